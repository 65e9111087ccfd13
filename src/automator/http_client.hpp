#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QHash>
#include <QtCore/QList>
#include <QtCore/QObject>
#include <QtCore/QUrl>
#include <QtNetwork/QNetworkAccessManager>

#include <functional>

class QNetworkReply;

namespace ab::automator {

enum class HttpErrorKind {
    None = 0,
    Timeout,
    ConnectionRefused,
    Unreachable,
    HttpStatus,
    Other,
};

QString to_string(HttpErrorKind kind);

struct HttpResult {
    HttpErrorKind kind = HttpErrorKind::None;
    int statusCode = 0;
    QByteArray body;
    QString errorString;

    bool ok() const { return kind == HttpErrorKind::None; }
    bool isTransportError() const { return kind != HttpErrorKind::None && kind != HttpErrorKind::HttpStatus; }
};

struct HttpClientOptions {
    int maxConnections = 50;
    int maxConnectionsPerHost = 20;
    int timeoutMs = 5000;
};

// The one outbound HTTP client of the process. Requests beyond the
// connection limits wait in FIFO order; every request is bounded by a timeout
// that surfaces as HttpErrorKind::Timeout.
class HttpClient : public QObject {
    Q_OBJECT

public:
    using Callback = std::function<void(const HttpResult &)>;

    explicit HttpClient(HttpClientOptions options = {}, QObject *parent = nullptr);
    ~HttpClient() override;

    // timeoutMs <= 0 uses the client default.
    void get(const QUrl &url, Callback callback, int timeoutMs = 0);

    // Aborts in-flight and queued requests; each callback runs once, before
    // close() returns, with closed_result(). Later get() calls fail
    // immediately the same way.
    void close();
    bool isClosed() const;

    int inFlight() const;
    int queued() const;
    const HttpClientOptions &options() const;

private:
    struct Request {
        QUrl url;
        Callback callback;
        int timeoutMs = 0;
    };

    struct Active {
        Request request;
        QString hostKey;
        bool timedOut = false;
    };

    static QString hostKey(const QUrl &url);
    bool canStart(const QString &key) const;
    void pump();
    void start(Request request);
    void handleFinished(QNetworkReply *reply);

    HttpClientOptions options_;
    QNetworkAccessManager manager_;
    QList<Request> queue_;
    QHash<QNetworkReply *, Active> active_;
    QHash<QString, int> perHost_;
    bool closed_ = false;
};

HttpResult classify_reply(QNetworkReply *reply, bool timedOut);

// HttpErrorKind::Other, "HTTP client is closed".
HttpResult closed_result();

}  // namespace ab::automator
