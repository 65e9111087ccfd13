#include "http_client.hpp"

#include "common/logger.hpp"

#include <QtCore/QTimer>
#include <QtNetwork/QNetworkReply>
#include <QtNetwork/QNetworkRequest>

namespace ab::automator {

using common::LogLevel;
using common::Logger;

QString to_string(HttpErrorKind kind) {
    switch (kind) {
        case HttpErrorKind::None:
            return QStringLiteral("ok");
        case HttpErrorKind::Timeout:
            return QStringLiteral("timeout");
        case HttpErrorKind::ConnectionRefused:
            return QStringLiteral("connection refused");
        case HttpErrorKind::Unreachable:
            return QStringLiteral("unreachable");
        case HttpErrorKind::HttpStatus:
            return QStringLiteral("http status");
        case HttpErrorKind::Other:
            return QStringLiteral("other");
    }
    return QStringLiteral("other");
}

HttpResult classify_reply(QNetworkReply *reply, bool timedOut) {
    HttpResult result;
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    result.statusCode = status.isValid() ? status.toInt() : 0;
    result.body = reply->readAll();

    if (timedOut) {
        result.kind = HttpErrorKind::Timeout;
        result.errorString = QStringLiteral("request timed out");
        return result;
    }
    if (result.statusCode > 0) {
        if (result.statusCode >= 200 && result.statusCode < 300) {
            return result;
        }
        result.kind = HttpErrorKind::HttpStatus;
        result.errorString = QStringLiteral("HTTP %1").arg(result.statusCode);
        return result;
    }

    switch (reply->error()) {
        case QNetworkReply::NoError:
            result.kind = HttpErrorKind::Other;
            result.errorString = QStringLiteral("no HTTP status in reply");
            break;
        case QNetworkReply::TimeoutError:
            result.kind = HttpErrorKind::Timeout;
            break;
        case QNetworkReply::ConnectionRefusedError:
            result.kind = HttpErrorKind::ConnectionRefused;
            break;
        case QNetworkReply::HostNotFoundError:
        case QNetworkReply::TemporaryNetworkFailureError:
        case QNetworkReply::NetworkSessionFailedError:
        case QNetworkReply::UnknownNetworkError:
            result.kind = HttpErrorKind::Unreachable;
            break;
        default:
            result.kind = HttpErrorKind::Other;
            break;
    }
    if (result.errorString.isEmpty()) {
        result.errorString = reply->errorString();
    }
    return result;
}

HttpResult closed_result() {
    HttpResult result;
    result.kind = HttpErrorKind::Other;
    result.errorString = QStringLiteral("HTTP client is closed");
    return result;
}

HttpClient::HttpClient(HttpClientOptions options, QObject *parent)
    : QObject(parent), options_(options) {}

HttpClient::~HttpClient() {
    close();
}

void HttpClient::get(const QUrl &url, Callback callback, int timeoutMs) {
    if (closed_) {
        if (callback) {
            callback(closed_result());
        }
        return;
    }
    Request request;
    request.url = url;
    request.callback = std::move(callback);
    request.timeoutMs = timeoutMs > 0 ? timeoutMs : options_.timeoutMs;
    queue_.push_back(std::move(request));
    pump();
}

void HttpClient::close() {
    if (closed_) {
        return;
    }
    closed_ = true;

    // State is cleared before any callback runs; callbacks may call get().
    QList<Callback> pending;
    for (auto it = active_.begin(); it != active_.end(); ++it) {
        QNetworkReply *reply = it.key();
        disconnect(reply, nullptr, this, nullptr);
        reply->abort();
        reply->deleteLater();
        pending.append(std::move(it->request.callback));
    }
    active_.clear();
    perHost_.clear();
    for (auto &request : queue_) {
        pending.append(std::move(request.callback));
    }
    queue_.clear();

    const HttpResult result = closed_result();
    for (const auto &callback : pending) {
        if (callback) {
            callback(result);
        }
    }
}

bool HttpClient::isClosed() const {
    return closed_;
}

int HttpClient::inFlight() const {
    return active_.size();
}

int HttpClient::queued() const {
    return queue_.size();
}

const HttpClientOptions &HttpClient::options() const {
    return options_;
}

QString HttpClient::hostKey(const QUrl &url) {
    return QStringLiteral("%1:%2").arg(url.host()).arg(url.port(url.scheme() == QLatin1String("https") ? 443 : 80));
}

bool HttpClient::canStart(const QString &key) const {
    if (active_.size() >= options_.maxConnections) {
        return false;
    }
    return perHost_.value(key, 0) < options_.maxConnectionsPerHost;
}

void HttpClient::pump() {
    // Skip over requests whose host is saturated so one busy instance does not
    // hold up the others.
    for (int i = 0; i < queue_.size() && active_.size() < options_.maxConnections;) {
        if (canStart(hostKey(queue_.at(i).url))) {
            start(queue_.takeAt(i));
        } else {
            ++i;
        }
    }
}

void HttpClient::start(Request request) {
    QNetworkRequest networkRequest(request.url);
    networkRequest.setRawHeader("Accept", "application/json");

    const QString key = hostKey(request.url);
    const int timeoutMs = request.timeoutMs;
    QNetworkReply *reply = manager_.get(networkRequest);

    Active active;
    active.request = std::move(request);
    active.hostKey = key;
    active_.insert(reply, std::move(active));
    perHost_[key] += 1;

    auto *timer = new QTimer(reply);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, this, [this, reply]() {
        auto it = active_.find(reply);
        if (it == active_.end()) {
            return;
        }
        it->timedOut = true;
        reply->abort();
    });
    timer->start(timeoutMs);

    connect(reply, &QNetworkReply::finished, this, [this, reply]() { handleFinished(reply); });
}

void HttpClient::handleFinished(QNetworkReply *reply) {
    auto it = active_.find(reply);
    if (it == active_.end()) {
        reply->deleteLater();
        return;
    }
    Active active = std::move(it.value());
    active_.erase(it);
    if (--perHost_[active.hostKey] <= 0) {
        perHost_.remove(active.hostKey);
    }

    const HttpResult result = classify_reply(reply, active.timedOut);
    reply->deleteLater();
    if (!result.ok()) {
        Logger::instance().log(LogLevel::Debug, QStringLiteral("http"),
                               QStringLiteral("GET %1 failed (%2): %3")
                                   .arg(active.request.url.toString(), to_string(result.kind), result.errorString));
    }

    if (active.request.callback) {
        active.request.callback(result);
    }
    if (!closed_) {
        pump();
    }
}

}  // namespace ab::automator
