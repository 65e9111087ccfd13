#pragma once

#include "common/config.hpp"
#include "common/item_type.hpp"
#include "http_client.hpp"

#include <QtCore/QDateTime>
#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <functional>

namespace ab::common {
class EventLog;
}

namespace ab::automator {

constexpr char kStatusPath[] = "/api/app/webconnection";

// "/api/macro/{id}", "/api/trigger/button/{id}" or "/api/trigger/shortcut/{id}".
// Unknown types use the macro path.
QString endpoint_path(ItemType type, const QString &itemId);

struct DispatchRequest {
    QString automatorId;
    QString itemId;
    QString itemName;
    ItemType itemType = ItemType::Macro;
};

struct DispatchOutcome {
    enum class Kind {
        Accepted,
        Succeeded,
        ConfigurationError,
        TransportError,
        // No answer within the HTTP client's timeout.
        Timeout,
        HttpStatusError,
    };

    Kind kind = Kind::Accepted;
    QString automatorId;
    QString automatorName;
    QString endpoint;
    int statusCode = 0;
    QString message;

    bool isError() const {
        return kind == Kind::ConfigurationError || kind == Kind::TransportError || kind == Kind::Timeout ||
               kind == Kind::HttpStatusError;
    }
};

QString to_string(DispatchOutcome::Kind kind);

struct ConnectionStatus {
    enum class Kind {
        Connected,
        NotSelected,
        NotFound,
        NotConfigured,
        Timeout,
        Unreachable,
        HttpError,
        Other,
    };

    Kind kind = Kind::Other;
    QString automatorId;
    QString automatorName;
    int statusCode = 0;
    QString message;
    QDateTime lastCheck;

    bool connected() const { return kind == Kind::Connected; }
};

struct DispatchOptions {
    int probeTimeoutMs = 5000;
};

// Executes catalog items on Automator instances over the shared HttpClient.
class DispatchClient : public QObject {
    Q_OBJECT

public:
    using Callback = std::function<void(const DispatchOutcome &)>;
    using ProbeCallback = std::function<void(const ConnectionStatus &)>;

    DispatchClient(HttpClient &http, common::EventLog &events, DispatchOptions options = {},
                   QObject *parent = nullptr);

    void setConfig(config::ConfigSnapshot snapshot);

    // Returns ConfigurationError without any network traffic when the target
    // cannot be used, Accepted otherwise. The final outcome goes to done and
    // to dispatchFinished.
    DispatchOutcome trigger(const DispatchRequest &request, Callback done = {});

    void checkConnection(const QString &automatorId, ProbeCallback done);
    QHash<QString, ConnectionStatus> lastConnectionStatus() const;

signals:
    void dispatchFinished(const ab::automator::DispatchOutcome &outcome);
    void connectionChecked(const ab::automator::ConnectionStatus &status);

private:
    void finishProbe(ConnectionStatus status, const ProbeCallback &done);

    HttpClient &http_;
    common::EventLog &events_;
    DispatchOptions options_;
    config::ConfigSnapshot config_;
    QHash<QString, ConnectionStatus> lastStatus_;
};

}  // namespace ab::automator
