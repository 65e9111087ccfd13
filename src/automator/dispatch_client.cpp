#include "dispatch_client.hpp"

#include "common/event_log.hpp"
#include "common/logger.hpp"

#include <QtCore/QPointer>
#include <QtCore/QTimer>
#include <QtCore/QUrl>

namespace ab::automator {

namespace {

using common::EventKind;
using common::LogLevel;
using common::Logger;

const QString kCategory = QStringLiteral("dispatch");

QString probe_failure_message(const HttpResult &result) {
    switch (result.kind) {
        case HttpErrorKind::Timeout:
            return QStringLiteral("Connection timeout - check if Automator is running");
        case HttpErrorKind::ConnectionRefused:
        case HttpErrorKind::Unreachable:
            return QStringLiteral("Cannot connect - check URL and port");
        case HttpErrorKind::HttpStatus:
            return QStringLiteral("HTTP error: %1").arg(result.statusCode);
        default: {
            QString text = result.errorString;
            const int paren = text.indexOf(QLatin1Char('('));
            if (paren > 0) {
                text = text.left(paren).trimmed();
            }
            return text.left(100);
        }
    }
}

ConnectionStatus::Kind probe_kind(HttpErrorKind kind) {
    switch (kind) {
        case HttpErrorKind::None:
            return ConnectionStatus::Kind::Connected;
        case HttpErrorKind::Timeout:
            return ConnectionStatus::Kind::Timeout;
        case HttpErrorKind::ConnectionRefused:
        case HttpErrorKind::Unreachable:
            return ConnectionStatus::Kind::Unreachable;
        case HttpErrorKind::HttpStatus:
            return ConnectionStatus::Kind::HttpError;
        case HttpErrorKind::Other:
            return ConnectionStatus::Kind::Other;
    }
    return ConnectionStatus::Kind::Other;
}

}  // namespace

QString endpoint_path(ItemType type, const QString &itemId) {
    const QString id = QString::fromLatin1(QUrl::toPercentEncoding(itemId));
    switch (type) {
        case ItemType::Button:
            return QStringLiteral("/api/trigger/button/%1").arg(id);
        case ItemType::Shortcut:
            return QStringLiteral("/api/trigger/shortcut/%1").arg(id);
        case ItemType::Macro:
        case ItemType::Unknown:
            break;
    }
    return QStringLiteral("/api/macro/%1").arg(id);
}

QString to_string(DispatchOutcome::Kind kind) {
    switch (kind) {
        case DispatchOutcome::Kind::Accepted:
            return QStringLiteral("accepted");
        case DispatchOutcome::Kind::Succeeded:
            return QStringLiteral("succeeded");
        case DispatchOutcome::Kind::ConfigurationError:
            return QStringLiteral("configuration error");
        case DispatchOutcome::Kind::TransportError:
            return QStringLiteral("transport error");
        case DispatchOutcome::Kind::Timeout:
            return QStringLiteral("timeout");
        case DispatchOutcome::Kind::HttpStatusError:
            return QStringLiteral("http status error");
    }
    return QStringLiteral("accepted");
}

DispatchClient::DispatchClient(HttpClient &http, common::EventLog &events, DispatchOptions options, QObject *parent)
    : QObject(parent),
      http_(http),
      events_(events),
      options_(options),
      config_(std::make_shared<const config::BridgeConfig>()) {}

void DispatchClient::setConfig(config::ConfigSnapshot snapshot) {
    config_ = std::move(snapshot);
}

DispatchOutcome DispatchClient::trigger(const DispatchRequest &request, Callback done) {
    DispatchOutcome outcome;
    outcome.automatorId = request.automatorId;

    auto reject = [this, &outcome](const QString &message) {
        outcome.kind = DispatchOutcome::Kind::ConfigurationError;
        outcome.message = message;
        events_.append(EventKind::AutomatorError, message);
        Logger::instance().log(LogLevel::Error, kCategory, message);
        return outcome;
    };

    if (request.itemId.isEmpty()) {
        return reject(QStringLiteral("No item id given"));
    }

    QString error;
    const config::AutomatorInstance *automator = config::select_automator(*config_, request.automatorId, &error);
    if (!automator) {
        return reject(error);
    }
    outcome.automatorId = automator->id;
    outcome.automatorName = automator->name;
    if (!automator->enabled) {
        return reject(QStringLiteral("%1 is disabled").arg(automator->name));
    }
    const QString base = automator->normalizedUrl();
    if (base.isEmpty()) {
        return reject(QStringLiteral("%1 URL not configured").arg(automator->name));
    }

    const QString type = to_string(request.itemType);
    const QString itemName = request.itemName.isEmpty() ? request.itemId : request.itemName;
    outcome.endpoint = base + endpoint_path(request.itemType, request.itemId);
    outcome.kind = DispatchOutcome::Kind::Accepted;

    events_.append(EventKind::HttpTrigger, QStringLiteral("[%1] Calling %2: %3").arg(automator->name, type, itemName));

    const QString automatorName = automator->name;
    DispatchOutcome pending = outcome;
    QPointer<DispatchClient> self(this);
    http_.get(QUrl(outcome.endpoint), [this, self, pending, type, itemName, automatorName, done](const HttpResult &result) {
        if (!self) {
            return;
        }
        DispatchOutcome finished = pending;
        finished.statusCode = result.statusCode;
        if (result.ok()) {
            finished.kind = DispatchOutcome::Kind::Succeeded;
            events_.append(EventKind::HttpSuccess,
                           QStringLiteral("[%1] Triggered %2: %3").arg(automatorName, type, itemName));
        } else if (result.kind == HttpErrorKind::HttpStatus) {
            finished.kind = DispatchOutcome::Kind::HttpStatusError;
            finished.message = result.errorString;
            events_.append(EventKind::HttpStatusError, QStringLiteral("[%1] Failed to trigger %2 %3: HTTP %4")
                                                           .arg(automatorName, type, itemName)
                                                           .arg(result.statusCode));
        } else if (result.kind == HttpErrorKind::Timeout) {
            finished.kind = DispatchOutcome::Kind::Timeout;
            finished.message = result.errorString;
            events_.append(EventKind::HttpTimeout, QStringLiteral("[%1] Timed out triggering %2 %3")
                                                       .arg(automatorName, type, itemName));
        } else {
            finished.kind = DispatchOutcome::Kind::TransportError;
            finished.message = QStringLiteral("%1: %2").arg(to_string(result.kind), result.errorString);
            events_.append(EventKind::HttpTransportError, QStringLiteral("[%1] Failed to trigger %2 %3: %4")
                                                              .arg(automatorName, type, itemName, finished.message));
        }
        if (finished.isError()) {
            Logger::instance().log(LogLevel::Error, kCategory,
                                   QStringLiteral("Error triggering Automator %1 %2 on %3: %4")
                                       .arg(type, itemName, automatorName, finished.message));
        }
        emit dispatchFinished(finished);
        if (done) {
            done(finished);
        }
    });
    return outcome;
}

void DispatchClient::checkConnection(const QString &automatorId, ProbeCallback done) {
    ConnectionStatus status;
    status.automatorId = automatorId;

    QString error;
    const config::AutomatorInstance *automator = config::select_automator(*config_, automatorId, &error);
    if (!automator) {
        status.kind = automatorId.isEmpty() ? ConnectionStatus::Kind::NotSelected : ConnectionStatus::Kind::NotFound;
        status.message = automatorId.isEmpty() ? QStringLiteral("No Automator specified")
                                               : QStringLiteral("Automator not found");
        finishProbe(status, done);
        return;
    }
    status.automatorId = automator->id;
    status.automatorName = automator->name;

    const QString base = automator->normalizedUrl();
    if (!automator->enabled || base.isEmpty()) {
        status.kind = ConnectionStatus::Kind::NotConfigured;
        status.message = QStringLiteral("Not configured");
        finishProbe(status, done);
        return;
    }

    QPointer<DispatchClient> self(this);
    http_.get(
        QUrl(base + QLatin1String(kStatusPath)),
        [this, self, status, done](const HttpResult &result) {
            if (!self) {
                return;
            }
            ConnectionStatus checked = status;
            checked.kind = probe_kind(result.kind);
            checked.statusCode = result.statusCode;
            if (!result.ok()) {
                checked.message = probe_failure_message(result);
            }
            checked.lastCheck = QDateTime::currentDateTime();
            lastStatus_.insert(checked.automatorId, checked);
            emit connectionChecked(checked);
            if (done) {
                done(checked);
            }
        },
        options_.probeTimeoutMs);
}

QHash<QString, ConnectionStatus> DispatchClient::lastConnectionStatus() const {
    return lastStatus_;
}

void DispatchClient::finishProbe(ConnectionStatus status, const ProbeCallback &done) {
    status.lastCheck = QDateTime::currentDateTime();
    if (!status.automatorId.isEmpty()) {
        lastStatus_.insert(status.automatorId, status);
    }
    QTimer::singleShot(0, this, [this, status, done]() {
        emit connectionChecked(status);
        if (done) {
            done(status);
        }
    });
}

}  // namespace ab::automator
