#include "event_log.hpp"

#include "logger.hpp"

#include <algorithm>

namespace ab::common {

namespace {

bool is_failure(EventKind kind) {
    switch (kind) {
        case EventKind::TcpError:
        case EventKind::TcpWarning:
        case EventKind::MappingError:
        case EventKind::AutomatorError:
        case EventKind::HttpTransportError:
        case EventKind::HttpTimeout:
        case EventKind::HttpStatusError:
            return true;
        default:
            return false;
    }
}

}  // namespace

QString to_string(EventKind kind) {
    switch (kind) {
        case EventKind::System:
            return QStringLiteral("System");
        case EventKind::Config:
            return QStringLiteral("Config");
        case EventKind::TcpServer:
            return QStringLiteral("TCP Server");
        case EventKind::TcpError:
            return QStringLiteral("TCP Error");
        case EventKind::TcpCommand:
            return QStringLiteral("TCP Command");
        case EventKind::TcpWarning:
            return QStringLiteral("TCP Warning");
        case EventKind::TcpCapture:
            return QStringLiteral("TCP Capture");
        case EventKind::MappingFound:
            return QStringLiteral("Mapping Found");
        case EventKind::MappingError:
            return QStringLiteral("Mapping Error");
        case EventKind::AutomatorError:
            return QStringLiteral("Automator Error");
        case EventKind::HttpTrigger:
            return QStringLiteral("HTTP Trigger");
        case EventKind::HttpSuccess:
            return QStringLiteral("HTTP Success");
        case EventKind::HttpTransportError:
            return QStringLiteral("HTTP Transport Error");
        case EventKind::HttpTimeout:
            return QStringLiteral("HTTP Timeout");
        case EventKind::HttpStatusError:
            return QStringLiteral("HTTP Status Error");
        case EventKind::CatalogRefresh:
            return QStringLiteral("Catalog Refresh");
    }
    return QStringLiteral("System");
}

QString EventEntry::toLine() const {
    return QStringLiteral("[%1] %2: %3")
        .arg(timestamp.toString(QStringLiteral("yyyy-MM-dd hh:mm:ss")), to_string(kind), detail);
}

EventLog::EventLog(int maxEntries, QObject *parent)
    : QObject(parent), maxEntries_(std::max(1, maxEntries)) {}

void EventLog::append(EventKind kind, const QString &detail) {
    EventEntry entry;
    entry.timestamp = QDateTime::currentDateTime();
    entry.kind = kind;
    entry.detail = detail;
    entries_.push_back(entry);
    if (entries_.size() > maxEntries_) {
        entries_.erase(entries_.begin(), entries_.begin() + (entries_.size() - maxEntries_));
    }
    Logger::instance().log(is_failure(kind) ? LogLevel::Warn : LogLevel::Info, QStringLiteral("event"),
                           QStringLiteral("%1: %2").arg(to_string(kind), detail));
    emit appended(entry);
}

QVector<EventEntry> EventLog::recent(int count) const {
    if (count <= 0) {
        return {};
    }
    if (count >= entries_.size()) {
        return entries_;
    }
    return entries_.mid(entries_.size() - count);
}

QStringList EventLog::toLines(int count) const {
    QStringList lines;
    for (const auto &entry : recent(count)) {
        lines.append(entry.toLine());
    }
    return lines;
}

int EventLog::size() const {
    return entries_.size();
}

int EventLog::maxEntries() const {
    return maxEntries_;
}

void EventLog::clear() {
    entries_.clear();
}

}  // namespace ab::common
