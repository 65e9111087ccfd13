#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QObject>
#include <QtCore/QString>

#include <optional>

namespace ab::common {
class EventLog;
}

struct CaptureResult {
    QString trigger;
    quint16 port = 0;
    QString peer;
    QDateTime capturedAt;
};

struct CapturePoll {
    enum class State {
        Idle,
        Listening,
        Captured,
    };

    State state = State::Idle;
    std::optional<CaptureResult> result;
};

QString to_string(CapturePoll::State state);

// Single-slot "listen and learn" mode: records the next trigger seen on any
// listener after start(). The result is handed out once by poll().
class CaptureSession : public QObject {
    Q_OBJECT

public:
    explicit CaptureSession(ab::common::EventLog *events = nullptr, QObject *parent = nullptr);

    void start();
    // Claims the slot if listening. Returns true for the one trigger captured.
    bool offer(const QString &trigger, quint16 port, const QString &peer);
    CapturePoll poll();
    void cancel();

    CapturePoll::State state() const;

signals:
    void captured(const CaptureResult &result);

private:
    ab::common::EventLog *events_;
    CapturePoll::State state_ = CapturePoll::State::Idle;
    std::optional<CaptureResult> result_;
};
