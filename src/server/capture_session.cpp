#include "capture_session.hpp"

#include "common/event_log.hpp"
#include "common/logger.hpp"

using ab::common::EventKind;
using ab::common::LogLevel;
using ab::common::Logger;

QString to_string(CapturePoll::State state) {
    switch (state) {
        case CapturePoll::State::Idle:
            return QStringLiteral("idle");
        case CapturePoll::State::Listening:
            return QStringLiteral("listening");
        case CapturePoll::State::Captured:
            return QStringLiteral("captured");
    }
    return QStringLiteral("idle");
}

CaptureSession::CaptureSession(ab::common::EventLog *events, QObject *parent)
    : QObject(parent), events_(events) {}

void CaptureSession::start() {
    state_ = CapturePoll::State::Listening;
    result_.reset();
    if (events_) {
        events_->append(EventKind::TcpCapture, QStringLiteral("Started listening for TCP command"));
    }
}

bool CaptureSession::offer(const QString &trigger, quint16 port, const QString &peer) {
    if (state_ != CapturePoll::State::Listening) {
        return false;
    }
    CaptureResult result;
    result.trigger = trigger;
    result.port = port;
    result.peer = peer;
    result.capturedAt = QDateTime::currentDateTime();
    result_ = result;
    state_ = CapturePoll::State::Captured;
    if (events_) {
        events_->append(EventKind::TcpCapture,
                        QStringLiteral("Captured command '%1' from port %2").arg(trigger).arg(port));
    }
    emit captured(result);
    return true;
}

CapturePoll CaptureSession::poll() {
    CapturePoll poll;
    poll.state = state_;
    if (state_ == CapturePoll::State::Captured) {
        poll.result = result_;
        result_.reset();
        state_ = CapturePoll::State::Idle;
    }
    return poll;
}

void CaptureSession::cancel() {
    if (state_ != CapturePoll::State::Idle) {
        Logger::instance().log(LogLevel::Debug, QStringLiteral("capture"),
                               QStringLiteral("Capture cancelled in state %1").arg(to_string(state_)));
    }
    state_ = CapturePoll::State::Idle;
    result_.reset();
    if (events_) {
        events_->append(EventKind::TcpCapture, QStringLiteral("Cancelled"));
    }
}

CapturePoll::State CaptureSession::state() const {
    return state_;
}
