#include "protocol.hpp"

namespace ab::protocol {

namespace {

void set_error(LineError code, const QString &reason, LineError *outCode, QString *outReason) {
    if (outCode) {
        *outCode = code;
    }
    if (outReason) {
        *outReason = reason;
    }
}

}  // namespace

void LineParser::append(const QByteArray &data) {
    buffer_.append(data);
}

void LineParser::clear() {
    buffer_.clear();
    discarding_ = false;
}

int LineParser::bufferedBytes() const {
    return buffer_.size();
}

std::optional<QByteArray> LineParser::nextLine(LineError *error, QString *message) {
    if (error) {
        *error = LineError::None;
    }
    if (message) {
        message->clear();
    }

    while (true) {
        const int end = buffer_.indexOf(kLineTerminator);
        if (end < 0) {
            if (buffer_.size() > kMaxLineBytes) {
                const int dropped = buffer_.size();
                buffer_.clear();
                // Keep dropping until the terminator of this line shows up.
                if (!discarding_) {
                    discarding_ = true;
                    set_error(LineError::LineTooLong,
                              QStringLiteral("Line exceeds %1 bytes, dropped %2 bytes").arg(kMaxLineBytes).arg(dropped),
                              error, message);
                }
            }
            return std::nullopt;
        }

        QByteArray line = buffer_.left(end);
        buffer_.remove(0, end + 1);

        if (discarding_) {
            discarding_ = false;
            continue;
        }
        if (line.size() > kMaxLineBytes) {
            set_error(LineError::LineTooLong,
                      QStringLiteral("Line of %1 bytes exceeds limit").arg(line.size()), error, message);
            return std::nullopt;
        }
        return line;
    }
}

QByteArray LineParser::takeRemainder() {
    QByteArray rest;
    if (!discarding_ && buffer_.size() <= kMaxLineBytes) {
        rest = buffer_;
    }
    buffer_.clear();
    discarding_ = false;
    return rest;
}

QString decode_trigger(const QByteArray &line) {
    return QString::fromUtf8(line).trimmed();
}

QByteArray build_line(const QString &trigger) {
    QByteArray line = trigger.trimmed().toUtf8();
    line.append(kLineTerminator);
    return line;
}

}  // namespace ab::protocol
