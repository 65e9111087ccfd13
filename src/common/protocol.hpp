#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QString>

#include <optional>

namespace ab::protocol {

constexpr char kLineTerminator = '\n';
constexpr int kMaxLineBytes = 4096;

enum class LineError {
    None = 0,
    LineTooLong,
};

// Splits a TCP byte stream into newline-terminated trigger lines.
class LineParser {
public:
    void append(const QByteArray &data);

    // Returns the next complete line without its terminator, or nullopt when
    // more data is needed. An overlong line is discarded and reported through
    // error/message with a nullopt result; call again to continue.
    std::optional<QByteArray> nextLine(LineError *error = nullptr, QString *message = nullptr);

    // Returns whatever is buffered after the last terminator (used at EOF).
    QByteArray takeRemainder();

    void clear();
    int bufferedBytes() const;

private:
    QByteArray buffer_;
    bool discarding_ = false;
};

// Decodes a raw line into the trigger text: UTF-8, surrounding whitespace
// (including a trailing CR) removed.
QString decode_trigger(const QByteArray &line);

QByteArray build_line(const QString &trigger);

}  // namespace ab::protocol
