#include <QtTest/QtTest>

#include "common/protocol.hpp"

using namespace ab::protocol;

class TestLineParser : public QObject {
    Q_OBJECT

private slots:
    void splitsLinesAcrossChunks();
    void keepsPartialLineUntilTerminator();
    void dropsOverlongUnterminatedLine();
    void reportsOverlongTerminatedLineBeforeNextLine();
    void remainderIsDeliveredAtEof();
    void decodeTrimsWhitespaceAndCarriageReturn();
    void decodeHandlesUtf8();
    void buildLineAppendsTerminator();
};

void TestLineParser::splitsLinesAcrossChunks() {
    LineParser parser;
    parser.append("LIGHT_ON\nLIG");
    parser.append("HT_OFF\n");

    auto first = parser.nextLine();
    QVERIFY(first.has_value());
    QCOMPARE(*first, QByteArray("LIGHT_ON"));
    auto second = parser.nextLine();
    QVERIFY(second.has_value());
    QCOMPARE(*second, QByteArray("LIGHT_OFF"));
    QVERIFY(!parser.nextLine().has_value());
    QCOMPARE(parser.bufferedBytes(), 0);
}

void TestLineParser::keepsPartialLineUntilTerminator() {
    LineParser parser;
    parser.append("PARTIAL");
    LineError error = LineError::None;
    QVERIFY(!parser.nextLine(&error).has_value());
    QVERIFY(error == LineError::None);
    QCOMPARE(parser.bufferedBytes(), 7);

    parser.append("\n");
    auto line = parser.nextLine();
    QVERIFY(line.has_value());
    QCOMPARE(*line, QByteArray("PARTIAL"));
}

void TestLineParser::dropsOverlongUnterminatedLine() {
    LineParser parser;
    parser.append(QByteArray(kMaxLineBytes + 10, 'x'));

    LineError error = LineError::None;
    QString message;
    QVERIFY(!parser.nextLine(&error, &message).has_value());
    QVERIFY(error == LineError::LineTooLong);
    QVERIFY(!message.isEmpty());
    QCOMPARE(parser.bufferedBytes(), 0);

    // The tail of the dropped line is discarded up to its terminator.
    parser.append("yyyy\nNEXT\n");
    auto line = parser.nextLine(&error);
    QVERIFY(line.has_value());
    QCOMPARE(*line, QByteArray("NEXT"));
}

void TestLineParser::reportsOverlongTerminatedLineBeforeNextLine() {
    LineParser parser;
    QByteArray data(kMaxLineBytes + 1, 'x');
    data.append("\nOK\n");
    parser.append(data);

    LineError error = LineError::None;
    QVERIFY(!parser.nextLine(&error).has_value());
    QVERIFY(error == LineError::LineTooLong);

    auto line = parser.nextLine(&error);
    QVERIFY(line.has_value());
    QVERIFY(error == LineError::None);
    QCOMPARE(*line, QByteArray("OK"));
}

void TestLineParser::remainderIsDeliveredAtEof() {
    LineParser parser;
    parser.append("ONE\nTWO");
    QVERIFY(parser.nextLine().has_value());
    QVERIFY(!parser.nextLine().has_value());
    QCOMPARE(parser.takeRemainder(), QByteArray("TWO"));
    QCOMPARE(parser.bufferedBytes(), 0);
}

void TestLineParser::decodeTrimsWhitespaceAndCarriageReturn() {
    QCOMPARE(decode_trigger("  LIGHT_ON\r"), QStringLiteral("LIGHT_ON"));
    QCOMPARE(decode_trigger("\t\r"), QString());
}

void TestLineParser::decodeHandlesUtf8() {
    QCOMPARE(decode_trigger(QStringLiteral("Café").toUtf8()), QStringLiteral("Café"));
}

void TestLineParser::buildLineAppendsTerminator() {
    QCOMPARE(build_line(QStringLiteral(" TEST1 ")), QByteArray("TEST1\n"));
}

QTEST_GUILESS_MAIN(TestLineParser)
#include "tst_line_parser.moc"
