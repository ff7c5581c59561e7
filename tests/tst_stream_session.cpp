#include <QTest>
#include "stream/stream_session.h"
#include "adapters/format_registry.h"
#include "test_support.h"

namespace {

QList<QJsonObject> payloads(const QByteArray& sse)
{
    SseDecoder decoder;
    QList<QJsonObject> out;
    for (const auto& event : decoder.feed(sse)) {
        if (!event.isDone())
            out.append(QJsonDocument::fromJson(event.data).object());
    }
    return out;
}

}

class TestStreamSession : public QObject {
    Q_OBJECT

private slots:
    void testClaudeTranscriptToOpenAi() {
        TestContext test;
        const FormatRegistry registry = FormatRegistry::createDefault();
        auto session = StreamSession::open(registry, WireFormat::Claude, WireFormat::OpenAI, test.ctx);
        QVERIFY(session.has_value());

        const QByteArray transcript =
            "event: message_start\n"
            "data: {\"type\":\"message_start\",\"message\":{\"id\":\"msg_1\",\"model\":\"claude\"}}\n\n"
            "event: content_block_start\n"
            "data: {\"type\":\"content_block_start\",\"index\":0,\"content_block\":{\"type\":\"text\",\"text\":\"\"}}\n\n"
            "event: ping\n"
            "data: {\"type\":\"ping\"}\n\n"
            "event: content_block_delta\n"
            "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"text_delta\",\"text\":\"Hi\"}}\n\n"
            "event: content_block_stop\n"
            "data: {\"type\":\"content_block_stop\",\"index\":0}\n\n"
            "event: message_delta\n"
            "data: {\"type\":\"message_delta\",\"delta\":{\"stop_reason\":\"end_turn\"}}\n\n"
            "event: message_stop\n"
            "data: {\"type\":\"message_stop\"}\n\n";

        QByteArray output = (*session)->feed(transcript.left(100));
        output += (*session)->feed(transcript.mid(100));
        output += (*session)->finish();

        QVERIFY(output.endsWith("data: [DONE]\n\n"));
        QVERIFY(!output.contains("event:"));

        const QList<QJsonObject> chunks = payloads(output);
        QCOMPARE(chunks.size(), 3);
        QCOMPARE(chunks[1].value(QStringLiteral("choices")).toArray()[0].toObject()
                     .value(QStringLiteral("delta")).toObject().value(QStringLiteral("content")).toString(),
                 QStringLiteral("Hi"));
        QCOMPARE(chunks[2].value(QStringLiteral("choices")).toArray()[0].toObject()
                     .value(QStringLiteral("finish_reason")).toString(),
                 QStringLiteral("stop"));
        QVERIFY((*session)->isFinished());
        QVERIFY((*session)->finish().isEmpty());
    }

    void testOpenAiTranscriptToClaude() {
        TestContext test;
        const FormatRegistry registry = FormatRegistry::createDefault();
        auto session = StreamSession::open(registry, WireFormat::OpenAI, WireFormat::Claude, test.ctx);
        QVERIFY(session.has_value());

        QByteArray output = (*session)->feed(
            "data: {\"id\":\"chatcmpl-abcdefgh\",\"model\":\"gpt\",\"choices\":[{\"delta\":{\"content\":\"ok\"}}]}\n\n"
            "data: {\"id\":\"chatcmpl-abcdefgh\",\"choices\":[{\"delta\":{},\"finish_reason\":\"stop\"}]}\n\n"
            "data: [DONE]\n\n"
            "data: {\"id\":\"chatcmpl-abcdefgh\",\"choices\":[{\"delta\":{\"content\":\"ignored\"}}]}\n\n");
        QVERIFY((*session)->upstreamDone());
        output += (*session)->finish();

        QVERIFY(output.startsWith("event: message_start\ndata: "));
        QVERIFY(output.contains("event: message_stop\n"));
        QVERIFY(!output.contains("[DONE]"));
        QVERIFY(!output.contains("ignored"));
    }

    void testOpenAiStreamEndingWithoutFinishClosesBlocks() {
        TestContext test;
        const FormatRegistry registry = FormatRegistry::createDefault();
        auto session = StreamSession::open(registry, WireFormat::OpenAI, WireFormat::Claude, test.ctx);
        QVERIFY(session.has_value());

        QByteArray output = (*session)->feed(
            "data: {\"id\":\"chatcmpl-abcdefgh\",\"model\":\"gpt\",\"choices\":[{\"delta\":{\"content\":\"ok\"}}]}\n\n"
            "data: {\"id\":\"chatcmpl-abcdefgh\",\"choices\":[{\"delta\":{\"tool_calls\":["
            "{\"index\":0,\"id\":\"call_a\",\"function\":{\"name\":\"lookup\",\"arguments\":\"{}\"}}]}}]}\n\n"
            "data: [DONE]\n\n");
        QVERIFY(!(*session)->state().finishReasonSent);

        const QByteArray tail = (*session)->finish();
        output += tail;
        QVERIFY((*session)->state().finishReasonSent);

        const QList<QJsonObject> events = payloads(output);
        QMap<int, int> stops;
        QStringList types;
        for (const auto& e : events) {
            types.append(e.value(QStringLiteral("type")).toString());
            if (types.last() == QLatin1String("content_block_stop"))
                ++stops[e.value(QStringLiteral("index")).toInt()];
        }
        QCOMPARE(stops.value(0), 1);
        QCOMPARE(stops.value(1), 1);
        QCOMPARE(types.count(QStringLiteral("message_delta")), 1);
        QCOMPARE(types.last(), QStringLiteral("message_stop"));

        const QJsonObject messageDelta = events[events.size() - 2];
        QCOMPARE(messageDelta.value(QStringLiteral("delta")).toObject()
                     .value(QStringLiteral("stop_reason")).toString(), QStringLiteral("tool_use"));
        QVERIFY(tail.contains("event: message_stop\n"));
    }

    void testClaudeStreamEndingWithoutStopEmitsTerminal() {
        TestContext test;
        const FormatRegistry registry = FormatRegistry::createDefault();
        auto session = StreamSession::open(registry, WireFormat::Claude, WireFormat::OpenAI, test.ctx);
        QVERIFY(session.has_value());

        QByteArray output = (*session)->feed(
            "event: message_start\n"
            "data: {\"type\":\"message_start\",\"message\":{\"id\":\"msg_1\",\"model\":\"claude\"}}\n\n"
            "event: content_block_start\n"
            "data: {\"type\":\"content_block_start\",\"index\":0,\"content_block\":{\"type\":\"thinking\",\"thinking\":\"\"}}\n\n"
            "event: content_block_delta\n"
            "data: {\"type\":\"content_block_delta\",\"index\":0,\"delta\":{\"type\":\"thinking_delta\",\"thinking\":\"hmm\"}}\n\n");
        output += (*session)->finish();

        QVERIFY(output.endsWith("data: [DONE]\n\n"));
        const QList<QJsonObject> chunks = payloads(output);
        QCOMPARE(chunks.size(), 5);
        QCOMPARE(chunks[3].value(QStringLiteral("choices")).toArray()[0].toObject()
                     .value(QStringLiteral("delta")).toObject().value(QStringLiteral("content")).toString(),
                 QStringLiteral("</think>"));
        QCOMPARE(chunks[4].value(QStringLiteral("choices")).toArray()[0].toObject()
                     .value(QStringLiteral("finish_reason")).toString(),
                 QStringLiteral("stop"));
        QCOMPARE((*session)->state().openBlock, OpenBlock::None);
    }

    void testGeminiStreamEndingWithoutFinishReason() {
        TestContext test;
        const FormatRegistry registry = FormatRegistry::createDefault();
        auto session = StreamSession::open(registry, WireFormat::Gemini, WireFormat::OpenAI, test.ctx);
        QVERIFY(session.has_value());

        QByteArray output = (*session)->feed(
            "data: {\"candidates\":[{\"content\":{\"parts\":[{\"text\":\"partial\"}]}}]}\n\n");
        output += (*session)->finish();

        const QList<QJsonObject> chunks = payloads(output);
        QCOMPARE(chunks.size(), 3);
        QCOMPARE(chunks.last().value(QStringLiteral("choices")).toArray()[0].toObject()
                     .value(QStringLiteral("finish_reason")).toString(),
                 QStringLiteral("stop"));
        QVERIFY(output.endsWith("data: [DONE]\n\n"));
    }

    void testEmptyStreamFinishesQuietly() {
        TestContext test;
        const FormatRegistry registry = FormatRegistry::createDefault();
        auto session = StreamSession::open(registry, WireFormat::OpenAI, WireFormat::Claude, test.ctx);
        QVERIFY(session.has_value());
        QVERIFY((*session)->finish().isEmpty());
    }

    void testUnparseableEventSkipped() {
        TestContext test;
        const FormatRegistry registry = FormatRegistry::createDefault();
        auto session = StreamSession::open(registry, WireFormat::Gemini, WireFormat::OpenAI, test.ctx);
        QVERIFY(session.has_value());

        QByteArray output = (*session)->feed(
            "data: {broken\n\n"
            "data: {\"candidates\":[{\"content\":{\"parts\":[{\"text\":\"x\"}]},\"finishReason\":\"STOP\"}]}\n\n");
        QCOMPARE((*session)->skippedEvents(), 1);
        QCOMPARE(payloads(output).size(), 3);
        QVERIFY((*session)->state().finishReasonSent);
    }

    void testUnsupportedPairFailsToOpen() {
        TestContext test;
        const FormatRegistry registry = FormatRegistry::createDefault();
        auto session = StreamSession::open(registry, WireFormat::Claude, WireFormat::Gemini, test.ctx);
        QVERIFY(!session.has_value());
        QCOMPARE(session.error().kind, ErrorKind::NotSupported);
    }
};

QTEST_MAIN(TestStreamSession)
#include "tst_stream_session.moc"
