#include <QTest>
#include "adapters/stream/openai_to_claude.h"
#include "test_support.h"

namespace {

QStringList eventTypes(const QList<QJsonObject>& events)
{
    QStringList types;
    for (const auto& e : events)
        types.append(e.value(QStringLiteral("type")).toString());
    return types;
}

}

class TestOpenAiToClaude : public QObject {
    Q_OBJECT

private:
    QList<QJsonObject> run(const QList<QJsonObject>& chunks, StreamState& state) {
        QList<QJsonObject> out;
        for (const auto& chunk : chunks)
            out.append(m_translator.step(chunk, state, m_test.ctx));
        return out;
    }

    OpenAiToClaudeStream m_translator;
    TestContext m_test;

private slots:
    void testTextStream() {
        StreamState state;
        const QList<QJsonObject> out = run({
            jsonObject(R"({"id":"chatcmpl-abc123456","model":"gpt-4o",
                "choices":[{"index":0,"delta":{"role":"assistant","content":"Hel"}}]})"),
            jsonObject(R"({"id":"chatcmpl-abc123456","choices":[{"index":0,"delta":{"content":"lo"}}]})"),
            jsonObject(R"({"id":"chatcmpl-abc123456","choices":[{"index":0,"delta":{},"finish_reason":"stop"}],
                "usage":{"prompt_tokens":5,"completion_tokens":2,"total_tokens":7}})"),
        }, state);

        QCOMPARE(eventTypes(out), QStringList({
            QStringLiteral("message_start"), QStringLiteral("content_block_start"),
            QStringLiteral("content_block_delta"), QStringLiteral("content_block_delta"),
            QStringLiteral("content_block_stop"), QStringLiteral("message_delta"),
            QStringLiteral("message_stop")}));

        const QJsonObject message = out[0].value(QStringLiteral("message")).toObject();
        QCOMPARE(message.value(QStringLiteral("id")).toString(), QStringLiteral("abc123456"));
        QCOMPARE(message.value(QStringLiteral("model")).toString(), QStringLiteral("gpt-4o"));
        QCOMPARE(message.value(QStringLiteral("role")).toString(), QStringLiteral("assistant"));

        QCOMPARE(out[1].value(QStringLiteral("content_block")).toObject(),
                 jsonObject(R"({"type":"text","text":""})"));
        QCOMPARE(out[3].value(QStringLiteral("delta")).toObject(),
                 jsonObject(R"({"type":"text_delta","text":"lo"})"));

        QCOMPARE(out[5].value(QStringLiteral("delta")).toObject()
                     .value(QStringLiteral("stop_reason")).toString(), QStringLiteral("end_turn"));
        QCOMPARE(out[5].value(QStringLiteral("usage")).toObject(),
                 jsonObject(R"({"output_tokens":2,"input_tokens":5})"));
    }

    void testReasoningThenContentSwitchesBlocks() {
        StreamState state;
        const QList<QJsonObject> out = run({
            jsonObject(R"({"id":"chatcmpl-xyz98765","choices":[{"delta":{"reasoning_content":"think"}}]})"),
            jsonObject(R"({"id":"chatcmpl-xyz98765","choices":[{"delta":{"reasoning":" more"}}]})"),
            jsonObject(R"({"id":"chatcmpl-xyz98765","choices":[{"delta":{"content":"done"}}]})"),
        }, state);

        QCOMPARE(eventTypes(out), QStringList({
            QStringLiteral("message_start"),
            QStringLiteral("content_block_start"), QStringLiteral("content_block_delta"),
            QStringLiteral("content_block_delta"),
            QStringLiteral("content_block_stop"),
            QStringLiteral("content_block_start"), QStringLiteral("content_block_delta")}));
        QCOMPARE(out[1].value(QStringLiteral("index")).toInt(), 0);
        QCOMPARE(out[2].value(QStringLiteral("delta")).toObject(),
                 jsonObject(R"({"type":"thinking_delta","thinking":"think"})"));
        QCOMPARE(out[4].value(QStringLiteral("index")).toInt(), 0);
        QCOMPARE(out[5].value(QStringLiteral("index")).toInt(), 1);
        QCOMPARE(out[0].value(QStringLiteral("message")).toObject()
                     .value(QStringLiteral("model")).toString(), QStringLiteral("unknown"));
    }

    void testToolCallFragmentsReassemble() {
        StreamState state;
        const QList<QJsonObject> out = run({
            jsonObject(R"({"id":"chatcmpl-tool0001","choices":[{"delta":{"content":"Let me check."}}]})"),
            jsonObject(R"({"id":"chatcmpl-tool0001","choices":[{"delta":{"tool_calls":[
                {"index":0,"id":"call_a","type":"function","function":{"name":"lookup","arguments":""}}]}}]})"),
            jsonObject(R"({"id":"chatcmpl-tool0001","choices":[{"delta":{"tool_calls":[
                {"index":0,"function":{"arguments":"{\"q\":"}}]}}]})"),
            jsonObject(R"({"id":"chatcmpl-tool0001","choices":[{"delta":{"tool_calls":[
                {"index":0,"function":{"arguments":"\"qt\"}"}}]}}]})"),
            jsonObject(R"({"id":"chatcmpl-tool0001","choices":[{"delta":{"tool_calls":[
                {"index":1,"id":"call_b","type":"function","function":{"name":"other","arguments":"{}"}}]}}]})"),
            jsonObject(R"({"id":"chatcmpl-tool0001","choices":[{"delta":{},"finish_reason":"tool_calls"}]})"),
        }, state);

        int toolStarts = 0;
        QMap<int, QString> fragments;
        QMap<int, int> stops;
        for (const auto& e : out) {
            const QString type = e.value(QStringLiteral("type")).toString();
            const int index = e.value(QStringLiteral("index")).toInt(-1);
            if (type == QLatin1String("content_block_start")
                && e.value(QStringLiteral("content_block")).toObject()
                       .value(QStringLiteral("type")).toString() == QLatin1String("tool_use")) {
                ++toolStarts;
                fragments.insert(index, QString());
            } else if (type == QLatin1String("content_block_delta")
                       && e.value(QStringLiteral("delta")).toObject()
                              .value(QStringLiteral("type")).toString() == QLatin1String("input_json_delta")) {
                fragments[index] += e.value(QStringLiteral("delta")).toObject()
                                        .value(QStringLiteral("partial_json")).toString();
            } else if (type == QLatin1String("content_block_stop")) {
                ++stops[index];
            }
        }

        QCOMPARE(toolStarts, 2);
        QCOMPARE(fragments.keys(), QList<int>({1, 2}));
        QCOMPARE(fragments.value(1), QStringLiteral("{\"q\":\"qt\"}"));
        QCOMPARE(fragments.value(2), QStringLiteral("{}"));
        QCOMPARE(stops.value(0), 1);
        QCOMPARE(stops.value(1), 1);
        QCOMPARE(stops.value(2), 1);

        QCOMPARE(out[out.size() - 2].value(QStringLiteral("delta")).toObject()
                     .value(QStringLiteral("stop_reason")).toString(), QStringLiteral("tool_use"));
        QCOMPARE(out.last().value(QStringLiteral("type")).toString(), QStringLiteral("message_stop"));
    }

    void testRepeatedIdDoesNotReopen() {
        StreamState state;
        const QList<QJsonObject> out = run({
            jsonObject(R"({"id":"chatcmpl-rep00001","choices":[{"delta":{"tool_calls":[
                {"index":0,"id":"call_a","function":{"name":"f","arguments":"{"}}]}}]})"),
            jsonObject(R"({"id":"chatcmpl-rep00001","choices":[{"delta":{"tool_calls":[
                {"index":0,"id":"call_a","function":{"arguments":"}"}}]}}]})"),
        }, state);
        QCOMPARE(eventTypes(out).count(QStringLiteral("content_block_start")), 1);
        QCOMPARE(state.toolCalls.byProviderIndex(0)->argumentBuffer, QStringLiteral("{}"));
    }

    void testNothingAfterFinish() {
        StreamState state;
        run({jsonObject(R"({"id":"chatcmpl-fin00001","choices":[{"delta":{"content":"x"},"finish_reason":"length"}]})")},
            state);
        QVERIFY(state.finishReasonSent);
        QCOMPARE(*state.finishReason, QStringLiteral("length"));
        QVERIFY(run({jsonObject(R"({"choices":[{"delta":{"content":"late"}}]})")}, state).isEmpty());
    }

    void testMessageIdFallbacks() {
        QCOMPARE(OpenAiToClaudeStream::resolveMessageId(jsonObject(R"({"id":"chatcmpl-long-enough"})"), m_test.ctx),
                 QStringLiteral("long-enough"));
        QCOMPARE(OpenAiToClaudeStream::resolveMessageId(
                     jsonObject(R"({"id":"chat","extend_fields":{"requestId":"req-42"}})"), m_test.ctx),
                 QStringLiteral("req-42"));
        QCOMPARE(OpenAiToClaudeStream::resolveMessageId(
                     jsonObject(R"({"id":"short","extend_fields":{"traceId":"trace-7"}})"), m_test.ctx),
                 QStringLiteral("trace-7"));
        QVERIFY(OpenAiToClaudeStream::resolveMessageId(jsonObject(R"({})"), m_test.ctx)
                    .startsWith(QStringLiteral("msg-")));
    }

    void testUsageOnlyChunkRecorded() {
        StreamState state;
        QVERIFY(run({jsonObject(R"({"choices":[],"usage":{"prompt_tokens":3,"completion_tokens":4}})")},
                    state).isEmpty());
        QVERIFY(state.usage.has_value());
        QCOMPARE(state.usage->totalTokens, 7);
    }
};

QTEST_MAIN(TestOpenAiToClaude)
#include "tst_openai_to_claude.moc"
