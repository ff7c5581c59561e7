#include <QTest>
#include "adapters/stream/gemini_to_openai.h"
#include "test_support.h"

namespace {

QJsonObject choice(const QJsonObject& chunk)
{
    return chunk.value(QStringLiteral("choices")).toArray()[0].toObject();
}

QJsonObject delta(const QJsonObject& chunk)
{
    return choice(chunk).value(QStringLiteral("delta")).toObject();
}

}

class TestGeminiToOpenAi : public QObject {
    Q_OBJECT

private:
    GeminiToOpenAiStream m_translator;
    TestContext m_test;

private slots:
    void testTextStreamWithUsage() {
        StreamState state;
        QList<QJsonObject> out = m_translator.step(jsonObject(R"({
            "responseId":"resp-1","modelVersion":"gemini-2.5-pro",
            "candidates":[{"content":{"role":"model","parts":[{"text":"Hel"}]}}]})"), state, m_test.ctx);
        QCOMPARE(out.size(), 2);
        QCOMPARE(out[0].value(QStringLiteral("id")).toString(), QStringLiteral("chatcmpl-resp-1"));
        QCOMPARE(out[0].value(QStringLiteral("model")).toString(), QStringLiteral("gemini-2.5-pro"));
        QCOMPARE(delta(out[0]), jsonObject(R"({"role":"assistant"})"));
        QCOMPARE(delta(out[1]), jsonObject(R"({"content":"Hel"})"));

        out = m_translator.step(jsonObject(R"({
            "candidates":[{"content":{"parts":[{"text":"lo"}]},"finishReason":"STOP"}],
            "usageMetadata":{"promptTokenCount":10,"candidatesTokenCount":4,
                             "thoughtsTokenCount":3,"totalTokenCount":17}})"), state, m_test.ctx);
        QCOMPARE(out.size(), 2);
        QCOMPARE(delta(out[0]), jsonObject(R"({"content":"lo"})"));
        QCOMPARE(choice(out[1]).value(QStringLiteral("finish_reason")).toString(), QStringLiteral("stop"));
        QCOMPARE(out[1].value(QStringLiteral("usage")).toObject(), jsonObject(R"({
            "prompt_tokens":13,"completion_tokens":4,"total_tokens":17,
            "completion_tokens_details":{"reasoning_tokens":3}})"));
    }

    void testEnvelopeUnwrappedAndThoughtRouted() {
        StreamState state;
        QList<QJsonObject> out = m_translator.step(jsonObject(R"({"response":{
            "candidates":[{"content":{"parts":[
              {"text":"pondering","thought":true,"thoughtSignature":"sig"},
              {"text":"answer"}]}}]}})"), state, m_test.ctx);
        QCOMPARE(out.size(), 3);
        QCOMPARE(out[0].value(QStringLiteral("model")).toString(), QStringLiteral("gemini"));
        QCOMPARE(delta(out[1]), jsonObject(R"({"reasoning_content":"pondering"})"));
        QCOMPARE(delta(out[2]), jsonObject(R"({"content":"answer"})"));
    }

    void testFunctionCallsEmittedWhole() {
        StreamState state;
        QList<QJsonObject> out = m_translator.step(jsonObject(R"({"candidates":[{"content":{"parts":[
            {"functionCall":{"name":"weather","args":{"city":"Paris"}}},
            {"functionCall":{"name":"time"}}]},"finishReason":"STOP"}]})"), state, m_test.ctx);

        QCOMPARE(out.size(), 4);
        QCOMPARE(delta(out[1]), jsonObject(R"({"tool_calls":[{"id":"weather-1700000000123-0","index":0,
            "type":"function","function":{"name":"weather","arguments":"{\"city\":\"Paris\"}"}}]})"));
        const QJsonObject second = delta(out[2]).value(QStringLiteral("tool_calls")).toArray()[0].toObject();
        QCOMPARE(second.value(QStringLiteral("index")).toInt(), 1);
        QCOMPARE(second.value(QStringLiteral("function")).toObject().value(QStringLiteral("arguments")).toString(),
                 QStringLiteral("{}"));
        QCOMPARE(choice(out[3]).value(QStringLiteral("finish_reason")).toString(), QStringLiteral("tool_calls"));
        QCOMPARE(state.toolCalls.size(), 2);
    }

    void testInlineImage() {
        StreamState state;
        QList<QJsonObject> out = m_translator.step(jsonObject(R"({"candidates":[{"content":{"parts":[
            {"inlineData":{"mimeType":"image/jpeg","data":"QUJD"}},
            {"inlineData":{"data":"REVG"}}]}}]})"), state, m_test.ctx);
        QCOMPARE(out.size(), 3);
        QCOMPARE(delta(out[1]), jsonObject(R"({"images":[
            {"type":"image_url","image_url":{"url":"data:image/jpeg;base64,QUJD"}}]})"));
        QCOMPARE(delta(out[2]).value(QStringLiteral("images")).toArray()[0].toObject()
                     .value(QStringLiteral("image_url")).toObject().value(QStringLiteral("url")).toString(),
                 QStringLiteral("data:image/png;base64,REVG"));
    }

    void testMaxTokensLowercasedAndSingleTerminal() {
        StreamState state;
        QList<QJsonObject> out = m_translator.step(jsonObject(
            R"({"candidates":[{"content":{"parts":[{"text":"a"}]},"finishReason":"MAX_TOKENS"}]})"),
            state, m_test.ctx);
        QCOMPARE(choice(out.last()).value(QStringLiteral("finish_reason")).toString(), QStringLiteral("max_tokens"));

        out = m_translator.step(jsonObject(
            R"({"candidates":[{"content":{"parts":[{"text":"late"}]},"finishReason":"STOP"}],
                "usageMetadata":{"promptTokenCount":1,"candidatesTokenCount":2,"totalTokenCount":3}})"),
            state, m_test.ctx);
        QVERIFY(out.isEmpty());
        QCOMPARE(state.usage->totalTokens, 3);
    }

    void testEmptyCandidatesProduceNothing() {
        StreamState state;
        QVERIFY(m_translator.step(jsonObject(R"({"candidates":[]})"), state, m_test.ctx).isEmpty());
        QVERIFY(!state.messageStarted);
    }
};

QTEST_MAIN(TestGeminiToOpenAi)
#include "tst_gemini_to_openai.moc"
