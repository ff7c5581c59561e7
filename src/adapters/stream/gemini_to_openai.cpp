#include "gemini_to_openai.h"
#include "openai_chunk.h"
#include "semantic/json_util.h"
#include <QJsonArray>

QString GeminiToOpenAiStream::name() const
{
    return QStringLiteral("gemini->openai");
}

QList<QJsonObject> GeminiToOpenAiStream::step(const QJsonObject& event,
                                              StreamState& state,
                                              const TranslationContext& ctx) const
{
    QList<QJsonObject> out;

    const QJsonValue wrapped = event.value(QStringLiteral("response"));
    const QJsonObject response = wrapped.isObject() ? wrapped.toObject() : event;

    QJsonObject usage = response.value(QStringLiteral("usageMetadata")).toObject();
    if (usage.isEmpty())
        usage = event.value(QStringLiteral("usageMetadata")).toObject();
    if (!usage.isEmpty())
        foldUsage(usage, state);

    if (state.finishReasonSent)
        return out;

    const QJsonArray candidates = response.value(QStringLiteral("candidates")).toArray();
    if (candidates.isEmpty())
        return out;
    const QJsonObject candidate = candidates.first().toObject();

    if (!state.messageStarted) {
        state.messageId = response.value(QStringLiteral("responseId")).toString();
        if (state.messageId.isEmpty())
            state.messageId = ctx.nextId(IdKind::Message);
        state.modelName = response.value(QStringLiteral("modelVersion")).toString(QStringLiteral("gemini"));
        state.nextToolCallIndex = 0;
        state.messageStarted = true;

        QJsonObject delta;
        delta[QStringLiteral("role")] = QStringLiteral("assistant");
        out.append(openai_chunk::make(state, ctx, delta));
    }

    const QJsonArray parts = candidate.value(QStringLiteral("content")).toObject()
                                 .value(QStringLiteral("parts")).toArray();
    emitParts(parts, state, ctx, out);

    QString finishReason = candidate.value(QStringLiteral("finishReason")).toString().toLower();
    if (!finishReason.isEmpty()) {
        if (finishReason == QLatin1String("stop") && !state.toolCalls.isEmpty())
            finishReason = QStringLiteral("tool_calls");
        out.append(openai_chunk::terminal(state, ctx, finishReason));
        state.finishReason = finishReason;
        state.finishReasonSent = true;
    }

    return out;
}

QList<QJsonObject> GeminiToOpenAiStream::close(StreamState& state,
                                               const TranslationContext& ctx) const
{
    QList<QJsonObject> out;
    if (!state.messageStarted || state.finishReasonSent)
        return out;

    const QString finishReason = state.toolCalls.isEmpty() ? QStringLiteral("stop")
                                                           : QStringLiteral("tool_calls");
    out.append(openai_chunk::terminal(state, ctx, finishReason));
    state.finishReason = finishReason;
    state.finishReasonSent = true;
    return out;
}

void GeminiToOpenAiStream::foldUsage(const QJsonObject& usage, StreamState& state) const
{
    const int thoughts = usage.value(QStringLiteral("thoughtsTokenCount")).toInt();

    UsageCounters counters;
    counters.promptTokens = usage.value(QStringLiteral("promptTokenCount")).toInt() + thoughts;
    counters.completionTokens = usage.value(QStringLiteral("candidatesTokenCount")).toInt();
    counters.totalTokens = usage.value(QStringLiteral("totalTokenCount")).toInt();
    counters.reasoningTokens = thoughts > 0 ? thoughts : 0;
    state.usage = counters;
}

void GeminiToOpenAiStream::emitParts(const QJsonArray& parts, StreamState& state,
                                     const TranslationContext& ctx,
                                     QList<QJsonObject>& out) const
{
    for (const auto& item : parts) {
        const QJsonObject part = item.toObject();

        const bool hasSignature = !json_util::firstOf(part, "thoughtSignature", "thought_signature")
                                  .toString().isEmpty();
        const bool thought = part.value(QStringLiteral("thought")).toBool(false);
        const QString text = part.value(QStringLiteral("text")).toString();
        const QJsonObject functionCall = part.value(QStringLiteral("functionCall")).toObject();
        const bool hasCall = part.value(QStringLiteral("functionCall")).isObject();

        if (!text.isEmpty()) {
            const QString key = thought ? QStringLiteral("reasoning_content") : QStringLiteral("content");
            out.append(openai_chunk::make(state, ctx, openai_chunk::contentDelta(key, text)));
        }

        if (hasCall)
            out.append(toolCallChunk(functionCall, state, ctx));

        // Signed parts carry only thought text and calls.
        if (hasSignature)
            continue;

        const QJsonObject inlineData = json_util::firstOf(part, "inlineData", "inline_data").toObject();
        const QString data = inlineData.value(QStringLiteral("data")).toString();
        if (!data.isEmpty()) {
            QString mimeType = json_util::firstOf(inlineData, "mimeType", "mime_type").toString();
            if (mimeType.isEmpty())
                mimeType = QStringLiteral("image/png");

            QJsonObject url;
            url[QStringLiteral("url")] = QStringLiteral("data:%1;base64,%2").arg(mimeType, data);
            QJsonObject image;
            image[QStringLiteral("type")] = QStringLiteral("image_url");
            image[QStringLiteral("image_url")] = url;

            QJsonObject delta;
            delta[QStringLiteral("images")] = QJsonArray{image};
            out.append(openai_chunk::make(state, ctx, delta));
        }
    }
}

QJsonObject GeminiToOpenAiStream::toolCallChunk(const QJsonObject& functionCall, StreamState& state,
                                                const TranslationContext& ctx) const
{
    const QString toolName = functionCall.value(QStringLiteral("name")).toString();
    const QJsonValue args = functionCall.value(QStringLiteral("args"));
    const QString arguments = json_util::stringify(args.isObject() ? args : QJsonValue(QJsonObject()));

    // Gemini never fragments arguments, so each call opens and completes in one delta.
    const int index = state.allocateToolCallIndex();
    const QString id = QStringLiteral("%1-%2-%3").arg(toolName).arg(ctx.nowMillis()).arg(index);
    state.toolCalls.open(index, index, id, toolName);
    state.toolCalls.appendArguments(index, arguments);

    QJsonObject function;
    function[QStringLiteral("name")] = toolName;
    function[QStringLiteral("arguments")] = arguments;

    QJsonObject toolCall;
    toolCall[QStringLiteral("id")] = id;
    toolCall[QStringLiteral("index")] = index;
    toolCall[QStringLiteral("type")] = QStringLiteral("function");
    toolCall[QStringLiteral("function")] = function;

    QJsonObject delta;
    delta[QStringLiteral("tool_calls")] = QJsonArray{toolCall};
    return openai_chunk::make(state, ctx, delta);
}
