#include "openai_chunk.h"
#include <QJsonArray>

namespace openai_chunk {

QJsonObject make(const StreamState& state, const TranslationContext& ctx,
                 const QJsonObject& delta, const QJsonValue& finishReason)
{
    QJsonObject choice;
    choice[QStringLiteral("index")] = 0;
    choice[QStringLiteral("delta")] = delta;
    choice[QStringLiteral("finish_reason")] = finishReason.isString() ? finishReason : QJsonValue();

    QJsonObject chunk;
    chunk[QStringLiteral("id")] = QStringLiteral("chatcmpl-") + state.messageId;
    chunk[QStringLiteral("object")] = QStringLiteral("chat.completion.chunk");
    chunk[QStringLiteral("created")] = ctx.nowSeconds();
    chunk[QStringLiteral("model")] = state.modelName;
    chunk[QStringLiteral("choices")] = QJsonArray{choice};
    return chunk;
}

QJsonObject terminal(const StreamState& state, const TranslationContext& ctx,
                     const QString& finishReason)
{
    QJsonObject chunk = make(state, ctx, QJsonObject(), finishReason);
    if (state.usage.has_value())
        chunk[QStringLiteral("usage")] = usage(state.usage.value());
    return chunk;
}

QJsonObject usage(const UsageCounters& counters)
{
    QJsonObject out;
    out[QStringLiteral("prompt_tokens")] = counters.promptTokens;
    out[QStringLiteral("completion_tokens")] = counters.completionTokens;
    out[QStringLiteral("total_tokens")] = counters.totalTokens;
    if (counters.reasoningTokens > 0) {
        QJsonObject details;
        details[QStringLiteral("reasoning_tokens")] = counters.reasoningTokens;
        out[QStringLiteral("completion_tokens_details")] = details;
    }
    return out;
}

QJsonObject contentDelta(const QString& key, const QString& text)
{
    QJsonObject delta;
    delta[key] = text;
    return delta;
}

} // namespace openai_chunk
