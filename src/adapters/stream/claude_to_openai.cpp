#include "claude_to_openai.h"
#include "openai_chunk.h"
#include "semantic/reason_map.h"
#include "core/log_manager.h"
#include <QJsonArray>

QString ClaudeToOpenAiStream::name() const
{
    return QStringLiteral("claude->openai");
}

QList<QJsonObject> ClaudeToOpenAiStream::step(const QJsonObject& event,
                                              StreamState& state,
                                              const TranslationContext& ctx) const
{
    QList<QJsonObject> out;
    const QString type = event.value(QStringLiteral("type")).toString();

    // Content that arrives without message_start still needs an id to stamp chunks with.
    if (!state.messageStarted && type != QLatin1String("message_start") && state.messageId.isEmpty())
        state.messageId = ctx.nextId(IdKind::Message);

    if (type == QLatin1String("message_start"))
        onMessageStart(event, state, ctx, out);
    else if (type == QLatin1String("content_block_start"))
        onBlockStart(event, state, ctx, out);
    else if (type == QLatin1String("content_block_delta"))
        onBlockDelta(event, state, ctx, out);
    else if (type == QLatin1String("content_block_stop"))
        onBlockStop(event, state, ctx, out);
    else if (type == QLatin1String("message_delta"))
        onMessageDelta(event, state, ctx, out);
    else if (type == QLatin1String("message_stop"))
        onMessageStop(state, ctx, out);
    else if (type == QLatin1String("error"))
        out.append(errorEvent(event));

    return out;
}

QList<QJsonObject> ClaudeToOpenAiStream::close(StreamState& state,
                                               const TranslationContext& ctx) const
{
    QList<QJsonObject> out;
    if (state.finishReasonSent || (!state.messageStarted && state.messageId.isEmpty()))
        return out;

    if (state.isOpen(OpenBlock::Thinking)) {
        out.append(openai_chunk::make(state, ctx,
            openai_chunk::contentDelta(QStringLiteral("content"), QString::fromLatin1(kThinkClose))));
    }
    state.clearOpenBlock();
    onMessageStop(state, ctx, out);
    return out;
}

void ClaudeToOpenAiStream::onMessageStart(const QJsonObject& event, StreamState& state,
                                          const TranslationContext& ctx,
                                          QList<QJsonObject>& out) const
{
    const QJsonObject message = event.value(QStringLiteral("message")).toObject();

    state.messageId = message.value(QStringLiteral("id")).toString();
    if (state.messageId.isEmpty())
        state.messageId = ctx.nextId(IdKind::Message);
    state.modelName = message.value(QStringLiteral("model")).toString();
    state.messageStarted = true;
    state.nextToolCallIndex = 0;
    state.toolCalls.clear();
    state.clearOpenBlock();

    const QJsonObject usage = message.value(QStringLiteral("usage")).toObject();
    if (usage.contains(QStringLiteral("input_tokens"))) {
        UsageCounters counters;
        counters.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();
        counters.totalTokens = counters.promptTokens;
        state.usage = counters;
    }

    QJsonObject delta;
    delta[QStringLiteral("role")] = QStringLiteral("assistant");
    out.append(openai_chunk::make(state, ctx, delta));
}

void ClaudeToOpenAiStream::onBlockStart(const QJsonObject& event, StreamState& state,
                                        const TranslationContext& ctx,
                                        QList<QJsonObject>& out) const
{
    const int index = event.value(QStringLiteral("index")).toInt();
    const QJsonObject block = event.value(QStringLiteral("content_block")).toObject();
    const QString blockType = block.value(QStringLiteral("type")).toString();

    if (blockType == QLatin1String("text")) {
        state.setOpenBlock(OpenBlock::Text, index);
    } else if (blockType == QLatin1String("thinking")) {
        state.setOpenBlock(OpenBlock::Thinking, index);
        out.append(openai_chunk::make(state, ctx,
            openai_chunk::contentDelta(QStringLiteral("content"), QString::fromLatin1(kThinkOpen))));
    } else if (blockType == QLatin1String("tool_use")) {
        const int outputIndex = state.allocateToolCallIndex();
        const ToolCallEntry& entry = state.toolCalls.open(
            index, outputIndex,
            block.value(QStringLiteral("id")).toString(),
            block.value(QStringLiteral("name")).toString());

        QJsonObject function;
        function[QStringLiteral("name")] = entry.name;
        function[QStringLiteral("arguments")] = QString();

        QJsonObject toolCall;
        toolCall[QStringLiteral("index")] = entry.outputIndex;
        toolCall[QStringLiteral("id")] = entry.id;
        toolCall[QStringLiteral("type")] = QStringLiteral("function");
        toolCall[QStringLiteral("function")] = function;

        QJsonObject delta;
        delta[QStringLiteral("tool_calls")] = QJsonArray{toolCall};
        out.append(openai_chunk::make(state, ctx, delta));
    }
}

void ClaudeToOpenAiStream::onBlockDelta(const QJsonObject& event, StreamState& state,
                                        const TranslationContext& ctx,
                                        QList<QJsonObject>& out) const
{
    const int index = event.value(QStringLiteral("index")).toInt();
    const QJsonObject delta = event.value(QStringLiteral("delta")).toObject();
    const QString deltaType = delta.value(QStringLiteral("type")).toString();

    if (deltaType == QLatin1String("text_delta")) {
        const QString text = delta.value(QStringLiteral("text")).toString();
        if (!text.isEmpty())
            out.append(openai_chunk::make(state, ctx, openai_chunk::contentDelta(QStringLiteral("content"), text)));
    } else if (deltaType == QLatin1String("thinking_delta")) {
        const QString thinking = delta.value(QStringLiteral("thinking")).toString();
        if (!thinking.isEmpty())
            out.append(openai_chunk::make(state, ctx, openai_chunk::contentDelta(QStringLiteral("content"), thinking)));
    } else if (deltaType == QLatin1String("input_json_delta")) {
        const QString fragment = delta.value(QStringLiteral("partial_json")).toString();
        if (fragment.isEmpty())
            return;

        ToolCallEntry* entry = state.toolCalls.byProviderIndex(index);
        if (!entry) {
            LOG_DEBUG(QStringLiteral("ClaudeStream: input_json_delta for unknown block %1").arg(index));
            return;
        }
        entry->argumentBuffer.append(fragment);

        QJsonObject function;
        function[QStringLiteral("arguments")] = fragment;

        QJsonObject toolCall;
        toolCall[QStringLiteral("index")] = entry->outputIndex;
        toolCall[QStringLiteral("id")] = entry->id;
        toolCall[QStringLiteral("function")] = function;

        QJsonObject chunkDelta;
        chunkDelta[QStringLiteral("tool_calls")] = QJsonArray{toolCall};
        out.append(openai_chunk::make(state, ctx, chunkDelta));
    }
}

void ClaudeToOpenAiStream::onBlockStop(const QJsonObject& event, StreamState& state,
                                       const TranslationContext& ctx,
                                       QList<QJsonObject>& out) const
{
    const int index = event.value(QStringLiteral("index")).toInt();
    if (state.openBlockIndex == index && state.isOpen(OpenBlock::Thinking)) {
        out.append(openai_chunk::make(state, ctx,
            openai_chunk::contentDelta(QStringLiteral("content"), QString::fromLatin1(kThinkClose))));
    }
    state.clearOpenBlock();
}

void ClaudeToOpenAiStream::onMessageDelta(const QJsonObject& event, StreamState& state,
                                          const TranslationContext& ctx,
                                          QList<QJsonObject>& out) const
{
    const QJsonObject usage = event.value(QStringLiteral("usage")).toObject();
    if (usage.contains(QStringLiteral("output_tokens"))) {
        UsageCounters counters = state.usage.value_or(UsageCounters{});
        if (usage.contains(QStringLiteral("input_tokens")))
            counters.promptTokens = usage.value(QStringLiteral("input_tokens")).toInt();
        counters.completionTokens = usage.value(QStringLiteral("output_tokens")).toInt();
        counters.totalTokens = counters.promptTokens + counters.completionTokens;
        state.usage = counters;
    }

    const QString stopReason = event.value(QStringLiteral("delta")).toObject()
                                   .value(QStringLiteral("stop_reason")).toString();
    if (stopReason.isEmpty())
        return;

    state.finishReason = finishReasonFromStopReason(stopReason);
    if (state.finishReasonSent)
        return;

    out.append(openai_chunk::terminal(state, ctx, state.finishReason.value()));
    state.finishReasonSent = true;
}

void ClaudeToOpenAiStream::onMessageStop(StreamState& state, const TranslationContext& ctx,
                                         QList<QJsonObject>& out) const
{
    if (state.finishReasonSent)
        return;

    QString reason = state.finishReason.value_or(QString());
    if (reason.isEmpty())
        reason = state.toolCalls.isEmpty() ? QStringLiteral("stop") : QStringLiteral("tool_calls");

    out.append(openai_chunk::terminal(state, ctx, reason));
    state.finishReason = reason;
    state.finishReasonSent = true;
}

QJsonObject ClaudeToOpenAiStream::errorEvent(const QJsonObject& event) const
{
    const QJsonObject source = event.value(QStringLiteral("error")).toObject();

    QJsonObject error;
    error[QStringLiteral("type")] = source.value(QStringLiteral("type")).toString(QStringLiteral("api_error"));
    error[QStringLiteral("message")] = source.value(QStringLiteral("message")).toString();

    LOG_WARNING(QStringLiteral("ClaudeStream: provider error: %1")
                    .arg(error.value(QStringLiteral("message")).toString()));

    QJsonObject out;
    out[QStringLiteral("error")] = error;
    return out;
}
