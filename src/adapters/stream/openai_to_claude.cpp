#include "openai_to_claude.h"
#include "semantic/reason_map.h"
#include "core/log_manager.h"
#include <QJsonArray>

namespace {

QJsonObject blockStop(int index)
{
    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("content_block_stop");
    event[QStringLiteral("index")] = index;
    return event;
}

QJsonObject blockDelta(int index, const QJsonObject& delta)
{
    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("content_block_delta");
    event[QStringLiteral("index")] = index;
    event[QStringLiteral("delta")] = delta;
    return event;
}

QJsonObject blockStart(int index, const QJsonObject& contentBlock)
{
    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("content_block_start");
    event[QStringLiteral("index")] = index;
    event[QStringLiteral("content_block")] = contentBlock;
    return event;
}

QString firstNonEmptyString(const QJsonObject& obj, const char* key, const char* alternate)
{
    const QString primary = obj.value(QString::fromLatin1(key)).toString();
    if (!primary.isEmpty())
        return primary;
    return obj.value(QString::fromLatin1(alternate)).toString();
}

} // namespace

QString OpenAiToClaudeStream::name() const
{
    return QStringLiteral("openai->claude");
}

QString OpenAiToClaudeStream::resolveMessageId(const QJsonObject& chunk, const TranslationContext& ctx)
{
    QString id = chunk.value(QStringLiteral("id")).toString();
    if (id.startsWith(QLatin1String("chatcmpl-")))
        id = id.mid(9);
    if (!id.isEmpty() && id != QLatin1String("chat") && id.size() >= 8)
        return id;

    const QJsonObject extend = chunk.value(QStringLiteral("extend_fields")).toObject();
    const QString fallback = firstNonEmptyString(extend, "requestId", "traceId");
    if (!fallback.isEmpty())
        return fallback;
    return ctx.nextId(IdKind::Message);
}

QList<QJsonObject> OpenAiToClaudeStream::step(const QJsonObject& event,
                                              StreamState& state,
                                              const TranslationContext& ctx) const
{
    QList<QJsonObject> out;
    if (state.finishReasonSent)
        return out;

    const QJsonValue usage = event.value(QStringLiteral("usage"));
    if (usage.isObject())
        recordUsage(usage.toObject(), state);

    const QJsonArray choices = event.value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty())
        return out;

    const QJsonObject choice = choices.first().toObject();
    const QJsonObject delta = choice.value(QStringLiteral("delta")).toObject();

    if (!state.messageStarted) {
        state.messageStarted = true;
        state.messageId = resolveMessageId(event, ctx);
        state.modelName = event.value(QStringLiteral("model")).toString();
        if (state.modelName.isEmpty())
            state.modelName = QStringLiteral("unknown");
        state.nextBlockIndex = 0;
        out.append(messageStart(state));
    }

    const QString reasoning = firstNonEmptyString(delta, "reasoning_content", "reasoning");
    if (!reasoning.isEmpty()) {
        if (!state.isOpen(OpenBlock::Thinking))
            openBlock(OpenBlock::Thinking, state, out);

        QJsonObject thinking;
        thinking[QStringLiteral("type")] = QStringLiteral("thinking_delta");
        thinking[QStringLiteral("thinking")] = reasoning;
        out.append(blockDelta(state.openBlockIndex, thinking));
    }

    const QString content = delta.value(QStringLiteral("content")).toString();
    if (!content.isEmpty()) {
        if (!state.isOpen(OpenBlock::Text))
            openBlock(OpenBlock::Text, state, out);

        QJsonObject text;
        text[QStringLiteral("type")] = QStringLiteral("text_delta");
        text[QStringLiteral("text")] = content;
        out.append(blockDelta(state.openBlockIndex, text));
    }

    const QJsonValue toolCalls = delta.value(QStringLiteral("tool_calls"));
    if (toolCalls.isArray())
        handleToolCalls(toolCalls.toArray(), state, out);

    const QString finishReason = choice.value(QStringLiteral("finish_reason")).toString();
    if (!finishReason.isEmpty())
        finish(finishReason, state, out);

    return out;
}

QList<QJsonObject> OpenAiToClaudeStream::close(StreamState& state,
                                               const TranslationContext& ctx) const
{
    Q_UNUSED(ctx);
    QList<QJsonObject> out;
    if (!state.messageStarted || state.finishReasonSent)
        return out;

    LOG_DEBUG(QStringLiteral("OpenAiStream: stream ended without finish_reason"));
    finish(state.toolCalls.isEmpty() ? QStringLiteral("stop") : QStringLiteral("tool_calls"), state, out);
    return out;
}

QJsonObject OpenAiToClaudeStream::messageStart(const StreamState& state) const
{
    QJsonObject usage;
    usage[QStringLiteral("input_tokens")] = state.usage.has_value() ? state.usage->promptTokens : 0;
    usage[QStringLiteral("output_tokens")] = 0;

    QJsonObject message;
    message[QStringLiteral("id")] = state.messageId;
    message[QStringLiteral("type")] = QStringLiteral("message");
    message[QStringLiteral("role")] = QStringLiteral("assistant");
    message[QStringLiteral("model")] = state.modelName;
    message[QStringLiteral("content")] = QJsonArray();
    message[QStringLiteral("stop_reason")] = QJsonValue();
    message[QStringLiteral("stop_sequence")] = QJsonValue();
    message[QStringLiteral("usage")] = usage;

    QJsonObject event;
    event[QStringLiteral("type")] = QStringLiteral("message_start");
    event[QStringLiteral("message")] = message;
    return event;
}

void OpenAiToClaudeStream::openBlock(OpenBlock kind, StreamState& state, QList<QJsonObject>& out) const
{
    closeOpenBlock(state, out);

    const int index = state.allocateBlockIndex();
    QJsonObject contentBlock;
    if (kind == OpenBlock::Thinking) {
        contentBlock[QStringLiteral("type")] = QStringLiteral("thinking");
        contentBlock[QStringLiteral("thinking")] = QString();
    } else {
        contentBlock[QStringLiteral("type")] = QStringLiteral("text");
        contentBlock[QStringLiteral("text")] = QString();
    }
    out.append(blockStart(index, contentBlock));
    state.setOpenBlock(kind, index);
}

void OpenAiToClaudeStream::closeOpenBlock(StreamState& state, QList<QJsonObject>& out) const
{
    if (state.openBlock == OpenBlock::None)
        return;
    out.append(blockStop(state.openBlockIndex));
    state.clearOpenBlock();
}

void OpenAiToClaudeStream::handleToolCalls(const QJsonArray& toolCalls, StreamState& state,
                                           QList<QJsonObject>& out) const
{
    for (const auto& item : toolCalls) {
        const QJsonObject call = item.toObject();
        const int providerIndex = call.value(QStringLiteral("index")).toInt(0);
        const QJsonObject function = call.value(QStringLiteral("function")).toObject();
        const QString id = call.value(QStringLiteral("id")).toString();

        if (!id.isEmpty()) {
            const ToolCallEntry* existing = state.toolCalls.byProviderIndex(providerIndex);
            // Some upstreams repeat the id on every fragment of the same call.
            if (!existing || existing->id != id) {
                closeOpenBlock(state, out);

                const int blockIndex = state.allocateBlockIndex();
                const ToolCallEntry& entry = state.toolCalls.open(
                    providerIndex, blockIndex, id, function.value(QStringLiteral("name")).toString());

                QJsonObject contentBlock;
                contentBlock[QStringLiteral("type")] = QStringLiteral("tool_use");
                contentBlock[QStringLiteral("id")] = entry.id;
                contentBlock[QStringLiteral("name")] = entry.name;
                contentBlock[QStringLiteral("input")] = QJsonObject();
                out.append(blockStart(blockIndex, contentBlock));
            }
        }

        const QString fragment = function.value(QStringLiteral("arguments")).toString();
        if (fragment.isEmpty())
            continue;

        ToolCallEntry* entry = state.toolCalls.byProviderIndex(providerIndex);
        if (!entry) {
            LOG_DEBUG(QStringLiteral("OpenAiStream: arguments for unknown tool call %1").arg(providerIndex));
            continue;
        }
        entry->argumentBuffer.append(fragment);

        QJsonObject jsonDelta;
        jsonDelta[QStringLiteral("type")] = QStringLiteral("input_json_delta");
        jsonDelta[QStringLiteral("partial_json")] = fragment;
        out.append(blockDelta(entry->outputIndex, jsonDelta));
    }
}

void OpenAiToClaudeStream::finish(const QString& finishReason, StreamState& state,
                                  QList<QJsonObject>& out) const
{
    closeOpenBlock(state, out);
    for (const auto& entry : state.toolCalls.entries())
        out.append(blockStop(entry.outputIndex));

    QJsonObject delta;
    delta[QStringLiteral("stop_reason")] = stopReasonFromFinishReason(finishReason);
    delta[QStringLiteral("stop_sequence")] = QJsonValue();

    QJsonObject usage;
    usage[QStringLiteral("output_tokens")] = state.usage.has_value() ? state.usage->completionTokens : 0;
    if (state.usage.has_value())
        usage[QStringLiteral("input_tokens")] = state.usage->promptTokens;

    QJsonObject messageDelta;
    messageDelta[QStringLiteral("type")] = QStringLiteral("message_delta");
    messageDelta[QStringLiteral("delta")] = delta;
    messageDelta[QStringLiteral("usage")] = usage;
    out.append(messageDelta);

    QJsonObject stop;
    stop[QStringLiteral("type")] = QStringLiteral("message_stop");
    out.append(stop);

    state.finishReason = finishReason;
    state.finishReasonSent = true;
}

void OpenAiToClaudeStream::recordUsage(const QJsonObject& usage, StreamState& state) const
{
    UsageCounters counters;
    counters.promptTokens = usage.value(QStringLiteral("prompt_tokens")).toInt();
    counters.completionTokens = usage.value(QStringLiteral("completion_tokens")).toInt();
    counters.totalTokens = usage.value(QStringLiteral("total_tokens")).toInt(
        counters.promptTokens + counters.completionTokens);
    counters.reasoningTokens = usage.value(QStringLiteral("completion_tokens_details")).toObject()
                                   .value(QStringLiteral("reasoning_tokens")).toInt();
    state.usage = counters;
}
