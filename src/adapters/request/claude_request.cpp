#include "claude_request.h"
#include "semantic/message_merger.h"
#include "semantic/request_parser.h"
#include "semantic/json_util.h"
#include "core/log_manager.h"

namespace {

QJsonObject ephemeral(bool longLived)
{
    QJsonObject cache;
    cache[QStringLiteral("type")] = QStringLiteral("ephemeral");
    if (longLived)
        cache[QStringLiteral("ttl")] = QStringLiteral("1h");
    return cache;
}

QJsonObject defaultInputSchema()
{
    QJsonObject schema;
    schema[QStringLiteral("type")] = QStringLiteral("object");
    schema[QStringLiteral("properties")] = QJsonObject();
    schema[QStringLiteral("required")] = QJsonArray();
    return schema;
}

} // namespace

QString OpenAiToClaudeRequest::name() const
{
    return QStringLiteral("openai->claude");
}

QJsonObject OpenAiToClaudeRequest::translate(const QString& model,
                                             const QJsonObject& body,
                                             bool stream,
                                             const TranslationContext& ctx) const
{
    const RequestModel request = RequestParser::parse(model, body, stream);

    QJsonObject result;
    result[QStringLiteral("model")] = model;
    result[QStringLiteral("max_tokens")] = resolveMaxTokens(request, ctx.options);
    result[QStringLiteral("stream")] = stream;

    if (request.params.temperature.has_value())
        result[QStringLiteral("temperature")] = request.params.temperature.value();
    if (request.params.topP.has_value())
        result[QStringLiteral("top_p")] = request.params.topP.value();
    if (request.params.topK.has_value())
        result[QStringLiteral("top_k")] = request.params.topK.value();
    if (!request.params.stopSequences.isEmpty())
        result[QStringLiteral("stop_sequences")] = QJsonArray::fromStringList(request.params.stopSequences);

    const MergedConversation merged = MessageMerger::merge(request.messages);
    result[QStringLiteral("messages")] = buildMessages(merged.messages);
    result[QStringLiteral("system")] = buildSystem(merged.systemText, ctx.options);

    if (request.hasTools())
        result[QStringLiteral("tools")] = buildToolDefs(request.tools);

    if (request.hasToolChoice())
        result[QStringLiteral("tool_choice")] = mapToolChoice(request.toolChoice);

    if (request.thinkingBudget.has_value()) {
        QJsonObject thinking;
        thinking[QStringLiteral("type")] = QStringLiteral("enabled");
        thinking[QStringLiteral("budget_tokens")] = request.thinkingBudget.value();
        result[QStringLiteral("thinking")] = thinking;
    }

    return result;
}

int OpenAiToClaudeRequest::resolveMaxTokens(const RequestModel& request,
                                            const TranslatorOptions& options)
{
    int maxTokens = request.params.maxTokens.value_or(options.defaultMaxTokens);

    if (request.hasTools() && maxTokens < options.minToolMaxTokens)
        maxTokens = options.minToolMaxTokens;

    // Anthropic rejects max_tokens <= thinking.budget_tokens.
    if (request.thinkingBudget.has_value() && maxTokens <= request.thinkingBudget.value())
        maxTokens = request.thinkingBudget.value() + options.thinkingBudgetPadding;

    return maxTokens;
}

QJsonObject OpenAiToClaudeRequest::mapToolChoice(const QJsonValue& choice)
{
    QJsonObject mapped;

    if (choice.isObject()) {
        const QJsonObject obj = choice.toObject();
        const QString functionName =
            obj.value(QStringLiteral("function")).toObject().value(QStringLiteral("name")).toString();
        if (!functionName.isEmpty()) {
            mapped[QStringLiteral("type")] = QStringLiteral("tool");
            mapped[QStringLiteral("name")] = functionName;
            return mapped;
        }
        if (obj.contains(QStringLiteral("type")))
            return obj;
    }

    const QString keyword = choice.toString();
    if (keyword == QLatin1String("required"))
        mapped[QStringLiteral("type")] = QStringLiteral("any");
    else
        mapped[QStringLiteral("type")] = QStringLiteral("auto");
    return mapped;
}

QJsonArray OpenAiToClaudeRequest::buildMessages(const QList<Message>& messages) const
{
    QJsonArray out;
    for (const auto& message : messages) {
        QJsonArray content;
        for (const auto& block : message.blocks)
            content.append(renderBlock(block));

        QJsonObject msg;
        msg[QStringLiteral("role")] = message.role == MessageRole::Assistant
            ? QStringLiteral("assistant")
            : QStringLiteral("user");
        msg[QStringLiteral("content")] = content;
        out.append(msg);
    }
    return out;
}

QJsonObject OpenAiToClaudeRequest::renderBlock(const ContentBlock& block) const
{
    QJsonObject out;

    switch (block.kind) {
    case BlockKind::Text:
        out[QStringLiteral("type")] = QStringLiteral("text");
        out[QStringLiteral("text")] = block.text;
        break;

    case BlockKind::Image: {
        QJsonObject source;
        source[QStringLiteral("type")] = QStringLiteral("base64");
        source[QStringLiteral("media_type")] = block.mediaType;
        source[QStringLiteral("data")] = block.data;
        out[QStringLiteral("type")] = QStringLiteral("image");
        out[QStringLiteral("source")] = source;
        break;
    }

    case BlockKind::ToolUse:
        out[QStringLiteral("type")] = QStringLiteral("tool_use");
        out[QStringLiteral("id")] = block.id;
        out[QStringLiteral("name")] = block.name;
        out[QStringLiteral("input")] = block.input;
        break;

    case BlockKind::ToolResult:
        out[QStringLiteral("type")] = QStringLiteral("tool_result");
        out[QStringLiteral("tool_use_id")] = block.toolUseId;
        // Claude accepts a string or an array of content blocks here.
        if (block.content.isString() || block.content.isArray())
            out[QStringLiteral("content")] = block.content;
        else
            out[QStringLiteral("content")] = json_util::stringify(block.content);
        if (block.isError)
            out[QStringLiteral("is_error")] = true;
        break;
    }

    if (block.cacheEligible)
        out[QStringLiteral("cache_control")] = ephemeral(false);
    return out;
}

QJsonArray OpenAiToClaudeRequest::buildSystem(const QString& systemText,
                                              const TranslatorOptions& options) const
{
    QJsonArray system;

    QJsonObject preamble;
    preamble[QStringLiteral("type")] = QStringLiteral("text");
    preamble[QStringLiteral("text")] = options.systemPreamble;
    system.append(preamble);

    if (!systemText.isEmpty()) {
        QJsonObject custom;
        custom[QStringLiteral("type")] = QStringLiteral("text");
        custom[QStringLiteral("text")] = systemText;
        custom[QStringLiteral("cache_control")] = ephemeral(true);
        system.append(custom);
    }
    return system;
}

QJsonArray OpenAiToClaudeRequest::buildToolDefs(const QList<ToolSpec>& tools) const
{
    QJsonArray defs;
    for (const auto& tool : tools) {
        QJsonObject def;
        def[QStringLiteral("name")] = tool.name;
        def[QStringLiteral("description")] = tool.description;
        def[QStringLiteral("input_schema")] = tool.inputSchema.isEmpty()
            ? defaultInputSchema()
            : tool.inputSchema;
        defs.append(def);
    }

    if (!defs.isEmpty()) {
        QJsonObject last = defs.last().toObject();
        last[QStringLiteral("cache_control")] = ephemeral(true);
        defs[defs.size() - 1] = last;
    }

    LOG_DEBUG(QStringLiteral("ClaudeRequest: mapped %1 tool definitions").arg(defs.size()));
    return defs;
}
