#include "request_parser.h"
#include "normalizer.h"
#include "json_util.h"
#include "core/log_manager.h"

namespace RequestParser {

QList<ToolSpec> parseTools(const QJsonArray& tools)
{
    QList<ToolSpec> specs;
    for (const auto& item : tools) {
        const QJsonObject tool = item.toObject();
        const bool wrapped = tool.value(QStringLiteral("type")).toString() == QLatin1String("function")
                             && tool.value(QStringLiteral("function")).isObject();
        const QJsonObject def = wrapped ? tool.value(QStringLiteral("function")).toObject() : tool;

        ToolSpec spec;
        spec.name = def.value(QStringLiteral("name")).toString();
        if (spec.name.isEmpty()) {
            LOG_DEBUG(QStringLiteral("RequestParser: dropping tool definition without a name"));
            continue;
        }
        spec.description = def.value(QStringLiteral("description")).toString();
        spec.inputSchema = json_util::firstOf(def, "parameters", "input_schema").toObject();
        specs.append(spec);
    }
    return specs;
}

GenerationParams parseGenerationParams(const QJsonObject& body)
{
    GenerationParams params;

    if (body.value(QStringLiteral("temperature")).isDouble())
        params.temperature = body.value(QStringLiteral("temperature")).toDouble();
    if (body.value(QStringLiteral("top_p")).isDouble())
        params.topP = body.value(QStringLiteral("top_p")).toDouble();
    if (body.value(QStringLiteral("top_k")).isDouble())
        params.topK = body.value(QStringLiteral("top_k")).toInt();

    const QJsonValue maxTokens = json_util::firstOf(body, "max_tokens", "max_completion_tokens");
    if (maxTokens.isDouble())
        params.maxTokens = maxTokens.toInt();

    const QJsonValue stop = body.value(QStringLiteral("stop"));
    if (stop.isString() && !stop.toString().isEmpty()) {
        params.stopSequences.append(stop.toString());
    } else if (stop.isArray()) {
        for (const auto& s : stop.toArray()) {
            if (s.isString() && !s.toString().isEmpty())
                params.stopSequences.append(s.toString());
        }
    }
    return params;
}

RequestModel parse(const QString& model, const QJsonObject& body, bool stream)
{
    RequestModel request;
    request.model = model;
    request.stream = stream;

    for (const auto& item : body.value(QStringLiteral("messages")).toArray())
        request.messages.append(Normalizer::normalize(item.toObject()));

    request.tools = parseTools(body.value(QStringLiteral("tools")).toArray());

    const QJsonValue toolChoice = body.value(QStringLiteral("tool_choice"));
    const bool emptyChoice = toolChoice.isUndefined() || toolChoice.isNull()
                             || (toolChoice.isString() && toolChoice.toString().isEmpty());
    if (!emptyChoice)
        request.toolChoice = toolChoice;

    request.params = parseGenerationParams(body);
    request.reasoningEffort = body.value(QStringLiteral("reasoning_effort")).toString().trimmed().toLower();

    const QJsonObject thinking = body.value(QStringLiteral("thinking")).toObject();
    if (thinking.value(QStringLiteral("type")).toString() == QLatin1String("enabled")) {
        const int budget = thinking.value(QStringLiteral("budget_tokens")).toInt(0);
        if (budget > 0)
            request.thinkingBudget = budget;
    }
    return request;
}

} // namespace RequestParser
