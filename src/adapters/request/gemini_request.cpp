#include "gemini_request.h"
#include "antigravity_envelope.h"
#include "schema_cleaner.h"
#include "semantic/request_parser.h"
#include "semantic/json_util.h"
#include "core/log_manager.h"

namespace {

QJsonObject textPart(const QString& text)
{
    QJsonObject part;
    part[QStringLiteral("text")] = text;
    return part;
}

QJsonObject contentEntry(const QString& role, const QJsonArray& parts)
{
    QJsonObject entry;
    entry[QStringLiteral("role")] = role;
    entry[QStringLiteral("parts")] = parts;
    return entry;
}

QJsonObject defaultParameters()
{
    QJsonObject schema;
    schema[QStringLiteral("type")] = QStringLiteral("object");
    schema[QStringLiteral("properties")] = QJsonObject();
    return schema;
}

} // namespace

// -----------------------------------------------------------------------------
// OpenAiToGeminiRequest
// -----------------------------------------------------------------------------

QString OpenAiToGeminiRequest::name() const
{
    return QStringLiteral("openai->gemini");
}

QJsonObject OpenAiToGeminiRequest::translate(const QString& model,
                                             const QJsonObject& body,
                                             bool stream,
                                             const TranslationContext& ctx) const
{
    return buildBody(RequestParser::parse(model, body, stream), ctx);
}

QString OpenAiToGeminiRequest::resolveToolName(const QString& callId,
                                               const QMap<QString, QString>& knownNames)
{
    const QString known = knownNames.value(callId);
    if (!known.isEmpty())
        return known;

    const QStringList segments = callId.split(QLatin1Char('-'));
    if (segments.size() > 2)
        return segments.mid(0, segments.size() - 2).join(QLatin1Char('-'));
    return callId;
}

QJsonArray OpenAiToGeminiRequest::defaultSafetySettings()
{
    static const char* const kCategories[] = {
        "HARM_CATEGORY_HARASSMENT",
        "HARM_CATEGORY_HATE_SPEECH",
        "HARM_CATEGORY_SEXUALLY_EXPLICIT",
        "HARM_CATEGORY_DANGEROUS_CONTENT",
        "HARM_CATEGORY_CIVIC_INTEGRITY",
    };

    QJsonArray settings;
    for (const char* category : kCategories) {
        QJsonObject setting;
        setting[QStringLiteral("category")] = QString::fromLatin1(category);
        setting[QStringLiteral("threshold")] = QStringLiteral("OFF");
        settings.append(setting);
    }
    return settings;
}

QJsonObject OpenAiToGeminiRequest::buildBody(const RequestModel& request,
                                             const TranslationContext& ctx) const
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;

    QStringList systemTexts;
    body[QStringLiteral("contents")] = buildContents(request.messages, ctx.options, systemTexts);
    body[QStringLiteral("generationConfig")] = buildGenerationConfig(request, ctx.options);
    body[QStringLiteral("safetySettings")] = defaultSafetySettings();

    if (!systemTexts.isEmpty()) {
        QJsonObject instruction;
        instruction[QStringLiteral("role")] = QStringLiteral("user");
        instruction[QStringLiteral("parts")] = QJsonArray{textPart(systemTexts.join(QLatin1Char('\n')))};
        body[QStringLiteral("systemInstruction")] = instruction;
    }

    if (request.hasTools()) {
        QJsonArray declarations;
        for (const auto& tool : request.tools)
            declarations.append(buildDeclaration(tool, request));

        QJsonObject toolGroup;
        toolGroup[QStringLiteral("functionDeclarations")] = declarations;
        body[QStringLiteral("tools")] = QJsonArray{toolGroup};
    }

    return body;
}

QJsonObject OpenAiToGeminiRequest::buildGenerationConfig(const RequestModel& request,
                                                         const TranslatorOptions& options) const
{
    Q_UNUSED(options);
    const GenerationParams& params = request.params;

    QJsonObject config;
    if (params.temperature.has_value())
        config[QStringLiteral("temperature")] = params.temperature.value();
    if (params.topP.has_value())
        config[QStringLiteral("topP")] = params.topP.value();
    if (params.topK.has_value())
        config[QStringLiteral("topK")] = params.topK.value();
    if (params.maxTokens.has_value())
        config[QStringLiteral("maxOutputTokens")] = params.maxTokens.value();
    if (!params.stopSequences.isEmpty())
        config[QStringLiteral("stopSequences")] = QJsonArray::fromStringList(params.stopSequences);
    return config;
}

QJsonObject OpenAiToGeminiRequest::buildDeclaration(const ToolSpec& tool,
                                                    const RequestModel& request) const
{
    Q_UNUSED(request);
    QJsonObject decl;
    decl[QStringLiteral("name")] = tool.name;
    decl[QStringLiteral("description")] = tool.description;
    decl[QStringLiteral("parameters")] = tool.inputSchema.isEmpty() ? defaultParameters() : tool.inputSchema;
    return decl;
}

QJsonArray OpenAiToGeminiRequest::buildContents(const QList<Message>& messages,
                                                const TranslatorOptions& options,
                                                QStringList& systemTexts) const
{
    // Tool results are not emitted where they appear; they are attached to
    // the model turn that issued the matching call.
    QMap<QString, QString> knownNames;
    QMap<QString, QJsonValue> responses;
    for (const auto& message : messages) {
        for (const auto& block : message.blocks) {
            if (block.kind == BlockKind::ToolUse && !block.id.isEmpty() && !block.name.isEmpty())
                knownNames.insert(block.id, block.name);
            else if (block.kind == BlockKind::ToolResult && !block.toolUseId.isEmpty())
                responses.insert(block.toolUseId, block.content);
        }
    }

    const bool onlyMessage = messages.size() == 1;
    QJsonArray contents;

    for (const auto& message : messages) {
        switch (message.role) {
        case MessageRole::Tool:
            break;

        case MessageRole::System:
            if (!onlyMessage) {
                const QString text = message.joinedText();
                if (!text.isEmpty())
                    systemTexts.append(text);
                break;
            }
            [[fallthrough]];

        case MessageRole::User: {
            const QJsonArray parts = userParts(message);
            if (!parts.isEmpty())
                contents.append(contentEntry(QStringLiteral("user"), parts));
            break;
        }

        case MessageRole::Assistant: {
            QJsonArray parts;
            const QString text = message.joinedText();
            if (!text.isEmpty())
                parts.append(textPart(text));

            QList<const ContentBlock*> calls;
            for (const auto& block : message.blocks) {
                if (block.kind == BlockKind::ToolUse)
                    calls.append(&block);
            }

            if (calls.isEmpty()) {
                if (!parts.isEmpty())
                    contents.append(contentEntry(QStringLiteral("model"), parts));
                break;
            }

            QJsonArray responseParts;
            for (const ContentBlock* call : calls) {
                const QString toolName = call->name.isEmpty()
                    ? resolveToolName(call->id, knownNames)
                    : call->name;

                QJsonObject functionCall;
                functionCall[QStringLiteral("id")] = call->id;
                functionCall[QStringLiteral("name")] = toolName;
                functionCall[QStringLiteral("args")] = call->input.isObject() ? call->input.toObject()
                                                                               : QJsonObject();
                QJsonObject callPart;
                callPart[QStringLiteral("thoughtSignature")] = options.thoughtSignature;
                callPart[QStringLiteral("functionCall")] = functionCall;
                parts.append(callPart);

                QJsonObject wrapped;
                wrapped[QStringLiteral("result")] = functionResponseValue(responses.value(call->id));

                QJsonObject functionResponse;
                functionResponse[QStringLiteral("id")] = call->id;
                functionResponse[QStringLiteral("name")] = toolName;
                functionResponse[QStringLiteral("response")] = wrapped;

                QJsonObject responsePart;
                responsePart[QStringLiteral("functionResponse")] = functionResponse;
                responseParts.append(responsePart);
            }

            contents.append(contentEntry(QStringLiteral("model"), parts));
            contents.append(contentEntry(QStringLiteral("user"), responseParts));
            break;
        }
        }
    }

    return contents;
}

QJsonArray OpenAiToGeminiRequest::userParts(const Message& message) const
{
    QJsonArray parts;
    for (const auto& block : message.blocks) {
        if (block.kind == BlockKind::Text) {
            parts.append(textPart(block.text));
        } else if (block.kind == BlockKind::Image) {
            QJsonObject inlineData;
            inlineData[QStringLiteral("mimeType")] = block.mediaType;
            inlineData[QStringLiteral("data")] = block.data;
            QJsonObject part;
            part[QStringLiteral("inlineData")] = inlineData;
            parts.append(part);
        }
    }
    return parts;
}

QJsonObject OpenAiToGeminiRequest::functionResponseValue(const QJsonValue& raw) const
{
    QJsonValue value;
    if (raw.isObject()) {
        value = raw;
    } else if (raw.isString() || raw.isArray()) {
        const QString text = json_util::extractText(raw);
        value = json_util::parseOrRaw(text.isEmpty() ? QStringLiteral("{}") : text);
    } else {
        value = QJsonObject();
    }

    if (value.isObject())
        return value.toObject();

    QJsonObject wrapped;
    wrapped[QStringLiteral("result")] = value;
    return wrapped;
}

// -----------------------------------------------------------------------------
// OpenAiToGeminiCliRequest
// -----------------------------------------------------------------------------

QString OpenAiToGeminiCliRequest::name() const
{
    return QStringLiteral("openai->gemini-cli");
}

int OpenAiToGeminiCliRequest::resolveThinkingBudget(const RequestModel& request,
                                                    const TranslatorOptions& options)
{
    if (request.thinkingBudget.has_value())
        return request.thinkingBudget.value();

    if (request.reasoningEffort == QLatin1String("low"))
        return 1024;
    if (request.reasoningEffort == QLatin1String("medium"))
        return 8192;
    if (request.reasoningEffort == QLatin1String("high"))
        return 32768;
    return options.defaultThinkingBudget;
}

QJsonObject OpenAiToGeminiCliRequest::buildGenerationConfig(const RequestModel& request,
                                                            const TranslatorOptions& options) const
{
    QJsonObject config = OpenAiToGeminiRequest::buildGenerationConfig(request, options);

    QJsonObject thinking;
    thinking[QStringLiteral("thinkingBudget")] = resolveThinkingBudget(request, options);
    thinking[QStringLiteral("include_thoughts")] = true;
    config[QStringLiteral("thinkingConfig")] = thinking;
    return config;
}

QJsonObject OpenAiToGeminiCliRequest::buildDeclaration(const ToolSpec& tool,
                                                       const RequestModel& request) const
{
    QJsonObject decl = OpenAiToGeminiRequest::buildDeclaration(tool, request);
    const QJsonObject cleaned = SchemaCleaner::clean(decl.value(QStringLiteral("parameters")).toObject());

    // Claude-backed models take "parameters"; native Gemini wants parametersJsonSchema.
    if (request.model.contains(QLatin1String("claude"), Qt::CaseInsensitive)) {
        decl[QStringLiteral("parameters")] = cleaned;
    } else {
        decl.remove(QStringLiteral("parameters"));
        decl[QStringLiteral("parametersJsonSchema")] = cleaned;
    }
    return decl;
}

// -----------------------------------------------------------------------------
// OpenAiToAntigravityRequest
// -----------------------------------------------------------------------------

QString OpenAiToAntigravityRequest::name() const
{
    return QStringLiteral("openai->antigravity");
}

QJsonObject OpenAiToAntigravityRequest::translate(const QString& model,
                                                  const QJsonObject& body,
                                                  bool stream,
                                                  const TranslationContext& ctx) const
{
    const QJsonObject cliBody = OpenAiToGeminiCliRequest::translate(model, body, stream, ctx);
    LOG_DEBUG(QStringLiteral("GeminiRequest: wrapping %1 in Cloud Code envelope").arg(model));
    return AntigravityEnvelope::wrap(model, cliBody, ctx);
}
