#include "normalizer.h"
#include "json_util.h"
#include "core/log_manager.h"
#include <QJsonArray>

namespace {

QString partType(const QJsonObject& part)
{
    return part.value(QStringLiteral("type")).toString();
}

bool isText(const QJsonObject& part) { return partType(part) == QLatin1String("text"); }
bool isImageUrl(const QJsonObject& part) { return partType(part) == QLatin1String("image_url"); }
bool isImage(const QJsonObject& part) { return partType(part) == QLatin1String("image"); }
bool isToolUse(const QJsonObject& part) { return partType(part) == QLatin1String("tool_use"); }
bool isToolResult(const QJsonObject& part) { return partType(part) == QLatin1String("tool_result"); }
bool isFunctionCall(const QJsonObject& part) { return partType(part) == QLatin1String("function"); }

std::optional<ContentBlock> convertText(const QJsonObject& part)
{
    const QString text = part.value(QStringLiteral("text")).toString();
    if (text.isEmpty())
        return std::nullopt;
    return ContentBlock::fromText(text);
}

std::optional<ContentBlock> convertImageUrl(const QJsonObject& part)
{
    const QJsonValue imageUrl = part.value(QStringLiteral("image_url"));
    const QString url = imageUrl.isObject()
        ? imageUrl.toObject().value(QStringLiteral("url")).toString()
        : imageUrl.toString();

    auto uri = json_util::parseDataUri(url);
    if (!uri)
        return std::nullopt;
    return ContentBlock::fromImage(uri->mediaType, uri->data);
}

std::optional<ContentBlock> convertImage(const QJsonObject& part)
{
    const QJsonObject source = part.value(QStringLiteral("source")).toObject();
    if (source.value(QStringLiteral("type")).toString() != QLatin1String("base64"))
        return std::nullopt;
    const QString data = source.value(QStringLiteral("data")).toString();
    if (data.isEmpty())
        return std::nullopt;
    return ContentBlock::fromImage(source.value(QStringLiteral("media_type")).toString(), data);
}

std::optional<ContentBlock> convertToolUse(const QJsonObject& part)
{
    const QString id = part.value(QStringLiteral("id")).toString();
    const QString name = part.value(QStringLiteral("name")).toString();
    if (id.isEmpty() && name.isEmpty())
        return std::nullopt;

    QJsonValue input = part.value(QStringLiteral("input"));
    if (input.isUndefined() || input.isNull())
        input = QJsonObject();
    return ContentBlock::fromToolUse(id, name, input);
}

std::optional<ContentBlock> convertToolResult(const QJsonObject& part)
{
    QJsonValue content = part.value(QStringLiteral("content"));
    if (content.isUndefined())
        content = QString();
    return ContentBlock::fromToolResult(part.value(QStringLiteral("tool_use_id")).toString(),
                                        content,
                                        part.value(QStringLiteral("is_error")).toBool(false));
}

std::optional<ContentBlock> convertFunctionCall(const QJsonObject& part)
{
    const QJsonObject function = part.value(QStringLiteral("function")).toObject();
    const QString id = part.value(QStringLiteral("id")).toString();
    const QString name = function.value(QStringLiteral("name")).toString();
    if (id.isEmpty() && name.isEmpty())
        return std::nullopt;

    const QJsonValue arguments = function.value(QStringLiteral("arguments"));
    QJsonValue input;
    if (arguments.isString())
        input = json_util::parseOrRaw(arguments.toString());
    else if (arguments.isObject())
        input = arguments;
    else
        input = QJsonObject();
    return ContentBlock::fromToolUse(id, name, input);
}

struct Recognizer {
    const char* name;
    bool (*matches)(const QJsonObject& part);
    std::optional<ContentBlock> (*convert)(const QJsonObject& part);
};

// Tried in order; the first matching recognizer owns the part.
const Recognizer kRecognizers[] = {
    {"text",        isText,         convertText},
    {"image_url",   isImageUrl,     convertImageUrl},
    {"image",       isImage,        convertImage},
    {"tool_use",    isToolUse,      convertToolUse},
    {"tool_result", isToolResult,   convertToolResult},
    {"function",    isFunctionCall, convertFunctionCall},
};

const Recognizer* recognizerFor(const QJsonObject& part)
{
    for (const auto& recognizer : kRecognizers) {
        if (recognizer.matches(part))
            return &recognizer;
    }
    return nullptr;
}

} // namespace

namespace Normalizer {

MessageRole roleFromString(const QString& role)
{
    if (role == QLatin1String("user"))
        return MessageRole::User;
    if (role == QLatin1String("system") || role == QLatin1String("developer"))
        return MessageRole::System;
    if (role == QLatin1String("tool"))
        return MessageRole::Tool;
    return MessageRole::Assistant;
}

QList<ContentBlock> contentBlocks(const QJsonValue& content)
{
    QList<ContentBlock> blocks;

    if (content.isString()) {
        const QString text = content.toString();
        if (!text.isEmpty())
            blocks.append(ContentBlock::fromText(text));
        return blocks;
    }

    if (!content.isArray())
        return blocks;

    for (const auto& item : content.toArray()) {
        const QJsonObject part = item.toObject();
        const Recognizer* recognizer = recognizerFor(part);
        if (!recognizer) {
            LOG_DEBUG(QStringLiteral("Normalizer: skipping unrecognised part type '%1'")
                          .arg(partType(part)));
            continue;
        }
        if (auto block = recognizer->convert(part))
            blocks.append(*block);
        else
            LOG_DEBUG(QStringLiteral("Normalizer: dropped %1 part")
                          .arg(QLatin1String(recognizer->name)));
    }
    return blocks;
}

std::optional<ContentBlock> toolCall(const QJsonObject& record)
{
    if (isToolUse(record))
        return convertToolUse(record);
    if (isFunctionCall(record))
        return convertFunctionCall(record);
    return std::nullopt;
}

Message normalize(const QJsonObject& message)
{
    Message result;
    result.role = roleFromString(message.value(QStringLiteral("role")).toString());

    if (result.role == MessageRole::Tool) {
        QJsonValue content = message.value(QStringLiteral("content"));
        if (content.isUndefined() || content.isNull())
            content = QString();
        result.blocks.append(ContentBlock::fromToolResult(
            message.value(QStringLiteral("tool_call_id")).toString(), content));
        return result;
    }

    result.blocks = contentBlocks(message.value(QStringLiteral("content")));

    const QJsonArray toolCalls = message.value(QStringLiteral("tool_calls")).toArray();
    for (const auto& item : toolCalls) {
        auto block = toolCall(item.toObject());
        if (!block) {
            LOG_DEBUG(QStringLiteral("Normalizer: dropping tool call without id or name"));
            continue;
        }
        result.blocks.append(*block);
    }
    return result;
}

} // namespace Normalizer
