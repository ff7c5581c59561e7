#pragma once
#include "request.h"
#include <QJsonObject>
#include <QJsonValue>
#include <optional>

namespace Normalizer {

MessageRole roleFromString(const QString& role);

// Turns one source-format message (OpenAI or Claude shaped) into the canonical form.
Message normalize(const QJsonObject& message);

QList<ContentBlock> contentBlocks(const QJsonValue& content);

// Native {type:"tool_use"} or OpenAI {type:"function", function:{...}} records.
// Returns nullopt for unrecognised records and for calls with neither id nor name.
std::optional<ContentBlock> toolCall(const QJsonObject& record);

} // namespace Normalizer
