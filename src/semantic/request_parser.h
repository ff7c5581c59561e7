#pragma once
#include "request.h"
#include <QJsonArray>
#include <QJsonObject>

namespace RequestParser {

RequestModel parse(const QString& model, const QJsonObject& body, bool stream);

// Accepts OpenAI {type:"function", function:{...}} and native {name, input_schema}
// definitions. Definitions without a name are dropped.
QList<ToolSpec> parseTools(const QJsonArray& tools);

GenerationParams parseGenerationParams(const QJsonObject& body);

} // namespace RequestParser
