#pragma once
#include <QJsonObject>

namespace SchemaCleaner {

// Rewrites a JSON Schema into the subset accepted by the Cloud Code
// function-declaration validator. The input is not modified.
QJsonObject clean(const QJsonObject& schema);

} // namespace SchemaCleaner
