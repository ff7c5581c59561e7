#pragma once
#include <QString>
#include <QJsonValue>
#include <QJsonObject>
#include <optional>

namespace json_util {

struct DataUri {
    QString mediaType;
    QString data;
};

// Parses any JSON value, including bare scalars.
std::optional<QJsonValue> parse(const QString& text);

// Parses text as JSON, falling back to the raw string when it is not valid JSON.
QJsonValue parseOrRaw(const QString& text);

QString stringify(const QJsonValue& value);

// String content is returned as-is; arrays contribute their text parts, newline-joined.
QString extractText(const QJsonValue& content);

// Matches data:<mediaType>;base64,<payload>.
std::optional<DataUri> parseDataUri(const QString& uri);

QJsonValue firstOf(const QJsonObject& obj, const char* key, const char* alternate);

} // namespace json_util
