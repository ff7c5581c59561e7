#include "json_util.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QStringList>

namespace json_util {

std::optional<QJsonValue> parse(const QString& text)
{
    if (text.trimmed().isEmpty())
        return std::nullopt;

    // QJsonDocument only accepts objects and arrays at the top level.
    QJsonParseError error;
    const QByteArray wrapped = "[" + text.toUtf8() + "]";
    QJsonDocument doc = QJsonDocument::fromJson(wrapped, &error);
    if (error.error != QJsonParseError::NoError || !doc.isArray())
        return std::nullopt;

    const QJsonArray array = doc.array();
    if (array.size() != 1)
        return std::nullopt;
    return array.first();
}

QJsonValue parseOrRaw(const QString& text)
{
    if (auto parsed = parse(text))
        return *parsed;
    return QJsonValue(text);
}

QString stringify(const QJsonValue& value)
{
    if (value.isObject())
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    if (value.isArray())
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    if (value.isUndefined())
        return QString();

    const QByteArray wrapped = QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact);
    return QString::fromUtf8(wrapped.mid(1, wrapped.size() - 2));
}

QString extractText(const QJsonValue& content)
{
    if (content.isString())
        return content.toString();
    if (!content.isArray())
        return QString();

    QStringList parts;
    for (const auto& item : content.toArray()) {
        const QJsonObject part = item.toObject();
        if (part.value(QStringLiteral("type")).toString() == QLatin1String("text"))
            parts.append(part.value(QStringLiteral("text")).toString());
    }
    return parts.join('\n');
}

std::optional<DataUri> parseDataUri(const QString& uri)
{
    static const QRegularExpression pattern(
        QStringLiteral("^data:([^;]+);base64,(.+)$"),
        QRegularExpression::DotMatchesEverythingOption);

    const QRegularExpressionMatch match = pattern.match(uri);
    if (!match.hasMatch())
        return std::nullopt;
    return DataUri{match.captured(1), match.captured(2)};
}

QJsonValue firstOf(const QJsonObject& obj, const char* key, const char* alternate)
{
    const QString primary = QString::fromUtf8(key);
    if (obj.contains(primary))
        return obj.value(primary);
    return obj.value(QString::fromUtf8(alternate));
}

} // namespace json_util
