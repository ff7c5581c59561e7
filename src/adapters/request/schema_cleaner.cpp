#include "schema_cleaner.h"
#include <QJsonArray>
#include <QStringList>

namespace {

const QStringList& unsupportedKeywords()
{
    static const QStringList keys = {
        QStringLiteral("$schema"), QStringLiteral("$id"), QStringLiteral("$ref"),
        QStringLiteral("$defs"), QStringLiteral("$comment"), QStringLiteral("definitions"),
        QStringLiteral("additionalProperties"), QStringLiteral("patternProperties"),
        QStringLiteral("unevaluatedProperties"), QStringLiteral("propertyNames"),
        QStringLiteral("default"), QStringLiteral("examples"), QStringLiteral("title"),
        QStringLiteral("deprecated"), QStringLiteral("readOnly"), QStringLiteral("writeOnly"),
        QStringLiteral("minLength"), QStringLiteral("maxLength"), QStringLiteral("pattern"),
        QStringLiteral("minItems"), QStringLiteral("maxItems"), QStringLiteral("uniqueItems"),
        QStringLiteral("minimum"), QStringLiteral("maximum"),
        QStringLiteral("exclusiveMinimum"), QStringLiteral("exclusiveMaximum"),
        QStringLiteral("multipleOf"), QStringLiteral("minProperties"), QStringLiteral("maxProperties"),
    };
    return keys;
}

QJsonObject cleanNode(const QJsonObject& node);

QJsonArray cleanEach(const QJsonArray& schemas)
{
    QJsonArray out;
    for (const auto& item : schemas) {
        if (item.isObject())
            out.append(cleanNode(item.toObject()));
    }
    return out;
}

// Folds allOf members into the enclosing schema: properties and required
// are unioned, other keywords fill in only where the parent has none.
QJsonObject mergeAllOf(QJsonObject node)
{
    const QJsonArray members = node.take(QStringLiteral("allOf")).toArray();

    QJsonObject properties = node.value(QStringLiteral("properties")).toObject();
    QJsonArray required = node.value(QStringLiteral("required")).toArray();

    for (const auto& item : members) {
        const QJsonObject member = item.toObject();
        const QJsonObject memberProps = member.value(QStringLiteral("properties")).toObject();
        for (auto it = memberProps.constBegin(); it != memberProps.constEnd(); ++it)
            properties.insert(it.key(), it.value());
        for (const auto& r : member.value(QStringLiteral("required")).toArray()) {
            if (!required.contains(r))
                required.append(r);
        }
        for (auto it = member.constBegin(); it != member.constEnd(); ++it) {
            if (it.key() == QLatin1String("properties") || it.key() == QLatin1String("required"))
                continue;
            if (!node.contains(it.key()))
                node.insert(it.key(), it.value());
        }
    }

    if (!properties.isEmpty())
        node[QStringLiteral("properties")] = properties;
    if (!required.isEmpty())
        node[QStringLiteral("required")] = required;
    return node;
}

QJsonObject cleanNode(const QJsonObject& input)
{
    QJsonObject node = input;

    if (node.contains(QStringLiteral("allOf")))
        node = mergeAllOf(node);

    for (const QString& key : unsupportedKeywords())
        node.remove(key);

    if (node.contains(QStringLiteral("const"))) {
        const QJsonValue value = node.take(QStringLiteral("const"));
        if (!node.contains(QStringLiteral("enum")))
            node[QStringLiteral("enum")] = QJsonArray{value};
    }

    // ["string", "null"] -> "string"
    const QJsonValue type = node.value(QStringLiteral("type"));
    if (type.isArray()) {
        QString picked;
        for (const auto& t : type.toArray()) {
            if (t.toString() != QLatin1String("null")) {
                picked = t.toString();
                break;
            }
        }
        if (picked.isEmpty())
            node.remove(QStringLiteral("type"));
        else
            node[QStringLiteral("type")] = picked;
    }

    if (node.contains(QStringLiteral("format"))
        && node.value(QStringLiteral("type")).toString() != QLatin1String("string")) {
        node.remove(QStringLiteral("format"));
    }

    if (node.contains(QStringLiteral("oneOf"))) {
        const QJsonValue variants = node.take(QStringLiteral("oneOf"));
        if (!node.contains(QStringLiteral("anyOf")))
            node[QStringLiteral("anyOf")] = variants;
    }
    if (node.value(QStringLiteral("anyOf")).isArray())
        node[QStringLiteral("anyOf")] = cleanEach(node.value(QStringLiteral("anyOf")).toArray());

    if (node.value(QStringLiteral("properties")).isObject()) {
        const QJsonObject properties = node.value(QStringLiteral("properties")).toObject();
        QJsonObject cleaned;
        for (auto it = properties.constBegin(); it != properties.constEnd(); ++it) {
            QJsonValue value = it.value();
            if (value.isObject())
                value = cleanNode(value.toObject());
            cleaned.insert(it.key(), value);
        }
        node[QStringLiteral("properties")] = cleaned;

        if (node.contains(QStringLiteral("required"))) {
            QJsonArray kept;
            for (const auto& r : node.value(QStringLiteral("required")).toArray()) {
                if (cleaned.contains(r.toString()))
                    kept.append(r);
            }
            if (kept.isEmpty())
                node.remove(QStringLiteral("required"));
            else
                node[QStringLiteral("required")] = kept;
        }
    }

    const QJsonValue items = node.value(QStringLiteral("items"));
    if (items.isObject())
        node[QStringLiteral("items")] = cleanNode(items.toObject());
    else if (items.isArray())
        node[QStringLiteral("items")] = cleanEach(items.toArray());

    return node;
}

} // namespace

namespace SchemaCleaner {

QJsonObject clean(const QJsonObject& schema)
{
    return cleanNode(schema);
}

} // namespace SchemaCleaner
