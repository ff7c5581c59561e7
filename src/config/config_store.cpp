#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QFileInfo>
#include <QDir>
#include <QJsonDocument>
#include <QJsonObject>

namespace {

constexpr int kMaxTokenCeiling = 1000000;

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

bool ConfigStore::load(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARNING(QStringLiteral("ConfigStore: cannot open %1").arg(path));
        return false;
    }

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARNING(QStringLiteral("ConfigStore: %1 is not a JSON object (%2)")
                        .arg(path, err.errorString()));
        return false;
    }

    m_filePath = path;
    const QJsonObject root = doc.object();
    m_config.translator = translatorFromJson(root.value(QStringLiteral("translator")).toObject());
    m_config.logging = loggingFromJson(root.value(QStringLiteral("logging")).toObject());

    LOG_INFO(QStringLiteral("ConfigStore: loaded %1").arg(path));
    emit configChanged();
    return true;
}

bool ConfigStore::save()
{
    if (m_filePath.isEmpty())
        return false;

    QJsonObject root;
    root[QStringLiteral("version")] = 1;
    root[QStringLiteral("translator")] = translatorToJson(m_config.translator);
    root[QStringLiteral("logging")] = loggingToJson(m_config.logging);

    QDir().mkpath(QFileInfo(m_filePath).absolutePath());
    QFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(QStringLiteral("ConfigStore: cannot write %1").arg(m_filePath));
        return false;
    }
    file.write(QJsonDocument(root).toJson(QJsonDocument::Indented));
    return true;
}

bool ConfigStore::saveAs(const QString& path)
{
    m_filePath = path;
    return save();
}

void ConfigStore::setTranslatorOptions(const TranslatorOptions& options)
{
    m_config.translator = options;
    emit configChanged();
}

void ConfigStore::setLoggingOptions(const LoggingOptions& options)
{
    m_config.logging = options;
    emit configChanged();
}

void ConfigStore::applyLogging() const
{
    auto& log = LogManager::instance();
    log.setMinimumLevel(LogManager::levelFromString(m_config.logging.minimumLevel));
    log.setEchoToStderr(m_config.logging.echoToStderr);
    if (!m_config.logging.logDir.isEmpty())
        log.initialize(m_config.logging.logDir);
}

TranslatorOptions ConfigStore::translatorFromJson(const QJsonObject& obj)
{
    const TranslatorOptions defaults;
    TranslatorOptions o;

    o.systemPreamble = jsonStringEither(obj, "system_preamble", "systemPreamble", defaults.systemPreamble);
    o.defaultMaxTokens = clampInt(
        jsonIntEither(obj, "default_max_tokens", "defaultMaxTokens", defaults.defaultMaxTokens),
        1, kMaxTokenCeiling);
    o.minToolMaxTokens = clampInt(
        jsonIntEither(obj, "min_tool_max_tokens", "minToolMaxTokens", defaults.minToolMaxTokens),
        0, kMaxTokenCeiling);
    o.thinkingBudgetPadding = clampInt(
        jsonIntEither(obj, "thinking_budget_padding", "thinkingBudgetPadding", defaults.thinkingBudgetPadding),
        0, kMaxTokenCeiling);
    o.defaultThinkingBudget = clampInt(
        jsonIntEither(obj, "default_thinking_budget", "defaultThinkingBudget", defaults.defaultThinkingBudget),
        0, kMaxTokenCeiling);
    o.thoughtSignature = jsonStringEither(obj, "thought_signature", "thoughtSignature", defaults.thoughtSignature);
    o.envelopeUserAgent = jsonStringEither(obj, "envelope_user_agent", "envelopeUserAgent", defaults.envelopeUserAgent);
    return o;
}

LoggingOptions ConfigStore::loggingFromJson(const QJsonObject& obj)
{
    const LoggingOptions defaults;
    LoggingOptions o;
    o.logDir = jsonStringEither(obj, "log_dir", "logDir", defaults.logDir);
    o.minimumLevel = jsonStringEither(obj, "minimum_level", "minimumLevel", defaults.minimumLevel).toLower();
    o.echoToStderr = jsonBoolEither(obj, "echo_to_stderr", "echoToStderr", defaults.echoToStderr);
    return o;
}

QJsonObject ConfigStore::translatorToJson(const TranslatorOptions& options)
{
    QJsonObject obj;
    obj[QStringLiteral("system_preamble")] = options.systemPreamble;
    obj[QStringLiteral("default_max_tokens")] = options.defaultMaxTokens;
    obj[QStringLiteral("min_tool_max_tokens")] = options.minToolMaxTokens;
    obj[QStringLiteral("thinking_budget_padding")] = options.thinkingBudgetPadding;
    obj[QStringLiteral("default_thinking_budget")] = options.defaultThinkingBudget;
    obj[QStringLiteral("thought_signature")] = options.thoughtSignature;
    obj[QStringLiteral("envelope_user_agent")] = options.envelopeUserAgent;
    return obj;
}

QJsonObject ConfigStore::loggingToJson(const LoggingOptions& options)
{
    QJsonObject obj;
    obj[QStringLiteral("log_dir")] = options.logDir;
    obj[QStringLiteral("minimum_level")] = options.minimumLevel;
    obj[QStringLiteral("echo_to_stderr")] = options.echoToStderr;
    return obj;
}
