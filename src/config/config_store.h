#pragma once
#include "config_types.h"
#include <QJsonObject>
#include <QObject>

class ConfigStore : public QObject {
    Q_OBJECT

public:
    explicit ConfigStore(QObject* parent = nullptr);

    // Returns false when the file is missing or not a JSON object; the
    // current configuration is left untouched in that case.
    bool load(const QString& path);
    bool save();
    bool saveAs(const QString& path);

    QString filePath() const { return m_filePath; }

    const BridgeConfig& config() const { return m_config; }
    TranslatorOptions translatorOptions() const { return m_config.translator; }
    LoggingOptions loggingOptions() const { return m_config.logging; }

    void setTranslatorOptions(const TranslatorOptions& options);
    void setLoggingOptions(const LoggingOptions& options);

    // Pushes the logging section into LogManager.
    void applyLogging() const;

signals:
    void configChanged();

private:
    BridgeConfig m_config;
    QString m_filePath;

    static TranslatorOptions translatorFromJson(const QJsonObject& obj);
    static LoggingOptions loggingFromJson(const QJsonObject& obj);
    static QJsonObject translatorToJson(const TranslatorOptions& options);
    static QJsonObject loggingToJson(const LoggingOptions& options);
};
