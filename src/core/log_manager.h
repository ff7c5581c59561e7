#pragma once
#include <QObject>
#include <QFile>
#include <QVariantMap>
#include <QList>
#include <QMutex>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    void initialize(const QString& logDir);
    void shutdown();

    void setMinimumLevel(Level level);
    Level minimumLevel() const;
    void setEchoToStderr(bool echo);

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "bridge", msg); }
    void info(const QString& msg)    { log(Info, "bridge", msg); }
    void warning(const QString& msg) { log(Warning, "bridge", msg); }
    void error(const QString& msg)   { log(Error, "bridge", msg); }

    QVariantList recentLogs(int count = 200) const;
    void clearLogs();

    static Level levelFromString(const QString& name, Level fallback = Info);

signals:
    void logEntry(int level, const QString& timestamp,
                  const QString& category, const QString& message);

private:
    ~LogManager() override;
    LogManager() = default;
    void closeFile();

    mutable QMutex m_mutex;
    QFile m_logFile;
    QList<QVariantMap> m_buffer;
    int m_maxBuffer = 2000;
    Level m_minLevel = Info;
    bool m_echo = false;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)
