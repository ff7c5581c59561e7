#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QTextStream>
#include <QDebug>
#include <QMutexLocker>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

QString currentTimestamp()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
}

} // namespace

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    shutdown();
}

void LogManager::setMinimumLevel(Level level)
{
    QMutexLocker locker(&m_mutex);
    m_minLevel = level;
}

LogManager::Level LogManager::minimumLevel() const
{
    QMutexLocker locker(&m_mutex);
    return m_minLevel;
}

void LogManager::setEchoToStderr(bool echo)
{
    QMutexLocker locker(&m_mutex);
    m_echo = echo;
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    closeFile();
    if (logDir.isEmpty())
        return;

    QDir().mkpath(logDir);
    QString logPath = logDir + "/llmbridge.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::shutdown()
{
    QMutexLocker locker(&m_mutex);
    closeFile();
}

void LogManager::closeFile()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    QString timestamp = currentTimestamp();
    {
        QMutexLocker locker(&m_mutex);
        if (level < m_minLevel)
            return;

        QString formatted = QString("[%1] [%2] [%3] %4")
            .arg(timestamp, kLevelNames[level], category, message);

        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }

        if (m_echo) {
            QTextStream err(stderr);
            err << formatted << "\n";
        }

        QVariantMap entry;
        entry["level"] = static_cast<int>(level);
        entry["timestamp"] = timestamp;
        entry["category"] = category;
        entry["message"] = message;
        m_buffer.append(entry);
        while (m_buffer.size() > m_maxBuffer)
            m_buffer.removeFirst();
    }

    // Emitted outside the lock; connected slots may log.
    emit logEntry(static_cast<int>(level), timestamp, category, message);
}

QVariantList LogManager::recentLogs(int count) const {
    QMutexLocker locker(&m_mutex);
    QVariantList result;
    int start = qMax(0, m_buffer.size() - count);
    for (int i = start; i < m_buffer.size(); ++i)
        result.append(m_buffer[i]);
    return result;
}

void LogManager::clearLogs() {
    QMutexLocker locker(&m_mutex);
    m_buffer.clear();
}

LogManager::Level LogManager::levelFromString(const QString& name, Level fallback)
{
    const QString key = name.trimmed().toLower();
    if (key == QLatin1String("debug"))
        return Debug;
    if (key == QLatin1String("info"))
        return Info;
    if (key == QLatin1String("warn") || key == QLatin1String("warning"))
        return Warning;
    if (key == QLatin1String("error"))
        return Error;
    return fallback;
}
