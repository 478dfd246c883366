#include "logmanager.h"

#include <QDateTime>
#include <QMutexLocker>
#include <cstdio>

LogManager& LogManager::instance()
{
    static LogManager inst;
    return inst;
}

LogManager::LogManager(QObject* parent) : QObject(parent)
{
    m_enabledCategories = {LogCategory::APP, LogCategory::TRANSFER, LogCategory::MKVTOOLNIX, LogCategory::NETWORK};
}

LogManager::~LogManager()
{
    QMutexLocker locker(&m_mutex);
    if (m_ts.device())
    {
        m_ts.flush();
    }
}

bool LogManager::openFile(const QString& path)
{
    QMutexLocker locker(&m_mutex);
    if (m_file.isOpen())
    {
        m_ts.flush();
        m_ts.setDevice(nullptr);
        m_file.close();
    }
    m_file.setFileName(path);
    if (!m_file.open(QIODevice::Append | QIODevice::Text))
    {
        return false;
    }
    m_ts.setDevice(&m_file);
    m_ts << "\n--- session start ---\n";
    m_ts.flush();
    return true;
}

void LogManager::setEnabledCategories(const QSet<LogCategory>& categories)
{
    QMutexLocker locker(&m_mutex);
    m_enabledCategories = categories;
}

void LogManager::setEchoToStderr(bool enabled)
{
    QMutexLocker locker(&m_mutex);
    m_echoToStderr = enabled;
}

void LogManager::addLog(const QString& message, LogCategory category)
{
    addLevelLog(message, "INFO", category);
}

void LogManager::addLevelLog(const QString& message, const QString& level, LogCategory category)
{
    QMutexLocker locker(&m_mutex);
    if (!m_enabledCategories.contains(category) && !shouldFlushImmediately(level))
    {
        return;
    }

    const QString timestamp = QDateTime::currentDateTime().toString("hh:mm:ss.zzz");
    const QString logEntry =
        QString("[%1] [%2] [%3] %4").arg(timestamp, level, logCategoryName(category), message.trimmed());

    if (m_echoToStderr)
    {
        std::fprintf(stderr, "%s\n", logEntry.toLocal8Bit().constData());
    }

    if (m_ts.device())
    {
        m_ts << logEntry << '\n';
        if (shouldFlushImmediately(level))
        {
            m_ts.flush();
        }
    }
}

bool LogManager::shouldFlushImmediately(const QString& level)
{
    const QString upper = level.toUpper();
    return upper == "WARN" || upper == "ERROR" || upper == "FATAL";
}

void logMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg)
{
    Q_UNUSED(context);
    QString level;
    LogCategory category = LogCategory::APP;
    switch (type)
    {
    case QtDebugMsg:
        level = "DEBUG";
        category = LogCategory::DEBUG;
        break;
    case QtInfoMsg:
        level = "INFO";
        break;
    case QtWarningMsg:
        level = "WARN";
        break;
    case QtCriticalMsg:
        level = "ERROR";
        break;
    case QtFatalMsg:
        level = "FATAL";
        break;
    }
    LogManager::instance().addLevelLog(msg, level, category);
}
