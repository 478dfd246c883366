#ifndef LOGMANAGER_H
#define LOGMANAGER_H

#include "appsettings.h"

#include <QFile>
#include <QMutex>
#include <QObject>
#include <QSet>
#include <QTextStream>

/**
 * @brief Process-wide log sink.
 *
 * Components never write to the console directly: they emit
 * logMessage(text, category) and main() connects those signals here with
 * Qt::DirectConnection, so addLog() may run on any worker thread.
 */
class LogManager : public QObject
{
    Q_OBJECT

public:
    static LogManager& instance();

    ~LogManager() override;

    bool openFile(const QString& path);
    void setEnabledCategories(const QSet<LogCategory>& categories);
    void setEchoToStderr(bool enabled);

public slots:
    void addLog(const QString& message, LogCategory category = LogCategory::APP);
    void addLevelLog(const QString& message, const QString& level, LogCategory category);

private:
    explicit LogManager(QObject* parent = nullptr);
    Q_DISABLE_COPY(LogManager)

    static bool shouldFlushImmediately(const QString& level);

    QMutex m_mutex;
    QFile m_file;
    QTextStream m_ts;
    QSet<LogCategory> m_enabledCategories;
    bool m_echoToStderr = true;
};

// Routes qDebug/qWarning/qCritical into LogManager
void logMessageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

#endif // LOGMANAGER_H
