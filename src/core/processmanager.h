#ifndef PROCESSMANAGER_H
#define PROCESSMANAGER_H

#include "appsettings.h"

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QStringList>


struct ProcessResult
{
    bool started = false;
    bool timedOut = false;
    int exitCode = -1;
    QProcess::ExitStatus exitStatus = QProcess::NormalExit;
    QByteArray stdOut;
    QByteArray stdErr;

    bool finishedNormally() const { return started && !timedOut && exitStatus == QProcess::NormalExit; }
};

/**
 * @brief Synchronous subprocess runner.
 *
 * Every call owns its own QProcess, so run() may be used from several worker
 * threads at once.
 */
class ProcessManager : public QObject
{
    Q_OBJECT
public:
    explicit ProcessManager(QObject *parent = nullptr);

    ProcessResult run(const QString &program, const QStringList &arguments, int timeoutMs = -1);
    bool executeAndWait(const QString &program, const QStringList &arguments, QByteArray &output,
                        int timeoutMs = 30000);

signals:
    void logMessage(const QString &message, LogCategory category = LogCategory::MKVTOOLNIX);
};

#endif // PROCESSMANAGER_H
