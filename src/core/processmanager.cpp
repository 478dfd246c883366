#include "processmanager.h"

#include <QFileInfo>

ProcessManager::ProcessManager(QObject* parent) : QObject{parent}
{
}

ProcessResult ProcessManager::run(const QString& program, const QStringList& arguments, int timeoutMs)
{
    ProcessResult result;
    emit logMessage(QString("Starting: %1 %2").arg(program, arguments.join(" ")), LogCategory::MKVTOOLNIX);

    QProcess process;
    process.start(program, arguments);
    if (!process.waitForStarted())
    {
        emit logMessage(QString("Could not start process '%1': %2").arg(program, process.errorString()),
                        LogCategory::MKVTOOLNIX);
        return result;
    }
    result.started = true;

    if (!process.waitForFinished(timeoutMs))
    {
        result.timedOut = true;
        emit logMessage(QString("Process '%1' did not finish within %2 ms, killing it.")
                            .arg(QFileInfo(program).fileName())
                            .arg(timeoutMs),
                        LogCategory::MKVTOOLNIX);
        process.kill();
        process.waitForFinished(500);
        return result;
    }

    result.exitCode = process.exitCode();
    result.exitStatus = process.exitStatus();
    result.stdOut = process.readAllStandardOutput();
    result.stdErr = process.readAllStandardError();

    if (result.exitStatus != QProcess::NormalExit || result.exitCode != 0)
    {
        emit logMessage(QString("Process '%1' finished with code %2, status %3.")
                            .arg(QFileInfo(program).fileName())
                            .arg(result.exitCode)
                            .arg(result.exitStatus == QProcess::NormalExit ? "Normal" : "Crash"),
                        LogCategory::MKVTOOLNIX);
        if (!result.stdErr.isEmpty())
        {
            emit logMessage("STDERR: " + QString::fromUtf8(result.stdErr), LogCategory::MKVTOOLNIX);
        }
    }
    return result;
}

bool ProcessManager::executeAndWait(const QString& program, const QStringList& arguments, QByteArray& output,
                                    int timeoutMs)
{
    const ProcessResult result = run(program, arguments, timeoutMs);
    if (!result.finishedNormally() || result.exitCode != 0)
    {
        return false;
    }

    output = result.stdOut;
    emit logMessage("Process finished successfully, received " + QString::number(output.size()) + " bytes.",
                    LogCategory::DEBUG);
    return true;
}
