#include "appsettings.h"
#include "catalog.h"
#include "localremotesession.h"
#include "logmanager.h"
#include "mkvtoolnixmuxtool.h"
#include "pipelineorchestrator.h"
#include "webdavsession.h"
#ifdef SERIESFETCH_WITH_SFTP
#include "sftpsession.h"
#endif

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLockFile>
#include <csignal>
#include <memory>

static PipelineOrchestrator* g_orchestrator = nullptr;

static void handleInterrupt(int)
{
    // requestStop() only stores to a lock-free atomic
    if (g_orchestrator)
        g_orchestrator->requestStop();
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("seriesfetch");
    QCoreApplication::setApplicationVersion("1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription("Fetches new episodes from a remote store into a local series library.");
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption configOption(QStringList{"c", "config"}, "INI configuration file.", "file",
                                    QDir(QCoreApplication::applicationDirPath()).filePath("seriesfetch.ini"));
    QCommandLineOption dryRunOption("dry-run", "List and match only, print where files would go.");
    QCommandLineOption verboseOption(QStringList{"v", "verbose"}, "Enable debug logging.");
    parser.addOption(configOption);
    parser.addOption(dryRunOption);
    parser.addOption(verboseOption);
    parser.process(app);

    LogManager& log = LogManager::instance();
    qInstallMessageHandler(logMessageHandler);

    AppSettings settings;
    QString error;
    if (!settings.load(parser.value(configOption), &error))
    {
        log.addLevelLog(error, "ERROR", LogCategory::APP);
        return 1;
    }

    QSet<LogCategory> categories = settings.enabledLogCategories();
    if (parser.isSet(verboseOption))
        categories.insert(LogCategory::DEBUG);
    log.setEnabledCategories(categories);
    if (!settings.logFile().isEmpty() && !log.openFile(settings.logFile()))
        log.addLevelLog("Cannot open log file " + settings.logFile(), "WARN", LogCategory::APP);

    QLockFile lock(QDir::temp().filePath("seriesfetch.lock"));
    if (!lock.tryLock(100))
    {
        log.addLevelLog("Another instance of seriesfetch is already running. Exiting.", "ERROR", LogCategory::APP);
        return 1;
    }

    Catalog catalog;
    if (!catalog.loadFromFile(settings.catalogPath(), &error))
    {
        log.addLevelLog(error, "ERROR", LogCategory::APP);
        return 1;
    }
    ReleaseGroupFilter groups;
    if (!settings.groupsPath().isEmpty() && !groups.loadFromFile(settings.groupsPath(), &error))
    {
        log.addLevelLog(error, "ERROR", LogCategory::APP);
        return 1;
    }

    std::unique_ptr<RemoteSession> session;
    if (settings.moveLocal())
    {
        session = std::make_unique<LocalRemoteSession>(settings.localTemp());
    }
    else
    {
        const QUrl url(settings.remoteUrl());
        if (!url.isValid() || url.scheme().isEmpty())
        {
            log.addLevelLog("remote/url is missing or invalid", "ERROR", LogCategory::APP);
            return 1;
        }
        if (url.scheme().compare("sftp", Qt::CaseInsensitive) == 0)
        {
#ifdef SERIESFETCH_WITH_SFTP
            session = std::make_unique<SftpSession>(url, settings.remoteUser(), settings.remotePassword());
#else
            log.addLevelLog("This build has no SFTP support (libssh was not found)", "ERROR", LogCategory::APP);
            return 1;
#endif
        }
        else
        {
            session = std::make_unique<WebDavSession>(url, settings.remoteUser(), settings.remotePassword());
        }
    }

    MkvToolNixMuxTool muxTool(settings.mkvmergePath(), settings.mkvextractPath());
    QObject::connect(&muxTool, &MkvToolNixMuxTool::logMessage, &log, &LogManager::addLog, Qt::DirectConnection);

    PipelineOrchestrator orchestrator(settings, catalog, groups, *session, muxTool);
    QObject::connect(&orchestrator, &PipelineOrchestrator::logMessage, &log, &LogManager::addLog,
                     Qt::DirectConnection);
    QObject::connect(
        &orchestrator, &PipelineOrchestrator::progressUpdated, &log,
        [&log](int finished, int total) {
            log.addLog(QString("Progress: %1/%2 items finished").arg(finished).arg(total), LogCategory::APP);
        },
        Qt::DirectConnection);

    log.addLog(QString("Library: %1, temp: %2, mode: %3")
                   .arg(settings.localRoot(), settings.localTemp(),
                        settings.moveLocal() ? QString("move-local") : settings.remoteUrl()),
               LogCategory::APP);

    if (parser.isSet(dryRunOption))
    {
        return orchestrator.dryRun().listed ? 0 : 1;
    }

    g_orchestrator = &orchestrator;
    std::signal(SIGINT, handleInterrupt);
    std::signal(SIGTERM, handleInterrupt);

    const RunSummary summary = orchestrator.run();

    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
    g_orchestrator = nullptr;

    if (!summary.listed)
        return 1;
    return summary.failed > 0 ? 2 : 0;
}
