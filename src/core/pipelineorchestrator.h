#ifndef PIPELINEORCHESTRATOR_H
#define PIPELINEORCHESTRATOR_H

#include "appsettings.h"
#include "catalog.h"
#include "muxtool.h"
#include "pipelinetypes.h"
#include "processedledger.h"
#include "remotesession.h"

#include <QHash>
#include <QMutex>
#include <QObject>
#include <atomic>

/**
 * @brief Per-run state shared by the item workers.
 *
 * The ruleset cache is filled before the first item starts and only read
 * afterwards; reports are written under the mutex.
 */
struct RunContext
{
    struct Ruleset
    {
        bool present = false;
        bool valid = false;
        ReplacementRuleList rules;
        QString error;
    };

    explicit RunContext(const QString &tempDir) : ledger(tempDir) {}

    ProcessedLedger ledger;
    QList<ItemReport> reports;
    QHash<QString, Ruleset> rulesets;
    QMutex mutex;
    std::atomic_int finished{0};
    int total = 0;
};

/**
 * @brief Drives every remote entry through transfer, placement and subtitles.
 *
 * Items are independent: each runs on the item pool (capped by
 * general/itemConcurrency) and ends in exactly one of Done, Skipped or Failed.
 * One item's failure never stops the others.
 */
class PipelineOrchestrator : public QObject
{
    Q_OBJECT
public:
    PipelineOrchestrator(const AppSettings &settings, const Catalog &catalog, const ReleaseGroupFilter &groups,
                         RemoteSession &session, MuxTool &muxTool, QObject *parent = nullptr);

    RunSummary run();

    // Lists and matches only. Items stay Listed, with their would-be final path.
    RunSummary dryRun();

    void requestStop();
    bool stopRequested() const { return m_stopRequested.load(); }

    static QString tempPathFor(const QString &tempDir, const RemoteEntry &entry);

signals:
    void logMessage(const QString &message, LogCategory category);
    void progressUpdated(int finished, int total);

private:
    bool listEntries(QList<RemoteEntry> *entries);
    void preloadRulesets(RunContext &ctx, const QList<RemoteEntry> &entries);
    void processItem(RunContext &ctx, int index);
    bool advance(ItemReport &report, ItemState to);
    void finishItem(RunContext &ctx, int index, const ItemReport &report);
    bool keepUnmatchedDownload(const RemoteEntry &entry, const QString &tempPath, QString *keptPath);
    void runSubtitleStep(RunContext &ctx, ItemReport &report, const PlacementDecision &decision);
    RunContext::Ruleset rulesetFor(const RunContext &ctx, const PlacementDecision &decision) const;
    void logSummary(const RunSummary &summary);

    const AppSettings &m_settings;
    const Catalog &m_catalog;
    const ReleaseGroupFilter &m_groups;
    RemoteSession &m_session;
    MuxTool &m_muxTool;
    std::atomic_bool m_stopRequested{false};
};

#endif // PIPELINEORCHESTRATOR_H
