#include "pipelineorchestrator.h"
#include "episodematcher.h"
#include "fileplacer.h"
#include "replacementrules.h"
#include "subtitleprocessor.h"
#include "transferengine.h"

#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QFuture>
#include <QMutexLocker>
#include <QThreadPool>
#include <QtConcurrent/QtConcurrent>
#include <algorithm>

PipelineOrchestrator::PipelineOrchestrator(const AppSettings& settings, const Catalog& catalog,
                                           const ReleaseGroupFilter& groups, RemoteSession& session,
                                           MuxTool& muxTool, QObject* parent)
    : QObject(parent),
    m_settings(settings),
    m_catalog(catalog),
    m_groups(groups),
    m_session(session),
    m_muxTool(muxTool)
{
}

void PipelineOrchestrator::requestStop()
{
    m_stopRequested.store(true);
}

QString PipelineOrchestrator::tempPathFor(const QString& tempDir, const RemoteEntry& entry)
{
    return QDir(tempDir).filePath(entry.fileName() + ".part");
}

bool PipelineOrchestrator::listEntries(QList<RemoteEntry>* entries)
{
    // In move-local mode the session is rooted at the temp directory itself
    const QString directory = m_settings.moveLocal() ? QString("/") : m_settings.remoteRoot();
    QString error;
    if (!m_session.list(directory, entries, &error))
    {
        emit logMessage("Remote listing failed: " + error, LogCategory::NETWORK);
        return false;
    }
    std::sort(entries->begin(), entries->end(),
              [](const RemoteEntry& a, const RemoteEntry& b) { return a.remotePath < b.remotePath; });
    emit logMessage(QString("Found %1 file(s) in %2").arg(entries->size()).arg(directory), LogCategory::APP);
    return true;
}

void PipelineOrchestrator::preloadRulesets(RunContext& ctx, const QList<RemoteEntry>& entries)
{
    for (const RemoteEntry& entry : entries)
    {
        const CatalogRule* rule = m_catalog.match(entry.fileName());
        if (!rule || rule->replacementSource.isEmpty() || ctx.rulesets.contains(rule->replacementSource))
            continue;

        RunContext::Ruleset ruleset;
        ruleset.present = true;
        ruleset.valid = ReplacementRules::loadFromSource(rule->replacementSource, &ruleset.rules, &ruleset.error);
        if (ruleset.valid)
        {
            emit logMessage(QString("Loaded %1 replacement rule(s) from %2")
                                .arg(ruleset.rules.size())
                                .arg(rule->replacementSource),
                            LogCategory::APP);
        }
        else
        {
            emit logMessage("Replacement rules unusable: " + ruleset.error, LogCategory::NETWORK);
        }
        ctx.rulesets.insert(rule->replacementSource, ruleset);
    }
}

bool PipelineOrchestrator::advance(ItemReport& report, ItemState to)
{
    if (!isValidTransition(report.state, to))
    {
        qCritical() << "Illegal state change for" << report.entry.remotePath << ":" << itemStateName(report.state)
                    << "->" << itemStateName(to);
        return false;
    }
    emit logMessage(QString("%1: %2 -> %3")
                        .arg(report.entry.fileName(), itemStateName(report.state), itemStateName(to)),
                    LogCategory::DEBUG);
    report.state = to;
    return true;
}

void PipelineOrchestrator::finishItem(RunContext& ctx, int index, const ItemReport& report)
{
    {
        QMutexLocker locker(&ctx.mutex);
        ctx.reports[index] = report;
    }
    const int finished = ++ctx.finished;
    emit progressUpdated(finished, ctx.total);
}

bool PipelineOrchestrator::keepUnmatchedDownload(const RemoteEntry& entry, const QString& tempPath,
                                                 QString* keptPath)
{
    // A later move-local run can still place the file once the catalog knows it
    *keptPath = QDir(m_settings.localTemp()).filePath(EpisodeMatcher::sanitizeForPath(entry.fileName()));
    QString error;
    if (!FilePlacer::replaceFile(tempPath, *keptPath, &error))
    {
        emit logMessage("Warning: " + error, LogCategory::APP);
        return false;
    }
    TransferEngine::discardTemp(tempPath);
    return true;
}

RunContext::Ruleset PipelineOrchestrator::rulesetFor(const RunContext& ctx, const PlacementDecision& decision) const
{
    if (!decision.rule.replacementSource.isEmpty())
        return ctx.rulesets.value(decision.rule.replacementSource);

    // The season folder wins over the series folder
    const QString seriesDir = QDir(m_settings.localRoot()).filePath(EpisodeMatcher::sanitizeForPath(decision.rule.displayName));
    const QStringList candidates = {QDir(QFileInfo(decision.finalPath).absolutePath()).filePath("replace.txt"),
                                    QDir(seriesDir).filePath("replace.txt")};
    RunContext::Ruleset ruleset;
    for (const QString& path : candidates)
    {
        if (!QFileInfo::exists(path))
            continue;
        ruleset.present = true;
        ruleset.valid = ReplacementRules::loadFromFile(path, &ruleset.rules, &ruleset.error);
        break;
    }
    return ruleset;
}

void PipelineOrchestrator::runSubtitleStep(RunContext& ctx, ItemReport& report, const PlacementDecision& decision)
{
    const RunContext::Ruleset ruleset = rulesetFor(ctx, decision);
    if (!ruleset.present)
    {
        report.subtitleOutcome = SubtitleOutcome::NotApplicable;
        report.subtitleReason = "no replacement rules";
        return;
    }
    if (!ruleset.valid)
    {
        report.subtitleOutcome = SubtitleOutcome::Failed;
        report.subtitleReason = ruleset.error;
        emit logMessage(QString("%1: subtitles left unchanged, %2").arg(report.entry.fileName(), ruleset.error),
                        LogCategory::MKVTOOLNIX);
        return;
    }

    ReplacementRuleList rules;
    if (m_settings.standardReplacements())
        rules = ReplacementRules::standardRules();
    rules.append(ruleset.rules);

    SubtitleProcessor::Options options;
    options.trackId = m_settings.subtitleTrackId();
    options.language = m_settings.subtitleLanguage();
    options.trackName = m_settings.subtitleTrackName();
    SubtitleProcessor processor(m_muxTool, options);
    connect(&processor, &SubtitleProcessor::logMessage, this, &PipelineOrchestrator::logMessage,
            Qt::DirectConnection);

    const SubtitleResult result = processor.process(decision.finalPath, rules);
    report.subtitleOutcome = result.outcome;
    report.subtitleReason = result.reason;
    if (result.outcome == SubtitleOutcome::Failed)
        report.error = PipelineError::SubtitleToolError;
}

void PipelineOrchestrator::processItem(RunContext& ctx, int index)
{
    ItemReport report;
    {
        QMutexLocker locker(&ctx.mutex);
        report = ctx.reports[index];
    }
    const RemoteEntry entry = report.entry;
    const QString fileName = entry.fileName();
    const bool moveLocal = m_settings.moveLocal();

    if (m_stopRequested.load())
    {
        advance(report, ItemState::Failed);
        report.error = PipelineError::Cancelled;
        report.reason = "stopped";
        finishItem(ctx, index, report);
        return;
    }
    if (!m_groups.accepts(fileName))
    {
        advance(report, ItemState::Skipped);
        report.error = PipelineError::Filtered;
        report.reason = "release group not tracked";
        finishItem(ctx, index, report);
        return;
    }
    if (entry.sizeBytes == 0)
    {
        // Neither downloaded nor recorded: the file may still be growing on the store
        advance(report, ItemState::Skipped);
        report.error = PipelineError::Filtered;
        report.reason = moveLocal ? "empty local file" : "empty remote file";
        emit logMessage(QString("Skipped %1: %2").arg(fileName, report.reason), LogCategory::APP);
        finishItem(ctx, index, report);
        return;
    }
    if (!moveLocal && ctx.ledger.contains(entry))
    {
        advance(report, ItemState::Skipped);
        report.error = PipelineError::AlreadyProcessed;
        report.reason = "already processed";
        finishItem(ctx, index, report);
        return;
    }

    // Transfer
    advance(report, ItemState::Transferring);
    QString sourcePath;
    const QString tempPath = tempPathFor(m_settings.localTemp(), entry);
    if (moveLocal)
    {
        sourcePath = QDir(m_settings.localTemp()).filePath(entry.remotePath.mid(entry.remotePath.startsWith('/') ? 1 : 0));
    }
    else
    {
        TransferEngine engine(TransferOptions::fromSettings(m_settings));
        connect(&engine, &TransferEngine::logMessage, this, &PipelineOrchestrator::logMessage, Qt::DirectConnection);
        const TransferResult transfer = engine.transfer(m_session, entry, tempPath, m_stopRequested);
        if (transfer.status != TransferStatus::Verified)
        {
            advance(report, ItemState::Failed);
            report.error = transfer.status == TransferStatus::Cancelled ? PipelineError::Cancelled
                                                                        : PipelineError::TransferError;
            report.reason = transfer.error;
            finishItem(ctx, index, report);
            return;
        }
        sourcePath = tempPath;
    }
    advance(report, ItemState::Verified);

    // Match
    advance(report, ItemState::Matching);
    EpisodeMatcher::Options matchOptions;
    matchOptions.localRoot = m_settings.localRoot();
    matchOptions.rename = m_settings.rename();
    matchOptions.moveLocal = moveLocal;
    const EpisodeMatcher matcher(m_catalog, matchOptions);
    const MatchResult match = matcher.match(sourcePath, fileName);

    if (match.error == PipelineError::NoCatalogMatch)
    {
        advance(report, ItemState::Skipped);
        report.error = PipelineError::NoCatalogMatch;
        report.reason = "no catalog match";
        if (!moveLocal)
        {
            QString keptPath;
            if (keepUnmatchedDownload(entry, tempPath, &keptPath))
            {
                report.reason += ", kept as " + keptPath;
                QString error;
                if (!ctx.ledger.record(entry, keptPath, &error))
                    emit logMessage("Warning: " + error, LogCategory::APP);
            }
            else
            {
                // Left out of the ledger so the next run downloads it again
                TransferEngine::discardTemp(tempPath);
            }
        }
        emit logMessage(QString("Skipped %1: %2").arg(fileName, report.reason), LogCategory::APP);
        finishItem(ctx, index, report);
        return;
    }
    if (match.error == PipelineError::NamingAmbiguous)
    {
        report.error = PipelineError::NamingAmbiguous;
        report.unrenamed = true;
        emit logMessage(QString("Warning: no episode number in %1, keeping its name").arg(fileName), LogCategory::APP);
    }

    const PlacementDecision& decision = match.decision;
    QString error;
    if (!FilePlacer::place(decision, &error))
    {
        // A verified download stays resumable, the next run only re-places it
        advance(report, ItemState::Failed);
        report.error = PipelineError::PlacementError;
        report.reason = error;
        emit logMessage(QString("Placement of %1 failed: %2").arg(fileName, error), LogCategory::APP);
        finishItem(ctx, index, report);
        return;
    }
    if (!error.isEmpty())
        emit logMessage("Warning: " + error, LogCategory::APP);
    advance(report, ItemState::Placed);
    report.finalPath = decision.finalPath;
    emit logMessage(QString("Placed %1 as %2").arg(fileName, decision.finalPath), LogCategory::APP);

    if (!moveLocal)
        TransferEngine::discardTemp(tempPath);

    if (m_settings.saveInfo())
    {
        const QFileInfo finalInfo(decision.finalPath);
        if (!FilePlacer::appendInfoLine(finalInfo.absolutePath(), fileName, finalInfo.fileName(), &error))
            emit logMessage("Warning: " + error, LogCategory::APP);
    }

    if (m_settings.deleteRemote() && !moveLocal)
    {
        if (m_session.remove(entry.remotePath, &error))
            emit logMessage("Deleted remote " + entry.remotePath, LogCategory::NETWORK);
        else
            emit logMessage("Warning: could not delete remote file: " + error, LogCategory::NETWORK);
    }

    // Subtitles
    advance(report, ItemState::SubtitleProcessing);
    runSubtitleStep(ctx, report, decision);
    advance(report, ItemState::Done);

    if (!moveLocal && !ctx.ledger.record(entry, decision.finalPath, &error))
        emit logMessage("Warning: " + error, LogCategory::APP);

    finishItem(ctx, index, report);
}

RunSummary PipelineOrchestrator::run()
{
    RunSummary summary;
    if (!QDir().mkpath(m_settings.localTemp()))
    {
        emit logMessage("Cannot create temp directory " + m_settings.localTemp(), LogCategory::APP);
        return summary;
    }

    QList<RemoteEntry> entries;
    if (!listEntries(&entries))
        return summary;
    summary.listed = true;

    RunContext ctx(m_settings.localTemp());
    ctx.total = entries.size();
    for (const RemoteEntry& entry : entries)
    {
        ItemReport report;
        report.entry = entry;
        ctx.reports.append(report);
    }
    preloadRulesets(ctx, entries);

    QThreadPool itemPool;
    itemPool.setMaxThreadCount(std::max(1, m_settings.itemConcurrency()));
    QList<QFuture<void>> futures;
    for (int i = 0; i < entries.size(); ++i)
    {
        futures.append(QtConcurrent::run(&itemPool, [this, &ctx, i]() { processItem(ctx, i); }));
    }
    for (QFuture<void>& future : futures)
    {
        future.waitForFinished();
    }

    summary.items = ctx.reports;
    for (const ItemReport& report : summary.items)
    {
        if (report.state == ItemState::Done)
            ++summary.done;
        else if (report.state == ItemState::Skipped)
            ++summary.skipped;
        else
            ++summary.failed;
    }
    logSummary(summary);
    return summary;
}

RunSummary PipelineOrchestrator::dryRun()
{
    RunSummary summary;
    QList<RemoteEntry> entries;
    if (!listEntries(&entries))
        return summary;
    summary.listed = true;

    const ProcessedLedger ledger(m_settings.localTemp());
    EpisodeMatcher::Options matchOptions;
    matchOptions.localRoot = m_settings.localRoot();
    matchOptions.rename = m_settings.rename();
    matchOptions.moveLocal = m_settings.moveLocal();
    const EpisodeMatcher matcher(m_catalog, matchOptions);

    for (const RemoteEntry& entry : entries)
    {
        ItemReport report;
        report.entry = entry;
        if (!m_groups.accepts(entry.fileName()))
        {
            report.error = PipelineError::Filtered;
            report.reason = "release group not tracked";
        }
        else if (entry.sizeBytes == 0)
        {
            report.error = PipelineError::Filtered;
            report.reason = "empty file";
        }
        else if (!m_settings.moveLocal() && ledger.contains(entry))
        {
            report.error = PipelineError::AlreadyProcessed;
            report.reason = "already processed";
        }
        else
        {
            const MatchResult match = matcher.match(tempPathFor(m_settings.localTemp(), entry), entry.fileName());
            report.error = match.error;
            if (match.error == PipelineError::NoCatalogMatch)
            {
                report.reason = "no catalog match";
            }
            else
            {
                report.finalPath = match.decision.finalPath;
                report.unrenamed = match.error == PipelineError::NamingAmbiguous;
                report.reason = report.unrenamed ? "would be placed unrenamed" : "would be placed";
            }
        }
        emit logMessage(QString("[dry-run] %1 -> %2 (%3)")
                            .arg(entry.fileName(), report.finalPath.isEmpty() ? QString("-") : report.finalPath,
                                 report.reason),
                        LogCategory::APP);
        summary.items.append(report);
    }
    return summary;
}

void PipelineOrchestrator::logSummary(const RunSummary& summary)
{
    emit logMessage(QString("Run finished: %1 done, %2 skipped, %3 failed")
                        .arg(summary.done)
                        .arg(summary.skipped)
                        .arg(summary.failed),
                    LogCategory::APP);
    for (const ItemReport& report : summary.items)
    {
        QString line = QString("  %1 [%2]").arg(report.entry.fileName(), itemStateName(report.state));
        if (!report.finalPath.isEmpty())
            line += " -> " + report.finalPath;
        if (!report.reason.isEmpty())
            line += ": " + report.reason;
        if (report.unrenamed)
            line += " (unrenamed)";
        if (report.subtitleOutcome != SubtitleOutcome::NotApplicable)
        {
            line += QString(", subtitles %1").arg(subtitleOutcomeName(report.subtitleOutcome));
            if (!report.subtitleReason.isEmpty())
                line += " (" + report.subtitleReason + ")";
        }
        emit logMessage(line, LogCategory::APP);
    }
}
