#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QTextStream>
#include "../core/common/CancellationToken.hpp"
#include "../core/common/Expected.hpp"
#include "../core/sync/SyncOrchestrator.hpp"
#include "../core/sync/SyncTypes.hpp"

namespace ReelSync {

enum ExitCode {
    ExitSuccess = 0,
    ExitFailure = 1,
    ExitPartFailures = 2,
    ExitDestinationUnavailable = 3,
    ExitInterrupted = 130
};

/**
 * @brief Command-line flow: preview, confirm, download, summarize
 *
 * The preview is a dry run over every item; the live pass repeats the
 * classification from scratch, so anything that changed on disk in
 * between is picked up.
 */
class SyncController {
public:
    struct Options {
        QString destination;
        bool assumeYes = false;
        bool dryRun = false;
    };

    struct PreviewSummary {
        int itemsPending = 0;
        qint64 bytesPending = 0;
        int issues = 0;
    };

    struct RunSummary {
        int itemsSynced = 0;
        int itemsFailed = 0;
        qint64 bytesTransferred = 0;
        QList<PartIssue> failures;
    };

    SyncController(SyncOrchestrator& orchestrator,
                   QTextStream& out,
                   QTextStream& in,
                   const CancellationToken& token);

    int run(const QList<MediaItem>& items, const Options& options);

    Expected<PreviewSummary, SyncFailure> preview(const QList<MediaItem>& items, const QString& destination);
    Expected<RunSummary, SyncFailure> download(const QList<MediaItem>& items, const QString& destination);
    bool confirm();

private:
    int exitCodeFor(const SyncFailure& failure);

    SyncOrchestrator& orchestrator_;
    QTextStream& out_;
    QTextStream& in_;
    const CancellationToken& token_;
};

} // namespace ReelSync
