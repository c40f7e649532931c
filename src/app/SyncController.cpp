#include "SyncController.hpp"
#include "../core/common/Logger.hpp"
#include "../core/common/SizeFormat.hpp"

namespace ReelSync {

namespace {
const QString kSeparator(61, QLatin1Char('-'));
}

SyncController::SyncController(SyncOrchestrator& orchestrator,
                               QTextStream& out,
                               QTextStream& in,
                               const CancellationToken& token)
    : orchestrator_(orchestrator)
    , out_(out)
    , in_(in)
    , token_(token) {
}

Expected<SyncController::PreviewSummary, SyncFailure> SyncController::preview(const QList<MediaItem>& items,
                                                                              const QString& destination) {
    PreviewSummary summary;
    out_ << "Items to download:\n";

    for (const MediaItem& item : items) {
        auto report = orchestrator_.syncItem(item, destination, true, QString(), token_);
        if (report.hasError()) {
            return makeUnexpected(report.error());
        }

        if (report.value().bytes > 0) {
            ++summary.itemsPending;
            summary.bytesPending += report.value().bytes;
            out_ << item.title << " (" << formatSize(report.value().bytes) << ")\n";
        }
        for (const PartIssue& issue : report.value().failures) {
            ++summary.issues;
            out_ << "  ! " << item.title << ": " << issue.message << '\n';
        }
    }

    out_ << "Total: " << summary.itemsPending << " items, " << formatSize(summary.bytesPending) << '\n';
    out_ << kSeparator << '\n';
    out_.flush();
    return summary;
}

bool SyncController::confirm() {
    out_ << "Press Y to continue downloading: ";
    out_.flush();
    const QString answer = in_.readLine().trimmed();
    return answer.compare(QLatin1String("y"), Qt::CaseInsensitive) == 0;
}

Expected<SyncController::RunSummary, SyncFailure> SyncController::download(const QList<MediaItem>& items,
                                                                           const QString& destination) {
    RunSummary summary;
    const int count = items.size();

    for (int i = 0; i < count; ++i) {
        const MediaItem& item = items.at(i);
        const QString position = QString("[%1/%2]").arg(i + 1).arg(count);

        auto report = orchestrator_.syncItem(item, destination, false, position, token_);
        if (report.hasError()) {
            return makeUnexpected(report.error());
        }

        summary.bytesTransferred += report.value().bytes;
        if (report.value().hasFailures()) {
            ++summary.itemsFailed;
            summary.failures.append(report.value().failures);
        } else {
            ++summary.itemsSynced;
        }
        for (const PartIssue& warning : report.value().warnings) {
            REELSYNC_WARN("{} {}", position.toStdString(), warning.message.toStdString());
        }
    }

    return summary;
}

int SyncController::exitCodeFor(const SyncFailure& failure) {
    out_ << '\n';
    switch (failure.error) {
        case SyncError::Cancelled:
            out_ << "Stopped by user (Ctrl+C)\n";
            out_.flush();
            return ExitInterrupted;
        case SyncError::DestinationUnavailable:
            out_ << "Destination unavailable: " << failure.message << '\n';
            out_.flush();
            return ExitDestinationUnavailable;
        default:
            out_ << "Error: " << failure.toString() << '\n';
            out_.flush();
            return ExitFailure;
    }
}

int SyncController::run(const QList<MediaItem>& items, const Options& options) {
    REELSYNC_INFO("Syncing {} items to {}", items.size(), options.destination.toStdString());

    auto previewed = preview(items, options.destination);
    if (previewed.hasError()) {
        return exitCodeFor(previewed.error());
    }
    if (options.dryRun) {
        return ExitSuccess;
    }

    if (!options.assumeYes && !confirm()) {
        if (token_.isCancelled()) {
            return exitCodeFor(SyncFailure{SyncError::Cancelled, "Interrupted at the prompt"});
        }
        out_ << "Aborted.\n";
        out_.flush();
        return ExitFailure;
    }

    auto result = download(items, options.destination);
    if (result.hasError()) {
        return exitCodeFor(result.error());
    }

    const RunSummary& summary = result.value();
    out_ << "Finished: " << summary.itemsSynced << " items synced, "
         << summary.itemsFailed << " with errors, "
         << formatSize(summary.bytesTransferred) << " transferred\n";
    for (const PartIssue& issue : summary.failures) {
        out_ << "  " << syncErrorName(issue.error) << ": " << issue.part << " - " << issue.message << '\n';
    }
    out_.flush();

    REELSYNC_INFO("Sync finished: {} ok, {} failed", summary.itemsSynced, summary.itemsFailed);
    return summary.itemsFailed > 0 ? ExitPartFailures : ExitSuccess;
}

} // namespace ReelSync
