#pragma once

#include <QtCore/QString>
#include "IntegrityClassifier.hpp"
#include "ProgressSink.hpp"
#include "SyncTypes.hpp"
#include "TransferExecutor.hpp"
#include "../common/CancellationToken.hpp"
#include "../common/Config.hpp"
#include "../common/Expected.hpp"
#include "../network/RemoteStore.hpp"

namespace ReelSync {

/**
 * @brief Drives classification and transfer for every part of an item
 *
 * Parts are handled in declared order. A part that cannot be mapped,
 * classified or transferred is recorded in the report and the item moves
 * on; only an unusable destination or cancellation ends the call early.
 *
 * The orchestrator keeps no state between calls, so a dry run followed by
 * a live run over the same items sees the disk as it is at each call.
 */
class SyncOrchestrator {
public:
    SyncOrchestrator(RemoteStore& store,
                     const Config::TransferSettings& settings,
                     ProgressSinkFactory sinkFactory = nullptr);

    Expected<ItemSyncReport, SyncFailure> syncItem(const MediaItem& item,
                                                   const QString& destinationRoot,
                                                   bool dryRun,
                                                   const QString& positionLabel,
                                                   const CancellationToken& token);

    // "<positionLabel> <first 20 characters of title>"
    static QString progressLabel(const QString& positionLabel, const QString& title);

    // Local path for a mapped part: root/<section>/<relativePath>
    static QString localPathFor(const QString& destinationRoot,
                                const QString& sectionTitle,
                                const QString& relativePath);

    // Existing root must be a writable directory; a missing one is created
    // unless this is a dry run.
    static Expected<bool, SyncFailure> checkDestination(const QString& destinationRoot, bool dryRun);

private:
    std::unique_ptr<ProgressSink> createSink(const QString& label) const;

    IntegrityClassifier classifier_;
    TransferExecutor executor_;
    ProgressSinkFactory sinkFactory_;
};

} // namespace ReelSync
