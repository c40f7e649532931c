#include "SyncOrchestrator.hpp"
#include "PathMapper.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>

namespace ReelSync {

namespace {

constexpr int kLabelTitleLength = 20;

std::string describePlan(const TransferPlan& plan) {
    return std::visit(Overloaded{
        [](const Skip&) { return std::string("skip"); },
        [](const ResumeFrom& resume) { return fmt::format("resume from {}", resume.offset); },
        [](const Redownload& redownload) {
            return std::string(redownload.discardLocal ? "redownload (stale local copy)" : "download");
        }
    }, plan.action);
}

} // namespace

SyncOrchestrator::SyncOrchestrator(RemoteStore& store,
                                   const Config::TransferSettings& settings,
                                   ProgressSinkFactory sinkFactory)
    : classifier_(store, settings)
    , executor_(store, settings.chunkSize)
    , sinkFactory_(std::move(sinkFactory)) {
}

QString SyncOrchestrator::progressLabel(const QString& positionLabel, const QString& title) {
    return QString("%1 %2").arg(positionLabel, title.left(kLabelTitleLength));
}

QString SyncOrchestrator::localPathFor(const QString& destinationRoot,
                                       const QString& sectionTitle,
                                       const QString& relativePath) {
    const QString section = PathMapper::sanitizeSegment(sectionTitle).trimmed();
    const QDir root(destinationRoot);
    if (section.isEmpty() || section == QLatin1String(".") || section == QLatin1String("..")) {
        return root.filePath(relativePath);
    }
    return root.filePath(section + QLatin1Char('/') + relativePath);
}

Expected<bool, SyncFailure> SyncOrchestrator::checkDestination(const QString& destinationRoot, bool dryRun) {
    if (destinationRoot.trimmed().isEmpty()) {
        return makeUnexpected(SyncFailure{SyncError::DestinationUnavailable, "No destination directory given"});
    }

    const QFileInfo info(destinationRoot);
    if (info.exists()) {
        if (!info.isDir()) {
            return makeUnexpected(SyncFailure{SyncError::DestinationUnavailable,
                QString("%1 is not a directory").arg(destinationRoot)});
        }
        if (!info.isWritable()) {
            return makeUnexpected(SyncFailure{SyncError::DestinationUnavailable,
                QString("%1 is not writable").arg(destinationRoot)});
        }
        return true;
    }

    if (dryRun) {
        return true;
    }
    if (!QDir().mkpath(destinationRoot)) {
        return makeUnexpected(SyncFailure{SyncError::DestinationUnavailable,
            QString("Cannot create %1").arg(destinationRoot)});
    }
    REELSYNC_INFO("Created destination {}", destinationRoot.toStdString());
    return true;
}

std::unique_ptr<ProgressSink> SyncOrchestrator::createSink(const QString& label) const {
    if (sinkFactory_) {
        if (auto sink = sinkFactory_(label)) {
            return sink;
        }
    }
    return std::make_unique<NullProgressSink>();
}

Expected<ItemSyncReport, SyncFailure> SyncOrchestrator::syncItem(const MediaItem& item,
                                                                 const QString& destinationRoot,
                                                                 bool dryRun,
                                                                 const QString& positionLabel,
                                                                 const CancellationToken& token) {
    auto destination = checkDestination(destinationRoot, dryRun);
    if (destination.hasError()) {
        return makeUnexpected(destination.error());
    }

    ItemSyncReport report;
    report.title = item.title;

    for (const Media& media : item.media) {
        for (const RemotePart& part : media.parts) {
            if (token.isCancelled()) {
                return makeUnexpected(SyncFailure{SyncError::Cancelled,
                    QString("Interrupted while syncing %1").arg(item.title)});
            }
            ++report.partsTotal;

            auto relativePath = PathMapper::map(item.sectionLocations, part.sourcePath);
            if (relativePath.hasError()) {
                REELSYNC_WARN("{}: {}", item.title.toStdString(), relativePath.error().message.toStdString());
                report.failures.append(PartIssue{part.sourcePath, SyncError::MappingError,
                                                 relativePath.error().message});
                continue;
            }

            const QString localPath = localPathFor(destinationRoot, item.sectionTitle, relativePath.value());

            auto plan = classifier_.classify(localPath, part, token);
            if (plan.hasError()) {
                if (plan.error().error == SyncError::Cancelled) {
                    return makeUnexpected(plan.error());
                }
                REELSYNC_ERROR("{}: {}", item.title.toStdString(), plan.error().toString().toStdString());
                report.failures.append(PartIssue{part.sourcePath, plan.error().error, plan.error().message});
                continue;
            }

            REELSYNC_DEBUG("{} -> {}", localPath.toStdString(), describePlan(plan.value()));

            const auto* redownload = std::get_if<Redownload>(&plan.value().action);
            if (redownload && redownload->probeUnresolved) {
                report.warnings.append(PartIssue{part.sourcePath, SyncError::AmbiguousContentUnresolved,
                    QString("Could not compare %1 with the remote; downloading it again").arg(localPath)});
            }

            if (!plan.value().needsTransfer()) {
                continue;
            }
            ++report.partsNeedingTransfer;

            if (dryRun) {
                report.bytes += plan.value().pendingBytes;
                continue;
            }

            if (redownload && redownload->discardLocal && QFile::exists(localPath) && !QFile::remove(localPath)) {
                REELSYNC_ERROR("Cannot remove stale {}", localPath.toStdString());
                report.failures.append(PartIssue{part.sourcePath, SyncError::FilesystemError,
                    QString("Cannot remove stale copy %1").arg(localPath)});
                continue;
            }

            auto sink = createSink(progressLabel(positionLabel, item.title));
            auto written = executor_.transfer(part, localPath, plan.value(), *sink, token);
            if (written.hasError()) {
                if (written.error().error == SyncError::Cancelled) {
                    return makeUnexpected(written.error());
                }
                REELSYNC_ERROR("{}: {}", item.title.toStdString(), written.error().toString().toStdString());
                report.failures.append(PartIssue{part.sourcePath, written.error().error,
                                                 written.error().message});
                continue;
            }
            report.bytes += written.value();
        }
    }

    return report;
}

} // namespace ReelSync
