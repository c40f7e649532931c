#pragma once

#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace ReelSync {

enum class SyncError {
    MappingError,               // part path is not under any section location
    NetworkError,               // fetch failed, timed out or returned a non-success status
    FilesystemError,            // cannot create, open, read or write a local file
    AmbiguousContentUnresolved, // head-sample probe kept failing; part is re-downloaded
    Cancelled,                  // interrupt requested
    DestinationUnavailable      // destination root is not a usable directory
};

const char* syncErrorName(SyncError error);

struct SyncFailure {
    SyncError error = SyncError::NetworkError;
    QString message;

    QString toString() const {
        return QString("%1: %2").arg(QString::fromLatin1(syncErrorName(error)), message);
    }
};

/**
 * One stored byte stream of a media item. declaredSize is the remote's
 * authoritative byte count and does not change during a sync pass.
 */
struct RemotePart {
    QString remoteKey;
    qint64 declaredSize = 0;
    QString sourcePath;
};

// One version of an item (e.g. a different resolution); parts are a split file
struct Media {
    QList<RemotePart> parts;
};

struct MediaItem {
    QString title;
    QString sectionTitle;
    QStringList sectionLocations;
    QList<Media> media;

    qint64 totalDeclaredSize() const {
        qint64 total = 0;
        for (const Media& m : media) {
            for (const RemotePart& part : m.parts) {
                total += part.declaredSize;
            }
        }
        return total;
    }
};

struct PartIssue {
    QString part;   // source path on the remote
    SyncError error = SyncError::NetworkError;
    QString message;
};

struct ItemSyncReport {
    QString title;
    qint64 bytes = 0;            // pending bytes (dry run) or bytes written (live run)
    int partsTotal = 0;
    int partsNeedingTransfer = 0;
    QList<PartIssue> failures;   // parts that were skipped or did not complete
    QList<PartIssue> warnings;   // parts that completed after a conservative decision

    bool hasFailures() const { return !failures.isEmpty(); }
};

} // namespace ReelSync
