#include "PathMapper.hpp"
#include "../common/Logger.hpp"
#include <QtCore/QDir>

namespace ReelSync {

namespace {
const QString kIllegalCharacters = QStringLiteral("<>:\"|?*/\\");
}

QString PathMapper::normalize(const QString& path) {
    QString unified = path;
    unified.replace(QLatin1Char('\\'), QLatin1Char('/'));
    return QDir::cleanPath(unified);
}

QString PathMapper::sanitizeSegment(const QString& segment) {
    QString cleaned;
    cleaned.reserve(segment.size());
    for (const QChar c : segment) {
        const QChar out = kIllegalCharacters.contains(c) ? QLatin1Char(' ') : c;
        if (out == QLatin1Char(' ') && cleaned.endsWith(QLatin1Char(' '))) {
            continue;
        }
        cleaned.append(out);
    }
    return cleaned;
}

Expected<QString, SyncFailure> PathMapper::map(const QStringList& sectionLocations,
                                               const QString& sourcePath) {
    const QString source = normalize(sourcePath);

    for (const QString& location : sectionLocations) {
        if (location.trimmed().isEmpty()) {
            continue;
        }
        QString prefix = normalize(location);
        if (!prefix.endsWith(QLatin1Char('/'))) {
            prefix += QLatin1Char('/');
        }
        if (!source.startsWith(prefix, Qt::CaseInsensitive)) {
            continue;
        }

        QStringList segments;
        const QStringList raw = source.mid(prefix.size()).split(QLatin1Char('/'), Qt::SkipEmptyParts);
        for (const QString& segment : raw) {
            const QString clean = sanitizeSegment(segment);
            // "." and ".." would leave the destination root
            if (clean.isEmpty() || clean == QLatin1String(".") || clean == QLatin1String("..")) {
                continue;
            }
            segments.append(clean);
        }

        if (segments.isEmpty()) {
            return makeUnexpected(SyncFailure{SyncError::MappingError,
                QString("Path %1 names the section location itself").arg(sourcePath)});
        }
        return segments.join(QLatin1Char('/'));
    }

    REELSYNC_DEBUG("No section location matches {}", sourcePath.toStdString());
    return makeUnexpected(SyncFailure{SyncError::MappingError,
        QString("Path %1 is not under any section location (%2)")
            .arg(sourcePath, sectionLocations.join(", "))});
}

} // namespace ReelSync
