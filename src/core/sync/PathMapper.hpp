#pragma once

#include <QtCore/QString>
#include <QtCore/QStringList>
#include "SyncTypes.hpp"
#include "../common/Expected.hpp"

namespace ReelSync {

/**
 * @brief Derives a stable relative download path from a part's remote path
 *
 * '/data/movies/Foo (2020)/Foo (2020).mkv' under section location
 * '/data/movies' maps to 'Foo (2020)/Foo (2020).mkv'. The remote may use
 * either separator style and any letter case, so matching is done on
 * normalized, case-insensitive paths and only on whole directory names.
 */
class PathMapper {
public:
    // Relative path with '/' separators, or SyncError::MappingError
    static Expected<QString, SyncFailure> map(const QStringList& sectionLocations,
                                              const QString& sourcePath);

    // Replaces characters that are illegal on Windows file systems (and both
    // separators) with a space, then collapses runs of spaces.
    static QString sanitizeSegment(const QString& segment);

    // '\' to '/', duplicate separators and '.' removed, '..' resolved
    static QString normalize(const QString& path);
};

} // namespace ReelSync
