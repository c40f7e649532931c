#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QString>
#include "../common/Expected.hpp"
#include "../sync/SyncTypes.hpp"

namespace ReelSync {

enum class CatalogError {
    FileNotFound,
    ReadFailed,
    ParseFailed,
    InvalidItem
};

struct SyncJob {
    QString name;
    QList<MediaItem> items;
};

/**
 * @brief Reads a sync job (an ordered list of media items) from JSON
 *
 * Expected layout:
 * @code
 * { "name": "...",
 *   "items": [ { "title": "...",
 *                "section": { "title": "...", "locations": ["..."] },
 *                "media": [ { "parts": [ { "key": "...", "size": 123, "file": "..." } ] } ] } ] }
 * @endcode
 * Item order is preserved. On failure lastErrorMessage() says what was wrong.
 */
class CatalogLoader {
public:
    Expected<SyncJob, CatalogError> loadFromFile(const QString& path);
    Expected<SyncJob, CatalogError> loadFromJson(const QByteArray& json);

    QString lastErrorMessage() const { return lastError_; }

    static const char* errorName(CatalogError error);

private:
    Expected<MediaItem, CatalogError> parseItem(const QJsonObject& object, int index);
    Expected<RemotePart, CatalogError> parsePart(const QJsonObject& object, const QString& where);
    Unexpected<CatalogError> fail(CatalogError error, const QString& message);

    QString lastError_;
};

} // namespace ReelSync
