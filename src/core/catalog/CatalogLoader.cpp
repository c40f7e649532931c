#include "CatalogLoader.hpp"
#include "../common/Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <cmath>

namespace ReelSync {

namespace {
// Largest integer a JSON double carries exactly
constexpr double kMaxExactInteger = 9007199254740992.0;
}

const char* CatalogLoader::errorName(CatalogError error) {
    switch (error) {
        case CatalogError::FileNotFound: return "FileNotFound";
        case CatalogError::ReadFailed: return "ReadFailed";
        case CatalogError::ParseFailed: return "ParseFailed";
        case CatalogError::InvalidItem: return "InvalidItem";
    }
    return "Unknown";
}

Unexpected<CatalogError> CatalogLoader::fail(CatalogError error, const QString& message) {
    lastError_ = message;
    REELSYNC_ERROR("Catalog {}: {}", errorName(error), message.toStdString());
    return makeUnexpected(error);
}

Expected<SyncJob, CatalogError> CatalogLoader::loadFromFile(const QString& path) {
    QFile file(path);
    if (!file.exists()) {
        return fail(CatalogError::FileNotFound, QString("Job file %1 does not exist").arg(path));
    }
    if (!file.open(QIODevice::ReadOnly)) {
        return fail(CatalogError::ReadFailed, QString("Cannot read %1: %2").arg(path, file.errorString()));
    }

    const QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        return fail(CatalogError::ReadFailed, QString("Cannot read %1: %2").arg(path, file.errorString()));
    }

    REELSYNC_DEBUG("Loading job from {} ({} bytes)", path.toStdString(), data.size());
    return loadFromJson(data);
}

Expected<SyncJob, CatalogError> CatalogLoader::loadFromJson(const QByteArray& json) {
    lastError_.clear();

    QJsonParseError error;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &error);
    if (error.error != QJsonParseError::NoError) {
        return fail(CatalogError::ParseFailed,
                    QString("%1 at offset %2").arg(error.errorString()).arg(error.offset));
    }
    if (!doc.isObject()) {
        return fail(CatalogError::ParseFailed, "Top level of the job must be an object");
    }

    const QJsonObject root = doc.object();
    if (!root.value("items").isArray()) {
        return fail(CatalogError::ParseFailed, "Job has no \"items\" array");
    }

    SyncJob job;
    job.name = root.value("name").toString();

    const QJsonArray items = root.value("items").toArray();
    for (int i = 0; i < items.size(); ++i) {
        if (!items.at(i).isObject()) {
            return fail(CatalogError::InvalidItem, QString("items[%1] is not an object").arg(i));
        }
        auto item = parseItem(items.at(i).toObject(), i);
        if (item.hasError()) {
            return makeUnexpected(item.error());
        }
        job.items.append(std::move(item).value());
    }

    REELSYNC_INFO("Loaded job '{}' with {} items", job.name.toStdString(), job.items.size());
    return job;
}

Expected<MediaItem, CatalogError> CatalogLoader::parseItem(const QJsonObject& object, int index) {
    const QString where = QString("items[%1]").arg(index);

    MediaItem item;
    if (!object.value("title").isString()) {
        return fail(CatalogError::InvalidItem, where + " has no title");
    }
    item.title = object.value("title").toString();

    if (!object.value("section").isObject()) {
        return fail(CatalogError::InvalidItem, QString("%1 (%2) has no section").arg(where, item.title));
    }
    const QJsonObject section = object.value("section").toObject();
    item.sectionTitle = section.value("title").toString();
    for (const QJsonValue& location : section.value("locations").toArray()) {
        if (!location.isString()) {
            return fail(CatalogError::InvalidItem,
                        QString("%1 (%2) has a non-string section location").arg(where, item.title));
        }
        item.sectionLocations.append(location.toString());
    }

    if (!object.value("media").isArray()) {
        return fail(CatalogError::InvalidItem, QString("%1 (%2) has no media").arg(where, item.title));
    }
    const QJsonArray mediaArray = object.value("media").toArray();
    for (int m = 0; m < mediaArray.size(); ++m) {
        const QJsonObject mediaObject = mediaArray.at(m).toObject();
        Media media;
        const QJsonArray parts = mediaObject.value("parts").toArray();
        for (int p = 0; p < parts.size(); ++p) {
            auto part = parsePart(parts.at(p).toObject(),
                                  QString("%1.media[%2].parts[%3]").arg(where).arg(m).arg(p));
            if (part.hasError()) {
                return makeUnexpected(part.error());
            }
            media.parts.append(std::move(part).value());
        }
        item.media.append(media);
    }

    return item;
}

Expected<RemotePart, CatalogError> CatalogLoader::parsePart(const QJsonObject& object, const QString& where) {
    RemotePart part;

    if (!object.value("key").isString() || object.value("key").toString().isEmpty()) {
        return fail(CatalogError::InvalidItem, where + " has no key");
    }
    part.remoteKey = object.value("key").toString();

    if (!object.value("file").isString() || object.value("file").toString().isEmpty()) {
        return fail(CatalogError::InvalidItem, where + " has no file path");
    }
    part.sourcePath = object.value("file").toString();

    const QJsonValue size = object.value("size");
    const double raw = size.toDouble(-1.0);
    if (!size.isDouble() || raw < 0.0 || raw >= kMaxExactInteger || std::floor(raw) != raw) {
        return fail(CatalogError::InvalidItem, where + " has an invalid size");
    }
    part.declaredSize = static_cast<qint64>(raw);

    return part;
}

} // namespace ReelSync
