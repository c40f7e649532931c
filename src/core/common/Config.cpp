#include "Config.hpp"
#include "Logger.hpp"
#include <QtCore/QDir>
#include <QtCore/QtGlobal>

namespace ReelSync {

namespace {
constexpr int kMinReadTimeoutSeconds = 5;
constexpr qint64 kMinChunkSize = 4 * 1024;
constexpr int kMaxProbeRetryDelayMs = 10000;
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    REELSYNC_DEBUG("Config initialized for {}/{} ({})",
                   organizationName.toStdString(), applicationName.toStdString(),
                   settings_->fileName().toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    REELSYNC_DEBUG("Config initialized from {}", iniPath.toStdString());
}

QString Config::fileName() const {
    return settings_ ? settings_->fileName() : QString();
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    bool ok = false;
    int value = getValue(key, defaultValue).toInt(&ok);
    if (!ok) {
        REELSYNC_WARN("Setting {} is not an integer, using {}", key.toStdString(), defaultValue);
        return defaultValue;
    }
    return value;
}

qint64 Config::getInt64(const QString& key, qint64 defaultValue) const {
    bool ok = false;
    qint64 value = getValue(key, defaultValue).toLongLong(&ok);
    if (!ok) {
        REELSYNC_WARN("Setting {} is not an integer, using {}", key.toStdString(), defaultValue);
        return defaultValue;
    }
    return value;
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

Config::ConnectionSettings Config::getConnectionSettings() const {
    ConnectionSettings settings;
    settings.baseUrl = getString("connection/baseUrl");
    settings.token = getString("connection/token");
    settings.tokenHeader = getString("connection/tokenHeader", settings.tokenHeader);
    settings.userAgent = getString("connection/userAgent", settings.userAgent);
    settings.readTimeoutSeconds = qMax(kMinReadTimeoutSeconds,
        getInt("connection/readTimeoutSeconds", settings.readTimeoutSeconds));
    settings.verifySsl = getBool("connection/verifySsl", settings.verifySsl);
    return settings;
}

Config::TransferSettings Config::getTransferSettings() const {
    TransferSettings settings;
    settings.chunkSize = qMax(kMinChunkSize, getInt64("transfer/chunkSize", settings.chunkSize));
    settings.probeBytes = qMax<qint64>(1, getInt64("transfer/probeBytes", settings.probeBytes));
    settings.probeAttempts = qMax(1, getInt("transfer/probeAttempts", settings.probeAttempts));
    settings.probeRetryDelayMs = qBound(0, getInt("transfer/probeRetryDelayMs", settings.probeRetryDelayMs),
                                        kMaxProbeRetryDelayMs);
    return settings;
}

Config::LoggingSettings Config::getLoggingSettings() const {
    LoggingSettings settings;
    settings.level = getString("logging/level", settings.level);
    settings.filePath = getString("logging/file", getDataPath() + "/reelsync.log");
    return settings;
}

QString Config::getDefaultDestination() const {
    return getString("destination/defaultPath",
        QStandardPaths::writableLocation(QStandardPaths::DownloadLocation));
}

void Config::setConnectionSettings(const ConnectionSettings& settings) {
    setValue("connection/baseUrl", settings.baseUrl);
    setValue("connection/token", settings.token);
    setValue("connection/tokenHeader", settings.tokenHeader);
    setValue("connection/userAgent", settings.userAgent);
    setValue("connection/readTimeoutSeconds", settings.readTimeoutSeconds);
    setValue("connection/verifySsl", settings.verifySsl);
}

void Config::setTransferSettings(const TransferSettings& settings) {
    setValue("transfer/chunkSize", settings.chunkSize);
    setValue("transfer/probeBytes", settings.probeBytes);
    setValue("transfer/probeAttempts", settings.probeAttempts);
    setValue("transfer/probeRetryDelayMs", settings.probeRetryDelayMs);
}

void Config::setLoggingSettings(const LoggingSettings& settings) {
    setValue("logging/level", settings.level);
    setValue("logging/file", settings.filePath);
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

} // namespace ReelSync
