#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QVariant>
#include <memory>

namespace ReelSync {

class Config {
public:
    static Config& instance();

    // Native settings store (registry, plist or ~/.config depending on platform)
    void initialize(const QString& organizationName = "ReelSync",
                    const QString& applicationName = "reelsync");

    // INI file given on the command line; created on first write
    void initializeFromFile(const QString& iniPath);

    bool isInitialized() const { return settings_ != nullptr; }
    QString fileName() const;

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    qint64 getInt64(const QString& key, qint64 defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;

    struct ConnectionSettings {
        QString baseUrl;
        QString token;
        QString tokenHeader = "X-Plex-Token";
        QString userAgent = "ReelSync/1.0";
        int readTimeoutSeconds = 60;
        bool verifySsl = true;
    };

    struct TransferSettings {
        qint64 chunkSize = 64 * 1024;
        qint64 probeBytes = 1024 * 1024;
        int probeAttempts = 3;
        int probeRetryDelayMs = 500;
    };

    struct LoggingSettings {
        QString level = "info";
        QString filePath;
    };

    ConnectionSettings getConnectionSettings() const;
    TransferSettings getTransferSettings() const;
    LoggingSettings getLoggingSettings() const;
    QString getDefaultDestination() const;

    void setConnectionSettings(const ConnectionSettings& settings);
    void setTransferSettings(const TransferSettings& settings);
    void setLoggingSettings(const LoggingSettings& settings);

    QString getDataPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;
};

} // namespace ReelSync
