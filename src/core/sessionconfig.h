#ifndef SESSIONCONFIG_H
#define SESSIONCONFIG_H

#include <QString>
#include <QJsonObject>
#include <limits>

struct SessionPaths {
    QString sessionName;   // "RemoteAuth-<id>", also the remote store key
    QString dataPath;
    QString workingDir;
    QString stagingDir;
    QString archivePath;
    QString partialArchivePath;
};

struct SessionConfig {
    enum class Error {
        None,
        InvalidClientId,
        IntervalTooShort,
        IntervalTooLong,
        InvalidCompressionLevel,
        MissingStore,
        ConflictingUserDataDir,
        UnreadableConfig
    };

    static constexpr qint64 MinimumBackupIntervalMs = 60000;
    static constexpr qint64 DefaultInitialBackupDelayMs = 60000;
    // QTimer keeps its interval in an int
    static constexpr qint64 MaximumTimerIntervalMs = std::numeric_limits<int>::max();
    static constexpr int DefaultCompressionLevel = 6;

    QString clientId;
    QString dataPath;
    qint64 backupSyncIntervalMs;
    qint64 initialBackupDelayMs;
    int compressionLevel;

    SessionConfig()
        : backupSyncIntervalMs(0)
        , initialBackupDelayMs(DefaultInitialBackupDelayMs)
        , compressionLevel(DefaultCompressionLevel) {}

    Error validate(QString *errorMessage = nullptr) const;

    // Empty id -> "default"
    QString effectiveClientId() const;
    SessionPaths resolvePaths() const;

    static bool isValidClientId(const QString &clientId);
    static QString defaultDataPath();

    static SessionConfig fromJson(const QJsonObject &obj);
    static SessionConfig load(const QString &filePath, Error *error = nullptr,
                              QString *errorMessage = nullptr);
    QJsonObject toJson() const;
};

#endif // SESSIONCONFIG_H
