#include "sessionconfig.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>

namespace {

void setMessage(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

}

bool SessionConfig::isValidClientId(const QString &clientId)
{
    static const QRegularExpression re(QStringLiteral("^[-_A-Za-z0-9]+$"));
    return re.match(clientId).hasMatch();
}

QString SessionConfig::defaultDataPath()
{
    return QStringLiteral("./.wwebjs_auth/");
}

QString SessionConfig::effectiveClientId() const
{
    return clientId.isEmpty() ? QStringLiteral("default") : clientId;
}

SessionConfig::Error SessionConfig::validate(QString *errorMessage) const
{
    if (!clientId.isEmpty() && !isValidClientId(clientId)) {
        setMessage(errorMessage, "Invalid clientId \"" + clientId
                   + "\": only alphanumeric characters, underscores and hyphens are allowed");
        return Error::InvalidClientId;
    }

    if (backupSyncIntervalMs < MinimumBackupIntervalMs) {
        setMessage(errorMessage, QString("Invalid backupSyncIntervalMs %1. Must be >= %2ms.")
                                     .arg(backupSyncIntervalMs)
                                     .arg(MinimumBackupIntervalMs));
        return Error::IntervalTooShort;
    }

    if (backupSyncIntervalMs > MaximumTimerIntervalMs) {
        setMessage(errorMessage, QString("Invalid backupSyncIntervalMs %1. Must be <= %2ms.")
                                     .arg(backupSyncIntervalMs)
                                     .arg(MaximumTimerIntervalMs));
        return Error::IntervalTooLong;
    }

    if (initialBackupDelayMs > MaximumTimerIntervalMs) {
        setMessage(errorMessage, QString("Invalid initialBackupDelayMs %1. Must be <= %2ms.")
                                     .arg(initialBackupDelayMs)
                                     .arg(MaximumTimerIntervalMs));
        return Error::IntervalTooLong;
    }

    if (compressionLevel < 1 || compressionLevel > 9) {
        setMessage(errorMessage, QString("Invalid compressionLevel %1. Must be between 1 and 9.")
                                     .arg(compressionLevel));
        return Error::InvalidCompressionLevel;
    }

    setMessage(errorMessage, QString());
    return Error::None;
}

SessionPaths SessionConfig::resolvePaths() const
{
    const QString id = effectiveClientId();
    const QString root = QDir::cleanPath(
        QFileInfo(dataPath.isEmpty() ? defaultDataPath() : dataPath).absoluteFilePath());

    SessionPaths paths;
    paths.sessionName = "RemoteAuth-" + id;
    paths.dataPath = root;
    paths.workingDir = root + "/" + paths.sessionName;
    paths.stagingDir = root + "/wwebjs_temp_session_" + id;
    paths.archivePath = root + "/" + paths.sessionName + ".zip";
    paths.partialArchivePath = paths.archivePath + ".partial";
    return paths;
}

SessionConfig SessionConfig::fromJson(const QJsonObject &obj)
{
    SessionConfig config;
    config.clientId = obj["clientId"].toString();
    config.dataPath = obj["dataPath"].toString();
    config.backupSyncIntervalMs = obj["backupSyncIntervalMs"].toInteger(0);
    config.initialBackupDelayMs = obj["initialBackupDelayMs"].toInteger(DefaultInitialBackupDelayMs);
    config.compressionLevel = obj["compressionLevel"].toInt(DefaultCompressionLevel);
    return config;
}

SessionConfig SessionConfig::load(const QString &filePath, Error *error, QString *errorMessage)
{
    if (error) {
        *error = Error::None;
    }

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = Error::UnreadableConfig;
        }
        setMessage(errorMessage, "Cannot open config file " + filePath + ": " + file.errorString());
        return SessionConfig();
    }

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();

    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = Error::UnreadableConfig;
        }
        setMessage(errorMessage, "Malformed config file " + filePath + ": " + parseError.errorString());
        return SessionConfig();
    }

    SessionConfig config = fromJson(doc.object());
    // Relative data paths are taken relative to the config file
    if (!config.dataPath.isEmpty() && QDir::isRelativePath(config.dataPath)) {
        config.dataPath = QFileInfo(filePath).absoluteDir().filePath(config.dataPath);
    }
    return config;
}

QJsonObject SessionConfig::toJson() const
{
    QJsonObject obj;
    obj["clientId"] = clientId;
    obj["dataPath"] = dataPath;
    obj["backupSyncIntervalMs"] = backupSyncIntervalMs;
    obj["initialBackupDelayMs"] = initialBackupDelayMs;
    obj["compressionLevel"] = compressionLevel;
    return obj;
}
