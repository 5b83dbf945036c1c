#include "remotesession.h"
#include "backupscheduler.h"
#include "fsutils.h"
#include "remotestore.h"
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <QtConcurrent>

RemoteSession *RemoteSession::create(const SessionConfig &config, RemoteStore *store,
                                     SessionConfig::Error *error, QString *errorMessage,
                                     QObject *parent)
{
    QString message;
    SessionConfig::Error result = config.validate(&message);

    if (result == SessionConfig::Error::None && !store) {
        result = SessionConfig::Error::MissingStore;
        message = "Remote store is required.";
    }

    if (error) {
        *error = result;
    }
    if (errorMessage) {
        *errorMessage = message;
    }

    if (result != SessionConfig::Error::None) {
        qCritical() << "Invalid session configuration:" << message;
        return nullptr;
    }

    return new RemoteSession(config, store, parent);
}

RemoteSession::RemoteSession(const SessionConfig &config, RemoteStore *store, QObject *parent)
    : QObject(parent)
    , m_config(config)
    , m_paths(config.resolvePaths())
    , m_archiver(m_paths, config.compressionLevel)
    , m_gateway(store, m_paths.sessionName)
    , m_scheduler(new BackupScheduler(config.backupSyncIntervalMs, this))
{
    m_workerPool.setMaxThreadCount(1);

    connect(m_scheduler, &BackupScheduler::backupRequested,
            this, &RemoteSession::onBackupRequested);
    connect(&m_backupWatcher, &QFutureWatcher<CycleResult>::finished,
            this, &RemoteSession::onBackupCycleFinished);
    connect(&m_probeWatcher, &QFutureWatcher<bool>::finished,
            this, &RemoteSession::onReadyProbeFinished);
    connect(&m_logoutWatcher, &QFutureWatcher<LogoutResult>::finished,
            this, &RemoteSession::onLogoutFinished);
}

RemoteSession::~RemoteSession()
{
    m_scheduler->stop();

    // Workers hold pointers into this object
    m_workerPool.waitForDone();
}

bool RemoteSession::prepareWorkingDirectory(BrowserLaunchOptions &options,
                                            SessionConfig::Error *error, QString *errorMessage)
{
    if (error) {
        *error = SessionConfig::Error::None;
    }

    if (!options.userDataDir.isEmpty()
        && QDir::cleanPath(QFileInfo(options.userDataDir).absoluteFilePath()) != m_paths.workingDir) {
        QString message = "RemoteSession is not compatible with a user-supplied userDataDir ("
                          + options.userDataDir + ")";
        qCritical() << "Conflicting userDataDir:" << options.userDataDir;
        if (error) {
            *error = SessionConfig::Error::ConflictingUserDataDir;
        }
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    }

    // The restore below talks to the store from this thread
    m_workerPool.waitForDone();

    m_scheduler->beginRestore();
    bool restored = restoreRemoteSession();
    m_scheduler->endRestore();

    if (!QFileInfo(m_paths.workingDir).isDir()) {
        QString message = "Failed to create working directory " + m_paths.workingDir;
        qCritical() << "Failed to create working directory" << m_paths.workingDir;
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    }

    qInfo() << (restored ? "Restored session into" : "Initialized empty session in") << m_paths.workingDir;
    options.userDataDir = m_paths.workingDir;
    return true;
}

bool RemoteSession::restoreRemoteSession()
{
    bool ok = false;
    bool exists = m_gateway.exists(&ok);

    if (!ok || !exists) {
        if (!ok) {
            qWarning() << "Treating" << m_paths.sessionName << "as absent";
        }
        QDir().mkpath(m_paths.workingDir);
        return false;
    }

    QDir().mkpath(m_paths.dataPath);
    if (!m_gateway.fetch(m_paths.archivePath)) {
        QDir().mkpath(m_paths.workingDir);
        return false;
    }

    if (!FsUtils::exists(m_paths.archivePath)) {
        qWarning() << "Zip file" << m_paths.archivePath << "not found after extraction";
        QDir().mkpath(m_paths.workingDir);
        return false;
    }

    QString message;
    bool extracted = false;
    if (!SessionArchiver::verifyArchive(m_paths.archivePath)) {
        message = "archive is unreadable";
    } else if (resetWorkingDirectory()) {
        extracted = m_archiver.extractSession(m_paths.archivePath, &message);
    } else {
        message = "could not clear " + m_paths.workingDir;
    }

    if (!extracted) {
        qWarning() << "Failed to unzip session:" << message;
        FsUtils::removeFile(m_paths.archivePath);
        resetWorkingDirectory();
        return false;
    }

    return true;
}

bool RemoteSession::resetWorkingDirectory()
{
    if (!FsUtils::removeDirectory(m_paths.workingDir)) {
        return false;
    }
    return QDir().mkpath(m_paths.workingDir);
}

void RemoteSession::onReady()
{
    if (m_scheduler->state() == BackupScheduler::State::Stopped || m_probeWatcher.isRunning()) {
        return;
    }

    RemoteSyncGateway gateway = m_gateway;
    m_probeWatcher.setFuture(QtConcurrent::run(&m_workerPool, [gateway]() {
        return gateway.exists();
    }));
}

void RemoteSession::onReadyProbeFinished()
{
    bool exists = m_probeWatcher.result();

    if (exists) {
        m_scheduler->start(false);
    } else {
        // Let a freshly authenticated profile settle before the first snapshot
        m_scheduler->start(true, m_config.initialBackupDelayMs);
    }
}

bool RemoteSession::backupNow(bool notify)
{
    if (m_uploadsRevoked) {
        return false;
    }
    return m_scheduler->requestBackup(notify);
}

void RemoteSession::onBackupRequested(bool notify)
{
    m_pendingNotify = notify;
    emit backupStarted();

    SessionArchiver archiver = m_archiver;
    RemoteSyncGateway gateway = m_gateway;
    const std::atomic<bool> *revoked = &m_uploadsRevoked;

    m_backupWatcher.setFuture(QtConcurrent::run(&m_workerPool, [archiver, gateway, revoked]() {
        return runBackupCycle(archiver, gateway, revoked);
    }));
}

RemoteSession::CycleResult RemoteSession::runBackupCycle(const SessionArchiver &archiver,
                                                         const RemoteSyncGateway &gateway,
                                                         const std::atomic<bool> *uploadsRevoked)
{
    CycleResult result;
    const QString archivePath = archiver.paths().archivePath;

    archiver.discardPartialArchive();

    QString message;
    if (!archiver.compressSession(&message)) {
        result.message = "Failed to build session archive: " + message;
        qWarning() << "Backup cycle aborted:" << message;
        return result;
    }

    result.archived = true;
    result.archiveSize = QFileInfo(archivePath).size();

    if (uploadsRevoked->load()) {
        result.message = "Session logged out, upload skipped";
        return result;
    }

    // The archive stays on disk either way; a failed upload is retried by the next cycle
    if (!gateway.save(archivePath, &message)) {
        result.message = "Failed to upload zip to remote store: " + message;
        return result;
    }

    result.uploaded = true;
    result.message = "Uploaded " + QString::number(result.archiveSize) + " bytes";
    return result;
}

void RemoteSession::onBackupCycleFinished()
{
    CycleResult result = m_backupWatcher.result();
    bool notify = m_pendingNotify;
    m_pendingNotify = false;

    if (result.archived) {
        m_lastBackupTime = QDateTime::currentDateTime();
        m_lastArchiveSize = result.archiveSize;
    }

    m_scheduler->backupFinished();

    if (result.uploaded) {
        qDebug() << "Backup cycle done," << result.message;
    } else if (!m_uploadsRevoked) {
        emit error(result.message);
    }
    emit backupFinished(result.uploaded, result.message);

    if (result.uploaded && notify) {
        emit remoteSessionSaved();
    }

    if (m_logoutPending) {
        m_logoutPending = false;
        startLogout();
    }
}

void RemoteSession::logout()
{
    if (m_uploadsRevoked.exchange(true)) {
        return;
    }

    m_scheduler->stop();

    if (m_backupWatcher.isRunning()) {
        // Finish the running cycle before deleting what it works on
        m_logoutPending = true;
        return;
    }

    startLogout();
}

void RemoteSession::startLogout()
{
    RemoteSyncGateway gateway = m_gateway;
    SessionPaths paths = m_paths;

    m_logoutWatcher.setFuture(QtConcurrent::run(&m_workerPool, [gateway, paths]() {
        LogoutResult result;
        result.remoteDeleted = gateway.remove(&result.message);

        FsUtils::removeDirectory(paths.workingDir);
        FsUtils::removeFile(paths.archivePath);
        FsUtils::removeFile(paths.partialArchivePath);
        return result;
    }));
}

void RemoteSession::onLogoutFinished()
{
    LogoutResult result = m_logoutWatcher.result();

    if (!result.remoteDeleted) {
        emit error("Failed to delete remote session: " + result.message);
    }
    qInfo() << "Logged out" << m_paths.sessionName;
    emit loggedOut(result.remoteDeleted);
}

void RemoteSession::destroy()
{
    m_scheduler->stop();
}

const SessionPaths &RemoteSession::paths() const
{
    return m_paths;
}

QString RemoteSession::sessionName() const
{
    return m_paths.sessionName;
}

qint64 RemoteSession::backupInterval() const
{
    return m_scheduler->interval();
}

bool RemoteSession::isBusy() const
{
    return m_backupWatcher.isRunning() || m_scheduler->isBusy();
}

BackupScheduler *RemoteSession::scheduler() const
{
    return m_scheduler;
}

QDateTime RemoteSession::lastBackupTime() const
{
    return m_lastBackupTime;
}

qint64 RemoteSession::lastArchiveSize() const
{
    return m_lastArchiveSize;
}
