#ifndef REMOTESESSION_H
#define REMOTESESSION_H

#include <QObject>
#include <QDateTime>
#include <QFutureWatcher>
#include <QString>
#include <QThreadPool>
#include <atomic>
#include "sessionconfig.h"
#include "sessionarchiver.h"
#include "remotesyncgateway.h"

class BackupScheduler;
class RemoteStore;

// Launch options the host passes to the browser automation client.
struct BrowserLaunchOptions {
    QString userDataDir;
};

// Keeps a browser profile directory backed up in a RemoteStore.
//
// Host sequence: create() -> prepareWorkingDirectory() before the browser
// starts -> onReady() once the session is authenticated -> logout() or
// destroy(). All remote and archive I/O after prepareWorkingDirectory()
// runs in order on one worker thread, so store calls never overlap; results
// come back as signals.
class RemoteSession : public QObject {
    Q_OBJECT

public:
    // Returns nullptr and sets error on invalid configuration or a missing store.
    // The store must outlive the returned object.
    static RemoteSession *create(const SessionConfig &config, RemoteStore *store,
                                 SessionConfig::Error *error = nullptr,
                                 QString *errorMessage = nullptr,
                                 QObject *parent = nullptr);
    ~RemoteSession() override;

    // Restores the remote session into the working directory, or creates an
    // empty one. Blocks. Fails only when options already name another
    // userDataDir or the working directory cannot be created; on success
    // options.userDataDir points at the working directory.
    bool prepareWorkingDirectory(BrowserLaunchOptions &options,
                                 SessionConfig::Error *error = nullptr,
                                 QString *errorMessage = nullptr);

    void onReady();

    // Deletes the remote session and the working directory, stops backups.
    void logout();

    // Stops backups, keeps all data.
    void destroy();

    // Runs one backup cycle now unless one is already running.
    bool backupNow(bool notify = false);

    const SessionPaths &paths() const;
    QString sessionName() const;
    qint64 backupInterval() const;
    bool isBusy() const;
    BackupScheduler *scheduler() const;
    QDateTime lastBackupTime() const;
    qint64 lastArchiveSize() const;

signals:
    void remoteSessionSaved();
    void backupStarted();
    void backupFinished(bool uploaded, const QString &message);
    void loggedOut(bool remoteDeleted);
    void error(const QString &message);

private slots:
    void onBackupRequested(bool notify);
    void onBackupCycleFinished();
    void onReadyProbeFinished();
    void onLogoutFinished();

private:
    struct CycleResult {
        bool archived = false;
        bool uploaded = false;
        qint64 archiveSize = 0;
        QString message;
    };

    struct LogoutResult {
        bool remoteDeleted = false;
        QString message;
    };

    RemoteSession(const SessionConfig &config, RemoteStore *store, QObject *parent);

    bool restoreRemoteSession();
    bool resetWorkingDirectory();
    void startLogout();

    static CycleResult runBackupCycle(const SessionArchiver &archiver,
                                      const RemoteSyncGateway &gateway,
                                      const std::atomic<bool> *uploadsRevoked);

    SessionConfig m_config;
    SessionPaths m_paths;
    SessionArchiver m_archiver;
    RemoteSyncGateway m_gateway;
    BackupScheduler *m_scheduler;

    QThreadPool m_workerPool;
    QFutureWatcher<CycleResult> m_backupWatcher;
    QFutureWatcher<bool> m_probeWatcher;
    QFutureWatcher<LogoutResult> m_logoutWatcher;

    bool m_pendingNotify = false;
    bool m_logoutPending = false;
    std::atomic<bool> m_uploadsRevoked{false};
    QDateTime m_lastBackupTime;
    qint64 m_lastArchiveSize = 0;
};

#endif // REMOTESESSION_H
