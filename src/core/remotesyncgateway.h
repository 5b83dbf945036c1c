#ifndef REMOTESYNCGATEWAY_H
#define REMOTESYNCGATEWAY_H

#include <QString>

class RemoteStore;

// Binds a RemoteStore to one session name. Failures are logged here; the
// return value only says whether the call succeeded.
class RemoteSyncGateway {
public:
    RemoteSyncGateway(RemoteStore *store, const QString &sessionName);

    // ok is false when the store could not be asked; the result is then false.
    bool exists(bool *ok = nullptr) const;
    bool save(const QString &localArchivePath, QString *errorMessage = nullptr) const;
    bool fetch(const QString &destinationArchivePath, QString *errorMessage = nullptr) const;

    // No-op when the session is not stored remotely.
    bool remove(QString *errorMessage = nullptr) const;

    QString sessionName() const { return m_sessionName; }

private:
    RemoteStore *m_store;
    QString m_sessionName;
};

#endif // REMOTESYNCGATEWAY_H
