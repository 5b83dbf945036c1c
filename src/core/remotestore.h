#ifndef REMOTESTORE_H
#define REMOTESTORE_H

#include <QString>

// Blob store keyed by session name, implemented by the host (object storage,
// a database, a shared filesystem...). Calls are made from a worker thread,
// one at a time per session. A call that fails returns false and may
// describe the failure in errorMessage.
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual bool sessionExists(const QString &session, bool *exists,
                               QString *errorMessage = nullptr) = 0;

    // Uploads the archive at localPath, replacing any previous blob.
    virtual bool save(const QString &session, const QString &localPath,
                      QString *errorMessage = nullptr) = 0;

    // Downloads the blob to destinationPath.
    virtual bool extract(const QString &session, const QString &destinationPath,
                         QString *errorMessage = nullptr) = 0;

    virtual bool remove(const QString &session, QString *errorMessage = nullptr) = 0;
};

#endif // REMOTESTORE_H
