#include "remotesyncgateway.h"
#include "remotestore.h"
#include <QDebug>

RemoteSyncGateway::RemoteSyncGateway(RemoteStore *store, const QString &sessionName)
    : m_store(store)
    , m_sessionName(sessionName)
{
}

bool RemoteSyncGateway::exists(bool *ok) const
{
    bool found = false;
    QString message;
    bool success = m_store->sessionExists(m_sessionName, &found, &message);

    if (ok) {
        *ok = success;
    }
    if (!success) {
        qWarning() << "Failed to query" << m_sessionName << ":" << message;
        return false;
    }
    return found;
}

bool RemoteSyncGateway::save(const QString &localArchivePath, QString *errorMessage) const
{
    QString message;
    if (!m_store->save(m_sessionName, localArchivePath, &message)) {
        qWarning() << "Failed to upload" << localArchivePath
                   << "to remote store:" << message;
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    }

    qDebug() << "Uploaded" << m_sessionName;
    return true;
}

bool RemoteSyncGateway::fetch(const QString &destinationArchivePath, QString *errorMessage) const
{
    QString message;
    if (!m_store->extract(m_sessionName, destinationArchivePath, &message)) {
        qWarning() << "Failed to download" << m_sessionName << ":" << message;
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    }
    return true;
}

bool RemoteSyncGateway::remove(QString *errorMessage) const
{
    bool ok = false;
    if (!exists(&ok)) {
        if (!ok && errorMessage) {
            *errorMessage = "Could not determine whether " + m_sessionName + " exists";
        }
        return ok;
    }

    QString message;
    if (!m_store->remove(m_sessionName, &message)) {
        qWarning() << "Failed to delete" << m_sessionName << ":" << message;
        if (errorMessage) {
            *errorMessage = message;
        }
        return false;
    }

    qDebug() << "Deleted" << m_sessionName;
    return true;
}
