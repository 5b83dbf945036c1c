#ifndef SESSIONARCHIVER_H
#define SESSIONARCHIVER_H

#include <QString>
#include "sessionconfig.h"

// Snapshots the working directory into the session archive and restores it.
// All methods block; callers run them off the host's thread.
class SessionArchiver {
public:
    explicit SessionArchiver(const SessionPaths &paths,
                             int compressionLevel = SessionConfig::DefaultCompressionLevel);

    // Copies the working directory to the staging directory, strips it down
    // to the required entries, streams it into the .partial archive and
    // renames that over the final archive. The staging directory is removed
    // whatever the outcome. On failure the previous final archive is untouched.
    bool compressSession(QString *errorMessage = nullptr) const;

    // Extracts archivePath into the working directory (created if needed,
    // existing entries overwritten) and deletes the archive on success.
    bool extractSession(const QString &archivePath, QString *errorMessage = nullptr) const;

    // Removes a .partial left over by an interrupted run.
    bool discardPartialArchive() const;

    const SessionPaths &paths() const { return m_paths; }

    static bool writeArchive(const QString &sourceDir, const QString &archivePath,
                             int compressionLevel, QString *errorMessage = nullptr);
    // Hard links and symlinks that could point outside targetDir are skipped.
    static bool extractArchive(const QString &archivePath, const QString &targetDir,
                               QString *errorMessage = nullptr);
    static bool verifyArchive(const QString &archivePath);

private:
    static bool addDirectoryToArchive(struct archive *a, const QString &baseDir,
                                      const QString &relativePath, QString *errorMessage);

    SessionPaths m_paths;
    int m_compressionLevel;
};

#endif // SESSIONARCHIVER_H
