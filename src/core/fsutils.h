#ifndef FSUTILS_H
#define FSUTILS_H

#include <QString>

// Filesystem helpers for the session pipeline. None of them throw; the
// best-effort variants log what they could not do and carry on.
class FsUtils {
public:
    // False for missing or inaccessible paths, never an error.
    static bool exists(const QString &path);

    // Best-effort: a missing path counts as removed.
    static bool removeFile(const QString &path);
    static bool removeDirectory(const QString &path);

    // Copies the tree, skipping entries that cannot be copied.
    // Returns the number of entries that failed.
    static int copyDirectory(const QString &source, const QString &destination);

    // Atomically replaces target with source (same filesystem).
    static bool replaceFile(const QString &source, const QString &target,
                            QString *errorMessage = nullptr);

    static qint64 directorySize(const QString &path);
};

#endif // FSUTILS_H
