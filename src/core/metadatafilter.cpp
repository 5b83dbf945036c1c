#include "metadatafilter.h"
#include "fsutils.h"
#include <QDir>
#include <QFileInfo>
#include <QDebug>

QStringList MetadataFilter::requiredEntries()
{
    return {QStringLiteral("Default"), QStringLiteral("IndexedDB"), QStringLiteral("Local Storage")};
}

int MetadataFilter::apply(const QString &profileDir)
{
    int removed = 0;
    const QStringList dirs = {profileDir, profileDir + "/Default"};

    for (const QString &dir : dirs) {
        removed += filterDirectory(dir);
    }

    return removed;
}

int MetadataFilter::filterDirectory(const QString &dirPath)
{
    QFileInfo dirInfo(dirPath);
    if (!FsUtils::exists(dirPath) || !dirInfo.isDir()) {
        return 0;
    }

    QDir dir(dirPath);
    if (!dir.isReadable()) {
        qWarning() << "Cannot list" << dirPath << ", skipping";
        return 0;
    }

    const QStringList required = requiredEntries();
    const QFileInfoList entries = dir.entryInfoList(
        QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System);

    int removed = 0;
    for (const QFileInfo &fi : entries) {
        if (required.contains(fi.fileName())) {
            continue;
        }

        // Symlinks are removed as links, never followed
        bool ok = (fi.isDir() && !fi.isSymLink())
            ? FsUtils::removeDirectory(fi.absoluteFilePath())
            : FsUtils::removeFile(fi.absoluteFilePath());

        if (ok) {
            ++removed;
        }
    }

    return removed;
}
