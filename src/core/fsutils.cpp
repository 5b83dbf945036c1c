#include "fsutils.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <cerrno>
#include <cstdio>
#include <cstring>

bool FsUtils::exists(const QString &path)
{
    if (path.isEmpty()) {
        return false;
    }
    // Dangling symlinks still occupy the path
    QFileInfo info(path);
    return info.exists() || info.isSymLink();
}

bool FsUtils::removeFile(const QString &path)
{
    if (!exists(path)) {
        return true;
    }

    QFile file(path);
    if (!file.remove()) {
        qWarning() << "Failed to remove file" << path << ":" << file.errorString();
        return false;
    }
    return true;
}

bool FsUtils::removeDirectory(const QString &path)
{
    if (!exists(path)) {
        return true;
    }

    QFileInfo info(path);
    if (info.isSymLink() || !info.isDir()) {
        return removeFile(path);
    }

    QDir dir(path);
    if (!dir.removeRecursively()) {
        qWarning() << "Failed to remove directory" << path;
        return false;
    }
    return true;
}

int FsUtils::copyDirectory(const QString &source, const QString &destination)
{
    QDir sourceDir(source);
    if (!sourceDir.exists()) {
        qWarning() << "Copy source does not exist:" << source;
        return 1;
    }

    if (!QDir().mkpath(destination)) {
        qWarning() << "Failed to create" << destination;
        return 1;
    }

    int failures = 0;
    const QFileInfoList entries = sourceDir.entryInfoList(
        QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System);

    for (const QFileInfo &fi : entries) {
        QString dstPath = destination + "/" + fi.fileName();

        if (fi.isSymLink()) {
            // Relative, so links inside the tree follow it to its new place
            const QString target = QDir(fi.absolutePath()).relativeFilePath(fi.symLinkTarget());
            if (!QFile::link(target, dstPath)) {
                qWarning() << "Skipping symlink" << fi.absoluteFilePath();
                ++failures;
            }
        } else if (fi.isDir()) {
            failures += copyDirectory(fi.absoluteFilePath(), dstPath);
        } else {
            if (QFile::exists(dstPath)) {
                QFile::remove(dstPath);
            }
            QFile file(fi.absoluteFilePath());
            if (!file.copy(dstPath)) {
                qWarning() << "Failed to copy" << fi.absoluteFilePath()
                           << ":" << file.errorString();
                ++failures;
            }
        }
    }

    return failures;
}

bool FsUtils::replaceFile(const QString &source, const QString &target, QString *errorMessage)
{
    // QFile::rename refuses to overwrite; rename(2) replaces atomically
    if (std::rename(QFile::encodeName(source).constData(),
                    QFile::encodeName(target).constData()) != 0) {
        if (errorMessage) {
            *errorMessage = QString("Failed to rename %1 to %2: %3")
                                .arg(source, target, QString::fromLocal8Bit(std::strerror(errno)));
        }
        return false;
    }
    return true;
}

qint64 FsUtils::directorySize(const QString &path)
{
    qint64 size = 0;
    QDir dir(path);

    const QFileInfoList entries = dir.entryInfoList(
        QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System);

    for (const QFileInfo &info : entries) {
        if (info.isSymLink()) {
            continue;
        }
        if (info.isDir()) {
            size += directorySize(info.absoluteFilePath());
        } else {
            size += info.size();
        }
    }

    return size;
}
