#include "sessionarchiver.h"
#include "fsutils.h"
#include "metadatafilter.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDateTime>
#include <QDebug>
#include <archive.h>
#include <archive_entry.h>

namespace {

void setMessage(QString *errorMessage, const QString &message)
{
    if (errorMessage) {
        *errorMessage = message;
    }
}

QString archiveError(struct archive *a)
{
    const char *msg = archive_error_string(a);
    return msg ? QString::fromUtf8(msg) : QStringLiteral("unknown libarchive error");
}

// Entry names are stored as UTF-8 in the zip; read them without going
// through the process locale.
QString entryName(struct archive_entry *entry)
{
    if (const char *utf8 = archive_entry_pathname_utf8(entry)) {
        return QString::fromUtf8(utf8);
    }
    if (const char *mbs = archive_entry_pathname(entry)) {
        return QFile::decodeName(mbs);
    }
    return QString();
}

QString symlinkTarget(struct archive_entry *entry)
{
    if (const char *utf8 = archive_entry_symlink_utf8(entry)) {
        return QString::fromUtf8(utf8);
    }
    if (const char *mbs = archive_entry_symlink(entry)) {
        return QFile::decodeName(mbs);
    }
    return QString();
}

// A link may only point down into the extraction root: relative, no "..".
// Chained links obeying the same rule cannot leave the root either.
bool isContainedSymlinkTarget(const QString &target)
{
    if (target.isEmpty() || QDir::isAbsolutePath(target)) {
        return false;
    }
    const QStringList parts = target.split('/');
    return !parts.contains(QStringLiteral(".."));
}

}

SessionArchiver::SessionArchiver(const SessionPaths &paths, int compressionLevel)
    : m_paths(paths)
    , m_compressionLevel(compressionLevel)
{
}

bool SessionArchiver::discardPartialArchive() const
{
    if (!FsUtils::exists(m_paths.partialArchivePath)) {
        return true;
    }
    qDebug() << "Removing stale partial archive" << m_paths.partialArchivePath;
    return FsUtils::removeFile(m_paths.partialArchivePath);
}

bool SessionArchiver::compressSession(QString *errorMessage) const
{
    // Leftovers from a crashed cycle would otherwise be merged into this snapshot
    FsUtils::removeDirectory(m_paths.stagingDir);

    if (!FsUtils::exists(m_paths.workingDir)) {
        setMessage(errorMessage, "Working directory does not exist: " + m_paths.workingDir);
        return false;
    }

    int copyFailures = FsUtils::copyDirectory(m_paths.workingDir, m_paths.stagingDir);
    if (copyFailures > 0) {
        qWarning() << copyFailures
                   << "entries could not be copied, archiving what was copied";
    }

    if (!QFileInfo(m_paths.stagingDir).isDir()) {
        setMessage(errorMessage, "Failed to create staging directory " + m_paths.stagingDir);
        return false;
    }

    int removed = MetadataFilter::apply(m_paths.stagingDir);
    qDebug() << "Filtered" << removed << "entries, staging"
             << FsUtils::directorySize(m_paths.stagingDir) << "bytes";

    QString writeError;
    bool ok = writeArchive(m_paths.stagingDir, m_paths.partialArchivePath, m_compressionLevel,
                           &writeError);

    if (ok) {
        ok = FsUtils::replaceFile(m_paths.partialArchivePath, m_paths.archivePath, &writeError);
    }

    if (!ok) {
        FsUtils::removeFile(m_paths.partialArchivePath);
        setMessage(errorMessage, writeError);
    }

    FsUtils::removeDirectory(m_paths.stagingDir);
    return ok;
}

bool SessionArchiver::extractSession(const QString &archivePath, QString *errorMessage) const
{
    if (!extractArchive(archivePath, m_paths.workingDir, errorMessage)) {
        return false;
    }

    FsUtils::removeFile(archivePath);
    return true;
}

// --- libarchive-based compression/extraction ---

bool SessionArchiver::addDirectoryToArchive(struct archive *a, const QString &baseDir,
                                            const QString &relativePath, QString *errorMessage)
{
    QDir dir(relativePath.isEmpty() ? baseDir : baseDir + "/" + relativePath);
    const QFileInfoList entries = dir.entryInfoList(
        QDir::NoDotAndDotDot | QDir::AllEntries | QDir::Hidden | QDir::System, QDir::DirsFirst);

    for (const QFileInfo &fi : entries) {
        QString entryRelPath = relativePath.isEmpty()
            ? fi.fileName()
            : relativePath + "/" + fi.fileName();

        struct archive_entry *entry = archive_entry_new();
        archive_entry_set_pathname_utf8(entry, entryRelPath.toUtf8().constData());
        archive_entry_set_mtime(entry, fi.lastModified().toSecsSinceEpoch(), 0);

        if (fi.isSymLink()) {
            archive_entry_set_filetype(entry, AE_IFLNK);
            // symLinkTarget() is absolute; store it relative to the link
            const QString target = QDir(fi.absolutePath()).relativeFilePath(fi.symLinkTarget());
            archive_entry_set_symlink_utf8(entry, target.toUtf8().constData());
            archive_entry_set_perm(entry, 0777);
            int r = archive_write_header(a, entry);
            archive_entry_free(entry);
            if (r < ARCHIVE_WARN) {
                setMessage(errorMessage, "Failed to write symlink entry " + entryRelPath + ": "
                                             + archiveError(a));
                return false;
            }
        } else if (fi.isDir()) {
            archive_entry_set_filetype(entry, AE_IFDIR);
            archive_entry_set_perm(entry, 0755);
            int r = archive_write_header(a, entry);
            archive_entry_free(entry);
            if (r < ARCHIVE_WARN) {
                setMessage(errorMessage, "Failed to write directory entry " + entryRelPath + ": "
                                             + archiveError(a));
                return false;
            }

            if (!addDirectoryToArchive(a, baseDir, entryRelPath, errorMessage)) {
                return false;
            }
        } else if (fi.isFile()) {
            QFile file(fi.absoluteFilePath());
            if (!file.open(QIODevice::ReadOnly)) {
                archive_entry_free(entry);
                setMessage(errorMessage, "Failed to read " + fi.absoluteFilePath() + ": "
                                             + file.errorString());
                return false;
            }

            archive_entry_set_filetype(entry, AE_IFREG);
            archive_entry_set_perm(entry, fi.isExecutable() ? 0755 : 0644);
            archive_entry_set_size(entry, fi.size());
            int r = archive_write_header(a, entry);
            archive_entry_free(entry);
            if (r < ARCHIVE_WARN) {
                setMessage(errorMessage, "Failed to write file entry " + entryRelPath + ": "
                                             + archiveError(a));
                return false;
            }

            char buf[8192];
            qint64 bytesRead;
            while ((bytesRead = file.read(buf, sizeof(buf))) > 0) {
                if (archive_write_data(a, buf, static_cast<size_t>(bytesRead)) < 0) {
                    setMessage(errorMessage, "Failed to write data for " + entryRelPath + ": "
                                                 + archiveError(a));
                    return false;
                }
            }
            if (bytesRead < 0) {
                setMessage(errorMessage, "Read error on " + fi.absoluteFilePath() + ": "
                                             + file.errorString());
                return false;
            }
        } else {
            // Sockets, fifos and the like are not part of a profile snapshot
            archive_entry_free(entry);
        }
    }

    return true;
}

bool SessionArchiver::writeArchive(const QString &sourceDir, const QString &archivePath,
                                   int compressionLevel, QString *errorMessage)
{
    QFileInfo sourceInfo(sourceDir);
    if (!sourceInfo.exists() || !sourceInfo.isDir()) {
        setMessage(errorMessage, "Source directory does not exist: " + sourceDir);
        return false;
    }

    struct archive *a = archive_write_new();
    archive_write_set_format_zip(a);

    QString options = QString("zip:compression=deflate,zip:compression-level=%1").arg(compressionLevel);
    if (archive_write_set_options(a, options.toUtf8().constData()) < ARCHIVE_OK) {
        qWarning() << "Compression options not applied:" << archiveError(a);
    }

    if (archive_write_open_filename(a, QFile::encodeName(archivePath).constData()) != ARCHIVE_OK) {
        setMessage(errorMessage, "Failed to open archive for writing: " + archiveError(a));
        archive_write_free(a);
        return false;
    }

    // Entries are stored relative to sourceDir, without a top-level directory
    bool success = addDirectoryToArchive(a, sourceInfo.absoluteFilePath(), QString(), errorMessage);

    if (archive_write_close(a) != ARCHIVE_OK && success) {
        setMessage(errorMessage, "Failed to finalize archive: " + archiveError(a));
        success = false;
    }
    archive_write_free(a);

    return success;
}

bool SessionArchiver::extractArchive(const QString &archivePath, const QString &targetDir,
                                     QString *errorMessage)
{
    if (!QDir().mkpath(targetDir)) {
        setMessage(errorMessage, "Failed to create " + targetDir);
        return false;
    }

    struct archive *a = archive_read_new();
    archive_read_support_format_zip(a);

    struct archive *ext = archive_write_disk_new();
    // Entry names are rewritten to absolute paths and link targets checked below,
    // so only ".." in names needs rejecting here
    archive_write_disk_set_options(ext, ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_PERM
                                            | ARCHIVE_EXTRACT_SECURE_NODOTDOT);
    archive_write_disk_set_standard_lookup(ext);

    if (archive_read_open_filename(a, QFile::encodeName(archivePath).constData(), 10240) != ARCHIVE_OK) {
        setMessage(errorMessage, "Failed to open archive: " + archiveError(a));
        archive_read_free(a);
        archive_write_free(ext);
        return false;
    }

    const QString root = QDir(targetDir).absolutePath();
    bool success = true;
    struct archive_entry *entry;
    int r;
    while ((r = archive_read_next_header(a, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        const QString name = entryName(entry);
        if (name.isEmpty()) {
            setMessage(errorMessage, "Archive entry without a usable name");
            success = false;
            break;
        }

        if (archive_entry_hardlink(entry) || archive_entry_hardlink_utf8(entry)) {
            qWarning() << "Skipping hard link entry" << name;
            archive_read_data_skip(a);
            continue;
        }

        if (archive_entry_filetype(entry) == AE_IFLNK) {
            const QString target = symlinkTarget(entry);
            if (!isContainedSymlinkTarget(target)) {
                qWarning() << "Skipping symlink" << name << "pointing outside the session:" << target;
                archive_read_data_skip(a);
                continue;
            }
            archive_entry_copy_symlink(entry, QFile::encodeName(target).constData());
        }

        QString entryPath = root + "/" + name;
        archive_entry_copy_pathname(entry, QFile::encodeName(entryPath).constData());

        if (archive_write_header(ext, entry) < ARCHIVE_WARN) {
            setMessage(errorMessage, "Extract header error: " + archiveError(ext));
            success = false;
            break;
        }

        // Zip entries written in streaming mode may not carry their size up front
        const void *buff;
        size_t size;
        la_int64_t offset;
        int dr;
        while ((dr = archive_read_data_block(a, &buff, &size, &offset)) == ARCHIVE_OK) {
            if (archive_write_data_block(ext, buff, size, offset) < ARCHIVE_WARN) {
                setMessage(errorMessage, "Extract write error: " + archiveError(ext));
                success = false;
                break;
            }
        }
        if (success && dr != ARCHIVE_EOF) {
            setMessage(errorMessage, "Archive data error: " + archiveError(a));
            success = false;
        }

        if (archive_write_finish_entry(ext) < ARCHIVE_WARN && success) {
            setMessage(errorMessage, "Extract finish error: " + archiveError(ext));
            success = false;
        }

        if (!success) break;
    }

    if (success && r != ARCHIVE_EOF) {
        setMessage(errorMessage, "Archive read error: " + archiveError(a));
        success = false;
    }

    archive_read_free(a);
    archive_write_free(ext);
    return success;
}

bool SessionArchiver::verifyArchive(const QString &archivePath)
{
    if (!FsUtils::exists(archivePath)) {
        return false;
    }

    struct archive *a = archive_read_new();
    archive_read_support_format_zip(a);

    bool valid = false;
    if (archive_read_open_filename(a, QFile::encodeName(archivePath).constData(), 10240) == ARCHIVE_OK) {
        valid = true;
        struct archive_entry *entry;
        int r = ARCHIVE_FATAL;
        while (valid && (r = archive_read_next_header(a, &entry)) == ARCHIVE_OK) {
            // Reading the data checks the CRCs
            const void *buff;
            size_t size;
            la_int64_t offset;
            int dr;
            do {
                dr = archive_read_data_block(a, &buff, &size, &offset);
            } while (dr == ARCHIVE_OK);
            if (dr != ARCHIVE_EOF) {
                valid = false;
            }
        }
        if (valid && r != ARCHIVE_EOF) {
            valid = false;
        }
    }

    archive_read_free(a);
    return valid;
}
