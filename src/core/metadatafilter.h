#ifndef METADATAFILTER_H
#define METADATAFILTER_H

#include <QString>
#include <QStringList>

class MetadataFilter {
public:
    // Top-level profile entries needed to restore an authenticated session.
    static QStringList requiredEntries();

    // Deletes every entry of profileDir and profileDir/Default whose name is
    // not in requiredEntries(). Missing or unreadable directories are skipped.
    // Returns the number of entries removed.
    static int apply(const QString &profileDir);

private:
    static int filterDirectory(const QString &dir);
};

#endif // METADATAFILTER_H
