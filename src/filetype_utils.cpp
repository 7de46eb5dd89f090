#include "filetype_utils.h"

#include <QDir>
#include <QFile>

bool isPdfFile(const QString &path)
{
    QFile f(path);
    if (!f.open(QIODevice::ReadOnly))
        return false;

    const QByteArray head = f.read(5);
    return head == "%PDF-";
}

QString makeOutputPath(const QString &outDir,
                       const QString &baseName,
                       const QString &extLower)
{
    const QString fileName =
        baseName + "_clauses" + (extLower.isEmpty() ? QString() : "." + extLower);

    return QDir(outDir).filePath(fileName);
}

QString truncateForPreview(const QString &text, const int limit)
{
    if (text.size() <= limit)
        return text;
    return text.left(limit).trimmed() + QChar(0x2026);
}
