#pragma once

#include <QString>

// Checks the "%PDF-" magic rather than the extension.
bool isPdfFile(const QString &path);

// <outDir>/<baseName>_clauses.<extLower>
QString makeOutputPath(const QString &outDir,
                       const QString &baseName,
                       const QString &extLower);

// Shortens long clause text for list/tree previews.
QString truncateForPreview(const QString &text, int limit = 220);
