#include <catch2/catch.hpp>

#include "filetype_utils.h"

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

TEST_CASE("PDF detection reads the magic bytes", "[files]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const QString pdf = dir.filePath("renamed.bin");
    const QString text = dir.filePath("fake.pdf");
    {
        QFile out(pdf);
        REQUIRE(out.open(QIODevice::WriteOnly));
        out.write("%PDF-1.7\n%\xE2\xE3\xCF\xD3\n");
    }
    {
        QFile out(text);
        REQUIRE(out.open(QIODevice::WriteOnly));
        out.write("hello");
    }

    REQUIRE(isPdfFile(pdf));
    REQUIRE_FALSE(isPdfFile(text));
    REQUIRE_FALSE(isPdfFile(dir.filePath("missing.pdf")));
}

TEST_CASE("Batch output names carry the clauses suffix", "[files]") {
    REQUIRE(makeOutputPath("/out", "iec61513", "json") == QDir("/out").filePath("iec61513_clauses.json"));
    REQUIRE(makeOutputPath("/out", "iec61513", "xlsx") == QDir("/out").filePath("iec61513_clauses.xlsx"));
}

TEST_CASE("Long previews are truncated with an ellipsis", "[files]") {
    const QString longText(300, QChar('a'));
    const QString preview = truncateForPreview(longText);

    REQUIRE(preview.size() == 221);
    REQUIRE(preview.endsWith(QChar(0x2026)));
    REQUIRE(truncateForPreview("short") == "short");
}
