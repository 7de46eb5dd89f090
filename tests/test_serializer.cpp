#include <catch2/catch.hpp>

#include "ClausePipeline.hpp"
#include "ClauseSerializer.hpp"
#include "ParserConfig.hpp"
#include "TestSupport.hpp"
#include "XlsxWriterMinizip.hpp"

#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include <string>
#include <vector>

using namespace clausetree;
using namespace clausetree::test;

namespace {
    ClauseForest sampleForest() {
        return BuildClauseForest({
                                     HeadingFragment(1, 100.0, "4 General"),
                                     BodyFragment(1, 120.0, "General requirements apply."),
                                     HeadingFragment(1, 140.0, "4.1 Scope"),
                                     BodyFragment(1, 160.0, "Scope text for the clause."),
                                     HeadingFragment(1, 180.0, "4.1.1 Detail"),
                                     HeadingFragment(1, 200.0, "5 Other"),
                                     BodyFragment(1, 220.0, "Text with <markup> & more."),
                                 }, DefaultParserConfig());
    }
} // namespace

TEST_CASE("JSON mirrors the clause hierarchy", "[serializer]") {
    const QJsonArray roots = ToJson(sampleForest());

    REQUIRE(roots.size() == 2);

    const QJsonObject four = roots.at(0).toObject();
    REQUIRE(four.value("clause").toString() == "4");
    REQUIRE(four.value("title").toString() == "General");
    REQUIRE(four.value("text").toString() == "General requirements apply.");
    REQUIRE(four.contains("subclauses"));

    const QJsonArray fourChildren = four.value("subclauses").toArray();
    REQUIRE(fourChildren.size() == 1);
    const QJsonObject scope = fourChildren.at(0).toObject();
    REQUIRE(scope.value("clause").toString() == "4.1");
    REQUIRE(scope.value("subclauses").toArray().at(0).toObject().value("clause").toString() == "4.1.1");
}

TEST_CASE("Leaf clauses carry no subclauses key", "[serializer]") {
    const QJsonArray roots = ToJson(sampleForest());

    const QJsonObject five = roots.at(1).toObject();
    REQUIRE(five.value("clause").toString() == "5");
    REQUIRE_FALSE(five.contains("subclauses"));
    REQUIRE(five.value("text").toString() == "Text with <markup> & more.");
}

TEST_CASE("Serialized JSON parses back to the same tree", "[serializer]") {
    const ClauseForest forest = sampleForest();
    QJsonParseError error{};
    const QJsonDocument doc = QJsonDocument::fromJson(ToJsonBytes(forest), &error);

    REQUIRE(error.error == QJsonParseError::NoError);
    REQUIRE(doc.isArray());
    REQUIRE(doc.array() == ToJson(forest));
}

TEST_CASE("Rows flatten the tree depth first", "[serializer]") {
    const std::vector<Row> rows = ToRows(sampleForest());

    REQUIRE(rows.size() == 5);
    REQUIRE(rows[0] == TableHeader());
    REQUIRE(rows[0] == Row{"Clause", "Title", "Parent", "Level", "Text"});
    REQUIRE(rows[1] == Row{"4", "General", "", "1", "General requirements apply."});
    REQUIRE(rows[2] == Row{"4.1", "Scope", "4", "2", "Scope text for the clause."});
    REQUIRE(rows[3] == Row{"4.1.1", "Detail", "4.1", "3", ""});
    REQUIRE(rows[4][0] == "5");
    REQUIRE(rows[4][2].empty());
    REQUIRE(rows[4][3] == "1");
}

TEST_CASE("WriteJsonFile writes a readable document", "[serializer]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const std::string path = dir.filePath("clauses.json").toStdString();

    const auto [ok, msg] = WriteJsonFile(sampleForest(), path);
    REQUIRE(ok);

    QFile in(QString::fromStdString(path));
    REQUIRE(in.open(QIODevice::ReadOnly));
    REQUIRE(QJsonDocument::fromJson(in.readAll()).array().size() == 2);
}

TEST_CASE("WriteJsonFile reports an unwritable path", "[serializer]") {
    const auto [ok, msg] = WriteJsonFile(sampleForest(), "/nonexistent-dir/clauses.json");

    REQUIRE_FALSE(ok);
    REQUIRE_FALSE(msg.empty());
}

TEST_CASE("Column letters follow spreadsheet naming", "[xlsx]") {
    REQUIRE(XlsxWriterMinizip::ColumnLetter(0) == "A");
    REQUIRE(XlsxWriterMinizip::ColumnLetter(4) == "E");
    REQUIRE(XlsxWriterMinizip::ColumnLetter(25) == "Z");
    REQUIRE(XlsxWriterMinizip::ColumnLetter(26) == "AA");
    REQUIRE(XlsxWriterMinizip::ColumnLetter(51) == "AZ");
    REQUIRE(XlsxWriterMinizip::ColumnLetter(52) == "BA");
}

TEST_CASE("Sheet XML escapes text and leaves empty cells bare", "[xlsx]") {
    const std::string xml = XlsxWriterMinizip::BuildSheetXml({
        {"Clause", "Parent"},
        {"4.1", ""},
        {"a < b & c", "line\nbreak"},
    });

    REQUIRE(xml.find("<c r=\"A1\" t=\"inlineStr\"><is><t xml:space=\"preserve\">Clause</t></is></c>") !=
            std::string::npos);
    REQUIRE(xml.find("<c r=\"B2\"/>") != std::string::npos);
    REQUIRE(xml.find("a &lt; b &amp; c") != std::string::npos);
    REQUIRE(xml.find("line&#10;break") != std::string::npos);
    REQUIRE(xml.find("<row r=\"3\">") != std::string::npos);
}

TEST_CASE("Workbook bytes form a zip archive", "[xlsx]") {
    const auto [ok, msg, bytes] = XlsxWriterMinizip::WriteBytes(ToRows(sampleForest()));

    REQUIRE(ok);
    REQUIRE(bytes.size() > 4);
    REQUIRE(bytes[0] == 'P');
    REQUIRE(bytes[1] == 'K');
}

TEST_CASE("Workbook is written to disk", "[xlsx]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("clauses.xlsx");

    const auto [ok, msg] = XlsxWriterMinizip::Write(ToRows(sampleForest()), path.toStdString());

    REQUIRE(ok);
    REQUIRE(QFile::exists(path));
    REQUIRE(QFile(path).size() > 0);
}
