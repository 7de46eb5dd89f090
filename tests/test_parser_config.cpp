#include <catch2/catch.hpp>

#include "ParserConfig.hpp"

#include <QSettings>
#include <QFile>
#include <QTemporaryDir>

#include <stdexcept>
#include <string>
#include <vector>

using namespace clausetree;

TEST_CASE("Default thresholds", "[config]") {
    const ParserConfig config = DefaultParserConfig();

    REQUIRE(config.fragmentMergeGap == Approx(1.5));
    REQUIRE(config.headingMinFontSize == Approx(14.0));
    REQUIRE(config.headingMinBoldRatio == Approx(0.5));
    REQUIRE(config.paragraphGap == Approx(18.0));
    REQUIRE(config.fragmentMinWords == 2);
    REQUIRE(config.fragmentMaxWords == 6);
    REQUIRE(config.boilerplatePatterns == DefaultBoilerplatePatterns());
    REQUIRE(config.boilerplatePatterns.size() == 11);
}

TEST_CASE("INI values override the defaults", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("parser.ini");
    {
        QSettings out(path, QSettings::IniFormat);
        out.setValue("layout/paragraphGap", 24.0);
        out.setValue("headings/minFontSize", 12.0);
        out.setValue("fragments/maxWords", 4);
        out.beginWriteArray("boilerplate");
        out.setArrayIndex(0);
        out.setValue("pattern", "^draft");
        out.setArrayIndex(1);
        out.setValue("pattern", "^confidential");
        out.endArray();
        out.sync();
        REQUIRE(out.status() == QSettings::NoError);
    }

    const ParserConfig config = LoadParserConfig(path.toStdString());

    REQUIRE(config.paragraphGap == Approx(24.0));
    REQUIRE(config.headingMinFontSize == Approx(12.0));
    REQUIRE(config.fragmentMaxWords == 4);
    REQUIRE(config.fragmentMinWords == 2);
    REQUIRE(config.fragmentMergeGap == Approx(1.5));
    REQUIRE(config.boilerplatePatterns == std::vector<std::string>{"^draft", "^confidential"});
}

TEST_CASE("A missing config file is an error", "[config]") {
    REQUIRE_THROWS_AS(LoadParserConfig("/nonexistent-dir/parser.ini"), std::runtime_error);
}

TEST_CASE("Patterns with commas and backslashes survive the INI file", "[config]") {
    const std::string separatorRun = R"(--[`',.\-]{5,})";
    const std::string pageBanner = R"(^page\s+\d+,\s*\d+)";

    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = dir.filePath("parser.ini");
    {
        QSettings out(path, QSettings::IniFormat);
        out.beginWriteArray("boilerplate");
        out.setArrayIndex(0);
        out.setValue("pattern", QString::fromStdString(separatorRun));
        out.setArrayIndex(1);
        out.setValue("pattern", QString::fromStdString(pageBanner));
        out.endArray();
        out.sync();
        REQUIRE(out.status() == QSettings::NoError);
    }

    const ParserConfig config = LoadParserConfig(path.toStdString());

    REQUIRE(config.boilerplatePatterns == std::vector<std::string>{separatorRun, pageBanner});
}

namespace {
    QString writeIni(const QTemporaryDir &dir, const QByteArray &content) {
        const QString path = dir.filePath("hand_written.ini");
        QFile out(path);
        REQUIRE(out.open(QIODevice::WriteOnly | QIODevice::Truncate));
        out.write(content);
        return path;
    }
} // namespace

TEST_CASE("A quoted hand-written pattern keeps its comma", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = writeIni(dir, "[boilerplate]\n"
                                       "size=1\n"
                                       "1\\pattern=\"^draft, final\"\n");

    const ParserConfig config = LoadParserConfig(path.toStdString());

    REQUIRE(config.boilerplatePatterns == std::vector<std::string>{"^draft, final"});
}

TEST_CASE("An unquoted comma in a pattern is rejected at load time", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = writeIni(dir, "[boilerplate]\n"
                                       "size=1\n"
                                       "1\\pattern=^draft, final\n");

    REQUIRE_THROWS_AS(LoadParserConfig(path.toStdString()), std::runtime_error);
}

TEST_CASE("A pattern that does not compile is rejected at load time", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const QString path = writeIni(dir, "[boilerplate]\n"
                                       "size=1\n"
                                       "1\\pattern=\"(unbalanced\"\n");

    REQUIRE_THROWS_AS(LoadParserConfig(path.toStdString()), std::runtime_error);
}
