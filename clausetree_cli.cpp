#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QLoggingCategory>

#include <exception>
#include <iostream>
#include <string>

#include "ClauseErrors.hpp"
#include "ClausePipeline.hpp"
#include "ClauseSerializer.hpp"
#include "ParserConfig.hpp"
#include "XlsxWriterMinizip.hpp"

namespace {
    constexpr int EXIT_OK = 0;
    constexpr int EXIT_FAILED = 1;

    void printProgress(int pageIndex, int pageCount, int percent, const std::string &bar) {
        std::cerr << "\r" << bar << " " << percent << "% (" << pageIndex + 1 << "/" << pageCount << ")";
        if (pageIndex + 1 >= pageCount)
            std::cerr << std::endl;
    }
} // namespace

int main(int argc, char *argv[]) {
    QCoreApplication app(argc, argv);
    QCoreApplication::setOrganizationName("ClauseTree");
    QCoreApplication::setApplicationName("clausetree-cli");
    QCoreApplication::setApplicationVersion(CLAUSETREE_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription("Recovers the numbered clause tree of a standards PDF "
        "and writes it as clauses.json and clauses.xlsx.");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("pdf", "Input PDF document.");

    const QCommandLineOption outputDirOption(QStringList{"o", "output-dir"},
                                             "Directory for clauses.json and clauses.xlsx.",
                                             "dir", "output");
    const QCommandLineOption configOption(QStringList{"c", "config"},
                                          "Parser config INI file.", "ini");
    const QCommandLineOption verboseOption(QStringList{"v", "verbose"},
                                           "Log pipeline decisions.");
    parser.addOption(outputDirOption);
    parser.addOption(configOption);
    parser.addOption(verboseOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        std::cerr << "Expected exactly one PDF path." << std::endl;
        parser.showHelp(EXIT_FAILED);
    }

    if (!parser.isSet(verboseOption))
        QLoggingCategory::setFilterRules("clausetree.*.debug=false\nclausetree.*.info=false");

    clausetree::ParserConfig config = clausetree::DefaultParserConfig();
    if (parser.isSet(configOption)) {
        try {
            config = clausetree::LoadParserConfig(parser.value(configOption).toStdString());
        } catch (const std::exception &ex) {
            std::cerr << "Config error: " << ex.what() << std::endl;
            return EXIT_FAILED;
        }
    }

    const std::string pdfPath = positional.first().toStdString();
    const QString outDir = parser.value(outputDirOption);
    if (!QDir().mkpath(outDir)) {
        std::cerr << "Cannot create output directory: " << outDir.toStdString() << std::endl;
        return EXIT_FAILED;
    }

    clausetree::ClauseForest forest;
    try {
        forest = clausetree::ExtractClauses(pdfPath, config, printProgress);
    } catch (const clausetree::ExtractionError &ex) {
        std::cerr << clausetree::ErrorKindName(ex.kind()) << ": " << ex.what() << std::endl;
        return EXIT_FAILED;
    } catch (const std::exception &ex) {
        std::cerr << "Error: " << ex.what() << std::endl;
        return EXIT_FAILED;
    }

    const QDir dir(outDir);
    const std::string jsonPath = dir.filePath("clauses.json").toStdString();
    const std::string xlsxPath = dir.filePath("clauses.xlsx").toStdString();

    if (const auto [ok, msg] = clausetree::WriteJsonFile(forest, jsonPath); !ok) {
        std::cerr << msg << std::endl;
        return EXIT_FAILED;
    }
    std::cout << "Wrote JSON: " << jsonPath << std::endl;

    if (const auto [ok, msg] = XlsxWriterMinizip::Write(clausetree::ToRows(forest), xlsxPath); !ok) {
        std::cerr << msg << std::endl;
        return EXIT_FAILED;
    }
    std::cout << "Wrote Excel: " << xlsxPath << std::endl;

    return EXIT_OK;
}
