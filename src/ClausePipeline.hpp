#pragma once

#include "ClauseTree.hpp"
#include "ParserConfig.hpp"
#include "TextLine.hpp"

#include <atomic>
#include <functional>
#include <string>
#include <vector>

namespace clausetree {
    // pageIndex, pageCount, percent, emoji progress bar
    using PageProgress = std::function<void(int, int, int, const std::string &)>;

    // Lines → headings → clause forest.
    // Throws ExtractionError(EmptyExtraction) when no line survives assembly
    // and ExtractionError(NoStructureDetected) when no clause is found.
    ClauseForest BuildClauseForest(std::vector<Fragment> fragments,
                                   const ParserConfig &config);

    // Reads the PDF through pdfium and runs BuildClauseForest.
    // Throws ExtractionError for NotFound / PermissionDenied / MalformedInput
    // and ExtractionCancelled when cancelFlag was raised.
    ClauseForest ExtractClauses(const std::string &pdfPath,
                                const ParserConfig &config,
                                const PageProgress &progress = nullptr,
                                const std::atomic<bool> *cancelFlag = nullptr);

    // Reads fragments from a PDF without building the tree.
    std::vector<Fragment> ExtractFragments(const std::string &pdfPath,
                                           const PageProgress &progress = nullptr,
                                           const std::atomic<bool> *cancelFlag = nullptr);
} // namespace clausetree
