#include "ClausePipeline.hpp"
#include "ClauseErrors.hpp"
#include "ClauseLogging.hpp"
#include "HeadingDetector.hpp"
#include "LineAssembler.hpp"
#include "PdfiumHelper.hpp"

#include <algorithm>
#include <filesystem>
#include <utility>

namespace clausetree {
    namespace {
        Fragment toFragment(const pdfium::TextRun &run, const int pageNumber, const double pageHeight) {
            Fragment fragment;
            fragment.page = pageNumber;
            fragment.top = std::max(pageHeight - run.y1, 0.0);
            fragment.left = run.x0;
            fragment.width = std::max(run.x1 - run.x0, 0.0);
            fragment.text = run.text;
            fragment.fontSize = run.fontSize;
            fragment.bold = run.totalWeight > 0 &&
                            static_cast<double>(run.boldWeight) / run.totalWeight >= 0.5;
            return fragment;
        }

        ErrorKind kindForPdfiumError(const unsigned long code) {
            switch (code) {
                case FPDF_ERR_PASSWORD:
                case FPDF_ERR_SECURITY:
                    return ErrorKind::PermissionDenied;
                default:
                    return ErrorKind::MalformedInput;
            }
        }
    } // namespace

    std::vector<Fragment> ExtractFragments(const std::string &pdfPath,
                                           const PageProgress &progress,
                                           const std::atomic<bool> *cancelFlag) {
        // pdfPath is UTF-8 on every platform
        std::error_code ec;
        if (!std::filesystem::is_regular_file(std::filesystem::u8path(pdfPath), ec))
            throw ExtractionError(ErrorKind::NotFound, "PDF not found: " + pdfPath);

        std::vector<pdfium::PageRuns> pages;
        try {
            pages = pdfium::ExtractTextRuns(pdfPath, progress, cancelFlag);
        } catch (const pdfium::LoadError &ex) {
            qCWarning(lcPdf) << "pdfium rejected" << pdfPath.c_str() << "code" << ex.code();
            if (ex.code() == FPDF_ERR_FILE)
                throw ExtractionError(ErrorKind::MalformedInput, "Failed to read PDF file: " + pdfPath);
            throw ExtractionError(kindForPdfiumError(ex.code()), ex.what());
        }

        if (cancelFlag && cancelFlag->load(std::memory_order_relaxed))
            throw ExtractionCancelled();

        std::vector<Fragment> fragments;
        for (const auto &page: pages) {
            for (const auto &run: page.runs)
                fragments.push_back(toFragment(run, page.pageIndex + 1, page.height));
        }

        qCDebug(lcPdf) << "Read" << fragments.size() << "text run(s) from" << pages.size() << "page(s)";
        return fragments;
    }

    ClauseForest BuildClauseForest(std::vector<Fragment> fragments,
                                   const ParserConfig &config) {
        const std::vector<Line> lines = AssembleLines(std::move(fragments), config);
        if (lines.empty())
            throw ExtractionError(ErrorKind::EmptyExtraction, "No text extracted from PDF.");

        const std::vector<Heading> headings = FindHeadings(lines, config);
        ClauseForest forest = BuildClauseTree(lines, headings, config);
        if (forest.empty())
            throw ExtractionError(ErrorKind::NoStructureDetected, "No clauses were detected in the document.");

        qCInfo(lcPipeline) << "Recovered" << forest.size() << "clause(s) from" << lines.size() << "line(s)";
        return forest;
    }

    ClauseForest ExtractClauses(const std::string &pdfPath,
                                const ParserConfig &config,
                                const PageProgress &progress,
                                const std::atomic<bool> *cancelFlag) {
        qCDebug(lcPipeline) << "Extracting clauses from" << pdfPath.c_str();
        return BuildClauseForest(ExtractFragments(pdfPath, progress, cancelFlag), config);
    }
} // namespace clausetree
