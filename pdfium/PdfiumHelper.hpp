#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// PDFium public headers.
#include "fpdfview.h"
#include "fpdf_text.h"

namespace pdfium {
    // ============================================================
    //  PdfiumLibrary (process-wide RAII + global mutex)
    // ============================================================
    class PdfiumLibrary {
    public:
        PdfiumLibrary(const PdfiumLibrary &) = delete;

        PdfiumLibrary &operator=(const PdfiumLibrary &) = delete;

        static PdfiumLibrary &Instance() {
            static PdfiumLibrary instance;
            return instance;
        }

        std::mutex &Mutex() noexcept { return mutex_; }

    private:
        PdfiumLibrary() {
            FPDF_InitLibrary();
        }

        ~PdfiumLibrary() {
            FPDF_DestroyLibrary();
        }

        std::mutex mutex_;
    };

    // Document could not be opened or may not be read.
    // code() is an FPDF_ERR_* value.
    class LoadError : public std::runtime_error {
    public:
        LoadError(const unsigned long code, const std::string &message)
            : std::runtime_error(message), code_(code) {
        }

        [[nodiscard]] unsigned long code() const noexcept { return code_; }

    private:
        unsigned long code_;
    };

    // "Copy or otherwise extract text and graphics" (PDF 32000, table 22).
    constexpr unsigned long PERMISSION_EXTRACT_TEXT = 1UL << 4;

    // ============================================================
    //  RAII wrappers: Document, Page & TextPage
    // ============================================================
    class Document {
    public:
        Document() = default;

        explicit Document(const std::string &path,
                          const std::string &password = {}) {
            Open(path, password);
        }

        ~Document() {
            Reset();
        }

        Document(const Document &) = delete;

        Document &operator=(const Document &) = delete;

        Document(Document &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Document &operator=(Document &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        void Open(const std::string &path,
                  const std::string &password = {}) {
            Reset();

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadDocument(
                path.c_str(),
                password.empty() ? nullptr : password.c_str());

            if (!handle_) {
                const unsigned long err = FPDF_GetLastError();
                throw LoadError(err, "FPDF_LoadDocument failed, error = " +
                                     std::to_string(err));
            }
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_CloseDocument(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_DOCUMENT Get() const noexcept { return handle_; }

        [[nodiscard]] int GetPageCount() const {
            if (!handle_)
                return 0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageCount(handle_);
        }

        [[nodiscard]] bool AllowsTextExtraction() const {
            if (!handle_)
                return false;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return (FPDF_GetDocPermissions(handle_) & PERMISSION_EXTRACT_TEXT) != 0;
        }

    private:
        FPDF_DOCUMENT handle_ = nullptr;
    };

    class Page {
    public:
        Page() = default;

        Page(FPDF_DOCUMENT doc, const int index) {
            Open(doc, index);
        }

        ~Page() {
            Reset();
        }

        Page(const Page &) = delete;

        Page &operator=(const Page &) = delete;

        Page(Page &&other) noexcept
            : handle_(other.handle_) {
            other.handle_ = nullptr;
        }

        Page &operator=(Page &&other) noexcept {
            if (this != &other) {
                Reset();
                handle_ = other.handle_;
                other.handle_ = nullptr;
            }
            return *this;
        }

        void Open(FPDF_DOCUMENT doc, const int index) {
            Reset();
            if (!doc)
                throw std::runtime_error("Page::Open: null document handle");

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            handle_ = FPDF_LoadPage(doc, index);
            if (!handle_)
                throw LoadError(FPDF_ERR_PAGE, "FPDF_LoadPage failed at index " +
                                               std::to_string(index));
        }

        void Reset() noexcept {
            if (handle_) {
                auto &lib = PdfiumLibrary::Instance();
                std::lock_guard<std::mutex> lock(lib.Mutex());
                FPDF_ClosePage(handle_);
                handle_ = nullptr;
            }
        }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

        [[nodiscard]] FPDF_PAGE Get() const noexcept { return handle_; }

        [[nodiscard]] double Height() const {
            if (!handle_) return 0.0;
            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard<std::mutex> lock(lib.Mutex());
            return FPDF_GetPageHeight(handle_);
        }

    private:
        FPDF_PAGE handle_ = nullptr;
    };

    // Text page handle. Unlike Document and Page it does not lock: create,
    // use and destroy it while holding PdfiumLibrary::Mutex().
    //
    // Pdfium handles must never be declared `const`; they are opaque
    // pointers that Pdfium mutates internally.
    class TextPage {
    public:
        explicit TextPage(FPDF_PAGE page)
            : handle_(page ? FPDFText_LoadPage(page) : nullptr) {
        }

        ~TextPage() {
            if (handle_)
                FPDFText_ClosePage(handle_);
        }

        TextPage(const TextPage &) = delete;

        TextPage &operator=(const TextPage &) = delete;

        [[nodiscard]] FPDF_TEXTPAGE Get() const noexcept { return handle_; }

        [[nodiscard]] bool IsValid() const noexcept { return handle_ != nullptr; }

    private:
        FPDF_TEXTPAGE handle_ = nullptr;
    };

    // ============================================================
    //  Text runs
    // ============================================================

    // One line of text as laid out on the page. Coordinates are PDF user
    // space (bottom-left origin).
    struct TextRun {
        double x0 = 0.0;
        double y0 = 0.0;
        double x1 = 0.0;
        double y1 = 0.0;
        std::string text;
        double fontSize = 0.0;
        int boldWeight = 0;  // non-whitespace chars set in a bold face
        int totalWeight = 0; // non-whitespace chars
    };

    struct PageRuns {
        int pageIndex = 0;
        double height = 0.0;
        std::vector<TextRun> runs;
    };

    namespace detail {
        inline void append_utf8_codepoint(std::string &out, const std::uint32_t cp) {
            if (cp <= 0x7F) {
                out.push_back(static_cast<char>(cp));
            } else if (cp <= 0x7FF) {
                out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else if (cp <= 0xFFFF) {
                out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            } else {
                out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
                out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
            }
        }

        inline bool IsWhitespaceCodepoint(const std::uint32_t cp) {
            return cp == ' ' || cp == '\t' || cp == 0xA0 || cp == 0x2002 ||
                   cp == 0x2003 || cp == 0x2009 || cp == 0x3000;
        }

        // "Helvetica-Bold", "ArialBlack", "Roboto-Heavy"
        inline bool IsBoldFontName(std::string name) {
            std::transform(name.begin(), name.end(), name.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return name.find("bold") != std::string::npos ||
                   name.find("black") != std::string::npos ||
                   name.find("heavy") != std::string::npos;
        }

        inline std::string CharFontName(FPDF_TEXTPAGE textPage, const int index) {
            const unsigned long needed = FPDFText_GetFontInfo(textPage, index, nullptr, 0, nullptr);
            if (needed == 0)
                return {};

            std::string name(needed, '\0');
            FPDFText_GetFontInfo(textPage, index, name.data(), needed, nullptr);
            // |needed| includes terminating NUL
            name.resize(needed - 1);
            return name;
        }

        // Weight 600 and up is semibold or heavier; -1 means unknown.
        inline bool IsBoldChar(FPDF_TEXTPAGE textPage, const int index) {
            return FPDFText_GetFontWeight(textPage, index) >= 600 ||
                   IsBoldFontName(CharFontName(textPage, index));
        }

        // Emoji progress bar:
        // 🟩 = U+1F7E9 = F0 9F 9F A9
        // ⬜ = U+2B1C  = E2 AC 9C
        inline std::string BuildProgressBar(int percent, const int width = 10) {
            if (percent < 0) percent = 0;
            if (percent > 100) percent = 100;

            const int filled = (percent * width) / 100;

            static constexpr auto GREEN = "\xF0\x9F\x9F\xA9";
            static constexpr auto WHITE = "\xE2\xAC\x9C";

            std::string bar;
            bar.reserve(width * 4);

            for (int i = 0; i < filled; ++i)
                bar += GREEN;
            for (int i = filled; i < width; ++i)
                bar += WHITE;

            return bar;
        }

        // Walks the characters of one page and cuts them into runs at line
        // breaks ('\r' / '\n') or where a glyph leaves the run's vertical band.
        inline std::vector<TextRun> ExtractPageRuns(FPDF_PAGE page) {
            std::vector<TextRun> runs;
            if (!page)
                return runs;

            auto &lib = PdfiumLibrary::Instance();
            std::lock_guard lock(lib.Mutex());

            const TextPage textPage(page);
            if (!textPage.IsValid())
                return runs;

            const int nChars = FPDFText_CountChars(textPage.Get());
            if (nChars <= 0)
                return runs;

            TextRun current;
            bool hasBox = false;

            auto flush = [&]() {
                if (hasBox && !current.text.empty())
                    runs.push_back(std::move(current));
                current = TextRun{};
                hasBox = false;
            };

            for (int i = 0; i < nChars; ++i) {
                std::uint32_t cp = FPDFText_GetUnicode(textPage.Get(), i);
                if (cp == '\r' || cp == '\n') {
                    flush();
                    continue;
                }
                if (cp == 0)
                    continue;
                if (cp == 0xA0)
                    cp = ' ';

                double left = 0.0, right = 0.0, bottom = 0.0, top = 0.0;
                const bool boxed = FPDFText_GetCharBox(textPage.Get(), i, &left, &right, &bottom, &top) &&
                                   (right > left || top > bottom);

                if (boxed && hasBox && (bottom > current.y1 || top < current.y0))
                    flush();

                if (boxed) {
                    if (!hasBox) {
                        current.x0 = left;
                        current.x1 = right;
                        current.y0 = bottom;
                        current.y1 = top;
                        hasBox = true;
                    } else {
                        current.x0 = std::min(current.x0, left);
                        current.x1 = std::max(current.x1, right);
                        current.y0 = std::min(current.y0, bottom);
                        current.y1 = std::max(current.y1, top);
                    }
                }

                current.fontSize = std::max(current.fontSize, FPDFText_GetFontSize(textPage.Get(), i));

                if (!IsWhitespaceCodepoint(cp)) {
                    ++current.totalWeight;
                    if (IsBoldChar(textPage.Get(), i))
                        ++current.boldWeight;
                }

                append_utf8_codepoint(current.text, cp);
            }
            flush();

            return runs;
        }
    } // namespace detail

    // ============================================================
    //  High-level extraction API
    // ============================================================

    // Progress callback:
    //   pageIndex  : 0-based page index
    //   pageCount  : total pages
    //   percent    : completion percentage (0..100)
    //   bar        : emoji progress bar (🟩⬜⬜...)
    using ProgressCallback =
    std::function<void(int pageIndex,
                       int pageCount,
                       int percent,
                       const std::string &bar)>;

    // Synchronous extraction of positioned text runs, page by page.
    // Throws LoadError when the file cannot be opened or forbids text
    // extraction. Stops early (returning the pages read so far) when
    // cancelFlag is raised; callers must check the flag.
    inline std::vector<PageRuns> ExtractTextRuns(const std::string &path,
                                                 const ProgressCallback &progress = nullptr,
                                                 const std::atomic<bool> *cancelFlag = nullptr) {
        (void) PdfiumLibrary::Instance();

        const Document doc(path);
        if (!doc.AllowsTextExtraction())
            throw LoadError(FPDF_ERR_SECURITY, "Text extraction is not permitted for this PDF.");

        const int pageCount = doc.GetPageCount();

        std::vector<PageRuns> pages;
        if (pageCount <= 0)
            return pages;
        pages.reserve(static_cast<std::size_t>(pageCount));

        for (int i = 0; i < pageCount; ++i) {
            if (cancelFlag &&
                cancelFlag->load(std::memory_order_relaxed)) {
                break;
            }

            const Page page(doc.Get(), i);

            PageRuns pageRuns;
            pageRuns.pageIndex = i;
            pageRuns.height = page.Height();
            pageRuns.runs = detail::ExtractPageRuns(page.Get());
            pages.push_back(std::move(pageRuns));

            if (progress) {
                const int percent =
                        static_cast<int>((static_cast<double>(i + 1) /
                                          static_cast<double>(pageCount)) * 100.0);
                progress(i, pageCount, percent, detail::BuildProgressBar(percent));
            }
        }

        return pages;
    }
} // namespace pdfium
