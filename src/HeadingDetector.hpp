#pragma once

#include "ParserConfig.hpp"
#include "TextLine.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace clausetree {
    struct Heading {
        std::string identifier;
        std::string title;
        std::size_t startLineIndex = 0;
        std::size_t lineSpan = 1;
    };

    // ------------------------- Dotted identifiers -------------------------

    std::vector<std::string> ParseIdentifier(const std::string &identifier);

    // Numeric per segment: "4.2" < "4.10" < "5". A prefix orders first.
    // Returns <0, 0 or >0.
    int CompareIdentifiers(const std::string &a, const std::string &b);

    // "4.2.1" -> "4.2"; empty for a top-level identifier.
    std::string ParentIdentifier(const std::string &identifier);


    // Full match of "<digits>(.<digits>)*" optionally followed by whitespace
    // and a remainder. On success fills identifier and (possibly empty) title.
    bool MatchHeadingNumber(const std::string &text,
                            std::string *identifier = nullptr,
                            std::string *title = nullptr);

    // --------------------------- Line cursor ------------------------------

    // Read position over the line sequence. Lookahead goes through peek();
    // the position only moves on advance().
    class LineCursor {
    public:
        explicit LineCursor(const std::vector<Line> &lines) : lines_(lines) {
        }

        [[nodiscard]] std::size_t position() const noexcept { return pos_; }

        [[nodiscard]] bool atEnd() const noexcept { return pos_ >= lines_.size(); }

        [[nodiscard]] bool hasAhead(const std::size_t offset) const noexcept {
            return pos_ + offset < lines_.size();
        }

        [[nodiscard]] const Line &peek(const std::size_t offset = 0) const {
            return lines_.at(pos_ + offset);
        }

        void advance(const std::size_t count = 1) noexcept { pos_ += count; }

    private:
        const std::vector<Line> &lines_;
        std::size_t pos_ = 0;
    };

    // ------------------------- Heading detection --------------------------

    [[nodiscard]] bool IsProminent(const Line &line, const ParserConfig &config);

    // Scans the unfiltered line sequence for numbered headings, including
    // titles continued on following prominent lines.
    std::vector<Heading> FindHeadings(const std::vector<Line> &lines,
                                      const ParserConfig &config);
} // namespace clausetree
