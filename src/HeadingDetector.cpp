#include "HeadingDetector.hpp"
#include "ClauseLogging.hpp"

#include <boost/regex.hpp>

#include <algorithm>

namespace clausetree {
    namespace {
        const boost::regex &headingPattern() {
            static const boost::regex re(R"(^(\d+(?:\.\d+)*)(?:\s+(.*\S))?$)");
            return re;
        }

        std::string stripLeadingZeros(const std::string &digits) {
            const size_t first = digits.find_first_not_of('0');
            return first == std::string::npos ? std::string("0") : digits.substr(first);
        }

        // Compares digit strings as integers without converting them.
        int compareNumeric(const std::string &a, const std::string &b) {
            const std::string x = stripLeadingZeros(a);
            const std::string y = stripLeadingZeros(b);
            if (x.size() != y.size())
                return x.size() < y.size() ? -1 : 1;
            return x.compare(y);
        }
    } // namespace

    std::vector<std::string> ParseIdentifier(const std::string &identifier) {
        std::vector<std::string> segments;
        size_t start = 0;
        while (true) {
            const size_t dot = identifier.find('.', start);
            segments.push_back(identifier.substr(start, dot - start));
            if (dot == std::string::npos)
                break;
            start = dot + 1;
        }
        return segments;
    }

    int CompareIdentifiers(const std::string &a, const std::string &b) {
        const auto lhs = ParseIdentifier(a);
        const auto rhs = ParseIdentifier(b);

        const size_t n = std::min(lhs.size(), rhs.size());
        for (size_t i = 0; i < n; ++i) {
            if (const int c = compareNumeric(lhs[i], rhs[i]); c != 0)
                return c < 0 ? -1 : 1;
        }
        if (lhs.size() == rhs.size())
            return 0;
        return lhs.size() < rhs.size() ? -1 : 1;
    }

    std::string ParentIdentifier(const std::string &identifier) {
        const size_t dot = identifier.rfind('.');
        return dot == std::string::npos ? std::string() : identifier.substr(0, dot);
    }

    bool MatchHeadingNumber(const std::string &text, std::string *identifier, std::string *title) {
        boost::smatch m;
        if (!boost::regex_match(text, m, headingPattern()))
            return false;

        if (identifier)
            *identifier = m[1].str();
        if (title)
            *title = m[2].matched ? TrimCopy(m[2].str()) : std::string();
        return true;
    }

    bool IsProminent(const Line &line, const ParserConfig &config) {
        return line.maxFontSize() >= config.headingMinFontSize &&
               line.boldRatio() >= config.headingMinBoldRatio;
    }

    std::vector<Heading> FindHeadings(const std::vector<Line> &lines,
                                      const ParserConfig &config) {
        std::vector<Heading> headings;
        LineCursor cursor(lines);

        while (!cursor.atEnd()) {
            const Line &line = cursor.peek();
            const std::string text = line.cleanedText();

            std::string identifier;
            std::string title;
            if (text.empty() || !MatchHeadingNumber(text, &identifier, &title) ||
                !IsProminent(line, config)) {
                cursor.advance();
                continue;
            }

            size_t consumed = 1;
            if (title.empty()) {
                std::vector<std::string> parts;
                while (cursor.hasAhead(consumed)) {
                    const Line &candidate = cursor.peek(consumed);
                    const std::string candidateText = candidate.cleanedText();

                    if (candidateText.empty()) {
                        ++consumed;
                        continue;
                    }
                    if (!IsProminent(candidate, config) || MatchHeadingNumber(candidateText))
                        break;

                    parts.push_back(candidateText);
                    ++consumed;
                }

                for (const auto &part: parts) {
                    if (!title.empty())
                        title.push_back(' ');
                    title += part;
                }
                title = TrimCopy(title);
            }

            if (title.empty() && identifier.find('.') == std::string::npos) {
                // bare number without a title: page number or similar
                qCDebug(lcTree) << "Discarding untitled top-level number"
                                << identifier.c_str() << "at line" << cursor.position();
                cursor.advance(consumed);
                continue;
            }

            headings.push_back(Heading{identifier, title, cursor.position(), consumed});
            cursor.advance(consumed);
        }

        qCDebug(lcTree) << "Detected" << headings.size() << "heading(s) in" << lines.size() << "line(s)";
        return headings;
    }
} // namespace clausetree
