#include "TextLine.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace clausetree {
    namespace {
        bool isSpace(const char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        // Code points, not bytes: continuation bytes are not counted.
        size_t utf8Length(const std::string &s) {
            return static_cast<size_t>(std::count_if(s.begin(), s.end(), [](const char c) {
                return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
            }));
        }
    } // namespace

    std::string TrimCopy(const std::string &s) {
        size_t start = 0;
        size_t end = s.size();

        while (start < end && isSpace(s[start]))
            ++start;
        while (end > start && isSpace(s[end - 1]))
            --end;

        return s.substr(start, end - start);
    }

    std::string CollapseWhitespace(const std::string &s) {
        std::string out;
        out.reserve(s.size());

        bool pendingSpace = false;
        for (const char c: s) {
            if (isSpace(c)) {
                pendingSpace = !out.empty();
                continue;
            }
            if (pendingSpace) {
                out.push_back(' ');
                pendingSpace = false;
            }
            out.push_back(c);
        }
        return out;
    }

    std::vector<std::string> SplitWords(const std::string &s) {
        std::vector<std::string> words;
        std::string current;
        for (const char c: s) {
            if (isSpace(c)) {
                if (!current.empty())
                    words.push_back(std::move(current));
                current.clear();
            } else {
                current.push_back(c);
            }
        }
        if (!current.empty())
            words.push_back(std::move(current));
        return words;
    }

    Line::Line(const int page, const double top, std::vector<Fragment> fragments,
               const double mergeGap)
        : page_(page), top_(top), mergeGap_(mergeGap), fragments_(std::move(fragments)) {
        std::stable_sort(fragments_.begin(), fragments_.end(),
                         [](const Fragment &a, const Fragment &b) { return a.left < b.left; });
    }

    double Line::left() const noexcept {
        return fragments_.empty() ? 0.0 : fragments_.front().left;
    }

    std::string Line::text() const {
        std::string out;
        bool haveRight = false;
        double lastRight = 0.0;

        for (const auto &fragment: fragments_) {
            if (fragment.text.empty())
                continue;
            if (haveRight && fragment.left - lastRight > mergeGap_)
                out.push_back(' ');
            out += fragment.text;
            lastRight = fragment.left + fragment.width;
            haveRight = true;
        }
        return out;
    }

    std::string Line::cleanedText() const {
        return CollapseWhitespace(text());
    }

    double Line::maxFontSize() const noexcept {
        double size = 0.0;
        for (const auto &fragment: fragments_)
            size = std::max(size, fragment.fontSize);
        return size;
    }

    double Line::boldRatio() const {
        size_t total = 0;
        size_t bold = 0;
        for (const auto &fragment: fragments_) {
            const size_t n = utf8Length(TrimCopy(fragment.text));
            total += n;
            if (fragment.bold)
                bold += n;
        }
        if (total == 0)
            return 0.0;
        return static_cast<double>(bold) / static_cast<double>(total);
    }
} // namespace clausetree
