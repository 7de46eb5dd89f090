#pragma once

#include <string>
#include <vector>

namespace clausetree {
    // One run of positioned text. `top` is measured from the page's top edge.
    struct Fragment {
        int page = 0;
        double top = 0.0;
        double left = 0.0;
        double width = 0.0;
        std::string text;
        double fontSize = 0.0;
        bool bold = false;
    };

    // Fragments sharing one page and vertical position. Every derived value is
    // recomputed from the fragments; a Line is never mutated after assembly.
    class Line {
    public:
        Line(int page, double top, std::vector<Fragment> fragments,
             double mergeGap = 1.5);

        [[nodiscard]] int page() const noexcept { return page_; }

        [[nodiscard]] double top() const noexcept { return top_; }

        [[nodiscard]] const std::vector<Fragment> &fragments() const noexcept { return fragments_; }

        [[nodiscard]] double left() const noexcept;

        // Fragments left to right, a space wherever the gap exceeds mergeGap.
        [[nodiscard]] std::string text() const;

        // text() with whitespace runs collapsed and trimmed.
        [[nodiscard]] std::string cleanedText() const;

        [[nodiscard]] double maxFontSize() const noexcept;

        [[nodiscard]] double boldRatio() const;

    private:
        int page_;
        double top_;
        double mergeGap_;
        std::vector<Fragment> fragments_;
    };

    std::string TrimCopy(const std::string &s);

    // Collapses every whitespace run to a single space and trims.
    std::string CollapseWhitespace(const std::string &s);

    std::vector<std::string> SplitWords(const std::string &s);
} // namespace clausetree
