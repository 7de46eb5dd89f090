#pragma once

#include "TextLine.hpp"

#include <string>

namespace clausetree::test {
    constexpr double BODY_SIZE = 10.0;
    constexpr double HEADING_SIZE = 16.0;

    // Width is roughly five points per byte, enough to keep neighbouring
    // fragments apart unless a test places them explicitly.
    inline Fragment MakeFragment(const int page, const double top, const double left,
                                 const std::string &text,
                                 const double fontSize = BODY_SIZE, const bool bold = false) {
        Fragment f;
        f.page = page;
        f.top = top;
        f.left = left;
        f.width = 5.0 * static_cast<double>(text.size());
        f.text = text;
        f.fontSize = fontSize;
        f.bold = bold;
        return f;
    }

    inline Fragment BodyFragment(const int page, const double top, const std::string &text) {
        return MakeFragment(page, top, 72.0, text);
    }

    inline Fragment HeadingFragment(const int page, const double top, const std::string &text) {
        return MakeFragment(page, top, 72.0, text, HEADING_SIZE, true);
    }
} // namespace clausetree::test
