#pragma once

#include "ParserConfig.hpp"
#include "TextLine.hpp"

#include <vector>

namespace clausetree {
    // True for fragments the layout engine emits for internal link
    // annotations ("Link to page 12").
    bool IsLinkAnnotation(const std::string &text);

    // Groups fragments sharing (page, top) into lines ordered by
    // (page, top, left). Empty fragments and link annotations are dropped.
    std::vector<Line> AssembleLines(std::vector<Fragment> fragments,
                                    const ParserConfig &config);
} // namespace clausetree
