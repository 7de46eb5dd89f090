#pragma once

#include <string>
#include <vector>

namespace clausetree {
    // Folds body lines into paragraphs separated by a blank line. An empty
    // entry forces a paragraph break; "exam-" followed by "ple" is joined
    // into "example".
    std::string ReconstructText(const std::vector<std::string> &bodyLines);

    // Unicode-aware test of the first code point of a UTF-8 string.
    bool StartsLowerCase(const std::string &utf8);
} // namespace clausetree
