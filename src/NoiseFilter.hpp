#pragma once

#include "ParserConfig.hpp"
#include "TextLine.hpp"

#include <boost/regex.hpp>

#include <string>
#include <vector>

namespace clausetree {
    // Drops page furniture and layout debris from clause bodies.
    // Patterns are compiled once; afterwards the filter holds no mutable
    // state and may be shared read-only between documents.
    class NoiseFilter {
    public:
        explicit NoiseFilter(const ParserConfig &config);

        // Boilerplate: TOC leader lines, separator runs, configured patterns.
        [[nodiscard]] bool ShouldSkip(const std::string &text) const;

        // Short, unpunctuated, non-bold remnants such as stray running heads.
        [[nodiscard]] bool LooksLikeFragment(const Line &line, const std::string &text) const;

    private:
        static bool isTocLeader(const std::string &text);

        std::vector<boost::regex> patterns_;
        int minWords_;
        int maxWords_;
    };
} // namespace clausetree
