#include "NoiseFilter.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace clausetree {
    namespace {
        // UTF-8 bullet and en dash.
        const char *const FRAGMENT_EXEMPT_PREFIXES[] = {
            "\xE2\x80\xA2", "\xE2\x80\x93", "-", "(", ")"
        };

        constexpr auto SENTENCE_PUNCTUATION = ".,;:!?";

        bool startsWith(const std::string &s, const std::string &prefix) {
            return s.compare(0, prefix.size(), prefix) == 0;
        }
    } // namespace

    NoiseFilter::NoiseFilter(const ParserConfig &config)
        : minWords_(config.fragmentMinWords), maxWords_(config.fragmentMaxWords) {
        patterns_.reserve(config.boilerplatePatterns.size());
        for (const auto &pattern: config.boilerplatePatterns) {
            try {
                patterns_.emplace_back(pattern, boost::regex::perl | boost::regex::icase);
            } catch (const boost::regex_error &ex) {
                throw std::invalid_argument("Invalid boilerplate pattern '" + pattern + "': " + ex.what());
            }
        }
    }

    bool NoiseFilter::isTocLeader(const std::string &text) {
        if (text.find("...") == std::string::npos)
            return false;

        const std::vector<std::string> words = SplitWords(text);
        if (words.empty())
            return false;

        const std::string &last = words.back();
        return std::all_of(last.begin(), last.end(),
                           [](const char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
    }

    bool NoiseFilter::ShouldSkip(const std::string &text) const {
        const std::string stripped = TrimCopy(text);
        if (stripped.empty())
            return false;

        if (isTocLeader(stripped))
            return true;
        if (stripped.find("--```") != std::string::npos)
            return true;

        return std::any_of(patterns_.begin(), patterns_.end(),
                           [&stripped](const boost::regex &re) { return boost::regex_search(stripped, re); });
    }

    bool NoiseFilter::LooksLikeFragment(const Line &line, const std::string &text) const {
        if (text.empty())
            return false;
        if (line.boldRatio() > 0.0)
            return false;

        for (const char *prefix: FRAGMENT_EXEMPT_PREFIXES) {
            if (startsWith(text, prefix))
                return false;
        }

        if (text.find_first_of(SENTENCE_PUNCTUATION) != std::string::npos)
            return false;

        const auto words = static_cast<int>(SplitWords(text).size());
        return words >= minWords_ && words <= maxWords_;
    }
} // namespace clausetree
