#include <catch2/catch.hpp>

#include "LineAssembler.hpp"
#include "NoiseFilter.hpp"
#include "ParserConfig.hpp"
#include "TestSupport.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace clausetree;
using namespace clausetree::test;

namespace {
    Line bodyLine(const std::string &text) {
        return Line(1, 100.0, {MakeFragment(1, 100.0, 72.0, text)});
    }

    Line boldLine(const std::string &text) {
        return Line(1, 100.0, {MakeFragment(1, 100.0, 72.0, text, BODY_SIZE, true)});
    }

    std::vector<Line> keptLines(const NoiseFilter &filter, const std::vector<Line> &lines) {
        std::vector<Line> kept;
        for (const Line &line: lines) {
            const std::string text = line.cleanedText();
            if (!filter.ShouldSkip(text) && !filter.LooksLikeFragment(line, text))
                kept.push_back(line);
        }
        return kept;
    }

    std::vector<std::string> textsOf(const std::vector<Line> &lines) {
        std::vector<std::string> texts;
        for (const Line &line: lines)
            texts.push_back(line.cleanedText());
        return texts;
    }
} // namespace

TEST_CASE("Copyright and licensing stamps are skipped", "[noise]") {
    const NoiseFilter filter(DefaultParserConfig());

    REQUIRE(filter.ShouldSkip("Copyright British Standards Institution"));
    REQUIRE(filter.ShouldSkip("COPYRIGHT BRITISH STANDARDS INSTITUTION Provided by"));
    REQUIRE(filter.ShouldSkip("Licensee=Some Company/1234567"));
    REQUIRE(filter.ShouldSkip("Not for Resale, 01/01/2020"));
    REQUIRE(filter.ShouldSkip("BS EN 61513:2013"));
    REQUIRE(filter.ShouldSkip("  Raising standards worldwide"));
}

TEST_CASE("Page banners and separator runs are skipped", "[noise]") {
    const NoiseFilter filter(DefaultParserConfig());

    REQUIRE(filter.ShouldSkip("\xE2\x80\x93 12 \xE2\x80\x93"));
    REQUIRE(filter.ShouldSkip("--```,,,,`,`,``"));
    REQUIRE(filter.ShouldSkip("x--`,,-`-`,,`,,`,`,,`---"));
}

TEST_CASE("Table of contents leaders are skipped", "[noise]") {
    const NoiseFilter filter(DefaultParserConfig());

    REQUIRE(filter.ShouldSkip("4.2 Requirements .................. 12"));
    REQUIRE_FALSE(filter.ShouldSkip("See clause 4... for details"));
}

TEST_CASE("Ordinary text is kept", "[noise]") {
    const NoiseFilter filter(DefaultParserConfig());

    REQUIRE_FALSE(filter.ShouldSkip(""));
    REQUIRE_FALSE(filter.ShouldSkip("The system shall respond within 2 s."));
    REQUIRE_FALSE(filter.ShouldSkip("Refer to BS EN 61513 for details."));
}

TEST_CASE("ShouldSkip is a pure function of its input", "[noise]") {
    const NoiseFilter filter(DefaultParserConfig());

    for (const std::string text: {"Copyright British Standards Institution", "Plain body text."}) {
        const bool first = filter.ShouldSkip(text);
        REQUIRE(filter.ShouldSkip(text) == first);
    }
}

TEST_CASE("Configured patterns replace the defaults", "[noise]") {
    ParserConfig config = DefaultParserConfig();
    config.boilerplatePatterns = {"^draft for comment"};
    const NoiseFilter filter(config);

    REQUIRE(filter.ShouldSkip("DRAFT FOR COMMENT 23/30456789"));
    REQUIRE_FALSE(filter.ShouldSkip("Copyright British Standards Institution"));
}

TEST_CASE("An invalid pattern is rejected at construction", "[noise]") {
    ParserConfig config = DefaultParserConfig();
    config.boilerplatePatterns = {"(unbalanced"};

    REQUIRE_THROWS_AS(NoiseFilter(config), std::invalid_argument);
}

TEST_CASE("Short unpunctuated plain lines look like fragments", "[noise]") {
    const NoiseFilter filter(DefaultParserConfig());

    REQUIRE(filter.LooksLikeFragment(bodyLine("Annex A informative"), "Annex A informative"));
    REQUIRE(filter.LooksLikeFragment(bodyLine("Two words"), "Two words"));
}

TEST_CASE("Sentences, single words, long lines, bold lines and list items are not fragments", "[noise]") {
    const NoiseFilter filter(DefaultParserConfig());

    REQUIRE_FALSE(filter.LooksLikeFragment(bodyLine("This is a sentence."), "This is a sentence."));
    REQUIRE_FALSE(filter.LooksLikeFragment(bodyLine("Single"), "Single"));
    REQUIRE_FALSE(filter.LooksLikeFragment(bodyLine("one two three four five six seven"),
                                           "one two three four five six seven"));
    REQUIRE_FALSE(filter.LooksLikeFragment(boldLine("Annex A informative"), "Annex A informative"));
    REQUIRE_FALSE(filter.LooksLikeFragment(bodyLine("\xE2\x80\xA2 bullet item here"), "\xE2\x80\xA2 bullet item here"));
    REQUIRE_FALSE(filter.LooksLikeFragment(bodyLine("- dash item here"), "- dash item here"));
    REQUIRE_FALSE(filter.LooksLikeFragment(bodyLine("(a) list item"), "(a) list item"));
    REQUIRE_FALSE(filter.LooksLikeFragment(bodyLine(""), ""));
}

TEST_CASE("Filtering a filtered line set keeps every line", "[noise]") {
    const ParserConfig config = DefaultParserConfig();
    const NoiseFilter filter(config);

    const std::vector<Line> lines = AssembleLines({
                                                      HeadingFragment(1, 40.0, "4 General"),
                                                      BodyFragment(1, 60.0, "Copyright British Standards Institution"),
                                                      BodyFragment(1, 80.0, "The system shall respond within 2 s."),
                                                      BodyFragment(1, 100.0, "Annex A informative"),
                                                      BodyFragment(1, 120.0, "4.1 Scope ............ 7"),
                                                      BodyFragment(1, 140.0, "\xE2\x80\xA2 bullet item here"),
                                                      BodyFragment(1, 160.0, "--```,,,,`,`,``"),
                                                      BodyFragment(1, 180.0, "\xE2\x80\x93 12 \xE2\x80\x93"),
                                                      BodyFragment(2, 40.0, "Licensee=Some Company/1234567"),
                                                      BodyFragment(2, 60.0, "Stray running head"),
                                                      BodyFragment(2, 80.0, "Requirements continue on this page."),
                                                  }, config);

    const std::vector<Line> once = keptLines(filter, lines);
    const std::vector<Line> again = keptLines(filter, lines);
    const std::vector<Line> twice = keptLines(filter, once);

    REQUIRE(textsOf(once) == std::vector<std::string>{
                "4 General",
                "The system shall respond within 2 s.",
                "\xE2\x80\xA2 bullet item here",
                "Requirements continue on this page.",
            });
    REQUIRE(textsOf(again) == textsOf(once));
    REQUIRE(textsOf(twice) == textsOf(once));
}
