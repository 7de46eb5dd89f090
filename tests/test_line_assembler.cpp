#include <catch2/catch.hpp>

#include "LineAssembler.hpp"
#include "ParserConfig.hpp"
#include "TestSupport.hpp"

#include <vector>

using namespace clausetree;
using namespace clausetree::test;

TEST_CASE("AssembleLines groups fragments sharing page and top", "[lines]") {
    std::vector<Fragment> fragments = {
        MakeFragment(1, 100.0, 50.0, "world"),
        MakeFragment(1, 100.0, 10.0, "Hello"),
        MakeFragment(1, 120.0, 10.0, "Next line."),
    };

    const auto lines = AssembleLines(fragments, DefaultParserConfig());

    REQUIRE(lines.size() == 2);
    REQUIRE(lines[0].fragments().size() == 2);
    REQUIRE(lines[0].text() == "Hello world");
    REQUIRE(lines[0].left() == Approx(10.0));
    REQUIRE(lines[1].text() == "Next line.");
}

TEST_CASE("Touching fragments are joined without a space", "[lines]") {
    Fragment exam = MakeFragment(1, 100.0, 10.0, "exam");
    exam.width = 20.0;
    const Fragment ple = MakeFragment(1, 100.0, 31.0, "ple");

    const auto lines = AssembleLines({exam, ple}, DefaultParserConfig());

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].text() == "example");
}

TEST_CASE("Lines are ordered by page, then top, then left", "[lines]") {
    const auto lines = AssembleLines({
                                         MakeFragment(2, 10.0, 72.0, "third"),
                                         MakeFragment(1, 50.0, 72.0, "second"),
                                         MakeFragment(1, 20.0, 72.0, "first"),
                                     }, DefaultParserConfig());

    REQUIRE(lines.size() == 3);
    REQUIRE(lines[0].text() == "first");
    REQUIRE(lines[1].text() == "second");
    REQUIRE(lines[2].text() == "third");
    REQUIRE(lines[2].page() == 2);
}

TEST_CASE("Empty fragments and link annotations are dropped", "[lines]") {
    REQUIRE(IsLinkAnnotation("Link to page 12"));
    REQUIRE(IsLinkAnnotation("  LINK TO PAGE 3"));
    REQUIRE_FALSE(IsLinkAnnotation("Linked clauses"));

    const auto lines = AssembleLines({
                                         MakeFragment(1, 10.0, 72.0, "   "),
                                         MakeFragment(1, 20.0, 72.0, "Link to page 4"),
                                         MakeFragment(1, 30.0, 72.0, "Kept text."),
                                     }, DefaultParserConfig());

    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0].text() == "Kept text.");
}

TEST_CASE("No fragments yield no lines", "[lines]") {
    REQUIRE(AssembleLines({}, DefaultParserConfig()).empty());
}

TEST_CASE("Line metrics are derived from the fragments", "[lines]") {
    const Line line(1, 100.0, {
                        MakeFragment(1, 100.0, 10.0, "ABCD", 16.0, true),
                        MakeFragment(1, 100.0, 80.0, "EF", 11.0, false),
                    });

    REQUIRE(line.maxFontSize() == Approx(16.0));
    REQUIRE(line.boldRatio() == Approx(4.0 / 6.0));
}

TEST_CASE("Bold ratio ignores surrounding whitespace", "[lines]") {
    const Line line(1, 100.0, {
                        MakeFragment(1, 100.0, 10.0, "AB  ", BODY_SIZE, true),
                        MakeFragment(1, 100.0, 80.0, "  CD", BODY_SIZE, false),
                    });

    REQUIRE(line.boldRatio() == Approx(0.5));
    REQUIRE(line.cleanedText() == "AB CD");
}

TEST_CASE("Whitespace helpers", "[lines]") {
    REQUIRE(TrimCopy("  a b \t") == "a b");
    REQUIRE(CollapseWhitespace("  a \t b\n c  ") == "a b c");
    REQUIRE(SplitWords(" one  two\tthree ") == std::vector<std::string>{"one", "two", "three"});
    REQUIRE(SplitWords("   ").empty());
}
