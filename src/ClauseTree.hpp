#pragma once

#include "HeadingDetector.hpp"
#include "ParserConfig.hpp"
#include "TextLine.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace clausetree {
    struct Clause {
        std::string identifier;
        std::string title;
        // "" entries mark forced paragraph breaks.
        std::vector<std::string> bodyLines;
        // Indices into the owning forest, in discovery order.
        std::vector<std::size_t> children;
    };

    // Arena of clauses. Each node is owned by exactly one parent (or the root
    // list) through index lists; there are no back references.
    class ClauseForest {
    public:
        using Index = std::size_t;

        // Returns false (and changes nothing) when the identifier exists.
        bool add(const std::string &identifier, const std::string &title, Index *created = nullptr);

        void attachChild(Index parent, Index child);

        void attachRoot(Index index);

        void appendBodyLine(Index index, std::string line);

        [[nodiscard]] bool contains(const std::string &identifier) const;

        // Index of the clause or npos.
        [[nodiscard]] Index find(const std::string &identifier) const;

        [[nodiscard]] const Clause &at(Index index) const { return nodes_.at(index); }

        [[nodiscard]] const std::vector<Index> &roots() const noexcept { return roots_; }

        [[nodiscard]] std::size_t size() const noexcept { return nodes_.size(); }

        [[nodiscard]] bool empty() const noexcept { return roots_.empty(); }

        // Keeps well-formed roots and orders them by numeric identifier.
        void finalizeRoots();

        static constexpr Index npos = static_cast<Index>(-1);

    private:
        std::vector<Clause> nodes_;
        std::unordered_map<std::string, Index> byId_;
        std::vector<Index> roots_;
    };

    ClauseForest BuildClauseTree(const std::vector<Line> &lines,
                                 const std::vector<Heading> &headings,
                                 const ParserConfig &config);
} // namespace clausetree
