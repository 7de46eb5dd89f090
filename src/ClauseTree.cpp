#include "ClauseTree.hpp"
#include "ClauseLogging.hpp"
#include "NoiseFilter.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace clausetree {
    bool ClauseForest::add(const std::string &identifier, const std::string &title, Index *created) {
        if (byId_.count(identifier) != 0)
            return false;

        const Index index = nodes_.size();
        nodes_.push_back(Clause{identifier, title, {}, {}});
        byId_.emplace(identifier, index);
        if (created)
            *created = index;
        return true;
    }

    void ClauseForest::attachChild(const Index parent, const Index child) {
        nodes_.at(parent).children.push_back(child);
    }

    void ClauseForest::attachRoot(const Index index) {
        roots_.push_back(index);
    }

    void ClauseForest::appendBodyLine(const Index index, std::string line) {
        nodes_.at(index).bodyLines.push_back(std::move(line));
    }

    bool ClauseForest::contains(const std::string &identifier) const {
        return byId_.count(identifier) != 0;
    }

    ClauseForest::Index ClauseForest::find(const std::string &identifier) const {
        const auto it = byId_.find(identifier);
        return it == byId_.end() ? npos : it->second;
    }

    void ClauseForest::finalizeRoots() {
        std::vector<Index> kept;
        kept.reserve(roots_.size());

        for (const Index index: roots_) {
            const std::string &id = nodes_[index].identifier;
            const auto dots = std::count(id.begin(), id.end(), '.');
            if (dots == 0 || dots == static_cast<std::ptrdiff_t>(ParseIdentifier(id).size()) - 1)
                kept.push_back(index);
        }

        std::stable_sort(kept.begin(), kept.end(), [this](const Index a, const Index b) {
            return CompareIdentifiers(nodes_[a].identifier, nodes_[b].identifier) < 0;
        });
        roots_ = std::move(kept);
    }

    ClauseForest BuildClauseTree(const std::vector<Line> &lines,
                                 const std::vector<Heading> &headings,
                                 const ParserConfig &config) {
        const NoiseFilter filter(config);
        ClauseForest forest;

        for (size_t h = 0; h < headings.size(); ++h) {
            const Heading &heading = headings[h];

            ClauseForest::Index index = ClauseForest::npos;
            if (!forest.add(heading.identifier, heading.title, &index)) {
                qCDebug(lcTree) << "Ignoring duplicate heading" << heading.identifier.c_str()
                                << "at line" << heading.startLineIndex;
                continue;
            }

            if (const std::string parentId = ParentIdentifier(heading.identifier); parentId.empty()) {
                forest.attachRoot(index);
            } else if (const auto parent = forest.find(parentId); parent != ClauseForest::npos) {
                forest.attachChild(parent, index);
            } else {
                // TODO: review with product owner whether orphans should be
                // attached to the nearest detected ancestor instead.
                qCDebug(lcTree) << "Parent" << parentId.c_str() << "not detected; promoting"
                                << heading.identifier.c_str() << "to root";
                forest.attachRoot(index);
            }

            const size_t start = heading.startLineIndex + heading.lineSpan;
            const size_t end = h + 1 < headings.size() ? headings[h + 1].startLineIndex : lines.size();

            bool havePrevious = false;
            int previousPage = 0;
            double previousTop = 0.0;

            for (size_t i = start; i < end && i < lines.size(); ++i) {
                const Line &line = lines[i];
                const std::string text = line.cleanedText();

                if (filter.ShouldSkip(text) || MatchHeadingNumber(text) ||
                    filter.LooksLikeFragment(line, text))
                    continue;

                if (havePrevious &&
                    (line.page() != previousPage || line.top() - previousTop > config.paragraphGap)) {
                    forest.appendBodyLine(index, std::string());
                }
                forest.appendBodyLine(index, text);

                havePrevious = true;
                previousPage = line.page();
                previousTop = line.top();
            }
        }

        forest.finalizeRoots();
        qCDebug(lcTree) << "Built" << forest.size() << "clause(s)," << forest.roots().size() << "root(s)";
        return forest;
    }
} // namespace clausetree
