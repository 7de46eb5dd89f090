#include "LineAssembler.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace clausetree {
    bool IsLinkAnnotation(const std::string &text) {
        static const std::string prefix = "link to page";

        const std::string trimmed = TrimCopy(text);
        if (trimmed.size() < prefix.size())
            return false;

        return std::equal(prefix.begin(), prefix.end(), trimmed.begin(),
                          [](const char a, const char b) {
                              return a == std::tolower(static_cast<unsigned char>(b));
                          });
    }

    std::vector<Line> AssembleLines(std::vector<Fragment> fragments,
                                    const ParserConfig &config) {
        fragments.erase(std::remove_if(fragments.begin(), fragments.end(),
                                       [](const Fragment &f) {
                                           return TrimCopy(f.text).empty() || IsLinkAnnotation(f.text);
                                       }),
                        fragments.end());

        std::stable_sort(fragments.begin(), fragments.end(),
                         [](const Fragment &a, const Fragment &b) {
                             if (a.page != b.page) return a.page < b.page;
                             if (a.top != b.top) return a.top < b.top;
                             return a.left < b.left;
                         });

        std::vector<Line> lines;
        std::vector<Fragment> pending;

        auto flush = [&]() {
            if (pending.empty())
                return;
            const int page = pending.front().page;
            const double top = pending.front().top;
            lines.emplace_back(page, top, std::move(pending), config.fragmentMergeGap);
            pending.clear();
        };

        for (auto &fragment: fragments) {
            if (!pending.empty() &&
                (pending.front().page != fragment.page || pending.front().top != fragment.top)) {
                flush();
            }
            pending.push_back(std::move(fragment));
        }
        flush();

        return lines;
    }
} // namespace clausetree
