#include "TextReconstructor.hpp"
#include "TextLine.hpp"

#include <QString>

#include <algorithm>

namespace clausetree {
    namespace {
        std::string joinParagraph(const std::vector<std::string> &buffer) {
            std::string out;
            for (const auto &entry: buffer) {
                if (!out.empty())
                    out.push_back(' ');
                out += entry;
            }
            return TrimCopy(out);
        }
    } // namespace

    bool StartsLowerCase(const std::string &utf8) {
        if (utf8.empty())
            return false;

        // At most one code point is 4 bytes.
        const QString head = QString::fromUtf8(utf8.data(),
                                               static_cast<qsizetype>(std::min<size_t>(utf8.size(), 4)));
        if (head.isEmpty())
            return false;

        const char32_t cp = head.at(0).isHighSurrogate() && head.size() > 1
                                ? QChar::surrogateToUcs4(head.at(0), head.at(1))
                                : head.at(0).unicode();
        return QChar::isLower(cp);
    }

    std::string ReconstructText(const std::vector<std::string> &bodyLines) {
        std::vector<std::string> paragraphs;
        std::vector<std::string> buffer;

        auto flush = [&]() {
            if (buffer.empty())
                return;
            paragraphs.push_back(joinParagraph(buffer));
            buffer.clear();
        };

        for (const auto &line: bodyLines) {
            if (line.empty()) {
                flush();
                continue;
            }

            if (!buffer.empty() && !buffer.back().empty() && buffer.back().back() == '-' &&
                StartsLowerCase(line)) {
                std::string &last = buffer.back();
                last.pop_back();
                last += line;
            } else {
                buffer.push_back(line);
            }
        }
        flush();

        std::string text;
        for (const auto &paragraph: paragraphs) {
            if (paragraph.empty())
                continue;
            if (!text.empty())
                text += "\n\n";
            text += paragraph;
        }
        return text;
    }
} // namespace clausetree
