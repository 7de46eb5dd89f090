#pragma once

#include "ClauseTree.hpp"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>

#include <string>
#include <vector>

namespace clausetree {
    using Row = std::vector<std::string>;

    struct WriteResult {
        bool success;
        std::string message;
    };

    // {clause, title, text, subclauses?}; subclauses only when non-empty.
    QJsonObject ClauseToJson(const ClauseForest &forest, ClauseForest::Index index);

    QJsonArray ToJson(const ClauseForest &forest);

    QByteArray ToJsonBytes(const ClauseForest &forest);

    const Row &TableHeader();

    // Header row followed by one row per clause, depth first.
    std::vector<Row> ToRows(const ClauseForest &forest);

    WriteResult WriteJsonFile(const ClauseForest &forest, const std::string &path);
} // namespace clausetree
