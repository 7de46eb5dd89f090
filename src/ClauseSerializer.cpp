#include "ClauseSerializer.hpp"
#include "TextReconstructor.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QString>

namespace clausetree {
    namespace {
        QString toQString(const std::string &s) {
            return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()));
        }

        void flatten(const ClauseForest &forest, const ClauseForest::Index index,
                     const std::string &parent, const int level, std::vector<Row> &rows) {
            const Clause &clause = forest.at(index);
            rows.push_back(Row{
                clause.identifier,
                clause.title,
                parent,
                std::to_string(level),
                ReconstructText(clause.bodyLines)
            });
            for (const auto child: clause.children)
                flatten(forest, child, clause.identifier, level + 1, rows);
        }
    } // namespace

    QJsonObject ClauseToJson(const ClauseForest &forest, const ClauseForest::Index index) {
        const Clause &clause = forest.at(index);

        QJsonObject obj;
        obj.insert("clause", toQString(clause.identifier));
        obj.insert("title", toQString(clause.title));
        obj.insert("text", toQString(ReconstructText(clause.bodyLines)));

        if (!clause.children.empty()) {
            QJsonArray subclauses;
            for (const auto child: clause.children)
                subclauses.append(ClauseToJson(forest, child));
            obj.insert("subclauses", subclauses);
        }
        return obj;
    }

    QJsonArray ToJson(const ClauseForest &forest) {
        QJsonArray out;
        for (const auto root: forest.roots())
            out.append(ClauseToJson(forest, root));
        return out;
    }

    QByteArray ToJsonBytes(const ClauseForest &forest) {
        return QJsonDocument(ToJson(forest)).toJson(QJsonDocument::Indented);
    }

    const Row &TableHeader() {
        static const Row header = {"Clause", "Title", "Parent", "Level", "Text"};
        return header;
    }

    std::vector<Row> ToRows(const ClauseForest &forest) {
        std::vector<Row> rows;
        rows.reserve(forest.size() + 1);
        rows.push_back(TableHeader());
        for (const auto root: forest.roots())
            flatten(forest, root, std::string(), 1, rows);
        return rows;
    }

    WriteResult WriteJsonFile(const ClauseForest &forest, const std::string &path) {
        QFile out(QString::fromStdString(path));
        if (!out.open(QIODevice::WriteOnly | QIODevice::Truncate))
            return {false, "Cannot open " + path + " for writing: " + out.errorString().toStdString()};

        const QByteArray bytes = ToJsonBytes(forest);
        if (out.write(bytes) != bytes.size())
            return {false, "Short write to " + path + ": " + out.errorString().toStdString()};

        out.close();
        return {true, "Wrote JSON: " + path};
    }
} // namespace clausetree
