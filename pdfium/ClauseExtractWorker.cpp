// ClauseExtractWorker.cpp

#include "ClauseExtractWorker.h"
#include "ClauseErrors.hpp"
#include "ClausePipeline.hpp"
#include "ClauseSerializer.hpp"

#include <QDebug>
#include <atomic>

namespace {
    QList<QStringList> toStringRows(const std::vector<clausetree::Row> &rows) {
        QList<QStringList> out;
        out.reserve(static_cast<qsizetype>(rows.size()));
        for (const auto &row: rows) {
            QStringList cells;
            for (const auto &cell: row)
                cells << QString::fromStdString(cell);
            out << cells;
        }
        return out;
    }
} // namespace

void ClauseExtractWorker::process() {
    try {
        const clausetree::PageProgress progressCb =
                [this](const int pageIndex,
                       const int pageCount,
                       const int percent,
                       const std::string &barUtf8) {
            if (m_cancelFlag->load(std::memory_order_relaxed))
                return;

            const QString bar = QString::fromUtf8(barUtf8.c_str(),
                                                  static_cast<int>(barUtf8.size()));
            emit progressChanged(percent, bar, pageIndex, pageCount);
        };

        const clausetree::ClauseForest forest =
                clausetree::ExtractClauses(m_filePath.toUtf8().constData(),
                                           m_config,
                                           progressCb,
                                           m_cancelFlag.get());

        emit finished(clausetree::ToJson(forest),
                      toStringRows(clausetree::ToRows(forest)));
    } catch (const clausetree::ExtractionCancelled &) {
        emit cancelled();
    } catch (const clausetree::ExtractionError &ex) {
        qWarning() << "Clause extraction failed:" << clausetree::ErrorKindName(ex.kind()) << ex.what();
        emit errorOccurred(QString::fromUtf8(ex.what()));
    } catch (const std::exception &ex) {
        qWarning() << "Clause extraction failed:" << ex.what();
        emit errorOccurred(QString::fromUtf8(ex.what()));
    }
}
