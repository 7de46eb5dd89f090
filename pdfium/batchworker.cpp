// BatchWorker.cpp
#include "batchworker.h"

#include <QFileInfo>

#include <atomic>
#include <utility>

#include "ClauseErrors.hpp"
#include "ClausePipeline.hpp"
#include "ClauseSerializer.hpp"
#include "XlsxWriterMinizip.hpp"
#include "filetype_utils.h"

BatchWorker::BatchWorker(const QStringList &files,
                         const QString &outDir,
                         clausetree::ParserConfig config,
                         QObject *parent)
    : QObject(parent),
      m_files(files),
      m_outDir(outDir),
      m_config(std::move(config)),
      m_cancelRequested(false) {
}

void BatchWorker::requestCancel() {
    m_cancelRequested.storeRelaxed(true);
}

void BatchWorker::process() {
    const qsizetype total = m_files.size();
    if (total == 0) {
        emit finished(false);
        return;
    }

    if (const QDir dir(m_outDir); !dir.exists() && !dir.mkpath(".")) {
        emit error(QString("Cannot create output directory: %1").arg(m_outDir));
        emit finished(false);
        return;
    }

    for (qsizetype i = 0; i < m_files.size(); ++i) {
        const qsizetype idx = i + 1;

        if (m_cancelRequested.loadRelaxed()) {
            emit log(QStringLiteral("Batch cancelled."));
            emit finished(true);
            return;
        }

        const QString path = m_files.at(i);
        if (QFileInfo fi(path); !fi.exists()) {
            emit log(QString("%1: %2 -> ❌ File not found.")
                .arg(idx)
                .arg(path));
            emit progress(static_cast<int>(idx),
                          static_cast<int>(total));
            continue;
        }

        try {
            processOneFile(static_cast<int>(idx), path);
        } catch (const clausetree::ExtractionCancelled &) {
            emit log(QString("%1: %2 -> ❌ Cancelled during PDF extraction.")
                .arg(idx)
                .arg(path));
        } catch (const std::exception &e) {
            emit error(QString("%1: %2 -> Error: %3")
                .arg(idx)
                .arg(path, QString::fromUtf8(e.what())));
        }

        emit progress(static_cast<int>(idx),
                      static_cast<int>(total));
    }

    emit finished(false);
}

void BatchWorker::processOneFile(const int idx, const QString &path) {
    const QFileInfo fi(path);

    if (!isPdfFile(path)) {
        emit log(QString("%1: %2 -> ❌ Skip: Not a PDF file.")
            .arg(idx)
            .arg(path));
        return;
    }

    emit log(QString("%1: %2 -> Extracting clauses...")
        .arg(idx)
        .arg(path));

    // QAtomicInteger is not a std::atomic; mirror it for the pipeline.
    std::atomic<bool> cancelFlag(false);
    const clausetree::PageProgress progressCb =
            [this, &cancelFlag](int, int, int, const std::string &) {
        if (m_cancelRequested.loadRelaxed())
            cancelFlag.store(true, std::memory_order_relaxed);
    };

    const clausetree::ClauseForest forest =
            clausetree::ExtractClauses(path.toUtf8().constData(), m_config, progressCb, &cancelFlag);

    const QString jsonPath = makeOutputPath(m_outDir, fi.completeBaseName(), "json");
    const QString xlsxPath = makeOutputPath(m_outDir, fi.completeBaseName(), "xlsx");

    if (const auto [ok, msg] = clausetree::WriteJsonFile(forest, jsonPath.toStdString()); !ok) {
        emit log(QString("%1: %2 -> ❌ %3")
            .arg(idx)
            .arg(jsonPath, QString::fromStdString(msg)));
        return;
    }

    const auto rows = clausetree::ToRows(forest);
    if (const auto [ok, msg] = XlsxWriterMinizip::Write(rows, xlsxPath.toStdString()); !ok) {
        emit log(QString("%1: %2 -> ❌ %3")
            .arg(idx)
            .arg(xlsxPath, QString::fromStdString(msg)));
        return;
    }

    emit log(QString("%1: %2 -> ✅ Done (%3 clauses).")
        .arg(idx)
        .arg(path)
        .arg(rows.size() - 1));
}
