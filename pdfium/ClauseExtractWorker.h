// ClauseExtractWorker.h
#pragma once

#include <QJsonArray>
#include <QList>
#include <QObject>
#include <QString>
#include <QStringList>
#include <memory>
#include <atomic>
#include <utility>

#include "ParserConfig.hpp"

class ClauseExtractWorker final : public QObject {
    Q_OBJECT

public:
    explicit ClauseExtractWorker(QString filePath,
                                 clausetree::ParserConfig config,
                                 QObject *parent = nullptr)
        : QObject(parent)
          , m_filePath(std::move(filePath))
          , m_config(std::move(config))
          , m_cancelFlag(std::make_shared<std::atomic<bool> >(false)) {
    }

public slots:
    // Entry point for the worker thread
    void process();

    // Called from GUI thread to request cancellation
    void requestCancel() const {
        m_cancelFlag->store(true, std::memory_order_relaxed);
    }

signals:
    // percent: 0–100
    // bar: emoji progress bar (🟩🟩⬜⬜…)
    // pageIndex: 0-based
    // pageCount: total pages
    void progressChanged(int percent,
                         const QString &bar,
                         int pageIndex,
                         int pageCount);

    // clauses: hierarchical projection; rows: header + one row per clause
    void finished(const QJsonArray &clauses, const QList<QStringList> &rows);

    void cancelled();

    void errorOccurred(const QString &message);

private:
    QString m_filePath;
    clausetree::ParserConfig m_config;
    std::shared_ptr<std::atomic<bool> > m_cancelFlag;
};
