#pragma once

#include <QObject>
#include <QStringList>
#include <QDir>
#include <QAtomicInteger>

#include "ParserConfig.hpp"

// Runs the clause pipeline over a list of PDFs, one after another, writing
// <base>_clauses.json and <base>_clauses.xlsx into the output directory.
class BatchWorker : public QObject
{
    Q_OBJECT

public:
    BatchWorker(const QStringList &files,
                const QString &outDir,
                clausetree::ParserConfig config,
                QObject *parent = nullptr);

public slots:
    void process();
    void requestCancel();

signals:
    void log(const QString &line);
    void progress(int current, int total); // (idx, total)
    void finished(bool cancelled);
    void error(const QString &msg);

private:
    void processOneFile(int idx, const QString &path);

    QStringList m_files;
    QString     m_outDir;
    clausetree::ParserConfig m_config;

    QAtomicInteger<bool> m_cancelRequested;
};
