#pragma once

#include <QJsonArray>
#include <QList>
#include <QMainWindow>
#include <QPushButton>
#include <QStringList>
#include <QThread>
#include <QTreeWidgetItem>

#include "ui_mainwindow.h"
#include "ParserConfig.hpp"
#include "ClauseExtractWorker.h"
#include "batchworker.h"

QT_BEGIN_NAMESPACE

namespace Ui {
    class MainWindowClass;
};

QT_END_NAMESPACE

class MainWindow final : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);

    ~MainWindow() override;

private slots:
    void on_btnExit_clicked();

    static void on_actionExit_triggered();

    void on_actionAbout_triggered();

    void on_actionOpen_triggered();

    void on_actionLoadConfig_triggered();

    void on_btnOpenFile_clicked();

    void on_btnSaveJson_clicked();

    void on_btnSaveExcel_clicked();

    void on_treeClauses_currentItemChanged(QTreeWidgetItem *current, QTreeWidgetItem *previous) const;

    void on_btnAdd_clicked();

    void on_btnRemove_clicked() const;

    void on_btnListClear_clicked() const;

    void on_btnOutDir_clicked();

    void on_btnBatchStart_clicked();

    void onExtractionFinished(const QJsonArray &clauses, const QList<QStringList> &rows);

    void onExtractionCancelled();

    void onExtractionError(const QString &message);

    void cleanupExtractThread();

    void onCancelClicked() const;

    // Batch handlers
    void onBatchProgress(int current, int total) const;
    void onBatchError(const QString &msg) const;
    void onBatchFinished(bool cancelled) const;
    void onBatchThreadFinished();

private:
    Ui::MainWindowClass *ui;

    void startClauseExtraction(const QString &filePath);

    void populateTree(const QJsonArray &clauses, QTreeWidgetItem *parent) const;

    void cleanupBatchThread();

    [[nodiscard]] QString lastDirectory() const;

    void rememberDirectory(const QString &path) const;

    clausetree::ParserConfig m_config;

    QJsonArray m_clauses;
    QList<QStringList> m_rows;

    QPushButton *m_cancelButton = nullptr; // button shown in status bar
    QThread *m_extractThread = nullptr;
    ClauseExtractWorker *m_extractWorker = nullptr;
    QString m_currentPdfFilePath;

    QThread *m_batchThread = nullptr;
    BatchWorker *m_batchWorker = nullptr;
};
