#include "mainwindow.h"
#include "QFileDialog"
#include "QMessageBox"
#include <QApplication>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHeaderView>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSettings>
#include <string>
#include <utility>
#include <vector>
#include "filetype_utils.h"
#include "XlsxWriterMinizip.hpp"

namespace {
    constexpr int FULL_TEXT_ROLE = Qt::UserRole + 1;

    const auto SETTINGS_LAST_DIR = QStringLiteral("paths/lastDirectory");
    const auto SETTINGS_OUT_DIR = QStringLiteral("paths/batchOutputDirectory");
} // namespace

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent), ui(new Ui::MainWindowClass()),
      m_config(clausetree::DefaultParserConfig()) {
    ui->setupUi(this);
    ui->tabWidget->setCurrentIndex(0);
    ui->treeClauses->header()->setSectionResizeMode(0, QHeaderView::ResizeToContents);
    ui->splitterDocument->setStretchFactor(0, 3);
    ui->splitterDocument->setStretchFactor(1, 2);

    const QSettings settings;
    ui->lineEditDir->setText(settings.value(SETTINGS_OUT_DIR,
                                            QDir::home().filePath("clauses_out")).toString());

    connect(ui->tbClauseText, &ClauseTextView::pdfDropped, this,
            [this](const QString &path) {
                startClauseExtraction(path);
            });
    connect(ui->tbClauseText, &ClauseTextView::nonPdfDropped, this,
            [this](const QString &path) {
                ui->statusBar->showMessage(tr("❌ Not a PDF file: %1").arg(path), 5000);
            });
    connect(ui->listSource, &DragListWidget::rejected, this,
            [this](const QString &path) {
                ui->tbPreview->appendPlainText(tr("❌ Skip: Not a PDF file: %1").arg(path));
            });

    // --- Status-bar Cancel button ---
    m_cancelButton = new QPushButton(tr("Cancel"), this);
    m_cancelButton->setObjectName("btnCancel");
    m_cancelButton->setAutoDefault(false);
    m_cancelButton->setFlat(true); // look like status-bar control
    m_cancelButton->hide(); // hidden by default

    ui->statusBar->addPermanentWidget(m_cancelButton);

    connect(m_cancelButton, &QPushButton::clicked,
            this, &MainWindow::onCancelClicked);
}

MainWindow::~MainWindow() {
    if (m_extractWorker)
        m_extractWorker->requestCancel();
    if (m_batchWorker)
        m_batchWorker->requestCancel();
    cleanupExtractThread();
    cleanupBatchThread();
    delete ui;
}

void MainWindow::on_btnExit_clicked() { this->close(); }

void MainWindow::on_actionExit_triggered() { QApplication::quit(); }

void MainWindow::on_actionAbout_triggered() {
    QMessageBox::about(this, "About",
                       "ClauseTreeQt version " CLAUSETREE_VERSION "\n"
                       "Recovers the numbered clause hierarchy of standards PDFs.");
}

QString MainWindow::lastDirectory() const {
    const QSettings settings;
    return settings.value(SETTINGS_LAST_DIR, QDir::homePath()).toString();
}

void MainWindow::rememberDirectory(const QString &path) const {
    QSettings settings;
    settings.setValue(SETTINGS_LAST_DIR, QFileInfo(path).absolutePath());
}

void MainWindow::on_actionOpen_triggered() { on_btnOpenFile_clicked(); }

void MainWindow::on_btnOpenFile_clicked() {
    const QString file_name = QFileDialog::getOpenFileName(
        this,
        tr("Open Standards PDF"),
        lastDirectory(),
        tr("PDF Files (*.pdf);;"
            "All Files (*.*)")
    );

    if (file_name.isEmpty())
        return;

    rememberDirectory(file_name);

    if (!isPdfFile(file_name)) {
        ui->statusBar->showMessage(tr("❌ Not a PDF file: %1").arg(file_name), 5000);
        return;
    }
    startClauseExtraction(file_name);
}

void MainWindow::on_actionLoadConfig_triggered() {
    const QString file_name = QFileDialog::getOpenFileName(
        this,
        tr("Load Parser Config"),
        lastDirectory(),
        tr("INI Files (*.ini);;All Files (*.*)"));

    if (file_name.isEmpty())
        return;

    try {
        m_config = clausetree::LoadParserConfig(file_name.toStdString());
        ui->statusBar->showMessage(tr("Parser config loaded: %1").arg(file_name));
    } catch (const std::exception &ex) {
        QMessageBox::warning(this, tr("Parser Config"), QString::fromUtf8(ex.what()));
    }
}

void MainWindow::startClauseExtraction(const QString &filePath) {
    // Clean up any previous thread/worker if needed
    cleanupExtractThread();

    m_currentPdfFilePath = filePath;
    ui->lineEditPdf->setText(filePath);
    ui->treeClauses->clear();
    ui->tbClauseText->clear();
    ui->btnSaveJson->setEnabled(false);
    ui->btnSaveExcel->setEnabled(false);
    m_clauses = QJsonArray();
    m_rows.clear();

    m_extractThread = new QThread(this);
    m_extractWorker = new ClauseExtractWorker(filePath, m_config);

    m_extractWorker->moveToThread(m_extractThread);

    // When thread starts -> do work
    connect(m_extractThread, &QThread::started,
            m_extractWorker, &ClauseExtractWorker::process);

    // Progress → update status bar text / emoji bar
    connect(m_extractWorker, &ClauseExtractWorker::progressChanged,
            this, [this](const int percent, const QString &bar) {
                ui->statusBar->showMessage(bar + "  " + QString::number(percent) + "%");
            });

    connect(m_extractWorker, &ClauseExtractWorker::finished,
            this, &MainWindow::onExtractionFinished);

    connect(m_extractWorker, &ClauseExtractWorker::cancelled,
            this, &MainWindow::onExtractionCancelled);

    connect(m_extractWorker, &ClauseExtractWorker::errorOccurred,
            this, &MainWindow::onExtractionError);

    // Cleanup when thread exits
    connect(m_extractThread, &QThread::finished,
            m_extractWorker, &QObject::deleteLater);
    connect(m_extractThread, &QThread::finished,
            m_extractThread, &QObject::deleteLater);

    // --- Show Cancel button while running ---
    m_cancelButton->setEnabled(true);
    m_cancelButton->show();

    ui->statusBar->showMessage(tr("Extracting clauses: %1").arg(filePath));
    m_extractThread->start();
}

void MainWindow::onCancelClicked() const {
    if (m_extractWorker) {
        // requestCancel() only writes an atomic<bool>, which is thread-safe.
        m_extractWorker->requestCancel();
        m_cancelButton->setEnabled(false);
        ui->statusBar->showMessage(tr("Cancelling clause extraction..."));
    } else if (m_batchWorker) {
        m_batchWorker->requestCancel();
        m_cancelButton->setEnabled(false);
        ui->statusBar->showMessage(tr("Cancelling batch..."));
    }
}

void MainWindow::populateTree(const QJsonArray &clauses, QTreeWidgetItem *parent) const {
    for (const auto &value: clauses) {
        const QJsonObject clause = value.toObject();
        const QString text = clause.value("text").toString();

        auto *item = parent ? new QTreeWidgetItem(parent) : new QTreeWidgetItem(ui->treeClauses);
        item->setText(0, clause.value("clause").toString());
        item->setText(1, clause.value("title").toString());
        item->setText(2, truncateForPreview(text).replace('\n', ' '));
        item->setData(0, FULL_TEXT_ROLE, text);

        if (clause.contains("subclauses"))
            populateTree(clause.value("subclauses").toArray(), item);
    }
}

void MainWindow::onExtractionFinished(const QJsonArray &clauses, const QList<QStringList> &rows) {
    m_cancelButton->hide();

    m_clauses = clauses;
    m_rows = rows;

    populateTree(m_clauses, nullptr);
    ui->treeClauses->expandToDepth(0);

    ui->btnSaveJson->setEnabled(true);
    ui->btnSaveExcel->setEnabled(true);

    ui->statusBar->showMessage(
        tr("✅ Extracted %1 clauses from %2").arg(m_rows.size() - 1).arg(m_currentPdfFilePath));

    cleanupExtractThread();
}

void MainWindow::onExtractionCancelled() {
    m_cancelButton->hide();

    ui->statusBar->showMessage(
        tr("❌ Clause extraction cancelled: %1").arg(m_currentPdfFilePath));

    cleanupExtractThread();
    m_currentPdfFilePath.clear();
}

void MainWindow::onExtractionError(const QString &message) {
    m_cancelButton->hide();
    ui->statusBar->showMessage(tr("Error: %1").arg(message), 5000);
    QMessageBox::warning(this, tr("Clause Extraction"),
                         tr("Failed to process PDF: %1").arg(message));

    cleanupExtractThread();
    m_currentPdfFilePath.clear();
}

void MainWindow::cleanupExtractThread() {
    if (m_extractThread) {
        m_extractThread->quit(); // ask thread to stop event loop
        m_extractThread->wait(); // block until fully stopped

        // deleteLater for worker & thread is already connected,
        // so we just reset pointers here.
        m_extractThread = nullptr;
        m_extractWorker = nullptr;
    }
}

void MainWindow::on_treeClauses_currentItemChanged(QTreeWidgetItem *current, QTreeWidgetItem *previous) const {
    Q_UNUSED(previous);

    if (!current) {
        ui->tbClauseText->clear();
        return;
    }

    const QString heading = current->text(0) + "  " + current->text(1);
    const QString text = current->data(0, FULL_TEXT_ROLE).toString();
    ui->tbClauseText->setPlainText(heading + "\n\n" + text);
}

void MainWindow::on_btnSaveJson_clicked() {
    if (m_clauses.isEmpty()) {
        ui->statusBar->showMessage(tr("Nothing to save."));
        return;
    }

    const QString suggested = makeOutputPath(QFileInfo(m_currentPdfFilePath).absolutePath(),
                                             QFileInfo(m_currentPdfFilePath).completeBaseName(),
                                             "json");
    const QString file_name = QFileDialog::getSaveFileName(
        this, tr("Save JSON"), suggested, tr("JSON Files (*.json)"));
    if (file_name.isEmpty())
        return;

    QFile outFile(file_name);
    if (!outFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        ui->statusBar->showMessage(tr("❌ Error opening for write: %1").arg(outFile.errorString()));
        return;
    }
    outFile.write(QJsonDocument(m_clauses).toJson(QJsonDocument::Indented));
    outFile.close();

    ui->statusBar->showMessage(tr("Wrote JSON: %1").arg(file_name));
}

void MainWindow::on_btnSaveExcel_clicked() {
    if (m_rows.size() <= 1) {
        ui->statusBar->showMessage(tr("Nothing to save."));
        return;
    }

    const QString suggested = makeOutputPath(QFileInfo(m_currentPdfFilePath).absolutePath(),
                                             QFileInfo(m_currentPdfFilePath).completeBaseName(),
                                             "xlsx");
    const QString file_name = QFileDialog::getSaveFileName(
        this, tr("Save Excel"), suggested, tr("Excel Workbook (*.xlsx)"));
    if (file_name.isEmpty())
        return;

    std::vector<XlsxWriterMinizip::Row> rows;
    rows.reserve(static_cast<size_t>(m_rows.size()));
    for (const QStringList &row: m_rows) {
        XlsxWriterMinizip::Row cells;
        for (const QString &cell: row)
            cells.push_back(cell.toStdString());
        rows.push_back(std::move(cells));
    }

    const auto [ok, msg] = XlsxWriterMinizip::Write(rows, file_name.toStdString());
    ui->statusBar->showMessage(ok
                                   ? tr("Wrote Excel: %1").arg(file_name)
                                   : tr("❌ %1").arg(QString::fromStdString(msg)));
}

// ---------------------------------------------------------------------------
// Batch
// ---------------------------------------------------------------------------

void MainWindow::on_btnAdd_clicked() {
    const QStringList files =
            QFileDialog::getOpenFileNames(this,
                                          tr("Select PDF files"),
                                          lastDirectory(),
                                          tr("PDF Files (*.pdf);;All Files (*.*)"));
    if (files.isEmpty())
        return;

    rememberDirectory(files.first());
    int added = 0;
    for (const QString &file: files) {
        if (ui->listSource->addPdf(file))
            ++added;
    }
    ui->statusBar->showMessage(tr("Added %1 file(s).").arg(added));
}

void MainWindow::on_btnRemove_clicked() const {
    const QList<QListWidgetItem *> selected = ui->listSource->selectedItems();
    for (QListWidgetItem *item: selected)
        delete ui->listSource->takeItem(ui->listSource->row(item));
    ui->statusBar->showMessage(tr("Removed %1 file(s).").arg(selected.size()));
}

void MainWindow::on_btnListClear_clicked() const {
    ui->listSource->clear();
    ui->statusBar->showMessage(tr("File list cleared."));
}

void MainWindow::on_btnOutDir_clicked() {
    if (const QString directory = QFileDialog::getExistingDirectory(this, tr("Output Directory"),
                                                                    ui->lineEditDir->text());
        !directory.isEmpty()) {
        ui->lineEditDir->setText(directory);
        QSettings settings;
        settings.setValue(SETTINGS_OUT_DIR, directory);
    }
}

void MainWindow::on_btnBatchStart_clicked() {
    if (ui->listSource->count() == 0) {
        ui->statusBar->showMessage(tr("Nothing to extract: Empty file list."));
        return;
    }

    const QString outDir = ui->lineEditDir->text().trimmed();
    if (outDir.isEmpty()) {
        ui->lineEditDir->setFocus();
        ui->statusBar->showMessage(tr("Invalid output directory."));
        return;
    }

    ui->tbPreview->clear();
    ui->statusBar->showMessage(tr("Starting batch extraction..."));

    // Clean up any previous batch thread if needed
    cleanupBatchThread();

    m_batchThread = new QThread(this);
    m_batchWorker = new BatchWorker(ui->listSource->files(), outDir, m_config, nullptr);

    m_batchWorker->moveToThread(m_batchThread);

    // Thread start → worker.process()
    connect(m_batchThread, &QThread::started,
            m_batchWorker, &BatchWorker::process);

    // Signals → UI
    connect(m_batchWorker, &BatchWorker::log,
            ui->tbPreview, &QPlainTextEdit::appendPlainText);
    connect(m_batchWorker, &BatchWorker::progress,
            this, &MainWindow::onBatchProgress);
    connect(m_batchWorker, &BatchWorker::error,
            this, &MainWindow::onBatchError);
    connect(m_batchWorker, &BatchWorker::finished,
            this, &MainWindow::onBatchFinished);

    // Cleanup when worker finishes
    connect(m_batchWorker, &BatchWorker::finished,
            m_batchThread, &QThread::quit);
    connect(m_batchThread, &QThread::finished,
            m_batchWorker, &QObject::deleteLater);
    connect(m_batchThread, &QThread::finished,
            this, &MainWindow::onBatchThreadFinished);

    ui->btnBatchStart->setEnabled(false);

    // --- Show Cancel button while running (reuse existing button) ---
    m_cancelButton->setEnabled(true);
    m_cancelButton->show();

    m_batchThread->start();
}

void MainWindow::onBatchProgress(const int current, const int total) const {
    ui->statusBar->showMessage(tr("Processing %1/%2...").arg(current).arg(total));
}

void MainWindow::onBatchError(const QString &msg) const {
    ui->tbPreview->appendPlainText(msg);
}

void MainWindow::onBatchFinished(const bool cancelled) const {
    m_cancelButton->hide();
    ui->btnBatchStart->setEnabled(true);
    ui->statusBar->showMessage(cancelled
                                   ? tr("❌ Batch extraction cancelled.")
                                   : tr("✅ Batch extraction completed."));
}

void MainWindow::onBatchThreadFinished() {
    if (m_batchThread) {
        m_batchThread->deleteLater();
        m_batchThread = nullptr;
    }
    m_batchWorker = nullptr;
}

void MainWindow::cleanupBatchThread() {
    if (m_batchThread) {
        m_batchThread->quit();
        m_batchThread->wait();
        m_batchThread->deleteLater();
        m_batchThread = nullptr;
        m_batchWorker = nullptr;
    }
}
