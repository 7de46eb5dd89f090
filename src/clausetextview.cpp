#include <QMimeData>
#include "clausetextview.h"
#include "filetype_utils.h"


ClauseTextView::ClauseTextView(QWidget *parent) : QPlainTextEdit(parent) {
    setReadOnly(true);
    setAcceptDrops(true);
    setPlaceholderText(tr("Open or drop a standards PDF to extract its clauses."));
}

void ClauseTextView::dragEnterEvent(QDragEnterEvent *event) {
    if (const QMimeData *mimeData = event->mimeData(); mimeData->hasUrls()) {
        event->acceptProposedAction();
    }
}

void ClauseTextView::dragMoveEvent(QDragMoveEvent *event) {
    if (event->mimeData()->hasUrls()) {
        event->acceptProposedAction();
    }
}

void ClauseTextView::dropEvent(QDropEvent *event) {
    if (const QMimeData *mimeData = event->mimeData(); mimeData->hasUrls()) {
        const QString filePath = mimeData->urls().at(0).toLocalFile();
        if (isPdfFile(filePath)) {
            emit pdfDropped(filePath);
        } else {
            emit nonPdfDropped(filePath);
        }
        event->acceptProposedAction();
    }
}
