#ifndef CLAUSETEXTVIEW_H
#define CLAUSETEXTVIEW_H

#include <QPlainTextEdit>
#include <QDragEnterEvent>

// Read-only view of the selected clause's text. Doubles as the drop target
// for a single PDF.
class ClauseTextView : public QPlainTextEdit
{
    Q_OBJECT

public:
    explicit ClauseTextView(QWidget* parent = nullptr);

signals:
    void pdfDropped(const QString& filePath);
    void nonPdfDropped(const QString& filePath);

protected:
    void dragEnterEvent(QDragEnterEvent* event) override;

    void dragMoveEvent(QDragMoveEvent* event) override;

    void dropEvent(QDropEvent* event) override;
};

#endif // CLAUSETEXTVIEW_H
