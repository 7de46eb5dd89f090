#ifndef DRAGLISTWIDGET_H
#define DRAGLISTWIDGET_H

#include <QListWidget>
#include <QDragEnterEvent>
#include <QStringList>

// Batch queue: accepts dropped PDF files, ignores duplicates and non-PDFs.
class DragListWidget : public QListWidget {
Q_OBJECT

public:
    explicit DragListWidget(QWidget *parent = nullptr);

    // Returns false when the path is already queued or is not a PDF.
    bool addPdf(const QString &path);

    [[nodiscard]] QStringList files() const;

signals:
    void rejected(const QString &path);

protected:
    void dragEnterEvent(QDragEnterEvent *event) override;

    void dragMoveEvent(QDragMoveEvent *event) override;

    void dropEvent(QDropEvent *event) override;

    bool isItemInList(const QString &itemText) const;
};

#endif // DRAGLISTWIDGET_H
