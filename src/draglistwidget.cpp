#include <QMimeData>
#include "draglistwidget.h"
#include "filetype_utils.h"


DragListWidget::DragListWidget(QWidget* parent) : QListWidget(parent)
{
    setSelectionMode(ExtendedSelection);
    setAcceptDrops(true);
    viewport()->setAcceptDrops(true);
    setDropIndicatorShown(true);
    setDefaultDropAction(Qt::CopyAction);
}

bool DragListWidget::addPdf(const QString& path)
{
    if (path.isEmpty() || isItemInList(path))
        return false;
    if (!isPdfFile(path))
    {
        emit rejected(path);
        return false;
    }
    // Let QListWidget allocate & own the item internally
    addItem(path);
    return true;
}

QStringList DragListWidget::files() const
{
    QStringList out;
    out.reserve(count());
    for (int i = 0; i < count(); ++i)
        out << item(i)->text();
    return out;
}

void DragListWidget::dragEnterEvent(QDragEnterEvent* event)
{
    if (const QMimeData* mimeData = event->mimeData(); mimeData->hasUrls())
    {
        event->acceptProposedAction();
    }
}

void DragListWidget::dragMoveEvent(QDragMoveEvent* event)
{
    if (event->mimeData()->hasUrls())
    {
        event->acceptProposedAction();
    }
}

void DragListWidget::dropEvent(QDropEvent* event)
{
    const QMimeData* mimeData = event->mimeData();
    if (mimeData->hasUrls())
    {
        for (const QUrl& url : mimeData->urls())
        {
            addPdf(url.toLocalFile());
        }
        event->acceptProposedAction();
    }
}

bool DragListWidget::isItemInList(const QString& itemText) const
{
    const QList<QListWidgetItem*> items = findItems(itemText, Qt::MatchExactly);
    return !items.isEmpty();
}
