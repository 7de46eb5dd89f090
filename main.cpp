#include "mainwindow.h"
#include <QApplication>

int main(int argc, char *argv[]) {
    QApplication a(argc, argv);
    QApplication::setOrganizationName("ClauseTree");
    QApplication::setApplicationName("ClauseTreeQt");
    QApplication::setApplicationVersion(CLAUSETREE_VERSION);

    MainWindow w;
    w.show();
    return QApplication::exec();
}
