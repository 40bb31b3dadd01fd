#include "windowcontroller.h"
#include <QApplication>
#include <QDebug>
#include <QEvent>
#include <QIcon>
#include <QMainWindow>
#include <QPixmap>

namespace otv {

WindowController::WindowController(QMainWindow* window)
    : QObject(window), m_window(window)
{
    m_window->installEventFilter(this);
}

bool WindowController::eventFilter(QObject* watched, QEvent* event) {
    if (watched == m_window && event->type() == QEvent::WindowActivate)
        emit activated();
    return false;
}

void WindowController::show() {
    m_window->show();
    m_window->activateWindow();
    m_window->raise();
    QApplication::processEvents();
}

void WindowController::close() {
    m_window->close();
}

bool WindowController::setIcon(const QByteArray& data) {
    QPixmap pixmap;
    if (!pixmap.loadFromData(data)) {
        qWarning() << "WindowController: Could not decode icon data," << data.size() << "bytes";
        return false;
    }
    m_window->setWindowIcon(QIcon(pixmap));
    return true;
}

bool WindowController::hasFocus() const {
    return m_window->isActiveWindow();
}

} // namespace otv
