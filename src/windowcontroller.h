#pragma once
#include <QByteArray>
#include <QObject>

class QEvent;
class QMainWindow;

namespace otv {

// Wrapper with methods for manipulating the main window.
class WindowController : public QObject {
    Q_OBJECT
public:
    explicit WindowController(QMainWindow* window);

    QMainWindow* window() const { return m_window; }

    // Show the window, move it in front of other windows and give it focus.
    // Pending events are processed before returning.
    void show();
    void close();

    // Set the window icon from raw image data (PNG, SVG, ...).
    bool setIcon(const QByteArray& data);

    // True if the window, or something in it, has keyboard focus.
    bool hasFocus() const;

signals:
    void activated();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    QMainWindow* m_window;
};

} // namespace otv
