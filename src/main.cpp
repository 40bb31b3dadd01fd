#include "mainwindow.h"
#include "optionsdialog.h"
#include "treedialog.h"
#include "windowcontroller.h"
#include "introspect/iconset.h"
#include <QAction>
#include <QApplication>
#include <QDebug>
#include <QLabel>
#include <QMenuBar>
#include <QSettings>
#include <QStatusBar>

namespace otv {

// Application settings as a map. Writes replace the whole key set.
static ObjectRef settingsRef() {
    ObjectRef ref;
    ref.key = QStringLiteral("settings");
    ref.getter = []() {
        QSettings settings("objtree", "objtree");
        QVariantMap map;
        for (const QString& key : settings.allKeys())
            map.insert(key, settings.value(key));
        return QVariant(map);
    };
    ref.value = ref.getter();
    ref.setter = [](const QVariant& v) {
        QSettings settings("objtree", "objtree");
        const QVariantMap map = v.toMap();
        for (const QString& key : settings.allKeys()) {
            if (!map.contains(key))
                settings.remove(key);
        }
        for (auto it = map.cbegin(); it != map.cend(); ++it)
            settings.setValue(it.key(), it.value());
        settings.sync();
        if (settings.status() != QSettings::NoError)
            throw EditError(QStringLiteral("Could not write settings"));
    };
    return ref;
}

MainWindow::MainWindow(QWidget* parent)
    : QMainWindow(parent)
    , m_icons(std::make_shared<IconSet>())
{
    setWindowTitle("objtree");
    setObjectName("mainWindow");
    resize(800, 500);

    {
        QSettings settings("objtree", "objtree");
        m_options = TreeOptions::load(settings);
    }

    m_controller = new WindowController(this);
    if (!m_controller->setIcon(IconSet::appIconData()))
        qWarning() << "MainWindow: Application icon unavailable";
    connect(m_controller, &WindowController::activated, this, &MainWindow::onActivated);

    m_statusLabel = new QLabel("Tools > Object Tree opens a live view of this application's objects.", this);
    m_statusLabel->setAlignment(Qt::AlignCenter);
    m_statusLabel->setObjectName("statusLabel");
    setCentralWidget(m_statusLabel);

    createMenus();
    statusBar()->showMessage("Ready");
}

void MainWindow::createMenus() {
    // File
    auto* file = menuBar()->addMenu("&File");
    auto* options = file->addAction("&Options...");
    connect(options, &QAction::triggered, this, &MainWindow::showOptionsDialog);
    file->addSeparator();
    auto* exit = file->addAction("E&xit");
    exit->setShortcut(QKeySequence::Quit);
    connect(exit, &QAction::triggered, m_controller, &WindowController::close);

    // Tools
    auto* tools = menuBar()->addMenu("&Tools");
    auto* tree = tools->addAction(m_icons->icon(ValueCategory::Object), "Object &Tree...");
    tree->setShortcut(QKeySequence(Qt::CTRL | Qt::Key_T));
    connect(tree, &QAction::triggered, this, &MainWindow::showObjectTree);
}

QVector<ObjectRef> MainWindow::inspectionRoots() {
    return {
        objectRef(QStringLiteral("application"), qApp),
        objectRef(QStringLiteral("window"), this),
        settingsRef(),
    };
}

void MainWindow::showObjectTree() {
    if (m_treeDialog) {
        m_treeDialog->raise();
        m_treeDialog->activateWindow();
        return;
    }
    auto* dialog = new TreeDialog(m_options, this);
    dialog->setAttribute(Qt::WA_DeleteOnClose);
    // The dialog owns the model.
    auto* model = makeObjectTreeModel(inspectionRoots(), m_options, m_icons, dialog).release();
    dialog->setModel(model);
    dialog->restoreSettings();
    m_treeDialog = dialog;
    dialog->show();
}

void MainWindow::showOptionsDialog() {
    OptionsDialog dlg(m_options, this);
    if (dlg.exec() != QDialog::Accepted)
        return;
    m_options = dlg.result();
    QSettings settings("objtree", "objtree");
    m_options.save(settings);
    qDebug() << "MainWindow: Options saved, child limit" << m_options.childLimit;
}

void MainWindow::onActivated() {
    ++m_activations;
    statusBar()->showMessage(QStringLiteral("Activated %1 time(s)").arg(m_activations), 2000);
}

} // namespace otv

// ── Entry point ──

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    app.setApplicationName("objtree");
    app.setOrganizationName("objtree");

    otv::MainWindow window;
    window.controller()->show();

    return app.exec();
}
