#include "app/mainwindow.h"
#include "appsettings.h"
#include "canvas/mapcanvas.h"
#include "canvas/viewportcontroller.h"
#include "geometry/geometrymodel.h"
#include "io/mapdocument.h"
#include "gdal/gdalreader.h"
#include "gdal/gdalwriter.h"
#include "gdal/geosbridge.h"

#include <QApplication>
#include <QAction>
#include <QActionGroup>
#include <QMenuBar>
#include <QMenu>
#include <QToolBar>
#include <QStatusBar>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QHBoxLayout>
#include <QVBoxLayout>
#include <QFileDialog>
#include <QFileInfo>
#include <QMessageBox>
#include <QInputDialog>
#include <QColorDialog>
#include <QCloseEvent>
#include <QDebug>

namespace {

const int kMaxListedWarnings = 10;

QString formatCoord(double v)
{
    return QString::number(v, 'f', 3);
}

}

MainWindow::MainWindow(QWidget *parent)
    : QMainWindow(parent)
{
    m_model = new GeometryModel(this);
    m_document = new MapDocument(m_model, this);
    m_controller = new ViewportController(m_model, this);

    setupCentralWidget();
    setupMenus();
    setupToolbar();
    setupStatusBar();
    applySettings();

    connect(m_controller, &ViewportController::cursorWorldPosition, this, &MainWindow::updateCoordinates);
    connect(m_controller, &ViewportController::zoomChanged, this, &MainWindow::updateZoom);
    connect(m_controller, &ViewportController::selectionChanged, this, &MainWindow::updateSelectionSummary);
    connect(m_controller, &ViewportController::toolChanged, this, &MainWindow::onToolChanged);
    connect(m_controller, &ViewportController::statusMessage, this, &MainWindow::showStatus);
    connect(m_model, &GeometryModel::primitiveChanged, this, &MainWindow::updateSelectionSummary);
    connect(m_model, &GeometryModel::primitiveAdded, this, &MainWindow::updateSelectionSummary);
    connect(m_model, &GeometryModel::sceneReset, this, &MainWindow::updateSelectionSummary);
    connect(m_model, &GeometryModel::primitiveRemoved, this, &MainWindow::updateSelectionSummary);
    connect(m_model, &GeometryModel::modifiedChanged, this, &MainWindow::updateTitle);
    connect(m_document, &MapDocument::filePathChanged, this, &MainWindow::updateTitle);
    connect(m_document, &MapDocument::filePathChanged, m_pathEdit, &QLineEdit::setText);

    // Default geometry unless a previous session saved one
    resize(800, 600);
    move(100, 100);
    const QByteArray geometry = AppSettings::windowGeometry();
    if (!geometry.isEmpty()) restoreGeometry(geometry);

    updateTitle();
    updateZoom(m_controller->viewport().zoom());
    updateSelectionSummary();
}

MainWindow::~MainWindow()
{
}

void MainWindow::setupCentralWidget()
{
    QWidget* central = new QWidget(this);
    QVBoxLayout* layout = new QVBoxLayout(central);
    layout->setContentsMargins(4, 4, 4, 4);
    layout->setSpacing(4);

    // File path row
    QHBoxLayout* pathRow = new QHBoxLayout();
    m_pathEdit = new QLineEdit();
    m_pathEdit->setObjectName("pathEdit");
    m_pathEdit->setPlaceholderText("Path to a scene file, press Enter to load");
    connect(m_pathEdit, &QLineEdit::returnPressed, this, &MainWindow::loadFromPathEdit);
    pathRow->addWidget(m_pathEdit);

    QPushButton* browseBtn = new QPushButton("Browse...");
    connect(browseBtn, &QPushButton::clicked, this, &MainWindow::browse);
    pathRow->addWidget(browseBtn);
    layout->addLayout(pathRow);

    m_canvas = new MapCanvas(m_model, m_controller);
    layout->addWidget(m_canvas, 1);

    setCentralWidget(central);
}

void MainWindow::setupMenus()
{
    // File menu
    QMenu* fileMenu = menuBar()->addMenu("&File");

    QAction* newAction = fileMenu->addAction("&New");
    newAction->setShortcut(QKeySequence::New);
    connect(newAction, &QAction::triggered, this, &MainWindow::newFile);

    QAction* openAction = fileMenu->addAction("&Open...");
    openAction->setShortcut(QKeySequence::Open);
    connect(openAction, &QAction::triggered, this, &MainWindow::browse);

    m_recentMenu = fileMenu->addMenu("Recent &Files");
    updateRecentFilesMenu();

    QAction* saveAction = fileMenu->addAction("&Save");
    saveAction->setShortcut(QKeySequence::Save);
    connect(saveAction, &QAction::triggered, this, &MainWindow::save);

    QAction* saveAsAction = fileMenu->addAction("Save &As...");
    saveAsAction->setShortcut(QKeySequence::SaveAs);
    connect(saveAsAction, &QAction::triggered, this, &MainWindow::saveAs);

    fileMenu->addSeparator();

    QAction* importAction = fileMenu->addAction("&Import GIS Data...");
    connect(importAction, &QAction::triggered, this, &MainWindow::importGDAL);

    QAction* exportAction = fileMenu->addAction("&Export GIS Data...");
    connect(exportAction, &QAction::triggered, this, &MainWindow::exportGDAL);

    fileMenu->addSeparator();

    QAction* exitAction = fileMenu->addAction("E&xit");
    exitAction->setShortcut(QKeySequence::Quit);
    connect(exitAction, &QAction::triggered, this, &QWidget::close);

    // Edit menu
    QMenu* editMenu = menuBar()->addMenu("&Edit");

    m_deleteAction = editMenu->addAction("&Delete");
    m_deleteAction->setShortcut(QKeySequence::Delete);
    m_deleteAction->setShortcutContext(Qt::WidgetWithChildrenShortcut);
    m_canvas->addAction(m_deleteAction);
    connect(m_deleteAction, &QAction::triggered, m_controller, &ViewportController::deleteSelection);

    QAction* clearSelAction = editMenu->addAction("Clear &Selection");
    connect(clearSelAction, &QAction::triggered, m_controller, &ViewportController::clearSelection);

    // View menu
    QMenu* viewMenu = menuBar()->addMenu("&View");

    m_zoomInAction = viewMenu->addAction("Zoom &In");
    m_zoomInAction->setShortcut(QKeySequence::ZoomIn);
    connect(m_zoomInAction, &QAction::triggered, m_controller, &ViewportController::zoomIn);

    m_zoomOutAction = viewMenu->addAction("Zoom &Out");
    m_zoomOutAction->setShortcut(QKeySequence::ZoomOut);
    connect(m_zoomOutAction, &QAction::triggered, m_controller, &ViewportController::zoomOut);

    m_fitAction = viewMenu->addAction("&Fit to Scene");
    m_fitAction->setShortcut(QKeySequence("F"));
    connect(m_fitAction, &QAction::triggered, m_controller, &ViewportController::fitToScene);

    QAction* resetAction = viewMenu->addAction("&Reset View");
    connect(resetAction, &QAction::triggered, m_controller, &ViewportController::resetView);

    viewMenu->addSeparator();

    QAction* gridAction = viewMenu->addAction("Show &Grid");
    gridAction->setCheckable(true);
    gridAction->setChecked(AppSettings::showGrid());
    connect(gridAction, &QAction::toggled, this, [this](bool on) {
        m_canvas->setShowGrid(on);
        AppSettings::setShowGrid(on);
    });

    QAction* spacingAction = viewMenu->addAction("Grid S&pacing...");
    connect(spacingAction, &QAction::triggered, this, [this]() {
        bool ok = false;
        double spacing = QInputDialog::getDouble(this, "Grid Spacing", "Grid spacing (world units):",
                                                 m_canvas->gridSpacing(), 0.001, 1e9, 3, &ok);
        if (ok) {
            m_canvas->setGridSpacing(spacing);
            AppSettings::setGridSpacing(spacing);
        }
    });

    QAction* backgroundAction = viewMenu->addAction("&Background Color...");
    connect(backgroundAction, &QAction::triggered, this, [this]() {
        QColor color = QColorDialog::getColor(m_canvas->backgroundColor(), this, "Background Color");
        if (color.isValid()) {
            m_canvas->setBackgroundColor(color);
            AppSettings::setBackgroundColor(color);
        }
    });

    // Tools menu
    QMenu* toolsMenu = menuBar()->addMenu("&Tools");

    m_toolGroup = new QActionGroup(this);
    m_toolGroup->setExclusive(true);

    auto addTool = [this, toolsMenu](const QString& text, const QString& shortcut, EditTool tool) {
        QAction* action = toolsMenu->addAction(text);
        action->setCheckable(true);
        action->setShortcut(QKeySequence(shortcut));
        action->setData(static_cast<int>(tool));
        m_toolGroup->addAction(action);
        connect(action, &QAction::triggered, this, [this, tool]() { m_controller->setTool(tool); });
        return action;
    };
    m_selectToolAction = addTool("&Select", "S", EditTool::Select);
    m_panToolAction = addTool("&Pan", "H", EditTool::Pan);
    m_pointToolAction = addTool("Add P&oint", "P", EditTool::AddPoint);
    m_lineToolAction = addTool("Draw &Line", "L", EditTool::DrawLine);
    m_polygonToolAction = addTool("Draw Pol&ygon", "G", EditTool::DrawPolygon);
    m_selectToolAction->setChecked(true);

    toolsMenu->addSeparator();

    QAction* checkAction = toolsMenu->addAction("&Check Geometry");
    connect(checkAction, &QAction::triggered, this, &MainWindow::checkGeometry);

    QAction* strictAction = toolsMenu->addAction("S&trict File Parsing");
    strictAction->setCheckable(true);
    strictAction->setChecked(AppSettings::strictParsing());
    connect(strictAction, &QAction::toggled, this, [this](bool strict) {
        AppSettings::setStrictParsing(strict);
        m_document->setParseMode(strict ? SceneCodec::ParseMode::Strict : SceneCodec::ParseMode::Lenient);
        showStatus(strict ? "Strict parsing: files with errors are rejected"
                          : "Lenient parsing: bad lines are skipped with a warning");
    });
}

void MainWindow::setupToolbar()
{
    QToolBar* toolbar = addToolBar("Tools");
    toolbar->setObjectName("mainToolbar");
    toolbar->setMovable(false);

    toolbar->addAction(m_selectToolAction);
    toolbar->addAction(m_panToolAction);
    toolbar->addAction(m_pointToolAction);
    toolbar->addAction(m_lineToolAction);
    toolbar->addAction(m_polygonToolAction);
    toolbar->addSeparator();
    toolbar->addAction(m_zoomInAction);
    toolbar->addAction(m_zoomOutAction);
    toolbar->addAction(m_fitAction);
    toolbar->addSeparator();
    toolbar->addAction(m_deleteAction);
}

void MainWindow::setupStatusBar()
{
    m_coordLabel = new QLabel("X: 0.000  Y: 0.000");
    m_coordLabel->setMinimumWidth(200);
    statusBar()->addWidget(m_coordLabel);

    m_selectionLabel = new QLabel("");
    m_selectionLabel->setObjectName("selectionLabel");
    m_selectionLabel->setMinimumWidth(200);
    statusBar()->addPermanentWidget(m_selectionLabel);

    m_zoomLabel = new QLabel("Zoom: 100%");
    m_zoomLabel->setMinimumWidth(100);
    statusBar()->addPermanentWidget(m_zoomLabel);
}

void MainWindow::applySettings()
{
    m_controller->setZoomStep(AppSettings::zoomStep());
    m_controller->setZoomLimits(AppSettings::minZoom(), AppSettings::maxZoom());
    m_controller->setPickTolerance(AppSettings::pickTolerance());

    m_canvas->setShowGrid(AppSettings::showGrid());
    m_canvas->setGridSpacing(AppSettings::gridSpacing());
    m_canvas->setBackgroundColor(AppSettings::backgroundColor());

    m_document->setParseMode(AppSettings::strictParsing() ? SceneCodec::ParseMode::Strict
                                                          : SceneCodec::ParseMode::Lenient);
}

bool MainWindow::openFile(const QString& filePath)
{
    if (filePath.trimmed().isEmpty()) return false;
    if (!maybeSave()) {
        m_pathEdit->setText(m_document->filePath());
        return false;
    }

    QApplication::setOverrideCursor(Qt::WaitCursor);
    bool success = m_document->load(filePath);
    QApplication::restoreOverrideCursor();

    if (!success) {
        // The field shows the document that is actually open
        m_pathEdit->setText(m_document->filePath());
        const GeoError error = m_document->lastError();
        QMessageBox::warning(this, "Load Error",
            QString("Failed to load file:\n%1\n\n%2: %3")
                .arg(filePath)
                .arg(geoErrorCodeName(error.code))
                .arg(error.toString()));
        return false;
    }

    rememberDirectory(filePath);
    AppSettings::addRecentFile(QFileInfo(filePath).absoluteFilePath());
    updateRecentFilesMenu();
    m_controller->fitToScene();

    if (m_model->isEmpty()) {
        showStatus(QString("File is empty: %1").arg(m_document->displayName()));
    } else {
        showStatus(QString("Loaded %1 primitives (%2 points, %3 lines, %4 polygons)")
            .arg(m_model->count())
            .arg(m_model->scene().count(PrimitiveKind::Point))
            .arg(m_model->scene().count(PrimitiveKind::Line))
            .arg(m_model->scene().count(PrimitiveKind::Polygon)));
    }

    const QStringList warnings = m_document->warnings();
    if (!warnings.isEmpty()) {
        QStringList listed = warnings.mid(0, kMaxListedWarnings);
        if (warnings.size() > kMaxListedWarnings) {
            listed << QString("... and %1 more").arg(warnings.size() - kMaxListedWarnings);
        }
        QMessageBox::information(this, "Skipped Lines",
            QString("%1 line(s) could not be read and were skipped:\n\n%2")
                .arg(warnings.size())
                .arg(listed.join("\n")));
    }
    return true;
}

void MainWindow::newFile()
{
    if (!maybeSave()) return;
    m_document->newDocument();
    m_controller->resetView();
    showStatus("New scene");
}

void MainWindow::browse()
{
    QString fileName = QFileDialog::getOpenFileName(this, "Open Scene", dialogDirectory(),
                                                    "Text files (*.txt);;All Files (*)");
    if (fileName.isEmpty()) return;
    m_pathEdit->setText(fileName);
    openFile(fileName);
}

void MainWindow::loadFromPathEdit()
{
    const QString path = m_pathEdit->text().trimmed();
    if (path.isEmpty()) {
        showStatus("Enter a file path to load");
        return;
    }
    openFile(path);
}

bool MainWindow::save()
{
    if (!m_document->hasFilePath()) return saveAs();

    if (!m_document->save()) {
        QMessageBox::critical(this, "Save Error", m_document->lastError().toString());
        return false;
    }
    showStatus(QString("Saved %1").arg(m_document->displayName()));
    return true;
}

bool MainWindow::saveAs()
{
    QString fileName = QFileDialog::getSaveFileName(this, "Save Scene", dialogDirectory(),
                                                    "Text files (*.txt);;All Files (*)");
    if (fileName.isEmpty()) return false;
    if (QFileInfo(fileName).suffix().isEmpty()) fileName += ".txt";

    if (!m_document->saveAs(fileName)) {
        QMessageBox::critical(this, "Save Error", m_document->lastError().toString());
        return false;
    }
    rememberDirectory(fileName);
    AppSettings::addRecentFile(QFileInfo(fileName).absoluteFilePath());
    updateRecentFilesMenu();
    showStatus(QString("Saved %1").arg(m_document->displayName()));
    return true;
}

void MainWindow::importGDAL()
{
    if (!maybeSave()) return;

    QString fileName = QFileDialog::getOpenFileName(this,
        "Import GIS Data", dialogDirectory(),
        GdalReader::fileFilter());

    if (fileName.isEmpty()) return;
    rememberDirectory(fileName);

    QApplication::setOverrideCursor(Qt::WaitCursor);

    GdalReader reader;
    bool success = reader.readFile(fileName);

    QApplication::restoreOverrideCursor();

    if (!success) {
        QMessageBox::warning(this, "Import GIS Data",
            QString("Failed to load GIS file:\n%1\n\nError: %2")
                .arg(fileName)
                .arg(reader.lastError()));
        return;
    }

    // Imported data becomes a new unsaved scene
    m_document->newDocument();
    m_model->setScene(reader.scene());
    m_model->setModified(true);
    m_controller->fitToScene();

    QString message = QString("Imported %1 primitives from %2 layer(s)")
        .arg(reader.scene().size())
        .arg(reader.layerCount());
    if (reader.skippedCount() > 0) {
        message += QString(", %1 skipped").arg(reader.skippedCount());
    }
    if (!reader.crs().isEmpty()) {
        message += QString(" [%1]").arg(reader.crs());
    }
    showStatus(message);
}

void MainWindow::exportGDAL()
{
    if (m_model->isEmpty()) {
        showStatus("Nothing to export");
        return;
    }

    QString selectedFilter;
    QString fileName = QFileDialog::getSaveFileName(this, "Export GIS Data", dialogDirectory(),
                                                    GdalWriter::fileFilter(), &selectedFilter);
    if (fileName.isEmpty()) return;

    ExportFormat format = ExportFormat::GeoJSON;
    if (!GdalWriter::formatFromPath(fileName, &format)) {
        GdalWriter::formatFromFilter(selectedFilter, &format);
        fileName += "." + GdalWriter::suffix(format);
    }

    bool ok = false;
    QString crs = QInputDialog::getText(this, "Export GIS Data",
        "Coordinate reference system (e.g. EPSG:4326), leave empty for none:",
        QLineEdit::Normal, QString(), &ok).trimmed();
    if (!ok) return;

    QApplication::setOverrideCursor(Qt::WaitCursor);
    GdalWriter writer;
    bool success = writer.exportScene(m_model->scene(), fileName, format, crs);
    QApplication::restoreOverrideCursor();

    if (success) {
        rememberDirectory(fileName);
        showStatus(QString("Exported to %1 successfully").arg(GdalWriter::driverName(format)));
    } else {
        QMessageBox::warning(this, "Export Error", writer.lastError());
    }
}

void MainWindow::checkGeometry()
{
    const QStringList issues = GeosBridge::checkScene(m_model->scene());
    if (issues.isEmpty()) {
        showStatus("No geometry problems found");
        return;
    }

    QStringList listed = issues.mid(0, kMaxListedWarnings);
    if (issues.size() > kMaxListedWarnings) {
        listed << QString("... and %1 more").arg(issues.size() - kMaxListedWarnings);
    }
    QMessageBox::warning(this, "Check Geometry",
        QString("%1 problem(s) found:\n\n%2").arg(issues.size()).arg(listed.join("\n")));
}

void MainWindow::openRecentFile()
{
    QAction* action = qobject_cast<QAction*>(sender());
    if (!action) return;

    const QString path = action->data().toString();
    if (!QFileInfo::exists(path)) {
        QMessageBox::warning(this, "Recent Files", QString("File not found:\n%1").arg(path));
        QStringList files = AppSettings::recentFiles();
        files.removeAll(path);
        AppSettings::setRecentFiles(files);
        updateRecentFilesMenu();
        return;
    }
    m_pathEdit->setText(path);
    openFile(path);
}

void MainWindow::updateRecentFilesMenu()
{
    m_recentMenu->clear();

    const QStringList files = AppSettings::recentFiles();
    for (const QString& path : files) {
        QAction* action = m_recentMenu->addAction(QFileInfo(path).fileName());
        action->setData(path);
        action->setToolTip(path);
        connect(action, &QAction::triggered, this, &MainWindow::openRecentFile);
    }

    if (files.isEmpty()) {
        QAction* none = m_recentMenu->addAction("(none)");
        none->setEnabled(false);
        return;
    }

    m_recentMenu->addSeparator();
    QAction* clearAction = m_recentMenu->addAction("Clear List");
    connect(clearAction, &QAction::triggered, this, [this]() {
        AppSettings::clearRecentFiles();
        updateRecentFilesMenu();
    });
}

void MainWindow::updateCoordinates(const QPointF& pos)
{
    m_coordLabel->setText(QString("X: %1  Y: %2").arg(formatCoord(pos.x()), formatCoord(pos.y())));
}

void MainWindow::updateZoom(double zoom)
{
    m_zoomLabel->setText(QString("Zoom: %1%").arg(zoom * 100.0, 0, 'g', 4));
}

void MainWindow::updateSelectionSummary()
{
    const QVector<PrimitiveId>& selection = m_controller->selection();
    if (selection.isEmpty()) {
        m_selectionLabel->setText(QString("%1 primitives").arg(m_model->count()));
        return;
    }
    if (selection.size() > 1) {
        m_selectionLabel->setText(QString("%1 selected").arg(selection.size()));
        return;
    }

    const Primitive* primitive = m_model->primitive(selection.first());
    if (!primitive) {
        m_selectionLabel->clear();
        return;
    }

    switch (primitive->kind) {
        case PrimitiveKind::Point:
            m_selectionLabel->setText(QString("Point %1 (%2, %3)")
                .arg(primitive->id)
                .arg(formatCoord(primitive->position().x()), formatCoord(primitive->position().y())));
            break;
        case PrimitiveKind::Line:
            m_selectionLabel->setText(QString("Line %1: %2 vertices, length %3")
                .arg(primitive->id)
                .arg(primitive->points.size())
                .arg(formatCoord(GeosBridge::calculateLength(primitive->points, false))));
            break;
        case PrimitiveKind::Polygon:
        {
            const QPointF centroid = GeosBridge::calculateCentroid(primitive->points);
            m_selectionLabel->setText(QString("Polygon %1: %2 vertices, area %3, perimeter %4, centroid (%5, %6)")
                .arg(primitive->id)
                .arg(primitive->points.size())
                .arg(formatCoord(GeosBridge::calculateArea(primitive->points)))
                .arg(formatCoord(GeosBridge::calculateLength(primitive->points, true)))
                .arg(formatCoord(centroid.x()), formatCoord(centroid.y())));
            break;
        }
    }
}

void MainWindow::updateTitle()
{
    setWindowTitle(QString("Desktop GIS - %1[*]").arg(m_document->displayName()));
    setWindowModified(m_model->isModified());
}

void MainWindow::onToolChanged(EditTool tool)
{
    for (QAction* action : m_toolGroup->actions()) {
        if (action->data().toInt() == static_cast<int>(tool)) {
            action->setChecked(true);
            break;
        }
    }
}

void MainWindow::showStatus(const QString& message)
{
    statusBar()->showMessage(message, AppSettings::statusTimeout());
}

bool MainWindow::maybeSave()
{
    if (!m_model->isModified()) return true;

    QMessageBox::StandardButton reply = QMessageBox::question(
        this, "Unsaved Changes",
        QString("%1 has unsaved changes.\n\nSave them first?").arg(m_document->displayName()),
        QMessageBox::Save | QMessageBox::Discard | QMessageBox::Cancel,
        QMessageBox::Save
    );

    if (reply == QMessageBox::Save) return save();
    return reply == QMessageBox::Discard;
}

QString MainWindow::dialogDirectory() const
{
    if (m_document->hasFilePath()) return QFileInfo(m_document->filePath()).absolutePath();
    return AppSettings::lastDirectory();
}

void MainWindow::rememberDirectory(const QString& filePath)
{
    AppSettings::setLastDirectory(QFileInfo(filePath).absolutePath());
}

void MainWindow::closeEvent(QCloseEvent *event)
{
    if (maybeSave()) {
        AppSettings::setWindowGeometry(saveGeometry());
        event->accept();
    } else {
        event->ignore();
    }
}
