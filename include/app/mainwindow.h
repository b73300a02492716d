#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>
#include "canvas/viewportcontroller.h"

class GeometryModel;
class MapDocument;
class MapCanvas;
class QLabel;
class QLineEdit;
class QAction;
class QActionGroup;
class QMenu;

class MainWindow : public QMainWindow
{
    Q_OBJECT

public:
    explicit MainWindow(QWidget *parent = nullptr);
    ~MainWindow();

    MapCanvas* canvas() const { return m_canvas; }
    MapDocument* document() const { return m_document; }

    // Load a scene file, asking first if the current one has unsaved edits.
    bool openFile(const QString& filePath);

protected:
    void closeEvent(QCloseEvent *event) override;

private slots:
    void newFile();
    void browse();
    void loadFromPathEdit();
    bool save();
    bool saveAs();
    void importGDAL();
    void exportGDAL();
    void checkGeometry();
    void openRecentFile();
    void updateRecentFilesMenu();
    void updateCoordinates(const QPointF& pos);
    void updateZoom(double zoom);
    void updateSelectionSummary();
    void updateTitle();
    void onToolChanged(EditTool tool);
    void showStatus(const QString& message);

private:
    void setupCentralWidget();
    void setupMenus();
    void setupToolbar();
    void setupStatusBar();
    void applySettings();
    bool maybeSave();
    QString dialogDirectory() const;
    void rememberDirectory(const QString& filePath);

    GeometryModel* m_model{nullptr};
    MapDocument* m_document{nullptr};
    ViewportController* m_controller{nullptr};
    MapCanvas* m_canvas{nullptr};

    QLineEdit* m_pathEdit{nullptr};
    QLabel* m_coordLabel{nullptr};
    QLabel* m_zoomLabel{nullptr};
    QLabel* m_selectionLabel{nullptr};

    QMenu* m_recentMenu{nullptr};
    QActionGroup* m_toolGroup{nullptr};
    QAction* m_selectToolAction{nullptr};
    QAction* m_panToolAction{nullptr};
    QAction* m_pointToolAction{nullptr};
    QAction* m_lineToolAction{nullptr};
    QAction* m_polygonToolAction{nullptr};
    QAction* m_deleteAction{nullptr};
    QAction* m_zoomInAction{nullptr};
    QAction* m_zoomOutAction{nullptr};
    QAction* m_fitAction{nullptr};
};

#endif // MAINWINDOW_H
