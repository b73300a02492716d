#ifndef MAPDOCUMENT_H
#define MAPDOCUMENT_H

#include <QObject>
#include <QString>
#include <QStringList>
#include "core/geoerror.h"
#include "io/scenecodec.h"

class GeometryModel;

// Binds a GeometryModel to a scene file on disk. A failed load never
// touches the model, so the scene that was open before stays on screen.
class MapDocument : public QObject {
    Q_OBJECT

public:
    explicit MapDocument(GeometryModel* model, QObject *parent = nullptr);

    GeometryModel* model() const { return m_model; }

    bool load(const QString& filePath);
    bool save();
    bool saveAs(const QString& filePath);
    void newDocument();

    QString filePath() const { return m_filePath; }
    bool hasFilePath() const { return !m_filePath.isEmpty(); }
    QString displayName() const;

    SceneCodec::ParseMode parseMode() const { return m_codec.parseMode(); }
    void setParseMode(SceneCodec::ParseMode mode) { m_codec.setParseMode(mode); }

    // Lenient-mode warnings of the last successful load.
    QStringList warnings() const { return m_warnings; }
    GeoError lastError() const { return m_lastError; }

signals:
    void filePathChanged(const QString& filePath);
    void loaded(const QString& filePath);
    void saved(const QString& filePath);

private:
    bool fail(GeoErrorCode code, const QString& message, int line = 0);
    void setFilePath(const QString& filePath);

    GeometryModel* m_model{nullptr};
    SceneCodec m_codec;
    QString m_filePath;
    QStringList m_warnings;
    GeoError m_lastError;
};

#endif // MAPDOCUMENT_H
