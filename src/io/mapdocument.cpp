#include "io/mapdocument.h"
#include "geometry/geometrymodel.h"
#include <QFile>
#include <QFileInfo>
#include <QSaveFile>
#include <QDebug>

MapDocument::MapDocument(GeometryModel* model, QObject *parent)
    : QObject(parent)
    , m_model(model)
{
}

bool MapDocument::load(const QString& filePath)
{
    m_lastError.clear();

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return fail(GeoErrorCode::FileIo,
                    QString("Cannot open %1: %2").arg(filePath, file.errorString()));
    }
    QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        return fail(GeoErrorCode::FileIo,
                    QString("Cannot read %1: %2").arg(filePath, file.errorString()));
    }
    file.close();

    QString text = QString::fromUtf8(data);
    if (text.startsWith(QChar(0xFEFF))) text.remove(0, 1);

    Scene scene;
    if (!m_codec.parse(text, &scene)) {
        GeoError error = m_codec.lastError();
        return fail(error.code, error.message, error.line);
    }

    m_warnings = m_codec.warnings();
    m_model->setScene(scene);
    setFilePath(filePath);

    qDebug() << "[MapDocument] Loaded" << scene.size() << "primitives from" << filePath;
    emit loaded(filePath);
    return true;
}

bool MapDocument::save()
{
    if (m_filePath.isEmpty()) {
        m_lastError.clear();
        return fail(GeoErrorCode::FileIo, "No file to save");
    }
    return saveAs(m_filePath);
}

bool MapDocument::saveAs(const QString& filePath)
{
    m_lastError.clear();

    QSaveFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        return fail(GeoErrorCode::FileIo,
                    QString("Cannot write %1: %2").arg(filePath, file.errorString()));
    }

    QByteArray data = m_codec.serialize(m_model->scene()).toUtf8();
    if (file.write(data) != data.size()) {
        QString reason = file.errorString();
        file.cancelWriting();
        return fail(GeoErrorCode::FileIo, QString("Cannot write %1: %2").arg(filePath, reason));
    }
    if (!file.commit()) {
        return fail(GeoErrorCode::FileIo,
                    QString("Cannot write %1: %2").arg(filePath, file.errorString()));
    }

    m_model->setModified(false);
    setFilePath(filePath);

    qDebug() << "[MapDocument] Saved" << m_model->count() << "primitives to" << filePath;
    emit saved(filePath);
    return true;
}

void MapDocument::newDocument()
{
    m_lastError.clear();
    m_warnings.clear();
    m_model->clear();
    setFilePath(QString());
}

QString MapDocument::displayName() const
{
    if (m_filePath.isEmpty()) return QStringLiteral("Untitled");
    return QFileInfo(m_filePath).fileName();
}

bool MapDocument::fail(GeoErrorCode code, const QString& message, int line)
{
    m_lastError = GeoError(code, message, line);
    qWarning() << "[MapDocument]" << m_lastError.toString();
    return false;
}

void MapDocument::setFilePath(const QString& filePath)
{
    if (m_filePath == filePath) return;
    m_filePath = filePath;
    emit filePathChanged(m_filePath);
}
