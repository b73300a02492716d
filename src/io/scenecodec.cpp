#include "io/scenecodec.h"
#include <QLocale>
#include <QRegularExpression>
#include <QtMath>
#include <QDebug>

bool SceneCodec::parse(const QString& text, Scene* scene)
{
    m_lastError.clear();
    m_warnings.clear();

    Scene parsed;
    static const QRegularExpression lineBreak("\r\n|\n|\r");
    const QStringList lines = text.split(lineBreak);

    for (int i = 0; i < lines.size(); ++i) {
        const QString line = lines[i].trimmed();
        if (line.isEmpty() || line.startsWith('#')) continue;

        PrimitiveKind kind;
        QVector<QPointF> points;
        if (!parseRecord(line, i + 1, &kind, &points)) {
            if (m_mode == ParseMode::Strict) {
                qDebug() << "[SceneCodec]" << m_lastError.toString();
                return false;
            }
            m_warnings.append(m_lastError.toString());
            m_lastError.clear();
            continue;
        }
        parsed.append(kind, points);
    }

    if (!m_warnings.isEmpty()) {
        qDebug() << "[SceneCodec] Skipped" << m_warnings.size() << "malformed lines";
    }
    if (scene) *scene = parsed;
    return true;
}

QString SceneCodec::serialize(const Scene& scene) const
{
    QString out;
    for (const auto& primitive : scene.primitives) {
        out += formatRecord(primitive);
        out += '\n';
    }
    return out;
}

QString SceneCodec::formatRecord(const Primitive& primitive)
{
    QStringList parts;
    parts.reserve(1 + primitive.points.size() * 2);
    parts << primitiveKindTag(primitive.kind);
    for (const QPointF& p : primitive.points) {
        parts << formatNumber(p.x()) << formatNumber(p.y());
    }
    return parts.join(' ');
}

QString SceneCodec::formatNumber(double value)
{
    // Shortest representation that reads back to the same double
    return QString::number(value, 'g', QLocale::FloatingPointShortest);
}

bool SceneCodec::parseRecord(const QString& line, int lineNumber, PrimitiveKind* kind, QVector<QPointF>* points)
{
    static const QRegularExpression whitespace("\\s+");
    QStringList tokens = line.split(whitespace, Qt::SkipEmptyParts);

    QLocale c = QLocale::c();
    c.setNumberOptions(QLocale::RejectGroupSeparator);
    bool tagged = false;
    PrimitiveKind recordKind = PrimitiveKind::Point;

    if (primitiveKindFromTag(tokens.first(), &recordKind)) {
        tagged = true;
        tokens.removeFirst();
    } else {
        bool isNumber = false;
        c.toDouble(tokens.first(), &isNumber);
        if (!isNumber) {
            m_lastError = GeoError(GeoErrorCode::Format,
                                   QString("Unknown record type '%1'").arg(tokens.first()), lineNumber);
            return false;
        }
    }

    QVector<double> values;
    values.reserve(tokens.size());
    for (const QString& token : tokens) {
        bool ok = false;
        double v = c.toDouble(token, &ok);
        if (!ok) {
            m_lastError = GeoError(GeoErrorCode::Format,
                                   QString("Invalid coordinate '%1'").arg(token), lineNumber);
            return false;
        }
        if (!qIsFinite(v)) {
            m_lastError = GeoError(GeoErrorCode::Format,
                                   QString("Coordinate '%1' is not finite").arg(token), lineNumber);
            return false;
        }
        values.append(v);
    }

    if (values.size() % 2 != 0) {
        m_lastError = GeoError(GeoErrorCode::Format,
                               QString("Odd number of coordinates (%1)").arg(values.size()), lineNumber);
        return false;
    }

    const int pairCount = values.size() / 2;
    if (!tagged) {
        // Untagged records: 2 numbers are a point, 4 a line, 6 or more a polygon
        if (pairCount == 1) {
            recordKind = PrimitiveKind::Point;
        } else if (pairCount == 2) {
            recordKind = PrimitiveKind::Line;
        } else if (pairCount >= 3) {
            recordKind = PrimitiveKind::Polygon;
        } else {
            m_lastError = GeoError(GeoErrorCode::Format, "Record has no coordinates", lineNumber);
            return false;
        }
    } else if (recordKind == PrimitiveKind::Point && pairCount != 1) {
        m_lastError = GeoError(GeoErrorCode::Format,
                               QString("POINT takes exactly 1 coordinate pair, got %1").arg(pairCount),
                               lineNumber);
        return false;
    } else if (pairCount < minimumPointCount(recordKind)) {
        m_lastError = GeoError(GeoErrorCode::Format,
                               QString("%1 needs at least %2 coordinate pairs, got %3")
                                   .arg(primitiveKindTag(recordKind))
                                   .arg(minimumPointCount(recordKind))
                                   .arg(pairCount),
                               lineNumber);
        return false;
    }

    points->clear();
    points->reserve(pairCount);
    for (int i = 0; i < pairCount; ++i) {
        points->append(QPointF(values[2 * i], values[2 * i + 1]));
    }
    *kind = recordKind;
    return true;
}
