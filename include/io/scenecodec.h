#ifndef SCENECODEC_H
#define SCENECODEC_H

#include <QString>
#include <QStringList>
#include <QVector>
#include "core/geoerror.h"
#include "geometry/primitive.h"

// Reads and writes the line oriented scene format:
//
//   # comment
//   POINT   x y
//   LINE    x1 y1 x2 y2 [...]
//   POLYGON x1 y1 x2 y2 x3 y3 [...]
//
// Tags are case-insensitive and tokens are separated by whitespace.
// Untagged records ("x y", "x1 y1 x2 y2", "x1 y1 ... xn yn") written by
// older versions are still accepted and classified by coordinate count.
class SceneCodec {
public:
    enum class ParseMode {
        Strict,     // First malformed line aborts the parse
        Lenient     // Malformed lines are skipped and reported as warnings
    };

    SceneCodec() = default;
    explicit SceneCodec(ParseMode mode) : m_mode(mode) {}

    ParseMode parseMode() const { return m_mode; }
    void setParseMode(ParseMode mode) { m_mode = mode; }

    // On success replaces *scene and returns true. On failure *scene is
    // left as it was and lastError() names the offending line.
    bool parse(const QString& text, Scene* scene);

    QString serialize(const Scene& scene) const;

    static QString formatRecord(const Primitive& primitive);
    static QString formatNumber(double value);

    GeoError lastError() const { return m_lastError; }
    // Lines skipped by the last lenient parse, as "Line N: reason".
    QStringList warnings() const { return m_warnings; }

private:
    bool parseRecord(const QString& line, int lineNumber, PrimitiveKind* kind, QVector<QPointF>* points);

    ParseMode m_mode{ParseMode::Strict};
    GeoError m_lastError;
    QStringList m_warnings;
};

#endif // SCENECODEC_H
