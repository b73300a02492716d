#ifndef PRIMITIVE_H
#define PRIMITIVE_H

#include <QString>
#include <QVector>
#include <QPointF>
#include <QRectF>

// Identifier of a primitive within its scene. Ids start at 1; 0 means
// "no primitive".
using PrimitiveId = int;
constexpr PrimitiveId InvalidPrimitiveId = 0;

enum class PrimitiveKind {
    Point,      // Exactly one coordinate
    Line,       // Open polyline, two or more coordinates
    Polygon     // Implicitly closed ring, three or more coordinates
};

// A point, line or polygon. Coordinates are stored by value so that no
// primitive ever refers to another. Equality compares kind and coordinates,
// never the id.
struct Primitive {
    PrimitiveId id{InvalidPrimitiveId};
    PrimitiveKind kind{PrimitiveKind::Point};
    QVector<QPointF> points;

    Primitive() = default;
    Primitive(PrimitiveKind k, const QVector<QPointF>& pts, PrimitiveId primitiveId = InvalidPrimitiveId)
        : id(primitiveId), kind(k), points(pts) {}

    bool isClosed() const { return kind == PrimitiveKind::Polygon; }
    QPointF position() const { return points.isEmpty() ? QPointF() : points.first(); }
    QRectF bounds() const;

    bool operator==(const Primitive& other) const;
    bool operator!=(const Primitive& other) const { return !(*this == other); }
};

// Minimum number of coordinates a primitive of this kind must carry.
int minimumPointCount(PrimitiveKind kind);

// "POINT", "LINE", "POLYGON" - the record tags of the scene file format.
QString primitiveKindTag(PrimitiveKind kind);
bool primitiveKindFromTag(const QString& tag, PrimitiveKind* kind);

// Human readable name used in status messages ("point", "line", "polygon").
QString primitiveKindName(PrimitiveKind kind);

// Checks vertex count and finiteness. On failure returns false and fills
// reason (if given) with a user readable explanation.
bool isValidGeometry(PrimitiveKind kind, const QVector<QPointF>& points, QString* reason = nullptr);

// All primitives currently loaded or edited, in insertion order.
struct Scene {
    QVector<Primitive> primitives;
    PrimitiveId nextId{1};

    void clear() {
        primitives.clear();
        nextId = 1;
    }

    bool isEmpty() const { return primitives.isEmpty(); }
    int size() const { return primitives.size(); }
    int count(PrimitiveKind kind) const;

    int indexOf(PrimitiveId id) const;
    const Primitive* find(PrimitiveId id) const;
    Primitive* find(PrimitiveId id);

    // Appends without validation and returns the assigned id.
    PrimitiveId append(PrimitiveKind kind, const QVector<QPointF>& points);

    // Bounding rectangle of every vertex; null when the scene is empty.
    QRectF extent() const;

    bool operator==(const Scene& other) const { return primitives == other.primitives; }
    bool operator!=(const Scene& other) const { return !(*this == other); }
};

#endif // PRIMITIVE_H
