#ifndef TEST_COMMON_H
#define TEST_COMMON_H

#include <gtest/gtest.h>
#include <QString>
#include <QPointF>
#include <QVector>
#include <ostream>
#include "geometry/primitive.h"

// Readable gtest failure output for the Qt types used in assertions
inline void PrintTo(const QString& value, std::ostream* os)
{
    *os << '"' << value.toStdString() << '"';
}

inline void PrintTo(const QPointF& value, std::ostream* os)
{
    *os << '(' << value.x() << ", " << value.y() << ')';
}

inline void PrintTo(const Primitive& value, std::ostream* os)
{
    *os << primitiveKindTag(value.kind).toStdString() << '#' << value.id;
    for (const QPointF& p : value.points) {
        *os << ' ';
        PrintTo(p, os);
    }
}

inline void PrintTo(const Scene& value, std::ostream* os)
{
    *os << '{';
    for (const Primitive& p : value.primitives) {
        *os << ' ';
        PrintTo(p, os);
        *os << ';';
    }
    *os << " }";
}

namespace test_util {

inline QVector<QPointF> pts(std::initializer_list<QPointF> list)
{
    return QVector<QPointF>(list);
}

inline QVector<QPointF> unitSquare(double size = 10.0)
{
    return pts({ QPointF(0, 0), QPointF(size, 0), QPointF(size, size), QPointF(0, size) });
}

// One point, one line and one polygon in insertion order
inline Scene mixedScene()
{
    Scene scene;
    scene.append(PrimitiveKind::Point, pts({ QPointF(1, 2) }));
    scene.append(PrimitiveKind::Line, pts({ QPointF(0, 0), QPointF(5, 5), QPointF(10, 0) }));
    scene.append(PrimitiveKind::Polygon, unitSquare());
    return scene;
}

} // namespace test_util

#define EXPECT_POINT_NEAR(actual, expected, tol)       \
    do {                                               \
        const QPointF a_ = (actual);                   \
        const QPointF e_ = (expected);                 \
        EXPECT_NEAR(a_.x(), e_.x(), (tol));            \
        EXPECT_NEAR(a_.y(), e_.y(), (tol));            \
    } while (0)

#endif // TEST_COMMON_H
