#ifndef GEOERROR_H
#define GEOERROR_H

#include <QString>

// Failure categories reported by the scene codec, the geometry model and
// the document layer.
enum class GeoErrorCode {
    None,
    Format,             // Malformed record in a scene file
    InvalidGeometry,    // Too few vertices or a non-finite coordinate
    NotFound,           // Unknown primitive id
    IndexOutOfRange,    // Vertex index outside the primitive
    FileIo              // File could not be opened, read or written
};

struct GeoError {
    GeoErrorCode code{GeoErrorCode::None};
    int line{0};        // 1-based source line for Format errors, 0 otherwise
    QString message;

    GeoError() = default;
    GeoError(GeoErrorCode c, const QString& msg, int lineNumber = 0)
        : code(c), line(lineNumber), message(msg) {}

    bool isError() const { return code != GeoErrorCode::None; }
    void clear() { code = GeoErrorCode::None; line = 0; message.clear(); }

    // "Line 3: Invalid coordinate 'abc'" for format errors, the bare
    // message otherwise.
    QString toString() const;
};

QString geoErrorCodeName(GeoErrorCode code);

#endif // GEOERROR_H
