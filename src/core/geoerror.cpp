#include "core/geoerror.h"

QString GeoError::toString() const
{
    if (code == GeoErrorCode::Format && line > 0) {
        return QString("Line %1: %2").arg(line).arg(message);
    }
    return message;
}

QString geoErrorCodeName(GeoErrorCode code)
{
    switch (code) {
        case GeoErrorCode::None:            return "None";
        case GeoErrorCode::Format:          return "FormatError";
        case GeoErrorCode::InvalidGeometry: return "InvalidGeometryError";
        case GeoErrorCode::NotFound:        return "NotFoundError";
        case GeoErrorCode::IndexOutOfRange: return "IndexOutOfRangeError";
        case GeoErrorCode::FileIo:          return "FileError";
    }
    return "Unknown";
}
