#include "geokit/shape.hpp"

namespace geokit {

    const ShapeRule &shapeRule(GeometryKind kind) { return kShapeTable[static_cast<std::size_t>(kind)]; }

    const char *kindName(GeometryKind kind) { return shapeRule(kind).tag.data(); }

} // namespace geokit
