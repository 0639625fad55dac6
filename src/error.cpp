#include "geokit/error.hpp"

#include <utility>

namespace geokit {

    const char *errcName(Errc code) {
        switch (code) {
        case Errc::UnknownGeometryType:
            return "UnknownGeometryType";
        case Errc::MalformedCoordinates:
            return "MalformedCoordinates";
        case Errc::MalformedGeometry:
            return "MalformedGeometry";
        case Errc::GeometryKindMismatch:
            return "GeometryKindMismatch";
        case Errc::UnknownEnvelopeType:
            return "UnknownEnvelopeType";
        case Errc::MissingFeaturesArray:
            return "MissingFeaturesArray";
        case Errc::MalformedFeature:
            return "MalformedFeature";
        case Errc::PropertyDecodeError:
            return "PropertyDecodeError";
        case Errc::MalformedJSON:
            return "MalformedJSON";
        }
        return "Unknown";
    }

    Error::Error(Errc code, std::string path, const std::string &message)
        : std::runtime_error("geokit: " + path + ": " + message), code_(code), path_(std::move(path)) {}

} // namespace geokit
