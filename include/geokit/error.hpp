#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace geokit {

    enum class Errc {
        UnknownGeometryType,
        MalformedCoordinates,
        MalformedGeometry,
        GeometryKindMismatch,
        UnknownEnvelopeType,
        MissingFeaturesArray,
        MalformedFeature,
        PropertyDecodeError,
        MalformedJSON
    };

    const char *errcName(Errc code);

    // Thrown by every decode entry point. `path` locates the offending node,
    // e.g. "$.features[1].geometry.coordinates[0]".
    class Error : public std::runtime_error {
      public:
        Error(Errc code, std::string path, const std::string &message);

        Errc code() const noexcept { return code_; }
        const std::string &path() const noexcept { return path_; }

      private:
        Errc code_;
        std::string path_;
    };

    namespace detail {
        // JSON path helpers used while descending into a node tree.
        inline std::string member_path(const std::string &parent, const char *key) { return parent + "." + key; }

        inline std::string index_path(const std::string &parent, std::size_t index) {
            return parent + "[" + std::to_string(index) + "]";
        }
    } // namespace detail

} // namespace geokit
