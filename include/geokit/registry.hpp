#pragma once

#include "geokit/types.hpp"

#include <boost/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace geokit {

    using GeometryDecoder = Geometry (*)(boost::json::object const &node, std::string const &path);

    // Immutable "type" tag -> decode routine table, built on first use.
    class GeometryRegistry {
      public:
        static GeometryRegistry const &instance();

        // nullptr when the tag is not registered.
        GeometryDecoder find(std::string_view tag) const;

        // Reads the discriminator of `node` and hands the whole object to the
        // matching routine. Throws Errc::UnknownGeometryType.
        Geometry decode(boost::json::value const &node, std::string const &path) const;

        std::vector<std::string> tags() const;

      private:
        GeometryRegistry();

        std::map<std::string, GeometryDecoder, std::less<>> routines_;
    };

    enum class EnvelopeKind { Feature, FeatureCollection };

    std::optional<EnvelopeKind> envelopeKind(std::string_view tag);

    const char *envelopeName(EnvelopeKind kind);

    namespace detail {
        // Reads the "type" member of an envelope object and resolves it.
        // Throws Errc::UnknownEnvelopeType.
        EnvelopeKind read_envelope_kind(boost::json::value const &node, std::string const &path);
    } // namespace detail

} // namespace geokit
