#include "geokit/registry.hpp"
#include "geokit/error.hpp"
#include "geokit/geometry_codec.hpp"
#include "geokit/shape.hpp"

#include <array>
#include <cstddef>

namespace geokit {

    namespace {
        // Indexed by GeometryKind, same order as kShapeTable.
        constexpr std::array<GeometryDecoder, 7> kRoutines = {{
            &detail::decode_point,
            &detail::decode_line_string,
            &detail::decode_polygon,
            &detail::decode_multi_point,
            &detail::decode_multi_line_string,
            &detail::decode_multi_polygon,
            &detail::decode_geometry_collection,
        }};

        GeometryDecoder routine_for(GeometryKind kind) { return kRoutines[static_cast<std::size_t>(kind)]; }
    } // namespace

    GeometryRegistry::GeometryRegistry() {
        for (auto const &rule : kShapeTable)
            routines_.emplace(std::string(rule.tag), routine_for(rule.kind));
        for (auto const &alias : kTagAliases)
            routines_.emplace(std::string(alias.tag), routine_for(alias.kind));
    }

    GeometryRegistry const &GeometryRegistry::instance() {
        static const GeometryRegistry registry;
        return registry;
    }

    GeometryDecoder GeometryRegistry::find(std::string_view tag) const {
        auto it = routines_.find(tag);
        return it == routines_.end() ? nullptr : it->second;
    }

    Geometry GeometryRegistry::decode(boost::json::value const &node, std::string const &path) const {
        auto const *obj = node.if_object();
        if (!obj)
            throw Error(Errc::UnknownGeometryType, path, "geometry must be a JSON object");

        auto const *type = obj->if_contains("type");
        if (!type || !type->is_string())
            throw Error(Errc::UnknownGeometryType, detail::member_path(path, "type"), "missing string 'type' field");

        auto const &tag = type->as_string();
        auto routine = find(std::string_view(tag.data(), tag.size()));
        if (!routine) {
            throw Error(Errc::UnknownGeometryType, detail::member_path(path, "type"),
                        "unknown geometry type \"" + std::string(tag.data(), tag.size()) + "\"");
        }
        return routine(*obj, path);
    }

    std::vector<std::string> GeometryRegistry::tags() const {
        std::vector<std::string> out;
        out.reserve(routines_.size());
        for (auto const &[tag, routine] : routines_)
            out.push_back(tag);
        return out;
    }

    namespace {
        std::map<std::string, EnvelopeKind, std::less<>> const &envelope_table() {
            static const std::map<std::string, EnvelopeKind, std::less<>> table{
                {"Feature", EnvelopeKind::Feature},
                {"FeatureCollection", EnvelopeKind::FeatureCollection},
            };
            return table;
        }
    } // namespace

    std::optional<EnvelopeKind> envelopeKind(std::string_view tag) {
        auto const &table = envelope_table();
        auto it = table.find(tag);
        if (it == table.end())
            return std::nullopt;
        return it->second;
    }

    const char *envelopeName(EnvelopeKind kind) {
        switch (kind) {
        case EnvelopeKind::Feature:
            return "Feature";
        case EnvelopeKind::FeatureCollection:
            return "FeatureCollection";
        }
        return "Unknown";
    }

    namespace detail {
        EnvelopeKind read_envelope_kind(boost::json::value const &node, std::string const &path) {
            auto const *obj = node.if_object();
            if (!obj)
                throw Error(Errc::UnknownEnvelopeType, path, "expected a JSON object");

            auto const *type = obj->if_contains("type");
            if (!type || !type->is_string())
                throw Error(Errc::UnknownEnvelopeType, member_path(path, "type"), "missing string 'type' field");

            auto const &tag = type->as_string();
            auto kind = envelopeKind(std::string_view(tag.data(), tag.size()));
            if (!kind) {
                throw Error(Errc::UnknownEnvelopeType, member_path(path, "type"),
                            "unknown envelope type \"" + std::string(tag.data(), tag.size()) + "\"");
            }
            return *kind;
        }
    } // namespace detail

} // namespace geokit
