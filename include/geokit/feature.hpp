#pragma once

#include "geokit/error.hpp"
#include "geokit/geometry_codec.hpp"
#include "geokit/registry.hpp"
#include "geokit/shape.hpp"
#include "geokit/types.hpp"

#include <boost/json.hpp>

#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace geokit {

    // Caller-supplied (de)serialization of the opaque properties payload.
    // The envelopes never look inside P.
    template <typename P> struct PropertyCodec {
        std::function<boost::json::value(P const &)> encode;
        std::function<P(boost::json::value const &)> decode;
    };

    // Codec for payloads Boost.JSON can already convert, either natively or
    // through tag_invoke(value_from_tag, ...) / tag_invoke(value_to_tag<P>, ...).
    template <typename P> PropertyCodec<P> jsonPropertyCodec() {
        return PropertyCodec<P>{[](P const &props) { return boost::json::value_from(props); },
                                [](boost::json::value const &node) { return boost::json::value_to<P>(node); }};
    }

    template <typename P, typename G = Geometry> struct Feature {
        static_assert(is_geometry_v<G>, "Feature geometry must be geokit::Geometry or a geometry kind");

        std::optional<FeatureId> id;
        std::optional<G> geometry;
        std::optional<P> properties;

        Feature() = default;
        Feature(G geom, P props) : geometry(std::move(geom)), properties(std::move(props)) {}
    };

    template <typename P, typename G = Geometry> struct FeatureCollection {
        std::vector<Feature<P, G>> features;

        FeatureCollection() = default;
        explicit FeatureCollection(std::vector<Feature<P, G>> feats) : features(std::move(feats)) {}

        std::size_t size() const { return features.size(); }
    };

    namespace detail {
        boost::json::value id_to_json(FeatureId const &id);

        FeatureId id_from_json(boost::json::value const &node, std::string const &path);

        // Member lookup where a missing member reads as null.
        boost::json::value const *non_null_member(boost::json::object const &obj, const char *key);

        template <typename G> G geometry_as(Geometry geom, std::string const &path) {
            if constexpr (std::is_same_v<G, Geometry>) {
                return geom;
            } else {
                auto const *shape = geom.get_if<G>();
                if (!shape) {
                    throw Error(Errc::GeometryKindMismatch, path,
                                std::string("expected ") + kindName(kindOf<G>()) + ", got " + kindName(geom.kind()));
                }
                return *shape;
            }
        }

        template <typename P>
        P decode_properties(PropertyCodec<P> const &codec, boost::json::value const &node, std::string const &path) {
            if (!codec.decode)
                throw Error(Errc::PropertyDecodeError, path, "no property decoder supplied");
            try {
                return codec.decode(node);
            } catch (std::exception const &e) {
                std::throw_with_nested(Error(Errc::PropertyDecodeError, path, e.what()));
            }
        }

        inline void expect_envelope(boost::json::value const &node, EnvelopeKind expected, std::string const &path) {
            auto const kind = read_envelope_kind(node, path);
            if (kind != expected) {
                throw Error(Errc::UnknownEnvelopeType, member_path(path, "type"),
                            std::string("expected ") + envelopeName(expected) + ", got " + envelopeName(kind));
            }
        }
    } // namespace detail

    // Members in order: type, id (only when set), geometry, properties.
    template <typename P, typename G>
    boost::json::value featureToJson(Feature<P, G> const &feature,
                                     PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        boost::json::object j;
        j["type"] = envelopeName(EnvelopeKind::Feature);
        if (feature.id)
            j["id"] = detail::id_to_json(*feature.id);
        if (feature.geometry)
            j["geometry"] = geometryToJson(Geometry(*feature.geometry));
        else
            j["geometry"] = nullptr;
        if (feature.properties)
            j["properties"] = codec.encode(*feature.properties);
        else
            j["properties"] = nullptr;
        return j;
    }

    template <typename P, typename G = Geometry>
    Feature<P, G> featureFromJson(boost::json::value const &node,
                                  PropertyCodec<P> const &codec = jsonPropertyCodec<P>(),
                                  std::string const &path = "$") {
        detail::expect_envelope(node, EnvelopeKind::Feature, path);
        auto const &obj = node.as_object();

        Feature<P, G> feature;
        if (auto const *id = detail::non_null_member(obj, "id"))
            feature.id = detail::id_from_json(*id, detail::member_path(path, "id"));
        if (auto const *geom = detail::non_null_member(obj, "geometry")) {
            auto const geom_path = detail::member_path(path, "geometry");
            feature.geometry = detail::geometry_as<G>(geometryFromJson(*geom, geom_path), geom_path);
        }
        if (auto const *props = detail::non_null_member(obj, "properties"))
            feature.properties = detail::decode_properties(codec, *props, detail::member_path(path, "properties"));
        return feature;
    }

    template <typename P, typename G>
    boost::json::value featureCollectionToJson(FeatureCollection<P, G> const &fc,
                                               PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        boost::json::object j;
        j["type"] = envelopeName(EnvelopeKind::FeatureCollection);
        boost::json::array features;
        features.reserve(fc.features.size());
        for (auto const &f : fc.features)
            features.push_back(featureToJson(f, codec));
        j["features"] = std::move(features);
        return j;
    }

    template <typename P, typename G = Geometry>
    FeatureCollection<P, G> featureCollectionFromJson(boost::json::value const &node,
                                                      PropertyCodec<P> const &codec = jsonPropertyCodec<P>(),
                                                      std::string const &path = "$") {
        detail::expect_envelope(node, EnvelopeKind::FeatureCollection, path);
        auto const features_path = detail::member_path(path, "features");
        auto const *features = node.as_object().if_contains("features");
        if (!features || !features->is_array())
            throw Error(Errc::MissingFeaturesArray, features_path, "FeatureCollection requires a 'features' array");

        auto const &arr = features->as_array();
        FeatureCollection<P, G> fc;
        fc.features.reserve(arr.size());
        for (std::size_t i = 0; i < arr.size(); ++i)
            fc.features.push_back(featureFromJson<P, G>(arr[i], codec, detail::index_path(features_path, i)));
        return fc;
    }

    template <typename P, typename G = Geometry>
    using Envelope = std::variant<Feature<P, G>, FeatureCollection<P, G>>;

    // Decodes whichever envelope the top-level "type" names.
    template <typename P, typename G = Geometry>
    Envelope<P, G> decodeEnvelope(boost::json::value const &node,
                                  PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        switch (detail::read_envelope_kind(node, "$")) {
        case EnvelopeKind::Feature:
            return featureFromJson<P, G>(node, codec);
        case EnvelopeKind::FeatureCollection:
            return featureCollectionFromJson<P, G>(node, codec);
        }
        throw Error(Errc::UnknownEnvelopeType, "$.type", "unhandled envelope kind");
    }

    template <typename P, typename G>
    std::string encodeFeature(Feature<P, G> const &feature, PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        return boost::json::serialize(featureToJson(feature, codec));
    }

    template <typename P, typename G = Geometry>
    Feature<P, G> decodeFeature(std::string_view text, PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        return featureFromJson<P, G>(detail::parse_text(text), codec);
    }

    template <typename P, typename G>
    std::string encodeFeatureCollection(FeatureCollection<P, G> const &fc,
                                        PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        return boost::json::serialize(featureCollectionToJson(fc, codec));
    }

    template <typename P, typename G = Geometry>
    FeatureCollection<P, G> decodeFeatureCollection(std::string_view text,
                                                    PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        return featureCollectionFromJson<P, G>(detail::parse_text(text), codec);
    }

} // namespace geokit
