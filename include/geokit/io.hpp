#pragma once

#include "geokit/feature.hpp"

#include <filesystem>
#include <string>

namespace geokit {

    namespace detail {
        std::string read_file(std::filesystem::path const &file);

        void write_file(std::filesystem::path const &file, std::string const &text);
    } // namespace detail

    // Reads any GeoJSON document as a collection: a lone Feature becomes a
    // one-element collection, a bare geometry a one-element collection of a
    // Feature without properties.
    template <typename P, typename G = Geometry>
    FeatureCollection<P, G> ReadFeatureCollection(std::filesystem::path const &file,
                                                  PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        auto const j = detail::parse_text(detail::read_file(file));

        auto const *obj = j.if_object();
        auto const *type = obj ? obj->if_contains("type") : nullptr;
        if (type && type->is_string()) {
            auto const &tag = type->as_string();
            if (envelopeKind(std::string_view(tag.data(), tag.size())) == EnvelopeKind::FeatureCollection)
                return featureCollectionFromJson<P, G>(j, codec);
            if (envelopeKind(std::string_view(tag.data(), tag.size())) == EnvelopeKind::Feature) {
                FeatureCollection<P, G> fc;
                fc.features.push_back(featureFromJson<P, G>(j, codec));
                return fc;
            }
        }

        Feature<P, G> feature;
        feature.geometry = detail::geometry_as<G>(geometryFromJson(j), "$");
        FeatureCollection<P, G> fc;
        fc.features.push_back(std::move(feature));
        return fc;
    }

    template <typename P, typename G>
    void WriteFeatureCollection(FeatureCollection<P, G> const &fc, std::filesystem::path const &outPath,
                                PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        detail::write_file(outPath, encodeFeatureCollection(fc, codec) + "\n");
    }

    template <typename P, typename G = Geometry>
    FeatureCollection<P, G> read(std::filesystem::path const &file,
                                 PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        return ReadFeatureCollection<P, G>(file, codec);
    }

    template <typename P, typename G>
    void write(FeatureCollection<P, G> const &fc, std::filesystem::path const &outPath,
               PropertyCodec<P> const &codec = jsonPropertyCodec<P>()) {
        WriteFeatureCollection(fc, outPath, codec);
    }

} // namespace geokit
