#include "geokit/geometry_codec.hpp"
#include "geokit/registry.hpp"
#include "geokit/shape.hpp"

#include <cmath>
#include <cstdint>
#include <type_traits>
#include <utility>
#include <vector>

namespace geokit {

    namespace detail {

        boost::json::value number_to_json(double v) {
            constexpr double kMaxExactInteger = 9007199254740992.0; // 2^53
            if (std::isfinite(v) && std::trunc(v) == v && std::fabs(v) < kMaxExactInteger &&
                !(v == 0.0 && std::signbit(v))) {
                return static_cast<std::int64_t>(v);
            }
            return v;
        }

        namespace {
            boost::json::array position_to_json(dp::Point const &p, std::size_t dimension) {
                boost::json::array arr;
                arr.push_back(number_to_json(p.x));
                arr.push_back(number_to_json(p.y));
                if (dimension > 2)
                    arr.push_back(number_to_json(p.z));
                return arr;
            }

            boost::json::array polygon_to_json(Polygon const &poly) {
                boost::json::array rings;
                if (poly.empty())
                    return rings;
                rings.push_back(sequence_to_json(poly.shell));
                for (auto const &hole : poly.holes)
                    rings.push_back(sequence_to_json(hole));
                return rings;
            }
        } // namespace

        boost::json::array sequence_to_json(CoordinateSequence const &seq) {
            boost::json::array arr;
            arr.reserve(seq.size());
            for (auto const &p : seq)
                arr.push_back(position_to_json(p, seq.dimension()));
            return arr;
        }

        boost::json::value parse_text(std::string_view text) {
            boost::json::parse_options opt;
            opt.max_depth = kMaxNestingDepth;
            boost::json::error_code ec;
            boost::json::value j =
                boost::json::parse(boost::json::string_view(text.data(), text.size()), ec, {}, opt);
            if (ec)
                throw Error(Errc::MalformedJSON, "$", ec.message());
            return j;
        }

        void check_shape(boost::json::value const &node, int depth, std::string const &path) {
            if (!node.is_array())
                throw Error(Errc::MalformedCoordinates, path, "expected an array");
            auto const &arr = node.as_array();
            if (depth == 1) {
                if (arr.size() < kMinTupleArity || arr.size() > kMaxTupleArity) {
                    throw Error(Errc::MalformedCoordinates, path,
                                "coordinate tuple must hold 2 or 3 numbers, got " + std::to_string(arr.size()));
                }
                for (std::size_t i = 0; i < arr.size(); ++i) {
                    if (!arr[i].is_number())
                        throw Error(Errc::MalformedCoordinates, index_path(path, i), "expected a number");
                }
                return;
            }
            for (std::size_t i = 0; i < arr.size(); ++i)
                check_shape(arr[i], depth - 1, index_path(path, i));
        }

        namespace {
            // Shape has already been checked, so every tuple is a 2/3-number array.
            CoordinateSequence sequence_from_json(boost::json::array const &positions) {
                std::size_t dimension = 2;
                std::vector<dp::Point> points;
                points.reserve(positions.size());
                for (auto const &pos : positions) {
                    auto const &tuple = pos.as_array();
                    double z = 0.0;
                    if (tuple.size() > 2) {
                        z = boost::json::value_to<double>(tuple[2]);
                        dimension = 3;
                    }
                    points.push_back(dp::Point{boost::json::value_to<double>(tuple[0]),
                                               boost::json::value_to<double>(tuple[1]), z});
                }
                return CoordinateSequence(std::move(points), dimension);
            }

            Polygon polygon_from_json(boost::json::array const &rings) {
                Polygon poly;
                if (rings.empty())
                    return poly;
                poly.shell = sequence_from_json(rings[0].as_array());
                poly.holes.reserve(rings.size() - 1);
                for (std::size_t i = 1; i < rings.size(); ++i)
                    poly.holes.push_back(sequence_from_json(rings[i].as_array()));
                return poly;
            }

            // Fetches "coordinates" and validates it against the shape table row of `kind`.
            boost::json::array const &coordinates_of(boost::json::object const &node, GeometryKind kind,
                                                     std::string const &path) {
                auto const coords_path = member_path(path, "coordinates");
                auto const *coords = node.if_contains("coordinates");
                if (!coords)
                    throw Error(Errc::MalformedCoordinates, coords_path, "missing 'coordinates' member");

                int const depth = shapeRule(kind).depth;
                // An empty position array is the GeoJSON spelling of an empty Point.
                bool const empty_point = depth == 1 && coords->is_array() && coords->as_array().empty();
                if (!empty_point)
                    check_shape(*coords, depth, coords_path);
                return coords->as_array();
            }
        } // namespace

        Geometry decode_point(boost::json::object const &node, std::string const &path) {
            auto const &coords = coordinates_of(node, GeometryKind::Point, path);
            if (coords.empty())
                return Point{};
            boost::json::array positions;
            positions.push_back(coords);
            return Point(sequence_from_json(positions));
        }

        Geometry decode_line_string(boost::json::object const &node, std::string const &path) {
            return LineString{sequence_from_json(coordinates_of(node, GeometryKind::LineString, path))};
        }

        Geometry decode_polygon(boost::json::object const &node, std::string const &path) {
            return polygon_from_json(coordinates_of(node, GeometryKind::Polygon, path));
        }

        Geometry decode_multi_point(boost::json::object const &node, std::string const &path) {
            return MultiPoint{sequence_from_json(coordinates_of(node, GeometryKind::MultiPoint, path))};
        }

        Geometry decode_multi_line_string(boost::json::object const &node, std::string const &path) {
            MultiLineString mls;
            auto const &lines = coordinates_of(node, GeometryKind::MultiLineString, path);
            mls.lines.reserve(lines.size());
            for (auto const &line : lines)
                mls.lines.push_back(LineString{sequence_from_json(line.as_array())});
            return mls;
        }

        Geometry decode_multi_polygon(boost::json::object const &node, std::string const &path) {
            MultiPolygon mp;
            auto const &polys = coordinates_of(node, GeometryKind::MultiPolygon, path);
            mp.polygons.reserve(polys.size());
            for (auto const &poly : polys)
                mp.polygons.push_back(polygon_from_json(poly.as_array()));
            return mp;
        }

        Geometry decode_geometry_collection(boost::json::object const &node, std::string const &path) {
            auto const geoms_path = member_path(path, "geometries");
            auto const *geoms = node.if_contains("geometries");
            if (!geoms || !geoms->is_array())
                throw Error(Errc::MalformedGeometry, geoms_path, "GeometryCollection requires a 'geometries' array");

            GeometryCollection gc;
            auto const &arr = geoms->as_array();
            gc.geometries.reserve(arr.size());
            for (std::size_t i = 0; i < arr.size(); ++i)
                gc.geometries.push_back(geometryFromJson(arr[i], index_path(geoms_path, i)));
            return gc;
        }

    } // namespace detail

    boost::json::value geometryToJson(Geometry const &geom) {
        return std::visit(
            [&](auto const &shape) -> boost::json::value {
                using T = std::decay_t<decltype(shape)>;
                boost::json::object j;
                j["type"] = kindName(geom.kind());
                if constexpr (std::is_same_v<T, Point>) {
                    if (shape.empty())
                        j["coordinates"] = boost::json::array();
                    else
                        j["coordinates"] = detail::sequence_to_json(shape.coordinates).at(0);
                } else if constexpr (std::is_same_v<T, LineString> || std::is_same_v<T, MultiPoint>) {
                    j["coordinates"] = detail::sequence_to_json(shape.coordinates);
                } else if constexpr (std::is_same_v<T, Polygon>) {
                    j["coordinates"] = detail::polygon_to_json(shape);
                } else if constexpr (std::is_same_v<T, MultiLineString>) {
                    boost::json::array lines;
                    for (auto const &line : shape.lines)
                        lines.push_back(detail::sequence_to_json(line.coordinates));
                    j["coordinates"] = std::move(lines);
                } else if constexpr (std::is_same_v<T, MultiPolygon>) {
                    boost::json::array polys;
                    for (auto const &poly : shape.polygons)
                        polys.push_back(detail::polygon_to_json(poly));
                    j["coordinates"] = std::move(polys);
                } else if constexpr (std::is_same_v<T, GeometryCollection>) {
                    boost::json::array geoms;
                    for (auto const &child : shape.geometries)
                        geoms.push_back(geometryToJson(child));
                    j["geometries"] = std::move(geoms);
                }
                return j;
            },
            geom.shape());
    }

    Geometry geometryFromJson(boost::json::value const &node, std::string const &path) {
        return GeometryRegistry::instance().decode(node, path);
    }

    std::string encode(Geometry const &geom) { return boost::json::serialize(geometryToJson(geom)); }

    Geometry decodeGeometry(std::string_view text) { return geometryFromJson(detail::parse_text(text)); }

} // namespace geokit
