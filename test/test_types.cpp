#include <doctest/doctest.h>

#include "geokit/geokit.hpp"

#include <stdexcept>
#include <variant>
#include <vector>

TEST_CASE("Types - CoordinateSequence") {
    SUBCASE("2D sequence from xy pairs") {
        geokit::CoordinateSequence seq{{0, 0}, {10, 10}, {20, 25}};

        CHECK(seq.size() == 3);
        CHECK(seq.dimension() == 2);
        CHECK(seq.at(2).x == 20.0);
        CHECK(seq.at(2).y == 25.0);
        CHECK_THROWS_AS(seq.at(3), std::out_of_range);
    }

    SUBCASE("3D sequence keeps z") {
        geokit::CoordinateSequence seq({dp::Point{1.0, 2.0, 3.0}}, 3);

        CHECK(seq.dimension() == 3);
        CHECK(seq.at(0).z == 3.0);
    }

    SUBCASE("2D sequence drops z") {
        geokit::CoordinateSequence seq({dp::Point{1.0, 2.0, 3.0}}, 2);

        CHECK(seq.at(0).z == 0.0);
        CHECK(seq == geokit::CoordinateSequence{{1, 2}});
    }

    SUBCASE("Empty sequence is two dimensional") {
        geokit::CoordinateSequence seq(std::vector<dp::Point>{}, 3);
        CHECK(seq.dimension() == 2);
        CHECK(seq == geokit::CoordinateSequence{});
    }

    SUBCASE("Invalid dimension") {
        CHECK_THROWS_AS(geokit::CoordinateSequence({dp::Point{1.0, 2.0, 3.0}}, 4), std::invalid_argument);
    }

    SUBCASE("Equality is order and dimension sensitive") {
        geokit::CoordinateSequence a{{0, 0}, {1, 1}};
        geokit::CoordinateSequence b{{1, 1}, {0, 0}};
        geokit::CoordinateSequence c({dp::Point{0.0, 0.0, 0.0}, dp::Point{1.0, 1.0, 0.0}}, 3);

        CHECK(a == a);
        CHECK(a != b);
        CHECK(a != c);
    }
}

TEST_CASE("Types - Geometry variant") {
    SUBCASE("Kind follows the held shape") {
        CHECK(geokit::Geometry(geokit::Point(1, 2)).kind() == geokit::GeometryKind::Point);
        CHECK(geokit::Geometry(geokit::LineString{}).kind() == geokit::GeometryKind::LineString);
        CHECK(geokit::Geometry(geokit::Polygon{}).kind() == geokit::GeometryKind::Polygon);
        CHECK(geokit::Geometry(geokit::MultiPoint{}).kind() == geokit::GeometryKind::MultiPoint);
        CHECK(geokit::Geometry(geokit::MultiLineString{}).kind() == geokit::GeometryKind::MultiLineString);
        CHECK(geokit::Geometry(geokit::MultiPolygon{}).kind() == geokit::GeometryKind::MultiPolygon);
        CHECK(geokit::Geometry(geokit::GeometryCollection{}).kind() == geokit::GeometryKind::GeometryCollection);
    }

    SUBCASE("Point accessors") {
        geokit::Point p(15, 20);

        CHECK_FALSE(p.empty());
        CHECK(p.x() == 15.0);
        CHECK(p.y() == 20.0);
        CHECK(geokit::Point().empty());
        CHECK(geokit::Point(1, 2, 3).coordinates.dimension() == 3);
    }

    SUBCASE("Point rejects more than one coordinate") {
        CHECK_THROWS_AS(geokit::Point(geokit::CoordinateSequence{{0, 0}, {1, 1}}), std::invalid_argument);
    }

    SUBCASE("Typed access") {
        geokit::Geometry geom = geokit::LineString{{{0, 0}, {1, 1}}};

        CHECK(geom.is<geokit::LineString>());
        CHECK_FALSE(geom.is<geokit::Point>());
        CHECK(geom.get_if<geokit::Point>() == nullptr);
        CHECK(geom.as<geokit::LineString>().coordinates.size() == 2);
    }

    SUBCASE("kindOf matches the variant order") {
        CHECK(geokit::kindOf<geokit::Point>() == geokit::GeometryKind::Point);
        CHECK(geokit::kindOf<geokit::MultiPolygon>() == geokit::GeometryKind::MultiPolygon);
        CHECK(geokit::kindOf<geokit::GeometryCollection>() == geokit::GeometryKind::GeometryCollection);
    }
}

TEST_CASE("Types - Geometry equality") {
    SUBCASE("Different kinds never compare equal") {
        geokit::Geometry point = geokit::Point(0, 0);
        geokit::Geometry multi = geokit::MultiPoint{{{0, 0}}};

        CHECK(point != multi);
    }

    SUBCASE("Polygon compares holes") {
        geokit::Polygon a{{{0, 0}, {10, 0}, {10, 10}, {0, 0}}, {}};
        geokit::Polygon b = a;
        b.holes.push_back({{2, 2}, {3, 2}, {3, 3}, {2, 2}});

        CHECK(a == a);
        CHECK(a != b);
    }

    SUBCASE("Collections compare children recursively") {
        geokit::GeometryCollection inner{{geokit::Point(1, 1)}};
        geokit::GeometryCollection a{{geokit::Point(0, 0), inner}};
        geokit::GeometryCollection b{{geokit::Point(0, 0), inner}};
        geokit::GeometryCollection c{{inner, geokit::Point(0, 0)}};

        CHECK(geokit::Geometry(a) == geokit::Geometry(b));
        CHECK(geokit::Geometry(a) != geokit::Geometry(c));
    }
}

TEST_CASE("Types - Shape table") {
    CHECK(geokit::shapeRule(geokit::GeometryKind::Point).depth == 1);
    CHECK(geokit::shapeRule(geokit::GeometryKind::LineString).depth == 2);
    CHECK(geokit::shapeRule(geokit::GeometryKind::MultiPoint).depth == 2);
    CHECK(geokit::shapeRule(geokit::GeometryKind::Polygon).depth == 3);
    CHECK(geokit::shapeRule(geokit::GeometryKind::MultiLineString).depth == 3);
    CHECK(geokit::shapeRule(geokit::GeometryKind::MultiPolygon).depth == 4);
    CHECK(geokit::shapeRule(geokit::GeometryKind::GeometryCollection).depth == 0);

    CHECK(std::string(geokit::kindName(geokit::GeometryKind::MultiLineString)) == "MultiLineString");
    REQUIRE(geokit::kTagAliases.size() == 1);
    CHECK(geokit::kTagAliases[0].tag == "LinearRing");
    CHECK(geokit::kTagAliases[0].kind == geokit::GeometryKind::LineString);
}
