#include <doctest/doctest.h>

#include "geokit/geokit.hpp"

#include <algorithm>
#include <boost/json.hpp>
#include <thread>
#include <vector>

TEST_CASE("Registry - Geometry tags") {
    auto const &registry = geokit::GeometryRegistry::instance();

    SUBCASE("Eight tags are registered") {
        auto tags = registry.tags();
        CHECK(tags.size() == 8);
        for (auto const &rule : geokit::kShapeTable)
            CHECK(std::find(tags.begin(), tags.end(), std::string(rule.tag)) != tags.end());
        CHECK(std::find(tags.begin(), tags.end(), "LinearRing") != tags.end());
    }

    SUBCASE("Lookup is exact") {
        CHECK(registry.find("Point") != nullptr);
        CHECK(registry.find("point") == nullptr);
        CHECK(registry.find("Feature") == nullptr);
        CHECK(registry.find("") == nullptr);
    }

    SUBCASE("The table is built once") { CHECK(&geokit::GeometryRegistry::instance() == &registry); }

    SUBCASE("Routines receive the whole node") {
        auto node = boost::json::parse(R"({"type":"MultiPoint","coordinates":[[1,2],[3,4]]})");
        auto routine = registry.find("MultiPoint");
        REQUIRE(routine != nullptr);

        auto geom = routine(node.as_object(), "$");
        CHECK(geom.as<geokit::MultiPoint>().coordinates.size() == 2);
    }
}

TEST_CASE("Registry - Envelope tags") {
    CHECK(geokit::envelopeKind("Feature") == geokit::EnvelopeKind::Feature);
    CHECK(geokit::envelopeKind("FeatureCollection") == geokit::EnvelopeKind::FeatureCollection);
    CHECK_FALSE(geokit::envelopeKind("Point").has_value());
    CHECK_FALSE(geokit::envelopeKind("feature").has_value());
    CHECK(std::string(geokit::envelopeName(geokit::EnvelopeKind::FeatureCollection)) == "FeatureCollection");
}

TEST_CASE("Registry - Concurrent decoding") {
    auto const text = geokit::encode(geokit::GeometryCollection{
        {geokit::Point(1, 2), geokit::LineString{{{0, 0}, {5, 5}}}, geokit::Polygon{{{0, 0}, {1, 0}, {0, 0}}, {}}}});

    std::vector<int> matches(8, 0);
    std::vector<std::thread> workers;
    for (std::size_t t = 0; t < matches.size(); ++t) {
        workers.emplace_back([&, t] {
            for (int i = 0; i < 100; ++i) {
                if (geokit::encode(geokit::decodeGeometry(text)) == text)
                    ++matches[t];
            }
        });
    }
    for (auto &w : workers)
        w.join();

    for (auto m : matches)
        CHECK(m == 100);
}
