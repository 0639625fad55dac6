#include "geokit/geokit.hpp"

#include <boost/json.hpp>
#include <iostream>

int main(int argc, char **argv) {
    try {
        // 1) Build a small collection in memory
        gk::FeatureCollection<boost::json::object> fc;
        fc.features.emplace_back(gk::Point(32.6, 12.3), boost::json::object{{"name", "Brutus"}, {"age", 4}});
        fc.features.emplace_back(gk::Polygon{{{0, 0}, {10, 0}, {10, 10}, {0, 10}, {0, 0}}, {}},
                                 boost::json::object{{"name", "pen"}});

        // 2) Print it as GeoJSON
        std::cout << gk::encodeFeatureCollection(fc) << "\n";

        // 3) Read a file if one was given and report what it holds
        if (argc > 1) {
            auto loaded = gk::read<boost::json::object>(argv[1]);
            std::cout << "FEATURES: " << loaded.size() << "\n";
            for (auto const &f : loaded.features) {
                if (f.geometry)
                    std::cout << "  " << gk::kindName(f.geometry->kind()) << "\n";
                else
                    std::cout << "  (no geometry)\n";
            }
        }
    } catch (gk::Error &e) {
        std::cerr << "ERROR [" << gk::errcName(e.code()) << "]: " << e.what() << "\n";
        return 1;
    } catch (std::exception &e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
