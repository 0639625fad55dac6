#include "geokit/io.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace geokit {

    namespace detail {

        std::string read_file(std::filesystem::path const &file) {
            std::ifstream ifs(file);
            if (!ifs) {
                throw std::runtime_error("geokit::ReadFeatureCollection(): cannot open \"" + file.string() + '\"');
            }
            std::stringstream buffer;
            buffer << ifs.rdbuf();
            return buffer.str();
        }

        void write_file(std::filesystem::path const &file, std::string const &text) {
            std::ofstream ofs(file);
            if (!ofs)
                throw std::runtime_error("geokit::WriteFeatureCollection(): cannot open \"" + file.string() + '\"');
            ofs << text;
        }

    } // namespace detail

} // namespace geokit
