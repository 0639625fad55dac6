#include "geokit/feature.hpp"

#include <cstdint>
#include <limits>

namespace geokit {

    namespace detail {

        boost::json::value id_to_json(FeatureId const &id) {
            return std::visit([](auto const &v) { return boost::json::value_from(v); }, id);
        }

        FeatureId id_from_json(boost::json::value const &node, std::string const &path) {
            if (node.is_string()) {
                auto const &s = node.as_string();
                return std::string(s.data(), s.size());
            }
            if (node.is_int64())
                return node.as_int64();
            auto const max_id = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());
            if (node.is_uint64() && node.as_uint64() <= max_id)
                return static_cast<std::int64_t>(node.as_uint64());
            throw Error(Errc::MalformedFeature, path, "feature id must be a string or an integer");
        }

        boost::json::value const *non_null_member(boost::json::object const &obj, const char *key) {
            auto const *member = obj.if_contains(key);
            if (!member || member->is_null())
                return nullptr;
            return member;
        }

    } // namespace detail

} // namespace geokit
