#pragma once

#include "geokit/error.hpp"
#include "geokit/feature.hpp"
#include "geokit/geometry_codec.hpp"
#include "geokit/io.hpp"
#include "geokit/registry.hpp"
#include "geokit/shape.hpp"
#include "geokit/types.hpp"

namespace gk = geokit;
