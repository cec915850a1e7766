/******************************************************************************
* Copyright (c) 2016, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#pragma once

#include <functional>
#include <string>

namespace demtile
{

// Produces file names for virtual tiles.  Every call must return a name not
// returned before and not ending in any raster format extension, so that a
// virtual tile never shares a key with a real one or with another virtual.
using IdentityGenerator = std::function<std::string()>;

// "virtual-" followed by a random version 4 UUID.
std::string randomIdentity();

// Returns a generator yielding "<prefix>0", "<prefix>1", ...  Each generator
// keeps its own counter, so names are only unique per generator.
IdentityGenerator sequentialIdentity(std::string prefix = "virtual-");

} // namespace demtile
