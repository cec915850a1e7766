/******************************************************************************
* Copyright (c) 2019, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#pragma once

#include <stdexcept>
#include <string>

namespace demtile
{

// The textual no-data sentinel of a tile could not be read as a number.
class NoDataParseError : public std::runtime_error
{
public:
    NoDataParseError(const std::string& s) : std::runtime_error(s) { }
};

// Persisted metadata was produced under a schema version other than the
// current one.  Old records are never upgraded in place: the whole metadata
// set must be rebuilt from the source rasters.
class RegenerationRequired : public std::runtime_error
{
public:
    RegenerationRequired(const std::string& s) : std::runtime_error(s) { }
};

class ConfigurationError : public std::runtime_error
{
public:
    ConfigurationError(const std::string& s) : std::runtime_error(s) { }
};

} // namespace demtile
