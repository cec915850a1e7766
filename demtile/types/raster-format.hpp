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

#include <string>
#include <utility>
#include <vector>

#include <json/json.h>

namespace demtile
{

enum class RasterType : char
{
    GeoTiff,
    SrtmHgt,
    AsciiGrid,
    NetCdf
};

enum class Registration : char
{
    // Samples lie on grid intersections (pixel-is-point), so the physical
    // image extends half a pixel past the data extrema on each side.
    Grid,

    // Samples represent the area of their cell (pixel-is-area).
    Cell
};

std::string toString(RasterType type);
RasterType toRasterType(const std::string& s);

std::string toString(Registration registration);
Registration toRegistration(const std::string& s);

// Describes a raster file format: display name, the type tag used to select
// a decoder, the file extension (with leading dot) and the sample
// registration of files in that format.
class RasterFormat
{
public:
    RasterFormat() = default;
    RasterFormat(
            std::string name,
            RasterType type,
            std::string extension,
            Registration registration)
        : m_name(std::move(name))
        , m_type(type)
        , m_extension(std::move(extension))
        , m_registration(registration)
    { }

    explicit RasterFormat(const Json::Value& json);

    const std::string& name() const { return m_name; }
    RasterType type() const { return m_type; }
    const std::string& extension() const { return m_extension; }
    Registration registration() const { return m_registration; }

    bool isGridRegistered() const
    {
        return m_registration == Registration::Grid;
    }

    // True if the path ends with this format's extension, ignoring case.
    bool matches(const std::string& path) const;

    Json::Value toJson() const;

    static RasterFormat geoTiff();
    static RasterFormat srtmHgt();
    static RasterFormat asciiGrid();
    static RasterFormat netCdf();

    static const std::vector<RasterFormat>& known();

private:
    std::string m_name;
    RasterType m_type = RasterType::GeoTiff;
    std::string m_extension;
    Registration m_registration = Registration::Cell;
};

inline bool operator==(const RasterFormat& a, const RasterFormat& b)
{
    return
        a.name() == b.name() &&
        a.type() == b.type() &&
        a.extension() == b.extension() &&
        a.registration() == b.registration();
}

inline bool operator!=(const RasterFormat& a, const RasterFormat& b)
{
    return !(a == b);
}

} // namespace demtile
