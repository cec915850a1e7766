/******************************************************************************
* Copyright (c) 2016, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <demtile/types/raster-format.hpp>

#include <algorithm>
#include <cctype>
#include <stdexcept>

#include <demtile/util/json.hpp>

namespace demtile
{

namespace
{
    std::string lower(std::string s)
    {
        std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c)
        {
            return static_cast<char>(std::tolower(c));
        });
        return s;
    }
}

std::string toString(const RasterType type)
{
    switch (type)
    {
        case RasterType::GeoTiff:   return "geotiff";
        case RasterType::SrtmHgt:   return "srtm-hgt";
        case RasterType::AsciiGrid: return "ascii-grid";
        case RasterType::NetCdf:    return "cf-netcdf";
        default: throw std::runtime_error("Invalid raster type");
    }
}

RasterType toRasterType(const std::string& s)
{
    if (s == "geotiff")     return RasterType::GeoTiff;
    if (s == "srtm-hgt")    return RasterType::SrtmHgt;
    if (s == "ascii-grid")  return RasterType::AsciiGrid;
    if (s == "cf-netcdf")   return RasterType::NetCdf;
    throw std::runtime_error("Invalid raster type string: " + s);
}

std::string toString(const Registration registration)
{
    switch (registration)
    {
        case Registration::Grid: return "grid";
        case Registration::Cell: return "cell";
        default: throw std::runtime_error("Invalid registration");
    }
}

Registration toRegistration(const std::string& s)
{
    if (s == "grid") return Registration::Grid;
    if (s == "cell") return Registration::Cell;
    throw std::runtime_error("Invalid registration string: " + s);
}

RasterFormat::RasterFormat(const Json::Value& json)
{
    if (json.isNull()) return;

    if (!json.isObject())
    {
        throw std::runtime_error(
                "Invalid JSON RasterFormat: " + toFastString(json));
    }

    m_name = getString(json, "name");
    m_type = toRasterType(getString(json, "type"));
    m_extension = getString(json, "extension");
    m_registration = toRegistration(getString(json, "registration"));
}

bool RasterFormat::matches(const std::string& path) const
{
    if (m_extension.empty() || path.size() < m_extension.size()) return false;

    return lower(path.substr(path.size() - m_extension.size())) ==
        lower(m_extension);
}

Json::Value RasterFormat::toJson() const
{
    Json::Value json;
    json["name"] = m_name;
    json["type"] = toString(m_type);
    json["extension"] = m_extension;
    json["registration"] = toString(m_registration);
    return json;
}

RasterFormat RasterFormat::geoTiff()
{
    return RasterFormat(
            "GeoTIFF",
            RasterType::GeoTiff,
            ".tif",
            Registration::Cell);
}

RasterFormat RasterFormat::srtmHgt()
{
    return RasterFormat(
            "SRTM HGT",
            RasterType::SrtmHgt,
            ".hgt",
            Registration::Grid);
}

RasterFormat RasterFormat::asciiGrid()
{
    return RasterFormat(
            "ASCII Grid",
            RasterType::AsciiGrid,
            ".asc",
            Registration::Cell);
}

RasterFormat RasterFormat::netCdf()
{
    return RasterFormat(
            "CF NetCDF",
            RasterType::NetCdf,
            ".nc",
            Registration::Cell);
}

const std::vector<RasterFormat>& RasterFormat::known()
{
    static const std::vector<RasterFormat> formats {
        geoTiff(),
        srtmHgt(),
        asciiGrid(),
        netCdf()
    };

    return formats;
}

} // namespace demtile
