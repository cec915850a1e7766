/******************************************************************************
* Copyright (c) 2016, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <demtile/types/file-metadata.hpp>

#include <cctype>
#include <sstream>
#include <stdexcept>

#include <demtile/types/exceptions.hpp>
#include <demtile/util/json.hpp>

namespace demtile
{

namespace
{
    bool isSpace(char c)
    {
        return std::isspace(static_cast<unsigned char>(c));
    }

    double parseNoData(const std::string& text)
    {
        std::size_t begin(0);
        std::size_t end(text.size());
        while (begin < end && isSpace(text[begin])) ++begin;
        while (end > begin && isSpace(text[end - 1])) --end;

        const std::string trimmed(text.substr(begin, end - begin));
        if (trimmed.empty())
        {
            throw NoDataParseError("Empty no-data value");
        }

        std::size_t pos(0);
        double result(0);

        try
        {
            result = std::stod(trimmed, &pos);
        }
        catch (const std::exception& e)
        {
            throw NoDataParseError(
                    "Invalid no-data value '" + text + "': " + e.what());
        }

        if (pos != trimmed.size())
        {
            throw NoDataParseError("Invalid no-data value '" + text + "'");
        }

        return result;
    }
}

const std::vector<PersistedField>& persistedFields()
{
    // Tag 1 belongs to the schema version constant itself.
    static const std::vector<PersistedField> fields {
        { 2, "version" },
        { 3, "filename" },
        { 4, "height" },
        { 5, "width" },
        { 6, "pixelScaleX" },
        { 7, "pixelScaleY" },
        { 8, "dataStartLat" },
        { 9, "dataStartLon" },
        { 10, "dataEndLat" },
        { 11, "dataEndLon" },
        { 12, "bitsPerSample" },
        { 13, "worldUnits" },
        { 14, "sampleFormat" },
        { 15, "noDataValue" },
        { 16, "scanlineSize" },
        { 17, "physicalStartLon" },
        { 18, "physicalStartLat" },
        { 19, "physicalEndLon" },
        { 20, "physicalEndLat" },
        { 21, "pixelSizeX" },
        { 22, "pixelSizeY" },
        { 23, "fileFormat" },
        { 24, "minimumAltitude" },
        { 25, "maximumAltitude" }
    };

    return fields;
}

FileMetadata::FileMetadata(
        std::string filename,
        RasterFormat fileFormat,
        std::string version)
    : m_filename(std::move(filename))
    , m_key(m_filename)
    , m_fileFormat(std::move(fileFormat))
    , m_version(std::move(version))
{ }

FileMetadata::FileMetadata(const Json::Value& json)
{
    if (!json.isObject())
    {
        throw std::runtime_error(
                "Invalid JSON FileMetadata: " + toFastString(json));
    }

    m_filename = getString(json, "filename");
    if (m_filename.empty())
    {
        throw std::runtime_error("Missing filename in file metadata");
    }

    m_key = TileKey(m_filename);
    if (m_key.empty())
    {
        throw std::runtime_error(
                "Missing file name in path '" + m_filename + "'");
    }

    m_fileFormat = RasterFormat(json["fileFormat"]);
    m_version = getString(json, "version");

    m_height = getInt(json, "height");
    m_width = getInt(json, "width");
    m_pixelScaleX = getDouble(json, "pixelScaleX");
    m_pixelScaleY = getDouble(json, "pixelScaleY");
    m_pixelSizeX = getDouble(json, "pixelSizeX");
    m_pixelSizeY = getDouble(json, "pixelSizeY");

    m_dataStartLat = getDouble(json, "dataStartLat");
    m_dataStartLon = getDouble(json, "dataStartLon");
    m_dataEndLat = getDouble(json, "dataEndLat");
    m_dataEndLon = getDouble(json, "dataEndLon");

    m_physicalStartLat = getDouble(json, "physicalStartLat");
    m_physicalStartLon = getDouble(json, "physicalStartLon");
    m_physicalEndLat = getDouble(json, "physicalEndLat");
    m_physicalEndLon = getDouble(json, "physicalEndLon");

    m_bitsPerSample = getInt(json, "bitsPerSample");
    m_scanlineSize = getInt(json, "scanlineSize");
    m_worldUnits = getString(json, "worldUnits");
    m_sampleFormat = getString(json, "sampleFormat");
    m_noDataValue = getString(json, "noDataValue");

    m_minimumAltitude = getDouble(json, "minimumAltitude");
    m_maximumAltitude = getDouble(json, "maximumAltitude");
}

FileMetadata::FileMetadata(const FileMetadata& source, std::string name)
    : FileMetadata(source)
{
    m_filename = std::move(name);
    m_key = TileKey(m_filename);
    m_virtual = true;
    m_bounds.reset();
}

const BoundingBox& FileMetadata::boundingBox() const
{
    return m_bounds.get([this]()
    {
        return BoundingBox(
                m_dataStartLon,
                m_dataEndLon,
                m_dataStartLat,
                m_dataEndLat);
    });
}

double FileMetadata::noDataValueAsNumber() const
{
    return m_noData.get([this]() { return parseNoData(m_noDataValue); });
}

FileMetadata FileMetadata::cloneAsVirtual(
        const IdentityGenerator& generator) const
{
    std::string name(generator());
    if (name.empty() || TileKey(name) == m_key)
    {
        throw std::runtime_error(
                "Identity generator produced an unusable name for a virtual "
                "copy of " + m_key.name());
    }

    return FileMetadata(*this, std::move(name));
}

Json::Value FileMetadata::toJson() const
{
    Json::Value json;

    json["version"] = m_version;
    json["filename"] = m_filename;
    json["height"] = m_height;
    json["width"] = m_width;
    json["pixelScaleX"] = m_pixelScaleX;
    json["pixelScaleY"] = m_pixelScaleY;
    json["dataStartLat"] = m_dataStartLat;
    json["dataStartLon"] = m_dataStartLon;
    json["dataEndLat"] = m_dataEndLat;
    json["dataEndLon"] = m_dataEndLon;
    json["bitsPerSample"] = m_bitsPerSample;
    json["worldUnits"] = m_worldUnits;
    json["sampleFormat"] = m_sampleFormat;
    json["noDataValue"] = m_noDataValue;
    json["scanlineSize"] = m_scanlineSize;
    json["physicalStartLon"] = m_physicalStartLon;
    json["physicalStartLat"] = m_physicalStartLat;
    json["physicalEndLon"] = m_physicalEndLon;
    json["physicalEndLat"] = m_physicalEndLat;
    json["pixelSizeX"] = m_pixelSizeX;
    json["pixelSizeY"] = m_pixelSizeY;
    json["fileFormat"] = m_fileFormat.toJson();
    json["minimumAltitude"] = m_minimumAltitude;
    json["maximumAltitude"] = m_maximumAltitude;

    return json;
}

std::string FileMetadata::toString() const
{
    std::ostringstream ss;
    ss << *this;
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const FileMetadata& metadata)
{
    os << metadata.key().name() << ": " << metadata.boundingBox();
    return os;
}

} // namespace demtile
