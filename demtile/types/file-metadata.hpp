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

#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <utility>
#include <vector>

#include <json/json.h>

#include <demtile/types/bounds.hpp>
#include <demtile/types/identity.hpp>
#include <demtile/types/raster-format.hpp>
#include <demtile/types/tile-key.hpp>
#include <demtile/types/version.hpp>
#include <demtile/util/cached.hpp>

namespace demtile
{

// Key and wire tag of a persisted metadata field.  Tags are append-only: a
// new field takes the next free tag and existing tags are never reused.
struct PersistedField
{
    int tag;
    const char* key;
};

const std::vector<PersistedField>& persistedFields();

// Everything needed to place an elevation raster in a spatial index and to
// plan reads from it, without opening the file.
class FileMetadata
{
public:
    // Deserialization only.  All fields are zero or empty.
    FileMetadata() { }

    FileMetadata(
            std::string filename,
            RasterFormat fileFormat,
            std::string version = currentMetadataVersion);

    // Reads the persisted form.  Any "virtual" or bounding box entries are
    // ignored, and the version is taken as is: checking it against
    // currentMetadataVersion is up to the caller.
    explicit FileMetadata(const Json::Value& json);

    // Relative path of the raster, or a synthetic name if virtual.
    const std::string& filename() const { return m_filename; }
    const RasterFormat& fileFormat() const { return m_fileFormat; }
    const std::string& version() const { return m_version; }

    VersionStatus versionStatus() const
    {
        return metadataVersionStatus(m_version);
    }

    int height() const { return m_height; }
    int width() const { return m_width; }

    // Scale is the per-unit factor used in the raster transform, size the
    // ground extent of a pixel.  They usually agree but are stored apart.
    double pixelScaleX() const { return m_pixelScaleX; }
    double pixelScaleY() const { return m_pixelScaleY; }
    double pixelSizeX() const { return m_pixelSizeX; }
    double pixelSizeY() const { return m_pixelSizeY; }

    // Extent of the sampled data.  Start and end follow the raster's row and
    // column order, so start may be greater than end.
    double dataStartLat() const { return m_dataStartLat; }
    double dataStartLon() const { return m_dataStartLon; }
    double dataEndLat() const { return m_dataEndLat; }
    double dataEndLon() const { return m_dataEndLon; }

    // Extent of the image itself.  For grid registered rasters this is offset
    // from the data extent by up to one pixel.
    double physicalStartLat() const { return m_physicalStartLat; }
    double physicalStartLon() const { return m_physicalStartLon; }
    double physicalEndLat() const { return m_physicalEndLat; }
    double physicalEndLon() const { return m_physicalEndLon; }

    int bitsPerSample() const { return m_bitsPerSample; }
    int scanlineSize() const { return m_scanlineSize; }
    const std::string& worldUnits() const { return m_worldUnits; }
    const std::string& sampleFormat() const { return m_sampleFormat; }
    const std::string& noDataValue() const { return m_noDataValue; }

    double minimumAltitude() const { return m_minimumAltitude; }
    double maximumAltitude() const { return m_maximumAltitude; }

    // True for placeholders standing in for tiles missing from a query area.
    bool isVirtual() const { return m_virtual; }

    // Normalized extent of the data-space extrema.  Computed on first call;
    // every later call returns the same object until a data extremum changes.
    // setDataStartLat(), setDataStartLon(), setDataEndLat() and
    // setDataEndLon() destroy the cached box, leaving any reference obtained
    // earlier dangling.
    const BoundingBox& boundingBox() const;

    // The no-data sentinel as a number, parsed from noDataValue() on first
    // call.  Throws NoDataParseError if the text is not numeric, in which
    // case nothing is cached.  Once resolved, the number no longer follows
    // setNoDataValue().
    double noDataValueAsNumber() const;

    const TileKey& key() const { return m_key; }
    std::size_t hash() const { return m_key.hash(); }

    // Same tile, by base name of the path.  False for null.
    bool equals(const FileMetadata* other) const
    {
        return other && m_key == other->m_key;
    }

    // Copy of this tile under a new synthetic name, marked virtual.  Layout
    // and geometry are unchanged and the bounding box is recomputed on demand.
    FileMetadata cloneAsVirtual(
            const IdentityGenerator& generator = randomIdentity) const;

    void setHeight(int v) { m_height = v; }
    void setWidth(int v) { m_width = v; }
    void setPixelScaleX(double v) { m_pixelScaleX = v; }
    void setPixelScaleY(double v) { m_pixelScaleY = v; }
    void setPixelSizeX(double v) { m_pixelSizeX = v; }
    void setPixelSizeY(double v) { m_pixelSizeY = v; }

    void setDataStartLat(double v) { m_dataStartLat = v; m_bounds.reset(); }
    void setDataStartLon(double v) { m_dataStartLon = v; m_bounds.reset(); }
    void setDataEndLat(double v) { m_dataEndLat = v; m_bounds.reset(); }
    void setDataEndLon(double v) { m_dataEndLon = v; m_bounds.reset(); }

    void setPhysicalStartLat(double v) { m_physicalStartLat = v; }
    void setPhysicalStartLon(double v) { m_physicalStartLon = v; }
    void setPhysicalEndLat(double v) { m_physicalEndLat = v; }
    void setPhysicalEndLon(double v) { m_physicalEndLon = v; }

    void setBitsPerSample(int v) { m_bitsPerSample = v; }
    void setScanlineSize(int v) { m_scanlineSize = v; }
    void setWorldUnits(std::string v) { m_worldUnits = std::move(v); }
    void setSampleFormat(std::string v) { m_sampleFormat = std::move(v); }
    void setNoDataValue(std::string v) { m_noDataValue = std::move(v); }
    void setNoDataValueAsNumber(double v) { m_noData.set(v); }

    void setMinimumAltitude(double v) { m_minimumAltitude = v; }
    void setMaximumAltitude(double v) { m_maximumAltitude = v; }

    Json::Value toJson() const;

    // "<basename>: <bounding box>", for diagnostics.
    std::string toString() const;

private:
    FileMetadata(const FileMetadata& source, std::string syntheticName);

    std::string m_filename;
    TileKey m_key;
    RasterFormat m_fileFormat;
    std::string m_version;
    bool m_virtual = false;

    int m_height = 0;
    int m_width = 0;
    double m_pixelScaleX = 0;
    double m_pixelScaleY = 0;
    double m_pixelSizeX = 0;
    double m_pixelSizeY = 0;

    double m_dataStartLat = 0;
    double m_dataStartLon = 0;
    double m_dataEndLat = 0;
    double m_dataEndLon = 0;

    double m_physicalStartLat = 0;
    double m_physicalStartLon = 0;
    double m_physicalEndLat = 0;
    double m_physicalEndLon = 0;

    int m_bitsPerSample = 0;
    int m_scanlineSize = 0;
    std::string m_worldUnits;
    std::string m_sampleFormat;
    std::string m_noDataValue;

    double m_minimumAltitude = 0;
    double m_maximumAltitude = 0;

    Cached<BoundingBox> m_bounds;
    Cached<double> m_noData;
};

std::ostream& operator<<(std::ostream& os, const FileMetadata& metadata);

// Tile identity, see TileKey.
inline bool operator==(const FileMetadata& a, const FileMetadata& b)
{
    return a.equals(&b);
}

inline bool operator!=(const FileMetadata& a, const FileMetadata& b)
{
    return !(a == b);
}

using FileMetadataList = std::vector<FileMetadata>;

} // namespace demtile

namespace std
{
    template<> struct hash<demtile::FileMetadata>
    {
        std::size_t operator()(const demtile::FileMetadata& m) const
        {
            return m.hash();
        }
    };
}
