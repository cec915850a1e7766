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
#include <string>
#include <utility>
#include <unordered_map>

#include <json/json.h>

#include <demtile/types/bounds.hpp>
#include <demtile/types/config.hpp>
#include <demtile/types/file-metadata.hpp>
#include <demtile/types/tile-key.hpp>

namespace demtile
{

// The metadata of a directory of elevation tiles, one entry per tile key.
class Catalog
{
public:
    explicit Catalog(Config config = Config());

    // Loads a persisted array of file metadata.  Entries not at the current
    // metadata version cause RegenerationRequired if the config is strict,
    // and are skipped otherwise.
    Catalog(const Json::Value& json, Config config);

    // Returns false, leaving the catalog unchanged, if the tile is virtual or
    // its key is already present.
    bool add(FileMetadata metadata);

    // Lookup by the base name of the path.
    const FileMetadata* find(const std::string& path) const;

    // Tiles whose bounding box touches the query, in insertion order.
    FileMetadataList intersecting(const BoundingBox& query) const;

    // Union of every tile's bounding box, empty if there are no tiles.
    BoundingBox bounds() const;

    std::size_t size() const { return m_list.size(); }
    bool empty() const { return m_list.empty(); }
    const FileMetadataList& list() const { return m_list; }

    // Number of persisted entries skipped on load for being out of date.
    std::size_t rejected() const { return m_rejected; }

    const Config& config() const { return m_config; }

    Json::Value toJson() const;

private:
    Config m_config;
    FileMetadataList m_list;
    std::unordered_map<TileKey, std::size_t> m_index;
    std::size_t m_rejected = 0;
};

} // namespace demtile
