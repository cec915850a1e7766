/******************************************************************************
* Copyright (c) 2016, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <demtile/types/catalog.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

#include <demtile/types/exceptions.hpp>
#include <demtile/types/tile-key.hpp>
#include <demtile/types/version.hpp>
#include <demtile/util/json.hpp>

namespace demtile
{

Catalog::Catalog(Config config)
    : m_config(std::move(config))
{ }

Catalog::Catalog(const Json::Value& json, Config config)
    : Catalog(std::move(config))
{
    if (json.isNull()) return;

    if (!json.isArray())
    {
        throw std::runtime_error(
                "Invalid JSON catalog: " + toFastString(json));
    }

    const bool verbose(m_config.verbose());

    for (const Json::Value& entry : json)
    {
        if (!entry.isObject())
        {
            throw std::runtime_error(
                    "Invalid JSON catalog entry: " + toFastString(entry));
        }

        // The layout of other versions is unknown, so nothing beyond the
        // version tag is read from them.
        const std::string version(getString(entry, "version"));
        const VersionStatus status(metadataVersionStatus(version));

        if (status != VersionStatus::Current)
        {
            if (m_config.strictVersion())
            {
                requireCurrentMetadataVersion(version);
            }

            ++m_rejected;
            if (verbose)
            {
                const Json::Value& filename(entry["filename"]);
                std::cout << "Skipping " <<
                    (filename.isString() ?
                        getBasename(filename.asString()) : "entry") <<
                    ": metadata version '" << version << "' is " <<
                    toString(status) << std::endl;
            }
            continue;
        }

        add(FileMetadata(entry));
    }

    if (m_rejected && verbose)
    {
        std::cout << m_rejected << " entries need regeneration at version " <<
            currentMetadataVersion << std::endl;
    }
}

bool Catalog::add(FileMetadata metadata)
{
    if (metadata.isVirtual())
    {
        if (m_config.verbose())
        {
            std::cout << "Not cataloging virtual tile " <<
                metadata.filename() << std::endl;
        }
        return false;
    }

    if (m_index.count(metadata.key()))
    {
        if (m_config.verbose())
        {
            const FileMetadata& existing(m_list.at(m_index.at(metadata.key())));
            std::cout << "Skipping duplicate tile " << metadata.filename() <<
                " (already have " << existing.filename() << ")" << std::endl;
        }
        return false;
    }

    m_index[metadata.key()] = m_list.size();
    m_list.push_back(std::move(metadata));
    return true;
}

const FileMetadata* Catalog::find(const std::string& path) const
{
    const auto it(m_index.find(TileKey(path)));
    if (it == m_index.end()) return nullptr;
    return &m_list.at(it->second);
}

FileMetadataList Catalog::intersecting(const BoundingBox& query) const
{
    FileMetadataList result;

    for (const auto& metadata : m_list)
    {
        if (metadata.boundingBox().intersects(query))
        {
            result.push_back(metadata);
        }
    }

    return result;
}

BoundingBox Catalog::bounds() const
{
    if (m_list.empty()) return BoundingBox();

    BoundingBox result(m_list.front().boundingBox());
    for (const auto& metadata : m_list) result.grow(metadata.boundingBox());
    return result;
}

Json::Value Catalog::toJson() const
{
    Json::Value json(Json::arrayValue);
    for (const auto& metadata : m_list) json.append(metadata.toJson());
    return json;
}

} // namespace demtile
