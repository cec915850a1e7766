/******************************************************************************
* Copyright (c) 2016, Connor Manning (connor@hobu.co)
*
* Demtile -- Elevation tile metadata
*
* Demtile is available under the terms of the LGPL2 license. See COPYING
* for specific license text and more information.
*
******************************************************************************/

#include <demtile/types/version.hpp>

#include <demtile/types/exceptions.hpp>

namespace demtile
{

std::string toString(const VersionStatus status)
{
    switch (status)
    {
        case VersionStatus::Current:    return "current";
        case VersionStatus::Outdated:   return "outdated";
        case VersionStatus::Unknown:    return "unknown";
        default: throw std::runtime_error("Invalid version status");
    }
}

VersionStatus metadataVersionStatus(const std::string& tag)
{
    if (tag == currentMetadataVersion) return VersionStatus::Current;

    const auto& known(knownMetadataVersions());
    if (std::find(known.begin(), known.end(), tag) != known.end())
    {
        return VersionStatus::Outdated;
    }

    return VersionStatus::Unknown;
}

void requireCurrentMetadataVersion(const std::string& tag)
{
    const VersionStatus status(metadataVersionStatus(tag));
    if (status == VersionStatus::Current) return;

    throw RegenerationRequired(
            "Metadata version '" + tag + "' is " + toString(status) +
            ", expected " + currentMetadataVersion +
            " - metadata must be regenerated");
}

} // namespace demtile
