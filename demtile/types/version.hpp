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

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>
#include <vector>

// Don't know where/which macro defines these things
#undef major
#undef minor

namespace demtile
{

class Version
{
public:
    Version() { }
    Version(int major, int minor = 0, int patch = 0)
        : m_major(major)
        , m_minor(minor)
        , m_patch(patch)
    { }

    Version(const std::string& s)
    {
        if (s.empty()) return;

        auto invalidCharacter([](char c)
        {
            return !(std::isdigit(static_cast<unsigned char>(c)) || c == '.');
        });

        if (s.front() == '.' ||
                std::any_of(s.begin(), s.end(), invalidCharacter))
        {
            throw std::runtime_error("Invalid version string: " + s);
        }

        m_major = std::stoi(s);

        const std::size_t p(s.find_first_of('.'));
        if (p != std::string::npos && p < s.size() - 1)
        {
            m_minor = std::stoi(s.substr(p + 1));
        }
        else return;

        const std::size_t q(s.find_first_of('.', p + 1));
        if (q != std::string::npos && q < s.size() - 1)
        {
            m_patch = std::stoi(s.substr(q + 1));
        }
    }

    int major() const { return m_major; }
    int minor() const { return m_minor; }
    int patch() const { return m_patch; }

    std::string toString() const
    {
        std::string s(std::to_string(major()) + "." + std::to_string(minor()));
        if (patch()) s += "." + std::to_string(patch());
        return s;
    }

    bool empty() const
    {
        return !m_major && !m_minor && !m_patch;
    }

private:
    int m_major = 0;
    int m_minor = 0;
    int m_patch = 0;
};

inline bool operator<(const Version& a, const Version& b)
{
    if (a.major() < b.major()) return true;
    else if (a.major() > b.major()) return false;

    if (a.minor() < b.minor()) return true;
    else if (a.minor() > b.minor()) return false;

    return a.patch() < b.patch();
}

inline bool operator>=(const Version& a, const Version& b)
{
    return !(a < b);
}

inline bool operator==(const Version& a, const Version& b)
{
    return
        a.major() == b.major() &&
        a.minor() == b.minor() &&
        a.patch() == b.patch();
}

inline bool operator!=(const Version& a, const Version& b)
{
    return !(a == b);
}

/*
 * Metadata schema history.  Every change here is a hard break: persisted
 * metadata written under any other tag must be regenerated from the source
 * rasters, never upgraded in place.
 *
 *  2.1 : File names are relative to the data directory.
 *  2.2 : File format is a full raster format definition (name, type,
 *        extension, registration) instead of a bare name and extension.
 *        Data and physical lat/lon bound fields renamed.
 */
constexpr const char* currentMetadataVersion = "2.2";

// Tags exactly as written by released builds.  Matching is on the raw
// string, so "2.2.0" or "02.2" is not a known tag.
inline const std::vector<std::string>& knownMetadataVersions()
{
    static const std::vector<std::string> versions { "2.1", "2.2" };
    return versions;
}

enum class VersionStatus : char
{
    Current,
    Outdated,   // A tag from the history above, older than the current one.
    Unknown     // Any other tag, including spellings of a known one.
};

std::string toString(VersionStatus status);

VersionStatus metadataVersionStatus(const std::string& tag);

// Throws RegenerationRequired unless the tag is the current version.
void requireCurrentMetadataVersion(const std::string& tag);

} // namespace demtile
