#include "nooku/rotation/SongCatalog.hpp"

#include "core/Log.h"

#include <algorithm>
#include <system_error>

namespace nooku::rotation {

std::optional<DuplicatePolicy> ParseDuplicatePolicy(std::string_view text) noexcept
{
    if (text == "last") return DuplicatePolicy::LastWins;
    if (text == "first") return DuplicatePolicy::FirstWins;
    if (text == "reject") return DuplicatePolicy::Reject;
    return std::nullopt;
}

std::expected<SongCatalog, CatalogError>
SongCatalog::ScanDirectory(const std::filesystem::path& dir, DuplicatePolicy policy)
{
    std::error_code ec;
    std::filesystem::directory_iterator it(dir, ec);
    if (ec)
        return std::unexpected(CatalogError{CatalogError::Code::SourceUnreadable,
                                            dir.string() + ": " + ec.message()});

    std::vector<CatalogEntry> entries;
    for (const std::filesystem::directory_iterator end{}; it != end; it.increment(ec))
    {
        if (ec)
            return std::unexpected(CatalogError{CatalogError::Code::SourceUnreadable,
                                                dir.string() + ": " + ec.message()});

        std::error_code fileEc;
        if (!it->is_regular_file(fileEc))
            continue;

        const std::string name = it->path().filename().string();
        if (name.size() < 3)
        {
            LOG_WARN("Catalog: skipping %s (name shorter than a key)", name.c_str());
            continue;
        }
        entries.push_back(CatalogEntry{name.substr(0, 3), it->path()});
    }
    if (ec)
        return std::unexpected(CatalogError{CatalogError::Code::SourceUnreadable,
                                            dir.string() + ": " + ec.message()});

    std::sort(entries.begin(), entries.end(), [](const CatalogEntry& a, const CatalogEntry& b) {
        return a.resource.filename() < b.resource.filename();
    });

    return FromEntries(entries, policy);
}

std::expected<SongCatalog, CatalogError>
SongCatalog::FromEntries(std::span<const CatalogEntry> entries, DuplicatePolicy policy)
{
    SongCatalog catalog;

    for (const CatalogEntry& e : entries)
    {
        if (e.prefix == kReservedCatalogPrefix)
            continue;

        const auto key = ParseSelectionKey(e.prefix);
        if (!key)
        {
            LOG_WARN("Catalog: skipping %s (prefix '%s' is not a key)",
                     e.resource.string().c_str(), e.prefix.c_str());
            continue;
        }

        auto [slot, inserted] = catalog.m_songs.try_emplace(*key, e.resource);
        if (inserted)
            continue;

        switch (policy)
        {
        case DuplicatePolicy::LastWins:
            LOG_WARN("Catalog: key %s from %s replaces %s", e.prefix.c_str(),
                     e.resource.string().c_str(), slot->second.string().c_str());
            slot->second = e.resource;
            break;
        case DuplicatePolicy::FirstWins:
            LOG_WARN("Catalog: key %s from %s ignored, keeping %s", e.prefix.c_str(),
                     e.resource.string().c_str(), slot->second.string().c_str());
            break;
        case DuplicatePolicy::Reject:
            return std::unexpected(CatalogError{CatalogError::Code::DuplicateKey,
                                                "duplicate key " + e.prefix + ": " + slot->second.string() +
                                                " and " + e.resource.string()});
        }
    }

    return catalog;
}

const std::filesystem::path* SongCatalog::Find(const SelectionKey& key) const
{
    const auto it = m_songs.find(key);
    return it == m_songs.end() ? nullptr : &it->second;
}

std::vector<SelectionKey> SongCatalog::Keys() const
{
    std::vector<SelectionKey> keys;
    keys.reserve(m_songs.size());
    for (const auto& [key, path] : m_songs)
        keys.push_back(key);

    std::sort(keys.begin(), keys.end(), [](const SelectionKey& a, const SelectionKey& b) {
        return a.ToString() < b.ToString();
    });
    return keys;
}

} // namespace nooku::rotation
