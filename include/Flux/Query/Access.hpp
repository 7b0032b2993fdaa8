#pragma once

#include <algorithm>
#include <optional>
#include <string_view>
#include <vector>

#include "../Archetype/Signature.hpp"
#include "../Component/Component.hpp"
#include "../Core/Base.hpp"
#include "../Core/Error.hpp"
#include "../Core/Log.hpp"

namespace Flux
{
    /**
     * Component access declared by one query: which columns it touches and
     * whether each is written. A column may be read any number of times but
     * a write excludes every other use of the same column.
     */
    class FilteredAccess
    {
    public:
        struct Entry
        {
            ComponentID id = INVALID_COMPONENT;
            bool isMutable = false;
            std::string_view name;
        };

        FilteredAccess() = default;

        // Conflicts found by Add are reported through log
        explicit FilteredAccess(const Log& log) noexcept : m_log(&log) {}

        /**
         * Record an access.
         * @return false if it conflicts with an access already recorded
         */
        FLUX_NODISCARD bool TryAdd(ComponentID id, bool isMutable, std::string_view name = {})
        {
            if (const Entry* existing = Find(id))
            {
                if (isMutable || existing->isMutable)
                    return false;
                return true;
            }

            m_entries.push_back(Entry{id, isMutable, name});
            return true;
        }

        // Record an access; throws AccessConflictError on conflict
        void Add(ComponentID id, bool isMutable, std::string_view name = {})
        {
            if (!TryAdd(id, isMutable, name))
            {
                m_log->Fatal<AccessConflictError>(
                    "Query requests component '{}' more than once with mutable access", name);
            }
        }

        /**
         * First component accessed by both sets where at least one side writes.
         */
        FLUX_NODISCARD std::optional<Entry> FindConflict(const FilteredAccess& other) const
        {
            for (const Entry& entry : m_entries)
            {
                if (const Entry* theirs = other.Find(entry.id))
                {
                    if (entry.isMutable || theirs->isMutable)
                        return entry;
                }
            }
            return std::nullopt;
        }

        FLUX_NODISCARD bool ConflictsWith(const FilteredAccess& other) const
        {
            return FindConflict(other).has_value();
        }

        FLUX_NODISCARD bool Reads(ComponentID id) const noexcept
        {
            return Find(id) != nullptr;
        }

        FLUX_NODISCARD bool Writes(ComponentID id) const noexcept
        {
            const Entry* entry = Find(id);
            return entry && entry->isMutable;
        }

        // Components an archetype must contain to match
        FLUX_NODISCARD Signature GetRequired() const
        {
            std::vector<ComponentID> ids;
            ids.reserve(m_entries.size());
            for (const Entry& entry : m_entries)
            {
                ids.push_back(entry.id);
            }
            return Signature(std::move(ids));
        }

        FLUX_NODISCARD const std::vector<Entry>& GetEntries() const noexcept { return m_entries; }
        FLUX_NODISCARD bool Empty() const noexcept { return m_entries.empty(); }

    private:
        FLUX_NODISCARD const Entry* Find(ComponentID id) const noexcept
        {
            auto it = std::find_if(m_entries.begin(), m_entries.end(),
                [id](const Entry& entry) { return entry.id == id; });
            return it != m_entries.end() ? &*it : nullptr;
        }

        std::vector<Entry> m_entries;
        const Log* m_log = &GetDefaultLog();
    };
}
