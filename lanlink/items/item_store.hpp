#pragma once

#include "lanlink/items/item.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace lanlink
{

/**
 * @brief In-memory table of items, safe to share between HTTP sessions.
 *
 * Ids start at 1 and are never reused, also not after a delete. Titles are stored as
 * given; callers trim and reject empty titles before they get here.
 */
class ItemStore
{
public:
    /// Every item, newest id first.
    std::vector<Item> list() const;

    Item create(const std::string& title, const std::string& updated_at);

    /// @return the updated item, or std::nullopt when no item has this id
    std::optional<Item> update(std::int64_t id, const std::string& title, const std::string& updated_at);

    /// @return false when no item has this id
    bool remove(std::int64_t id);

    std::size_t size() const;

    /// Leading and trailing whitespace removed.
    static std::string trim_title(const std::string& title);

private:
    mutable std::mutex _mutex;
    std::map<std::int64_t, Item> _items;
    std::int64_t _next_id = 1;
};

} // namespace lanlink
