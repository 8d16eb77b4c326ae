#include "lanlink/items/item_store.hpp"

#include "lanlink/logging/lanlink_logging.hpp"

namespace lanlink
{

std::vector<Item> ItemStore::list() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    std::vector<Item> items;
    items.reserve(_items.size());
    for (auto it = _items.rbegin(); it != _items.rend(); ++it)
    {
        items.push_back(it->second);
    }
    return items;
}

Item ItemStore::create(const std::string& title, const std::string& updated_at)
{
    std::unique_lock<std::mutex> lock(_mutex);
    Item item {_next_id++, title, updated_at};
    _items.emplace(item.id, item);
    LANLINK_LOG_DEBUG("Created item " << item.id);
    return item;
}

std::optional<Item> ItemStore::update(std::int64_t id, const std::string& title, const std::string& updated_at)
{
    std::unique_lock<std::mutex> lock(_mutex);
    auto it = _items.find(id);
    if (it == _items.end())
    {
        return std::nullopt;
    }

    it->second.title      = title;
    it->second.updated_at = updated_at;
    LANLINK_LOG_DEBUG("Updated item " << id);
    return it->second;
}

bool ItemStore::remove(std::int64_t id)
{
    std::unique_lock<std::mutex> lock(_mutex);
    if (_items.erase(id) == 0U)
    {
        return false;
    }
    LANLINK_LOG_DEBUG("Deleted item " << id);
    return true;
}

std::size_t ItemStore::size() const
{
    std::unique_lock<std::mutex> lock(_mutex);
    return _items.size();
}

std::string ItemStore::trim_title(const std::string& title)
{
    const char* whitespace = " \t\r\n\f\v";
    const auto first       = title.find_first_not_of(whitespace);
    if (first == std::string::npos)
    {
        return {};
    }
    const auto last = title.find_last_not_of(whitespace);
    return title.substr(first, last - first + 1);
}

} // namespace lanlink
