#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>

namespace lanlink
{

/// One titled record served under /items.
struct Item
{
    std::int64_t id = 0;
    std::string title;
    std::string updated_at; ///< ISO 8601 UTC, refreshed on every write
};

inline bool operator==(const Item& lhs, const Item& rhs)
{
    return lhs.id == rhs.id && lhs.title == rhs.title && lhs.updated_at == rhs.updated_at;
}

inline void to_json(nlohmann::json& json, const Item& item)
{
    json = nlohmann::json {{"id", item.id}, {"title", item.title}, {"updated_at", item.updated_at}};
}

inline void from_json(const nlohmann::json& json, Item& item)
{
    json.at("id").get_to(item.id);
    json.at("title").get_to(item.title);
    item.updated_at = json.value("updated_at", std::string());
}

} // namespace lanlink
