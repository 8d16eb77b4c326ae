#include "lanlink/items/item_store.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

using namespace lanlink;

TEST(ItemStoreTest, ListsNewestFirst)
{
    ItemStore store;
    store.create("first", "2026-01-01T00:00:00.000Z");
    store.create("second", "2026-01-01T00:00:01.000Z");
    store.create("third", "2026-01-01T00:00:02.000Z");

    const auto items = store.list();
    ASSERT_EQ(items.size(), 3U);
    EXPECT_EQ(items[0].id, 3);
    EXPECT_EQ(items[0].title, "third");
    EXPECT_EQ(items[2].id, 1);
    EXPECT_EQ(items[2].title, "first");
}

TEST(ItemStoreTest, UpdateChangesTitleAndTime)
{
    ItemStore store;
    const auto created = store.create("draft", "2026-01-01T00:00:00.000Z");

    auto updated = store.update(created.id, "final", "2026-01-02T00:00:00.000Z");
    ASSERT_TRUE(updated.has_value());
    EXPECT_EQ(updated->title, "final");
    EXPECT_EQ(updated->updated_at, "2026-01-02T00:00:00.000Z");
    EXPECT_EQ(store.list().front(), *updated);

    EXPECT_FALSE(store.update(created.id + 1, "nothing", "2026-01-02T00:00:00.000Z").has_value());
}

TEST(ItemStoreTest, IdsAreNotReusedAfterDelete)
{
    ItemStore store;
    const auto first  = store.create("a", "t");
    const auto second = store.create("b", "t");

    EXPECT_TRUE(store.remove(second.id));
    EXPECT_FALSE(store.remove(second.id));
    EXPECT_EQ(store.size(), 1U);

    const auto third = store.create("c", "t");
    EXPECT_EQ(third.id, second.id + 1);
    EXPECT_NE(third.id, first.id);
}

TEST(ItemStoreTest, TrimTitle)
{
    EXPECT_EQ(ItemStore::trim_title("  milk \t\n"), "milk");
    EXPECT_EQ(ItemStore::trim_title("two words"), "two words");
    EXPECT_EQ(ItemStore::trim_title(" \r\n "), "");
    EXPECT_EQ(ItemStore::trim_title(""), "");
}

TEST(ItemStoreTest, JsonShape)
{
    const Item item {7, "bread", "2026-01-01T00:00:00.000Z"};
    const nlohmann::json json = item;

    EXPECT_EQ(json.at("id"), 7);
    EXPECT_EQ(json.at("title"), "bread");
    EXPECT_EQ(json.at("updated_at"), "2026-01-01T00:00:00.000Z");
    EXPECT_EQ(json.get<Item>(), item);
}
