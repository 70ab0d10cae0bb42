#include <gtest/gtest.h>
#include "stow/store.hpp"
#include <filesystem>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

using namespace stow;
using nlohmann::json;


TEST(SetValueTest, ScalarReplacesWholeValue) {
    Store<int> store;
    store.add("count", 1);
    store.set_value("count", {std::nullopt, 7});
    EXPECT_EQ(store.fetch("count").data, 7);
}

TEST(SetValueTest, ScalarIgnoresKey) {
    Store<std::string> store;
    store.add("greeting", "hello");
    store.set_value("greeting", {"whatever", "hi"});
    EXPECT_EQ(store.fetch("greeting").data, "hi");
}

TEST(SetValueTest, PreservesId) {
    Store<int> store;
    store.add("a", 1);
    store.add("b", 2);
    store.set_value("b", {std::nullopt, 3});
    EXPECT_EQ(store.fetch("b").id, 1);
}

TEST(SetValueTest, ByIdResolvesName) {
    Store<int> store;
    store.add("a", 1);
    store.set_value_by_id(0, {std::nullopt, 9});
    EXPECT_EQ(store.fetch("a").data, 9);
}

TEST(SetValueTest, MissingEntryThrowsNotFound) {
    Store<int> store;
    EXPECT_THROW(store.set_value("missing", {std::nullopt, 1}), NameNotFoundError);
    EXPECT_THROW(store.set_value_by_id(3, {std::nullopt, 1}), IdNotFoundError);
}

TEST(SetValueTest, JsonObjectChangesOnlyThatKey) {
    Store<json> store;
    store.add("user", json{{"name", "ada"}, {"age", 36}});

    store.set_value("user", {"age", 37});

    const auto& data = store.fetch("user").data;
    EXPECT_EQ(data["age"], 37);
    EXPECT_EQ(data["name"], "ada");
    EXPECT_EQ(data.size(), 2u);
}

TEST(SetValueTest, JsonObjectRequiresKey) {
    Store<json> store;
    store.add("user", json{{"name", "ada"}});

    EXPECT_THROW(store.set_value("user", {std::nullopt, "bob"}), KeyUndefinedError);
    EXPECT_EQ(store.fetch("user").data, (json{{"name", "ada"}}));
}

TEST(SetValueTest, JsonObjectRejectsUnknownKey) {
    Store<json> store;
    store.add("user", json{{"name", "ada"}});

    try {
        store.set_value("user", {"email", "ada@example.com"});
        FAIL() << "expected InvalidKeyError";
    } catch (const InvalidKeyError& e) {
        EXPECT_EQ(e.key(), "email");
        EXPECT_EQ(e.store_name(), "unnamed db");
    }
    EXPECT_EQ(store.fetch("user").data, (json{{"name", "ada"}}));
}

TEST(SetValueTest, InvalidKeyErrorNamesStore) {
    auto dir = std::filesystem::temp_directory_path() / "stowrage_set_value_test";
    StoreOptions options;
    options.name = "settings";
    options.path = dir;
    Store<json> store{options};
    store.add("user", json{{"name", "ada"}});

    try {
        store.set_value("user", {"email", "x"});
        FAIL() << "expected InvalidKeyError";
    } catch (const InvalidKeyError& e) {
        EXPECT_EQ(e.store_name(), "settings");
    }
    std::filesystem::remove_all(dir);
}

TEST(SetValueTest, JsonPrimitiveIsReplacedWhole) {
    Store<json> store;
    store.add("flag", true);
    store.set_value("flag", {"ignored", false});
    EXPECT_EQ(store.fetch("flag").data, false);
}

TEST(SetValueTest, JsonArrayIsReplacedWhole) {
    Store<json> store;
    store.add("list", json::array({1, 2, 3}));
    store.set_value("list", {std::nullopt, json::array({4})});
    EXPECT_EQ(store.fetch("list").data, json::array({4}));
}

TEST(SetValueTest, MapChangesOnlyThatKey) {
    using Scores = std::map<std::string, int>;
    Store<Scores> store;
    store.add("scores", Scores{{"alice", 1}, {"bob", 2}});

    store.set_value("scores", {"bob", 5});

    const auto& data = store.fetch("scores").data;
    EXPECT_EQ(data.at("bob"), 5);
    EXPECT_EQ(data.at("alice"), 1);
}

TEST(SetValueTest, MapRejectsMissingOrUnknownKey) {
    using Scores = std::map<std::string, int>;
    Store<Scores> store;
    store.add("scores", Scores{{"alice", 1}});

    EXPECT_THROW(store.set_value("scores", {std::nullopt, 3}), KeyUndefinedError);
    EXPECT_THROW(store.set_value("scores", {"carol", 3}), InvalidKeyError);
    EXPECT_EQ(store.fetch("scores").data, (Scores{{"alice", 1}}));
}
