#include <gtest/gtest.h>
#include "stow/store.hpp"
#include <filesystem>
#include <limits>
#include <string>
#include <vector>

using namespace stow;

class StoreTest : public ::testing::Test {
protected:
    Store<int> store;

    void add_letters(const std::string& letters) {
        int value = 0;
        for (char c : letters)
            store.add(std::string(1, c), value++);
    }
};


TEST_F(StoreTest, AddThenFetch) {
    store.add("key", 42);
    EXPECT_TRUE(store.has("key"));

    const auto& entry = store.fetch("key");
    EXPECT_EQ(entry.name, "key");
    EXPECT_EQ(entry.data, 42);
    EXPECT_EQ(entry.id, 0);
}

TEST_F(StoreTest, IdsAreSequential) {
    EXPECT_EQ(store.ensure("a", 1).id, 0);
    EXPECT_EQ(store.ensure("b", 2).id, 1);
    EXPECT_EQ(store.ensure("c", 3).id, 2);
    EXPECT_EQ(store.total_entries(), 3u);
}

TEST_F(StoreTest, EnsureReturnsCreatedEntry) {
    store.add("first", 1);
    auto entry = store.ensure("second", 2);
    EXPECT_EQ(entry, (Entry<int>{1, "second", 2}));
    EXPECT_EQ(store.fetch_by_id(1), entry);
}

TEST_F(StoreTest, DuplicateNameThrowsAndLeavesStoreUnchanged) {
    store.add("key", 1);
    EXPECT_THROW(store.add("key", 2), NameDuplicationError);
    EXPECT_THROW(store.ensure("key", 3), NameDuplicationError);

    EXPECT_EQ(store.total_entries(), 1u);
    EXPECT_EQ(store.fetch("key").data, 1);
    // the failed adds did not consume ids
    EXPECT_EQ(store.ensure("other", 4).id, 1);
}

TEST_F(StoreTest, DuplicationErrorCarriesName) {
    store.add("key", 1);
    try {
        store.add("key", 2);
        FAIL() << "expected NameDuplicationError";
    } catch (const NameDuplicationError& e) {
        EXPECT_EQ(e.name(), "key");
    }
}

TEST_F(StoreTest, MissingKeysThrowNotFound) {
    store.add("present", 1);

    EXPECT_THROW(store.fetch("missing"), NameNotFoundError);
    EXPECT_THROW(store.fetch_by_id(7), IdNotFoundError);
    EXPECT_THROW(store.erase("missing"), NameNotFoundError);
    EXPECT_THROW(store.erase_by_id(7), IdNotFoundError);
    EXPECT_THROW(store.override("missing", 2), NameNotFoundError);
    EXPECT_THROW(store.override_by_id(7, 2), IdNotFoundError);

    EXPECT_EQ(store.total_entries(), 1u);
    EXPECT_EQ(store.fetch("present").data, 1);
}

TEST_F(StoreTest, IdNotFoundErrorCarriesId) {
    try {
        store.fetch_by_id(12);
        FAIL() << "expected IdNotFoundError";
    } catch (const IdNotFoundError& e) {
        EXPECT_EQ(e.id(), 12);
    }
}

TEST_F(StoreTest, EraseRemovesBothIndices) {
    store.add("a", 1);
    store.add("b", 2);
    store.erase("a");

    EXPECT_FALSE(store.has("a"));
    EXPECT_THROW(store.fetch_by_id(0), IdNotFoundError);
    EXPECT_EQ(store.fetch_by_id(1).name, "b");
    EXPECT_EQ(store.total_entries(), 1u);
}

TEST_F(StoreTest, EraseByIdRemovesName) {
    store.add("a", 1);
    store.add("b", 2);
    store.erase_by_id(1);

    EXPECT_FALSE(store.has("b"));
    EXPECT_THROW(store.fetch("b"), NameNotFoundError);
    EXPECT_TRUE(store.has("a"));
}

TEST_F(StoreTest, IdsAreNotReusedAfterErase) {
    store.add("a", 1);
    store.erase("a");
    EXPECT_EQ(store.ensure("a", 2).id, 1);
}

TEST_F(StoreTest, OverridePreservesId) {
    store.add("a", 1);
    store.add("b", 2);
    EntryId before = store.fetch("b").id;

    store.override("b", 20);
    EXPECT_EQ(store.fetch("b").id, before);
    EXPECT_EQ(store.fetch("b").data, 20);
    EXPECT_EQ(store.total_entries(), 2u);
}

TEST_F(StoreTest, OverrideByIdReplacesData) {
    store.add("a", 1);
    store.override_by_id(0, 5);
    EXPECT_EQ(store.fetch("a").data, 5);
}

TEST_F(StoreTest, FilterKeepsInsertionOrder) {
    store.add("c", 3);
    store.add("a", 1);
    store.add("b", 2);

    auto matches = store.filter([](const Entry<int>& e) { return e.data > 1; });
    ASSERT_EQ(matches.size(), 2u);
    EXPECT_EQ(matches[0].name, "c");
    EXPECT_EQ(matches[1].name, "b");
}

TEST_F(StoreTest, FilterWithoutMatchesIsEmpty) {
    store.add("a", 1);
    EXPECT_TRUE(store.filter([](const Entry<int>&) { return false; }).empty());
}

TEST_F(StoreTest, FindReturnsFirstMatchOrNullopt) {
    store.add("a", 1);
    store.add("b", 2);
    store.add("c", 2);

    auto found = store.find([](const Entry<int>& e) { return e.data == 2; });
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->name, "b");

    EXPECT_FALSE(store.find([](const Entry<int>& e) { return e.data == 9; }).has_value());
}

TEST_F(StoreTest, FetchRangeIsHalfOpen) {
    add_letters("abcde");
    auto entries = store.fetch_range(1, 2);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, 1);
    EXPECT_EQ(entries[1].id, 2);
}

TEST_F(StoreTest, FetchRangeCoveringStoreReturnsAll) {
    add_letters("abcde");
    EXPECT_EQ(store.fetch_range(0, 10).size(), 5u);
    EXPECT_EQ(store.fetch_range(3, 2).size(), 5u);
}

TEST_F(StoreTest, EraseRangeIsInclusive) {
    add_letters("abcde");
    store.erase_range(1, 2);

    EXPECT_EQ(store.total_entries(), 2u);
    EXPECT_TRUE(store.has("a"));
    EXPECT_FALSE(store.has("b"));
    EXPECT_FALSE(store.has("c"));
    EXPECT_FALSE(store.has("d"));
    EXPECT_TRUE(store.has("e"));
    EXPECT_THROW(store.fetch_by_id(3), IdNotFoundError);
}

TEST_F(StoreTest, EraseRangeOfLengthZeroRemovesOneId) {
    store.add("a", 1);
    store.add("b", 2);
    store.erase_range(0, 0);

    EXPECT_FALSE(store.has("a"));
    ASSERT_TRUE(store.has("b"));
    EXPECT_EQ(store.fetch("b").id, 1);
    EXPECT_EQ(store.fetch("b").data, 2);
}

// The clear branch compares start + length with the entry count, not with the ids
TEST_F(StoreTest, EraseRangeReachingCountClearsEverything) {
    add_letters("abcde");
    store.erase("a");
    store.erase("b");
    ASSERT_EQ(store.total_entries(), 3u);

    store.erase_range(3, 0);
    EXPECT_EQ(store.total_entries(), 0u);
    EXPECT_FALSE(store.has("c"));
    EXPECT_EQ(store.ensure("f", 6).id, 0);
}

TEST_F(StoreTest, EraseRangeWithNegativeLengthKeepsEntries) {
    add_letters("abcde");
    store.erase_range(2, -1);
    EXPECT_EQ(store.total_entries(), 5u);
}

TEST_F(StoreTest, RangesEndingPastLargestIdCoverEverything) {
    constexpr EntryId max = std::numeric_limits<EntryId>::max();
    add_letters("abc");
    EXPECT_EQ(store.fetch_range(max, 1).size(), 3u);
    EXPECT_EQ(store.fetch_range(1, max).size(), 3u);

    store.erase_range(max, 1);
    EXPECT_EQ(store.total_entries(), 0u);
}

TEST_F(StoreTest, RangesEndingBelowSmallestIdCoverNothing) {
    constexpr EntryId min = std::numeric_limits<EntryId>::min();
    add_letters("abc");
    EXPECT_TRUE(store.fetch_range(min, -1).empty());

    store.erase_range(min, -1);
    store.erase_range(-1, min);
    EXPECT_EQ(store.total_entries(), 3u);
}

TEST_F(StoreTest, ClearResetsIds) {
    add_letters("abc");
    store.clear();

    EXPECT_EQ(store.total_entries(), 0u);
    EXPECT_FALSE(store.has("a"));
    EXPECT_EQ(store.ensure("a", 1).id, 0);
}

TEST_F(StoreTest, HasIsCaseSensitive) {
    store.add("NAME", 1);
    EXPECT_TRUE(store.has("NAME"));
    EXPECT_FALSE(store.has("name"));
}

TEST_F(StoreTest, InitWithoutPersistenceThrows) {
    try {
        store.init();
        FAIL() << "expected NonPersistentError";
    } catch (const NonPersistentError& e) {
        EXPECT_EQ(e.store_name(), "unnamed db");
        EXPECT_EQ(e.action(), "initiated");
    }
    EXPECT_FALSE(store.is_mirrored());
}

TEST_F(StoreTest, CloseWithoutMirrorThrows) {
    try {
        store.close();
        FAIL() << "expected NonPersistentError";
    } catch (const NonPersistentError& e) {
        EXPECT_EQ(e.action(), "closed");
    }
}

TEST_F(StoreTest, StoresStrings) {
    Store<std::string> strings;
    strings.add("greeting", "hello");
    strings.override("greeting", "bye");
    EXPECT_EQ(strings.fetch("greeting").data, "bye");
}


TEST(StoreEvictionTest, EvictsOldestPastCapacity) {
    StoreOptions options;
    options.max_entries = 2;
    Store<int> store{options};

    store.add("a", 1);
    store.add("b", 2);
    store.add("c", 3);

    EXPECT_EQ(store.total_entries(), 2u);
    EXPECT_FALSE(store.has("a"));
    EXPECT_THROW(store.fetch_by_id(0), IdNotFoundError);
    EXPECT_TRUE(store.has("b"));
    EXPECT_TRUE(store.has("c"));
}

TEST(StoreEvictionTest, KeepsCapacityWhileAdding) {
    StoreOptions options;
    options.max_entries = 3;
    Store<int> store{options};

    for (int i = 0; i < 10; ++i)
        store.add("key" + std::to_string(i), i);

    ASSERT_EQ(store.total_entries(), 3u);
    auto all = store.fetch_range(0, 100);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, 7);
    EXPECT_EQ(all[1].id, 8);
    EXPECT_EQ(all[2].id, 9);
}

TEST(StoreEvictionTest, MissingEvictionTargetIsNoOp) {
    StoreOptions options;
    options.max_entries = 2;
    Store<int> store{options};

    store.add("a", 0);
    store.add("b", 1);
    store.erase("b");
    store.add("c", 2);
    // the eviction target is id 1, which is already gone
    store.add("d", 3);

    EXPECT_EQ(store.total_entries(), 3u);
    EXPECT_TRUE(store.has("a"));
}

TEST(StoreEvictionTest, ZeroMaxEntriesIsUnbounded) {
    StoreOptions options;
    options.max_entries = 0;
    Store<int> store{options};

    for (int i = 0; i < 5; ++i)
        store.add("key" + std::to_string(i), i);
    EXPECT_EQ(store.total_entries(), 5u);
}


TEST(StoreDirectoryTest, NamedStoreCreatesDirectory) {
    auto dir = std::filesystem::temp_directory_path() / "stowrage_directory_test";
    std::filesystem::remove_all(dir);

    StoreOptions options;
    options.name = "named";
    options.path = dir;
    Store<int> store{options};

    EXPECT_TRUE(std::filesystem::is_directory(dir));
    // not persistent, so no mirror file
    EXPECT_FALSE(std::filesystem::exists(dir / "named.db"));
    std::filesystem::remove_all(dir);
}

TEST(StoreDirectoryTest, UnnamedStoreLeavesFilesystemAlone) {
    auto dir = std::filesystem::temp_directory_path() / "stowrage_unnamed_test";
    std::filesystem::remove_all(dir);

    StoreOptions options;
    options.path = dir;
    Store<int> store{options};

    EXPECT_FALSE(std::filesystem::exists(dir));
}
