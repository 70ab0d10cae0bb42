#pragma once

#include "stow/codec.hpp"
#include "stow/errors.hpp"
#include "stow/logger.hpp"
#include "stow/mirror.hpp"
#include "stow/value_traits.hpp"

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>
#include <vector>

namespace stow {

template <typename T>
struct Entry {
    EntryId id;
    std::string name;
    T data;

    bool operator==(const Entry&) const = default;
};

struct StoreOptions {
    // Zero or unset means unbounded
    std::optional<std::size_t> max_entries;
    // Required for persistence; also names the mirror file
    std::optional<std::string> name;
    bool persistent = false;
    std::filesystem::path path = "./stowrage/";
};

// Argument of set_value: which field to change (keyed data only) and its new value
template <typename T>
struct ValueChange {
    std::optional<std::string> key;
    typename ValueTraits<T>::field_type value;
};

/*
 * In-memory store of named values with sequential ids.
 *
 * Entries are indexed by id (ordered, which is also insertion order) and by name.
 * Both indices change together inside each mutating call, after validation.
 * When init() has opened a mirror, each mutation is written through to it.
 *
 * Not thread-safe; callers serialize access.
 * T must be copyable and convertible with nlohmann::json.
 */
template <typename T>
class Store {
public:
    explicit Store(StoreOptions options = {}, MirrorFactory factory = open_sqlite_mirror)
        : options_(std::move(options)),
          factory_(std::move(factory)),
          mirror_(std::make_unique<NullMirror>()) {
        if (!options_.name)
            return;
        std::error_code ec;
        std::filesystem::create_directories(options_.path, ec);
        if (ec)
            Logger::instance().warn("cannot create " + options_.path.string() + ": " + ec.message());
    }

    Store(const Store&) = delete;
    Store& operator=(const Store&) = delete;

    Store(Store&&) = default;
    Store& operator=(Store&&) = default;

    // Opens the mirror and replays its rows.
    // Throws NonPersistentError unless the store is named and persistent.
    void init() {
        if (!options_.name || !options_.persistent)
            throw NonPersistentError{display_name(), "initiated"};
        if (mirror_->is_open()) {
            Logger::instance().warn(display_name() + " is already initiated");
            return;
        }

        std::unique_ptr<Mirror> mirror = factory_(options_.path, *options_.name);
        std::vector<MirrorRow> rows = mirror->load();

        std::vector<T> values;
        values.reserve(rows.size());
        for (const auto& row : rows)
            values.push_back(decode_value<T>(row.data));

        for (const auto& row : rows) {
            if (has(row.name))
                throw NameDuplicationError{row.name};
        }

        // Rows whose id is already taken in memory move above every stored id
        EntryId taken_below = next_id_;
        EntryId moved_id = std::max(next_id_, rows.empty() ? EntryId{0} : rows.back().id + 1);

        mirror_ = std::move(mirror);
        for (std::size_t i = 0; i < rows.size(); ++i) {
            EntryId id = rows[i].id >= taken_below ? rows[i].id : moved_id++;
            replay(rows[i], id, std::move(values[i]));
        }

        Logger::instance().info("initiated " + display_name() + " with " +
                                std::to_string(entries_.size()) + " entries");
    }

    void add(const std::string& name, T value) {
        ensure(name, std::move(value));
    }

    // add() that also returns the created entry
    Entry<T> ensure(const std::string& name, T value) {
        if (has(name))
            throw NameDuplicationError{name};
        EntryId id = next_id_++;
        Entry<T> created = insert_entry(id, name, std::move(value));
        if (mirror_->is_open())
            mirror_->insert(MirrorRow{id, name, encode_value(created.data)});
        evict_over_capacity(id);
        return created;
    }

    void erase(const std::string& name) {
        auto it = ids_by_name_.find(name);
        if (it == ids_by_name_.end())
            throw NameNotFoundError{name};
        remove_entry(it->second);
    }

    void erase_by_id(EntryId id) {
        if (entries_.find(id) == entries_.end())
            throw IdNotFoundError{id};
        remove_entry(id);
    }

    // Removes ids in [start, start + length].
    // When start + length reaches the entry count the whole store is cleared instead.
    void erase_range(EntryId start, EntryId length) {
        EntryId last = range_end(start, length);
        if (last >= static_cast<EntryId>(entries_.size())) {
            clear();
            return;
        }
        if (last < start)
            return;

        auto first_it = entries_.lower_bound(start);
        auto last_it = entries_.upper_bound(last);
        for (auto it = first_it; it != last_it; ++it)
            ids_by_name_.erase(it->second.name);
        entries_.erase(first_it, last_it);
        mirror_->erase_range(start, last);
    }

    void override(const std::string& name, T value) {
        auto it = ids_by_name_.find(name);
        if (it == ids_by_name_.end())
            throw NameNotFoundError{name};

        Entry<T>& entry = entries_.at(it->second);
        entry.data = std::move(value);
        if (mirror_->is_open())
            mirror_->replace(MirrorRow{entry.id, entry.name, encode_value(entry.data)});
    }

    void override_by_id(EntryId id, T value) {
        override(name_of(id), std::move(value));
    }

    template <typename Pred>
    std::vector<Entry<T>> filter(Pred pred) const {
        std::vector<Entry<T>> out;
        for (const auto& [id, entry] : entries_) {
            if (pred(entry))
                out.push_back(entry);
        }
        return out;
    }

    template <typename Pred>
    std::optional<Entry<T>> find(Pred pred) const {
        for (const auto& [id, entry] : entries_) {
            if (pred(entry))
                return entry;
        }
        return std::nullopt;
    }

    const Entry<T>& fetch(const std::string& name) const {
        auto it = ids_by_name_.find(name);
        if (it == ids_by_name_.end())
            throw NameNotFoundError{name};
        return entries_.at(it->second);
    }

    const Entry<T>& fetch_by_id(EntryId id) const {
        auto it = entries_.find(id);
        if (it == entries_.end())
            throw IdNotFoundError{id};
        return it->second;
    }

    // Entries with ids in [start, start + length), or every entry when the
    // range reaches the entry count
    std::vector<Entry<T>> fetch_range(EntryId start, EntryId length) const {
        EntryId end = range_end(start, length);
        std::vector<Entry<T>> out;
        if (end >= static_cast<EntryId>(entries_.size())) {
            for (const auto& [id, entry] : entries_)
                out.push_back(entry);
            return out;
        }
        for (auto it = entries_.lower_bound(start); it != entries_.end() && it->first < end; ++it)
            out.push_back(it->second);
        return out;
    }

    void set_value(const std::string& name, ValueChange<T> change) {
        const Entry<T>& entry = fetch(name);
        override(name, changed_copy(entry.data, std::move(change)));
    }

    void set_value_by_id(EntryId id, ValueChange<T> change) {
        set_value(name_of(id), std::move(change));
    }

    bool has(const std::string& name) const {
        return ids_by_name_.find(name) != ids_by_name_.end();
    }

    // Drops every entry and restarts ids at zero
    void clear() {
        entries_.clear();
        ids_by_name_.clear();
        next_id_ = 0;
        mirror_->clear();
    }

    // Throws NonPersistentError when no mirror is open.
    // The store stays usable in memory afterwards.
    void close() {
        if (!mirror_->is_open())
            throw NonPersistentError{display_name(), "closed"};
        mirror_->close();
        mirror_ = std::make_unique<NullMirror>();
        Logger::instance().info("closed " + display_name());
    }

    std::size_t total_entries() const {
        return entries_.size();
    }

    bool is_mirrored() const noexcept {
        return mirror_->is_open();
    }

    const StoreOptions& options() const noexcept {
        return options_;
    }

private:
    std::string display_name() const {
        return options_.name.value_or("unnamed db");
    }

    const std::string& name_of(EntryId id) const {
        auto it = entries_.find(id);
        if (it == entries_.end())
            throw IdNotFoundError{id};
        return it->second.name;
    }

    Entry<T> insert_entry(EntryId id, const std::string& name, T value) {
        auto [it, inserted] = entries_.emplace(id, Entry<T>{id, name, std::move(value)});
        ids_by_name_.emplace(name, id);
        return it->second;
    }

    void remove_entry(EntryId id) {
        auto it = entries_.find(id);
        ids_by_name_.erase(it->second.name);
        entries_.erase(it);
        mirror_->erase_id(id);
    }

    // Evicts the entry max_entries positions older than newest once the cap is exceeded
    void evict_over_capacity(EntryId newest) {
        if (!options_.max_entries || *options_.max_entries == 0)
            return;
        if (entries_.size() <= *options_.max_entries)
            return;

        auto it = entries_.find(newest - static_cast<EntryId>(*options_.max_entries));
        if (it == entries_.end())
            return;

        std::string name = it->second.name;
        ids_by_name_.erase(name);
        entries_.erase(it);
        mirror_->erase_name(name);
        Logger::instance().debug("evicted \"" + name + "\" from " + display_name());
    }

    // start + length, held at the EntryId limits instead of overflowing
    static EntryId range_end(EntryId start, EntryId length) {
        if (length > 0 && start > std::numeric_limits<EntryId>::max() - length)
            return std::numeric_limits<EntryId>::max();
        if (length < 0 && start < std::numeric_limits<EntryId>::min() - length)
            return std::numeric_limits<EntryId>::min();
        return start + length;
    }

    // Restores a stored row under id; a moved row is written anew before its old row goes
    void replay(const MirrorRow& row, EntryId id, T value) {
        next_id_ = std::max(next_id_, id + 1);
        Entry<T> restored = insert_entry(id, row.name, std::move(value));
        if (id != row.id) {
            mirror_->insert(MirrorRow{id, row.name, encode_value(restored.data)});
            mirror_->erase_id(row.id);
        }
        evict_over_capacity(id);
    }

    T changed_copy(const T& current, ValueChange<T> change) const {
        using Traits = ValueTraits<T>;
        T data = current;
        if (!Traits::is_keyed(data)) {
            Traits::assign(data, std::move(change.value));
            return data;
        }
        if (!change.key)
            throw KeyUndefinedError{};
        if (!Traits::has_field(data, *change.key))
            throw InvalidKeyError{*change.key, display_name()};
        Traits::set_field(data, *change.key, std::move(change.value));
        return data;
    }

    StoreOptions options_;
    MirrorFactory factory_;
    std::unique_ptr<Mirror> mirror_;

    std::map<EntryId, Entry<T>> entries_;
    std::unordered_map<std::string, EntryId> ids_by_name_;
    EntryId next_id_ = 0;
};

} // namespace stow
