#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace stow {

using EntryId = std::int64_t;

/*
 * Base of every failure raised by the store.
 * Each subclass keeps the offending key so callers can react without parsing what().
 */
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& msg) : std::runtime_error(msg) {}
};

class NameDuplicationError : public StoreError {
public:
    explicit NameDuplicationError(const std::string& name)
        : StoreError("entry \"" + name + "\" already exists"), name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class NameNotFoundError : public StoreError {
public:
    explicit NameNotFoundError(const std::string& name)
        : StoreError("no entry named \"" + name + "\""), name_(name) {}

    const std::string& name() const noexcept { return name_; }

private:
    std::string name_;
};

class IdNotFoundError : public StoreError {
public:
    explicit IdNotFoundError(EntryId id)
        : StoreError("no entry with id " + std::to_string(id)), id_(id) {}

    EntryId id() const noexcept { return id_; }

private:
    EntryId id_;
};

// set_value on keyed data without saying which key to change
class KeyUndefinedError : public StoreError {
public:
    KeyUndefinedError() : StoreError("a key is required to change keyed data") {}
};

class InvalidKeyError : public StoreError {
public:
    InvalidKeyError(const std::string& key, const std::string& store_name)
        : StoreError("key \"" + key + "\" does not exist in " + store_name),
          key_(key), store_name_(store_name) {}

    const std::string& key() const noexcept { return key_; }
    const std::string& store_name() const noexcept { return store_name_; }

private:
    std::string key_;
    std::string store_name_;
};

class NonPersistentError : public StoreError {
public:
    NonPersistentError(const std::string& store_name, const std::string& action)
        : StoreError(store_name + " is not persistent and cannot be " + action),
          store_name_(store_name), action_(action) {}

    const std::string& store_name() const noexcept { return store_name_; }
    const std::string& action() const noexcept { return action_; }

private:
    std::string store_name_;
    std::string action_;
};

// Mirror I/O failed or a stored row could not be decoded.
class PersistenceError : public StoreError {
public:
    explicit PersistenceError(const std::string& msg) : StoreError(msg) {}
};

} // namespace stow
