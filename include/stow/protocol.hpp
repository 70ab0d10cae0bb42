#pragma once

#include "stow/errors.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace stow {

class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& msg) : std::runtime_error(msg) {}
};

struct Add {
    std::string name;
    nlohmann::json value;
};

struct Ensure {
    std::string name;
    nlohmann::json value;
};

struct Get {
    std::string name;
};

struct GetId {
    EntryId id;
};

struct Range {
    EntryId start;
    EntryId length;
};

struct Del {
    std::string name;
};

struct DelId {
    EntryId id;
};

struct DelRange {
    EntryId start;
    EntryId length;
};

struct Override {
    std::string name;
    nlohmann::json value;
};

struct OverrideId {
    EntryId id;
    nlohmann::json value;
};

struct SetVal {
    std::string name;
    std::optional<std::string> key;
    nlohmann::json value;
};

struct Has {
    std::string name;
};

struct Count {};
struct Clear {};
struct Ping {};
struct NoOp {};

using Command = std::variant<Add, Ensure, Get, GetId, Range, Del, DelId, DelRange,
                             Override, OverrideId, SetVal, Has, Count, Clear, Ping, NoOp>;

/*
 * Parses shell lines into commands and formats replies.
 * Command words are case-insensitive; a value argument takes the rest
 * of the line and must be JSON.
 */
class Protocol {
public:
    static Command parse(std::string_view line);

    static std::string format_ok();
    static std::string format_error(std::string_view message);
    static std::string format_value(std::string_view value);

private:
    static Command parse_command(const std::string& cmd, std::string_view rest);
};

} // namespace stow
