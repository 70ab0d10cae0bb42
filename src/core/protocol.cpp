#include "stow/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace stow {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && text.front() == ' ')
        text.remove_prefix(1);
    while (!text.empty() && text.back() == ' ')
        text.remove_suffix(1);
    return text;
}

// Splits the first space-delimited token off rest
std::string_view next_token(std::string_view& rest) {
    size_t pos = 0;
    while (pos < rest.size() && rest[pos] == ' ')
        ++pos;

    size_t start = pos;
    while (pos < rest.size() && rest[pos] != ' ')
        ++pos;

    std::string_view token = rest.substr(start, pos - start);
    rest.remove_prefix(pos);
    return token;
}

std::string require_token(std::string_view& rest, const char* usage) {
    std::string_view token = next_token(rest);
    if (token.empty())
        throw ProtocolError{usage};
    return std::string{token};
}

void require_end(std::string_view rest, const char* usage) {
    if (!trim(rest).empty())
        throw ProtocolError{usage};
}

EntryId parse_id(std::string_view token) {
    EntryId value = 0;
    auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size())
        throw ProtocolError{"invalid number: " + std::string{token}};
    return value;
}

EntryId require_id(std::string_view& rest, const char* usage) {
    return parse_id(require_token(rest, usage));
}

nlohmann::json require_json(std::string_view rest, const char* usage) {
    rest = trim(rest);
    if (rest.empty())
        throw ProtocolError{usage};

    nlohmann::json value = nlohmann::json::parse(rest, nullptr, false);
    if (value.is_discarded())
        throw ProtocolError{"invalid JSON value: " + std::string{rest}};
    return value;
}

} // namespace

Command Protocol::parse(std::string_view line) {
    // CRLF tolerance (windows, telnet, netcat)
    if (!line.empty() && line.back() == '\r') {
        line.remove_suffix(1);
    }

    std::string_view rest = line;
    std::string cmd{next_token(rest)};
    if (cmd.empty()) {
        return NoOp{ };
    }

    std::transform(cmd.begin(), cmd.end(), cmd.begin(), [](unsigned char c) {
        return std::tolower(c);
    });
    return parse_command(cmd, rest);
}

Command Protocol::parse_command(const std::string& cmd, std::string_view rest) {
    if (cmd == "add" || cmd == "ensure" || cmd == "override") {
        const char* usage = cmd == "add"    ? "ADD requires a name and a value" :
                            cmd == "ensure" ? "ENSURE requires a name and a value" :
                                              "OVERRIDE requires a name and a value";
        std::string name = require_token(rest, usage);
        nlohmann::json value = require_json(rest, usage);

        if (cmd == "add")
            return Add{ std::move(name), std::move(value) };
        if (cmd == "ensure")
            return Ensure{ std::move(name), std::move(value) };
        return Override{ std::move(name), std::move(value) };
    }

    if (cmd == "overrideid") {
        constexpr const char* usage = "OVERRIDEID requires an id and a value";
        EntryId id = require_id(rest, usage);
        return OverrideId{ id, require_json(rest, usage) };
    }

    if (cmd == "setval") {
        constexpr const char* usage = "SETVAL requires a name, an optional key and a value";
        std::string name = require_token(rest, usage);

        // "SETVAL name value" when the remainder is one JSON value, else "SETVAL name key value"
        if (nlohmann::json::accept(trim(rest)))
            return SetVal{ std::move(name), std::nullopt, require_json(rest, usage) };

        std::string key = require_token(rest, usage);
        return SetVal{ std::move(name), std::move(key), require_json(rest, usage) };
    }

    if (cmd == "get" || cmd == "del" || cmd == "has") {
        const char* usage = cmd == "get" ? "GET requires exactly one argument" :
                            cmd == "del" ? "DEL requires exactly one argument" :
                                           "HAS requires exactly one argument";
        std::string name = require_token(rest, usage);
        require_end(rest, usage);

        if (cmd == "get")
            return Get{ std::move(name) };
        if (cmd == "del")
            return Del{ std::move(name) };
        return Has{ std::move(name) };
    }

    if (cmd == "getid" || cmd == "delid") {
        const char* usage = cmd == "getid" ? "GETID requires exactly one id" :
                                             "DELID requires exactly one id";
        EntryId id = require_id(rest, usage);
        require_end(rest, usage);

        if (cmd == "getid")
            return GetId{ id };
        return DelId{ id };
    }

    if (cmd == "range" || cmd == "delrange") {
        const char* usage = cmd == "range" ? "RANGE requires a start and a length" :
                                             "DELRANGE requires a start and a length";
        EntryId start = require_id(rest, usage);
        EntryId length = require_id(rest, usage);
        require_end(rest, usage);

        if (cmd == "range")
            return Range{ start, length };
        return DelRange{ start, length };
    }

    if (cmd == "count") {
        require_end(rest, "COUNT takes no arguments");
        return Count{ };
    }

    if (cmd == "clear") {
        require_end(rest, "CLEAR takes no arguments");
        return Clear{ };
    }

    if (cmd == "ping") {
        require_end(rest, "PING takes no arguments");
        return Ping{ };
    }

    throw ProtocolError{"unknown command"};
}

std::string Protocol::format_ok() {
    return "+OK\n";
}

std::string Protocol::format_error(std::string_view message) {
    return "-ERR " + std::string{message} + "\n";
}

std::string Protocol::format_value(std::string_view value) {
    return "$" + std::string{value} + "\n";
}

} // namespace stow
