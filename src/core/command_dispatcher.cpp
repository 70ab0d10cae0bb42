#include "stow/command_dispatcher.hpp"

#include <type_traits>
#include <variant>
#include <vector>

namespace stow {

nlohmann::json entry_to_json(const Entry<nlohmann::json>& entry) {
    return nlohmann::json{{"id", entry.id}, {"name", entry.name}, {"data", entry.data}};
}

namespace {

std::string format_entries(const std::vector<Entry<nlohmann::json>>& entries) {
    nlohmann::json out = nlohmann::json::array();
    for (const auto& entry : entries)
        out.push_back(entry_to_json(entry));
    return Protocol::format_value(out.dump());
}

} // namespace

std::string CommandDispatcher::execute(const Command& command, JsonStore& store) {
    try {
        return std::visit([&](const auto& cmd) -> std::string {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, Add>) {
                store.add(cmd.name, cmd.value);
                return Protocol::format_ok();

            } else if constexpr (std::is_same_v<T, Ensure>) {
                auto entry = store.ensure(cmd.name, cmd.value);
                return Protocol::format_value(std::to_string(entry.id));

            } else if constexpr (std::is_same_v<T, Get>) {
                return Protocol::format_value(entry_to_json(store.fetch(cmd.name)).dump());

            } else if constexpr (std::is_same_v<T, GetId>) {
                return Protocol::format_value(entry_to_json(store.fetch_by_id(cmd.id)).dump());

            } else if constexpr (std::is_same_v<T, Range>) {
                return format_entries(store.fetch_range(cmd.start, cmd.length));

            } else if constexpr (std::is_same_v<T, Del>) {
                store.erase(cmd.name);
                return Protocol::format_ok();

            } else if constexpr (std::is_same_v<T, DelId>) {
                store.erase_by_id(cmd.id);
                return Protocol::format_ok();

            } else if constexpr (std::is_same_v<T, DelRange>) {
                store.erase_range(cmd.start, cmd.length);
                return Protocol::format_ok();

            } else if constexpr (std::is_same_v<T, Override>) {
                store.override(cmd.name, cmd.value);
                return Protocol::format_ok();

            } else if constexpr (std::is_same_v<T, OverrideId>) {
                store.override_by_id(cmd.id, cmd.value);
                return Protocol::format_ok();

            } else if constexpr (std::is_same_v<T, SetVal>) {
                store.set_value(cmd.name, ValueChange<nlohmann::json>{cmd.key, cmd.value});
                return Protocol::format_ok();

            } else if constexpr (std::is_same_v<T, Has>) {
                return Protocol::format_value(store.has(cmd.name) ? "true" : "false");

            } else if constexpr (std::is_same_v<T, Count>) {
                return Protocol::format_value(std::to_string(store.total_entries()));

            } else if constexpr (std::is_same_v<T, Clear>) {
                store.clear();
                return Protocol::format_ok();

            } else if constexpr (std::is_same_v<T, Ping>) {
                return Protocol::format_value("Pong");

            } else if constexpr (std::is_same_v<T, NoOp>) {
                return {};
            }
        }, command);
    } catch (const StoreError& e) {
        return Protocol::format_error(e.what());
    } catch (const nlohmann::json::exception& e) {
        // names and strings that are not valid UTF-8 cannot be dumped
        return Protocol::format_error(e.what());
    }
}

} // namespace stow
