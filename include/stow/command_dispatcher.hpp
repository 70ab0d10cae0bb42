#pragma once

#include "stow/protocol.hpp"
#include "stow/store.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace stow {

using JsonStore = Store<nlohmann::json>;

// {"id": .., "name": .., "data": ..}
nlohmann::json entry_to_json(const Entry<nlohmann::json>& entry);

class CommandDispatcher {
public:
    // Runs one command; store failures come back as error replies.
    // NoOp yields an empty reply.
    static std::string execute(const Command& command, JsonStore& store);
};

} // namespace stow
