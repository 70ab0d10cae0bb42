#include "stow/command_dispatcher.hpp"
#include "stow/logger.hpp"
#include "stow/protocol.hpp"
#include "stow/store.hpp"

#include <charconv>
#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

/*
 * Entry point for the shell executable.
 * parse CLI args
 * open (and replay) the store
 * answer one command per stdin line until EOF
 */

namespace {

constexpr const char* kUsage =
    "usage: stowrage <name> [--persistent] [--max <n>] [--path <dir>] "
    "[--log-level <trace|debug|info|warn|error>]";

struct ShellArgs {
    stow::StoreOptions options;
    stow::LogLevel log_level = stow::LogLevel::Warn;
};

ShellArgs parse_args(int argc, char** argv) {
    ShellArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string_view arg{argv[i]};
        auto value = [&]() -> std::string_view {
            if (i + 1 >= argc)
                throw std::invalid_argument{std::string{arg} + " requires a value"};
            return argv[++i];
        };

        if (arg == "--persistent") {
            args.options.persistent = true;
        } else if (arg == "--max") {
            std::string_view text = value();
            std::size_t max = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), max);
            if (ec != std::errc{} || ptr != text.data() + text.size())
                throw std::invalid_argument{"--max expects a number, got " + std::string{text}};
            args.options.max_entries = max;
        } else if (arg == "--path") {
            args.options.path = std::string{value()};
        } else if (arg == "--log-level") {
            std::string_view text = value();
            auto level = stow::parse_log_level(text);
            if (!level)
                throw std::invalid_argument{"unknown log level " + std::string{text}};
            args.log_level = *level;
        } else if (!arg.empty() && arg.front() != '-' && !args.options.name) {
            args.options.name = std::string{arg};
        } else {
            throw std::invalid_argument{"unexpected argument " + std::string{arg}};
        }
    }

    if (!args.options.name)
        throw std::invalid_argument{"a store name is required"};
    return args;
}

} // namespace

int main(int argc, char** argv) {
    ShellArgs args;
    try {
        args = parse_args(argc, argv);
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n" << kUsage << "\n";
        return 2;
    }

    stow::Logger::instance().set_level(args.log_level);

    try {
        stow::JsonStore store{args.options};
        if (args.options.persistent)
            store.init();

        std::string line;
        while (std::getline(std::cin, line)) {
            std::string response;
            try {
                response = stow::CommandDispatcher::execute(stow::Protocol::parse(line), store);
            } catch (const stow::ProtocolError& e) {
                response = stow::Protocol::format_error(e.what());
            }
            std::cout << response << std::flush;
        }

        if (store.is_mirrored())
            store.close();
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
