#ifndef RESPKV_UTIL_CONFIG_HPP
#define RESPKV_UTIL_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include "respkv/util/logger.hpp"

namespace respkv::util {

// the settings given on the command line. unset fields leave the file/default value alone
struct ConfigOverrides {
    std::optional<std::filesystem::path> config_path;
    std::optional<std::string> host;
    std::optional<uint16_t> port;
    std::optional<std::size_t> max_connections;
    std::optional<LogLevel> log_level;
};

struct Config {
    // server
    std::string host = "127.0.0.1";
    uint16_t port = 31337;
    std::size_t max_connections = 64;

    // logging
    LogLevel log_level = LogLevel::Info;

    // load from file ("key = value" lines, '#' comments). nullopt if the file can't be opened
    static std::optional<Config> load_file(const std::filesystem::path& path);

    // parse CLI args, returns nullopt on --help. throws std::invalid_argument on bad numbers
    static std::optional<ConfigOverrides> parse_args(int argc, char* argv[]);

    // merge: CLI overrides file, file overrides defaults.
    // only flags present on the command line override, even when they repeat a default
    static Config merge(const Config& file_config, const ConfigOverrides& cli);
};

}  // namespace respkv::util

#endif
