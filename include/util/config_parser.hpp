#pragma once
#include "util/logger.hpp"

#include <optional>
#include <string>

namespace seed::config {

// User defaults read from a JSON object. Every key is optional.
class SeedConfigFromFile {
public:
    std::optional<std::string> base_dir;
    std::optional<LogLevel> log_level;
    std::optional<std::string> default_group_id;
    std::optional<std::string> default_java_version;

    // err is filled when false is returned
    bool LoadFile(const std::string &path, std::string &err);

    void Reset();
};

// $XDG_CONFIG_HOME/springseed/config.json, else $HOME/.config/springseed/config.json.
// Empty when neither variable is set.
std::string DefaultConfigPath();

} // namespace seed::config
