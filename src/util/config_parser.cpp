#include "util/config_parser.hpp"

#include "util/config_json_utils.hpp"

#include <cstdlib>

namespace seed::config {

void SeedConfigFromFile::Reset() {
    base_dir.reset();
    log_level.reset();
    default_group_id.reset();
    default_java_version.reset();
}

bool SeedConfigFromFile::LoadFile(const std::string& path, std::string& err) {
    Reset();

    nlohmann::json json;
    if (!detail::LoadJsonObjectFromFile(path, json, err)) {
        return false;
    }

    if (!detail::FillConfigFromJson(json, *this, err)) {
        err += " in " + path;
        Reset();
        return false;
    }

    return true;
}

std::string DefaultConfigPath() {
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg) {
        return std::string(xdg) + "/springseed/config.json";
    }
    if (const char* home = std::getenv("HOME"); home && *home) {
        return std::string(home) + "/.config/springseed/config.json";
    }
    return {};
}

} // namespace seed::config
