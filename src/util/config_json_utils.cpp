#include "util/config_json_utils.hpp"

#include <fstream>

namespace seed::config::detail {

namespace {

// Absent key -> true with out untouched; present with the wrong type -> false.
bool GetStringIfPresent(const nlohmann::json& j,
                        const char* key,
                        std::optional<std::string>& out,
                        std::string& err) {
    auto it = j.find(key);
    if (it == j.end())
        return true;
    if (!it->is_string()) {
        err = std::string(key) + " must be a string";
        return false;
    }
    out = it->get<std::string>();
    return true;
}

} // namespace

bool LoadJsonObjectFromFile(const std::string& path, nlohmann::json& out, std::string& err) {
    std::ifstream is(path);
    if (!is.good()) {
        err = "cannot open " + path;
        return false;
    }

    try {
        is >> out;
    } catch (const std::exception& e) {
        err = "invalid JSON in " + path + ": " + e.what();
        return false;
    }

    if (!out.is_object()) {
        err = "root must be JSON object: " + path;
        return false;
    }

    return true;
}

bool FillConfigFromJson(const nlohmann::json& j, SeedConfigFromFile& cfg, std::string& err) {
    if (!GetStringIfPresent(j, "BaseDir", cfg.base_dir, err)) return false;
    if (!GetStringIfPresent(j, "DefaultGroupId", cfg.default_group_id, err)) return false;
    if (!GetStringIfPresent(j, "DefaultJavaVersion", cfg.default_java_version, err)) return false;

    if (cfg.base_dir && cfg.base_dir->empty()) {
        err = "BaseDir must not be empty";
        return false;
    }

    std::optional<std::string> level;
    if (!GetStringIfPresent(j, "LogLevel", level, err)) return false;
    if (level) {
        LogLevel lvl{};
        if (!ParseLogLevel(*level, lvl)) {
            err = "unknown LogLevel '" + *level + "'";
            return false;
        }
        cfg.log_level = lvl;
    }

    return true;
}

} // namespace seed::config::detail
