#include "scaffold/metadata_parser.hpp"

#include <nlohmann/json.hpp>

namespace seed {

using json = nlohmann::json;

namespace {

const json* FindObject(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_object()) return nullptr;
    return &*it;
}

std::expected<SelectField, std::string> ParseSelectField(const json& root, const char* key) {
    SelectField field;
    const json* obj = FindObject(root, key);
    if (!obj) return field;

    field.default_id = obj->value("default", "");

    auto values = obj->find("values");
    if (values == obj->end()) return field;
    if (!values->is_array()) {
        return std::unexpected(std::string("'") + key + ".values' must be an array");
    }

    field.options.reserve(values->size());
    for (const auto& item : *values) {
        SelectOption opt;
        opt.id = item.value("id", "");
        opt.name = item.value("name", opt.id);
        opt.description = item.value("description", "");

        // tag values may be null ("dialect": null)
        if (auto tags = item.find("tags"); tags != item.end() && tags->is_object()) {
            for (const auto& [tk, tv] : tags->items()) {
                if (tv.is_string()) opt.tags.emplace(tk, tv.get<std::string>());
            }
        }
        field.options.push_back(std::move(opt));
    }
    return field;
}

TextField ParseTextField(const json& root, const char* key) {
    TextField field;
    if (const json* obj = FindObject(root, key)) {
        field.default_value = obj->value("default", "");
    }
    return field;
}

} // namespace

std::expected<InitializrMetadata, std::string> MetadataParser::Parse(const std::string& json_input) const {
    try {
        if (json_input.find_first_not_of(" \t\n\r") == std::string::npos) {
            return std::unexpected("Empty input");
        }

        auto j = json::parse(json_input);
        if (!j.is_object()) {
            return std::unexpected("JSON root must be an object");
        }

        InitializrMetadata m;

        struct SelectSlot {
            const char* key;
            SelectField* out;
        };
        const SelectSlot selects[] = {
            {"language", &m.language},
            {"javaVersion", &m.java_version},
            {"bootVersion", &m.boot_version},
            {"packaging", &m.packaging},
            {"type", &m.project_type},
        };
        for (const auto& s : selects) {
            auto parsed = ParseSelectField(j, s.key);
            if (!parsed)
                return std::unexpected(parsed.error());
            *s.out = std::move(*parsed);
        }

        m.group_id = ParseTextField(j, "groupId");
        m.artifact_id = ParseTextField(j, "artifactId");
        m.name = ParseTextField(j, "name");
        m.description = ParseTextField(j, "description");
        m.package_name = ParseTextField(j, "packageName");
        m.version = ParseTextField(j, "version");

        const json* deps = FindObject(j, "dependencies");
        if (!deps || !deps->contains("values")) {
            return m;
        }
        const json& groups = (*deps)["values"];
        if (!groups.is_array()) {
            return std::unexpected("'dependencies.values' must be an array");
        }

        for (const auto& group : groups) {
            const std::string group_name = group.value("name", "");
            auto items = group.find("values");
            if (items == group.end()) continue;
            if (!items->is_array()) {
                return std::unexpected("dependency group values must be an array: " + group_name);
            }

            for (const auto& item : *items) {
                ComponentDescriptor c;
                c.id = item.value("id", "");
                if (c.id.empty()) {
                    return std::unexpected("dependency without id in group: " + group_name);
                }
                c.name = item.value("name", c.id);
                c.description = item.value("description", "");
                c.group = group_name;
                c.raw_range = item.value("versionRange", "");

                auto range = ParseVersionInterval(c.raw_range);
                c.compatibility = std::move(range.interval);
                c.range_degraded = range.degraded();
                if (c.range_degraded && on_degraded_) {
                    on_degraded_(c, range.reason);
                }
                m.dependencies.push_back(std::move(c));
            }
        }

        return m;
    } catch (const json::parse_error& e) {
        return std::unexpected(std::string("Syntax Error: ") + e.what());
    } catch (const std::exception& e) {
        return std::unexpected(std::string("Internal Error: ") + e.what());
    }
}

} // namespace seed
