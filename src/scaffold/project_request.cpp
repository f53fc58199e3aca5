#include "scaffold/project_request.hpp"

#include "scaffold/option_filter.hpp"
#include "util/path_utils.hpp"

#include <algorithm>
#include <cstdio>
#include <utility>

namespace seed {

namespace {

void TrimInPlace(std::string& s) { s = std::string(TrimSpaces(s)); }

// Empty choice -> metadata default; otherwise it must be one of the options.
std::expected<std::string, std::string> ResolveSelect(const std::string& value,
                                                      const std::vector<SelectOption>& options,
                                                      const std::string& default_id,
                                                      const char* label) {
    if (value.empty()) {
        const std::string id = DefaultOptionId(default_id, options);
        if (id.empty()) {
            return std::unexpected(std::string("no ") + label + " offered by the generator");
        }
        return id;
    }
    for (const auto& opt : options) {
        if (opt.id == value) return value;
    }
    return std::unexpected(std::string("unknown ") + label + " '" + value + "'");
}

} // namespace

Result ValidateIdentifier(std::string_view value, std::string_view field) {
    const std::string_view s = TrimSpaces(value);
    if (s.empty()) {
        return Result::Fail(-1, std::string(field) + " should not be empty");
    }
    if (s.find(' ') != std::string_view::npos) {
        return Result::Fail(-1, std::string(field) + " should not contain space");
    }
    return Result::Ok();
}

std::expected<ProjectInfo, std::string> ResolveProjectInfo(ProjectInfo info,
                                                           const InitializrMetadata& metadata) {
    for (std::string* s : {&info.name, &info.group_id, &info.artifact_id, &info.description,
                           &info.project_type, &info.language, &info.boot_version,
                           &info.packaging, &info.java_version}) {
        TrimInPlace(*s);
    }

    if (info.name.empty()) info.name = metadata.name.default_value;
    if (info.group_id.empty()) info.group_id = metadata.group_id.default_value;
    if (info.artifact_id.empty()) info.artifact_id = metadata.artifact_id.default_value;

    struct Identifier {
        const std::string* value;
        const char* field;
    };
    for (const auto& id : {Identifier{&info.name, "name"},
                           Identifier{&info.group_id, "group id"},
                           Identifier{&info.artifact_id, "artifact id"}}) {
        if (auto r = ValidateIdentifier(*id.value, id.field); !r.ok) {
            return std::unexpected(r.msg);
        }
    }

    struct Select {
        std::string* value;
        std::vector<SelectOption> options;
        const std::string& default_id;
        const char* label;
    };
    const Select selects[] = {
        {&info.project_type, ProjectTypeOptions(metadata.project_type),
         metadata.project_type.default_id, "project type"},
        {&info.language, metadata.language.options, metadata.language.default_id, "language"},
        {&info.boot_version, metadata.boot_version.options, metadata.boot_version.default_id,
         "boot version"},
        {&info.packaging, metadata.packaging.options, metadata.packaging.default_id, "packaging"},
        {&info.java_version, metadata.java_version.options, metadata.java_version.default_id,
         "java version"},
    };
    for (const auto& s : selects) {
        auto resolved = ResolveSelect(*s.value, s.options, s.default_id, s.label);
        if (!resolved) return std::unexpected(resolved.error());
        *s.value = std::move(*resolved);
    }

    const auto offered = ComputeOfferedOptions(metadata.dependencies, info.boot_version);

    std::vector<std::string> deps;
    for (auto& raw : info.dependencies) {
        std::string id(TrimSpaces(raw));
        if (id.empty()) continue;

        const ComponentDescriptor* dep = metadata.FindDependency(id);
        if (!dep) {
            return std::unexpected("unknown dependency '" + id + "'");
        }
        const bool ok = std::any_of(offered.begin(), offered.end(),
                                    [&](const ComponentDescriptor& c) { return c.id == id; });
        if (!ok) {
            std::string msg = "dependency '" + id + "' is not compatible with boot version " +
                              info.boot_version;
            if (const std::string cond = dep->compatibility.Render(); !cond.empty()) {
                msg += " (requires " + cond + ")";
            }
            return std::unexpected(msg);
        }
        if (std::find(deps.begin(), deps.end(), id) == deps.end()) {
            deps.push_back(std::move(id));
        }
    }
    info.dependencies = std::move(deps);

    return info;
}

std::string FormUrlEncode(std::string_view value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        const bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                                (c >= '0' && c <= '9') || c == '-' || c == '_' || c == '.' ||
                                c == '~';
        if (unreserved) {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out.append(buf);
        }
    }
    return out;
}

std::string EncodeStarterForm(const ProjectInfo& info) {
    std::string deps;
    for (const auto& d : info.dependencies) {
        if (!deps.empty()) deps.push_back(',');
        deps += d;
    }

    const std::pair<const char*, const std::string*> fields[] = {
        {"name", &info.name},
        {"groupId", &info.group_id},
        {"artifactId", &info.artifact_id},
        {"description", &info.description},
        {"language", &info.language},
        {"javaVersion", &info.java_version},
        {"bootVersion", &info.boot_version},
        {"type", &info.project_type},
        {"packaging", &info.packaging},
        {"dependencies", &deps},
    };

    std::string out;
    for (const auto& [key, value] : fields) {
        if (!out.empty()) out.push_back('&');
        out += key;
        out.push_back('=');
        out += FormUrlEncode(*value);
    }
    return out;
}

std::vector<std::string> SplitList(std::string_view text) {
    std::vector<std::string> out;
    while (!text.empty()) {
        const auto pos = text.find(',');
        const auto item = TrimSpaces(text.substr(0, pos));
        if (!item.empty()) out.emplace_back(item);
        if (pos == std::string_view::npos) break;
        text.remove_prefix(pos + 1);
    }
    return out;
}

} // namespace seed
