#include "io/file_reader.hpp"
#include "scaffold/archive_materializer.hpp"
#include "scaffold/metadata_parser.hpp"
#include "scaffold/option_filter.hpp"
#include "scaffold/project_request.hpp"
#include "util/config_parser.hpp"
#include "util/logger.hpp"

#include <cstdio>
#include <cstring>
#include <filesystem>
#include <getopt.h>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void PrintUsage(const char *argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config>] [-v] <command> [options]\n"
        "\n"
        "Commands:\n"
        "  options   List the dependencies offered for a boot version\n"
        "            -m, --metadata <file|->   Generator client metadata (JSON)\n"
        "            -b, --boot <version>      Boot version (default: metadata default)\n"
        "            -a, --all                 Also list incompatible dependencies\n"
        "  request   Validate choices and print the starter form body\n"
        "            -m, --metadata <file|->   Generator client metadata (JSON)\n"
        "            --name --group --artifact --description\n"
        "            --language --java --boot --type --packaging <value>\n"
        "            -d, --dependencies <id,id,...>\n"
        "            -C, --directory <dir>     Where the project will be created\n"
        "  extract   Unpack a generated project archive into a new directory\n"
        "            -i, --input <file|->      Archive (default: stdin)\n"
        "            -n, --name <dir>          Project directory to create\n"
        "            -C, --directory <dir>     Parent directory (default: config or cwd)\n"
        "\n"
        "Global options:\n"
        "  -c, --config <path>    Config file (default: $XDG_CONFIG_HOME/springseed/config.json)\n"
        "  -v, --verbose          Debug logging\n"
        "  -h, --help             Show this help\n",
        argv0);
}

bool LoadMetadata(const std::string& path, seed::InitializrMetadata& out) {
    std::string text;
    if (auto r = seed::ReadFileOrStdin(path, text); !r.ok) {
        LogError("%s", r.msg.c_str());
        return false;
    }

    seed::MetadataParser parser([](const seed::ComponentDescriptor& c, const std::string& reason) {
        LogWarn("dependency '%s': versionRange '%s' only partly understood (%s)",
                c.id.c_str(), c.raw_range.c_str(), reason.c_str());
    });
    auto parsed = parser.Parse(text);
    if (!parsed) {
        LogError("cannot decode metadata %s: %s", path.c_str(), parsed.error().c_str());
        return false;
    }
    out = std::move(*parsed);
    LogDebug("metadata: %zu dependencies, %zu boot versions",
             out.dependencies.size(), out.boot_version.options.size());
    return true;
}

int RunOptions(int argc, char** argv) {
    std::string metadata_path;
    std::string boot;
    bool all = false;

    static option long_opts[] = {
        {"metadata", required_argument, nullptr, 'm'},
        {"boot", required_argument, nullptr, 'b'},
        {"all", no_argument, nullptr, 'a'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "m:b:a", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'm': metadata_path = optarg; break;
            case 'b': boot = optarg; break;
            case 'a': all = true; break;
            default:  return kExitUsage;
        }
    }
    if (metadata_path.empty()) {
        std::fprintf(stderr, "options: --metadata is required\n");
        return kExitUsage;
    }

    seed::InitializrMetadata md;
    if (!LoadMetadata(metadata_path, md)) return kExitFailure;

    if (boot.empty()) {
        boot = seed::DefaultOptionId(md.boot_version.default_id, md.boot_version.options);
    }
    // An unparsable boot version still lists the components without a range.
    if (auto version = seed::SemanticVersion::Parse(boot); !version) {
        LogWarn("boot version '%s' not understood (%s), listing unrestricted dependencies only",
                boot.c_str(), version.error().c_str());
    } else {
        LogDebug("filtering dependencies for boot version %s", version->ToString().c_str());
    }

    const auto offered = seed::ComputeOfferedOptions(md.dependencies, std::string_view(boot));
    if (!all) {
        for (const auto& dep : offered) {
            std::printf("%s\t%s\n", dep.id.c_str(), dep.name.c_str());
        }
        return kExitOk;
    }

    std::set<std::string> offered_ids;
    for (const auto& dep : offered) offered_ids.insert(dep.id);

    for (const auto& dep : md.dependencies) {
        const bool ok = offered_ids.count(dep.id) > 0;
        std::printf("%s\t%s\t%s\t%s\n", dep.id.c_str(), dep.name.c_str(),
                    ok ? "offered" : "-", dep.compatibility.Render().c_str());
    }
    return kExitOk;
}

int RunRequest(int argc, char** argv, const seed::config::SeedConfigFromFile& cfg) {
    enum : int {
        kOptName = 1000, kOptGroup, kOptArtifact, kOptDescription,
        kOptLanguage, kOptJava, kOptType, kOptPackaging,
    };

    std::string metadata_path;
    std::string base_dir = cfg.base_dir.value_or(".");
    seed::ProjectInfo info;

    static option long_opts[] = {
        {"metadata", required_argument, nullptr, 'm'},
        {"name", required_argument, nullptr, kOptName},
        {"group", required_argument, nullptr, kOptGroup},
        {"artifact", required_argument, nullptr, kOptArtifact},
        {"description", required_argument, nullptr, kOptDescription},
        {"language", required_argument, nullptr, kOptLanguage},
        {"java", required_argument, nullptr, kOptJava},
        {"boot", required_argument, nullptr, 'b'},
        {"type", required_argument, nullptr, kOptType},
        {"packaging", required_argument, nullptr, kOptPackaging},
        {"dependencies", required_argument, nullptr, 'd'},
        {"directory", required_argument, nullptr, 'C'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "m:b:d:C:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'm':             metadata_path = optarg; break;
            case 'b':             info.boot_version = optarg; break;
            case 'd': {
                auto more = seed::SplitList(optarg);
                info.dependencies.insert(info.dependencies.end(), more.begin(), more.end());
                break;
            }
            case 'C':             base_dir = optarg; break;
            case kOptName:        info.name = optarg; break;
            case kOptGroup:       info.group_id = optarg; break;
            case kOptArtifact:    info.artifact_id = optarg; break;
            case kOptDescription: info.description = optarg; break;
            case kOptLanguage:    info.language = optarg; break;
            case kOptJava:        info.java_version = optarg; break;
            case kOptType:        info.project_type = optarg; break;
            case kOptPackaging:   info.packaging = optarg; break;
            default:              return kExitUsage;
        }
    }
    if (metadata_path.empty()) {
        std::fprintf(stderr, "request: --metadata is required\n");
        return kExitUsage;
    }

    seed::InitializrMetadata md;
    if (!LoadMetadata(metadata_path, md)) return kExitFailure;

    if (info.group_id.empty() && cfg.default_group_id) info.group_id = *cfg.default_group_id;
    if (info.java_version.empty() && cfg.default_java_version) info.java_version = *cfg.default_java_version;

    auto resolved = seed::ResolveProjectInfo(std::move(info), md);
    if (!resolved) {
        LogError("%s", resolved.error().c_str());
        return kExitFailure;
    }

    if (auto r = seed::CheckTargetAvailable(base_dir, resolved->name); !r.ok) {
        LogError("%s", r.msg.c_str());
        return kExitFailure;
    }

    LogDebug("request: %s boot %s, %zu dependencies",
             resolved->name.c_str(), resolved->boot_version.c_str(), resolved->dependencies.size());
    std::printf("%s\n", seed::EncodeStarterForm(*resolved).c_str());
    return kExitOk;
}

int RunExtract(int argc, char** argv, const seed::config::SeedConfigFromFile& cfg) {
    std::string input = "-";
    std::string name;
    seed::ArchiveMaterializer::Options opt;
    opt.base_dir = cfg.base_dir.value_or(".");

    static option long_opts[] = {
        {"input", required_argument, nullptr, 'i'},
        {"name", required_argument, nullptr, 'n'},
        {"directory", required_argument, nullptr, 'C'},
        {nullptr, 0, nullptr, 0},
    };

    optind = 0;
    int c;
    while ((c = getopt_long(argc, argv, "i:n:C:", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'i': input = optarg; break;
            case 'n': name = optarg; break;
            case 'C': opt.base_dir = optarg; break;
            default:  return kExitUsage;
        }
    }
    if (name.empty()) {
        std::fprintf(stderr, "extract: --name is required\n");
        return kExitUsage;
    }

    // Checked before reading the payload so a taken name fails fast.
    if (auto r = seed::CheckTargetAvailable(opt.base_dir, name); !r.ok) {
        LogError("%s", r.msg.c_str());
        return kExitFailure;
    }

    std::vector<std::uint8_t> bytes;
    if (auto r = seed::ReadFileOrStdin(input, bytes); !r.ok) {
        LogError("%s", r.msg.c_str());
        return kExitFailure;
    }
    LogDebug("archive: %zu bytes from %s", bytes.size(), input.c_str());

    seed::ArchiveMaterializer materializer(opt);
    auto res = materializer.Extract(bytes, name);
    if (!res) {
        LogError("%s", res.error().Describe().c_str());
        return kExitFailure;
    }

    LogInfo("extracted %llu files, %llu directories (%llu bytes) into %s",
            (unsigned long long)res->files, (unsigned long long)res->directories,
            (unsigned long long)res->bytes, name.c_str());
    if (res->skipped > 0) {
        LogWarn("skipped %llu entries that are neither files nor directories",
                (unsigned long long)res->skipped);
    }
    std::printf("Project generated\n");
    return kExitOk;
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    // '+' stops at the command name
    int c;
    while ((c = getopt_long(argc, argv, "+c:vh", long_opts, nullptr)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return kExitOk;
            case 'c':
                config_path = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            default:
                PrintUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind >= argc) {
        PrintUsage(argv[0]);
        return kExitUsage;
    }

    seed::config::SeedConfigFromFile cfg;
    const bool explicit_config = !config_path.empty();
    if (!explicit_config) {
        config_path = seed::config::DefaultConfigPath();
    }
    if (!config_path.empty()) {
        std::string err;
        if (cfg.LoadFile(config_path, err)) {
            LogDebug("config: loaded %s", config_path.c_str());
        } else if (explicit_config) {
            std::fprintf(stderr, "ERROR: cannot load config: %s\n", err.c_str());
            return kExitFailure;
        } else if (std::filesystem::exists(config_path)) {
            LogWarn("ignoring config: %s", err.c_str());
        }
    }

    if (verbose) {
        seed::Logger::Instance().SetLevel(seed::LogLevel::Debug);
    } else if (cfg.log_level) {
        seed::Logger::Instance().SetLevel(*cfg.log_level);
    }

    const char* command = argv[optind];
    const int sub_argc = argc - optind;
    char** sub_argv = argv + optind;

    if (std::strcmp(command, "options") == 0) {
        return RunOptions(sub_argc, sub_argv);
    }
    if (std::strcmp(command, "request") == 0) {
        return RunRequest(sub_argc, sub_argv, cfg);
    }
    if (std::strcmp(command, "extract") == 0) {
        return RunExtract(sub_argc, sub_argv, cfg);
    }

    std::fprintf(stderr, "Unknown command: %s\n", command);
    PrintUsage(argv[0]);
    return kExitUsage;
}
