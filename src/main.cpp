#include "update/updater.hpp"
#include "util/logger.hpp"
#include "util/updater_config.hpp"

#include <cerrno>
#include <cstdio>
#include <getopt.h>
#include <string>
#include <utility>

#ifndef SELFUPDATE_DEFAULT_CONFIG_FILE
#define SELFUPDATE_DEFAULT_CONFIG_FILE "data/updater.json"
#endif

namespace {

constexpr const char *kDefaultConfigPath = SELFUPDATE_DEFAULT_CONFIG_FILE;

void PrintUsage(const char *argv0) {
    std::fprintf(stderr,
        "Usage:\n"
        "   %s [-c <config.json>] [-v]\n"
        "\n"
        "Replaces the installed application with the staged update and starts it.\n"
        "\n"
        "Options:\n"
        "  -c, --config    JSON file overriding the built-in paths (default %s, optional)\n"
        "  -v, --verbose   Debug logging\n"
        "  -h, --help      Show this help\n",
        argv0, kDefaultConfigPath);
}

} // namespace

int main(int argc, char **argv) {
    std::string config_path = kDefaultConfigPath;
    bool config_required = false;
    bool verbose = false;

    static option long_opts[] = {
        {"config", required_argument, nullptr, 'c'},
        {"verbose", no_argument, nullptr, 'v'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0},
    };

    int idx = 0;
    int c;
    while ((c = getopt_long(argc, argv, "hc:v", long_opts, &idx)) != -1) {
        switch (c) {
            case 'h':
                PrintUsage(argv[0]);
                return selfupdate::kExitSuccess;

            case 'c':
                config_path = optarg;
                config_required = true;
                break;

            case 'v':
                verbose = true;
                break;

            default:
                PrintUsage(argv[0]);
                return selfupdate::kExitConfigError;
        }
    }

    if (optind < argc) {
        std::fprintf(stderr, "Unexpected argument: %s\n", argv[optind]);
        PrintUsage(argv[0]);
        return selfupdate::kExitConfigError;
    }

    if (verbose) {
        selfupdate::Logger::Instance().SetLevel(selfupdate::LogLevel::Debug);
    }

    selfupdate::UpdaterConfig cfg = selfupdate::UpdaterConfig::Defaults();
    if (auto r = selfupdate::UpdaterConfig::LoadFile(config_path, cfg); !r.is_ok()) {
        if (r.err != ENOENT || config_required) {
            LogError("Config: %s", r.msg.c_str());
            return selfupdate::kExitConfigError;
        }
        LogDebug("No config at %s, using built-in defaults", config_path.c_str());
    }

    if (cfg.verbose) {
        selfupdate::Logger::Instance().SetLevel(selfupdate::LogLevel::Debug);
    }

    LogDebug("staging=%s target_dir=%s process=%s policy=%s grace=%lldms",
             cfg.staging_dir.c_str(),
             cfg.target_dir.c_str(),
             cfg.process_name.c_str(),
             selfupdate::ToString(cfg.error_policy),
             static_cast<long long>(cfg.grace_delay.count()));

    selfupdate::Updater updater(std::move(cfg));
    return updater.Run();
}
