#include "Discovery.hpp"
#include "Process.hpp"
#include "RunConfig.hpp"
#include "Runner.hpp"
#include "Status.hpp"
#include <clocale>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#ifndef PREFIXRUN_LOCALEDIR
#define PREFIXRUN_LOCALEDIR "/usr/share/locale"
#endif

using namespace prefixrun;

namespace {
    constexpr int kExitOk = 0;
    constexpr int kExitRunFailed = 1;
    constexpr int kExitUsage = 2;

    struct CliOptions {
        std::string config_path;
        std::string directory;
        ExtensionMap extensions;
        bool strict = false;
        bool relative = false;
        bool dry_run = false;
        bool list_extensions = false;
        bool help = false;
    };

    void print_usage(std::ostream &os, const char *argv0) {
        os << _("Usage: ") << argv0 << _(" [options] [DIRECTORY]") << "\n"
           << _("Run every <integer>-<name>.<ext> file of DIRECTORY (default: .) in prefix order.") << "\n\n"
           << "  -c, --config FILE       " << _("read settings from a .prc file") << "\n"
           << "  -e, --ext '.EXT=CMD'    " << _("command for an extension (repeatable)") << "\n"
           << "      --strict            " << _("treat a non-zero exit status as a failure") << "\n"
           << "      --relative          " << _("run each file from inside DIRECTORY") << "\n"
           << "  -n, --dry-run           " << _("show the plan without running anything") << "\n"
           << "      --extensions        " << _("list the configured extensions") << "\n"
           << "  -h, --help              " << _("show this help") << "\n";
    }

    // Throws ConfigError on bad usage.
    CliOptions parse_args(const int argc, char **argv) {
        CliOptions opts;
        auto value_of = [&](int &i, const std::string &flag) -> std::string {
            if (i + 1 >= argc) throw ConfigError(flag + _(" expects a value"));
            return argv[++i];
        };
        for (int i = 1; i < argc; ++i) {
            const std::string arg = argv[i];
            if (arg == "-h" || arg == "--help") opts.help = true;
            else if (arg == "-c" || arg == "--config") opts.config_path = value_of(i, arg);
            else if (arg == "-e" || arg == "--ext") {
                auto [ext, command] = parse_extension_override(value_of(i, arg));
                opts.extensions[ext] = std::move(command);
            } else if (arg == "--strict") opts.strict = true;
            else if (arg == "--relative") opts.relative = true;
            else if (arg == "-n" || arg == "--dry-run") opts.dry_run = true;
            else if (arg == "--extensions") opts.list_extensions = true;
            else if (!arg.empty() && arg[0] == '-') throw ConfigError(_("Unknown option: ") + arg);
            else if (opts.directory.empty()) opts.directory = arg;
            else throw ConfigError(_("Only one directory can be given: ") + arg);
        }
        return opts;
    }

    RunConfig build_config(const CliOptions &opts) {
        RunConfig cfg;
        if (!opts.config_path.empty()) {
            ConfigParser parser;
            parser.parse_file(opts.config_path);
            parser.apply(cfg);
        }
        if (!opts.directory.empty()) cfg.directory = opts.directory;
        if (cfg.directory.empty()) cfg.directory = std::filesystem::current_path().string();
        cfg.extensions = merge_extensions(cfg.extensions, opts.extensions);
        if (opts.strict) cfg.fail_on_exit_code = true;
        if (opts.relative) cfg.path_mode = PathMode::Relative;
        return cfg;
    }

    void print_extensions(std::ostream &os, const ExtensionMap &extensions) {
        std::vector<std::vector<std::string> > rows;
        for (const auto &[ext, command]: extensions) rows.push_back({ext, join_command(command)});
        os << render_table({_("Extension"), _("Command")}, rows) << std::endl;
    }
} // namespace

int main(const int argc, char **argv) {
    std::setlocale(LC_ALL, "");
    bindtextdomain("prefixrun", PREFIXRUN_LOCALEDIR);
    textdomain("prefixrun");

    CliOptions opts;
    std::unique_ptr<Runner> runner;
    try {
        opts = parse_args(argc, argv);
        if (opts.help) {
            print_usage(std::cout, argv[0]);
            return kExitOk;
        }
        runner = std::make_unique<Runner>(build_config(opts));
    } catch (const ConfigError &e) {
        std::cerr << e.what() << std::endl;
        print_usage(std::cerr, argv[0]);
        return kExitUsage;
    } catch (const std::runtime_error &e) {
        // ValidationError or an unreadable directory
        print_status(std::cerr, e.what(), "!!", true);
        return kExitUsage;
    }

    if (opts.list_extensions) {
        print_extensions(std::cout, runner->extensions());
        return kExitOk;
    }
    if (opts.dry_run) {
        runner->print_plan(std::cout);
        return kExitOk;
    }
    if (runner->files().empty()) {
        print_status(std::cout, _("No <integer>- prefixed files found in ") + runner->directory(), "!!", true);
        return kExitOk;
    }

    int rc = kExitOk;
    print_status(std::cout, _("Starting pipeline in ") + runner->directory(), "ok");
    try {
        runner->run(std::cout);
        print_status(std::cout, _("Pipeline completed successfully"), "ok");
    } catch (const InvocationFailure &e) {
        print_status(std::cerr, _("Pipeline stopped: ") + std::string(e.what()), "!!", true);
        rc = kExitRunFailed;
    } catch (const UnknownExtensionError &e) {
        print_status(std::cerr, _("Pipeline stopped: ") + std::string(e.what()), "!!", true);
        rc = kExitRunFailed;
    }
    std::cout << runner->report() << std::endl;
    return rc;
}
