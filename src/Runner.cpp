#include "../include/Runner.hpp"
#include "../include/Status.hpp"
#include <filesystem>
#include <ostream>

using namespace prefixrun;
namespace fs = std::filesystem;

namespace {
    RunConfig normalized(RunConfig cfg) {
        cfg.directory = ensure_trailing_slash(cfg.directory);
        cfg.extensions = merge_extensions(default_extensions(), cfg.extensions);
        return cfg;
    }

    double minutes_between(const Clock::time_point start, const Clock::time_point end) {
        return std::chrono::duration<double, std::ratio<60> >(end - start).count();
    }
} // namespace

Runner::Runner(RunConfig cfg)
    : Runner(std::move(cfg), nullptr) {
}

Runner::Runner(RunConfig cfg, std::unique_ptr<ProcessLauncher> proc)
    : config(normalized(std::move(cfg))), launcher(std::move(proc)) {
    if (!launcher) launcher = std::make_unique<PosixLauncher>(config.fail_on_exit_code);
    ordered = discover(config.directory);
}

std::string Runner::extension_of(const std::string &name) {
    return fs::path(name).extension().string();
}

std::vector<std::string> Runner::command_for(const OrderedFile &file) const {
    const std::string ext = extension_of(file.name);
    const auto it = config.extensions.find(ext);
    if (it == config.extensions.end()) {
        throw UnknownExtensionError(file.name, ext);
    }
    std::vector<std::string> argv = it->second;
    argv.push_back(config.path_mode == PathMode::Relative ? file.name : config.directory + file.name);
    return argv;
}

RunReport Runner::run(std::ostream &log) {
    run_records.assign(ordered.size(), std::nullopt);
    const std::string cwd = config.path_mode == PathMode::Relative ? config.directory : std::string();

    for (size_t i = 0; i < ordered.size(); ++i) {
        const auto &file = ordered[i];
        const auto argv = command_for(file);

        auto &rec = run_records[i].emplace();
        rec.start_time = Clock::now();
        print_info(log, file.name + ": " + join_command(argv));
        try {
            rec.exit_status = launcher->spawn_and_wait(argv, cwd);
            rec.ran_successfully = true;
        } catch (const InvocationFailure &e) {
            rec.ran_successfully = false;
            rec.exit_status = e.status();
            rec.error = e.what();
        }
        rec.end_time = Clock::now();
        rec.elapsed_minutes = minutes_between(rec.start_time, rec.end_time);
        rec.state = RecordState::Finalized;

        if (!rec.ran_successfully) {
            print_status(log, file.name + ": " + rec.error, "!!", true);
            throw InvocationFailure(file.name + ": " + rec.error, rec.exit_status);
        }
        std::string done = file.name;
        if (rec.exit_status.value_or(0) != 0) {
            done += " (" + std::string(_("exit status")) + " " + std::to_string(*rec.exit_status) + ")";
        }
        print_status(log, done, "ok");
    }
    return report();
}

RunReport Runner::report() const {
    return make_report(ordered, run_records);
}

void Runner::print_plan(std::ostream &os) const {
    os << "[prefixrun] " << _("Directory") << ": " << config.directory
       << "; " << _("files") << "=" << ordered.size()
       << "; " << _("paths") << "=" << path_mode_name(config.path_mode)
       << "; " << _("strict") << "=" << (config.fail_on_exit_code ? "on" : "off") << "\n";
    for (const auto &file: ordered) {
        os << "  - " << file.order << " " << file.name << " -> ";
        try {
            os << join_command(command_for(file));
        } catch (const UnknownExtensionError &e) {
            os << "<" << e.what() << ">";
        }
        os << "\n";
    }
    os << std::flush;
}
