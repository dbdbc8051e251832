#pragma once
#include <libintl.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#ifndef PREFIXRUN_GETTEXT_DEFINED
#define _(String) gettext(String)
#define PREFIXRUN_GETTEXT_DEFINED
#endif

namespace prefixrun {
    // The command could not be run to completion: fork/exec/wait failed, or the
    // launcher's exit-code policy rejected the child's status.
    class InvocationFailure : public std::runtime_error {
    public:
        explicit InvocationFailure(const std::string &msg, std::optional<int> status = std::nullopt)
            : std::runtime_error(msg), exit_status(status) {
        }

        [[nodiscard]] std::optional<int> status() const { return exit_status; }

    private:
        std::optional<int> exit_status;
    };

    // Synchronous process collaborator used by the Runner.
    class ProcessLauncher {
    public:
        virtual ~ProcessLauncher() = default;

        // Runs argv (argv[0] looked up in PATH) and blocks until it exits.
        // cwd empty = inherit. Returns the exit status, 128 + signal for a killed child.
        // Throws InvocationFailure.
        virtual int spawn_and_wait(const std::vector<std::string> &argv, const std::string &cwd) = 0;
    };

    class PosixLauncher : public ProcessLauncher {
    public:
        explicit PosixLauncher(bool fail_on_exit_code = false) : fail_on_exit_code(fail_on_exit_code) {
        }

        int spawn_and_wait(const std::vector<std::string> &argv, const std::string &cwd) override;

        [[nodiscard]] bool strict() const { return fail_on_exit_code; }

    private:
        bool fail_on_exit_code;
    };

    // "bash /tmp/x/1-a.sh" style rendering for logs and dry runs.
    [[nodiscard]] std::string join_command(const std::vector<std::string> &argv);
} // namespace prefixrun
