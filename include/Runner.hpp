#pragma once
#include <libintl.h>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "Discovery.hpp"
#include "Process.hpp"
#include "Report.hpp"
#include "RunConfig.hpp"

#ifndef PREFIXRUN_GETTEXT_DEFINED
#define _(String) gettext(String)
#define PREFIXRUN_GETTEXT_DEFINED
#endif

namespace prefixrun {
    // No command is mapped for a file's extension.
    class UnknownExtensionError : public std::runtime_error {
    public:
        UnknownExtensionError(const std::string &file, const std::string &ext)
            : std::runtime_error(std::string(_("No command configured for extension '")) + ext + "' (" + file + ")"),
              extension(ext) {
        }

        [[nodiscard]] const std::string &get_extension() const { return extension; }

    private:
        std::string extension;
    };

    // Runs every "<int>-name.ext" file of a directory in prefix order, one at a time.
    // Discovery happens once, in the constructor; run() can be called again and starts
    // over from the first file.
    class Runner {
    public:
        // Throws ValidationError on duplicate prefixes, std::runtime_error if the
        // directory cannot be listed.
        explicit Runner(RunConfig config);

        // A non-null launcher replaces the PosixLauncher built from config.fail_on_exit_code.
        Runner(RunConfig config, std::unique_ptr<ProcessLauncher> launcher);

        // Stops at the first InvocationFailure and rethrows it once that file's record is
        // finalized. UnknownExtensionError is thrown before the file gets a record.
        // report() reflects partial progress in both cases.
        RunReport run(std::ostream &log = std::cout);

        [[nodiscard]] RunReport report() const;

        [[nodiscard]] const std::vector<OrderedFile> &files() const { return ordered; }

        [[nodiscard]] const ExtensionMap &extensions() const { return config.extensions; }

        [[nodiscard]] const std::vector<std::optional<RunRecord> > &records() const { return run_records; }

        [[nodiscard]] const std::string &directory() const { return config.directory; }

        [[nodiscard]] PathMode path_mode() const { return config.path_mode; }

        // Text after the last '.', dot included; "" when there is none.
        [[nodiscard]] static std::string extension_of(const std::string &name);

        // extensions[ext] + target. Throws UnknownExtensionError.
        [[nodiscard]] std::vector<std::string> command_for(const OrderedFile &file) const;

        // Order, file and command of each step, without running anything.
        void print_plan(std::ostream &os = std::cout) const;

    private:
        RunConfig config;
        std::unique_ptr<ProcessLauncher> launcher;
        std::vector<OrderedFile> ordered;
        std::vector<std::optional<RunRecord> > run_records; // same index as ordered
    };
} // namespace prefixrun
