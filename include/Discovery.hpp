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
    // A file selected for execution: "<order>-<rest>".
    struct OrderedFile {
        long long order = 0;
        std::string name; // file name only, prefix kept
    };

    // Two or more eligible files share the same integer prefix.
    class ValidationError : public std::runtime_error {
    public:
        explicit ValidationError(const std::string &msg) : std::runtime_error(msg) {
        }
    };

    // Integer before the first '-', or nullopt when the name is not eligible.
    [[nodiscard]] std::optional<long long> parse_prefix(const std::string &name);

    // Keeps eligible names and sorts them by prefix. Throws ValidationError on duplicates.
    [[nodiscard]] std::vector<OrderedFile> order_files(const std::vector<std::string> &names);

    // Immediate entries of a directory (no recursion, subdirectories skipped).
    [[nodiscard]] std::vector<std::string> list_directory_entries(const std::string &directory);

    [[nodiscard]] std::vector<OrderedFile> discover(const std::string &directory);
} // namespace prefixrun
