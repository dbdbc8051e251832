#pragma once
#include <libintl.h>
#include <filesystem>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#ifndef PREFIXRUN_GETTEXT_DEFINED
#define _(String) gettext(String)
#define PREFIXRUN_GETTEXT_DEFINED
#endif

namespace prefixrun {
    // ".sh" -> {"bash"}; the target file is appended after the last token.
    using ExtensionMap = std::map<std::string, std::vector<std::string> >;

    enum class PathMode {
        Absolute, // directory + name, caller's working directory
        Relative // bare name, child runs inside the directory
    };

    struct RunConfig {
        std::string directory;
        ExtensionMap extensions; // overrides on top of default_extensions()
        PathMode path_mode = PathMode::Absolute;
        bool fail_on_exit_code = false;
    };

    class ConfigError : public std::runtime_error {
    public:
        explicit ConfigError(const std::string &msg) : std::runtime_error(msg) {
        }
    };

    [[nodiscard]] ExtensionMap default_extensions();

    // Overrides win key by key; keys missing from overrides keep their base value.
    [[nodiscard]] ExtensionMap merge_extensions(const ExtensionMap &base, const ExtensionMap &overrides);

    [[nodiscard]] std::string ensure_trailing_slash(const std::string &directory);

    // ".ext=cmd arg..." -> {".ext", {"cmd", "arg", ...}}
    [[nodiscard]] std::pair<std::string, std::vector<std::string> > parse_extension_override(const std::string &spec);

    [[nodiscard]] std::string path_mode_name(PathMode mode);

    // Reader for .prc files:
    //   @dir ./pipeline
    //   @let PY=python3
    //   @ext .py ${PY} -u
    //   @paths relative
    //   @strict on
    //   @include common.prc
    class ConfigParser {
    public:
        ConfigParser();

        void parse_file(const std::string &path);

        void parse_line(const std::string &line);

        // Copies every value seen so far into cfg (unset values leave cfg untouched).
        void apply(RunConfig &cfg) const;

        [[nodiscard]] const std::optional<std::string> &get_directory() const { return directory; }

        [[nodiscard]] const ExtensionMap &get_extensions() const { return extensions; }

        [[nodiscard]] std::optional<PathMode> get_path_mode() const { return path_mode; }

        [[nodiscard]] std::optional<bool> get_strict() const { return strict; }

        std::string expand_vars(const std::string &in) const; // replaces ${VAR}

    private:
        static std::string trim(const std::string &x);

        static bool starts_with(const std::string &s, const std::string &p);

        static std::vector<std::string> split_ws(const std::string &line);

        static std::string strip_quotes(const std::string &x);

        static std::string strip_comment(const std::string &s);

        static std::optional<bool> to_bool(const std::string &v);

        [[noreturn]] void bad(const std::string &msg) const;

        // Directive arguments: text after the keyword, expanded.
        std::string argument(const std::string &s, const std::string &keyword) const;

        std::optional<std::string> directory;
        ExtensionMap extensions;
        std::optional<PathMode> path_mode;
        std::optional<bool> strict;

        int currentLine = 0;
        std::unordered_map<std::string, std::string> vars; // @let
        std::vector<std::filesystem::path> file_stack;
        std::unordered_set<std::string> include_guard; // absolute paths being read
        int include_depth = 0;
        const int include_depth_max = 16;
    };
} // namespace prefixrun
