#include "../include/RunConfig.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <regex>
#include <sstream>

using namespace prefixrun;
namespace fs = std::filesystem;

ExtensionMap prefixrun::default_extensions() {
    return {
        {".hql", {"hive", "-f"}},
        {".py", {"python"}},
        {".R", {"Rscript"}},
        {".scala", {"scala"}},
        {".sh", {"bash"}},
    };
}

ExtensionMap prefixrun::merge_extensions(const ExtensionMap &base, const ExtensionMap &overrides) {
    ExtensionMap merged = base;
    for (const auto &[ext, command]: overrides) merged[ext] = command;
    return merged;
}

std::string prefixrun::ensure_trailing_slash(const std::string &directory) {
    if (directory.empty()) return "./";
    std::string out = directory;
    while (out.size() > 1 && out.back() == '/') out.pop_back();
    if (out.back() != '/') out.push_back('/');
    return out;
}

std::pair<std::string, std::vector<std::string> > prefixrun::parse_extension_override(const std::string &spec) {
    const auto eq = spec.find('=');
    if (eq == std::string::npos || eq == 0) {
        throw ConfigError(std::string(_("Extension override expects .EXT=COMMAND: ")) + spec);
    }
    std::string ext = spec.substr(0, eq);
    if (ext.front() != '.') ext.insert(ext.begin(), '.');
    std::vector<std::string> command;
    std::istringstream iss(spec.substr(eq + 1));
    std::string tok;
    while (iss >> tok) command.push_back(std::move(tok));
    if (command.empty()) {
        throw ConfigError(std::string(_("Extension override has an empty command: ")) + spec);
    }
    return {ext, command};
}

std::string prefixrun::path_mode_name(const PathMode mode) {
    return mode == PathMode::Relative ? "relative" : "absolute";
}

// ------------ Helpers ------------
std::string ConfigParser::trim(const std::string &x) {
    auto start = x.begin();
    while (start != x.end() && std::isspace(static_cast<unsigned char>(*start))) {
        ++start;
    }
    auto rend = x.rbegin();
    while (rend != x.rend() && std::isspace(static_cast<unsigned char>(*rend))) {
        ++rend;
    }
    if (start >= rend.base()) return {};
    return std::string(start, rend.base());
}

bool ConfigParser::starts_with(const std::string &s, const std::string &p) {
    if (s.size() < p.size() || s.compare(0, p.size(), p) != 0) return false;
    // "@dir" must not match "@directory"
    return s.size() == p.size() || std::isspace(static_cast<unsigned char>(s[p.size()]));
}

std::vector<std::string> ConfigParser::split_ws(const std::string &line) {
    std::vector<std::string> tokens;
    std::istringstream iss(line);
    std::string tok;
    while (iss >> tok) tokens.push_back(std::move(tok));
    return tokens;
}

std::string ConfigParser::strip_quotes(const std::string &x) {
    std::string t = trim(x);
    if (t.size() >= 2) {
        const char a = t.front(), b = t.back();
        if ((a == '"' && b == '"') || (a == '\'' && b == '\'')) {
            t = t.substr(1, t.size() - 2);
        }
    }
    return t;
}

std::string ConfigParser::strip_comment(const std::string &s) {
    // "//" and "#" open a comment only after whitespace: "a//b" and "http://x" are values
    for (size_t i = 1; i < s.size(); ++i) {
        if (!std::isspace(static_cast<unsigned char>(s[i - 1]))) continue;
        if (s[i] == '#' || s.compare(i, 2, "//") == 0) return trim(s.substr(0, i));
    }
    return s;
}

std::optional<bool> ConfigParser::to_bool(const std::string &v) {
    std::string s;
    s.reserve(v.size());
    for (const char c: v) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (s == "1" || s == "on" || s == "true" || s == "yes") return true;
    if (s == "0" || s == "off" || s == "false" || s == "no") return false;
    return std::nullopt;
}

[[noreturn]] void ConfigParser::bad(const std::string &msg) const {
    std::string where = file_stack.empty() ? std::string("<input>") : file_stack.back().string();
    throw ConfigError("[prefixrun] " + where + ":" + std::to_string(currentLine) + ": " + msg);
}

std::string ConfigParser::argument(const std::string &s, const std::string &keyword) const {
    return expand_vars(trim(s.substr(keyword.size())));
}

// ------------ Core ------------

ConfigParser::ConfigParser() = default;

void ConfigParser::parse_file(const std::string &path) {
    fs::path p = fs::absolute(path);
    if (include_depth >= include_depth_max) bad(_("Include depth exceeded"));
    if (!fs::exists(p)) bad(std::string(_("Failed to open file: ")) + p.string());

    const std::string key = p.lexically_normal().string();
    if (include_guard.find(key) != include_guard.end()) {
        bad(std::string(_("Circular include detected: ")) + key);
    }

    std::ifstream in(p);
    if (!in.is_open()) bad(std::string(_("Failed to open file: ")) + p.string());

    struct IncludeGuardRAII {
        ConfigParser *self;
        std::string key;
        int savedLine;

        IncludeGuardRAII(ConfigParser *s, std::string k, fs::path pth)
            : self(s), key(std::move(k)), savedLine(s->currentLine) {
            self->include_guard.insert(key);
            self->file_stack.push_back(std::move(pth));
            self->include_depth++;
        }

        ~IncludeGuardRAII() {
            self->include_guard.erase(key);
            if (!self->file_stack.empty()) self->file_stack.pop_back();
            self->include_depth--;
            self->currentLine = savedLine;
        }
    } guard(this, key, p);

    std::string line;
    currentLine = 0;
    while (std::getline(in, line)) {
        ++currentLine;
        parse_line(line);
    }
}

void ConfigParser::parse_line(const std::string &line) {
    std::string s = trim(line);
    if (s.empty()) return;
    if (s.rfind("//", 0) == 0 || s.front() == '#') return;
    s = strip_comment(s);
    if (s.empty()) return;

    if (starts_with(s, "@include")) {
        const std::string rest = strip_quotes(argument(s, "@include"));
        if (rest.empty()) bad(_("@include expects a path"));
        const fs::path base = file_stack.empty() ? fs::current_path() : file_stack.back().parent_path();
        const fs::path target = fs::absolute(base / rest);
        if (!fs::exists(target)) {
            bad(std::string(_("@include file not found: ")) + target.string());
        }
        parse_file(target.string());
        return;
    }

    if (starts_with(s, "@let")) {
        const std::string rest = trim(s.substr(std::string("@let").size()));
        if (rest.empty()) bad(_("@let expects NAME=VALUE or NAME VALUE"));
        std::string name, value;
        if (const auto eq = rest.find('='); eq != std::string::npos) {
            name = trim(rest.substr(0, eq));
            value = trim(rest.substr(eq + 1));
        } else {
            const auto toks = split_ws(rest);
            name = toks[0];
            if (toks.size() == 1) value = "1";
            for (size_t i = 1; i < toks.size(); ++i) {
                if (i > 1) value.push_back(' ');
                value += toks[i];
            }
        }
        static const std::regex nameRe(R"([A-Za-z_][A-Za-z0-9_]*)");
        if (!std::regex_match(name, nameRe)) bad(std::string(_("@let invalid name: ")) + name);
        vars[name] = expand_vars(strip_quotes(value));
        return;
    }

    if (starts_with(s, "@dir")) {
        const std::string rest = strip_quotes(argument(s, "@dir"));
        if (rest.empty()) bad(_("@dir expects a path"));
        fs::path dir(rest);
        if (dir.is_relative() && !file_stack.empty()) dir = file_stack.back().parent_path() / dir;
        directory = dir.lexically_normal().string();
        return;
    }

    if (starts_with(s, "@ext")) {
        const auto toks = split_ws(argument(s, "@ext"));
        if (toks.size() < 2) bad(_("@ext expects .EXT COMMAND [ARGS...]"));
        std::string ext = toks[0];
        if (ext.front() != '.') bad(std::string(_("@ext extension must start with '.': ")) + ext);
        extensions[ext] = std::vector<std::string>(toks.begin() + 1, toks.end());
        return;
    }

    if (starts_with(s, "@paths")) {
        const std::string rest = argument(s, "@paths");
        if (rest == "absolute") path_mode = PathMode::Absolute;
        else if (rest == "relative") path_mode = PathMode::Relative;
        else bad(std::string(_("@paths expects absolute or relative, got: ")) + rest);
        return;
    }

    if (starts_with(s, "@strict")) {
        const std::string rest = argument(s, "@strict");
        if (rest.empty()) {
            strict = true;
            return;
        }
        const auto value = to_bool(rest);
        if (!value.has_value()) bad(std::string(_("@strict expects on or off, got: ")) + rest);
        strict = *value;
        return;
    }

    bad(std::string(_("Unknown directive: ")) + s);
}

void ConfigParser::apply(RunConfig &cfg) const {
    if (directory.has_value()) cfg.directory = *directory;
    cfg.extensions = merge_extensions(cfg.extensions, extensions);
    if (path_mode.has_value()) cfg.path_mode = *path_mode;
    if (strict.has_value()) cfg.fail_on_exit_code = *strict;
}

std::string ConfigParser::expand_vars(const std::string &in) const {
    static const std::regex re(R"(\$\{([A-Za-z_][A-Za-z0-9_]*)\})");
    std::string out;
    out.reserve(in.size());
    std::sregex_iterator it(in.begin(), in.end(), re);
    size_t last = 0;
    for (const std::sregex_iterator end; it != end; ++it) {
        const auto &m = *it;
        out.append(in, last, static_cast<size_t>(m.position()) - last);
        if (const auto itv = vars.find(m[1].str()); itv != vars.end()) out += itv->second;
        else out += m.str();
        last = static_cast<size_t>(m.position() + m.length());
    }
    out.append(in, last, std::string::npos);
    return out;
}
