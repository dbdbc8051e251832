#include "../include/Discovery.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <system_error>

using namespace prefixrun;
namespace fs = std::filesystem;

namespace {
    std::string trim(const std::string &x) {
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

    bool str_to_int(const std::string &s, long long &out) {
        if (s.empty()) return false;
        // strtoll would also skip inner whitespace after a sign
        const char first = s.front();
        const size_t digits_at = (first == '+' || first == '-') ? 1 : 0;
        if (digits_at >= s.size()) return false;
        for (size_t i = digits_at; i < s.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
        }
        char *end = nullptr;
        errno = 0;
        const long long v = std::strtoll(s.c_str(), &end, 10);
        if (errno != 0 || end == s.c_str() || *end != '\0') return false;
        out = v;
        return true;
    }
} // namespace

std::optional<long long> prefixrun::parse_prefix(const std::string &name) {
    const auto dash = name.find('-');
    if (dash == std::string::npos) return std::nullopt;
    long long value = 0;
    if (!str_to_int(trim(name.substr(0, dash)), value)) return std::nullopt;
    return value;
}

std::vector<OrderedFile> prefixrun::order_files(const std::vector<std::string> &names) {
    std::map<long long, std::vector<std::string> > by_order;
    for (const auto &name: names) {
        if (const auto order = parse_prefix(name); order.has_value()) {
            by_order[*order].push_back(name);
        }
    }

    std::string clashes;
    for (auto &[order, group]: by_order) {
        if (group.size() < 2) continue;
        std::sort(group.begin(), group.end());
        if (!clashes.empty()) clashes += "; ";
        clashes += std::to_string(order) + ":";
        for (const auto &n: group) clashes += " " + n;
    }
    if (!clashes.empty()) {
        throw ValidationError(std::string(_("One or more files have the same integer prefix: ")) + clashes);
    }

    std::vector<OrderedFile> out;
    out.reserve(by_order.size());
    for (const auto &[order, group]: by_order) {
        out.push_back(OrderedFile{order, group.front()});
    }
    return out;
}

std::vector<std::string> prefixrun::list_directory_entries(const std::string &directory) {
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        throw std::runtime_error(std::string(_("Cannot list directory ")) + directory + ": " + ec.message());
    }
    std::vector<std::string> names;
    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_directory(type_ec)) continue;
        names.push_back(it->path().filename().string());
    }
    if (ec) {
        throw std::runtime_error(std::string(_("Cannot list directory ")) + directory + ": " + ec.message());
    }
    return names;
}

std::vector<OrderedFile> prefixrun::discover(const std::string &directory) {
    return order_files(list_directory_entries(directory));
}
