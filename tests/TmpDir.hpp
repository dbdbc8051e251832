#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace prefixrun::test_support {
    // mkdtemp-backed directory removed with its content on scope exit.
    struct TmpDir {
        std::filesystem::path path;

        TmpDir() {
            std::string tmpl = (std::filesystem::temp_directory_path() / "prefixrun-test-XXXXXX").string();
            if (::mkdtemp(tmpl.data()) == nullptr) throw std::runtime_error("mkdtemp failed");
            path = tmpl;
        }

        ~TmpDir() {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }

        TmpDir(const TmpDir &) = delete;

        TmpDir &operator=(const TmpDir &) = delete;

        [[nodiscard]] std::string str() const { return path.string(); }

        std::filesystem::path write(const std::string &name, const std::string &content = "") const {
            const auto p = path / name;
            std::ofstream o(p);
            o << content;
            return p;
        }

        std::filesystem::path mkdir(const std::string &name) const {
            const auto p = path / name;
            std::filesystem::create_directories(p);
            return p;
        }
    };
} // namespace prefixrun::test_support
