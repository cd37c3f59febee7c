#pragma once

#include "core/utils.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace sqlsandbox::testing {

/**
 * @brief Scratch directory removed with everything in it on destruction
 */
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() / ("sqlsandbox-test-" + utils::generate_uuid())) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

    std::filesystem::path write(const std::string& relative, const std::string& content) const {
        const auto file = path_ / relative;
        std::filesystem::create_directories(file.parent_path());
        std::ofstream out(file, std::ios::binary | std::ios::trunc);
        out << content;
        return file;
    }

private:
    std::filesystem::path path_;
};

} // namespace sqlsandbox::testing
