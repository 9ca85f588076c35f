/**
 * @file FileRepository.cpp
 * @brief Implementation of the FileRepository class.
 */
#include "infrastructure/FileRepository.hpp"
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace zlinker::infrastructure {

FileRepository::FileRepository(fs::path baseDir)
    : m_baseDir(std::move(baseDir)) {}

fs::path FileRepository::resolve(const std::string& path) const {
    fs::path p(path);
    return p.is_absolute() ? p : m_baseDir / p;
}

std::optional<std::string> FileRepository::readText(const std::string& path, std::string* error) const {
    fs::path fullPath = resolve(path);
    std::error_code ec;
    if (!fs::is_regular_file(fullPath, ec)) {
        if (error) *error = "No such file: " + fullPath.string();
        return std::nullopt;
    }

    std::ifstream file(fullPath, std::ios::binary);
    if (!file.is_open()) {
        if (error) *error = "Cannot open " + fullPath.string();
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        if (error) *error = "Read failed: " + fullPath.string();
        return std::nullopt;
    }
    return buffer.str();
}

bool FileRepository::saveText(const std::string& path, const std::string& content) const {
    fs::path finalPath = resolve(path);

    auto timestamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path tempPath = finalPath;
    tempPath += "." + std::to_string(timestamp) + ".tmp";

    // 1. Ensure directory exists
    std::error_code ec;
    if (finalPath.has_parent_path() && !fs::exists(finalPath.parent_path(), ec)) {
        fs::create_directories(finalPath.parent_path(), ec);
        if (ec) {
            std::cerr << "[FileRepository] Error creating directories: " << ec.message() << std::endl;
            return false;
        }
    }

    // 2. Write to temp
    {
        std::ofstream ofs(tempPath);
        if (!ofs.is_open()) {
            std::cerr << "[FileRepository] Failed to open temp file: " << tempPath << std::endl;
            return false;
        }
        ofs << content;
        ofs.flush();
        if (ofs.fail()) {
            std::cerr << "[FileRepository] Write failed: " << tempPath << std::endl;
            fs::remove(tempPath, ec);
            return false;
        }
    }

    // 3. Atomic rename
    fs::rename(tempPath, finalPath, ec);
    if (ec) {
        std::cerr << "[FileRepository] Rename failed: " << ec.message() << std::endl;
        std::error_code cleanup;
        fs::remove(tempPath, cleanup);
        return false;
    }
    return true;
}

} // namespace zlinker::infrastructure
