/**
 * @file FileRepository.hpp
 * @brief Filesystem access for the data file and generated outputs.
 */

#pragma once
#include <filesystem>
#include <optional>
#include <string>

namespace zlinker::infrastructure {

/**
 * @class FileRepository
 * @brief Reads input documents and writes outputs atomically, relative to a base directory.
 */
class FileRepository {
public:
    /**
     * @brief Constructor for FileRepository.
     * @param baseDir Directory relative paths are resolved against.
     */
    explicit FileRepository(std::filesystem::path baseDir);

    /**
     * @brief Reads a whole UTF-8 text file.
     * @param path File to read.
     * @param error Receives the failure reason, if given.
     * @return File content, or nullopt if it cannot be read.
     */
    std::optional<std::string> readText(const std::string& path, std::string* error = nullptr) const;

    /**
     * @brief Writes content through a temp file and an atomic rename.
     * @return True if the final file is in place.
     */
    bool saveText(const std::string& path, const std::string& content) const;

    /** @brief Absolute form of a path relative to the base directory. */
    std::filesystem::path resolve(const std::string& path) const;

private:
    std::filesystem::path m_baseDir; ///< Base for relative paths.
};

} // namespace zlinker::infrastructure
