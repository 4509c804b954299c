#pragma once

/**
 * @file types.hpp
 * @brief Per-transfer records kept by the metadata store
 *
 * The node only knows chunk counters for a transfer handle. Everything a
 * user wants to see about an upload (what it was, when, with which batch,
 * where it ended up) lives here, keyed by that handle.
 *
 * Lifecycle of one record:
 * 1. Written right after the node issues a handle (reference still null)
 * 2. Patched once with the content address when the payload call returns
 * 3. Never deleted by the engine
 */

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace swc {
namespace metadata {

/**
 * @brief One regular file inside a directory upload
 */
struct FileEntry {
    std::string path;      ///< Relative to the uploaded root, POSIX separators
    std::uint64_t size = 0;

    bool operator==(const FileEntry& other) const {
        return path == other.path && size == other.size;
    }
};

/**
 * @brief Everything known locally about one upload
 *
 * Field names mirror the JSON keys of uploads.json:
 * name, date, batchId, reference, size, isDirectory, fileCount, files,
 * entryPoint.
 */
struct UploadRecord {
    std::string name;                       ///< Logical name (file or directory base name)
    std::string date;                       ///< ISO-8601 UTC creation time
    std::string batch_id;                   ///< Storage-allocation id used
    std::optional<std::string> reference;   ///< Content address, empty until stored
    std::uint64_t size = 0;                 ///< Payload size before packing

    bool is_directory = false;
    std::uint64_t file_count = 0;
    std::vector<FileEntry> files;
    std::optional<std::string> entry_point;
};

} // namespace metadata
} // namespace swc
