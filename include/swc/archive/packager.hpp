#pragma once

#include "swc/core/result.hpp"
#include "swc/metadata/types.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <vector>

namespace swc::archive {

/// File the node serves when a collection is opened without a path
inline constexpr const char* kEntryPointName = "index.html";

/**
 * @brief Regular files reachable under a directory
 */
struct DirectoryManifest {
    std::filesystem::path root;
    std::vector<metadata::FileEntry> files;   ///< Sorted by relative path
    std::uint64_t total_size = 0;
    bool has_entry_point = false;             ///< An index.html exists at any depth

    std::size_t file_count() const noexcept { return files.size(); }
};

/**
 * @brief A packed tar archive on disk plus what went into it
 *
 * Owns the temporary file: the destructor deletes it. Whoever holds the
 * job last decides when the artifact goes away.
 */
class ArchiveJob {
public:
    ArchiveJob(std::filesystem::path archive_path, DirectoryManifest manifest);
    ~ArchiveJob();

    ArchiveJob(const ArchiveJob&) = delete;
    ArchiveJob& operator=(const ArchiveJob&) = delete;

    const std::filesystem::path& archive_path() const noexcept { return archive_path_; }
    const DirectoryManifest& manifest() const noexcept { return manifest_; }

    Result<std::vector<std::uint8_t>> read_bytes() const;

private:
    std::filesystem::path archive_path_;
    DirectoryManifest manifest_;
};

/**
 * @brief Turns a directory into one tar stream for a collection upload
 *
 * scan() and pack() are separate so a caller can show file count and size
 * before any work starts.
 */
class ArchivePackager {
public:
    /// temp_dir empty = system temporary directory
    explicit ArchivePackager(std::filesystem::path temp_dir = {});

    /**
     * @brief Walk dir and collect every regular file
     *
     * Symlinks, special files and entries that cannot be read are skipped
     * without error. Fails only if dir itself is not a readable directory.
     */
    Result<DirectoryManifest> scan(const std::filesystem::path& dir) const;

    /**
     * @brief Pack the files of manifest with the system tar
     *
     * Entries are stored relative to the manifest root, so index.html sits
     * at the top of the archive. Fails with LocalIOError when tar is not on
     * PATH or exits non-zero; any partial output is removed.
     */
    Result<std::unique_ptr<ArchiveJob>> pack(const DirectoryManifest& manifest) const;

    /// scan() followed by pack()
    Result<std::unique_ptr<ArchiveJob>> pack(const std::filesystem::path& dir) const;

private:
    std::filesystem::path next_archive_path() const;

    std::filesystem::path temp_dir_;
};

} // namespace swc::archive
