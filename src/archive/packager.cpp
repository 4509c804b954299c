#include "swc/archive/packager.hpp"

#include <boost/process.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace swc::archive {
namespace fs = std::filesystem;
namespace bp = boost::process;

namespace {

// Removes a scratch file when it goes out of scope
class ScopedFile {
public:
    explicit ScopedFile(fs::path path) : path_(std::move(path)) {}
    ~ScopedFile() {
        std::error_code ec;
        fs::remove(path_, ec);
    }
    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

Result<void> write_file_list(const fs::path& list_path, const DirectoryManifest& manifest) {
    std::ofstream list(list_path, std::ios::binary | std::ios::trunc);
    if (!list) {
        return Err<void>(ErrorKind::LocalIOError, "Failed to create file list " + list_path.string());
    }
    for (const auto& file : manifest.files) {
        list << file.path << '\0';
    }
    list.flush();
    if (!list) {
        return Err<void>(ErrorKind::LocalIOError, "Failed to write file list " + list_path.string());
    }
    return Ok();
}

} // namespace

// ──────────────────────────────────────────────────────────
// ArchiveJob
// ──────────────────────────────────────────────────────────

ArchiveJob::ArchiveJob(fs::path archive_path, DirectoryManifest manifest)
    : archive_path_(std::move(archive_path)), manifest_(std::move(manifest)) {}

ArchiveJob::~ArchiveJob() {
    std::error_code ec;
    if (fs::remove(archive_path_, ec)) {
        spdlog::debug("Removed archive {}", archive_path_.string());
    } else if (ec) {
        spdlog::warn("Failed to remove archive {}: {}", archive_path_.string(), ec.message());
    }
}

Result<std::vector<std::uint8_t>> ArchiveJob::read_bytes() const {
    std::ifstream input(archive_path_, std::ios::binary);
    if (!input) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::LocalIOError,
                                              "Failed to open archive " + archive_path_.string());
    }
    std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(input)),
                                    std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<std::vector<std::uint8_t>>(ErrorKind::LocalIOError,
                                              "Failed to read archive " + archive_path_.string());
    }
    return Ok(std::move(bytes));
}

// ──────────────────────────────────────────────────────────
// ArchivePackager
// ──────────────────────────────────────────────────────────

ArchivePackager::ArchivePackager(fs::path temp_dir) : temp_dir_(std::move(temp_dir)) {}

Result<DirectoryManifest> ArchivePackager::scan(const fs::path& dir) const {
    std::error_code ec;
    if (dir.empty() || !fs::is_directory(dir, ec)) {
        return Err<DirectoryManifest>(ErrorKind::LocalIOError, "Not a directory: " + dir.string());
    }

    DirectoryManifest manifest;
    manifest.root = dir;

    fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        return Err<DirectoryManifest>(ErrorKind::LocalIOError,
                                      "Cannot read directory " + dir.string() + ": " + ec.message());
    }

    const fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec)) {
        if (ec) {
            // The iterator is unusable after a failed increment
            break;
        }

        const auto& entry = *it;
        std::error_code entry_ec;
        if (entry.is_symlink(entry_ec) || !entry.is_regular_file(entry_ec)) {
            continue;
        }

        const auto size = entry.file_size(entry_ec);
        if (entry_ec) {
            continue;
        }

        auto relative = fs::relative(entry.path(), dir, entry_ec);
        if (entry_ec || relative.empty()) {
            continue;
        }

        // Unreadable files would make tar fail later; drop them here instead
        std::ifstream readable(entry.path(), std::ios::binary);
        if (!readable) {
            spdlog::debug("Skipping unreadable file {}", entry.path().string());
            continue;
        }

        if (entry.path().filename() == kEntryPointName) {
            manifest.has_entry_point = true;
        }
        manifest.files.push_back(metadata::FileEntry{relative.generic_string(), size});
        manifest.total_size += size;
    }

    if (ec) {
        return Err<DirectoryManifest>(ErrorKind::LocalIOError,
                                      "Failed to walk " + dir.string() + ": " + ec.message());
    }

    std::sort(manifest.files.begin(), manifest.files.end(),
              [](const metadata::FileEntry& a, const metadata::FileEntry& b) { return a.path < b.path; });

    return Ok(std::move(manifest));
}

Result<std::unique_ptr<ArchiveJob>> ArchivePackager::pack(const fs::path& dir) const {
    auto manifest = scan(dir);
    if (manifest.is_error()) {
        return Err<std::unique_ptr<ArchiveJob>>(manifest.error());
    }
    return pack(manifest.value());
}

Result<std::unique_ptr<ArchiveJob>> ArchivePackager::pack(const DirectoryManifest& manifest) const {
    // The job owns the archive path from here on, so every failure below
    // still removes whatever tar managed to write.
    auto job = std::make_unique<ArchiveJob>(next_archive_path(), manifest);

    const auto tar = bp::search_path("tar");
    if (tar.empty()) {
        return Err<std::unique_ptr<ArchiveJob>>(ErrorKind::LocalIOError,
                                                "Archive tool 'tar' not found on PATH");
    }

    fs::path list_path = job->archive_path();
    list_path += ".list";
    ScopedFile list_file(list_path);
    if (auto written = write_file_list(list_file.path(), manifest); written.is_error()) {
        return Err<std::unique_ptr<ArchiveJob>>(written.error());
    }

    std::error_code ec;
    const int exit_code = bp::system(tar,
                                     "-cf", job->archive_path().string(),
                                     "-C", manifest.root.string(),
                                     "--no-recursion", "--null", "-T", list_file.path().string(),
                                     bp::std_out > bp::null,
                                     bp::std_err > bp::null,
                                     ec);
    if (ec) {
        return Err<std::unique_ptr<ArchiveJob>>(ErrorKind::LocalIOError,
                                                "Failed to run tar: " + ec.message());
    }
    if (exit_code != 0) {
        return Err<std::unique_ptr<ArchiveJob>>(ErrorKind::LocalIOError,
                                                "tar exited with status " + std::to_string(exit_code));
    }

    spdlog::info("Packed {} files ({} bytes) from {} into {}",
                 manifest.file_count(), manifest.total_size,
                 manifest.root.string(), job->archive_path().string());
    return Ok(std::move(job));
}

fs::path ArchivePackager::next_archive_path() const {
    static std::atomic<std::uint64_t> counter{0};

    fs::path dir = temp_dir_;
    if (dir.empty()) {
        std::error_code ec;
        dir = fs::temp_directory_path(ec);
        if (ec) {
            dir = ".";
        }
    }
    return dir / ("swc-" + std::to_string(boost::this_process::get_id()) + "-" +
                  std::to_string(counter.fetch_add(1)) + ".tar");
}

} // namespace swc::archive
