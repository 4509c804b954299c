#include "swc/archive/packager.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include <unistd.h>

namespace fs = std::filesystem;
using swc::ErrorKind;
using swc::archive::ArchivePackager;
using swc::metadata::FileEntry;

namespace {

fs::path create_temp_dir(const std::string& prefix) {
    static std::atomic<uint64_t> counter{0};
    auto dir = fs::temp_directory_path() /
               fs::path(prefix + std::to_string(::getpid()) + "_" + std::to_string(counter.fetch_add(1)));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// Member names of a plain ustar archive, in order
std::vector<std::string> tar_entries(const std::vector<std::uint8_t>& bytes) {
    std::vector<std::string> names;
    std::size_t offset = 0;
    while (offset + 512 <= bytes.size()) {
        const char* header = reinterpret_cast<const char*>(bytes.data() + offset);
        if (header[0] == '\0') {
            break;
        }
        std::string name(header, strnlen(header, 100));
        const std::string size_field(header + 124, strnlen(header + 124, 12));
        const std::size_t size = std::stoul(size_field, nullptr, 8);
        names.push_back(name);
        offset += 512 + ((size + 511) / 512) * 512;
    }
    return names;
}

} // namespace

TEST(ArchivePackagerTest, ScanListsRegularFilesSorted) {
    auto root = create_temp_dir("swc_pack_scan");
    write_file(root / "b.txt", "bb");
    write_file(root / "a.txt", "a");
    write_file(root / "nested" / "deeper" / "index.html", "<html></html>");
    fs::create_symlink(root / "a.txt", root / "link.txt");
    fs::create_directories(root / "empty");

    ArchivePackager packager;
    auto manifest = packager.scan(root);
    ASSERT_TRUE(manifest.is_ok());

    const std::vector<FileEntry> expected{
        {"a.txt", 1}, {"b.txt", 2}, {"nested/deeper/index.html", 13}};
    EXPECT_EQ(manifest.value().files, expected);
    EXPECT_EQ(manifest.value().file_count(), 3u);
    EXPECT_EQ(manifest.value().total_size, 16u);
    EXPECT_TRUE(manifest.value().has_entry_point);
}

TEST(ArchivePackagerTest, WalkVisitsEveryLevelOnce) {
    auto root = create_temp_dir("swc_pack_deep");
    fs::path level = root;
    for (int depth = 0; depth < 6; ++depth) {
        level /= "d" + std::to_string(depth);
        write_file(level / "f.txt", std::string(static_cast<std::size_t>(depth + 1), 'x'));
    }
    fs::create_directory_symlink(root / "d0", root / "loop");

    auto manifest = ArchivePackager().scan(root);
    ASSERT_TRUE(manifest.is_ok()) << manifest.error().describe();
    EXPECT_EQ(manifest.value().file_count(), 6u);
    EXPECT_EQ(manifest.value().total_size, 21u);
    EXPECT_EQ(manifest.value().files.front().path, "d0/d1/d2/d3/d4/d5/f.txt");
    EXPECT_EQ(manifest.value().files.back().path, "d0/f.txt");
}

TEST(ArchivePackagerTest, EntryPointNeedsExactName) {
    auto root = create_temp_dir("swc_pack_entry");
    write_file(root / "index.htm", "x");
    write_file(root / "INDEX.HTML", "x");

    auto manifest = ArchivePackager().scan(root);
    ASSERT_TRUE(manifest.is_ok());
    EXPECT_FALSE(manifest.value().has_entry_point);
}

TEST(ArchivePackagerTest, EmptyDirectoryHasNoFiles) {
    auto root = create_temp_dir("swc_pack_none");
    fs::create_directories(root / "only" / "dirs");

    auto manifest = ArchivePackager().scan(root);
    ASSERT_TRUE(manifest.is_ok());
    EXPECT_EQ(manifest.value().file_count(), 0u);
    EXPECT_EQ(manifest.value().total_size, 0u);
}

TEST(ArchivePackagerTest, ScanOfFileIsLocalIOError) {
    auto root = create_temp_dir("swc_pack_file");
    write_file(root / "plain.txt", "x");

    auto manifest = ArchivePackager().scan(root / "plain.txt");
    ASSERT_TRUE(manifest.is_error());
    EXPECT_EQ(manifest.error().kind, ErrorKind::LocalIOError);

    auto missing = ArchivePackager().scan(root / "missing");
    ASSERT_TRUE(missing.is_error());
    EXPECT_EQ(missing.error().kind, ErrorKind::LocalIOError);
}

TEST(ArchivePackagerTest, PackPlacesEntriesAtArchiveRoot) {
    auto root = create_temp_dir("swc_pack_root");
    auto scratch = create_temp_dir("swc_pack_scratch");
    write_file(root / "index.html", "<h1>hi</h1>");
    write_file(root / "css" / "site.css", "body{}");

    ArchivePackager packager(scratch);
    auto job = packager.pack(root);
    ASSERT_TRUE(job.is_ok()) << job.error().describe();

    const fs::path archive = job.value()->archive_path();
    EXPECT_EQ(archive.parent_path(), scratch);
    EXPECT_EQ(archive.extension(), ".tar");
    ASSERT_TRUE(fs::exists(archive));

    auto bytes = job.value()->read_bytes();
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(tar_entries(bytes.value()), (std::vector<std::string>{"css/site.css", "index.html"}));
    EXPECT_EQ(job.value()->manifest().file_count(), 2u);

    // Releasing the job removes the artifact
    job.value().reset();
    EXPECT_FALSE(fs::exists(archive));
}

TEST(ArchivePackagerTest, ArchiveNamesAreUnique) {
    auto root = create_temp_dir("swc_pack_unique");
    write_file(root / "a.txt", "a");
    ArchivePackager packager(create_temp_dir("swc_pack_unique_scratch"));

    auto first = packager.pack(root);
    auto second = packager.pack(root);
    ASSERT_TRUE(first.is_ok());
    ASSERT_TRUE(second.is_ok());
    EXPECT_NE(first.value()->archive_path(), second.value()->archive_path());
}

TEST(ArchivePackagerTest, PackFailureLeavesNoArtifact) {
    auto scratch = create_temp_dir("swc_pack_fail");
    ArchivePackager packager(scratch);

    auto job = packager.pack(scratch / "does-not-exist");
    ASSERT_TRUE(job.is_error());
    EXPECT_EQ(job.error().kind, ErrorKind::LocalIOError);
    EXPECT_TRUE(fs::is_empty(scratch));
}
