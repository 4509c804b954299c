#pragma once

/**
 * @file store.hpp
 * @brief Durable table of upload records keyed by transfer handle
 *
 * WHY THIS FILE EXISTS:
 * The node forgets what a transfer was the moment it issues the handle.
 * This store remembers: name, date, batch, resulting content address and,
 * for directories, the file manifest.
 *
 * PERSISTENCE MODEL:
 * The whole table is one JSON object in uploads.json:
 *   { "42": { "name": "a.txt", "reference": null, ... }, ... }
 * Every put() re-reads the file, merges, and atomically replaces it
 * (write sibling temp file, then rename). Other processes and the transfer
 * lister therefore always see a complete table, and records written by
 * earlier runs are never lost.
 *
 * MERGE SEMANTICS:
 * Shallow field overwrite. put(h, {reference: X}) after put(h, {name: Y})
 * leaves {name: Y, reference: X}. Applying the same patch twice is the
 * same as applying it once.
 *
 * THREAD SAFETY PATTERN:
 * One process-wide reader-writer lock shared by every MetadataStore
 * instance. put() takes it exclusively for the full read-modify-write so
 * two sessions finishing together cannot drop each other's merges.
 *
 * EXAMPLE USAGE:
 * MetadataStore store(config.uploads_db_path());
 * store.put(42, RecordPatch().name("a.txt").reference(std::nullopt));
 * store.put(42, RecordPatch().reference("ab12..."));
 * auto record = store.get(42);   // Result<optional<UploadRecord>>
 */

#include "swc/core/result.hpp"
#include "swc/metadata/types.hpp"
#include "swc/transport/types.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace swc {
namespace metadata {

using transport::TransferHandle;

/**
 * @brief A partial UploadRecord
 *
 * Only the fields that were set are merged. reference(std::nullopt)
 * explicitly writes null, which is how a fresh record says "address not
 * known yet".
 */
class RecordPatch {
public:
    RecordPatch& name(const std::string& value);
    RecordPatch& date(const std::string& value);
    RecordPatch& batch_id(const std::string& value);
    RecordPatch& reference(const std::optional<std::string>& value);
    RecordPatch& size(std::uint64_t value);

    /**
     * @brief Mark the record as a collection and attach its manifest
     */
    RecordPatch& directory(const std::vector<FileEntry>& files,
                           const std::optional<std::string>& entry_point);

    const nlohmann::json& fields() const noexcept { return fields_; }
    bool empty() const noexcept { return fields_.empty(); }

private:
    nlohmann::json fields_ = nlohmann::json::object();
};

/**
 * @brief JSON-file backed store of UploadRecords
 *
 * INTERNAL DATA STRUCTURE:
 * Nothing is cached; the file is the single source of truth. This is not
 * a hot path (two writes per upload, one read per list refresh).
 */
class MetadataStore {
public:
    explicit MetadataStore(std::filesystem::path db_path);

    /**
     * Merge patch into the record for handle and persist the whole table
     *
     * HOW IT WORKS:
     * 1. Take the process-wide write lock
     * 2. Load uploads.json (missing file = empty table)
     * 3. Overwrite the patched fields of table[handle] (created if absent)
     * 4. Write uploads.json.tmp, rename over uploads.json
     *
     * @return LocalIOError if the table cannot be read, parsed or written.
     *         A corrupt table is never overwritten.
     */
    Result<void> put(TransferHandle handle, const RecordPatch& patch);

    /**
     * Current record for handle
     *
     * @return empty optional when no record exists, LocalIOError when the
     *         table cannot be read
     */
    Result<std::optional<UploadRecord>> get(TransferHandle handle) const;

    /**
     * Every record in the table, including transfers from earlier runs
     *
     * Keys that are not transfer handles are skipped.
     */
    Result<std::map<TransferHandle, UploadRecord>> list() const;

    const std::filesystem::path& path() const noexcept { return db_path_; }

private:
    Result<nlohmann::json> load_table() const;
    Result<void> write_table(const nlohmann::json& table) const;

    static std::shared_mutex& table_mutex();

    std::filesystem::path db_path_;
};

/// Tolerant parse: missing or mistyped keys fall back to defaults
UploadRecord record_from_json(const nlohmann::json& j);

/// ISO-8601 UTC with milliseconds, e.g. 2024-05-01T09:30:00.123Z
std::string format_timestamp(std::chrono::system_clock::time_point time);

} // namespace metadata
} // namespace swc
