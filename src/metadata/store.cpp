#include "swc/metadata/store.hpp"

#include <spdlog/spdlog.h>

#include <ctime>
#include <fstream>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <system_error>

namespace swc {
namespace metadata {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json files_to_json(const std::vector<FileEntry>& files) {
    json array = json::array();
    for (const auto& file : files) {
        array.push_back(json{{"path", file.path}, {"size", file.size}});
    }
    return array;
}

std::optional<std::string> optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

template<typename T>
T value_or(const json& j, const char* key, T fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        return fallback;
    }
}

bool parse_handle(const std::string& key, TransferHandle& out) {
    if (key.empty()) {
        return false;
    }
    TransferHandle value = 0;
    for (char c : key) {
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + static_cast<TransferHandle>(c - '0');
    }
    out = value;
    return true;
}

} // namespace

// ──────────────────────────────────────────────────────────
// RecordPatch
// ──────────────────────────────────────────────────────────

RecordPatch& RecordPatch::name(const std::string& value) {
    fields_["name"] = value;
    return *this;
}

RecordPatch& RecordPatch::date(const std::string& value) {
    fields_["date"] = value;
    return *this;
}

RecordPatch& RecordPatch::batch_id(const std::string& value) {
    fields_["batchId"] = value;
    return *this;
}

RecordPatch& RecordPatch::reference(const std::optional<std::string>& value) {
    fields_["reference"] = value ? json(*value) : json(nullptr);
    return *this;
}

RecordPatch& RecordPatch::size(std::uint64_t value) {
    fields_["size"] = value;
    return *this;
}

RecordPatch& RecordPatch::directory(const std::vector<FileEntry>& files,
                                    const std::optional<std::string>& entry_point) {
    fields_["isDirectory"] = true;
    fields_["fileCount"] = files.size();
    fields_["files"] = files_to_json(files);
    fields_["entryPoint"] = entry_point ? json(*entry_point) : json(nullptr);
    return *this;
}

// ──────────────────────────────────────────────────────────
// Record <-> JSON
// ──────────────────────────────────────────────────────────

UploadRecord record_from_json(const json& j) {
    UploadRecord record;
    if (!j.is_object()) {
        return record;
    }
    record.name = value_or<std::string>(j, "name", "");
    record.date = value_or<std::string>(j, "date", "");
    record.batch_id = value_or<std::string>(j, "batchId", "");
    record.reference = optional_string(j, "reference");
    record.size = value_or<std::uint64_t>(j, "size", 0);
    record.is_directory = value_or<bool>(j, "isDirectory", false);
    record.file_count = value_or<std::uint64_t>(j, "fileCount", 0);
    record.entry_point = optional_string(j, "entryPoint");

    auto files = j.find("files");
    if (files != j.end() && files->is_array()) {
        for (const auto& entry : *files) {
            if (!entry.is_object()) {
                continue;
            }
            record.files.push_back(FileEntry{value_or<std::string>(entry, "path", ""),
                                             value_or<std::uint64_t>(entry, "size", 0)});
        }
    }
    return record;
}

std::string format_timestamp(std::chrono::system_clock::time_point time) {
    using namespace std::chrono;
    const std::time_t seconds = system_clock::to_time_t(time);
    const auto millis = duration_cast<milliseconds>(time.time_since_epoch()).count() % 1000;

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

// ──────────────────────────────────────────────────────────
// MetadataStore
// ──────────────────────────────────────────────────────────

MetadataStore::MetadataStore(fs::path db_path)
    : db_path_(std::move(db_path)) {
}

std::shared_mutex& MetadataStore::table_mutex() {
    static std::shared_mutex mutex;
    return mutex;
}

Result<void> MetadataStore::put(TransferHandle handle, const RecordPatch& patch) {
    std::unique_lock lock(table_mutex());

    auto loaded = load_table();
    if (loaded.is_error()) {
        return Err<void>(loaded.error());
    }
    json table = std::move(loaded.value());

    const std::string key = std::to_string(handle);
    json& record = table[key];
    if (!record.is_object()) {
        record = json::object();
    }
    record.update(patch.fields());

    auto written = write_table(table);
    if (written.is_error()) {
        return written;
    }
    spdlog::debug("Metadata for transfer {} updated: {}", handle, patch.fields().dump());
    return Ok();
}

Result<std::optional<UploadRecord>> MetadataStore::get(TransferHandle handle) const {
    std::shared_lock lock(table_mutex());

    auto loaded = load_table();
    if (loaded.is_error()) {
        return Err<std::optional<UploadRecord>>(loaded.error());
    }

    const auto& table = loaded.value();
    auto it = table.find(std::to_string(handle));
    if (it == table.end() || !it->is_object()) {
        return Ok(std::optional<UploadRecord>());
    }
    return Ok(std::optional<UploadRecord>(record_from_json(*it)));
}

Result<std::map<TransferHandle, UploadRecord>> MetadataStore::list() const {
    std::shared_lock lock(table_mutex());

    auto loaded = load_table();
    if (loaded.is_error()) {
        return Err<std::map<TransferHandle, UploadRecord>>(loaded.error());
    }

    std::map<TransferHandle, UploadRecord> records;
    for (const auto& [key, value] : loaded.value().items()) {
        TransferHandle handle = 0;
        if (!parse_handle(key, handle) || !value.is_object()) {
            continue;
        }
        records.emplace(handle, record_from_json(value));
    }
    return Ok(std::move(records));
}

Result<json> MetadataStore::load_table() const {
    std::error_code ec;
    if (!fs::exists(db_path_, ec)) {
        return Ok(json::object());
    }

    std::ifstream input(db_path_);
    if (!input) {
        return Err<json>(ErrorKind::LocalIOError, "Failed to open " + db_path_.string());
    }

    json table = json::parse(input, nullptr, false);
    if (table.is_discarded() || !table.is_object()) {
        return Err<json>(ErrorKind::LocalIOError, "Malformed uploads table " + db_path_.string());
    }
    return Ok(std::move(table));
}

Result<void> MetadataStore::write_table(const json& table) const {
    std::error_code ec;
    const auto parent = db_path_.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent, ec);
        if (ec && !fs::exists(parent)) {
            return Err<void>(ErrorKind::LocalIOError, "Failed to create directory: " + parent.string());
        }
    }

    fs::path staging = db_path_;
    staging += ".tmp";
    {
        std::ofstream output(staging, std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorKind::LocalIOError, "Failed to open " + staging.string());
        }
        output << table.dump(2);
        output.flush();
        if (!output) {
            return Err<void>(ErrorKind::LocalIOError, "Failed to write " + staging.string());
        }
    }

    fs::rename(staging, db_path_, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Err<void>(ErrorKind::LocalIOError, "Failed to replace " + db_path_.string());
    }
    return Ok();
}

} // namespace metadata
} // namespace swc
