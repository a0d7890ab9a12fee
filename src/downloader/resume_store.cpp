/*
 * onyx/src/downloader/resume_store.cpp
 *
 * Persistent JSON ResumeStore and the per-task ResumeTracker.
 *
 * File layout: <resume_dir>/<key>.json, key = SHA-256(url + "\n" + destination)
 * {
 *   "version": 1,
 *   "key": "9f86d0...",
 *   "url": "https://example.com/file.bin",
 *   "destination_path": "/home/user/file.bin",
 *   "expected_size": 10485760,
 *   "checksum_algorithm": "sha256",
 *   "etag": "\"5e-abc\"",
 *   "worker_count": 4,
 *   "chunks": [{"id":0,"start":0,"end":2621440,"bytes_written":2621440,
 *               "status":"complete","attempts":1}, ...],
 *   "updated_at": 1760000000
 * }
 *
 * Saves go through a temp file (fsynced) + rename so a crash mid-write leaves the previous
 * record.
 */

#include <onyx/downloader/chunk_planner.hpp>
#include <onyx/downloader/disk_writer.hpp>
#include <onyx/downloader/resume_store.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <utility>

namespace onyx::downloader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

const char* chunk_status_name(ChunkStatus s) {
    switch (s) {
        case ChunkStatus::Pending:
            return "pending";
        case ChunkStatus::Active:
            return "active";
        case ChunkStatus::Complete:
            return "complete";
        case ChunkStatus::Failed:
            return "failed";
    }
    return "pending";
}

ChunkStatus chunk_status_from(std::string_view s) {
    if (s == "complete")
        return ChunkStatus::Complete;
    if (s == "failed")
        return ChunkStatus::Failed;
    // An "active" chunk in a persisted record belongs to a dead process.
    return ChunkStatus::Pending;
}

} // namespace

json resumeRecordToJson(const ResumeRecord& record) {
    json j;
    j["version"] = ResumeRecord::kFormatVersion;
    j["key"] = record.key;
    j["url"] = record.url;
    j["destination_path"] = record.destinationPath.string();
    j["expected_size"] = record.expectedSize;
    if (record.checksumAlgorithm)
        j["checksum_algorithm"] = hashAlgoName(*record.checksumAlgorithm);
    else
        j["checksum_algorithm"] = nullptr;
    if (record.etag)
        j["etag"] = *record.etag;
    else
        j["etag"] = nullptr;
    j["worker_count"] = record.workerCount;
    j["chunks"] = json::array();
    for (const auto& c : record.chunks) {
        j["chunks"].push_back({{"id", c.id},
                               {"start", c.startOffset},
                               {"end", c.endOffset},
                               {"bytes_written", c.bytesWritten},
                               {"status", chunk_status_name(c.status)},
                               {"attempts", c.attemptCount}});
    }
    j["updated_at"] = std::chrono::duration_cast<std::chrono::seconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
    return j;
}

std::optional<ResumeRecord> resumeRecordFromJson(const json& j) {
    if (!j.is_object())
        return std::nullopt;
    if (!j.contains("url") || !j["url"].is_string() || !j.contains("destination_path") ||
        !j["destination_path"].is_string() || !j.contains("expected_size") ||
        !j["expected_size"].is_number_unsigned() || !j.contains("chunks") ||
        !j["chunks"].is_array()) {
        return std::nullopt;
    }

    ResumeRecord r;
    r.key = j.value("key", std::string{});
    r.url = j["url"].get<std::string>();
    r.destinationPath = j["destination_path"].get<std::string>();
    r.expectedSize = j["expected_size"].get<std::uint64_t>();
    if (j.contains("checksum_algorithm") && j["checksum_algorithm"].is_string()) {
        r.checksumAlgorithm = hashAlgoFromName(j["checksum_algorithm"].get<std::string>());
        if (!r.checksumAlgorithm)
            return std::nullopt;
    }
    if (j.contains("etag") && j["etag"].is_string()) {
        r.etag = j["etag"].get<std::string>();
    }
    if (j.contains("worker_count") && j["worker_count"].is_number_integer()) {
        r.workerCount = j["worker_count"].get<int>();
    }

    for (const auto& cj : j["chunks"]) {
        if (!cj.is_object() || !cj.contains("id") || !cj["id"].is_number_unsigned() ||
            !cj.contains("start") || !cj["start"].is_number_unsigned() || !cj.contains("end") ||
            !cj["end"].is_number_unsigned() || !cj.contains("bytes_written") ||
            !cj["bytes_written"].is_number_unsigned()) {
            return std::nullopt;
        }
        Chunk c;
        c.id = cj["id"].get<std::uint32_t>();
        c.startOffset = cj["start"].get<std::uint64_t>();
        c.endOffset = cj["end"].get<std::uint64_t>();
        c.bytesWritten = cj["bytes_written"].get<std::uint64_t>();
        c.status = chunk_status_from(cj.value("status", std::string{"pending"}));
        c.attemptCount = cj.value("attempts", 0);
        if (c.status == ChunkStatus::Complete && c.bytesWritten != c.endOffset - c.startOffset)
            c.status = ChunkStatus::Pending;
        r.chunks.push_back(c);
    }

    if (!isValidPartition(r.chunks, r.expectedSize))
        return std::nullopt;
    return r;
}

// Persistent JSON ResumeStore: one file per (url, destination) key
class JsonResumeStore final : public IResumeStore {
public:
    explicit JsonResumeStore(fs::path directory) : dir_(std::move(directory)) {
        std::error_code ec;
        fs::create_directories(dir_, ec);
        if (ec) {
            spdlog::warn("ResumeStore: cannot create {}: {}", dir_.string(), ec.message());
        }
    }

    Expected<std::optional<ResumeRecord>> load(std::string_view key) override {
        if (key.empty()) {
            return Error{ErrorKind::InvalidArgument, "ResumeStore.load: empty key"};
        }
        const auto path = pathFor(key);
        std::error_code ec;
        if (!fs::exists(path, ec)) {
            return std::optional<ResumeRecord>{std::nullopt};
        }

        std::ifstream in(path);
        if (!in) {
            return Error{ErrorKind::DiskError, "Failed to open resume record " + path.string()};
        }
        json root = json::parse(in, nullptr, /*allow_exceptions=*/false);
        if (root.is_discarded()) {
            spdlog::warn("ResumeStore: discarding unreadable record {}", path.string());
            remove(key);
            return std::optional<ResumeRecord>{std::nullopt};
        }

        auto record = resumeRecordFromJson(root);
        if (!record) {
            spdlog::warn("ResumeStore: discarding malformed record {}", path.string());
            remove(key);
            return std::optional<ResumeRecord>{std::nullopt};
        }
        record->key = std::string(key);
        return record;
    }

    Expected<void> save(const ResumeRecord& record) override {
        if (record.key.empty()) {
            return Error{ErrorKind::InvalidArgument, "ResumeStore.save: empty key"};
        }
        const auto path = pathFor(record.key);
        auto tmp = path;
        tmp += ".tmp";
        {
            std::ofstream out(tmp, std::ios::trunc);
            if (!out) {
                return Error{ErrorKind::DiskError,
                             "Failed to open resume record for write: " + tmp.string()};
            }
            out << resumeRecordToJson(record).dump(2);
            out.flush();
            if (!out) {
                return Error{ErrorKind::DiskError,
                             "Failed to write resume record: " + tmp.string()};
            }
        }
        // Contents must be durable before the rename makes them the record of truth
        if (auto sr = syncFile(tmp); !sr.ok()) {
            removeFile(tmp);
            return sr.error();
        }
        std::error_code ec;
        fs::rename(tmp, path, ec);
        if (ec) {
            removeFile(tmp);
            return Error{ErrorKind::DiskError,
                         "Failed to replace resume record " + path.string() + ": " + ec.message()};
        }
        spdlog::debug("ResumeStore: saved {} ({} of {} bytes)", path.filename().string(),
                      record.bytesWritten(), record.expectedSize);
        return Expected<void>{};
    }

    void remove(std::string_view key) noexcept override {
        if (key.empty()) {
            return;
        }
        removeFile(pathFor(key));
    }

private:
    fs::path pathFor(std::string_view key) const { return dir_ / (std::string(key) + ".json"); }

    fs::path dir_;
};

std::unique_ptr<IResumeStore> makeJsonResumeStore(fs::path directory) {
    return std::make_unique<JsonResumeStore>(std::move(directory));
}

// ---- ResumeTracker ----

ResumeTracker::ResumeTracker(IResumeStore& store, ResumeRecord record, OutputFile& file,
                             Policy policy)
    : store_(store), file_(file), policy_(policy), record_(std::move(record)),
      lastSave_(std::chrono::steady_clock::now()) {
    persistedBytes_.reserve(record_.chunks.size());
    for (const auto& c : record_.chunks)
        persistedBytes_.push_back(c.bytesWritten);
}

void ResumeTracker::update(const Chunk& chunk, bool force, bool reset) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (chunk.id >= record_.chunks.size())
        return;

    auto& mine = record_.chunks[chunk.id];
    if (reset) {
        mine.bytesWritten = chunk.bytesWritten;
        persistedBytes_[chunk.id] = std::min(persistedBytes_[chunk.id], chunk.bytesWritten);
    } else {
        mine.bytesWritten = std::max(mine.bytesWritten, chunk.bytesWritten);
    }
    mine.status = chunk.status;
    mine.attemptCount = chunk.attemptCount;

    const bool sizeDue =
        mine.bytesWritten >= persistedBytes_[chunk.id] + policy_.persistEveryBytes;
    const bool timeDue =
        std::chrono::steady_clock::now() - lastSave_ >= policy_.persistInterval &&
        mine.bytesWritten != persistedBytes_[chunk.id];
    if (!force && !reset && !sizeDue && !timeDue)
        return;

    auto r = persistLocked();
    if (!r.ok()) {
        spdlog::warn("Failed to persist resume state for {}: {}", record_.url, r.error().message);
    }
}

Expected<void> ResumeTracker::flush() {
    std::lock_guard<std::mutex> lk(mutex_);
    return persistLocked();
}

ResumeRecord ResumeTracker::snapshot() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return record_;
}

Expected<void> ResumeTracker::persistLocked() {
    auto sr = file_.sync();
    if (!sr.ok())
        return sr;
    auto r = store_.save(record_);
    if (!r.ok())
        return r;
    for (std::size_t i = 0; i < record_.chunks.size(); ++i)
        persistedBytes_[i] = record_.chunks[i].bytesWritten;
    lastSave_ = std::chrono::steady_clock::now();
    return Expected<void>{};
}

} // namespace onyx::downloader
