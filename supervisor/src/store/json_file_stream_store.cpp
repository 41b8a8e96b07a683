#include "store/json_file_stream_store.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <unordered_set>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace rtmp2rtsp::store {

using model::ErrorCode;
using model::Status;

namespace {

constexpr int kStateVersion = 1;

json RecordToJson(const model::StreamRecord& rec) {
    json j;
    j["name"] = rec.config.name;
    j["source_url"] = rec.config.source_url;
    j["rtsp_port"] = rec.config.rtsp_port;
    j["created_at_ms"] = model::ToUnixMillis(rec.created_at);
    j["status"] = {
        {"running", rec.status.running},
        {"reason", rec.status.reason},
        {"last_checked_at_ms", model::ToUnixMillis(rec.status.last_checked_at)}
    };
    return j;
}

model::StreamRecord RecordFromJson(const json& j) {
    model::StreamRecord rec;
    rec.config.name = j.at("name").get<std::string>();
    rec.config.source_url = j.at("source_url").get<std::string>();
    rec.config.rtsp_port = j.at("rtsp_port").get<int>();
    rec.created_at = model::FromUnixMillis(j.value("created_at_ms", int64_t{0}));
    if (j.contains("status")) {
        const auto& s = j["status"];
        rec.status.running = s.value("running", false);
        rec.status.reason = s.value("reason", std::string());
        rec.status.last_checked_at = model::FromUnixMillis(s.value("last_checked_at_ms", int64_t{0}));
    }
    return rec;
}

std::string ErrnoString() {
    return std::strerror(errno);
}

bool WriteAll(int fd, const std::string& data) {
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = ::write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
}

} // namespace

JsonFileStreamStore::JsonFileStreamStore(std::string path) : path_(std::move(path)) {}

Status JsonFileStreamStore::Load() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        spdlog::info("State file {} not found, starting with no streams", path_);
        ResetLocked({});
        return Status::Ok();
    }

    std::ifstream in(path_);
    if (!in) {
        return Status::Error(ErrorCode::STORAGE_ERROR, "cannot open state file " + path_);
    }

    std::vector<model::StreamRecord> records;
    try {
        json doc = json::parse(in);
        int version = doc.value("version", 0);
        if (version != kStateVersion) {
            return Status::Error(ErrorCode::STORAGE_ERROR,
                "unsupported state file version " + std::to_string(version));
        }
        for (const auto& item : doc.at("streams")) {
            records.push_back(RecordFromJson(item));
        }
    } catch (const json::exception& e) {
        return Status::Error(ErrorCode::STORAGE_ERROR, std::string("corrupt state file: ") + e.what());
    }

    std::unordered_set<std::string> names;
    for (const auto& rec : records) {
        auto violation = model::ValidateStreamConfig(rec.config);
        if (!violation.empty()) {
            return Status::Error(ErrorCode::STORAGE_ERROR,
                "invalid stream '" + rec.config.name + "' in state file: " + violation);
        }
        if (!names.insert(rec.config.name).second) {
            return Status::Error(ErrorCode::STORAGE_ERROR,
                "duplicate stream '" + rec.config.name + "' in state file");
        }
    }

    spdlog::info("Loaded {} stream(s) from {}", records.size(), path_);
    ResetLocked(std::move(records));
    return Status::Ok();
}

Status JsonFileStreamStore::Commit() {
    json doc;
    doc["version"] = kStateVersion;
    doc["streams"] = json::array();
    for (const auto& rec : SnapshotLocked()) {
        doc["streams"].push_back(RecordToJson(rec));
    }
    std::string data = doc.dump(2);

    fs::path target(path_);
    fs::path tmp = target;
    tmp += ".tmp";

    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
    }

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        spdlog::error("Failed to open {}: {}", tmp.string(), ErrnoString());
        return Status::Error(ErrorCode::STORAGE_ERROR, "open " + tmp.string() + ": " + ErrnoString());
    }

    if (!WriteAll(fd, data) || ::fsync(fd) != 0) {
        std::string err = ErrnoString();
        ::close(fd);
        ::unlink(tmp.c_str());
        spdlog::error("Failed to write {}: {}", tmp.string(), err);
        return Status::Error(ErrorCode::STORAGE_ERROR, "write " + tmp.string() + ": " + err);
    }
    ::close(fd);

    if (::rename(tmp.c_str(), target.c_str()) != 0) {
        std::string err = ErrnoString();
        ::unlink(tmp.c_str());
        spdlog::error("Failed to replace {}: {}", path_, err);
        return Status::Error(ErrorCode::STORAGE_ERROR, "rename to " + path_ + ": " + err);
    }

    // Make the rename itself durable.
    fs::path dir = target.has_parent_path() ? target.parent_path() : fs::path(".");
    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd >= 0) {
        if (::fsync(dfd) != 0) {
            spdlog::warn("fsync of {} failed: {}", dir.string(), ErrnoString());
        }
        ::close(dfd);
    }

    return Status::Ok();
}

} // namespace rtmp2rtsp::store
