#pragma once
#include <string>
#include "store/memory_stream_store.hpp"

namespace rtmp2rtsp::store {

// Keeps every record in memory and mirrors the whole set into a single JSON
// document. The document is replaced atomically (write temp, fsync, rename),
// so a crash leaves either the previous or the new state on disk.
class JsonFileStreamStore : public MemoryStreamStore {
public:
    explicit JsonFileStreamStore(std::string path);

    // Reads the state file if present. A missing file is an empty store.
    model::Status Load();

    const std::string& path() const { return path_; }

protected:
    model::Status Commit() override;

private:
    std::string path_;
};

} // namespace rtmp2rtsp::store
