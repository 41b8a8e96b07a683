#pragma once
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace rtmp2rtsp::worker {

// Fixed-capacity byte ring for captured worker output. Once full, each
// append drops the oldest bytes. The lock is only held for the copy, so a
// reader never stalls the capture thread on I/O and never sees a torn append.
class LogRingBuffer {
public:
    explicit LogRingBuffer(size_t capacity);

    void Append(const char* data, size_t len);
    void Append(const std::string& data) { Append(data.data(), data.size()); }

    // Most recent bytes, at most max_bytes.
    std::string Tail(size_t max_bytes) const;

    // Last n non-empty lines; '\r' counts as a line break (ffmpeg progress).
    std::vector<std::string> LastLines(size_t n) const;

    size_t size() const;
    size_t capacity() const { return capacity_; }
    uint64_t total_written() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::vector<char> buf_;
    size_t head_ = 0;
    size_t size_ = 0;
    uint64_t total_written_ = 0;
};

} // namespace rtmp2rtsp::worker
