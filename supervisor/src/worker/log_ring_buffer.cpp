#include "worker/log_ring_buffer.hpp"
#include <algorithm>
#include <cstring>

namespace rtmp2rtsp::worker {

namespace {
constexpr size_t kLineScanBytes = 4096;
}

LogRingBuffer::LogRingBuffer(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)), buf_(std::max<size_t>(capacity, 1)) {}

void LogRingBuffer::Append(const char* data, size_t len) {
    if (len == 0) return;

    std::lock_guard<std::mutex> lock(mutex_);
    total_written_ += len;

    if (len >= capacity_) {
        std::memcpy(buf_.data(), data + (len - capacity_), capacity_);
        head_ = 0;
        size_ = capacity_;
        return;
    }

    size_t first = std::min(len, capacity_ - head_);
    std::memcpy(buf_.data() + head_, data, first);
    if (first < len) {
        std::memcpy(buf_.data(), data + first, len - first);
    }
    head_ = (head_ + len) % capacity_;
    size_ = std::min(size_ + len, capacity_);
}

std::string LogRingBuffer::Tail(size_t max_bytes) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t n = std::min(max_bytes, size_);
    std::string out;
    if (n == 0) return out;
    out.resize(n);

    size_t start = (head_ + capacity_ - n) % capacity_;
    size_t first = std::min(n, capacity_ - start);
    std::memcpy(out.data(), buf_.data() + start, first);
    if (first < n) {
        std::memcpy(out.data() + first, buf_.data(), n - first);
    }
    return out;
}

std::vector<std::string> LogRingBuffer::LastLines(size_t n) const {
    std::string tail = Tail(kLineScanBytes);
    std::vector<std::string> lines;
    size_t end = tail.size();
    while (end > 0 && lines.size() < n) {
        size_t pos = tail.find_last_of("\r\n", end - 1);
        size_t begin = (pos == std::string::npos) ? 0 : pos + 1;
        if (begin < end) {
            lines.push_back(tail.substr(begin, end - begin));
        }
        if (pos == std::string::npos) break;
        end = pos;
    }
    std::reverse(lines.begin(), lines.end());
    return lines;
}

size_t LogRingBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

uint64_t LogRingBuffer::total_written() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_written_;
}

} // namespace rtmp2rtsp::worker
