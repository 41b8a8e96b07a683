#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace rtmp2rtsp::utils {

// One mutex per key, created on demand and dropped when nobody holds or
// waits for it. The table lock is only held to find the slot, never while
// waiting for the per-key mutex.
class KeyedMutex {
    struct Slot {
        std::mutex mutex;
        size_t users = 0;
    };

public:
    class Guard {
    public:
        Guard(Guard&& other) noexcept;
        Guard& operator=(Guard&&) = delete;
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard();

    private:
        friend class KeyedMutex;
        Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Slot> slot);

        KeyedMutex* owner_;
        std::string key_;
        std::shared_ptr<Slot> slot_;
    };

    Guard Lock(const std::string& key);

    // Number of keys currently held or waited on.
    size_t size() const;

private:
    void Release(const std::string& key);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<Slot>> slots_;
};

} // namespace rtmp2rtsp::utils
