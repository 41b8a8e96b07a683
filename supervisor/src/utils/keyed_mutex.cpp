#include "utils/keyed_mutex.hpp"

namespace rtmp2rtsp::utils {

KeyedMutex::Guard::Guard(KeyedMutex* owner, std::string key, std::shared_ptr<Slot> slot)
    : owner_(owner), key_(std::move(key)), slot_(std::move(slot)) {}

KeyedMutex::Guard::Guard(Guard&& other) noexcept
    : owner_(other.owner_), key_(std::move(other.key_)), slot_(std::move(other.slot_)) {
    other.owner_ = nullptr;
}

KeyedMutex::Guard::~Guard() {
    if (!owner_ || !slot_) return;
    slot_->mutex.unlock();
    owner_->Release(key_);
}

KeyedMutex::Guard KeyedMutex::Lock(const std::string& key) {
    std::shared_ptr<Slot> slot;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = slots_[key];
        if (!entry) entry = std::make_shared<Slot>();
        ++entry->users;
        slot = entry;
    }
    slot->mutex.lock();
    return Guard(this, key, std::move(slot));
}

size_t KeyedMutex::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return slots_.size();
}

void KeyedMutex::Release(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(key);
    if (it != slots_.end() && --it->second->users == 0) {
        slots_.erase(it);
    }
}

} // namespace rtmp2rtsp::utils
