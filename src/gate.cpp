#include "gate.hpp"
#include <stdexcept>

namespace glmextract {

AdmissionGate::AdmissionGate(size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) {
        throw std::invalid_argument("AdmissionGate requires a capacity of at least 1");
    }
}

bool AdmissionGate::acquire() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return cancelled_ || in_use_ < capacity_; });
    if (cancelled_) return false;
    ++in_use_;
    return true;
}

void AdmissionGate::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_use_ > 0) --in_use_;
    }
    cv_.notify_one();
}

void AdmissionGate::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool AdmissionGate::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

size_t AdmissionGate::in_use() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_use_;
}

} // namespace glmextract
