#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace glmextract {

// Fixed concurrency budget placed in front of the inference client.
// All methods are thread-safe.
class AdmissionGate {
public:
    explicit AdmissionGate(size_t capacity);

    AdmissionGate(const AdmissionGate&) = delete;
    AdmissionGate& operator=(const AdmissionGate&) = delete;

    // Block until a slot is free. Returns false if the gate was cancelled
    // before a slot could be taken; the caller must then not start its work.
    bool acquire();
    void release();

    // Refuse all further admissions and wake every waiter.
    // Work already admitted is unaffected.
    void cancel();
    bool cancelled() const;

    size_t capacity() const { return capacity_; }
    size_t in_use() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_use_ = 0;
    bool cancelled_ = false;
};

} // namespace glmextract
