#pragma once
#include <chrono>
#include <memory>
#include <atomic>

namespace asset_scan {

// Steady-clock deadline plus a cancel flag shared by every copy derived from
// the same root, so the orchestrator can stop all modules at once.
class Deadline {
public:
    using clock = std::chrono::steady_clock;

    Deadline();
    explicit Deadline(clock::time_point at);
    static Deadline after(std::chrono::milliseconds d);

    bool expired() const;
    bool cancelled() const { return cancel_->load(); }
    void cancel() const { cancel_->store(true); }
    clock::time_point at() const { return at_; }
    std::chrono::milliseconds remaining() const;

    // Same cancel flag, deadline no later than this one.
    Deadline tightened(clock::time_point at) const;

private:
    clock::time_point at_;
    std::shared_ptr<std::atomic<bool>> cancel_;
};

}
