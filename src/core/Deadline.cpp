#include "Deadline.h"
#include <algorithm>

namespace asset_scan {

Deadline::Deadline() : at_(clock::time_point::max()), cancel_(std::make_shared<std::atomic<bool>>(false)) {}

Deadline::Deadline(clock::time_point at) : at_(at), cancel_(std::make_shared<std::atomic<bool>>(false)) {}

Deadline Deadline::after(std::chrono::milliseconds d){
    return Deadline(clock::now() + d);
}

bool Deadline::expired() const {
    return cancel_->load() || clock::now() >= at_;
}

std::chrono::milliseconds Deadline::remaining() const {
    if(expired()) return std::chrono::milliseconds(0);
    if(at_ == clock::time_point::max()) return std::chrono::milliseconds::max();
    return std::chrono::duration_cast<std::chrono::milliseconds>(at_ - clock::now());
}

Deadline Deadline::tightened(clock::time_point at) const {
    Deadline d(*this);
    d.at_ = std::min(at_, at);
    return d;
}

}
