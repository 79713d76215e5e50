#include "ObservationCollector.h"
#include <algorithm>
#include <iterator>

namespace asset_scan {

bool ObservationCollector::account(size_t bytes){
    size_t total = bytes_.fetch_add(bytes) + bytes;
    if(ceiling_ > 0 && total > ceiling_){
        exceeded_.store(true);
        return false;
    }
    return true;
}

bool ObservationCollector::commit(const std::string& module, std::vector<CandidateObservation> batch){
    std::lock_guard<std::mutex> lock(mutex_);
    if(sealed_ || abandoned_.count(module)) return false;
    observations_.insert(observations_.end(), std::make_move_iterator(batch.begin()), std::make_move_iterator(batch.end()));
    return true;
}

void ObservationCollector::abandon(const std::string& module){
    std::lock_guard<std::mutex> lock(mutex_);
    abandoned_.insert(module);
}

void ObservationCollector::seal(){
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = true;
}

std::vector<CandidateObservation> ObservationCollector::sorted() const {
    std::vector<CandidateObservation> out;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        out = observations_;
    }
    std::sort(out.begin(), out.end(), observation_less);
    return out;
}

}
