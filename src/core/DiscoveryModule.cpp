#include "DiscoveryModule.h"

namespace asset_scan {

std::optional<CandidateObservation> QueuedStream::next(){
    while(true){
        if(deadline_.expired()){
            if(!done_ || !pending_.empty()) partial_ = true;
            done_ = true;
            pending_.clear();
            return std::nullopt;
        }
        if(!pending_.empty()){
            CandidateObservation obs = std::move(pending_.front());
            pending_.pop_front();
            return obs;
        }
        if(done_) return std::nullopt;
        if(!advance()) done_ = true;
    }
}

}
