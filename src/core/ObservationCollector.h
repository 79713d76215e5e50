#pragma once
#include <string>
#include <vector>
#include <set>
#include <mutex>
#include <atomic>
#include <cstddef>
#include "Observation.h"

namespace asset_scan {

// The only state shared between module workers. Each module buffers locally
// and commits once; commits from abandoned modules or after sealing are refused.
class ObservationCollector {
public:
    explicit ObservationCollector(size_t memory_ceiling_bytes) : ceiling_(memory_ceiling_bytes) {}

    // Charges bytes against the ceiling; false once the ceiling is exceeded.
    bool account(size_t bytes);
    bool commit(const std::string& module, std::vector<CandidateObservation> batch);
    void abandon(const std::string& module);
    void seal();

    // Committed observations sorted with observation_less.
    std::vector<CandidateObservation> sorted() const;
    size_t bytes_in_use() const { return bytes_.load(); }
    bool ceiling_exceeded() const { return exceeded_.load(); }
private:
    size_t ceiling_;
    std::atomic<size_t> bytes_{0};
    std::atomic<bool> exceeded_{false};
    mutable std::mutex mutex_;
    bool sealed_ = false;
    std::set<std::string> abandoned_;
    std::vector<CandidateObservation> observations_;
};

}
