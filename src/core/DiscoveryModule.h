#pragma once
#include <string>
#include <memory>
#include <optional>
#include <deque>
#include "Observation.h"
#include "Config.h"
#include "Deadline.h"

namespace asset_scan {

// Finite, pull-based, non-restartable sequence of observations.
class ObservationStream {
public:
    virtual ~ObservationStream() = default;
    // nullopt once exhausted or once the deadline has expired.
    virtual std::optional<CandidateObservation> next() = 0;
    // True when the stream stopped because of its deadline with work left.
    virtual bool partial() const = 0;
};

// Stream driven by bounded units of work. Subclasses implement advance(),
// which performs one unit (a directory entry, a file, a socket table) and
// emits zero or more observations; the deadline is checked between units and
// by the subclass at its own I/O boundaries.
class QueuedStream : public ObservationStream {
public:
    explicit QueuedStream(Deadline deadline) : deadline_(std::move(deadline)) {}
    std::optional<CandidateObservation> next() override;
    bool partial() const override { return partial_; }

protected:
    virtual bool advance() = 0; // false when no work remains
    void emit(CandidateObservation obs){ pending_.push_back(std::move(obs)); }
    const Deadline& deadline() const { return deadline_; }

private:
    Deadline deadline_;
    std::deque<CandidateObservation> pending_;
    bool done_ = false;
    bool partial_ = false;
};

class DiscoveryModule {
public:
    virtual ~DiscoveryModule() = default;
    virtual std::string name() const = 0;
    virtual std::string description() const = 0;
    virtual DiscoveryMethod method() const = 0;
    // Discovery must never mutate what it inspects; others are refused at registration.
    virtual bool read_only() const { return true; }
    // Reason the module cannot run in this scope, or nullopt.
    virtual std::optional<std::string> availability(const ScopeConfig& scope) const { (void)scope; return std::nullopt; }
    virtual std::unique_ptr<ObservationStream> discover(const ScopeConfig& scope, const Deadline& deadline) = 0;
};

using ModulePtr = std::shared_ptr<DiscoveryModule>;

}
