#include "DiscoveryOrchestrator.h"
#include "ObservationCollector.h"
#include "Logging.h"
#include <algorithm>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <system_error>

namespace asset_scan {

namespace {

struct ModuleSlot {
    ModulePtr module;
    ScopeConfig scope;
    ModuleStatus status = ModuleStatus::Pending;
    size_t count = 0;
    std::string reason;
    bool finished = false;
    bool module_deadline_hit = false;
    std::chrono::system_clock::time_point start_time{};
    std::chrono::system_clock::time_point end_time{};
};

// Owned jointly by the orchestrator and every worker so a detached worker
// can still finish safely after run() returns.
struct RunState {
    RunState(size_t ceiling, Deadline d) : collector(ceiling), deadline(std::move(d)) {}
    std::mutex mutex;
    std::condition_variable cv;
    std::vector<ModuleSlot> slots;
    std::vector<bool> worker_exited;
    size_t finished = 0;
    bool finalized = false;
    std::atomic<size_t> next{0};
    ObservationCollector collector;
    Deadline deadline;
    std::chrono::milliseconds module_timeout{0};
};

void run_slot(RunState& st, size_t idx){
    ModulePtr module;
    ScopeConfig scope;
    {
        std::lock_guard<std::mutex> lock(st.mutex);
        if(st.finalized) return;
        auto& slot = st.slots[idx];
        if(st.deadline.expired()){
            slot.status = ModuleStatus::Skipped;
            slot.reason = "budget exceeded before start";
            slot.finished = true;
            ++st.finished;
            st.cv.notify_all();
            return;
        }
        slot.status = ModuleStatus::Running;
        slot.start_time = std::chrono::system_clock::now();
        module = slot.module;
        scope = slot.scope;
    }
    Deadline deadline = st.deadline;
    if(st.module_timeout.count() > 0) deadline = st.deadline.tightened(Deadline::clock::now() + st.module_timeout);

    Logger::instance().debug("Starting module: " + module->name());
    ModuleStatus status = ModuleStatus::Completed;
    std::string reason;
    std::vector<CandidateObservation> local;
    try {
        auto stream = module->discover(scope, deadline);
        bool over_ceiling = false;
        if(stream){
            while(auto obs = stream->next()){
                if(!st.collector.account(obs->approx_bytes())){
                    over_ceiling = true;
                    st.deadline.cancel();
                    break;
                }
                local.push_back(std::move(*obs));
            }
        }
        if(over_ceiling){
            status = ModuleStatus::Partial;
            reason = "memory ceiling exceeded";
        } else if(stream && stream->partial()){
            status = ModuleStatus::Partial;
            reason = "deadline expired";
        }
    } catch(const std::exception& ex){
        status = ModuleStatus::Failed;
        reason = ex.what();
        local.clear();
    }
    size_t count = local.size();

    // Commit and completion are one step under the run lock; once the run is
    // finalized this module has been reported abandoned and its output is dropped.
    std::lock_guard<std::mutex> lock(st.mutex);
    if(st.finalized){
        Logger::instance().debug("Discarding " + std::to_string(count) + " observations from abandoned module: " + module->name());
        return;
    }
    if(!st.collector.commit(module->name(), std::move(local))){
        status = ModuleStatus::Abandoned;
        count = 0;
    }
    Logger::instance().debug("Finished module: " + module->name() + " (" + module_status_to_string(status) + ", " + std::to_string(count) + " observations)");
    auto& slot = st.slots[idx];
    slot.status = status;
    slot.reason = reason;
    slot.count = count;
    slot.end_time = std::chrono::system_clock::now();
    slot.module_deadline_hit = status == ModuleStatus::Partial && !st.deadline.expired();
    slot.finished = true;
    ++st.finished;
    st.cv.notify_all();
}

void worker_loop(const std::shared_ptr<RunState>& state, size_t w, size_t n){
    while(true){
        size_t idx = state->next.fetch_add(1);
        if(idx >= n) break;
        run_slot(*state, idx);
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if(state->finalized) break;
        }
    }
    std::lock_guard<std::mutex> lock(state->mutex);
    state->worker_exited[w] = true;
}

}

DiscoveryOrchestrator::DiscoveryOrchestrator(std::vector<ModulePtr> modules){
    for(auto& m : modules) register_module(std::move(m));
}

bool DiscoveryOrchestrator::register_module(ModulePtr module){
    if(!module) return false;
    if(!module->read_only()){
        Logger::instance().error("Refusing to register module '" + module->name() + "': discovery modules must be read-only");
        rejected_.push_back(module->name());
        return false;
    }
    modules_.push_back(std::move(module));
    return true;
}

DiscoveryOutcome DiscoveryOrchestrator::run(const Config& cfg, Report& report){
    if(modules_.empty()) throw ConfigError("no discovery modules registered");
    if(!(cfg.budget_seconds > 0)) throw ConfigError("budget must be positive");
    if(cfg.max_workers < 1) throw ConfigError("max workers must be at least 1");

    DiscoveryOutcome outcome;
    outcome.start_time = std::chrono::system_clock::now();
    for(const auto& name : rejected_) report.add_warning(name, WarnCode::ModuleRejected, "module is not read-only");

    auto is_enabled = [&](const std::string& name){
        if(!cfg.enable_modules.empty() && std::find(cfg.enable_modules.begin(), cfg.enable_modules.end(), name) == cfg.enable_modules.end()) return false;
        if(std::find(cfg.disable_modules.begin(), cfg.disable_modules.end(), name) != cfg.disable_modules.end()) return false;
        return true;
    };

    auto budget = std::chrono::milliseconds(static_cast<long long>(std::min(cfg.budget_seconds, kMaxRunSeconds) * 1000.0));
    auto state = std::make_shared<RunState>(static_cast<size_t>(std::max(cfg.memory_ceiling_mb, 0)) * 1024u * 1024u, Deadline::after(budget));
    if(cfg.module_timeout_seconds > 0){
        state->module_timeout = std::chrono::milliseconds(static_cast<long long>(std::min(cfg.module_timeout_seconds, kMaxRunSeconds) * 1000.0));
    }

    size_t enabled = 0;
    for(const auto& m : modules_){
        ModuleRun skipped;
        skipped.name = m->name();
        skipped.method = m->method();
        skipped.status = ModuleStatus::Skipped;
        if(!is_enabled(m->name())){
            skipped.reason = "disabled by configuration";
            report.add_module(skipped);
            report.add_warning(m->name(), WarnCode::ModuleDisabled, skipped.reason);
            continue;
        }
        ++enabled;
        ScopeConfig scope = cfg.scope_for(m->method());
        if(auto why = m->availability(scope)){
            skipped.reason = *why;
            report.add_module(skipped);
            report.add_warning(m->name(), WarnCode::ModuleUnavailable, *why);
            continue;
        }
        ModuleSlot slot;
        slot.module = m;
        slot.scope = std::move(scope);
        state->slots.push_back(std::move(slot));
    }
    if(enabled == 0) throw ConfigError("no discovery modules left after enable/disable filtering");

    const size_t n = state->slots.size();
    const size_t workers = std::min(n, static_cast<size_t>(cfg.max_workers));
    state->worker_exited.assign(workers, false);
    std::vector<std::thread> threads;
    for(size_t w = 0; w < workers; ++w){
        try {
            threads.emplace_back(worker_loop, state, w, n);
        } catch(const std::system_error& ex){
            Logger::instance().warn("Could not start discovery worker " + std::to_string(w) + ": " + ex.what());
            break;
        }
    }
    if(threads.empty()){
        // No worker thread could be created; run every module on this thread.
        Logger::instance().warn("Running discovery modules without worker threads");
        worker_loop(state, 0, n);
    }

    {
        std::unique_lock<std::mutex> lock(state->mutex);
        auto all_done = [&]{ return state->finished == n; };
        // Wake periodically so a memory-ceiling cancellation starts the grace period promptly.
        while(!all_done() && !state->deadline.expired()){
            auto wake = std::min(state->deadline.at(), Deadline::clock::now() + std::chrono::milliseconds(50));
            state->cv.wait_until(lock, wake, all_done);
        }
        if(!all_done()){
            state->deadline.cancel();
            auto grace_end = Deadline::clock::now() + std::chrono::milliseconds(std::max(cfg.grace_ms, 0));
            state->cv.wait_until(lock, grace_end, all_done);
        }
        state->finalized = true;
        for(const auto& slot : state->slots){
            if(!slot.finished && slot.status == ModuleStatus::Running) state->collector.abandon(slot.module->name());
        }
    }

    bool truncated = false;
    for(auto& slot : state->slots){
        ModuleRun run;
        run.name = slot.module->name();
        run.method = slot.module->method();
        run.start_time = slot.start_time;
        run.end_time = slot.end_time;
        if(!slot.finished){
            if(slot.status == ModuleStatus::Running){
                run.status = ModuleStatus::Abandoned;
                run.reason = "still running after grace period";
                run.end_time = std::chrono::system_clock::now();
                report.add_warning(run.name, WarnCode::ModuleAbandoned, run.reason);
            } else {
                run.status = ModuleStatus::Skipped;
                run.reason = "budget exceeded before start";
                report.add_warning(run.name, WarnCode::BudgetExceeded, run.reason);
            }
            truncated = true;
        } else {
            run.status = slot.status;
            run.observation_count = slot.count;
            run.reason = slot.reason;
            if(slot.status == ModuleStatus::Failed){
                report.add_warning(run.name, WarnCode::ModuleFailed, slot.reason);
            } else if(slot.status == ModuleStatus::Partial){
                truncated = true;
                report.add_warning(run.name, slot.module_deadline_hit ? WarnCode::ModuleTimeout : WarnCode::BudgetExceeded,
                                   slot.reason + ", kept " + std::to_string(slot.count) + " observations");
            } else if(slot.status == ModuleStatus::Skipped){
                truncated = true;
                report.add_warning(run.name, WarnCode::BudgetExceeded, slot.reason);
            } else if(slot.status == ModuleStatus::Abandoned){
                truncated = true;
                report.add_warning(run.name, WarnCode::ModuleAbandoned, "output discarded");
            }
        }
        report.add_module(std::move(run));
    }
    state->collector.seal();
    if(state->collector.ceiling_exceeded()){
        truncated = true;
        report.add_warning("orchestrator", WarnCode::MemoryCeilingExceeded,
                           "approximately " + std::to_string(state->collector.bytes_in_use()) + " bytes collected");
    }

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        for(size_t w = 0; w < threads.size(); ++w){
            if(!state->worker_exited[w]) threads[w].detach();
        }
    }
    for(auto& t : threads){
        if(t.joinable()) t.join();
    }

    if(truncated) Logger::instance().warn("Discovery run truncated");
    report.set_truncated(truncated);
    outcome.truncated = truncated;
    outcome.observations = state->collector.sorted();
    outcome.end_time = std::chrono::system_clock::now();
    return outcome;
}

}
