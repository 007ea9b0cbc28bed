#ifndef RELICRANDO_ORCHESTRATOR_HPP
#define RELICRANDO_ORCHESTRATOR_HPP

#include <relicrando/accessibility_model.hpp>
#include <relicrando/placement_search.hpp>
#include <relicrando/task_pool.hpp>
#include <relicrando/types.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace relicrando {

// =============================================================================
// Worker protocol
// =============================================================================

enum class WorkerAction {
    Bootstrap,  // Full context, then attempt
    Attempt,    // Attempt with a new nonce
    Cancel      // Stop; no reply
};

struct WorkerRequest {
    WorkerAction action = WorkerAction::Cancel;
    Nonce nonce = 0;
};

struct WorkerReply {
    size_t worker = 0;
    Nonce nonce = 0;
    bool done = false;
    std::optional<PlacementResult> result;  // Set when done
    std::optional<std::string> error;
    std::string error_location;

    bool failed() const { return error.has_value(); }
};

/**
 * Decides the outcome of a search from the replies seen so far.
 *
 * Successes compete by nonce; the smallest wins. The outcome is settled
 * once no dispatched nonce below the best success is still outstanding,
 * or as soon as any reply reports an error.
 */
class ResultArbiter {
public:
    void dispatched(Nonce nonce) { in_flight_.insert(nonce); }

    // Returns true when reply became the new best success
    bool offer(WorkerReply reply);

    bool has_winner() const { return best_.has_value(); }
    bool has_error() const { return error_.has_value(); }
    bool resolved() const;

    size_t in_flight() const { return in_flight_.size(); }
    const PlacementResult& winner() const { return *best_; }
    const WorkerReply& error() const { return *error_; }

private:
    std::set<Nonce> in_flight_;
    std::optional<PlacementResult> best_;
    std::optional<WorkerReply> error_;
};

// =============================================================================
// RelicOrchestrator
// =============================================================================

/**
 * Runs placement workers in parallel until one finds a valid placement.
 *
 * Each worker gets a Bootstrap message with the first nonce; every failed
 * attempt is answered with a fresh nonce until a success or an error is
 * reported or the dispatch limit is reached. The nonce counter persists
 * across runs, so a caller retrying after SearchExhausted continues where
 * the last run stopped.
 *
 * Usage:
 *   RelicOrchestrator orchestrator(4);
 *   orchestrator.set_rounds(8);
 *   PlacementResult result = orchestrator.run(model, "1.0.0", fingerprint, "seed");
 */
class RelicOrchestrator {
public:
    static constexpr uint32_t DEFAULT_ROUNDS = 16;
    static constexpr uint64_t DEFAULT_MAX_DISPATCHES = 100000;

    // num_workers 0 picks worker_count_from_cores(hardware threads)
    explicit RelicOrchestrator(size_t num_workers = 0);
    ~RelicOrchestrator();

    RelicOrchestrator(const RelicOrchestrator&) = delete;
    RelicOrchestrator& operator=(const RelicOrchestrator&) = delete;

    // Tries per attempt message
    void set_rounds(uint32_t rounds);
    // Attempt messages per run before SearchExhausted
    void set_max_dispatches(uint64_t max_dispatches);
    void set_nonce_base(Nonce nonce) { next_nonce_ = nonce; }
    void set_worker_factory(PlacementWorkerFactory factory);

    size_t num_workers() const { return num_workers_; }
    uint32_t rounds() const { return rounds_; }
    uint64_t max_dispatches() const { return max_dispatches_; }
    Nonce next_nonce() const { return next_nonce_; }

    /**
     * Searches for a placement of model.
     * Throws SearchError when a worker reports an error, SearchExhausted when
     * the dispatch limit is reached without a success.
     */
    PlacementResult run(std::shared_ptr<const AccessibilityModel> model,
                        const std::string& version, const std::string& options,
                        const std::string& seed);

private:
    size_t num_workers_;
    uint32_t rounds_ = DEFAULT_ROUNDS;
    uint64_t max_dispatches_ = DEFAULT_MAX_DISPATCHES;
    Nonce next_nonce_ = 0;
    PlacementWorkerFactory factory_;
    TaskPool pool_;
};

} // namespace relicrando

#endif // RELICRANDO_ORCHESTRATOR_HPP
