// orchestrator.cpp - Parallel placement search with deterministic tie-break

#include "relicrando/orchestrator.hpp"
#include "relicrando/debug_log.hpp"
#include "relicrando/errors.hpp"
#include "relicrando/mailbox.hpp"
#include "relicrando/options.hpp"

#include <chrono>
#include <thread>
#include <vector>

namespace relicrando {

// =============================================================================
// ResultArbiter
// =============================================================================

bool ResultArbiter::offer(WorkerReply reply) {
    in_flight_.erase(reply.nonce);

    if (reply.failed()) {
        if (!error_) error_ = std::move(reply);
        return false;
    }
    if (!reply.done || !reply.result) {
        return false;
    }
    // Later nonces never replace an earlier success
    if (best_ && best_->nonce <= reply.nonce) {
        return false;
    }
    best_ = std::move(*reply.result);
    best_->nonce = reply.nonce;
    return true;
}

bool ResultArbiter::resolved() const {
    if (error_) return true;
    if (!best_) return false;
    return in_flight_.empty() || *in_flight_.begin() > best_->nonce;
}

// =============================================================================
// Search session
// =============================================================================

namespace {

// State shared between one run() and its worker tasks. Tasks hold it by
// shared_ptr and may outlive the run.
struct SearchSession {
    SearchContext context;
    uint32_t rounds;
    std::vector<std::unique_ptr<Mailbox<WorkerRequest>>> inboxes;
    Mailbox<WorkerReply> outbox;

    SearchSession(SearchContext ctx, uint32_t rounds_per_attempt, size_t num_workers)
        : context(std::move(ctx)), rounds(rounds_per_attempt) {
        inboxes.reserve(num_workers);
        for (size_t i = 0; i < num_workers; ++i) {
            inboxes.push_back(std::make_unique<Mailbox<WorkerRequest>>());
        }
    }

    void cancel() {
        for (auto& inbox : inboxes) {
            inbox->push(WorkerRequest{WorkerAction::Cancel, 0});
        }
    }

    // Workers finish their current attempt, then exit; later replies are dropped
    void close() {
        cancel();
        for (auto& inbox : inboxes) {
            inbox->close();
        }
        outbox.close();
    }
};

// Closes the session however run() exits
class SessionCloser {
public:
    explicit SessionCloser(SearchSession& session) : session_(session) {}
    ~SessionCloser() { session_.close(); }

    SessionCloser(const SessionCloser&) = delete;
    SessionCloser& operator=(const SessionCloser&) = delete;

private:
    SearchSession& session_;
};

void run_worker(SearchSession& session, size_t index, PlacementWorker& worker) {
    WorkerRequest request;
    while (session.inboxes[index]->pop_wait(request)) {
        if (request.action == WorkerAction::Cancel) {
            break;
        }

        WorkerReply reply;
        reply.worker = index;
        reply.nonce = request.nonce;
        try {
            if (request.action == WorkerAction::Bootstrap) {
                worker.bootstrap(session.context);
            }
            reply.result = worker.attempt(request.nonce, session.rounds);
            reply.done = reply.result.has_value();
        } catch (const SearchError& e) {
            reply.error = e.detail();
            reply.error_location = e.location();
        } catch (const std::exception& e) {
            reply.error = e.what();
        }

        if (!session.outbox.push(std::move(reply))) {
            break;
        }
    }
    RELICRANDO_TRACE_LOG("worker %zu exiting", index);
}

} // namespace

// =============================================================================
// RelicOrchestrator
// =============================================================================

RelicOrchestrator::RelicOrchestrator(size_t num_workers)
    : num_workers_(num_workers == 0
                       ? worker_count_from_cores(std::thread::hardware_concurrency())
                       : num_workers)
    , factory_([](size_t) { return std::make_unique<PlacementSearchWorker>(); })
    , pool_(num_workers_) {
    pool_.start();
}

RelicOrchestrator::~RelicOrchestrator() {
    pool_.shutdown();
}

void RelicOrchestrator::set_rounds(uint32_t rounds) {
    if (rounds == 0) {
        throw std::invalid_argument("rounds must be positive");
    }
    rounds_ = rounds;
}

void RelicOrchestrator::set_max_dispatches(uint64_t max_dispatches) {
    if (max_dispatches == 0) {
        throw std::invalid_argument("max_dispatches must be positive");
    }
    max_dispatches_ = max_dispatches;
}

void RelicOrchestrator::set_worker_factory(PlacementWorkerFactory factory) {
    if (!factory) {
        throw std::invalid_argument("worker factory must be callable");
    }
    factory_ = std::move(factory);
}

PlacementResult RelicOrchestrator::run(std::shared_ptr<const AccessibilityModel> model,
                                       const std::string& version, const std::string& options,
                                       const std::string& seed) {
    if (!model) {
        throw std::invalid_argument("run requires a model");
    }
    pool_.rethrow_if_failed();

    auto session = std::make_shared<SearchSession>(
        SearchContext{std::move(model), version, options, seed}, rounds_, num_workers_);
    SessionCloser closer(*session);

    for (size_t w = 0; w < num_workers_; ++w) {
        std::shared_ptr<PlacementWorker> worker = factory_(w);
        if (!worker) {
            throw std::invalid_argument("worker factory returned no worker");
        }
        pool_.submit_to_worker(w, [session, w, worker]() {
            run_worker(*session, w, *worker);
        });
    }

    ResultArbiter arbiter;
    uint64_t dispatches = 0;
    auto dispatch = [&](size_t worker, WorkerAction action) {
        const Nonce nonce = next_nonce_++;
        arbiter.dispatched(nonce);
        ++dispatches;
        session->inboxes[worker]->push(WorkerRequest{action, nonce});
    };

    RELICRANDO_DEBUG_LOG("search for seed \"%s\" with %zu workers from nonce %llu",
                         seed.c_str(), num_workers_, static_cast<unsigned long long>(next_nonce_));

    for (size_t w = 0; w < num_workers_ && dispatches < max_dispatches_; ++w) {
        dispatch(w, WorkerAction::Bootstrap);
    }

    bool cancelled = false;
    while (!arbiter.resolved()) {
        if (arbiter.in_flight() == 0) {
            RELICRANDO_DEBUG_LOG("search exhausted after %llu attempts",
                                 static_cast<unsigned long long>(dispatches));
            throw SearchExhausted(seed, next_nonce_);
        }

        WorkerReply reply;
        if (!session->outbox.pop_wait_for(reply, std::chrono::milliseconds(50))) {
            // A task that died outside the worker protocol never replies
            pool_.rethrow_if_failed();
            continue;
        }

        const size_t worker = reply.worker;
        const bool done = reply.done;
        if (arbiter.offer(std::move(reply))) {
            RELICRANDO_DEBUG_LOG("worker %zu found a placement at nonce %llu", worker,
                                 static_cast<unsigned long long>(arbiter.winner().nonce));
        }
        if (arbiter.has_error()) {
            break;
        }

        if (arbiter.has_winner()) {
            if (!cancelled) {
                RELICRANDO_DEBUG_LOG("cancelling workers, %zu attempts still in flight",
                                     arbiter.in_flight());
                session->cancel();
                cancelled = true;
            }
        } else if (!done && dispatches < max_dispatches_) {
            dispatch(worker, WorkerAction::Attempt);
        }
    }

    if (arbiter.has_error()) {
        const WorkerReply& error = arbiter.error();
        RELICRANDO_DEBUG_LOG("worker %zu failed at nonce %llu: %s", error.worker,
                             static_cast<unsigned long long>(error.nonce), error.error->c_str());
        throw SearchError(*error.error, error.error_location, seed, error.nonce);
    }

    PlacementResult result = arbiter.winner();
    RELICRANDO_INFO_LOG("placement accepted at nonce %llu, complexity %u",
                        static_cast<unsigned long long>(result.nonce), result.complexity);
    return result;
}

} // namespace relicrando
