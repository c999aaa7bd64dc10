#include "retriever/scheduler.hpp"
#include "retriever/worker.hpp"

#include <utility>

#include <fmt/format.h>

namespace retriever {

Scheduler::Scheduler(const PackageContext& context, TransferRunnerPtr runner)
    : context_(context), runner_(std::move(runner)) {}

void Scheduler::setOutcomeHandler(OutcomeHandler handler) {
    handler_ = std::move(handler);
}

std::vector<WorkerOutcome> Scheduler::run(std::vector<Bucket> buckets) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_.clear();
        completed_.reserve(buckets.size());
    }

    std::vector<WorkerOutcome> outcomes;
    try {
        launch(std::move(buckets));
        outcomes = collect();
    } catch (...) {
        // workers run to completion; never leave joinable threads behind
        joinAll();
        throw;
    }
    joinAll();

    return outcomes;
}

void Scheduler::launch(std::vector<Bucket> buckets) {
    threads_.reserve(buckets.size());
    for (std::size_t id = 0; id < buckets.size(); ++id) {
        threads_.emplace_back([this, id, bucket = std::move(buckets[id])]() mutable {
            Worker worker{id, std::move(bucket), context_, runner_};
            complete(worker.run());
        });
    }
}

// Reports outcomes as workers finish, first-to-finish first.
std::vector<WorkerOutcome> Scheduler::collect() {
    std::vector<WorkerOutcome> outcomes;
    outcomes.reserve(threads_.size());
    while (outcomes.size() < threads_.size()) {
        std::unique_lock<std::mutex> lock(mutex_);
        finished_.wait(lock, [this, &outcomes] { return completed_.size() > outcomes.size(); });
        const WorkerOutcome outcome = completed_[outcomes.size()];
        lock.unlock();

        if (handler_) {
            handler_(outcome);
        }
        outcomes.push_back(outcome);
    }
    return outcomes;
}

void Scheduler::joinAll() {
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void Scheduler::complete(WorkerOutcome outcome) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        completed_.push_back(std::move(outcome));
    }
    finished_.notify_one();
}

std::string Scheduler::formatOutcome(const WorkerOutcome& outcome) {
    std::string line = fmt::format("worker {} finished with status {} ({} of {} items failed)",
                                   outcome.worker_id, outcome.exit_status,
                                   outcome.failed_count, outcome.item_count);
    if (outcome.exit_status == WorkerOutcome::kCrashed) {
        line += fmt::format(": {}", outcome.error_message);
    }
    return line;
}

} // namespace retriever
