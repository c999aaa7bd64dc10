#pragma once

#include "package.hpp"
#include "retrieval_item.hpp"
#include "transfer.hpp"

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace retriever {

class Scheduler {
public:
    using OutcomeHandler = std::function<void(const WorkerOutcome&)>;

    Scheduler(const PackageContext& context, TransferRunnerPtr runner);

    void setOutcomeHandler(OutcomeHandler handler);

    // Launches one worker per bucket and blocks until all of them have
    // terminated. Outcomes are returned, and handed to the handler, in
    // termination order.
    std::vector<WorkerOutcome> run(std::vector<Bucket> buckets);

    static std::string formatOutcome(const WorkerOutcome& outcome);

private:
    void launch(std::vector<Bucket> buckets);
    std::vector<WorkerOutcome> collect();
    void joinAll();
    void complete(WorkerOutcome outcome);

    const PackageContext& context_;
    TransferRunnerPtr runner_;
    OutcomeHandler handler_;

    std::vector<std::thread> threads_;
    std::mutex mutex_;
    std::condition_variable finished_;
    std::vector<WorkerOutcome> completed_;
};

} // namespace retriever
