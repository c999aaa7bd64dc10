#pragma once

#include "package.hpp"
#include "retrieval_item.hpp"
#include "transfer.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace retriever {

class Worker {
public:
    // Exit code recorded for an item whose destination directory could not be
    // created; its transfer is not attempted.
    static constexpr int kNotAttempted = -1;

    Worker(std::size_t id, Bucket bucket, const PackageContext& context, TransferRunnerPtr runner);

    // Runs every item of the bucket in order. Never throws: failures that
    // escape the loop are reported as a crashed outcome.
    WorkerOutcome run();

    [[nodiscard]] std::size_t id() const { return id_; }
    [[nodiscard]] const Bucket& bucket() const { return bucket_; }

    static std::string formatLogLine(const TransferResult& result);

private:
    TransferResult transfer(const RetrievalItem& item);
    void processBucket(WorkerOutcome& outcome);

    std::size_t id_;
    Bucket bucket_;
    const PackageContext& context_;
    TransferRunnerPtr runner_;
};

} // namespace retriever
