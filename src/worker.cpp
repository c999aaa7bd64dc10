#include "retriever/worker.hpp"

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <fmt/os.h>

namespace retriever {

namespace {

// One write per line: every worker holds its own O_APPEND handle on the same
// log, so lines from different workers never interleave.
void appendLine(fmt::file& log, const std::string& line) {
    std::size_t written = 0;
    while (written < line.size()) {
        written += log.write(line.data() + written, line.size() - written);
    }
}

} // namespace

Worker::Worker(std::size_t id, Bucket bucket, const PackageContext& context, TransferRunnerPtr runner)
    : id_(id), bucket_(std::move(bucket)), context_(context), runner_(std::move(runner)) {}

WorkerOutcome Worker::run() {
    WorkerOutcome outcome;
    outcome.worker_id = id_;
    outcome.item_count = bucket_.size();

    try {
        processBucket(outcome);
    } catch (const std::exception& ex) {
        outcome.exit_status = WorkerOutcome::kCrashed;
        outcome.error_message = ex.what();
    } catch (...) {
        outcome.exit_status = WorkerOutcome::kCrashed;
        outcome.error_message = "unknown exception";
    }
    return outcome;
}

void Worker::processBucket(WorkerOutcome& outcome) {
    if (!runner_) {
        throw std::invalid_argument("worker has no transfer runner");
    }

    fmt::print("working on {} items in list {}\n", bucket_.size(), id_);
    std::fflush(stdout);

    fmt::file log{context_.logPath().string(),
                  fmt::file::WRONLY | fmt::file::CREATE | fmt::file::APPEND};
    for (const auto& item : bucket_) {
        const TransferResult result = transfer(item);
        if (result.exit_code != 0) {
            ++outcome.failed_count;
        }
        appendLine(log, formatLogLine(result));
    }
    log.close();
}

TransferResult Worker::transfer(const RetrievalItem& item) {
    const std::filesystem::path destination = context_.packageDirectory() / item.destination_name;

    TransferResult result;
    result.item = item;
    result.resolved_path = destination.string();

    if (const std::error_code ec = ensureParentDirectories(destination)) {
        fmt::print(stderr, "warning: worker {}: cannot create directory for {}: {}\n",
                   id_, result.resolved_path, ec.message());
        result.exit_code = kNotAttempted;
    } else {
        result.exit_code = runner_->run(selectTransfer(item), item, destination);
    }

    result.timestamp = std::chrono::system_clock::now();
    return result;
}

std::string Worker::formatLogLine(const TransferResult& result) {
    const std::time_t time = std::chrono::system_clock::to_time_t(result.timestamp);
    // asctime layout, e.g. "Sun Oct 18 02:24:00 2026"
    return fmt::format("{:%a %b %e %H:%M:%S %Y} {} {}\n",
                       fmt::localtime(time), result.resolved_path, result.exit_code);
}

} // namespace retriever
