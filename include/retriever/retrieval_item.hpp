#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace retriever {

struct RetrievalItem {
    std::string source_url;
    std::optional<std::uint64_t> expected_size;
    std::string destination_name;
};

using Bucket = std::vector<RetrievalItem>;

struct TransferResult {
    RetrievalItem item;
    std::string resolved_path;
    int exit_code{0};
    std::chrono::system_clock::time_point timestamp;
};

struct WorkerOutcome {
    static constexpr int kCompleted = 0;
    static constexpr int kCrashed = 1;

    std::size_t worker_id{0};
    int exit_status{kCompleted};
    std::size_t item_count{0};
    std::size_t failed_count{0};
    std::string error_message;
};

} // namespace retriever
