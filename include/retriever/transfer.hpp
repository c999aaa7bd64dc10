#pragma once

#include "retrieval_item.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace retriever {

enum class TransferKind {
    Mirror,  // rsync -ar
    Fetch,   // quiet fetch-by-URL
};

[[nodiscard]] TransferKind selectTransfer(std::string_view source_url);
[[nodiscard]] TransferKind selectTransfer(const RetrievalItem& item);
[[nodiscard]] const char* toString(TransferKind kind);

class TransferRunner {
public:
    virtual ~TransferRunner() = default;

    // Returns the exit code of the transfer, uninterpreted.
    virtual int run(TransferKind kind, const RetrievalItem& item,
                    const std::filesystem::path& destination) = 0;
};

using TransferRunnerPtr = std::shared_ptr<TransferRunner>;

} // namespace retriever
