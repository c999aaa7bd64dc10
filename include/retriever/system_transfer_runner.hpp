#pragma once

#include "transfer.hpp"

#include <memory>
#include <string>

namespace retriever {

// Mirror transfers spawn rsync from PATH with the inherited environment;
// fetch transfers go through libcurl.
class SystemTransferRunner final : public TransferRunner {
public:
    explicit SystemTransferRunner(std::string rsync_program = "rsync");
    ~SystemTransferRunner() override;

    int run(TransferKind kind, const RetrievalItem& item,
            const std::filesystem::path& destination) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace retriever
