#include "retriever/system_transfer_runner.hpp"
#include "retriever/detail/curl_utils.hpp"
#include "retriever/detail/process.hpp"

#include <memory>
#include <string>
#include <utility>

namespace retriever {

class SystemTransferRunner::Impl {
public:
    explicit Impl(std::string rsync_program)
        : rsync_program_(std::move(rsync_program)) {
        detail::ensureCurlInitialized();
    }

    int run(TransferKind kind, const RetrievalItem& item, const std::filesystem::path& destination) {
        switch (kind) {
        case TransferKind::Mirror:
            return detail::spawnAndWait(rsync_program_, {"-ar", item.source_url, destination.string()});
        case TransferKind::Fetch:
            return detail::fetchToFile(item.source_url, destination);
        }
        return detail::fetchToFile(item.source_url, destination);
    }

private:
    std::string rsync_program_;
};

SystemTransferRunner::SystemTransferRunner(std::string rsync_program)
    : impl_(std::make_unique<Impl>(std::move(rsync_program))) {}

SystemTransferRunner::~SystemTransferRunner() = default;

int SystemTransferRunner::run(TransferKind kind, const RetrievalItem& item,
                              const std::filesystem::path& destination) {
    return impl_->run(kind, item, destination);
}

} // namespace retriever
