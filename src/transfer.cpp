#include "retriever/transfer.hpp"

namespace retriever {

namespace {
constexpr std::string_view kRsyncScheme = "rsync:";
} // namespace

TransferKind selectTransfer(std::string_view source_url) {
    if (source_url.substr(0, kRsyncScheme.size()) == kRsyncScheme) {
        return TransferKind::Mirror;
    }
    // everything else (http, https, ftp, file...) is a plain fetch
    return TransferKind::Fetch;
}

TransferKind selectTransfer(const RetrievalItem& item) {
    return selectTransfer(item.source_url);
}

const char* toString(TransferKind kind) {
    switch (kind) {
    case TransferKind::Mirror:
        return "mirror";
    case TransferKind::Fetch:
        return "fetch";
    }
    return "fetch";
}

} // namespace retriever
