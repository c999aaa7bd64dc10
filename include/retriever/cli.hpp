#pragma once

#include "transfer.hpp"

namespace retriever {

// Process exit contract:
// - 0 once every worker has finished, whatever individual items returned
// - 1 setup failure (unreadable or malformed retrieval order, package
//   assembly) or a crashed worker
// - 2 usage error, reported before any I/O
enum class ExitCode : int {
    kSuccess = 0,
    kFailure = 1,
    kUsage = 2,
};

constexpr int toInt(ExitCode code) {
    return static_cast<int>(code);
}

// Parses argv, assembles the package and runs the scheduler. Without a
// runner, transfers go through SystemTransferRunner.
int runCli(int argc, const char* const* argv, TransferRunnerPtr runner = nullptr);

} // namespace retriever
