#include "retriever/cli.hpp"
#include "retriever/config.hpp"
#include "retriever/package.hpp"
#include "retriever/partitioner.hpp"
#include "retriever/retrieval_order.hpp"
#include "retriever/scheduler.hpp"
#include "retriever/system_transfer_runner.hpp"

#include <algorithm>
#include <cstdio>
#include <exception>
#include <filesystem>
#include <memory>
#include <string>
#include <utility>

#include <fmt/format.h>

namespace retriever {

int runCli(int argc, const char* const* argv, TransferRunnerPtr runner) {
    const std::string program_name = argc > 0 ? argv[0] : "parallel-retriever";

    Config config;
    try {
        config = parseCommandLine(argc, argv);
    } catch (const ConfigurationError& ex) {
        fmt::print(stderr, "{}\nerror: {}\n", usage(program_name), ex.what());
        return toInt(ExitCode::kUsage);
    }

    if (config.show_help) {
        fmt::print("{}", usage(program_name));
        return toInt(ExitCode::kSuccess);
    }

    try {
        PackageContext context;
        context.package_identifier = config.package_identifier.value_or(generatePackageIdentifier());
        context.destination_path = config.destination_path.value_or(std::filesystem::current_path());
        context.num_workers = config.num_workers;

        const auto items = readRetrievalOrder(config.retrieval_order);
        auto buckets = partition(items, context.num_workers);

        assemblePackage(context, config.file_manifest, config.retrieval_order);
        fmt::print("retrieving {} items into {} with {} workers\n",
                   items.size(), context.packageDirectory().string(), context.num_workers);
        std::fflush(stdout);

        if (!runner) {
            runner = std::make_shared<SystemTransferRunner>();
        }
        Scheduler scheduler{context, std::move(runner)};
        scheduler.setOutcomeHandler([](const WorkerOutcome& outcome) {
            fmt::print("{}\n", Scheduler::formatOutcome(outcome));
            std::fflush(stdout);
        });

        const auto outcomes = scheduler.run(std::move(buckets));
        const bool crashed = std::any_of(outcomes.begin(), outcomes.end(), [](const auto& outcome) {
            return outcome.exit_status != WorkerOutcome::kCompleted;
        });
        return toInt(crashed ? ExitCode::kFailure : ExitCode::kSuccess);
    } catch (const std::exception& ex) {
        fmt::print(stderr, "Fatal error: {}\n", ex.what());
        return toInt(ExitCode::kFailure);
    }
}

} // namespace retriever
