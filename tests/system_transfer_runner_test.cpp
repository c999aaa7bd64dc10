#include "retriever/system_transfer_runner.hpp"
#include "retriever/detail/curl_utils.hpp"
#include "retriever/detail/process.hpp"

#include "common/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>
#include <filesystem>
#include <string>

#include <curl/curl.h>

using retriever::tests::TempDir;

TEST_CASE("Fetch transfers copy file URLs through libcurl", "[runner]") {
    TempDir dir("retriever-runner");
    const auto source = dir.path() / "source.bin";
    retriever::tests::writeFile(source, "payload bytes");
    const auto destination = dir.path() / "copy.bin";

    retriever::SystemTransferRunner runner;
    const retriever::RetrievalItem item{"file://" + source.string(), 13, "copy.bin"};
    REQUIRE(runner.run(retriever::TransferKind::Fetch, item, destination) == 0);
    REQUIRE(retriever::tests::readFile(destination) == "payload bytes");
}

TEST_CASE("Failed fetches pass the curl code through", "[runner]") {
    TempDir dir("retriever-runner");
    retriever::SystemTransferRunner runner;

    const retriever::RetrievalItem missing{"file://" + (dir.path() / "absent").string(), std::nullopt, "x"};
    REQUIRE(runner.run(retriever::TransferKind::Fetch, missing, dir.path() / "x") != 0);

    const retriever::RetrievalItem item{"file:///etc/hostname", std::nullopt, "y"};
    REQUIRE(runner.run(retriever::TransferKind::Fetch, item, dir.path() / "no-dir" / "y") ==
            CURLE_WRITE_ERROR);
}

TEST_CASE("Mirror transfers return the tool's exit status", "[runner]") {
    TempDir dir("retriever-runner");
    const retriever::RetrievalItem item{"rsync://host/module/file", std::nullopt, "file"};

    retriever::SystemTransferRunner succeeding{"true"};
    REQUIRE(succeeding.run(retriever::TransferKind::Mirror, item, dir.path() / "file") == 0);

    retriever::SystemTransferRunner failing{"false"};
    REQUIRE(failing.run(retriever::TransferKind::Mirror, item, dir.path() / "file") == 1);

    retriever::SystemTransferRunner missing{"retriever-no-such-tool"};
    REQUIRE(missing.run(retriever::TransferKind::Mirror, item, dir.path() / "file") ==
            retriever::detail::kSpawnFailedExitCode);
}

TEST_CASE("Mirror transfers pass archive flags, source and destination", "[runner]") {
    TempDir dir("retriever-runner");
    const auto args_file = dir.path() / "args.txt";
    const auto tool = dir.path() / "fake-rsync";
    retriever::tests::writeFile(tool, "#!/bin/sh\nfor arg in \"$@\"; do echo \"$arg\"; done > '" +
                                          args_file.string() + "'\n");
    std::filesystem::permissions(tool, std::filesystem::perms::owner_all);

    const retriever::RetrievalItem item{"rsync://host/module/data/file.dat", 42, "data/file.dat"};
    const auto destination = dir.path() / "pkg" / "data" / "file.dat";
    retriever::SystemTransferRunner runner{tool.string()};
    REQUIRE(runner.run(retriever::TransferKind::Mirror, item, destination) == 0);

    const auto args = retriever::tests::readLines(args_file);
    REQUIRE(args.size() == 3);
    REQUIRE(args[0] == "-ar");
    REQUIRE(args[1] == "rsync://host/module/data/file.dat");
    REQUIRE(args[2] == destination.string());
}

TEST_CASE("Spawned tools inherit the environment", "[runner]") {
    REQUIRE(setenv("RETRIEVER_TEST_SECRET", "s3cret", 1) == 0);
    REQUIRE(retriever::detail::spawnAndWait(
                "sh", {"-c", "test \"$RETRIEVER_TEST_SECRET\" = s3cret"}) == 0);
    REQUIRE(retriever::detail::spawnAndWait("sh", {"-c", "exit 7"}) == 7);
}

TEST_CASE("fetchToFile overwrites an existing destination", "[runner]") {
    retriever::detail::ensureCurlInitialized();
    TempDir dir("retriever-runner");
    const auto source = dir.path() / "fresh.txt";
    const auto destination = dir.path() / "stale.txt";
    retriever::tests::writeFile(source, "new");
    retriever::tests::writeFile(destination, "old contents that are longer");

    REQUIRE(retriever::detail::fetchToFile("file://" + source.string(), destination) == CURLE_OK);
    REQUIRE(retriever::tests::readFile(destination) == "new");
}
