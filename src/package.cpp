#include "retriever/package.hpp"

#include <chrono>
#include <stdexcept>

#include <fmt/format.h>
#include <fmt/os.h>

namespace retriever {

namespace fs = std::filesystem;

namespace {

void copyInto(const fs::path& source, const fs::path& directory) {
    const fs::path target = directory / source.filename();

    std::error_code ec;
    if (fs::exists(target, ec) && fs::equivalent(source, target, ec)) {
        return;
    }

    fs::copy_file(source, target, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("Failed to copy {} into {}: {}",
                                             source.string(), directory.string(), ec.message()));
    }
}

} // namespace

std::string generatePackageIdentifier() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
    return fmt::format("{}", seconds.count());
}

void assemblePackage(const PackageContext& context,
                     const fs::path& file_manifest,
                     const fs::path& retrieval_order) {
    const fs::path directory = context.packageDirectory();

    std::error_code ec;
    fs::create_directories(directory, ec);
    if (ec || !fs::is_directory(directory)) {
        throw std::runtime_error(fmt::format("Failed to create package directory: {} - {}",
                                             directory.string(),
                                             ec ? ec.message() : "not a directory"));
    }

    copyInto(file_manifest, directory);
    copyInto(retrieval_order, directory);

    // workers append to it, so start from an empty log
    fmt::file log{context.logPath().string(), fmt::file::WRONLY | fmt::file::CREATE | fmt::file::TRUNC};
    log.close();
}

std::error_code ensureParentDirectories(const fs::path& path) {
    const fs::path parent = path.parent_path();
    if (parent.empty()) {
        return {};
    }

    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        std::error_code stat_ec;
        if (fs::is_directory(parent, stat_ec)) {
            // another worker created it between our check and mkdir
            return {};
        }
    }
    return ec;
}

} // namespace retriever
