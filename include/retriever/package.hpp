#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <system_error>

namespace retriever {

inline constexpr const char* kRetrievalLogName = "retrieval.log";

struct PackageContext {
    std::string package_identifier;
    std::filesystem::path destination_path;
    std::size_t num_workers{16};

    [[nodiscard]] std::filesystem::path packageDirectory() const {
        return destination_path / package_identifier;
    }

    [[nodiscard]] std::filesystem::path logPath() const {
        return packageDirectory() / kRetrievalLogName;
    }
};

// Seconds since the epoch, as a decimal string. Unique only at one-second
// granularity.
std::string generatePackageIdentifier();

// Creates the package directory if absent, copies the manifest and the
// retrieval order into it and truncates retrieval.log. Throws
// std::runtime_error on failure.
void assemblePackage(const PackageContext& context,
                     const std::filesystem::path& file_manifest,
                     const std::filesystem::path& retrieval_order);

// Creates the parent directories of path. A directory that already exists,
// including one created concurrently by another worker, is not an error.
[[nodiscard]] std::error_code ensureParentDirectories(const std::filesystem::path& path);

} // namespace retriever
