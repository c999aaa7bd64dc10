#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>

namespace retriever {

class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    std::size_t num_workers{16};
    std::optional<std::string> package_identifier;
    std::filesystem::path file_manifest;
    std::filesystem::path retrieval_order;
    std::optional<std::filesystem::path> destination_path;
    bool show_help{false};
};

// Throws ConfigurationError on unknown options, missing values, an invalid
// worker count or a missing manifest / retrieval order.
Config parseCommandLine(int argc, const char* const* argv);

std::string usage(const std::string& program_name);

} // namespace retriever
