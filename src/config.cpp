#include "retriever/config.hpp"

#include <charconv>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

namespace retriever {

namespace {

std::size_t parseWorkerCount(std::string_view raw) {
    std::size_t count = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), count);
    if (ec != std::errc{} || ptr != raw.data() + raw.size()) {
        throw ConfigurationError(fmt::format("Invalid number of processes: {}", raw));
    }
    if (count == 0) {
        throw ConfigurationError("Number of processes must be at least 1");
    }
    return count;
}

} // namespace

std::string usage(const std::string& program_name) {
    return fmt::format(
        "Usage: {} -m <manifest> -r <retrieval-order> [options]\n"
        "Options:\n"
        "  -n, --number-of-processes <N>   Number of concurrent retrievers (default: 16)\n"
        "  -i, --package-identifier <id>   Package name (default: seconds since epoch)\n"
        "  -m, --file-manifest <path>      File manifest that defines the package\n"
        "  -r, --retrieval-order <path>    Retrieval order (fetch.txt) for the package\n"
        "  -d, --destination-path <path>   Directory in which to create the package\n"
        "                                  (default: current directory)\n"
        "  -h, --help                      Show this message\n",
        program_name);
}

Config parseCommandLine(int argc, const char* const* argv) {
    Config config;

    int arg_index = 1;
    while (arg_index < argc) {
        const std::string option = argv[arg_index];

        if (option == "-h" || option == "--help") {
            config.show_help = true;
            return config;
        }

        if (arg_index + 1 >= argc) {
            throw ConfigurationError(fmt::format("Missing value for option {}", option));
        }
        const std::string value = argv[arg_index + 1];

        if (option == "-n" || option == "--number-of-processes") {
            config.num_workers = parseWorkerCount(value);
        } else if (option == "-i" || option == "--package-identifier") {
            if (value.empty()) {
                throw ConfigurationError("Package identifier cannot be empty");
            }
            config.package_identifier = value;
        } else if (option == "-m" || option == "--file-manifest") {
            config.file_manifest = value;
        } else if (option == "-r" || option == "--retrieval-order") {
            config.retrieval_order = value;
        } else if (option == "-d" || option == "--destination-path") {
            config.destination_path = std::filesystem::path{value};
        } else {
            throw ConfigurationError(fmt::format("Unknown option: {}", option));
        }
        arg_index += 2;
    }

    if (config.file_manifest.empty()) {
        throw ConfigurationError("Supply a file manifest with -m.");
    }
    if (config.retrieval_order.empty()) {
        throw ConfigurationError("Supply a retrieval order with -r.");
    }

    return config;
}

} // namespace retriever
