#include "retriever/retrieval_order.hpp"

#include <charconv>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace retriever {

namespace {

std::vector<std::string> splitTokens(std::string_view line) {
    std::vector<std::string> tokens;
    std::istringstream stream{std::string{line}};
    std::string token;
    while (stream >> token) {
        tokens.push_back(std::move(token));
    }
    return tokens;
}

bool isBlank(std::string_view line) {
    return line.find_first_not_of(" \t\r\n\v\f") == std::string_view::npos;
}

// Payload names are relative to the package directory and must stay inside it.
bool isContainedName(const std::string& name) {
    const std::filesystem::path path{name};
    if (path.has_root_path()) {
        return false;
    }
    for (const auto& part : path) {
        if (part == "..") {
            return false;
        }
    }
    const std::filesystem::path normal = path.lexically_normal();
    return !normal.empty() && normal != ".";
}

RetrievalItem makeItem(std::string url, std::optional<std::uint64_t> size, std::string name,
                       std::string_view line, std::size_t line_number) {
    if (!isContainedName(name)) {
        throw MalformedRetrievalLine(line_number, std::string{line},
                                     fmt::format("destination '{}' leaves the package directory", name));
    }
    return {std::move(url), size, std::move(name)};
}

} // namespace

MalformedRetrievalLine::MalformedRetrievalLine(std::size_t line_number,
                                               const std::string& line,
                                               const std::string& reason)
    : std::runtime_error(fmt::format("malformed retrieval order line {}: {} ('{}')",
                                     line_number, reason, line)),
      line_number_(line_number) {}

RetrievalItem parseRetrievalLine(std::string_view line, std::size_t line_number) {
    auto tokens = splitTokens(line);

    if (tokens.size() == 2) {
        return makeItem(std::move(tokens[0]), std::nullopt, std::move(tokens[1]), line, line_number);
    }

    if (tokens.size() == 3) {
        const std::string& size_token = tokens[1];
        std::uint64_t size = 0;
        const auto* first = size_token.data();
        const auto* last = size_token.data() + size_token.size();
        const auto [ptr, ec] = std::from_chars(first, last, size);
        if (ec != std::errc{} || ptr != last) {
            throw MalformedRetrievalLine(line_number, std::string{line},
                                         fmt::format("invalid size '{}'", size_token));
        }
        return makeItem(std::move(tokens[0]), size, std::move(tokens[2]), line, line_number);
    }

    throw MalformedRetrievalLine(line_number, std::string{line},
                                 fmt::format("expected 2 or 3 fields, got {}", tokens.size()));
}

std::vector<RetrievalItem> parseRetrievalOrder(std::istream& input) {
    std::vector<RetrievalItem> items;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        if (isBlank(line)) {
            continue;
        }
        items.push_back(parseRetrievalLine(line, line_number));
    }
    return items;
}

std::vector<RetrievalItem> readRetrievalOrder(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw std::runtime_error("Cannot open retrieval order: " + path.string());
    }
    return parseRetrievalOrder(input);
}

} // namespace retriever
