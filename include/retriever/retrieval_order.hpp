#pragma once

#include "retrieval_item.hpp"

#include <cstddef>
#include <filesystem>
#include <istream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace retriever {

class MalformedRetrievalLine : public std::runtime_error {
public:
    MalformedRetrievalLine(std::size_t line_number, const std::string& line, const std::string& reason);

    [[nodiscard]] std::size_t lineNumber() const noexcept { return line_number_; }

private:
    std::size_t line_number_;
};

// Accepts "url filename" (legacy fetch files) or "url size filename".
RetrievalItem parseRetrievalLine(std::string_view line, std::size_t line_number = 1);

// Blank lines are skipped; items keep file order.
std::vector<RetrievalItem> parseRetrievalOrder(std::istream& input);
std::vector<RetrievalItem> readRetrievalOrder(const std::filesystem::path& path);

} // namespace retriever
