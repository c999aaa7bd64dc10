#pragma once

#include <filesystem>
#include <string>

namespace retriever::detail {

void ensureCurlInitialized();

// Quiet fetch of url into destination (redirects followed, HTTP errors
// fail). Returns the CURLcode; CURLE_WRITE_ERROR when destination cannot be
// written.
int fetchToFile(const std::string& url, const std::filesystem::path& destination);

} // namespace retriever::detail
