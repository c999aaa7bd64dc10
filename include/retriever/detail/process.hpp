#pragma once

#include <string>
#include <vector>

namespace retriever::detail {

inline constexpr int kSpawnFailedExitCode = 127;

// Spawns program (looked up on PATH) with the current environment and waits
// for it. Returns the exit status, 128 + signal for a killed child, or
// kSpawnFailedExitCode if it could not be started.
int spawnAndWait(const std::string& program, const std::vector<std::string>& args);

} // namespace retriever::detail
