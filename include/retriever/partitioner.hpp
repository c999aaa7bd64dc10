#pragma once

#include "retrieval_item.hpp"

#include <cstddef>
#include <vector>

namespace retriever {

[[nodiscard]] constexpr std::size_t bucketOf(std::size_t index, std::size_t num_workers) {
    return index % num_workers;
}

// Round-robin split into exactly num_workers buckets. Throws
// std::invalid_argument when num_workers is zero.
std::vector<Bucket> partition(const std::vector<RetrievalItem>& items, std::size_t num_workers);

} // namespace retriever
