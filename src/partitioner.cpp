#include "retriever/partitioner.hpp"

#include <stdexcept>

namespace retriever {

std::vector<Bucket> partition(const std::vector<RetrievalItem>& items, std::size_t num_workers) {
    if (num_workers == 0) {
        throw std::invalid_argument("number of workers must be at least 1");
    }

    std::vector<Bucket> buckets(num_workers);
    const std::size_t per_bucket = (items.size() + num_workers - 1) / num_workers;
    for (auto& bucket : buckets) {
        bucket.reserve(per_bucket);
    }

    for (std::size_t i = 0; i < items.size(); ++i) {
        buckets[bucketOf(i, num_workers)].push_back(items[i]);
    }
    return buckets;
}

} // namespace retriever
