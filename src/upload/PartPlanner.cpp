#include "upload/PartPlanner.hpp"

#include <algorithm>
#include <limits>
#include <string>
#include <stdexcept>

namespace mpupload {

PartPlan PartPlanner::plan(uint64_t totalSize, uint64_t chunkSize) {
    if (chunkSize == 0) {
        throw std::invalid_argument("chunkSize must be > 0");
    }

    PartPlan parts;

    // The empty object is still uploaded as a single empty part
    if (totalSize == 0) {
        parts.push_back({1, 0, 0});
        return parts;
    }

    uint64_t count = totalSize / chunkSize + (totalSize % chunkSize != 0 ? 1 : 0);
    if (count > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
        throw std::invalid_argument("Part count " + std::to_string(count) +
                                    " exceeds the part number range");
    }
    parts.reserve(static_cast<size_t>(count));

    uint64_t offset = 0;
    int partNumber = 1;
    while (offset < totalSize) {
        uint64_t end = offset + std::min(chunkSize, totalSize - offset);
        parts.push_back({partNumber++, offset, end});
        offset = end;
    }

    return parts;
}

} // namespace mpupload
