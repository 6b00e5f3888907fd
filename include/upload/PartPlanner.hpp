#pragma once

#include <cstdint>
#include <vector>

namespace mpupload {

// One planned part: [byteStart, byteEnd)
struct PartRange {
    int partNumber;       // 1-based
    uint64_t byteStart;
    uint64_t byteEnd;     // exclusive

    uint64_t size() const { return byteEnd - byteStart; }

    bool operator==(const PartRange& other) const {
        return partNumber == other.partNumber && byteStart == other.byteStart &&
               byteEnd == other.byteEnd;
    }
};

using PartPlan = std::vector<PartRange>;

class PartPlanner {
public:
    /**
     * Splits [0, totalSize) into contiguous parts of chunkSize bytes, the
     * last one possibly shorter. An empty source yields one empty part [0, 0).
     * @throws std::invalid_argument if chunkSize is 0 or the part count does
     *         not fit a part number
     */
    static PartPlan plan(uint64_t totalSize, uint64_t chunkSize);
};

} // namespace mpupload
