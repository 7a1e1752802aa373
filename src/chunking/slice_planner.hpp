#ifndef SLICE_PLANNER_HPP
#define SLICE_PLANNER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

// One contiguous byte range of the record region
struct SliceInfo {
    int slice_id;
    uint64_t offset;   // absolute position in the source file
    uint64_t size;     // bytes

    SliceInfo(int id, uint64_t off, uint64_t len)
        : slice_id(id), offset(off), size(len) {}

    uint64_t end() const { return offset + size; }

    bool operator==(const SliceInfo& other) const {
        return slice_id == other.slice_id && offset == other.offset && size == other.size;
    }
};

using SlicePlan = std::vector<SliceInfo>;

/**
 * Turn ordered cut points into slices covering [region_start, region_end)
 * exactly once.
 *
 * @param cuts Strictly increasing offsets, each inside (region_start, region_end).
 * @return cuts.size() + 1 slices with ids 0, 1, ...
 * @throws std::invalid_argument if the cuts break that ordering.
 */
SlicePlan plan_slices(const std::vector<uint64_t>& cuts, uint64_t region_start, uint64_t region_end);

#endif // SLICE_PLANNER_HPP
