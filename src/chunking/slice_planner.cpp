#include "slice_planner.hpp"

#include <stdexcept>
#include <string>

SlicePlan plan_slices(const std::vector<uint64_t>& cuts, uint64_t region_start, uint64_t region_end) {
    if (region_end < region_start)
        throw std::invalid_argument("record region ends before it starts");

    SlicePlan plan;
    plan.reserve(cuts.size() + 1);

    uint64_t slice_start = region_start;
    for (uint64_t cut : cuts) {
        if (cut <= slice_start || cut >= region_end) {
            throw std::invalid_argument("cut point " + std::to_string(cut) +
                                        " is out of order or outside the record region");
        }
        plan.emplace_back(static_cast<int>(plan.size()), slice_start, cut - slice_start);
        slice_start = cut;
    }

    // last slice runs to the end of the file
    plan.emplace_back(static_cast<int>(plan.size()), slice_start, region_end - slice_start);
    return plan;
}
