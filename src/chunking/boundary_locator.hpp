#ifndef BOUNDARY_LOCATOR_HPP
#define BOUNDARY_LOCATOR_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../include/pcap_header.hpp"
#include "../include/source_file.hpp"
#include "record_chain.hpp"

struct LocatorConfig {
    double max_gap_seconds;      // idle gap needed to move a cut
    uint64_t resync_window;      // bytes scanned from a target, 0 = derive from snaplen
    uint64_t gap_window;         // bytes searched on each side of a target
    size_t gap_window_records;   // record cap for one gap walk
    int lookahead_records;       // followers checked during resynchronization

    LocatorConfig()
        : max_gap_seconds(3600.0)
        , resync_window(0)
        , gap_window(256 * 1024)
        , gap_window_records(4096)
        , lookahead_records(3) {}
};

struct CutResult {
    std::vector<uint64_t> cuts;   // strictly increasing, inside (region_start, region_end)
    size_t requested_slices = 0;
    size_t effective_slices = 0;
    bool degraded = false;        // some cuts collapsed
    size_t gap_searches = 0;      // targets that went through the gap search
    size_t gap_cuts = 0;          // cuts moved onto an idle gap
    size_t non_monotonic = 0;     // negative deltas seen while searching
};

// Finds the interior cut points of a capture's record region.
class BoundaryLocator {
public:
    BoundaryLocator(const SourceFile& file, const GlobalHeader& gh,
                    uint64_t region_start, uint64_t region_end,
                    const LocatorConfig& config = LocatorConfig());

    /**
     * Compute up to slice_count - 1 cut points.
     *
     * Each evenly spaced target is resynchronized onto a record boundary,
     * then moved to the largest inter-packet gap near it when that gap is at
     * least max_gap_seconds. Cuts that collapse onto each other or onto the
     * region bounds are dropped and reported through CutResult::degraded.
     *
     * @throws ConfigError if slice_count < 1.
     * @throws FormatError BoundaryNotFound if no record boundary is found
     *         within the resync window of a target.
     */
    CutResult locate_cuts(size_t slice_count);

    /**
     * First record boundary at or after `target`, or region_end when no
     * complete record header fits after it.
     */
    uint64_t resync(uint64_t target);

    /**
     * Check the record at the region start and its followers. Fatal when the
     * capture is truncated or corrupt right after the global header.
     */
    void validate_first_record();

    uint64_t resync_window() const { return resync_window_; }

private:
    struct GapChoice {
        uint64_t offset;   // second record of the widest pair, 0 if none
        int64_t delta_ns;  // magnitude of that gap
    };

    GapChoice widest_gap_near(uint64_t target, uint64_t resynced, CutResult& result);

    const SourceFile& file_;
    const GlobalHeader& gh_;
    uint64_t region_start_;
    uint64_t region_end_;
    LocatorConfig config_;
    uint64_t resync_window_;
    RecordReader reader_;
};

/**
 * Convenience wrapper: locate cuts with default windows and the given gap
 * threshold.
 */
CutResult locate_cuts(const SourceFile& file, const GlobalHeader& gh,
                      uint64_t region_start, uint64_t region_end,
                      size_t slice_count, double max_gap_seconds);

#endif // BOUNDARY_LOCATOR_HPP
