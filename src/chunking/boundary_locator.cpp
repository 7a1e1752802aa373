#include <algorithm>
#include <cmath>
#include <deque>
#include <limits>
#include <string>

#include "boundary_locator.hpp"
#include "../include/errors.hpp"
#include "../include/logging.hpp"

namespace {

// Margin added to the largest possible record when sizing the resync window
constexpr uint64_t RESYNC_MARGIN = 1024;

uint64_t derive_resync_window(const GlobalHeader& gh, const LocatorConfig& config) {
    if (config.resync_window > 0) return config.resync_window;
    // One full record (header + snaplen) must fit so the scan cannot
    // start inside a record and leave the window before the next one
    return RECORD_HEADER_SIZE + gh.effective_snaplen() + RESYNC_MARGIN;
}

size_t reader_block_size(const GlobalHeader& gh, const LocatorConfig& config, uint64_t window) {
    // Large enough that a byte-by-byte scan over the window plus the
    // lookahead chain of its last candidate never needs to refill backwards
    uint64_t max_record = RECORD_HEADER_SIZE + gh.effective_snaplen();
    uint64_t span = window + static_cast<uint64_t>(config.lookahead_records + 1) * max_record;
    return static_cast<size_t>(std::max<uint64_t>(span, 256 * 1024));
}

} // namespace

BoundaryLocator::BoundaryLocator(const SourceFile& file, const GlobalHeader& gh,
                                 uint64_t region_start, uint64_t region_end,
                                 const LocatorConfig& config)
    : file_(file), gh_(gh),
      region_start_(region_start), region_end_(region_end),
      config_(config),
      resync_window_(derive_resync_window(gh, config)),
      reader_(file, gh, region_end, reader_block_size(gh, config, resync_window_)) {}

void BoundaryLocator::validate_first_record() {
    if (region_start_ >= region_end_) return; // header-only capture

    switch (check_chain(reader_, region_start_, config_.lookahead_records)) {
        case ChainStatus::Consistent:
            return;
        case ChainStatus::Truncated:
            throw FormatError(FormatErrorKind::TruncatedRead,
                              "records after the global header of " + file_.path() + " are cut off (region " +
                              std::to_string(region_start_) + ".." + std::to_string(region_end_) + ")");
        default:
            throw FormatError(FormatErrorKind::CorruptRecord,
                              "no valid record header right after the global header of " + file_.path());
    }
}

uint64_t BoundaryLocator::resync(uint64_t target) {
    uint64_t limit = std::min(region_end_, target + resync_window_);

    for (uint64_t off = target; off < limit; ++off) {
        // nothing after this point can hold a full record header
        if (off + RECORD_HEADER_SIZE > region_end_) return region_end_;

        if (check_chain(reader_, off, config_.lookahead_records) == ChainStatus::Consistent) {
            LOG_TRACE("resync: target %llu -> record at %llu (+%llu)",
                      static_cast<unsigned long long>(target),
                      static_cast<unsigned long long>(off),
                      static_cast<unsigned long long>(off - target));
            return off;
        }
    }

    if (limit == region_end_) return region_end_;

    throw FormatError(FormatErrorKind::BoundaryNotFound,
                      "could not find a pcap record header within " + std::to_string(resync_window_) +
                      " bytes after offset " + std::to_string(target));
}

BoundaryLocator::GapChoice BoundaryLocator::widest_gap_near(uint64_t target, uint64_t resynced,
                                                            CutResult& result) {
    ++result.gap_searches;

    // Start the walk on a boundary before the target so that the pair
    // straddling the target is part of the search
    uint64_t start = resynced;
    if (target <= region_start_ + config_.gap_window) {
        start = region_start_;
    } else {
        try {
            start = std::min(resync(target - config_.gap_window), resynced);
        } catch (const FormatError& e) {
            LOG_DEBUG("gap search for target %llu starts at the target itself: %s",
                      static_cast<unsigned long long>(target), e.what());
        }
    }

    const uint64_t stop = std::min(region_end_, target + config_.gap_window);

    // The record budget is split around the target: at most half of it on
    // pairs ending at or before the resynced boundary (the newest ones win),
    // the rest on pairs after it
    const size_t back_budget = config_.gap_window_records / 2;
    std::deque<GapChoice> behind;
    std::vector<GapChoice> ahead;

    bool have_prev = false;
    int64_t prev_ts = 0;
    size_t walked = 0;
    uint64_t off = start;

    while (off < region_end_) {
        RecordHeader rh;
        if (!reader_.header_at(off, rh) || !rh.plausible(gh_)) break;
        uint64_t next = off + rh.total_size();
        if (next > region_end_) break;

        int64_t ts = rh.timestamp_ns(gh_.resolution);
        if (have_prev) {
            GapChoice pair{off, ts - prev_ts};
            if (off <= resynced) {
                behind.push_back(pair);
                if (behind.size() > back_budget) behind.pop_front();
            } else {
                if (behind.size() + ahead.size() >= config_.gap_window_records) break;
                ahead.push_back(pair);
            }
        }
        prev_ts = ts;
        have_prev = true;
        ++walked;

        if (off >= stop) break;
        off = next;
    }

    GapChoice best{0, -1};
    auto consider = [&](const GapChoice& pair) {
        if (pair.delta_ns < 0) {
            ++result.non_monotonic;
            LOG_DEBUG("timestamp goes back %lld ns at offset %llu",
                      static_cast<long long>(-pair.delta_ns), static_cast<unsigned long long>(pair.offset));
        }
        int64_t magnitude = pair.delta_ns < 0 ? -pair.delta_ns : pair.delta_ns;
        if (magnitude > best.delta_ns) {
            best.delta_ns = magnitude;
            best.offset = pair.offset;
        }
    };
    for (const auto& pair : behind) consider(pair);
    for (const auto& pair : ahead) consider(pair);

    LOG_TRACE("gap search around %llu: %zu records from %llu, widest gap %lld ns at %llu",
              static_cast<unsigned long long>(target), walked,
              static_cast<unsigned long long>(start),
              static_cast<long long>(best.delta_ns),
              static_cast<unsigned long long>(best.offset));
    return best;
}

CutResult BoundaryLocator::locate_cuts(size_t slice_count) {
    if (slice_count < 1) throw ConfigError("slice count must be at least 1");

    CutResult result;
    result.requested_slices = slice_count;

    const uint64_t region_len = region_end_ - region_start_;
    // thresholds beyond ~292 years can never be met
    const int64_t max_gap_ns = config_.max_gap_seconds >= 9.2e9
        ? std::numeric_limits<int64_t>::max()
        : static_cast<int64_t>(std::llround(config_.max_gap_seconds * 1e9));

    std::vector<uint64_t> raw;
    raw.reserve(slice_count - 1);

    for (size_t k = 1; k < slice_count; ++k) {
        // region_len * k / slice_count without overflowing
        uint64_t target = region_start_ + (region_len / slice_count) * k +
                          (region_len % slice_count) * k / slice_count;

        uint64_t resynced = resync(target);
        if (resynced >= region_end_) {
            LOG_DEBUG("target %zu at %llu: no record boundary after it",
                      k, static_cast<unsigned long long>(target));
            continue;
        }

        uint64_t cut = resynced;
        GapChoice gap = widest_gap_near(target, resynced, result);
        if (gap.delta_ns >= 0 && gap.offset > region_start_ && gap.delta_ns >= max_gap_ns) {
            cut = gap.offset;
            ++result.gap_cuts;
            LOG_DEBUG("target %zu at %llu: cut moved to idle gap of %.6f s at %llu",
                      k, static_cast<unsigned long long>(target),
                      static_cast<double>(gap.delta_ns) / 1e9,
                      static_cast<unsigned long long>(cut));
        } else {
            LOG_DEBUG("target %zu at %llu: cut at record boundary %llu",
                      k, static_cast<unsigned long long>(target),
                      static_cast<unsigned long long>(cut));
        }
        raw.push_back(cut);
    }

    // Collapse duplicates and anything sitting on the region bounds
    std::sort(raw.begin(), raw.end());
    raw.erase(std::unique(raw.begin(), raw.end()), raw.end());
    for (uint64_t cut : raw) {
        if (cut > region_start_ && cut < region_end_) result.cuts.push_back(cut);
    }

    result.effective_slices = result.cuts.size() + 1;
    result.degraded = result.effective_slices < slice_count;
    return result;
}

CutResult locate_cuts(const SourceFile& file, const GlobalHeader& gh,
                      uint64_t region_start, uint64_t region_end,
                      size_t slice_count, double max_gap_seconds) {
    LocatorConfig config;
    config.max_gap_seconds = max_gap_seconds;
    BoundaryLocator locator(file, gh, region_start, region_end, config);
    return locator.locate_cuts(slice_count);
}
