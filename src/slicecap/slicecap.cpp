#include "slicecap.hpp"

#include <algorithm>
#include <chrono>
#include <thread>

#include "../chunking/record_chain.hpp"
#include "../include/errors.hpp"

SliceConfig::SliceConfig()
    : slice_count(2)
    , max_gap_seconds(3600.0)
    , parallel(std::max(1, static_cast<int>(std::thread::hardware_concurrency())))
    , resync_window(0)
    , gap_window(256 * 1024)
    , gap_window_records(4096)
    , verify(false)
    , dry_run(false)
    , log_level(LogLevel::INFO) {}

void SliceConfig::validate() const {
    if (infile.empty()) throw ConfigError("no input file given (--infile)");
    if (slice_count < 1) throw ConfigError("number of slices must be at least 1");
    if (parallel <= 0) throw ConfigError("parallelism must be at least 1");
    if (!(max_gap_seconds >= 0.0)) throw ConfigError("maximum gap must be a non-negative number of seconds");
    if (gap_window_records == 0) throw ConfigError("gap search needs at least one record");
    if (command_words.empty() && !dry_run) throw ConfigError("no command given");
}

LocatorConfig SliceConfig::locator_config() const {
    LocatorConfig lc;
    lc.max_gap_seconds = max_gap_seconds;
    lc.resync_window = resync_window;
    lc.gap_window = gap_window;
    lc.gap_window_records = gap_window_records;
    return lc;
}

std::vector<const TaskResult*> RunReport::failed_tasks() const {
    std::vector<const TaskResult*> failed;
    for (const auto& r : results) {
        if (!r.ok()) failed.push_back(&r);
    }
    return failed;
}

Slicecap::Slicecap(const SliceConfig& config) : config_(config) {
    config_.validate();

    // A bad template must fail before we even look at the capture
    if (!config_.command_words.empty()) {
        command_.reset(new CommandTemplate(CommandTemplate::from_words(config_.command_words)));
    }

    file_.reset(new SourceFile(config_.infile));

    uint8_t buf[GLOBAL_HEADER_SIZE];
    size_t got = file_->read_at(0, buf, sizeof(buf));
    gh_ = parse_global_header(buf, got);

    LOG_DEBUG("%s: %llu bytes, pcap %u.%u, %s-endian, %s timestamps, snaplen %u, linktype %u",
              config_.infile.c_str(), static_cast<unsigned long long>(file_->size()),
              gh_.version_major, gh_.version_minor,
              gh_.order == ByteOrder::Little ? "little" : "big",
              gh_.resolution == TsResolution::Nano ? "ns" : "us",
              gh_.snaplen, gh_.network);
}

RunReport Slicecap::plan() {
    using Clock = std::chrono::steady_clock;
    auto t1 = Clock::now();

    RunReport report;
    BoundaryLocator locator(*file_, gh_, region_start(), region_end(), config_.locator_config());
    locator.validate_first_record();

    if (config_.verify) {
        uint64_t records = verify_record_chain(*file_, gh_, region_start(), region_end());
        LOG_INFO("verified %llu records in %s", static_cast<unsigned long long>(records), config_.infile.c_str());
    }

    report.cuts = locator.locate_cuts(config_.slice_count);
    report.plan = plan_slices(report.cuts.cuts, region_start(), region_end());

    // Only the last slice can end inside a cut-off record; --verify already walked it
    if (!config_.verify) {
        const SliceInfo& last = report.plan.back();
        uint64_t records = verify_record_chain(*file_, gh_, last.offset, last.end());
        LOG_DEBUG("last slice holds %llu complete records", static_cast<unsigned long long>(records));
    }

    if (report.cuts.degraded) {
        LOG_WARN("could only find %zu distinct slice boundaries, using %zu slices instead of %zu",
                 report.cuts.cuts.size(), report.cuts.effective_slices, report.cuts.requested_slices);
    }
    if (report.cuts.non_monotonic > 0) {
        LOG_WARN("%zu non-monotonic timestamps seen near slice boundaries; the capture may be merged or damaged",
                 report.cuts.non_monotonic);
    }

    for (const auto& slice : report.plan) {
        LOG_INFO("[PLAN] slice %d offset=%llu size=%llu", slice.slice_id,
                 static_cast<unsigned long long>(slice.offset),
                 static_cast<unsigned long long>(slice.size));
    }

    if (command_) report.tasks = build_tasks(report.plan, *command_);

    std::chrono::duration<double> planning = Clock::now() - t1;
    LOG_INFO("[TIMING] planning: %.3f s (%zu gap searches, %zu cuts on idle gaps)",
             planning.count(), report.cuts.gap_searches, report.cuts.gap_cuts);
    return report;
}

RunReport Slicecap::run(SliceDispatcher& dispatcher) {
    if (!command_) throw ConfigError("no command given");

    RunReport report = plan();

    LOG_INFO("dispatching %zu slices with %s", report.tasks.size(), dispatcher.name());
    report.results = dispatcher.dispatch(report.tasks, *file_, gh_);
    report.dispatched = true;

    auto failed = report.failed_tasks();
    if (!failed.empty()) {
        LOG_ERROR("%zu of %zu slices failed:", failed.size(), report.results.size());
        for (const auto* r : failed) {
            LOG_ERROR("  %s", r->describe().c_str());
        }
    }
    return report;
}
