#ifndef SLICECAP_HPP
#define SLICECAP_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "../chunking/boundary_locator.hpp"
#include "../chunking/slice_planner.hpp"
#include "../dispatch/command_template.hpp"
#include "../dispatch/worker_task.hpp"
#include "../include/logging.hpp"
#include "../include/pcap_header.hpp"
#include "../include/source_file.hpp"

// Everything a run needs, with the command line defaults
struct SliceConfig {
    std::string infile;
    size_t slice_count;
    double max_gap_seconds;
    int parallel;                       // worker slots
    uint64_t resync_window;             // 0 = derived from snaplen
    uint64_t gap_window;
    size_t gap_window_records;
    bool verify;                        // walk every record before slicing
    bool dry_run;                       // plan only, spawn nothing
    std::vector<std::string> command_words;
    LogLevel log_level;

    SliceConfig();

    // Throws ConfigError on the first invalid setting
    void validate() const;

    LocatorConfig locator_config() const;
};

// Outcome of a run: the plan, how it was found, and per-slice results
struct RunReport {
    CutResult cuts;
    SlicePlan plan;
    std::vector<WorkerTask> tasks;
    std::vector<TaskResult> results;
    bool dispatched = false;

    std::vector<const TaskResult*> failed_tasks() const;
    bool ok() const { return failed_tasks().empty(); }
};

// Owns the source file and runs locate -> plan -> dispatch.
class Slicecap {
public:
    /**
     * Validate the configuration, parse the command template and read the
     * global header. Throws ConfigError, FormatError or std::system_error.
     */
    explicit Slicecap(const SliceConfig& config);

    const GlobalHeader& global_header() const { return gh_; }
    const SourceFile& source() const { return *file_; }
    uint64_t region_start() const { return GLOBAL_HEADER_SIZE; }
    uint64_t region_end() const { return file_->size(); }

    // Locate cuts and build the plan (and the rendered tasks if a command
    // was given). No process is spawned.
    RunReport plan();

    // plan() followed by dispatching every slice
    RunReport run(SliceDispatcher& dispatcher);

private:
    SliceConfig config_;
    std::unique_ptr<CommandTemplate> command_;
    std::unique_ptr<SourceFile> file_;
    GlobalHeader gh_;
};

#endif // SLICECAP_HPP
