#ifndef WORKER_TASK_HPP
#define WORKER_TASK_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "../chunking/slice_planner.hpp"
#include "../include/pcap_header.hpp"
#include "../include/source_file.hpp"
#include "command_template.hpp"

constexpr size_t STREAM_CHUNK_SIZE = 64 * 1024;

// A planned slice bound to its rendered command
struct WorkerTask {
    SliceInfo slice;
    std::string command;
};

struct TaskResult {
    int slice_id = -1;
    uint64_t offset = 0;
    uint64_t size = 0;
    std::string command;
    uint64_t bytes_streamed = 0;   // including the global header
    int exit_code = -1;
    int signal = 0;
    std::string error;             // spawn or streaming failure

    bool ok() const { return error.empty() && signal == 0 && exit_code == 0; }

    // One line summary for the final report
    std::string describe() const;
};

// Render every command of the plan. Nothing is spawned here.
std::vector<WorkerTask> build_tasks(const SlicePlan& plan, const CommandTemplate& command);

/**
 * Run one slice: spawn its command, stream the global header followed by
 * the slice bytes into the child's stdin, close it and wait for exit.
 *
 * Never throws; every failure ends up in the returned TaskResult.
 */
TaskResult run_worker_task(const WorkerTask& task, const SourceFile& file, const GlobalHeader& gh,
                           size_t chunk_size = STREAM_CHUNK_SIZE);

// The worker pool seam: runs tasks with bounded parallelism and returns
// one result per task, indexed like the input.
class SliceDispatcher {
public:
    virtual ~SliceDispatcher() = default;
    virtual std::vector<TaskResult> dispatch(const std::vector<WorkerTask>& tasks,
                                             const SourceFile& file,
                                             const GlobalHeader& gh) = 0;
    virtual const char* name() const = 0;
};

#endif // WORKER_TASK_HPP
