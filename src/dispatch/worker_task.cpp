#include "worker_task.hpp"

#include <algorithm>
#include <cstring>
#include <memory>
#include <system_error>

#include "../include/errors.hpp"
#include "../include/logging.hpp"
#include "subprocess.hpp"

std::string TaskResult::describe() const {
    std::string out = "slice " + std::to_string(slice_id) +
                      " (offset=" + std::to_string(offset) + ", size=" + std::to_string(size) + "): ";
    if (!error.empty()) {
        out += error;
        if (exit_code > 0) out += ", exit status " + std::to_string(exit_code);
    } else if (signal != 0) {
        out += "killed by signal " + std::to_string(signal) + " (" + strsignal(signal) + ")";
    } else if (exit_code != 0) {
        out += "exit status " + std::to_string(exit_code);
    } else {
        out += "ok";
    }
    return out;
}

std::vector<WorkerTask> build_tasks(const SlicePlan& plan, const CommandTemplate& command) {
    std::vector<WorkerTask> tasks;
    tasks.reserve(plan.size());
    for (const auto& slice : plan) {
        tasks.push_back({slice, command.render(slice.offset, slice.size, slice.slice_id)});
    }
    return tasks;
}

namespace {

// Header first, then the slice in bounded chunks read at explicit offsets
void stream_slice(Subprocess& proc, const SliceInfo& slice, const SourceFile& file,
                  const GlobalHeader& gh, size_t chunk_size, uint64_t& written) {
    proc.write_stdin(gh.raw.data(), gh.raw.size());
    written += gh.raw.size();

    std::vector<char> buffer(std::max<size_t>(chunk_size, 1));
    uint64_t offset = slice.offset;
    uint64_t left = slice.size;
    while (left > 0) {
        size_t want = static_cast<size_t>(std::min<uint64_t>(left, buffer.size()));
        size_t got = file.read_at(offset, buffer.data(), want);
        if (got != want) {
            throw FormatError(FormatErrorKind::TruncatedRead,
                              "source file ended at offset " + std::to_string(offset + got) +
                              " while streaming slice " + std::to_string(slice.slice_id));
        }
        proc.write_stdin(buffer.data(), got);
        written += got;
        offset += got;
        left -= got;
    }
}

} // namespace

TaskResult run_worker_task(const WorkerTask& task, const SourceFile& file, const GlobalHeader& gh,
                           size_t chunk_size) {
    TaskResult result;
    result.slice_id = task.slice.slice_id;
    result.offset = task.slice.offset;
    result.size = task.slice.size;
    result.command = task.command;

    std::unique_ptr<Subprocess> proc;
    try {
        proc.reset(new Subprocess(task.command));
    } catch (const std::system_error& e) {
        result.error = std::string("spawn failed: ") + e.what();
        return result;
    }

    LOG_DEBUG("[SLICE %d] pid %d streaming %llu bytes from offset %llu",
              result.slice_id, static_cast<int>(proc->pid()),
              static_cast<unsigned long long>(result.size),
              static_cast<unsigned long long>(result.offset));

    uint64_t expected = gh.raw.size() + task.slice.size;
    try {
        stream_slice(*proc, task.slice, file, gh, chunk_size, result.bytes_streamed);
    } catch (const std::exception& e) {
        // keep going: the child still has to be reaped
        result.error = std::string("streaming stopped after ") + std::to_string(result.bytes_streamed) +
                       " of " + std::to_string(expected) + " bytes: " + e.what();
    }

    try {
        ExitStatus status = proc->wait();
        result.exit_code = status.exit_code;
        result.signal = status.signal;
    } catch (const std::system_error& e) {
        if (result.error.empty()) result.error = e.what();
    }
    return result;
}
