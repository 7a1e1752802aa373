#ifndef OPENMP_SLICE_DISPATCHER_H
#define OPENMP_SLICE_DISPATCHER_H

#include <vector>

#include "../dispatch/worker_task.hpp"

// Runs slice workers on an OpenMP thread team. Each thread is one worker
// slot: it claims the next pending slice (dynamic schedule), spawns the
// command and streams the slice itself.
class OpenMPDispatcher : public SliceDispatcher {
public:
    // num_threads == 0 means omp_get_max_threads()
    explicit OpenMPDispatcher(int num_threads = 0);

    std::vector<TaskResult> dispatch(const std::vector<WorkerTask>& tasks,
                                     const SourceFile& file,
                                     const GlobalHeader& gh) override;

    const char* name() const override { return "openmp"; }
    int num_threads() const { return num_threads_; }

private:
    int num_threads_;
};

#endif
