#ifndef FASTFLOW_SLICE_DISPATCHER_HPP
#define FASTFLOW_SLICE_DISPATCHER_HPP

#include <ff/ff.hpp>
#include <ff/farm.hpp>
#include <ff/utils.hpp>
#include <algorithm>
#include <stdexcept>
#include <thread>
#include <vector>

#include "../dispatch/subprocess.hpp"
#include "../dispatch/worker_task.hpp"
#include "../include/logging.hpp"

using namespace ff;

// ------------------------
// FastFlow Node: Slice Emitter
// ------------------------
// Sends every planned slice to the farm, in slice order
class SliceEmitter : public ff_node {
private:
    const std::vector<WorkerTask>& tasks_;

public:
    explicit SliceEmitter(const std::vector<WorkerTask>& tasks) : tasks_(tasks) {}

    void* svc(void*) override {
        for (const auto& task : tasks_) {
            ff_send_out(const_cast<WorkerTask*>(&task));
        }
        return EOS;
    }
};

// ------------------------
// FastFlow Node: Slice Worker
// ------------------------
// One worker slot: spawns the slice command and streams the slice into it
class SliceWorker : public ff_node {
private:
    const SourceFile& file_;
    const GlobalHeader& gh_;

public:
    SliceWorker(const SourceFile& file, const GlobalHeader& gh) : file_(file), gh_(gh) {}

    void* svc(void* task_ptr) override {
        auto* task = static_cast<WorkerTask*>(task_ptr);
        return new TaskResult(run_worker_task(*task, file_, gh_));
    }
};

// ------------------------
// FastFlow Node: Result Collector
// ------------------------
// Puts results back in slice order, whatever order they complete in
class ResultCollector : public ff_node {
private:
    std::vector<TaskResult>& results_;
    size_t finished_ = 0;

public:
    explicit ResultCollector(std::vector<TaskResult>& results) : results_(results) {}

    void* svc(void* task_ptr) override {
        auto* result = static_cast<TaskResult*>(task_ptr);
        ++finished_;
        if (result->ok()) {
            LOG_INFO("[SLICE %d] done (%zu/%zu), %llu bytes streamed",
                     result->slice_id, finished_, results_.size(),
                     static_cast<unsigned long long>(result->bytes_streamed));
        } else {
            LOG_ERROR("[SLICE %d] failed (%zu/%zu): %s",
                      result->slice_id, finished_, results_.size(), result->describe().c_str());
        }
        results_[static_cast<size_t>(result->slice_id)] = std::move(*result);
        delete result;
        return GO_ON;
    }
};

// ------------------------
// FastFlowDispatcher
// ------------------------
// Emitter -> num_workers slice workers -> collector. On-demand scheduling
// hands a slice to whichever worker is free, so a slow command only holds
// up its own slot.
class FastFlowDispatcher : public SliceDispatcher {
private:
    int num_workers_;

public:
    explicit FastFlowDispatcher(int num_workers) : num_workers_(num_workers) {
        if (num_workers_ <= 0) num_workers_ = std::max(1, static_cast<int>(std::thread::hardware_concurrency()));
        ignore_sigpipe();
    }

    std::vector<TaskResult> dispatch(const std::vector<WorkerTask>& tasks,
                                     const SourceFile& file,
                                     const GlobalHeader& gh) override {
        std::vector<TaskResult> results(tasks.size());
        if (tasks.empty()) return results;

        ff::ffTime(ff::START_TIME);

        SliceEmitter emitter(tasks);
        ResultCollector collector(results);

        std::vector<ff_node*> workers_v;
        for (int i = 0; i < num_workers_; ++i) {
            workers_v.push_back(new SliceWorker(file, gh));
        }

        ff_farm farm;
        farm.add_emitter(&emitter);
        farm.add_workers(workers_v);
        farm.add_collector(&collector);
        farm.set_scheduling_ondemand();
        farm.cleanup_workers();

        if (farm.run_and_wait_end() < 0) {
            throw std::runtime_error("FastFlow farm execution failed");
        }

        double elapsed_ms = ff::ffTime(ff::STOP_TIME);
        LOG_INFO("[TIMING] dispatch of %zu slices on %d workers: %.3f s",
                 tasks.size(), num_workers_, elapsed_ms / 1000.0);
        return results;
    }

    const char* name() const override { return "fastflow"; }
};

#endif
