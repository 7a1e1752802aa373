#include <gtest/gtest.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "chunking/boundary_locator.hpp"
#include "chunking/slice_planner.hpp"
#include "dispatch/subprocess.hpp"
#include "dispatch/worker_task.hpp"
#include "openmp/omp_dispatcher.hpp"
#include "pcapgen/pcapgen.hpp"
#include "test_helpers.hpp"

namespace {

// Expected content of a slice file: the global header, then the slice bytes
std::vector<char> expected_slice(const std::vector<char>& source, const SliceInfo& slice) {
    std::vector<char> out(source.begin(), source.begin() + GLOBAL_HEADER_SIZE);
    out.insert(out.end(), source.begin() + slice.offset, source.begin() + slice.end());
    return out;
}

class DispatchTest : public ::testing::Test {
protected:
    void SetUp() override {
        ignore_sigpipe();
        path_ = dir_.file("in.pcap");
        CaptureSpec spec;
        spec.num_records = 2000;
        spec.payload_len = 30;
        spec.payload_len_max = 1200;
        CaptureGenerator gen;
        gen.generate(path_, spec);
    }

    SlicePlan plan_for(const OpenedCapture& cap, size_t slices) {
        CutResult cuts = locate_cuts(cap.file, cap.gh, cap.region_start(), cap.region_end(), slices, 3600);
        return plan_slices(cuts.cuts, cap.region_start(), cap.region_end());
    }

    TempDir dir_;
    std::string path_;
};

} // namespace

TEST(Subprocess, ReportsExitCode) {
    Subprocess ok("exit 0");
    EXPECT_TRUE(ok.wait().ok());

    Subprocess failing("exit 3");
    ExitStatus status = failing.wait();
    EXPECT_EQ(status.exit_code, 3);
    EXPECT_EQ(status.signal, 0);
    EXPECT_FALSE(status.ok());

    // waiting again returns the same status
    EXPECT_EQ(failing.wait().exit_code, 3);
}

TEST(Subprocess, ReportsTerminatingSignal) {
    Subprocess killed("kill -TERM $$");
    ExitStatus status = killed.wait();
    EXPECT_EQ(status.signal, SIGTERM);
    EXPECT_FALSE(status.ok());
}

TEST(Subprocess, StdinReachesTheChild) {
    TempDir dir;
    std::string out = dir.file("out.bin");
    Subprocess cat("cat > " + out);
    std::string data = "hello slices\n";
    cat.write_stdin(data.data(), data.size());
    cat.close_stdin();
    EXPECT_TRUE(cat.wait().ok());

    std::vector<char> got = read_all(out);
    EXPECT_EQ(std::string(got.begin(), got.end()), data);
}

TEST(Subprocess, WritingToExitedChildFailsWithEpipe) {
    ignore_sigpipe();
    Subprocess quitter("exit 0");
    std::vector<char> block(1 << 20, 'x');
    try {
        for (int i = 0; i < 16; ++i) quitter.write_stdin(block.data(), block.size());
        FAIL() << "write into a closed pipe should fail";
    } catch (const std::system_error& e) {
        EXPECT_EQ(e.code().value(), EPIPE);
    }
    EXPECT_TRUE(quitter.wait().ok());
}

TEST_F(DispatchTest, WorkerStreamsHeaderAndSliceBytes) {
    OpenedCapture cap(path_);
    SliceInfo slice(0, cap.region_start(), cap.region_end() - cap.region_start());
    std::string out = dir_.file("whole.pcap");

    // a chunk size that does not divide anything
    TaskResult r = run_worker_task({slice, "cat > " + out}, cap.file, cap.gh, 4099);
    EXPECT_TRUE(r.ok()) << r.describe();
    EXPECT_EQ(r.bytes_streamed, cap.file.size());
    EXPECT_EQ(read_all(out), read_all(path_));
}

TEST_F(DispatchTest, ChildThatStopsReadingIsAFailure) {
    OpenedCapture cap(path_);
    SliceInfo slice(0, cap.region_start(), cap.region_end() - cap.region_start());

    TaskResult r = run_worker_task({slice, "head -c 10 > /dev/null"}, cap.file, cap.gh);
    EXPECT_FALSE(r.ok());
    EXPECT_NE(r.error.find("streaming stopped"), std::string::npos) << r.error;
    EXPECT_LT(r.bytes_streamed, cap.file.size());
    EXPECT_EQ(r.exit_code, 0);
}

TEST_F(DispatchTest, OpenMPDispatcherWritesEverySlice) {
    OpenedCapture cap(path_);
    SlicePlan plan = plan_for(cap, 6);
    ASSERT_EQ(plan.size(), 6u);

    std::string pattern = (dir_.path() / "slice_{SLICE_ID}.pcap").string();
    auto tasks = build_tasks(plan, CommandTemplate("cat > " + pattern));

    OpenMPDispatcher dispatcher(3);
    EXPECT_EQ(dispatcher.num_threads(), 3);
    std::vector<TaskResult> results = dispatcher.dispatch(tasks, cap.file, cap.gh);

    std::vector<char> source = read_all(path_);
    ASSERT_EQ(results.size(), plan.size());
    for (size_t i = 0; i < plan.size(); ++i) {
        EXPECT_EQ(results[i].slice_id, static_cast<int>(i));
        EXPECT_TRUE(results[i].ok()) << results[i].describe();
        EXPECT_EQ(results[i].bytes_streamed, GLOBAL_HEADER_SIZE + plan[i].size);

        std::string file = dir_.file("slice_" + std::to_string(i) + ".pcap");
        EXPECT_EQ(read_all(file), expected_slice(source, plan[i])) << file;
        EXPECT_NO_THROW(verify_pcap_file(file));
    }
}

TEST_F(DispatchTest, OneFailingSliceDoesNotStopTheOthers) {
    OpenedCapture cap(path_);
    SlicePlan plan = plan_for(cap, 4);
    ASSERT_EQ(plan.size(), 4u);

    std::string out = (dir_.path() / "part_{SLICE_ID}.pcap").string();
    auto tasks = build_tasks(plan, CommandTemplate(
        "if [ {SLICE_ID} -eq 1 ]; then cat > /dev/null; exit 1; fi; cat > " + out));

    OpenMPDispatcher dispatcher(2);
    std::vector<TaskResult> results = dispatcher.dispatch(tasks, cap.file, cap.gh);

    ASSERT_EQ(results.size(), 4u);
    EXPECT_FALSE(results[1].ok());
    EXPECT_EQ(results[1].exit_code, 1);
    EXPECT_TRUE(results[1].error.empty());
    EXPECT_NE(results[1].describe().find("exit status 1"), std::string::npos);
    EXPECT_FALSE(std::filesystem::exists(dir_.file("part_1.pcap")));

    for (size_t i : {0u, 2u, 3u}) {
        EXPECT_TRUE(results[i].ok()) << results[i].describe();
        EXPECT_TRUE(std::filesystem::exists(dir_.file("part_" + std::to_string(i) + ".pcap")));
    }
}

TEST_F(DispatchTest, MoreSlotsThanSlices) {
    OpenedCapture cap(path_);
    SlicePlan plan = plan_for(cap, 2);
    auto tasks = build_tasks(plan, CommandTemplate("cat > /dev/null"));

    OpenMPDispatcher dispatcher(8);
    std::vector<TaskResult> results = dispatcher.dispatch(tasks, cap.file, cap.gh);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].ok());
    EXPECT_TRUE(results[1].ok());
}

TEST_F(DispatchTest, NeverMoreChildrenThanSlots) {
    OpenedCapture cap(path_);
    SlicePlan plan = plan_for(cap, 6);
    ASSERT_EQ(plan.size(), 6u);

    // each child stamps its start and end (ns) around a short sleep
    std::string stamps = dir_.path().string();
    auto tasks = build_tasks(plan, CommandTemplate(
        "date +%s%N > " + stamps + "/start_{SLICE_ID}; cat > /dev/null; sleep 0.3; date +%s%N > " +
        stamps + "/end_{SLICE_ID}"));

    OpenMPDispatcher dispatcher(2);
    std::vector<TaskResult> results = dispatcher.dispatch(tasks, cap.file, cap.gh);
    for (const auto& r : results) ASSERT_TRUE(r.ok()) << r.describe();

    auto stamp = [&](const std::string& name) {
        std::ifstream in(dir_.file(name));
        long long ns = 0;
        in >> ns;
        return ns;
    };

    // +1 at each start, -1 at each end; ends sort before starts at the same instant
    std::vector<std::pair<long long, int>> events;
    for (size_t i = 0; i < plan.size(); ++i) {
        events.emplace_back(stamp("start_" + std::to_string(i)), 1);
        events.emplace_back(stamp("end_" + std::to_string(i)), -1);
    }
    std::sort(events.begin(), events.end());

    int running = 0;
    int peak = 0;
    for (const auto& e : events) {
        running += e.second;
        peak = std::max(peak, running);
    }
    EXPECT_GE(peak, 1);
    EXPECT_LE(peak, 2);
}
