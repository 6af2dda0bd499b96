#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <utility>

#include "vod_ingest/process_runner.hpp"
#include "vod_ingest/system.hpp"
#include "vod_ingest/worker_pool.hpp"

using namespace vod_ingest;
using namespace std::chrono_literals;

TEST(System, ParseCpuList) {
  EXPECT_EQ(parse_cpu_list("0-3"), (std::vector<int>{0, 1, 2, 3}));
  EXPECT_EQ(parse_cpu_list("0,2,4-5"), (std::vector<int>{0, 2, 4, 5}));
  EXPECT_TRUE(parse_cpu_list("").empty());
  EXPECT_EQ(parse_cpu_list("1,x,3"), (std::vector<int>{1, 3}));
}

TEST(System, WorkerCount) {
  EXPECT_EQ(calculate_transcode_workers(0, 16), 4);
  EXPECT_EQ(calculate_transcode_workers(0, 2), 1);
  EXPECT_EQ(calculate_transcode_workers(3, 16), 3);
  EXPECT_EQ(calculate_transcode_workers(32, 8), 8);
  EXPECT_GE(detect_cpu_limit(), 1);
  EXPECT_FALSE(get_available_cpus().empty());
}

TEST(System, PartitionCpus) {
  auto sets = partition_cpus({0, 1, 2, 3, 4, 5, 6, 7}, 2);
  ASSERT_EQ(sets.size(), 2u);
  EXPECT_EQ(sets[0], (std::vector<int>{0, 1, 2, 3}));
  EXPECT_EQ(sets[1], (std::vector<int>{4, 5, 6, 7}));

  auto too_few = partition_cpus({0}, 2);
  ASSERT_EQ(too_few.size(), 2u);
  EXPECT_TRUE(too_few[0].empty());
}

TEST(System, FormatHelpers) {
  EXPECT_EQ(format_time(3725), "01:02:05");
  EXPECT_EQ(format_cpu_list({2, 3}), "2,3");
  EXPECT_EQ(with_cpu_affinity({"ffmpeg", "-i", "x"}, {1, 2}),
            (std::vector<std::string>{"taskset", "-c", "1,2", "ffmpeg", "-i",
                                      "x"}));
  EXPECT_EQ(with_cpu_affinity({"ffmpeg"}, {}),
            (std::vector<std::string>{"ffmpeg"}));
}

TEST(SubprocessRunner, CapturesOutputAndExitCode) {
  SubprocessRunner runner;
  ProcessResult ok = runner.run({"sh", "-c", "printf hello"}, 10, true);
  EXPECT_TRUE(ok.ok());
  EXPECT_EQ(ok.output, "hello");

  ProcessResult fail = runner.run({"sh", "-c", "exit 3"}, 10, false);
  EXPECT_TRUE(fail.launched);
  EXPECT_EQ(fail.exit_code, 3);
  EXPECT_FALSE(fail.ok());
}

TEST(SubprocessRunner, KillsOnTimeout) {
  SubprocessRunner runner;
  auto start = std::chrono::steady_clock::now();
  ProcessResult r = runner.run({"sleep", "5"}, 0.3, false);
  EXPECT_TRUE(r.timed_out);
  EXPECT_FALSE(r.ok());
  EXPECT_LT(std::chrono::steady_clock::now() - start, 4s);
}

TEST(SubprocessRunner, MissingBinaryIsLaunchFailure) {
  SubprocessRunner runner;
  ProcessResult r =
      runner.run({"/nonexistent/definitely-not-a-binary"}, 5, false);
  EXPECT_FALSE(r.launched);
  EXPECT_FALSE(r.ok());
}

TEST(TranscodeWorkerPool, RefusesJobsBeforeStart) {
  TranscodeWorkerPool pool(2);
  EXPECT_FALSE(pool.running());
  EXPECT_FALSE(pool.submit(PipelineJob()));
  EXPECT_EQ(pool.pending(), 0u);

  std::atomic<int> done{0};
  pool.start([&](PipelineJob &, const WorkerContext &) { ++done; });
  EXPECT_TRUE(pool.running());
  ASSERT_TRUE(pool.submit(PipelineJob()));
  EXPECT_TRUE(pool.wait_idle(5s));
  EXPECT_EQ(done.load(), 1);

  pool.shutdown();
  EXPECT_FALSE(pool.running());
}

TEST(TranscodeWorkerPool, RunsEveryJobAndDrainsOnShutdown) {
  TranscodeWorkerPool pool(3);
  std::atomic<int> done{0};
  pool.start([&](PipelineJob &, const WorkerContext &ctx) {
    EXPECT_GE(ctx.worker_id, 0);
    EXPECT_LT(ctx.worker_id, 3);
    ++done;
  });

  for (int i = 0; i < 20; ++i) {
    PipelineJob job;
    job.video_id = std::to_string(i);
    ASSERT_TRUE(pool.submit(std::move(job)));
  }
  EXPECT_TRUE(pool.wait_idle(5s));
  EXPECT_EQ(done.load(), 20);
  EXPECT_EQ(pool.pending(), 0u);

  pool.shutdown();
  EXPECT_FALSE(pool.submit(PipelineJob()));
}
