#include <gtest/gtest.h>
#include <managers/job.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>
#include "test_helpers.hpp"

class JobTest : public TempDirTest {
protected:
    TaskDescriptor upload_task(const std::string& id = "t1") {
        TaskDescriptor t;
        t.direction = Direction::Upload;
        t.task_id = id;
        t.job_id = "upload-" + id;
        t.dataset_json = R"({"title": "x"})";
        ResourceSpec r;
        r.path = (test_dir / "a.bin").string();
        r.name = "a.bin";
        t.resources.push_back(r);
        return t;
    }
};

// ── Backoff ────────────────────────────────────────────────

TEST(BackoffTest, DoublesUntilCapped) {
    TransferConfig cfg;
    cfg.backoff_base_ms = 2000;
    cfg.backoff_cap_ms = 300000;
    cfg.backoff_jitter = 0.0;
    EXPECT_EQ(backoff_delay_ms(1, cfg, 0.5), 2000);
    EXPECT_EQ(backoff_delay_ms(2, cfg, 0.5), 4000);
    EXPECT_EQ(backoff_delay_ms(5, cfg, 0.5), 32000);
    EXPECT_EQ(backoff_delay_ms(9, cfg, 0.5), 300000);
    EXPECT_EQ(backoff_delay_ms(1000, cfg, 0.5), 300000);
}

TEST(BackoffTest, JitterStaysWithinTenPercent) {
    TransferConfig cfg;
    cfg.backoff_base_ms = 2000;
    cfg.backoff_cap_ms = 300000;
    cfg.backoff_jitter = 0.10;
    for (int attempt = 1; attempt <= 12; ++attempt) {
        double nominal = std::min(2000.0 * (1 << (attempt - 1)), 300000.0);
        for (double u : {0.0, 0.25, 0.5, 0.999}) {
            int64_t d = backoff_delay_ms(attempt, cfg, u);
            EXPECT_GE(d, static_cast<int64_t>(nominal * 0.9) - 1);
            EXPECT_LE(d, static_cast<int64_t>(nominal * 1.1) + 1);
        }
    }
}

// ── State machine ──────────────────────────────────────────

TEST_F(JobTest, AdvanceFollowsPipeline) {
    Job job(upload_task(), JobRecord{});
    job.advance();
    job.advance();
    EXPECT_EQ(job.state(), JobState::WaitingDisk);
    EXPECT_THROW(job.transition(JobState::Finalizing), std::logic_error);

    auto h = job.history();
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h[0], JobState::Init);
    EXPECT_EQ(h[2], JobState::WaitingDisk);
}

TEST_F(JobTest, RetryCeilingTurnsIntoError) {
    TransferConfig cfg = config.transfer();
    cfg.max_attempts = 3;
    Job job(upload_task(), JobRecord{});
    job.advance();   // parsing

    JobError err{ErrorKind::ConnectionError, "reset"};
    EXPECT_TRUE(job.schedule_retry(err, cfg));
    EXPECT_TRUE(job.schedule_retry(err, cfg));
    EXPECT_EQ(job.state(), JobState::Parsing);
    EXPECT_FALSE(job.schedule_retry(err, cfg));
    EXPECT_EQ(job.state(), JobState::Error);

    auto rec = job.record();
    EXPECT_EQ(rec.attempt_count, 3);
    EXPECT_EQ(rec.failed_state, JobState::Parsing);
    EXPECT_NE(rec.last_error.message.find("gave up after 3 attempts"), std::string::npos);
}

TEST_F(JobTest, BackoffDelaysReadiness) {
    TransferConfig cfg = config.transfer();
    cfg.backoff_base_ms = 60000;
    cfg.backoff_cap_ms = 60000;
    Job job(upload_task(), JobRecord{});
    EXPECT_TRUE(job.ready_at(Clock::now()));
    job.schedule_retry({ErrorKind::ConnectionError, "x"}, cfg);
    EXPECT_FALSE(job.ready_at(Clock::now()));
    EXPECT_TRUE(job.ready_at(Clock::now() + std::chrono::minutes(2)));
}

TEST_F(JobTest, UserRetryResumesFailedStep) {
    Job job(upload_task(), JobRecord{});
    job.advance();
    job.advance();
    job.advance();   // compressing
    job.fail({ErrorKind::ResourceUnavailable, "gone"});
    EXPECT_EQ(job.state(), JobState::Error);

    auto r = job.retry_by_user();
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(job.state(), JobState::Compressing);
    EXPECT_EQ(job.record().attempt_count, 0);
    EXPECT_TRUE(job.record().last_error.empty());
    EXPECT_TRUE(job.retry_by_user().is_err());
}

TEST_F(JobTest, RetryAfterVanishedDraftStartsOver) {
    JobRecord rec;
    rec.state = JobState::Verifying;
    rec.dataset_id = "ds-gone";
    ResourceProgress p;
    p.name = "a.bin";
    p.uploaded = true;
    p.resource_id = "res-1";
    p.transferred = 10;
    rec.resources.push_back(p);

    Job job(upload_task(), rec);
    job.fail({ErrorKind::RemoteStateVanished, "dataset deleted"});
    ASSERT_TRUE(job.retry_by_user().is_ok());

    auto after = job.record();
    EXPECT_EQ(after.state, JobState::Parsing);
    EXPECT_TRUE(after.dataset_id.empty());
    EXPECT_FALSE(after.resources[0].uploaded);
    EXPECT_TRUE(after.resources[0].resource_id.empty());
}

TEST_F(JobTest, AbortOnlyFromActiveStates) {
    Job job(upload_task(), JobRecord{});
    job.advance();
    EXPECT_TRUE(job.mark_aborted());
    EXPECT_EQ(job.state(), JobState::Aborted);
    EXPECT_FALSE(job.mark_aborted());
}

TEST_F(JobTest, ExactlyOneClaimant) {
    for (int round = 0; round < 50; ++round) {
        Job job(upload_task(), JobRecord{});
        std::atomic<int> winners{0};
        std::vector<std::thread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&] {
                if (job.try_claim()) winners++;
            });
        }
        for (auto& t : threads) t.join();
        EXPECT_EQ(winners.load(), 1);
        job.release();
        EXPECT_TRUE(job.try_claim());
    }
}

TEST_F(JobTest, StatusCountsUploadedBytes) {
    JobRecord rec;
    ResourceProgress a, b;
    a.size = 100;
    a.uploaded = true;
    b.size = 50;
    b.transferred = 20;
    rec.resources = {a, b};
    Job job(upload_task(), rec);

    JobStatus s = job.status();
    EXPECT_EQ(s.bytes_total, 150);
    EXPECT_EQ(s.bytes_done, 120);
    EXPECT_EQ(s.direction, Direction::Upload);
}

// ── Rate ───────────────────────────────────────────────────

TEST(RateMeterTest, IgnoresTimeOutsideTransfers) {
    RateMeter m;
    auto t0 = Clock::now();
    m.start(t0);
    m.add(1000, t0 + std::chrono::milliseconds(500));
    m.stop(t0 + std::chrono::seconds(1));

    // A long pause afterwards does not dilute the average
    EXPECT_NEAR(m.rate(t0 + std::chrono::hours(1)), 1000.0, 1.0);
}

TEST(RateMeterTest, SmoothsWhileRunning) {
    RateMeter m;
    auto t0 = Clock::now();
    m.start(t0);
    for (int i = 1; i <= 10; ++i) {
        m.add(2000, t0 + std::chrono::seconds(i));
    }
    EXPECT_NEAR(m.rate(t0 + std::chrono::seconds(10)), 2000.0, 1.0);
}
