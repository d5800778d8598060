#include <gtest/gtest.h>
#include "engine_fixture.hpp"

class DownloadPipelineTest : public EngineTest {
protected:
    std::string dataset;
    std::string data;
    std::string resource;

    void SetUp() override {
        EngineTest::SetUp();
        dataset = remote.add_dataset("cells");
        data = random_bytes(1024 * 1024 + 123);
        resource = remote.add_resource(dataset, "a.bin", data);
    }

    fs::path final_path() const { return test_dir / "downloads" / "cells" / "a.bin"; }
    fs::path temp_path() const { return test_dir / "downloads" / "cells" / "a.bin~"; }

    std::shared_ptr<Job> run(const TaskDescriptor& task) {
        auto r = downloads->enqueue(task);
        EXPECT_TRUE(r.accepted()) << r.message;
        if (!download_daemon) start_downloads();
        EXPECT_TRUE(wait_settled(*downloads, task.job_id));
        return downloads->find(task.job_id);
    }
};

TEST_F(DownloadPipelineTest, DownloadsAndVerifies) {
    auto job = run(download_task(resource));
    ASSERT_EQ(job->state(), JobState::Done) << job->record().last_error.describe();

    EXPECT_EQ(read_bytes(final_path()), data);
    EXPECT_FALSE(fs::exists(temp_path()));
    EXPECT_EQ(remote.download_offsets, std::vector<int64_t>{0});

    JobRecord rec = job->record();
    EXPECT_EQ(rec.download.verify_method, "sha256");
    EXPECT_EQ(rec.download.confirmed_offset, static_cast<int64_t>(data.size()));
    EXPECT_EQ(rec.dataset_id, dataset);

    std::vector<JobState> expected = {
        JobState::Init, JobState::Parsing, JobState::Transferring, JobState::Verifying, JobState::Done,
    };
    EXPECT_EQ(job->history(), expected);
    JobStatus s = job->status();
    EXPECT_EQ(s.bytes_done, s.bytes_total);
}

TEST_F(DownloadPipelineTest, ResumesAfterConnectionDrop) {
    remote.cut_download_after = 300000;
    auto job = run(download_task(resource));
    ASSERT_EQ(job->state(), JobState::Done) << job->record().last_error.describe();

    std::vector<int64_t> offsets = {0, 300000};
    EXPECT_EQ(remote.download_offsets, offsets);
    EXPECT_EQ(remote.bytes_served, static_cast<int64_t>(data.size()));
    EXPECT_EQ(read_bytes(final_path()), data);
    EXPECT_EQ(job->record().attempt_count, 1);
}

TEST_F(DownloadPipelineTest, ResumesPartialFileFromEarlierRun) {
    size_t half = data.size() / 2;
    write_bytes(temp_path(), data.substr(0, half));

    auto job = run(download_task(resource));
    ASSERT_EQ(job->state(), JobState::Done) << job->record().last_error.describe();
    EXPECT_EQ(remote.download_offsets, std::vector<int64_t>{static_cast<int64_t>(half)});
    EXPECT_EQ(remote.bytes_served, static_cast<int64_t>(data.size() - half));
    EXPECT_EQ(read_bytes(final_path()), data);
}

TEST_F(DownloadPipelineTest, BadPrefixIsCaughtAndRefetched) {
    size_t half = data.size() / 2;
    write_bytes(temp_path(), random_bytes(half, 99));

    auto job = run(download_task(resource));
    ASSERT_EQ(job->state(), JobState::Done) << job->record().last_error.describe();
    std::vector<int64_t> offsets = {static_cast<int64_t>(half), 0};
    EXPECT_EQ(remote.download_offsets, offsets);
    EXPECT_EQ(job->record().attempt_count, 1);
    EXPECT_EQ(read_bytes(final_path()), data);
}

TEST_F(DownloadPipelineTest, FallsBackToEtag) {
    remote.expose_sha256 = false;
    auto job = run(download_task(resource));
    ASSERT_EQ(job->state(), JobState::Done) << job->record().last_error.describe();
    EXPECT_EQ(job->record().download.verify_method, "etag");
}

TEST_F(DownloadPipelineTest, MatchingCopyIsKept) {
    write_bytes(final_path(), data);
    auto job = run(download_task(resource));
    ASSERT_EQ(job->state(), JobState::Done) << job->record().last_error.describe();
    EXPECT_TRUE(remote.download_offsets.empty());
    EXPECT_EQ(read_bytes(final_path()), data);
}

TEST_F(DownloadPipelineTest, DifferentCopyIsNotOverwritten) {
    write_bytes(final_path(), "something else");
    auto job = run(download_task(resource));
    ASSERT_EQ(job->state(), JobState::Error);
    EXPECT_EQ(job->record().last_error.kind, ErrorKind::InvalidTask);
    EXPECT_EQ(read_bytes(final_path()), "something else");
}

TEST_F(DownloadPipelineTest, MissingResourceFails) {
    auto job = run(download_task("res-none"));
    ASSERT_EQ(job->state(), JobState::Error);
    EXPECT_EQ(job->record().last_error.kind, ErrorKind::RemoteStateVanished);
    EXPECT_EQ(job->record().failed_state, JobState::Parsing);
}

TEST_F(DownloadPipelineTest, UserRetryResumesAtConfirmedOffset) {
    config.transfer().max_attempts = 1;
    remote.cut_download_after = 1000;
    auto job = run(download_task(resource));
    ASSERT_EQ(job->state(), JobState::Error);
    EXPECT_EQ(job->record().failed_state, JobState::Transferring);
    EXPECT_EQ(fs::file_size(temp_path()), 1000u);
    EXPECT_EQ(job->record().download.confirmed_offset, 1000);

    ASSERT_TRUE(downloads->retry(job->id()).is_ok());
    ASSERT_TRUE(wait_settled(*downloads, job->id()));
    ASSERT_EQ(job->state(), JobState::Done) << job->record().last_error.describe();
    std::vector<int64_t> offsets = {0, 1000};
    EXPECT_EQ(remote.download_offsets, offsets);
    EXPECT_EQ(read_bytes(final_path()), data);
}

TEST_F(DownloadPipelineTest, RemoveDeletesPartialFile) {
    config.transfer().max_attempts = 1;
    remote.cut_download_after = 5000;
    auto job = run(download_task(resource));
    ASSERT_EQ(job->state(), JobState::Error);
    ASSERT_TRUE(fs::exists(temp_path()));

    ASSERT_TRUE(downloads->remove(job->id()).is_ok());
    EXPECT_FALSE(fs::exists(temp_path()));
    EXPECT_FALSE(registry->contains(Direction::Download, job->id()));
}

TEST_F(DownloadPipelineTest, AbortTruncatesToConfirmedOffset) {
    TaskDescriptor task = download_task(resource);
    ASSERT_TRUE(downloads->enqueue(task).accepted());
    auto job = downloads->find(task.job_id);

    // Bytes past the confirmed offset are not trusted after an abort
    job->update([&](JobRecord& rec) {
        rec.download.temp_path = temp_path().string();
        rec.download.confirmed_offset = 100;
    });
    write_bytes(temp_path(), data.substr(0, 250));

    ASSERT_TRUE(downloads->abort(task.job_id).is_ok());
    EXPECT_EQ(job->state(), JobState::Aborted);
    EXPECT_EQ(fs::file_size(temp_path()), 100u);
}

TEST_F(DownloadPipelineTest, ResourcesSharingADatasetDownloadTogether) {
    std::string other = random_bytes(5000, 3);
    std::string second = remote.add_resource(dataset, "b.bin", other);
    start_downloads(2);
    ASSERT_TRUE(downloads->enqueue(download_task(resource)).accepted());
    ASSERT_TRUE(downloads->enqueue(download_task(second)).accepted());
    ASSERT_TRUE(wait_settled(*downloads, "download-" + resource));
    ASSERT_TRUE(wait_settled(*downloads, "download-" + second));
    EXPECT_EQ(read_bytes(final_path()), data);
    EXPECT_EQ(read_bytes(test_dir / "downloads" / "cells" / "b.bin"), other);
}

// ── Condensed copies ─────────────────────────────────────────

TEST_F(DownloadPipelineTest, CondensedNameKeepsSuffix) {
    EXPECT_EQ(condensed_name("cells.rtdc"), "cells_condensed.rtdc");
    EXPECT_EQ(condensed_name("run.2.rtdc"), "run.2_condensed.rtdc");
    EXPECT_EQ(condensed_name("plain"), "plain_condensed");
}

TEST_F(DownloadPipelineTest, CondensedRtdcLandsBesideOriginal) {
    std::string full = random_bytes(400000);
    std::string small = random_bytes(30000);
    std::string rid = remote.add_resource(dataset, "run.rtdc", full, "RT-DC");
    remote.set_condensed(rid, small);

    TaskDescriptor t = download_task(rid);
    t.condensed = true;
    t.job_id = derive_job_id(t);
    EXPECT_EQ(t.job_id, "download-" + rid + "_cond");

    auto job = run(t);
    ASSERT_EQ(job->state(), JobState::Done) << job->record().last_error.describe();
    fs::path cond = test_dir / "downloads" / "cells" / "run_condensed.rtdc";
    EXPECT_EQ(read_bytes(cond), small);
    EXPECT_EQ(remote.condensed_downloads, 1);
    EXPECT_TRUE(job->record().download.condensed);
    EXPECT_EQ(job->record().download.confirmed_offset, static_cast<int64_t>(small.size()));

    // The full file is a separate job and lands under its own name
    auto plain = run(download_task(rid));
    ASSERT_EQ(plain->state(), JobState::Done) << plain->record().last_error.describe();
    EXPECT_EQ(read_bytes(test_dir / "downloads" / "cells" / "run.rtdc"), full);
    EXPECT_EQ(read_bytes(cond), small);
    EXPECT_EQ(plain->record().download.verify_method, "sha256");
}

TEST_F(DownloadPipelineTest, CondensedRequestForOtherTypeFetchesFile) {
    TaskDescriptor t = download_task(resource);
    t.condensed = true;
    t.job_id = derive_job_id(t);
    auto job = run(t);
    ASSERT_EQ(job->state(), JobState::Done) << job->record().last_error.describe();
    EXPECT_EQ(read_bytes(final_path()), data);
    EXPECT_EQ(remote.condensed_downloads, 0);
    EXPECT_FALSE(job->record().download.condensed);
    EXPECT_EQ(job->record().download.verify_method, "sha256");
}

TEST_F(DownloadPipelineTest, CondensedCopyIsNotOverwritten) {
    std::string rid = remote.add_resource(dataset, "run.rtdc", random_bytes(1000), "RT-DC");
    remote.set_condensed(rid, "small");
    write_bytes(test_dir / "downloads" / "cells" / "run_condensed.rtdc", "mine");

    TaskDescriptor t = download_task(rid);
    t.condensed = true;
    t.job_id = derive_job_id(t);
    auto job = run(t);
    ASSERT_EQ(job->state(), JobState::Error);
    EXPECT_EQ(job->record().last_error.kind, ErrorKind::InvalidTask);
    EXPECT_EQ(read_bytes(test_dir / "downloads" / "cells" / "run_condensed.rtdc"), "mine");
}
