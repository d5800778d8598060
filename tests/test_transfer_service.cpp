#include <gtest/gtest.h>
#include <managers/transfer_service.hpp>
#include <nlohmann/json.hpp>
#include <atomic>
#include "test_helpers.hpp"
#include "mock_remote.hpp"

using json = nlohmann::json;

class TransferServiceTest : public TempDirTest {
protected:
    MockRemote remote;
    std::unique_ptr<TransferService> service;

    void TearDown() override {
        service.reset();
        TempDirTest::TearDown();
    }

    // A fresh service over the same state directory and fake server,
    // as after a process restart.
    TransferService& open() {
        service.reset();
        service = std::make_unique<TransferService>(config, std::make_unique<RemoteProxy>(remote));
        return *service;
    }

    fs::path write_upload_task(const std::string& task_id, const std::string& data) {
        fs::path dir = test_dir / "tasks" / task_id;
        write_bytes(dir / "a.bin", data);
        json j = {
            {"dataset_dict", {{"title", "Task " + task_id}}},
            {"upload_job", {{"task_id", task_id}, {"resource_paths", json::array({"a.bin"})}}},
        };
        write_bytes(dir / "task.json", j.dump(2));
        return dir / "task.json";
    }

    bool wait_settled(const std::string& job_id, Direction d = Direction::Upload) {
        return wait_until([&] {
            auto job = service->queue(d).find(job_id);
            return job && is_terminal(job->state()) && !job->claimed();
        }, 20000);
    }

    JobRecord record_of(const std::string& job_id, Direction d = Direction::Upload) {
        return service->queue(d).find(job_id)->record();
    }

    // Start the job, then stop the service while its upload is in flight.
    void interrupt_during_upload(const std::string& job_id) {
        std::atomic<bool> started{false};
        remote.on_upload_start = [&] {
            started = true;
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        };
        service->start();
        ASSERT_TRUE(wait_until([&] { return started.load(); }));
        service->stop();
        remote.on_upload_start = nullptr;
        ASSERT_EQ(service->queue(Direction::Upload).find(job_id)->state(), JobState::Transferring);
    }
};

TEST_F(TransferServiceTest, SubmitsTaskFiles) {
    auto& svc = open();
    ASSERT_TRUE(svc.restore().is_ok());

    fs::path good = write_upload_task("good", "aaa");
    fs::path broken = test_dir / "tasks" / "broken.json";
    write_bytes(broken, "{");

    std::vector<std::string> warnings;
    auto results = svc.submit_task_files({good, broken, good}, &warnings);
    ASSERT_EQ(results.size(), 2u);
    EXPECT_TRUE(results[0].accepted());
    EXPECT_EQ(results[1].outcome, EnqueueOutcome::Duplicate);
    EXPECT_EQ(warnings.size(), 1u);

    auto jobs = svc.list_jobs(Direction::Upload);
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].job_id, "upload-good");
    EXPECT_TRUE(svc.has_pending_work());
}

TEST_F(TransferServiceTest, RunsBothDirections) {
    std::string ds = remote.add_dataset("published");
    std::string res = remote.add_resource(ds, "data.bin", random_bytes(70000));

    auto& svc = open();
    ASSERT_TRUE(svc.restore().is_ok());
    svc.submit_task_files({write_upload_task("up", random_bytes(90000))});
    auto dl = svc.submit_download(res, (test_dir / "downloads").string(), 1);
    ASSERT_TRUE(dl.accepted()) << dl.message;
    EXPECT_EQ(svc.submit_download(res, (test_dir / "elsewhere").string()).outcome,
              EnqueueOutcome::Duplicate);

    svc.start();
    ASSERT_TRUE(wait_settled("upload-up"));
    ASSERT_TRUE(wait_settled(dl.job_id, Direction::Download));
    EXPECT_EQ(record_of("upload-up").state, JobState::Done);
    EXPECT_EQ(record_of(dl.job_id, Direction::Download).state, JobState::Done);
    EXPECT_TRUE(fs::exists(test_dir / "downloads" / "published" / "data.bin"));
    EXPECT_FALSE(svc.has_pending_work());

    QueueSummary s = svc.summary(Direction::Upload);
    EXPECT_EQ(s.total, 1);
    EXPECT_EQ(s.counts[JobState::Done], 1);
    EXPECT_EQ(s.bytes_done, s.bytes_total);
}

TEST_F(TransferServiceTest, RestartResumesWithSameDraft) {
    std::string data = random_bytes(400000);
    {
        auto& svc = open();
        ASSERT_TRUE(svc.restore().is_ok());
        ASSERT_TRUE(svc.submit_task_files({write_upload_task("t1", data)})[0].accepted());
        interrupt_during_upload("upload-t1");
    }
    std::string ds = record_of("upload-t1").dataset_id;
    ASSERT_FALSE(ds.empty());
    EXPECT_EQ(remote.drafts_created, 1);

    auto& svc = open();
    std::vector<std::string> messages;
    ASSERT_TRUE(svc.restore([&](const std::string& m) { messages.push_back(m); }).is_ok());
    ASSERT_FALSE(messages.empty());
    EXPECT_NE(messages.back().find("restored 1 upload"), std::string::npos);
    EXPECT_EQ(record_of("upload-t1").state, JobState::Transferring);

    svc.start();
    ASSERT_TRUE(wait_settled("upload-t1"));
    ASSERT_EQ(record_of("upload-t1").state, JobState::Done) << record_of("upload-t1").last_error.describe();
    EXPECT_EQ(record_of("upload-t1").dataset_id, ds);
    EXPECT_EQ(remote.drafts_created, 1);
    EXPECT_EQ(remote.resources_of(ds)[0].data, data);

    // The task map keeps re-submissions of the same task on that draft
    EXPECT_EQ(*svc.task_map().get("t1"), ds);
}

TEST_F(TransferServiceTest, VanishedDraftFailsOnRestart) {
    {
        auto& svc = open();
        ASSERT_TRUE(svc.restore().is_ok());
        svc.submit_task_files({write_upload_task("t1", random_bytes(200000))});
        interrupt_during_upload("upload-t1");
    }
    std::string ds = record_of("upload-t1").dataset_id;
    remote.delete_dataset(ds);

    auto& svc = open();
    ASSERT_TRUE(svc.restore().is_ok());
    JobRecord rec = record_of("upload-t1");
    ASSERT_EQ(rec.state, JobState::Error);
    EXPECT_EQ(rec.last_error.kind, ErrorKind::RemoteStateVanished);
    EXPECT_FALSE(svc.has_pending_work());

    // A user retry starts over with a new draft
    svc.start();
    ASSERT_TRUE(svc.retry_job("upload-t1").is_ok());
    ASSERT_TRUE(wait_settled("upload-t1"));
    rec = record_of("upload-t1");
    ASSERT_EQ(rec.state, JobState::Done) << rec.last_error.describe();
    EXPECT_NE(rec.dataset_id, ds);
    EXPECT_EQ(remote.drafts_created, 2);
}

TEST_F(TransferServiceTest, VanishedResourceIsSentAgain) {
    {
        auto& svc = open();
        ASSERT_TRUE(svc.restore().is_ok());
        svc.submit_task_files({write_upload_task("t1", "abc")});
        svc.start();
        ASSERT_TRUE(wait_settled("upload-t1"));
    }
    // Pretend the job stopped right after sending, before verification
    JobRegistry reg(config.storage().registry_dir);
    auto entries = reg.load_all(Direction::Upload);
    ASSERT_EQ(entries.size(), 1u);
    RegistryEntry e = entries[0];
    e.record.state = JobState::Transferring;
    e.record.resources[0].verified = false;
    ASSERT_TRUE(reg.save(e.task, e.record).is_ok());
    remote.delete_resource(e.record.resources[0].resource_id);

    auto& svc = open();
    ASSERT_TRUE(svc.restore().is_ok());
    EXPECT_FALSE(record_of("upload-t1").resources[0].uploaded);
    svc.start();
    ASSERT_TRUE(wait_settled("upload-t1"));
    EXPECT_EQ(record_of("upload-t1").state, JobState::Done);
    EXPECT_EQ(remote.upload_calls, 2);
}

TEST_F(TransferServiceTest, RestoreReportsCorruptEntries) {
    fs::path jobs = config.storage().registry_dir;
    write_bytes(fs::path(jobs) / "download" / "download-x.yaml", "::: not yaml [");

    auto& svc = open();
    std::vector<std::string> messages;
    ASSERT_TRUE(svc.restore([&](const std::string& m) { messages.push_back(m); }).is_ok());
    ASSERT_EQ(messages.size(), 2u);
    EXPECT_NE(messages[0].find("download-x.yaml"), std::string::npos);
    EXPECT_TRUE(fs::exists(fs::path(jobs) / "download" / "download-x.yaml.corrupt"));
}

TEST_F(TransferServiceTest, RestorePurgesOrphanedCache) {
    {
        CompressionCache cache(config.cache().dir, config.cache().max_bytes);
        cache.get_or_create("stale", "upload-gone", [](const fs::path& out) {
            write_bytes(out, "old payload");
        });
    }
    auto& svc = open();
    ASSERT_TRUE(svc.restore().is_ok());
    EXPECT_FALSE(svc.cache().contains("stale"));
}

TEST_F(TransferServiceTest, JobOperationsNeedAKnownId) {
    auto& svc = open();
    ASSERT_TRUE(svc.restore().is_ok());
    EXPECT_TRUE(svc.abort_job("upload-none").is_err());
    EXPECT_TRUE(svc.retry_job("upload-none").is_err());
    EXPECT_TRUE(svc.remove_job("upload-none").is_err());

    svc.submit_task_files({write_upload_task("t1", "x")});
    ASSERT_TRUE(svc.abort_job("upload-t1").is_ok());
    EXPECT_EQ(record_of("upload-t1").state, JobState::Aborted);
    ASSERT_TRUE(svc.remove_job("upload-t1").is_ok());
    EXPECT_TRUE(svc.list_jobs(Direction::Upload).empty());
}
