#include <gtest/gtest.h>
#include <managers/job_registry.hpp>
#include "test_helpers.hpp"

class JobRegistryTest : public TempDirTest {
protected:
    fs::path registry_dir() const { return test_dir / "jobs"; }

    static TaskDescriptor upload_task() {
        TaskDescriptor t;
        t.direction = Direction::Upload;
        t.task_id = "cells-1";
        t.job_id = "upload-cells-1";
        t.priority = 2;
        t.depends_on = {"upload-base"};
        t.dataset_json = R"({"title": "Blood: cells", "tags": ["a", "b"]})";
        ResourceSpec r;
        r.path = "/data/a.rtdc";
        r.name = "a.rtdc";
        r.supplements["sp:chip:name"] = "\"flow\"";
        r.depends_on = {"b.csv"};
        t.resources.push_back(r);
        return t;
    }

    static TaskDescriptor download_task() {
        TaskDescriptor t;
        t.direction = Direction::Download;
        t.resource_id = "res-9";
        t.download_dir = "/tmp/out";
        t.job_id = "download-res-9";
        return t;
    }
};

TEST_F(JobRegistryTest, UploadEntrySurvivesReload) {
    JobRegistry reg(registry_dir());
    TaskDescriptor task = upload_task();

    JobRecord rec;
    rec.state = JobState::Transferring;
    rec.failed_state = JobState::Compressing;
    rec.attempt_count = 3;
    rec.verify_polls = 1;
    rec.last_error = {ErrorKind::ConnectionError, "connection reset: by peer"};
    rec.dataset_id = "ds-1";
    rec.sequence = 42;
    ResourceProgress p;
    p.name = "a.rtdc.gz";
    p.source_path = "/data/a.rtdc";
    p.cache_key = "abc";
    p.upload_path = "/cache/abc/payload";
    p.size = 1234567890123LL;
    p.transferred = 1000;
    p.force_replace = true;
    p.supplements_sent = true;
    p.resource_id = "res-1";
    rec.resources.push_back(p);

    ASSERT_TRUE(reg.save(task, rec).is_ok());
    EXPECT_TRUE(reg.contains(Direction::Upload, "upload-cells-1"));

    auto all = reg.load_all(Direction::Upload);
    ASSERT_EQ(all.size(), 1u);
    const auto& e = all[0];
    EXPECT_EQ(e.task.job_id, task.job_id);
    EXPECT_EQ(e.task.priority, 2);
    EXPECT_EQ(e.task.depends_on, task.depends_on);
    EXPECT_EQ(e.task.dataset_json, task.dataset_json);
    ASSERT_EQ(e.task.resources.size(), 1u);
    EXPECT_EQ(e.task.resources[0].supplements, task.resources[0].supplements);
    EXPECT_EQ(e.task.resources[0].depends_on, task.resources[0].depends_on);

    EXPECT_EQ(e.record.state, JobState::Transferring);
    EXPECT_EQ(e.record.failed_state, JobState::Compressing);
    EXPECT_EQ(e.record.attempt_count, 3);
    EXPECT_EQ(e.record.verify_polls, 1);
    EXPECT_EQ(e.record.last_error.kind, ErrorKind::ConnectionError);
    EXPECT_EQ(e.record.last_error.message, "connection reset: by peer");
    EXPECT_EQ(e.record.sequence, 42);
    ASSERT_EQ(e.record.resources.size(), 1u);
    EXPECT_EQ(e.record.resources[0].size, 1234567890123LL);
    EXPECT_EQ(e.record.resources[0].transferred, 1000);
    EXPECT_TRUE(e.record.resources[0].force_replace);
    EXPECT_FALSE(e.record.resources[0].uploaded);
    EXPECT_TRUE(e.record.resources[0].supplements_sent);

    EXPECT_TRUE(reg.load_all(Direction::Download).empty());
}

TEST_F(JobRegistryTest, DownloadProgressSurvivesReload) {
    JobRegistry reg(registry_dir());
    JobRecord rec;
    rec.state = JobState::Transferring;
    rec.download.final_path = "/tmp/out/ds/a.bin";
    rec.download.temp_path = "/tmp/out/ds/a.bin~";
    rec.download.expected_size = 99;
    rec.download.confirmed_offset = 50;
    rec.download.etag = "\"abc\"";
    ASSERT_TRUE(reg.save(download_task(), rec).is_ok());

    auto all = reg.load_all(Direction::Download);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].task.resource_id, "res-9");
    EXPECT_EQ(all[0].record.download.confirmed_offset, 50);
    EXPECT_EQ(all[0].record.download.expected_size, 99);
    EXPECT_EQ(all[0].record.download.etag, "\"abc\"");
    EXPECT_EQ(all[0].record.download.temp_path, "/tmp/out/ds/a.bin~");
    EXPECT_FALSE(all[0].task.condensed);
    EXPECT_FALSE(all[0].record.download.condensed);
}

TEST_F(JobRegistryTest, CondensedDownloadSurvivesReload) {
    JobRegistry reg(registry_dir());
    TaskDescriptor t = download_task();
    t.condensed = true;
    t.job_id = "download-res-9_cond";
    JobRecord rec;
    rec.state = JobState::Verifying;
    rec.download.final_path = "/tmp/out/ds/run_condensed.rtdc";
    rec.download.condensed = true;
    ASSERT_TRUE(reg.save(t, rec).is_ok());

    auto all = reg.load_all(Direction::Download);
    ASSERT_EQ(all.size(), 1u);
    EXPECT_TRUE(all[0].task.condensed);
    EXPECT_EQ(all[0].task.job_id, "download-res-9_cond");
    EXPECT_TRUE(all[0].record.download.condensed);
    EXPECT_EQ(all[0].record.download.final_path, "/tmp/out/ds/run_condensed.rtdc");
}

TEST_F(JobRegistryTest, LoadsInSubmissionOrder) {
    JobRegistry reg(registry_dir());
    for (int seq : {3, 1, 2}) {
        TaskDescriptor t = download_task();
        t.resource_id = "r" + std::to_string(seq);
        t.job_id = "download-r" + std::to_string(seq);
        JobRecord rec;
        rec.sequence = seq;
        ASSERT_TRUE(reg.save(t, rec).is_ok());
    }
    auto all = reg.load_all(Direction::Download);
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].task.job_id, "download-r1");
    EXPECT_EQ(all[2].task.job_id, "download-r3");
}

TEST_F(JobRegistryTest, CorruptFileMovedAside) {
    JobRegistry reg(registry_dir());
    ASSERT_TRUE(reg.save(download_task(), JobRecord{}).is_ok());
    write_bytes(registry_dir() / "download" / "broken.yaml", "task: [unclosed");
    write_bytes(registry_dir() / "download" / "empty.yaml", "");

    std::vector<std::string> warnings;
    auto all = reg.load_all(Direction::Download, &warnings);
    EXPECT_EQ(all.size(), 1u);
    EXPECT_EQ(warnings.size(), 2u);
    EXPECT_TRUE(fs::exists(registry_dir() / "download" / "broken.yaml.corrupt"));
    EXPECT_FALSE(fs::exists(registry_dir() / "download" / "broken.yaml"));

    // Moved-aside files are not retried
    warnings.clear();
    EXPECT_EQ(reg.load_all(Direction::Download, &warnings).size(), 1u);
    EXPECT_TRUE(warnings.empty());
}

TEST_F(JobRegistryTest, RemoveDeletesOnlyThatJob) {
    JobRegistry reg(registry_dir());
    ASSERT_TRUE(reg.save(upload_task(), JobRecord{}).is_ok());
    ASSERT_TRUE(reg.save(download_task(), JobRecord{}).is_ok());

    reg.remove(Direction::Upload, "upload-cells-1");
    EXPECT_FALSE(reg.contains(Direction::Upload, "upload-cells-1"));
    EXPECT_TRUE(reg.contains(Direction::Download, "download-res-9"));
    reg.remove(Direction::Upload, "upload-cells-1");   // second time is harmless
}
