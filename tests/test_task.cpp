#include <gtest/gtest.h>
#include <managers/task.hpp>
#include <core/errors.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include "test_helpers.hpp"

using json = nlohmann::json;

class TaskTest : public TempDirTest {
protected:
    fs::path write_task(const std::string& name, const json& j) {
        fs::path p = test_dir / "tasks" / name;
        write_bytes(p, j.dump(2));
        return p;
    }

    TaskDescriptor upload_with(std::vector<ResourceSpec> resources) {
        TaskDescriptor t;
        t.direction = Direction::Upload;
        t.task_id = "t";
        t.dataset_json = "{}";
        t.resources = std::move(resources);
        t.job_id = derive_job_id(t);
        return t;
    }

    static ResourceSpec res(const std::string& name, std::vector<std::string> deps = {}) {
        ResourceSpec r;
        r.name = name;
        r.path = "/data/" + name;
        r.depends_on = std::move(deps);
        return r;
    }
};

// ── Identity ───────────────────────────────────────────────

TEST(TaskIdTest, AllowedCharacters) {
    EXPECT_TRUE(is_valid_task_id("run-2024_01"));
    EXPECT_TRUE(is_valid_task_id("0"));
    EXPECT_FALSE(is_valid_task_id(""));
    EXPECT_FALSE(is_valid_task_id("Run"));
    EXPECT_FALSE(is_valid_task_id("a b"));
    EXPECT_FALSE(is_valid_task_id("a/b"));
}

TEST(TaskIdTest, JobIdDerivation) {
    TaskDescriptor up;
    up.direction = Direction::Upload;
    EXPECT_EQ(derive_job_id(up), "");
    up.dataset_id = "abc";
    EXPECT_EQ(derive_job_id(up), "upload-abc");
    up.task_id = "t1";
    EXPECT_EQ(derive_job_id(up), "upload-t1");

    TaskDescriptor down;
    down.direction = Direction::Download;
    down.resource_id = "r9";
    EXPECT_EQ(derive_job_id(down), "download-r9");
    down.condensed = true;
    EXPECT_EQ(derive_job_id(down), "download-r9_cond");
}

// ── Structural checks ──────────────────────────────────────

TEST_F(TaskTest, CheckRejectsBadUploads) {
    EXPECT_TRUE(check_task(upload_with({res("a"), res("b")})).is_ok());

    EXPECT_TRUE(check_task(upload_with({})).is_err());
    EXPECT_TRUE(check_task(upload_with({res("a"), res("a")})).is_err());
    EXPECT_TRUE(check_task(upload_with({res("")})).is_err());

    auto t = upload_with({res("a")});
    t.dataset_json.clear();
    EXPECT_TRUE(check_task(t).is_err());

    auto s = upload_with({res("a")});
    s.resources[0].supplements["section:key"] = "1";
    auto r = check_task(s);
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("sp:section:key"), std::string::npos);
}

TEST_F(TaskTest, CheckRejectsIncompleteDownloads) {
    TaskDescriptor d;
    d.direction = Direction::Download;
    d.resource_id = "r1";
    d.job_id = derive_job_id(d);
    EXPECT_TRUE(check_task(d).is_err());
    d.download_dir = "/tmp/x";
    EXPECT_TRUE(check_task(d).is_ok());
}

// ── Resource order ─────────────────────────────────────────

TEST_F(TaskTest, DependenciesUploadFirst) {
    auto t = upload_with({res("a", {"c"}), res("b"), res("c")});
    auto order = resource_upload_order(t);
    std::vector<size_t> expected = {2, 0, 1};
    EXPECT_EQ(order, expected);
}

TEST_F(TaskTest, IndependentResourcesKeepTaskOrder) {
    auto t = upload_with({res("x"), res("y"), res("z")});
    std::vector<size_t> expected = {0, 1, 2};
    EXPECT_EQ(resource_upload_order(t), expected);
}

TEST_F(TaskTest, CycleIsInvalidTask) {
    auto t = upload_with({res("a", {"b"}), res("b", {"a"})});
    try {
        resource_upload_order(t);
        FAIL() << "cycle accepted";
    } catch (const TransferError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InvalidTask);
    }

    auto u = upload_with({res("a", {"ghost"})});
    EXPECT_THROW(resource_upload_order(u), TransferError);
}

// ── Task map ───────────────────────────────────────────────

TEST_F(TaskTest, TaskMapPersistsAcrossInstances) {
    fs::path p = test_dir / "state" / "task_map.txt";
    {
        TaskDatasetMap m(p);
        EXPECT_FALSE(m.get("t1").has_value());
        ASSERT_TRUE(m.add("t1", "ds-1").is_ok());
        EXPECT_TRUE(m.add("t1", "ds-1").is_ok());
        EXPECT_TRUE(m.add("t1", "ds-2").is_err());
        EXPECT_TRUE(m.add("Bad Id", "ds-3").is_err());
    }
    TaskDatasetMap again(p);
    ASSERT_TRUE(again.get("t1").has_value());
    EXPECT_EQ(*again.get("t1"), "ds-1");

    // Re-adding did not duplicate the line
    std::string text = read_bytes(p);
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 1);
}

TEST_F(TaskTest, TaskMapSkipsMalformedLines) {
    fs::path p = test_dir / "task_map.txt";
    write_bytes(p, "good ds-1\nBAD ds-2\nlonely\n\n");
    TaskDatasetMap m(p);
    EXPECT_TRUE(m.get("good").has_value());
    EXPECT_FALSE(m.get("BAD").has_value());
    EXPECT_FALSE(m.get("lonely").has_value());
}

// ── Task files ─────────────────────────────────────────────

TEST_F(TaskTest, LoadsUploadJob) {
    write_bytes(test_dir / "tasks" / "data" / "a.rtdc", "aaaa");
    write_bytes(test_dir / "tasks" / "data" / "b.csv", "bb");

    json j = {
        {"dataset_dict", {{"title", "Blood cells"}, {"license_id", "CC0-1.0"}}},
        {"upload_job", {
            {"task_id", "cells-1"},
            {"priority", 3},
            {"resource_paths", {"data/a.rtdc", "data/b.csv"}},
            {"resource_names", {"a.rtdc", "table.csv"}},
            {"resource_supplements", json::array({
                {{"chip", {{"name", "flow"}}}},
                json::object()})},
            {"resource_depends_on", json::array({json::array(), json::array({"a.rtdc"})})},
        }},
    };
    auto r = load_task_file(write_task("cells.json", j));
    ASSERT_TRUE(r.is_ok()) << r.error;

    const TaskDescriptor& t = r.value;
    EXPECT_EQ(t.job_id, "upload-cells-1");
    EXPECT_EQ(t.priority, 3);
    EXPECT_TRUE(t.dataset_id.empty());
    EXPECT_EQ(json::parse(t.dataset_json)["title"], "Blood cells");
    ASSERT_EQ(t.resources.size(), 2u);
    EXPECT_EQ(t.resources[1].name, "table.csv");
    EXPECT_TRUE(fs::path(t.resources[0].path).is_absolute());
    EXPECT_EQ(t.resources[0].supplements.at("sp:chip:name"), "\"flow\"");
    EXPECT_EQ(t.resources[1].depends_on, std::vector<std::string>{"a.rtdc"});
}

TEST_F(TaskTest, MovedTaskFindsResourcesBesideIt) {
    write_bytes(test_dir / "moved" / "a.rtdc", "aaaa");
    json j = {
        {"dataset_dict", {{"title", "x"}}},
        {"upload_job", {
            {"task_id", "moved"},
            {"resource_paths", json::array({"/nonexistent/original/place/a.rtdc"})},
        }},
    };
    fs::path p = test_dir / "moved" / "task.json";
    write_bytes(p, j.dump());
    auto r = load_task_file(p);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(fs::path(r.value.resources[0].path).filename(), "a.rtdc");
    EXPECT_EQ(r.value.resources[0].name, "a.rtdc");
}

TEST_F(TaskTest, TaskMapSuppliesDatasetId) {
    write_bytes(test_dir / "tasks" / "a.bin", "a");
    TaskDatasetMap map(test_dir / "map.txt");
    ASSERT_TRUE(map.add("known", "ds-77").is_ok());

    json j = {
        {"dataset_dict", {{"title", "x"}}},
        {"upload_job", {{"task_id", "known"}, {"resource_paths", json::array({"a.bin"})}}},
    };
    auto r = load_task_file(write_task("known.json", j), &map);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.dataset_id, "ds-77");

    // A conflicting id in the file is ambiguous
    j["upload_job"]["dataset_id"] = "ds-78";
    auto bad = load_task_file(write_task("conflict.json", j), &map);
    ASSERT_TRUE(bad.is_err());
    EXPECT_NE(bad.error.find("ambiguous"), std::string::npos);
}

TEST_F(TaskTest, LoadsDownloadJob) {
    json j = {{"download_job", {{"resource_id", "abc-123"}, {"download_path", "out"}}}};
    auto r = load_task_file(write_task("dl.json", j));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.direction, Direction::Download);
    EXPECT_EQ(r.value.job_id, "download-abc-123");
    EXPECT_EQ(fs::path(r.value.download_dir), (test_dir / "tasks" / "out").lexically_normal());
    EXPECT_FALSE(r.value.condensed);
}

TEST_F(TaskTest, LoadsCondensedDownloadJob) {
    json j = {{"download_job", {{"resource_id", "abc-123"}, {"download_path", "/data"},
                                {"condensed", true}}}};
    auto r = load_task_file(write_task("dl.json", j));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_TRUE(r.value.condensed);
    EXPECT_EQ(r.value.job_id, "download-abc-123_cond");
}

TEST_F(TaskTest, BadFilesBecomeWarnings) {
    write_bytes(test_dir / "tasks" / "a.bin", "a");
    json good = {
        {"dataset_dict", {{"title", "x"}}},
        {"upload_job", {{"task_id", "good"}, {"resource_paths", json::array({"a.bin"})}}},
    };
    json missing = {
        {"dataset_dict", {{"title", "x"}}},
        {"upload_job", {{"task_id", "missing"}, {"resource_paths", json::array({"nope.bin"})}}},
    };
    fs::path garbage = test_dir / "tasks" / "garbage.json";
    write_bytes(garbage, "{ not json");
    fs::path empty = test_dir / "tasks" / "empty.json";
    write_bytes(empty, "  \n");

    auto batch = load_task_files({write_task("good.json", good), write_task("missing.json", missing),
                                  garbage, empty, test_dir / "absent.json"});
    ASSERT_EQ(batch.tasks.size(), 1u);
    EXPECT_EQ(batch.tasks[0].task_id, "good");
    EXPECT_EQ(batch.warnings.size(), 4u);
}

TEST_F(TaskTest, RejectsInvalidTaskIdInFile) {
    write_bytes(test_dir / "tasks" / "a.bin", "a");
    json j = {
        {"dataset_dict", {{"title", "x"}}},
        {"upload_job", {{"task_id", "Not Valid"}, {"resource_paths", json::array({"a.bin"})}}},
    };
    EXPECT_TRUE(load_task_file(write_task("bad.json", j)).is_err());
}
