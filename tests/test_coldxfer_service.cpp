#include <gtest/gtest.h>
#include <managers/coldxfer_service.hpp>
#include <platform/platform.hpp>
#include <platform/durable_file.hpp>
#include <fmt/format.h>
#include <filesystem>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class ColdxferServiceTest : public ::testing::Test {
protected:
    fs::path dir;
    ManualClock clock{make_utc(2026, 1, 15, 3)};

    void SetUp() override {
        dir = platform::temp_file("coldxfer_service_test");
        fs::create_directories(dir / "data");
    }

    void TearDown() override {
        fs::remove_all(dir);
    }

    Config config(const std::string& extra = "") {
        auto r = Config::parse(fmt::format(R"(
state_dir: {0}/state
log_dir: {0}/logs
store:
  root: {0}/bucket
transfer:
  chunk_bytes: 5
  concurrency: 2
quota:
  monthly_limit_bytes: 1M
{1}
)", dir.string(), extra));
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }
};

TEST_F(ColdxferServiceTest, OpenRequiresStoreRoot) {
    auto cfg = Config::parse(fmt::format("state_dir: {0}/state\nlog_dir: {0}/logs\n",
                                         dir.string()));
    ASSERT_TRUE(cfg.is_ok());
    ColdxferService service(cfg.value, &clock);
    auto r = service.open();
    ASSERT_TRUE(r.is_err());
    EXPECT_NE(r.error.find("store.root"), std::string::npos);
    EXPECT_FALSE(service.is_open());
    EXPECT_TRUE(service.list_jobs().is_err());
}

TEST_F(ColdxferServiceTest, UploadThenDownload) {
    ColdxferService service(config(), &clock);
    ASSERT_TRUE(service.open().is_ok());

    fs::path src = dir / "data" / "notes.txt";
    ASSERT_TRUE(platform::write_file_atomic(src, "cold storage notes").is_ok());

    auto up = service.submit_upload(src.string(), "notes/notes.txt");
    ASSERT_TRUE(up.is_ok()) << up.error;
    auto ran = service.run();
    ASSERT_TRUE(ran.is_ok()) << ran.error;

    fs::path dst = dir / "data" / "copy.txt";
    auto down = service.submit_download("notes/notes.txt", dst.string());
    ASSERT_TRUE(down.is_ok()) << down.error;
    ASSERT_TRUE(service.run().is_ok());

    auto copy = platform::read_file(dst);
    ASSERT_TRUE(copy.is_ok());
    EXPECT_EQ(copy.value, "cold storage notes");

    auto jobs = service.list_jobs();
    ASSERT_TRUE(jobs.is_ok()) << jobs.error;
    ASSERT_EQ(jobs.value.size(), 2u);
    for (const auto& j : jobs.value) {
        EXPECT_EQ(j.state, "completed");
        EXPECT_NE(j.progress.find("(100%)"), std::string::npos);
        EXPECT_TRUE(j.error.empty());
    }

    auto q = service.quota();
    ASSERT_TRUE(q.is_ok());
    EXPECT_EQ(q.value.month, "2026-01");
    EXPECT_EQ(q.value.uploaded, 18u);
    EXPECT_EQ(q.value.downloaded, 18u);
    EXPECT_EQ(q.value.used, 36u);
    EXPECT_EQ(q.value.limit, 1024u * 1024u);
}

TEST_F(ColdxferServiceTest, WaitingJobShowsResumeTime) {
    ColdxferService service(config("schedule:\n  windows: [\"22:00-23:00\"]\n"), &clock);
    ASSERT_TRUE(service.open().is_ok());

    fs::path src = dir / "data" / "late.bin";
    ASSERT_TRUE(platform::write_file_atomic(src, "after hours").is_ok());
    auto up = service.submit_upload(src.string(), "late.bin", StorageClass::Glacier);
    ASSERT_TRUE(up.is_ok());
    ASSERT_TRUE(service.run(RunMode::DueOnly).is_ok());

    auto jobs = service.list_jobs();
    ASSERT_TRUE(jobs.is_ok());
    ASSERT_EQ(jobs.value.size(), 1u);
    EXPECT_EQ(jobs.value[0].state, "paused");
    EXPECT_EQ(jobs.value[0].resume, "in 19h0m");
    EXPECT_EQ(jobs.value[0].direction, "upload");
}

TEST_F(ColdxferServiceTest, CancelAndForget) {
    ColdxferService service(config(), &clock);
    ASSERT_TRUE(service.open().is_ok());

    fs::path src = dir / "data" / "tmp.bin";
    ASSERT_TRUE(platform::write_file_atomic(src, "discard").is_ok());
    auto up = service.submit_upload(src.string(), "tmp.bin");
    ASSERT_TRUE(up.is_ok());

    std::string id = up.value.job.id;
    EXPECT_TRUE(service.forget(id).is_err());
    ASSERT_TRUE(service.cancel(id).is_ok());

    auto jobs = service.list_jobs();
    ASSERT_TRUE(jobs.is_ok());
    ASSERT_EQ(jobs.value.size(), 1u);
    EXPECT_EQ(jobs.value[0].state, "failed");
    EXPECT_EQ(jobs.value[0].error.rfind("cancelled", 0), 0u);

    ASSERT_TRUE(service.forget(id).is_ok());
    EXPECT_TRUE(service.list_jobs().value.empty());

    // Forgotten transfers can be submitted again from scratch
    auto again = service.submit_upload(src.string(), "tmp.bin");
    ASSERT_TRUE(again.is_ok());
    EXPECT_TRUE(again.value.created);
    EXPECT_EQ(again.value.job.id, id);
}
