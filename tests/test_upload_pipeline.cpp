#include <gtest/gtest.h>
#include <managers/upload_pipeline.hpp>
#include <managers/job_ledger.hpp>
#include <platform/platform.hpp>
#include <platform/durable_file.hpp>
#include <core/log.hpp>
#include <store/fs_object_store.hpp>
#include "fake_object_store.hpp"
#include <filesystem>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class UploadPipelineTest : public ::testing::Test {
protected:
    fs::path dir;
    ManualClock clock{make_utc(2025, 7, 14, 12)};
    FakeObjectStore store;
    std::unique_ptr<JobLedger> ledger;
    std::unique_ptr<TransferGate> gate;
    std::unique_ptr<RetryController> retry;
    PipelineOptions options;

    void SetUp() override {
        dir = platform::temp_file("coldxfer_upload_test");
        fs::create_directories(dir / "src");
        set_log_dir(dir / "logs");
        options.chunk_bytes = 4;
        open_ledger(GatePolicy{});
    }

    void TearDown() override {
        retry.reset();
        gate.reset();
        ledger.reset();
        fs::remove_all(dir);
    }

    // Fresh ledger and controllers over the same state directory.
    void open_ledger(GatePolicy policy) {
        ledger = std::make_unique<JobLedger>(dir / "state", clock);
        gate = std::make_unique<TransferGate>(*ledger, std::move(policy));
        RetryPolicy rp;
        rp.base = 1000ms;
        rp.cap = 8000ms;
        rp.seed = 3;
        retry = std::make_unique<RetryController>(*ledger, rp);
    }

    UploadPipeline pipeline() {
        return UploadPipeline(store, *ledger, *gate, *retry, clock, sha256_factory(), options);
    }

    std::string write_source(const std::string& name, const std::string& content) {
        fs::path p = dir / "src" / name;
        EXPECT_TRUE(platform::write_file_atomic(p, content).is_ok());
        return p.string();
    }

    TransferJob submit(const std::string& path, const std::string& key, uint64_t size) {
        auto r = ledger->create(make_upload_job(path, key, StorageClass::Standard, size,
                                                clock.now()));
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value.job;
    }

    TransferJob reload(const std::string& id) {
        auto r = ledger->find(id);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }
};

TEST_F(UploadPipelineTest, UploadsInChunks) {
    const std::string data = "0123456789";
    auto job = submit(write_source("a.bin", data), "backups/a.bin", data.size());

    auto r = pipeline().upload(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(r.value.job.state, JobState::Completed);
    EXPECT_EQ(r.value.job.cursor, 10u);
    EXPECT_EQ(r.value.job.final_digest, sha256_hex(data));

    EXPECT_EQ(store.put_offsets(), (std::vector<uint64_t>{0, 4, 8}));
    EXPECT_EQ(store.object("backups/a.bin").data, data);

    auto q = ledger->load_quota(month_key(clock.now()));
    ASSERT_TRUE(q.is_ok());
    EXPECT_EQ(q.value.upload_bytes, 10u);
    EXPECT_EQ(q.value.bytes_used, 10u);
}

TEST_F(UploadPipelineTest, ThrottledThenRecovers) {
    const std::string data = "abcdefgh";
    auto job = submit(write_source("t.bin", data), "t.bin", data.size());
    store.fail_puts(FakeObjectStore::service(503, "SlowDown"), 3);

    auto up = pipeline();
    for (int attempt = 1; attempt <= 3; ++attempt) {
        auto r = up.upload(job);
        ASSERT_TRUE(r.is_ok()) << r.error;
        EXPECT_EQ(r.value.kind, PassResult::Kind::Rescheduled);
        job = reload(job.id);
        EXPECT_EQ(job.state, JobState::Retrying);
        EXPECT_EQ(job.retry_count, attempt);
        EXPECT_GT(job.next_attempt_at, clock.now());
        EXPECT_EQ(job.cursor, 0u);
        clock.set(job.next_attempt_at);
    }

    auto r = up.upload(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(r.value.job.retry_count, 0);
    EXPECT_EQ(store.object("t.bin").data, data);
}

TEST_F(UploadPipelineTest, ResumesAfterRestart) {
    std::string data;
    for (int i = 0; i < 22; ++i) data += static_cast<char>('a' + i);
    auto job = submit(write_source("r.bin", data), "r.bin", data.size());

    int polls = 0;
    auto suspend_after_two = [&](const std::string&) {
        return ++polls > 2 ? PassControl::Suspend : PassControl::Continue;
    };
    auto first = pipeline().upload(job, suspend_after_two);
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_EQ(first.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(reload(job.id).cursor, 8u);
    EXPECT_FALSE(store.has_object("r.bin"));

    // Transient failure on the next range leaves the cursor alone
    store.fail_puts(FakeObjectStore::network());
    open_ledger(GatePolicy{});
    auto second = pipeline().upload(reload(job.id));
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(reload(job.id).cursor, 8u);

    open_ledger(GatePolicy{});
    auto done = pipeline().upload(reload(job.id));
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(done.value.job.final_digest, sha256_hex(data));
    EXPECT_EQ(store.object("r.bin").data, data);
    EXPECT_EQ(store.put_offsets(), (std::vector<uint64_t>{0, 4, 8, 12, 16, 20}));
}

TEST_F(UploadPipelineTest, AccessDeniedFailsWithoutRetry) {
    auto job = submit(write_source("d.bin", "denied"), "d.bin", 6);
    store.fail_puts(FakeObjectStore::service(403, "AccessDenied"));

    auto r = pipeline().upload(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Failed);
    EXPECT_EQ(r.value.job.state, JobState::Failed);
    EXPECT_EQ(r.value.job.failure, ErrorClass::RemoteRejected);
    EXPECT_EQ(r.value.job.retry_count, 0);
    EXPECT_NE(r.value.job.last_error.find("AccessDenied"), std::string::npos);
    EXPECT_EQ(store.put_calls(), 1);
}

TEST_F(UploadPipelineTest, OversizedSourceFailsBeforeAnyPut) {
    options.max_object_bytes = 8;
    auto job = submit(write_source("big.bin", "0123456789"), "big.bin", 10);

    auto r = pipeline().upload(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Failed);
    EXPECT_EQ(r.value.job.failure, ErrorClass::OversizedSource);
    EXPECT_EQ(store.put_calls(), 0);
}

TEST_F(UploadPipelineTest, SourceChangedSize) {
    std::string path = write_source("grow.bin", "0123456789");
    auto job = submit(path, "grow.bin", 10);
    ASSERT_TRUE(platform::write_file_atomic(path, "0123456789AB").is_ok());

    auto r = pipeline().upload(job);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.kind, PassResult::Kind::Failed);
    EXPECT_EQ(r.value.job.failure, ErrorClass::LocalIOFailure);
    EXPECT_EQ(store.put_calls(), 0);
}

TEST_F(UploadPipelineTest, MissingSource) {
    auto job = submit((dir / "src" / "gone.bin").string(), "gone.bin", 4);
    auto r = pipeline().upload(job);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.job.failure, ErrorClass::LocalIOFailure);
}

TEST_F(UploadPipelineTest, EmptyFileCreatesEmptyObject) {
    auto job = submit(write_source("empty", ""), "empty", 0);
    auto r = pipeline().upload(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(r.value.job.final_digest, sha256_hex(""));
    EXPECT_EQ(store.put_calls(), 1);
    ASSERT_TRUE(store.has_object("empty"));
    EXPECT_EQ(store.object("empty").data, "");
}

TEST_F(UploadPipelineTest, CancelFailsTheJob) {
    auto job = submit(write_source("c.bin", "0123456789"), "c.bin", 10);
    int polls = 0;
    auto cancel_second = [&](const std::string&) {
        return ++polls == 2 ? PassControl::Cancel : PassControl::Continue;
    };

    auto r = pipeline().upload(job, cancel_second);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.kind, PassResult::Kind::Cancelled);
    EXPECT_EQ(r.value.job.state, JobState::Failed);
    EXPECT_EQ(r.value.job.failure, ErrorClass::Cancelled);
    EXPECT_EQ(r.value.job.cursor, 4u);
}

TEST_F(UploadPipelineTest, OutsideWindowPausesWithoutSending) {
    GatePolicy policy;
    policy.schedule = Schedule({parse_schedule_window("00:00-06:00").value});
    open_ledger(policy);
    auto job = submit(write_source("w.bin", "window"), "w.bin", 6);

    auto r = pipeline().upload(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(r.value.resume_at, make_utc(2025, 7, 15, 0, 0));
    EXPECT_EQ(r.value.job.state, JobState::Paused);
    EXPECT_EQ(store.put_calls(), 0);

    clock.set(r.value.resume_at);
    auto done = pipeline().upload(reload(job.id));
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.kind, PassResult::Kind::Completed);
}

TEST_F(UploadPipelineTest, ChunkAboveMonthlyLimitIsDenied) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 3;
    open_ledger(policy);
    auto job = submit(write_source("q.bin", "0123456789"), "q.bin", 10);

    auto r = pipeline().upload(job);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.kind, PassResult::Kind::Failed);
    EXPECT_EQ(r.value.job.failure, ErrorClass::PermanentlyTooLarge);
    EXPECT_EQ(store.put_calls(), 0);
}

TEST_F(UploadPipelineTest, QuotaExhaustedPausesUntilNextMonth) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 6;
    open_ledger(policy);
    auto job = submit(write_source("m.bin", "0123456789"), "m.bin", 10);

    auto r = pipeline().upload(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(r.value.job.state, JobState::Paused);
    EXPECT_EQ(r.value.job.cursor, 4u);
    EXPECT_EQ(r.value.resume_at, make_utc(2025, 8, 1));

    clock.set(r.value.resume_at);
    auto done = pipeline().upload(reload(job.id));
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(store.object("m.bin").data, "0123456789");
}

TEST_F(UploadPipelineTest, FinalRangeAckedBeforeCheckpoint) {
    const std::string data = "0123456789";
    auto job = submit(write_source("f.bin", data), "f.bin", data.size());

    int polls = 0;
    auto suspend_after_two = [&](const std::string&) {
        return ++polls > 2 ? PassControl::Suspend : PassControl::Continue;
    };
    ASSERT_TRUE(pipeline().upload(job, suspend_after_two).is_ok());
    ASSERT_EQ(reload(job.id).cursor, 8u);

    // The last range reached the store but the process died before the checkpoint.
    MemorySource tail(data.substr(8), 8);
    ASSERT_TRUE(store.put_object("f.bin", tail, 8, 2, 10, StorageClass::Standard).is_ok());
    ASSERT_TRUE(store.has_object("f.bin"));

    open_ledger(GatePolicy{});
    auto done = pipeline().upload(reload(job.id));
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.kind, PassResult::Kind::Completed) << done.value.job.last_error;
    EXPECT_EQ(done.value.job.final_digest, sha256_hex(data));
    EXPECT_EQ(store.object("f.bin").data, data);
    EXPECT_EQ(store.put_offsets(), (std::vector<uint64_t>{0, 4, 8, 8}));
}

TEST_F(UploadPipelineTest, FinalRangeAckedBeforeCheckpointOnDirectoryStore) {
    FsObjectStore disk(dir / "bucket", clock);
    const std::string data = "abcdefghij";
    auto job = submit(write_source("d.bin", data), "d.bin", data.size());

    int polls = 0;
    auto suspend_after_two = [&](const std::string&) {
        return ++polls > 2 ? PassControl::Suspend : PassControl::Continue;
    };
    UploadPipeline first(disk, *ledger, *gate, *retry, clock, sha256_factory(), options);
    ASSERT_TRUE(first.upload(job, suspend_after_two).is_ok());
    ASSERT_EQ(reload(job.id).cursor, 8u);

    MemorySource tail(data.substr(8), 8);
    ASSERT_TRUE(disk.put_object("d.bin", tail, 8, 2, 10, StorageClass::Standard).is_ok());

    open_ledger(GatePolicy{});
    UploadPipeline resumed(disk, *ledger, *gate, *retry, clock, sha256_factory(), options);
    auto done = resumed.upload(reload(job.id));
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.kind, PassResult::Kind::Completed) << done.value.job.last_error;
    EXPECT_EQ(done.value.job.final_digest, sha256_hex(data));

    auto head = disk.head_object("d.bin");
    ASSERT_TRUE(head.is_ok());
    EXPECT_EQ(head.value.size_bytes, 10u);
    auto bytes = disk.get_object_range("d.bin", 0, 10);
    ASSERT_TRUE(bytes.is_ok());
    EXPECT_EQ(bytes.value, data);
}
