#include <gtest/gtest.h>
#include <managers/download_pipeline.hpp>
#include <managers/job_ledger.hpp>
#include <platform/platform.hpp>
#include <platform/durable_file.hpp>
#include <core/log.hpp>
#include "fake_object_store.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class DownloadPipelineTest : public ::testing::Test {
protected:
    fs::path dir;
    ManualClock clock{make_utc(2025, 9, 9, 10)};
    FakeObjectStore store;
    std::unique_ptr<JobLedger> ledger;
    std::unique_ptr<TransferGate> gate;
    std::unique_ptr<RetryController> retry;
    std::unique_ptr<RestoreOrchestrator> restore;
    PipelineOptions options;

    struct Progress {
        uint64_t done;
        uint64_t total;
    };
    std::vector<Progress> progress;

    void SetUp() override {
        dir = platform::temp_file("coldxfer_download_test");
        fs::create_directories(dir / "dst");
        set_log_dir(dir / "logs");
        options.chunk_bytes = 4;
        open_ledger();
    }

    void TearDown() override {
        restore.reset();
        retry.reset();
        gate.reset();
        ledger.reset();
        fs::remove_all(dir);
    }

    void open_ledger() {
        ledger = std::make_unique<JobLedger>(dir / "state", clock);
        gate = std::make_unique<TransferGate>(*ledger, GatePolicy{});
        RetryPolicy rp;
        rp.base = 1000ms;
        rp.cap = 4000ms;
        rp.seed = 9;
        retry = std::make_unique<RetryController>(*ledger, rp);
        RestorePolicy policy;
        policy.poll = 900s;
        restore = std::make_unique<RestoreOrchestrator>(store, *ledger, policy);
    }

    DownloadPipeline pipeline() {
        return DownloadPipeline(store, *ledger, *gate, *retry, *restore, clock,
                                sha256_factory(), options);
    }

    Result<PassResult> run(const TransferJob& job, const ControlCheck& control = {}) {
        return pipeline().download(job, control,
            [this](const std::string&, uint64_t done, uint64_t total) {
                progress.push_back(Progress{done, total});
            });
    }

    TransferJob submit(const std::string& key, const std::string& name) {
        auto r = ledger->create(make_download_job(key, (dir / "dst" / name).string(),
                                                  clock.now()));
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value.job;
    }

    TransferJob reload(const std::string& id) {
        auto r = ledger->find(id);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }

    std::string local(const std::string& name) {
        auto r = platform::read_file(dir / "dst" / name);
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }
};

TEST_F(DownloadPipelineTest, DownloadsReadableObject) {
    const std::string data = "the quick brown";
    store.add_object("docs/fox.txt", data);
    auto job = submit("docs/fox.txt", "fox.txt");

    auto r = run(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(r.value.job.size_bytes, data.size());
    EXPECT_EQ(r.value.job.final_digest, sha256_hex(data));
    EXPECT_EQ(local("fox.txt"), data);
    EXPECT_FALSE(fs::exists(partial_path((dir / "dst" / "fox.txt").string())));
    EXPECT_EQ(store.restore_calls(), 0);

    ASSERT_EQ(progress.size(), 4u);
    EXPECT_EQ(progress[0].done, 4u);
    EXPECT_EQ(progress.back().done, data.size());
    EXPECT_EQ(progress.back().total, data.size());

    auto q = ledger->load_quota(month_key(clock.now()));
    ASSERT_TRUE(q.is_ok());
    EXPECT_EQ(q.value.download_bytes, data.size());
    EXPECT_EQ(q.value.upload_bytes, 0u);
}

TEST_F(DownloadPipelineTest, ArchivedObjectWaitsForRestore) {
    const std::string data = "deep archive payload";
    store.add_object("vault/a", data, StorageClass::DeepArchive);
    auto job = submit("vault/a", "a");

    auto first = run(job);
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_EQ(first.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(first.value.job.state, JobState::WaitingOnRestore);
    EXPECT_EQ(first.value.resume_at, clock.now() + 900s);
    EXPECT_EQ(store.get_calls(), 0);
    EXPECT_FALSE(fs::exists(dir / "dst" / "a"));

    clock.set(first.value.resume_at);
    auto second = run(reload(job.id));
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(second.value.job.state, JobState::WaitingOnRestore);

    store.finish_restore("vault/a");
    clock.set(second.value.resume_at);
    auto done = run(reload(job.id));
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(local("a"), data);
    EXPECT_EQ(store.restore_calls(), 1);
    EXPECT_FALSE(ledger->find_ticket("vault/a").value.has_value());
}

TEST_F(DownloadPipelineTest, ResumesFromCheckpoint) {
    std::string data;
    for (int i = 0; i < 18; ++i) data += static_cast<char>('A' + i);
    store.add_object("big", data);
    auto job = submit("big", "big");

    int polls = 0;
    auto suspend = [&](const std::string&) {
        // One poll before the restore check, then one per chunk
        return ++polls > 3 ? PassControl::Suspend : PassControl::Continue;
    };
    auto first = run(job, suspend);
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_EQ(first.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(reload(job.id).cursor, 8u);

    // Bytes written after the last checkpoint must not survive
    std::string part = partial_path((dir / "dst" / "big").string());
    {
        std::ofstream junk(part, std::ios::binary | std::ios::app);
        junk << "zz";
    }

    open_ledger();
    auto done = run(reload(job.id));
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(done.value.job.final_digest, sha256_hex(data));
    EXPECT_EQ(local("big"), data);
    EXPECT_EQ(store.get_calls(), 5);
}

TEST_F(DownloadPipelineTest, LapsedRestoreIsRequestedAgain) {
    const std::string data = "glacier object!!";
    store.add_object("g", data, StorageClass::Glacier);
    store.set_restore("g", RestoreStatus::Restored);
    auto job = submit("g", "g");

    int polls = 0;
    auto expire_mid_transfer = [&](const std::string&) {
        if (++polls == 3) store.expire_restore("g");
        return PassControl::Continue;
    };
    auto first = run(job, expire_mid_transfer);
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_EQ(first.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(first.value.job.state, JobState::WaitingOnRestore);
    EXPECT_EQ(first.value.job.cursor, 4u);

    auto second = run(reload(job.id));
    ASSERT_TRUE(second.is_ok()) << second.error;
    EXPECT_EQ(second.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(store.restore_calls(), 1);

    store.finish_restore("g");
    auto done = run(reload(job.id));
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(local("g"), data);
    EXPECT_EQ(store.restore_calls(), 1);
}

TEST_F(DownloadPipelineTest, ObjectChangedSizeIsRejected) {
    store.add_object("moving", "12345678");
    auto job = submit("moving", "moving");

    int polls = 0;
    auto suspend = [&](const std::string&) {
        return ++polls > 2 ? PassControl::Suspend : PassControl::Continue;
    };
    ASSERT_TRUE(run(job, suspend).is_ok());
    EXPECT_EQ(reload(job.id).size_bytes, 8u);

    store.add_object("moving", "1234567890");
    auto r = run(reload(job.id));
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.kind, PassResult::Kind::Failed);
    EXPECT_EQ(r.value.job.failure, ErrorClass::RemoteRejected);
}

TEST_F(DownloadPipelineTest, ShortReadIsRetried) {
    store.add_object("short", "abcdefgh");
    auto job = submit("short", "short");
    store.short_read_next();

    auto first = run(job);
    ASSERT_TRUE(first.is_ok()) << first.error;
    EXPECT_EQ(first.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(first.value.job.state, JobState::Retrying);
    EXPECT_EQ(first.value.job.cursor, 0u);
    EXPECT_EQ(reload(job.id).retry_count, 1);

    clock.set(first.value.resume_at);
    auto done = run(reload(job.id));
    ASSERT_TRUE(done.is_ok()) << done.error;
    EXPECT_EQ(done.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(done.value.job.retry_count, 0);
    EXPECT_EQ(local("short"), "abcdefgh");
}

TEST_F(DownloadPipelineTest, MissingKeyFails) {
    auto job = submit("nope", "nope");
    auto r = run(job);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.kind, PassResult::Kind::Failed);
    EXPECT_EQ(r.value.job.failure, ErrorClass::RemoteRejected);
    EXPECT_FALSE(fs::exists(dir / "dst" / "nope"));
}

TEST_F(DownloadPipelineTest, HeadTimeoutIsTransient) {
    store.add_object("slow", "data");
    auto job = submit("slow", "slow");
    store.fail_heads(FakeObjectStore::network());

    auto r = run(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Rescheduled);
    EXPECT_EQ(r.value.job.state, JobState::Retrying);
}

TEST_F(DownloadPipelineTest, EmptyObject) {
    store.add_object("zero", "");
    auto job = submit("zero", "zero");

    auto r = run(job);
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Completed);
    EXPECT_EQ(r.value.job.final_digest, sha256_hex(""));
    EXPECT_TRUE(fs::exists(dir / "dst" / "zero"));
    EXPECT_EQ(local("zero"), "");
    EXPECT_EQ(store.get_calls(), 0);
    ASSERT_EQ(progress.size(), 1u);
    EXPECT_EQ(progress[0].total, 0u);
}

TEST_F(DownloadPipelineTest, FilePublishedBeforeCompletionWasRecorded) {
    const std::string data = "abcdefgh";
    store.add_object("late", data);
    auto job = submit("late", "late");

    // Every chunk checkpointed and the .part renamed, then the process died.
    auto digest = sha256_factory()();
    digest->update(data.data(), data.size());
    ASSERT_TRUE(ledger->set_size(job.id, data.size()).is_ok());
    ASSERT_TRUE(ledger->transition(job.id, JobState::Streaming).is_ok());
    ASSERT_TRUE(ledger->checkpoint(job.id, data.size(), digest->save_state()).is_ok());
    ASSERT_TRUE(platform::write_file_atomic(dir / "dst" / "late", data).is_ok());

    auto r = run(reload(job.id));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Completed) << r.value.job.last_error;
    EXPECT_EQ(r.value.job.state, JobState::Completed);
    EXPECT_EQ(r.value.job.final_digest, sha256_hex(data));
    EXPECT_EQ(local("late"), data);
    EXPECT_FALSE(fs::exists(partial_path((dir / "dst" / "late").string())));
    EXPECT_EQ(store.get_calls(), 0);
}

TEST_F(DownloadPipelineTest, CheckpointedCursorWithoutFileStillFails) {
    store.add_object("lost", "abcdefgh");
    auto job = submit("lost", "lost");

    auto digest = sha256_factory()();
    digest->update("abcd", 4);
    ASSERT_TRUE(ledger->set_size(job.id, 8).is_ok());
    ASSERT_TRUE(ledger->transition(job.id, JobState::Streaming).is_ok());
    ASSERT_TRUE(ledger->checkpoint(job.id, 4, digest->save_state()).is_ok());

    auto r = run(reload(job.id));
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.kind, PassResult::Kind::Failed);
    EXPECT_EQ(r.value.job.failure, ErrorClass::LocalIOFailure);
}
