#include <gtest/gtest.h>
#include <managers/transfer_gate.hpp>
#include <managers/job_ledger.hpp>
#include <platform/platform.hpp>
#include <core/log.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <atomic>
#include <thread>
#include <vector>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

class TransferGateTest : public ::testing::Test {
protected:
    fs::path dir;
    ManualClock clock{make_utc(2025, 4, 20, 12)};
    std::unique_ptr<JobLedger> ledger;

    void SetUp() override {
        dir = platform::temp_file("coldxfer_gate_test");
        set_log_dir(dir / "logs");
        ledger = std::make_unique<JobLedger>(dir / "state", clock);
    }

    void TearDown() override {
        ledger.reset();
        fs::remove_all(dir);
    }

    QuotaRecord usage() {
        auto r = ledger->load_quota(month_key(clock.now()));
        EXPECT_TRUE(r.is_ok()) << r.error;
        return r.value;
    }
};

TEST_F(TransferGateTest, UnlimitedAndAlwaysOpenProceeds) {
    TransferGate gate(*ledger, GatePolicy{});
    auto a = gate.admit(1ULL << 40, Direction::Upload, clock.now());
    ASSERT_TRUE(a.is_ok()) << a.error;
    EXPECT_EQ(a.value.kind, Admission::Kind::Proceed);
}

TEST_F(TransferGateTest, OutsideWindowWaitsUntilItOpens) {
    GatePolicy policy;
    policy.schedule = Schedule({parse_schedule_window("00:00-06:00").value});
    TransferGate gate(*ledger, policy);

    auto a = gate.admit(4096, Direction::Upload, clock.now());
    ASSERT_TRUE(a.is_ok()) << a.error;
    EXPECT_EQ(a.value.kind, Admission::Kind::WaitUntil);
    EXPECT_EQ(a.value.resume_at, make_utc(2025, 4, 21, 0, 0));
    EXPECT_EQ(usage().bytes_used, 0u);
    EXPECT_EQ(usage().upload_bytes, 0u);

    clock.set(make_utc(2025, 4, 21, 1, 0));
    auto inside = gate.admit(4096, Direction::Upload, clock.now());
    ASSERT_TRUE(inside.is_ok());
    EXPECT_EQ(inside.value.kind, Admission::Kind::Proceed);
}

TEST_F(TransferGateTest, ChunkFittedToRemainingWindow) {
    GatePolicy policy;
    policy.schedule = Schedule({parse_schedule_window("00:00-06:00").value});
    policy.throughput_bytes_per_sec = 1024;
    TransferGate gate(*ledger, policy);

    clock.set(make_utc(2025, 4, 21, 5, 59));
    // 60 s left, 120 s of work
    auto a = gate.admit(120 * 1024, Direction::Download, clock.now());
    ASSERT_TRUE(a.is_ok());
    EXPECT_EQ(a.value.kind, Admission::Kind::WaitUntil);
    EXPECT_EQ(a.value.resume_at, make_utc(2025, 4, 22, 0, 0));

    auto small = gate.admit(30 * 1024, Direction::Download, clock.now());
    ASSERT_TRUE(small.is_ok());
    EXPECT_EQ(small.value.kind, Admission::Kind::Proceed);
}

TEST_F(TransferGateTest, QuotaExhaustedWaitsForNextMonth) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 1000;
    TransferGate gate(*ledger, policy);

    ASSERT_TRUE(gate.record_usage(900, Direction::Upload, clock.now()).is_ok());

    auto fits = gate.admit(100, Direction::Upload, clock.now());
    ASSERT_TRUE(fits.is_ok());
    EXPECT_EQ(fits.value.kind, Admission::Kind::Proceed);

    auto over = gate.admit(101, Direction::Upload, clock.now());
    ASSERT_TRUE(over.is_ok());
    EXPECT_EQ(over.value.kind, Admission::Kind::WaitUntil);
    EXPECT_EQ(over.value.resume_at, make_utc(2025, 5, 1));
    EXPECT_NE(over.value.reason.find("quota"), std::string::npos);

    // A new month starts from zero
    clock.set(make_utc(2025, 5, 1, 0, 0, 1));
    auto next = gate.admit(101, Direction::Upload, clock.now());
    ASSERT_TRUE(next.is_ok());
    EXPECT_EQ(next.value.kind, Admission::Kind::Proceed);
}

TEST_F(TransferGateTest, ChunkLargerThanLimitIsDenied) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 1000;
    TransferGate gate(*ledger, policy);

    auto a = gate.admit(1001, Direction::Upload, clock.now());
    ASSERT_TRUE(a.is_ok());
    EXPECT_EQ(a.value.kind, Admission::Kind::Deny);
    EXPECT_EQ(a.value.deny_class, ErrorClass::PermanentlyTooLarge);
}

TEST_F(TransferGateTest, UnmeteredDirectionIgnoresQuota) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 1000;
    policy.count_downloads = false;
    TransferGate gate(*ledger, policy);

    ASSERT_TRUE(gate.record_usage(1000, Direction::Upload, clock.now()).is_ok());
    ASSERT_TRUE(gate.record_usage(5000, Direction::Download, clock.now()).is_ok());

    auto down = gate.admit(5000, Direction::Download, clock.now());
    ASSERT_TRUE(down.is_ok());
    EXPECT_EQ(down.value.kind, Admission::Kind::Proceed);

    auto up = gate.admit(1, Direction::Upload, clock.now());
    ASSERT_TRUE(up.is_ok());
    EXPECT_EQ(up.value.kind, Admission::Kind::WaitUntil);

    QuotaRecord q = usage();
    EXPECT_EQ(q.bytes_used, 1000u);
    EXPECT_EQ(q.upload_bytes, 1000u);
    EXPECT_EQ(q.download_bytes, 5000u);
    EXPECT_EQ(q.bytes_limit, 1000u);
}

TEST_F(TransferGateTest, UsagePersistsAcrossRestart) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 1000;
    {
        TransferGate gate(*ledger, policy);
        ASSERT_TRUE(gate.record_usage(600, Direction::Upload, clock.now()).is_ok());
    }
    ledger = std::make_unique<JobLedger>(dir / "state", clock);
    TransferGate gate(*ledger, policy);
    auto a = gate.admit(500, Direction::Upload, clock.now());
    ASSERT_TRUE(a.is_ok());
    EXPECT_EQ(a.value.kind, Admission::Kind::WaitUntil);
}

TEST_F(TransferGateTest, SequentialChunksNeverPassTheLimit) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 10000;
    TransferGate gate(*ledger, policy);

    const uint64_t chunk = 768;
    int admitted = 0;
    for (int i = 0; i < 50; ++i) {
        auto a = gate.admit(chunk, Direction::Upload, clock.now());
        ASSERT_TRUE(a.is_ok());
        if (a.value.kind != Admission::Kind::Proceed) break;
        ASSERT_TRUE(gate.commit(a.value, chunk, Direction::Upload, clock.now()).is_ok());
        ++admitted;
    }
    EXPECT_EQ(admitted, 13);
    EXPECT_LE(usage().bytes_used, policy.monthly_limit_bytes);
}

TEST_F(TransferGateTest, InFlightChunksHoldQuota) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 1000;
    TransferGate gate(*ledger, policy);
    std::string month = month_key(clock.now());

    auto first = gate.admit(600, Direction::Upload, clock.now());
    ASSERT_TRUE(first.is_ok());
    ASSERT_EQ(first.value.kind, Admission::Kind::Proceed);
    EXPECT_EQ(gate.held_bytes(month), 600u);

    // Would fit on recorded usage alone, but not with the first chunk in flight
    auto second = gate.admit(600, Direction::Upload, clock.now());
    ASSERT_TRUE(second.is_ok());
    EXPECT_EQ(second.value.kind, Admission::Kind::WaitUntil);
    EXPECT_EQ(second.value.resume_at, clock.now() + std::chrono::seconds(QUOTA_HOLD_RECHECK_SECS));

    // The first chunk failed: its hold goes away and the second fits
    gate.release(first.value);
    EXPECT_EQ(gate.held_bytes(month), 0u);
    auto retry = gate.admit(600, Direction::Upload, clock.now());
    ASSERT_TRUE(retry.is_ok());
    ASSERT_EQ(retry.value.kind, Admission::Kind::Proceed);

    ASSERT_TRUE(gate.commit(retry.value, 600, Direction::Upload, clock.now()).is_ok());
    EXPECT_EQ(gate.held_bytes(month), 0u);
    EXPECT_EQ(usage().bytes_used, 600u);

    auto over = gate.admit(600, Direction::Upload, clock.now());
    ASSERT_TRUE(over.is_ok());
    EXPECT_EQ(over.value.resume_at, make_utc(2025, 5, 1));
}

TEST_F(TransferGateTest, GuardReleasesUncommittedChunk) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 1000;
    TransferGate gate(*ledger, policy);
    std::string month = month_key(clock.now());

    {
        auto a = gate.admit(400, Direction::Download, clock.now());
        ASSERT_TRUE(a.is_ok());
        AdmissionGuard hold(gate, a.value);
        EXPECT_EQ(gate.held_bytes(month), 400u);
    }
    EXPECT_EQ(gate.held_bytes(month), 0u);
    EXPECT_EQ(usage().bytes_used, 0u);

    {
        auto a = gate.admit(400, Direction::Download, clock.now());
        ASSERT_TRUE(a.is_ok());
        AdmissionGuard hold(gate, a.value);
        ASSERT_TRUE(hold.commit(400, Direction::Download, clock.now()).is_ok());
    }
    EXPECT_EQ(gate.held_bytes(month), 0u);
    EXPECT_EQ(usage().bytes_used, 400u);
}

TEST_F(TransferGateTest, ConcurrentWorkersStayWithinLimit) {
    GatePolicy policy;
    policy.monthly_limit_bytes = 5000;
    TransferGate gate(*ledger, policy);

    const uint64_t chunk = 128;
    std::atomic<bool> failed{false};
    std::vector<std::thread> workers;
    for (int w = 0; w < 6; ++w) {
        workers.emplace_back([&] {
            for (int i = 0; i < 20; ++i) {
                auto a = gate.admit(chunk, Direction::Upload, clock.now());
                if (a.is_err()) { failed = true; return; }
                if (a.value.kind != Admission::Kind::Proceed) continue;
                AdmissionGuard hold(gate, a.value);
                if (hold.commit(chunk, Direction::Upload, clock.now()).is_err()) failed = true;
            }
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_FALSE(failed);
    EXPECT_LE(usage().bytes_used, policy.monthly_limit_bytes);
    EXPECT_GT(usage().bytes_used, policy.monthly_limit_bytes - 6 * chunk);
}
