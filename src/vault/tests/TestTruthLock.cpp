/**
 * @file TestTruthLock.cpp
 * @brief Unit tests for spc::vault::TruthLock.
 */

#include <catch2/catch_test_macros.hpp>

#include <spc/vault/TruthLock.hpp>

#include <atomic>
#include <chrono>
#include <latch>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace spc;
using namespace spc::vault;
using namespace std::chrono_literals;

namespace {

const core::TimePoint kT0 = core::fromEpochMillis(1'700'000'000'000);

class FakeLockStore final : public ILockStore {
public:
    core::ExpectedVoid save(const LockRecord &record) override
    {
        if (failSave)
            return core::makeError(core::ErrorCode::kIoError, "disk full");
        saved.push_back(record);
        return {};
    }

    core::ExpectedVoid markReleased(std::string_view lockId, core::TimePoint releasedAt, ReleaseOutcome outcome) override
    {
        if (failRelease)
            return core::makeError(core::ErrorCode::kIoError, "store offline");
        released.push_back({std::string{lockId}, releasedAt, outcome});
        return {};
    }

    core::Expected<std::optional<LockRecord>> loadUnreleased() override
    {
        return unreleased;
    }

    struct Release {
        std::string     lockId;
        core::TimePoint at;
        ReleaseOutcome  outcome;
    };

    bool                      failSave    = false;
    bool                      failRelease = false;
    std::vector<LockRecord>   saved;
    std::vector<Release>      released;
    std::optional<LockRecord> unreleased;
};

struct Fixture {
    core::ManualClock         clock{kT0};
    FakeLockStore             store;
    TruthLock                 vault{clock, store};
    std::vector<alert::Alert> alerts;

    Fixture()
    {
        vault.onRelease([this](const alert::Alert &a) { alerts.push_back(a); });
    }
};

} // namespace

TEST_CASE("Evidence hashes depend only on the payload", "[vault][evidence]")
{
    REQUIRE(evidenceHash("gps:48.85,2.35") == evidenceHash("gps:48.85,2.35"));
    REQUIRE(evidenceHash("gps:48.85,2.35") != evidenceHash("gps:48.85,2.36"));
    REQUIRE(evidenceHash("").size() == 16);
    REQUIRE(evidenceHash("") == "cbf29ce484222325");

    Fixture f;
    auto first = f.vault.addEvidence("audio", "clip-001", kT0);
    f.clock.advance(5min);
    auto second = f.vault.addEvidence("note", "clip-001");
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    REQUIRE(first->integrityHash == second->integrityHash);
    REQUIRE(f.vault.evidence().size() == 2);
}

TEST_CASE("Locking persists the record and schedules the deadline", "[vault][lock]")
{
    Fixture f;
    REQUIRE(f.vault.addEvidence("audio", "clip-001").has_value());

    auto record = f.vault.lockIncident("incident-42", 24, kT0);
    REQUIRE(record.has_value());
    REQUIRE(record->lockId == makeLockId("incident-42", kT0));
    REQUIRE(record->lockId.starts_with("lock-"));
    REQUIRE(record->lockId.size() == 21);
    REQUIRE(record->unlockDeadline == kT0 + 24h);
    REQUIRE(record->cancelWindowEnd() == kT0 + 10min);
    REQUIRE(record->evidenceHash == snapshotHash(f.vault.evidence()));

    REQUIRE(f.store.saved.size() == 1);
    REQUIRE(f.vault.isLocked());
    REQUIRE(f.vault.state(kT0) == LockState::kCancellable);
    REQUIRE(f.vault.state(kT0 + 11min) == LockState::kSealed);

    auto again = f.vault.lockIncident("incident-43", 24, kT0 + 1min);
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kAlreadyLocked);
}

TEST_CASE("Lock input is validated", "[vault][lock]")
{
    Fixture f;
    REQUIRE(f.vault.lockIncident("", 24, kT0).error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(f.vault.lockIncident("incident-1", 0, kT0).error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE(f.vault.addEvidence("", "payload").error().code() == core::ErrorCode::kInvalidArgument);
    REQUIRE_FALSE(f.vault.isLocked());
}

TEST_CASE("A failed save leaves the vault unlocked", "[vault][lock]")
{
    Fixture f;
    f.store.failSave = true;

    auto record = f.vault.lockIncident("incident-1", 24, kT0);
    REQUIRE_FALSE(record.has_value());
    REQUIRE(record.error().code() == core::ErrorCode::kIoError);
    REQUIRE_FALSE(f.vault.isLocked());
    REQUIRE(f.vault.state(kT0) == LockState::kUnlocked);
}

TEST_CASE("Cancellation window is ten minutes regardless of the deadline", "[vault][cancel]")
{
    SECTION("9m59s succeeds")
    {
        Fixture f;
        REQUIRE(f.vault.lockIncident("incident-1", 1, kT0).has_value());
        REQUIRE(f.vault.canCancel(kT0 + 9min + 59s));
        REQUIRE(f.vault.cancelLock(kT0 + 9min + 59s).has_value());
        REQUIRE(f.vault.outcome() == ReleaseOutcome::kCancelled);
        REQUIRE(f.store.released.size() == 1);
        REQUIRE(f.alerts.empty());
    }

    SECTION("10m01s fails with window expired")
    {
        Fixture f;
        REQUIRE(f.vault.lockIncident("incident-1", 72, kT0).has_value());
        REQUIRE_FALSE(f.vault.canCancel(kT0 + 10min + 1s));

        auto res = f.vault.cancelLock(kT0 + 10min + 1s);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().code() == core::ErrorCode::kWindowExpired);
        REQUIRE(f.vault.isLocked());
        REQUIRE(f.store.released.empty());
    }
}

TEST_CASE("Cancelling without a lock is a typed failure", "[vault][cancel]")
{
    Fixture f;
    REQUIRE(f.vault.cancelLock(kT0).error().code() == core::ErrorCode::kNotLocked);
    REQUIRE(f.vault.releaseEvidence(kT0).error().code() == core::ErrorCode::kNotLocked);
}

TEST_CASE("Release happens exactly once", "[vault][release]")
{
    Fixture f;
    REQUIRE(f.vault.addEvidence("location", "48.85,2.35").has_value());
    REQUIRE(f.vault.lockIncident("incident-1", 24, kT0).has_value());

    auto first = f.vault.releaseEvidence(kT0 + 1h);
    REQUIRE(first.has_value());
    REQUIRE(*first == ReleaseOutcome::kManual);
    REQUIRE(f.alerts.size() == 1);
    REQUIRE(f.alerts.front().domain == alert::Domain::kTruthLock);
    REQUIRE(f.alerts.front().level == "released_manually");
    REQUIRE(f.alerts.front().signals.size() == 1);

    auto second = f.vault.releaseEvidence(kT0 + 2h);
    REQUIRE_FALSE(second.has_value());
    REQUIRE(second.error().code() == core::ErrorCode::kAlreadyTerminal);
    REQUIRE(f.alerts.size() == 1);

    REQUIRE(f.vault.cancelLock(kT0 + 2h).error().code() == core::ErrorCode::kAlreadyTerminal);
    REQUIRE(f.vault.addEvidence("note", "late", kT0 + 2h).error().code() == core::ErrorCode::kAlreadyTerminal);
    auto tick = f.vault.tick(kT0 + 48h);
    REQUIRE(tick.has_value());
    REQUIRE_FALSE(*tick);
    REQUIRE(f.store.released.size() == 1);
}

TEST_CASE("Deadline is honoured retroactively", "[vault][deadline]")
{
    Fixture f;
    REQUIRE(f.vault.lockIncident("incident-1", 2, kT0).has_value());

    auto early = f.vault.tick(kT0 + 1h);
    REQUIRE(early.has_value());
    REQUIRE_FALSE(*early);

    // No poll between +1h and +30h.
    auto late = f.vault.tick(kT0 + 30h);
    REQUIRE(late.has_value());
    REQUIRE(*late);
    REQUIRE(f.vault.outcome() == ReleaseOutcome::kDeadline);
    REQUIRE(f.alerts.size() == 1);
    REQUIRE(f.alerts.front().level == "released_by_deadline");

    auto again = f.vault.tick(kT0 + 31h);
    REQUIRE(again.has_value());
    REQUIRE_FALSE(*again);
    REQUIRE(f.alerts.size() == 1);
}

TEST_CASE("Manual release past the deadline counts as the deadline release", "[vault][deadline]")
{
    Fixture f;
    REQUIRE(f.vault.lockIncident("incident-1", 1, kT0).has_value());

    auto res = f.vault.releaseEvidence(kT0 + 3h);
    REQUIRE(res.has_value());
    REQUIRE(*res == ReleaseOutcome::kDeadline);
    REQUIRE(f.alerts.size() == 1);
}

TEST_CASE("A store failure on release keeps the lock active", "[vault][release]")
{
    Fixture f;
    REQUIRE(f.vault.lockIncident("incident-1", 1, kT0).has_value());

    f.store.failRelease = true;
    auto failed = f.vault.tick(kT0 + 2h);
    REQUIRE_FALSE(failed.has_value());
    REQUIRE(failed.error().code() == core::ErrorCode::kIoError);
    REQUIRE(f.vault.isLocked());
    REQUIRE(f.alerts.empty());

    f.store.failRelease = false;
    auto retried = f.vault.tick(kT0 + 2h + 1s);
    REQUIRE(retried.has_value());
    REQUIRE(*retried);
    REQUIRE(f.alerts.size() == 1);
}

TEST_CASE("Restore reloads an unreleased lock", "[vault][restore]")
{
    LockRecord persisted;
    persisted.incidentId       = "incident-7";
    persisted.lockedAt         = kT0;
    persisted.autoReleaseHours = 24;
    persisted.unlockDeadline   = kT0 + 24h;
    persisted.lockId           = makeLockId(persisted.incidentId, persisted.lockedAt);
    persisted.evidenceHash     = snapshotHash({});

    SECTION("deadline still ahead")
    {
        Fixture f;
        f.store.unreleased = persisted;

        auto restored = f.vault.restore(kT0 + 5min);
        REQUIRE(restored.has_value());
        REQUIRE(*restored);
        REQUIRE(f.vault.isLocked());
        REQUIRE(f.vault.record()->lockId == persisted.lockId);
        REQUIRE(f.vault.canCancel(kT0 + 5min));
        REQUIRE(f.vault.formatCountdown(kT0 + 5min) == "23h 55m 0s");
    }

    SECTION("deadline passed while the process was down")
    {
        Fixture f;
        f.store.unreleased = persisted;

        auto restored = f.vault.restore(kT0 + 25h);
        REQUIRE(restored.has_value());
        REQUIRE(*restored);
        REQUIRE(f.vault.outcome() == ReleaseOutcome::kDeadline);
        REQUIRE(f.alerts.size() == 1);
        REQUIRE(f.store.released.size() == 1);
    }

    SECTION("nothing to restore")
    {
        Fixture f;
        auto restored = f.vault.restore(kT0);
        REQUIRE(restored.has_value());
        REQUIRE_FALSE(*restored);
        REQUIRE(f.vault.state(kT0) == LockState::kUnlocked);
    }
}

TEST_CASE("Countdown is derived from the deadline", "[vault][countdown]")
{
    Fixture f;
    REQUIRE(f.vault.formatCountdown(kT0) == "0h 0m 0s");
    REQUIRE(f.vault.lockIncident("incident-1", 24, kT0).has_value());

    REQUIRE(f.vault.countdown(kT0) == std::chrono::duration_cast<core::Duration>(24h));
    REQUIRE(f.vault.formatCountdown(kT0 + 1h + 30min + 15s + 500ms) == "22h 29m 44s");
    REQUIRE(f.vault.countdown(kT0 + 25h) == core::Duration::zero());
}

TEST_CASE("Locking again past the deadline honours the release first", "[vault][deadline]")
{
    Fixture f;
    REQUIRE(f.vault.lockIncident("incident-1", 24, kT0).has_value());

    // No tick ran: the deadline is still visible through the derived state.
    REQUIRE(f.vault.isLocked());
    REQUIRE(f.vault.state(kT0 + 25h) == LockState::kReleasedByDeadline);
    REQUIRE(f.vault.countdown(kT0 + 25h) == core::Duration::zero());

    auto again = f.vault.lockIncident("incident-2", 24, kT0 + 25h);
    REQUIRE_FALSE(again.has_value());
    REQUIRE(again.error().code() == core::ErrorCode::kAlreadyTerminal);

    REQUIRE(f.vault.outcome() == ReleaseOutcome::kDeadline);
    REQUIRE(f.store.saved.size() == 1);
    REQUIRE(f.store.released.size() == 1);
    REQUIRE(f.store.released.front().outcome == ReleaseOutcome::kDeadline);
    REQUIRE(f.alerts.size() == 1);
}

TEST_CASE("Racing cancel, release and deadline ticks settle on one outcome", "[vault][concurrency]")
{
    for (int round = 0; round < 25; ++round) {
        Fixture f;
        REQUIRE(f.vault.lockIncident("incident-race", 24, kT0).has_value());

        constexpr int kPerOperation = 2;
        std::latch       go{3 * kPerOperation};
        std::atomic<int> wins{0};
        std::atomic<int> tickWins{0};
        std::atomic<int> terminalRefusals{0};
        std::atomic<int> otherFailures{0};

        const auto settle = [&](const core::ExpectedVoid &result) {
            if (result)
                ++wins;
            else if (result.error().code() == core::ErrorCode::kAlreadyTerminal)
                ++terminalRefusals;
            else
                ++otherFailures;
        };

        std::vector<std::thread> threads;
        for (int i = 0; i < kPerOperation; ++i) {
            threads.emplace_back([&] {
                go.arrive_and_wait();
                settle(f.vault.cancelLock(kT0 + 5min));
            });
            threads.emplace_back([&] {
                go.arrive_and_wait();
                auto released = f.vault.releaseEvidence(kT0 + 5min);
                settle(released ? core::ExpectedVoid{} : core::ExpectedVoid{std::unexpected(released.error())});
            });
            threads.emplace_back([&] {
                go.arrive_and_wait();
                auto fired = f.vault.tick(kT0 + 25h);
                if (!fired)
                    ++otherFailures;
                else if (*fired)
                    ++tickWins;
            });
        }
        for (auto &t : threads)
            t.join();

        REQUIRE(otherFailures.load() == 0);
        REQUIRE(wins.load() + tickWins.load() == 1);
        REQUIRE(terminalRefusals.load() == 2 * kPerOperation - wins.load());
        REQUIRE(f.vault.isTerminal());
        REQUIRE(f.store.released.size() == 1);

        const bool cancelled = f.vault.outcome() == ReleaseOutcome::kCancelled;
        REQUIRE(f.alerts.size() == (cancelled ? 0u : 1u));
    }
}
