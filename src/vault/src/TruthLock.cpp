/**
 * @file TruthLock.cpp
 * @brief TruthLock implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-10-19
 * @copyright MIT License
 */
#include "spc/vault/TruthLock.hpp"

#include <spc/core/Assert.hpp>
#include <spc/core/Log.hpp>

#include <algorithm>
#include <chrono>
#include <format>

namespace spc::vault {

TruthLock::TruthLock(const core::IClock &clock, ILockStore &store)
    : _clock(clock), _store(store)
{
}

// ---- Evidence --------------------------------------------------------------

core::Expected<EvidenceItem> TruthLock::addEvidence(std::string type, std::string payload, core::TimePoint now)
{
    Pending pending;
    auto result = [&] {
        std::lock_guard<std::mutex> lock{_mutex};
        return addEvidenceLocked(std::move(type), std::move(payload), now, pending);
    }();
    dispatch(pending);
    return result;
}

core::Expected<EvidenceItem> TruthLock::addEvidence(std::string type, std::string payload)
{
    return addEvidence(std::move(type), std::move(payload), _clock.now());
}

// ---- Lifecycle -------------------------------------------------------------

core::Expected<LockRecord> TruthLock::lockIncident(
    std::string incidentId, core::u32 autoReleaseHours, core::TimePoint now)
{
    Pending pending;
    auto result = [&] {
        std::lock_guard<std::mutex> lock{_mutex};
        return lockIncidentLocked(std::move(incidentId), autoReleaseHours, now, pending);
    }();
    dispatch(pending);
    return result;
}

core::Expected<LockRecord> TruthLock::lockIncident(std::string incidentId, core::u32 autoReleaseHours)
{
    return lockIncident(std::move(incidentId), autoReleaseHours, _clock.now());
}

core::ExpectedVoid TruthLock::cancelLock(core::TimePoint now)
{
    Pending pending;
    auto result = [&] {
        std::lock_guard<std::mutex> lock{_mutex};
        return cancelLocked(now, pending);
    }();
    dispatch(pending);
    return result;
}

core::ExpectedVoid TruthLock::cancelLock()
{
    return cancelLock(_clock.now());
}

core::Expected<ReleaseOutcome> TruthLock::releaseEvidence(core::TimePoint now)
{
    Pending pending;
    auto result = [&] {
        std::lock_guard<std::mutex> lock{_mutex};
        return releaseEvidenceLocked(now, pending);
    }();
    dispatch(pending);
    return result;
}

core::Expected<ReleaseOutcome> TruthLock::releaseEvidence()
{
    return releaseEvidence(_clock.now());
}

core::Expected<bool> TruthLock::tick(core::TimePoint now)
{
    Pending pending;
    auto result = [&] {
        std::lock_guard<std::mutex> lock{_mutex};
        return honourDeadlineLocked(now, pending);
    }();
    dispatch(pending);
    return result;
}

core::Expected<bool> TruthLock::restore(core::TimePoint now)
{
    Pending pending;
    auto result = [&] {
        std::lock_guard<std::mutex> lock{_mutex};
        return restoreLocked(now, pending);
    }();
    dispatch(pending);
    return result;
}

void TruthLock::onRelease(ReleaseCallback callback)
{
    std::lock_guard<std::mutex> lock{_mutex};
    _onRelease = std::move(callback);
}

// ---- Derived views ---------------------------------------------------------

LockState TruthLock::state(core::TimePoint now) const
{
    std::lock_guard<std::mutex> lock{_mutex};

    if (_outcome) {
        switch (*_outcome) {
            case ReleaseOutcome::kCancelled: return LockState::kCancelled;
            case ReleaseOutcome::kManual:    return LockState::kReleasedManually;
            case ReleaseOutcome::kDeadline:  return LockState::kReleasedByDeadline;
        }
    }
    if (!_record)
        return LockState::kUnlocked;
    if (now >= _record->unlockDeadline)
        return LockState::kReleasedByDeadline;
    return now - _record->lockedAt < core::kCancelWindow ? LockState::kCancellable : LockState::kSealed;
}

bool TruthLock::isLocked() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _record.has_value() && !_outcome.has_value();
}

bool TruthLock::isTerminal() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _outcome.has_value();
}

std::optional<ReleaseOutcome> TruthLock::outcome() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _outcome;
}

std::optional<LockRecord> TruthLock::record() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _record;
}

std::vector<EvidenceItem> TruthLock::evidence() const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _evidence;
}

bool TruthLock::canCancel(core::TimePoint now) const
{
    std::lock_guard<std::mutex> lock{_mutex};
    return _record && !_outcome
        && now - _record->lockedAt < core::kCancelWindow
        && now < _record->unlockDeadline;
}

core::Duration TruthLock::countdown(core::TimePoint now) const
{
    std::lock_guard<std::mutex> lock{_mutex};
    if (!_record || _outcome)
        return core::Duration::zero();
    return std::max(core::Duration::zero(), _record->unlockDeadline - now);
}

std::string TruthLock::formatCountdown(core::TimePoint now) const
{
    const auto total   = std::chrono::duration_cast<std::chrono::seconds>(countdown(now)).count();
    const auto hours   = total / 3600;
    const auto minutes = (total % 3600) / 60;
    const auto seconds = total % 60;
    return std::format("{}h {}m {}s", hours, minutes, seconds);
}

// ---- Private ---------------------------------------------------------------

core::Expected<EvidenceItem> TruthLock::addEvidenceLocked(
    std::string type, std::string payload, core::TimePoint now, Pending &pending)
{
    if (type.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "evidence type must not be empty");

    SPC_TRY(honourDeadlineLocked(now, pending));
    if (_outcome)
        return core::makeError(core::ErrorCode::kAlreadyTerminal,
            std::format("evidence refused, lock already {}", releaseOutcomeName(*_outcome)));

    EvidenceItem item;
    item.integrityHash = evidenceHash(payload);
    item.type          = std::move(type);
    item.payload       = std::move(payload);
    item.timestamp     = now;
    _evidence.push_back(item);

    core::Log::info("VAULT", std::format("evidence added: {} ({})", item.type, item.integrityHash));
    return item;
}

core::Expected<LockRecord> TruthLock::lockIncidentLocked(
    std::string incidentId, core::u32 autoReleaseHours, core::TimePoint now, Pending &pending)
{
    SPC_TRY(honourDeadlineLocked(now, pending));

    if (_outcome)
        return core::makeError(core::ErrorCode::kAlreadyTerminal,
            std::format("lock {} already {}", _record->lockId, releaseOutcomeName(*_outcome)));
    if (_record)
        return core::makeError(core::ErrorCode::kAlreadyLocked,
            std::format("incident {} already locked as {}", _record->incidentId, _record->lockId));
    if (incidentId.empty())
        return core::makeError(core::ErrorCode::kInvalidArgument, "incident id must not be empty");
    if (autoReleaseHours == 0)
        return core::makeError(core::ErrorCode::kInvalidArgument, "auto-release delay must be at least one hour");

    LockRecord record;
    record.lockId           = makeLockId(incidentId, now);
    record.incidentId       = std::move(incidentId);
    record.lockedAt         = now;
    record.unlockDeadline   = now + std::chrono::hours{autoReleaseHours};
    record.autoReleaseHours = autoReleaseHours;
    record.evidenceHash     = snapshotHash(_evidence);

    if (auto saved = _store.save(record); !saved) {
        core::Log::error("VAULT", std::format("lock not taken, store failed: {}", saved.error().format()));
        return std::unexpected(std::move(saved.error()));
    }

    _record = record;
    core::Log::info("VAULT", std::format("incident {} sealed as {} ({} items, hash {}), auto-release in {}h",
        record.incidentId, record.lockId, _evidence.size(), record.evidenceHash, autoReleaseHours));
    return record;
}

core::ExpectedVoid TruthLock::cancelLocked(core::TimePoint now, Pending &pending)
{
    SPC_TRY_VOID(guardLockedLocked());

    if (SPC_TRY(honourDeadlineLocked(now, pending)))
        return core::makeError(core::ErrorCode::kAlreadyTerminal, "deadline passed, evidence already released");

    if (now - _record->lockedAt >= core::kCancelWindow) {
        core::Log::warn("VAULT", std::format("cancel refused for {}, cancellation window expired", _record->lockId));
        return core::makeError(core::ErrorCode::kWindowExpired, "the cancellation window has expired");
    }

    SPC_TRY_VOID(releaseLocked(ReleaseOutcome::kCancelled, now, pending));
    _evidence.clear();
    return {};
}

core::Expected<ReleaseOutcome> TruthLock::releaseEvidenceLocked(core::TimePoint now, Pending &pending)
{
    SPC_TRY_VOID(guardLockedLocked());

    if (SPC_TRY(honourDeadlineLocked(now, pending)))
        return ReleaseOutcome::kDeadline;

    SPC_TRY_VOID(releaseLocked(ReleaseOutcome::kManual, now, pending));
    return ReleaseOutcome::kManual;
}

core::Expected<bool> TruthLock::restoreLocked(core::TimePoint now, Pending &pending)
{
    if (_outcome)
        return core::makeError(core::ErrorCode::kAlreadyTerminal, "lock already reached a terminal outcome");
    if (_record)
        return core::makeError(core::ErrorCode::kAlreadyLocked, std::format("lock {} already active", _record->lockId));

    auto loaded = SPC_TRY(_store.loadUnreleased());
    if (!loaded) {
        core::Log::debug("VAULT", "no unreleased lock to restore");
        return false;
    }

    _record = std::move(*loaded);
    core::Log::info("VAULT", std::format("restored {} for incident {}", _record->lockId, _record->incidentId));

    SPC_TRY(honourDeadlineLocked(now, pending));
    return true;
}

core::ExpectedVoid TruthLock::releaseLocked(ReleaseOutcome outcome, core::TimePoint now, Pending &pending)
{
    SPC_ASSERT(_record.has_value() && !_outcome.has_value());

    if (auto marked = _store.markReleased(_record->lockId, now, outcome); !marked) {
        core::Log::error("VAULT", std::format("{} of {} not recorded: {}",
            releaseOutcomeName(outcome), _record->lockId, marked.error().format()));
        return std::unexpected(std::move(marked.error()));
    }

    _outcome = outcome;
    core::Log::info("VAULT", std::format("{} {}", _record->lockId, releaseOutcomeName(outcome)));

    if (outcome != ReleaseOutcome::kCancelled) {
        pending.alert    = makeReleaseAlert(outcome, now);
        pending.callback = _onRelease;
    }
    return {};
}

core::Expected<bool> TruthLock::honourDeadlineLocked(core::TimePoint now, Pending &pending)
{
    if (!_record || _outcome || now < _record->unlockDeadline)
        return false;

    SPC_TRY_VOID(releaseLocked(ReleaseOutcome::kDeadline, now, pending));
    return true;
}

core::ExpectedVoid TruthLock::guardLockedLocked() const
{
    if (_outcome)
        return core::makeError(core::ErrorCode::kAlreadyTerminal,
            std::format("lock already {}", releaseOutcomeName(*_outcome)));
    if (!_record)
        return core::makeError(core::ErrorCode::kNotLocked, "no incident is locked");
    return {};
}

alert::Alert TruthLock::makeReleaseAlert(ReleaseOutcome outcome, core::TimePoint now) const
{
    SPC_ASSERT(_record.has_value());

    alert::Alert out;
    out.domain    = alert::Domain::kTruthLock;
    out.level     = std::string{releaseOutcomeName(outcome)};
    out.score     = 100;
    out.reference = _record->lockId;
    out.raisedAt  = now;
    out.message   = std::format("evidence for incident {} released ({} items)", _record->incidentId, _evidence.size());

    out.signals.reserve(_evidence.size());
    for (const auto &item : _evidence)
        out.signals.push_back({item.type, 0.0, item.timestamp, item.integrityHash});
    return out;
}

void TruthLock::dispatch(Pending &pending)
{
    if (pending.alert && pending.callback)
        pending.callback(*pending.alert);
}

} // namespace spc::vault
