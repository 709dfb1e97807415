// /////////////////////////////////////////////////////////////////////////////
/// @file SafetyEngine.cpp
/// @brief SafetyEngine façade implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <spc/engine/SafetyEngine.hpp>
#include <spc/core/Log.hpp>

#include <cmath>
#include <format>
#include <mutex>

namespace spc::engine {

struct SafetyEngine::Impl
{
    Config                          config;
    const core::IClock&             clock;
    vault::ILockStore&              store;

    alert::AlertDispatcher          dispatcher;
    fusion::DangerMonitor           danger;
    fusion::CoercionMonitor         coercion;
    fusion::SituationalMonitor      situational;
    fusion::CoercionHeuristics      heuristics;
    intent::IntentCorrelator        intent;
    intent::ScreamClassifier        screams;
    biometric::VoiceprintEnrollment enrollment;

    mutable std::mutex                vaultMutex;
    std::unique_ptr<vault::TruthLock> vault;
    /// Release alerts raised while vaultMutex is held; posted after it is released.
    std::vector<alert::Alert>         heldAlerts;

    bool running{false};

    Impl(Config cfg, const core::IClock& clk, alert::IAlertSink& sink, vault::ILockStore& lockStore)
        : config{cfg}
        , clock{clk}
        , store{lockStore}
        , dispatcher{sink, config.alertWorker()}
        , danger{clock}
        , coercion{clock}
        , situational{clock}
        , heuristics{}
        , intent{clock}
        , screams{}
        , enrollment{biometric::FeatureExtractor{config.sampleRate()}}
    {
    }

    void post(const alert::Alert& a)
    {
        if (auto posted = dispatcher.post(a); !posted)
        {
            core::Log::warn("ENGINE", std::format("{} alert not delivered: {}",
                alert::domainName(a.domain), posted.error().format()));
        }
    }

    /// Runs @p fn under vaultMutex, then posts the release alerts it raised.
    template <typename Fn>
    auto withVault(Fn&& fn)
    {
        std::vector<alert::Alert> ready;
        auto result = [&] {
            std::lock_guard<std::mutex> lock{vaultMutex};
            auto out = fn();
            ready.swap(heldAlerts);
            return out;
        }();

        for (const auto& a : ready)
        {
            post(a);
        }
        return result;
    }

    /// Vault accepting evidence or a lock. An overdue vault is released
    /// first and a terminal one is replaced.
    core::Expected<vault::TruthLock*> openVaultLocked(core::TimePoint now)
    {
        if (vault && !vault->isTerminal())
        {
            SPC_TRY(vault->tick(now));
        }
        if (!vault || vault->isTerminal())
        {
            vault = std::make_unique<vault::TruthLock>(clock, store);
            vault->onRelease([this](const alert::Alert& a) { heldAlerts.push_back(a); });
        }
        return vault.get();
    }

    core::ExpectedVoid requireVaultLocked() const
    {
        if (!vault)
            return core::makeError(core::ErrorCode::kNotLocked, "no incident is locked");
        return {};
    }

    /// Heuristics keep state, so they only see input the coercion monitor accepts.
    core::ExpectedVoid requireCoercionMonitoring() const
    {
        if (!coercion.isMonitoring())
            return core::makeError(core::ErrorCode::kMonitorStopped, "coercion monitor is stopped");
        return {};
    }

    core::Expected<std::vector<fusion::CoercionCandidate>> forward(
        std::vector<fusion::CoercionCandidate> candidates, core::TimePoint at)
    {
        for (const auto& c : candidates)
        {
            SPC_TRY(coercion.addSignal(c.kind, c.value, c.description, at));
        }
        return candidates;
    }

    void onIntentConfirmed(const intent::IntentState& state)
    {
        const core::TimePoint at = state.events.empty() ? clock.now() : state.events.back().timestamp;

        alert::Alert a;
        a.domain   = alert::Domain::kIntent;
        a.level    = "confirmed";
        a.score    = static_cast<core::i32>(std::lround(state.confirmationScore));
        a.message  = std::format("distress intent confirmed ({} keywords{})",
            state.keywordCount, state.lastDropTime ? ", phone dropped" : "");
        a.raisedAt = at;
        a.signals.reserve(state.events.size());
        for (const auto& e : state.events)
        {
            a.signals.push_back({std::string{intent::intentKindName(e.kind)}, e.confidence, e.timestamp, {}});
        }

        if (config.autoLockOnIntent())
        {
            const std::string incidentId = std::format("incident-{}", core::toEpochMillis(at));
            auto record = withVault([&]() -> core::Expected<vault::LockRecord> {
                auto* v = SPC_TRY(openVaultLocked(at));
                return v->lockIncident(incidentId, config.defaultAutoReleaseHours(), at);
            });
            if (record)
                a.reference = record->lockId;
            else
                core::Log::error("ENGINE", std::format("automatic lock failed: {}", record.error().format()));
        }

        post(a);
    }
};

SafetyEngine::SafetyEngine(Config config, const core::IClock& clock, alert::IAlertSink& sink, vault::ILockStore& store)
    : impl_{std::make_unique<Impl>(config, clock, sink, store)}
{
    core::Log::setMinLevel(impl_->config.logLevel());

    impl_->danger.setAutonomousMode(impl_->config.autonomousMode());
    impl_->danger.onAlert([this](const alert::Alert& a) { impl_->post(a); });
    impl_->coercion.onAlert([this](const alert::Alert& a) { impl_->post(a); });
    impl_->situational.onAlert([this](const alert::Alert& a) { impl_->post(a); });
    impl_->intent.onConfirmed([this](const intent::IntentState& s) { impl_->onIntentConfirmed(s); });
}

SafetyEngine::~SafetyEngine()
{
    if (impl_ && impl_->running)
    {
        stop();
    }
}

// ---- Lifecycle -------------------------------------------------------------

core::ExpectedVoid SafetyEngine::start(core::TimePoint now)
{
    core::Log::info("ENGINE", "starting monitors");
    impl_->danger.start();
    impl_->coercion.start();
    impl_->situational.start();
    impl_->running = true;

    return impl_->withVault([&]() -> core::ExpectedVoid {
        if (impl_->vault && impl_->vault->isLocked())
            return {};

        auto* v = SPC_TRY(impl_->openVaultLocked(now));
        if (auto restored = v->restore(now); !restored)
        {
            core::Log::error("ENGINE", std::format("lock restore failed: {}", restored.error().format()));
            return std::unexpected(std::move(restored.error()));
        }
        return {};
    });
}

void SafetyEngine::stop()
{
    core::Log::info("ENGINE", "stopping monitors");
    impl_->danger.stop();
    impl_->coercion.stop();
    impl_->situational.stop();
    impl_->dispatcher.flush();
    impl_->running = false;
}

bool SafetyEngine::isRunning() const
{
    return impl_->running;
}

core::ExpectedVoid SafetyEngine::tick(core::TimePoint now)
{
    impl_->danger.evaluate(now);
    impl_->coercion.evaluate(now);
    impl_->situational.evaluate(now);

    return impl_->withVault([&]() -> core::ExpectedVoid {
        if (impl_->vault)
        {
            SPC_TRY(impl_->vault->tick(now));
        }
        return {};
    });
}

// ---- Capture hand-off ------------------------------------------------------

core::Expected<std::vector<fusion::CoercionCandidate>> SafetyEngine::recordTouch(double pressure, core::TimePoint at)
{
    SPC_TRY_VOID(impl_->requireCoercionMonitoring());
    auto candidates = SPC_TRY(impl_->heuristics.recordTouch(pressure, at));
    return impl_->forward(std::move(candidates), at);
}

core::Expected<std::vector<fusion::CoercionCandidate>> SafetyEngine::recordUnlock(core::TimePoint at)
{
    SPC_TRY_VOID(impl_->requireCoercionMonitoring());
    return impl_->forward(impl_->heuristics.recordUnlock(at), at);
}

core::Expected<std::vector<fusion::CoercionCandidate>> SafetyEngine::recordNavigation(std::string path, core::TimePoint at)
{
    SPC_TRY_VOID(impl_->requireCoercionMonitoring());
    return impl_->forward(impl_->heuristics.recordNavigation(std::move(path), at), at);
}

core::Expected<intent::ScreamResult> SafetyEngine::analyzeAudio(const intent::ScreamFrame& frame, core::TimePoint at)
{
    auto result = SPC_TRY(impl_->screams.analyze(frame, at));
    if (result.detected)
    {
        SPC_TRY(impl_->intent.registerEvent(intent::IntentKind::kScreamDetected, result.confidence / 100.0, at));
    }
    return result;
}

// ---- Truth Lock ------------------------------------------------------------

core::Expected<vault::EvidenceItem> SafetyEngine::addEvidence(std::string type, std::string payload, core::TimePoint now)
{
    return impl_->withVault([&]() -> core::Expected<vault::EvidenceItem> {
        auto* v = SPC_TRY(impl_->openVaultLocked(now));
        return v->addEvidence(std::move(type), std::move(payload), now);
    });
}

core::Expected<vault::LockRecord> SafetyEngine::lockIncident(std::string incidentId, core::TimePoint now)
{
    return lockIncident(std::move(incidentId), impl_->config.defaultAutoReleaseHours(), now);
}

core::Expected<vault::LockRecord> SafetyEngine::lockIncident(
    std::string incidentId, core::u32 autoReleaseHours, core::TimePoint now)
{
    return impl_->withVault([&]() -> core::Expected<vault::LockRecord> {
        auto* v = SPC_TRY(impl_->openVaultLocked(now));
        return v->lockIncident(std::move(incidentId), autoReleaseHours, now);
    });
}

core::ExpectedVoid SafetyEngine::cancelLock(core::TimePoint now)
{
    return impl_->withVault([&]() -> core::ExpectedVoid {
        SPC_TRY_VOID(impl_->requireVaultLocked());
        return impl_->vault->cancelLock(now);
    });
}

core::Expected<vault::ReleaseOutcome> SafetyEngine::releaseEvidence(core::TimePoint now)
{
    return impl_->withVault([&]() -> core::Expected<vault::ReleaseOutcome> {
        SPC_TRY_VOID(impl_->requireVaultLocked());
        return impl_->vault->releaseEvidence(now);
    });
}

// ---- Components ------------------------------------------------------------

fusion::DangerMonitor& SafetyEngine::danger() noexcept { return impl_->danger; }
fusion::CoercionMonitor& SafetyEngine::coercion() noexcept { return impl_->coercion; }
fusion::SituationalMonitor& SafetyEngine::situational() noexcept { return impl_->situational; }
intent::IntentCorrelator& SafetyEngine::intent() noexcept { return impl_->intent; }
biometric::VoiceprintEnrollment& SafetyEngine::enrollment() noexcept { return impl_->enrollment; }
alert::AlertDispatcher& SafetyEngine::dispatcher() noexcept { return impl_->dispatcher; }

std::optional<VaultSnapshot> SafetyEngine::truthLock(core::TimePoint now) const
{
    std::lock_guard<std::mutex> lock{impl_->vaultMutex};
    if (!impl_->vault)
        return std::nullopt;

    const auto& v = *impl_->vault;
    VaultSnapshot snapshot;
    snapshot.state     = v.state(now);
    snapshot.record    = v.record();
    snapshot.outcome   = v.outcome();
    snapshot.evidence  = v.evidence();
    snapshot.countdown = v.countdown(now);
    return snapshot;
}

SafetyStatus SafetyEngine::status(core::TimePoint now) const
{
    SafetyStatus s;

    const auto danger = impl_->danger.state();
    s.dangerLevel = danger.level;
    s.dangerScore = danger.score;

    const auto coercion = impl_->coercion.state();
    s.coercionLevel = coercion.level;
    s.coercionScore = coercion.score;
    s.silentMode    = impl_->coercion.silentMode();

    const auto situational = impl_->situational.state();
    s.situationalLevel = situational.level;
    s.situationalScore = situational.score;

    const auto intent = impl_->intent.evaluate(now);
    s.intentConfirmed = intent.confirmed;
    s.intentScore     = intent.confirmationScore;

    std::lock_guard<std::mutex> lock{impl_->vaultMutex};
    if (impl_->vault)
    {
        s.lockState     = impl_->vault->state(now);
        s.lockCountdown = impl_->vault->countdown(now);
    }
    return s;
}

const Config& SafetyEngine::config() const noexcept
{
    return impl_->config;
}

} // namespace spc::engine
