#include "incidentguard/orchestrator.hpp"
#include "incidentguard/agent_harness.hpp"
#include "incidentguard/exceptions.hpp"

#include <algorithm>
#include <array>
#include <iostream>
#include <unordered_set>

namespace incidentguard {

namespace {

constexpr std::array<IncidentCategory, 4> kAllCategories = {
    IncidentCategory::InfrastructureCascade,
    IncidentCategory::ResourceExhaustion,
    IncidentCategory::Security,
    IncidentCategory::LatencyDegradation
};

EventType circuit_event(BreakerState state) {
    switch (state) {
        case BreakerState::Open:     return EventType::CircuitOpened;
        case BreakerState::HalfOpen: return EventType::CircuitHalfOpened;
        case BreakerState::Closed:   return EventType::CircuitClosed;
    }
    return EventType::CircuitClosed;
}

MonitorEvent incident_event(EventType type, const Incident& incident, std::string message) {
    MonitorEvent event;
    event.type = type;
    event.incident_id = incident.id;
    event.state = incident.state;
    event.message = std::move(message);
    return event;
}

} // anonymous namespace

// Per-incident working state, owned by the incident's worker thread
struct Orchestrator::IncidentContext {
    Incident incident;
    Version version{0};
    Timestamp started{};
    Timestamp deadline{};
    std::shared_ptr<std::atomic<bool>> cancel;
    std::vector<Finding> findings;
    std::vector<DispatchFailure> failures;
    std::optional<ConsensusDecision> last_decision;
};

struct Orchestrator::RoundOutcome {
    std::vector<Finding> findings;
    std::vector<AgentRole> excluded;
    bool abandoned{false};
};

Orchestrator::Orchestrator(std::vector<Agent> agents,
                           std::shared_ptr<RemediationExecutor> executor,
                           Config config,
                           std::shared_ptr<CircuitBreakerRegistry> breakers,
                           std::shared_ptr<IncidentLedger> ledger,
                           std::unique_ptr<ExecutionPolicy> policy)
    : config_(std::move(config))
    , agents_(std::move(agents))
    , breakers_(std::move(breakers))
    , ledger_(std::move(ledger))
    , engine_(config_.consensus)
    , driver_(config_.resolution, std::move(executor), std::move(policy))
{
    if (agents_.empty()) {
        throw InvalidConfigurationException("Orchestrator needs at least one agent");
    }

    std::vector<AgentRole> roles;
    std::unordered_set<AgentRole, EnumHash> seen;
    for (const auto& agent : agents_) {
        if (!seen.insert(agent.role()).second) {
            throw InvalidConfigurationException(
                std::string("Duplicate agent role: ") + to_string(agent.role()));
        }
        roles.push_back(agent.role());
    }

    if (!breakers_) {
        breakers_ = std::make_shared<CircuitBreakerRegistry>(roles, config_.breaker);
    } else {
        for (AgentRole role : roles) {
            if (!breakers_->contains(role)) {
                throw InvalidConfigurationException(
                    std::string("No circuit breaker for role ") + to_string(role));
            }
        }
    }

    if (!ledger_) {
        ledger_ = std::make_shared<IncidentLedger>(config_.ledger);
    }
    skip_recorded_ids();

    if (config_.runtime.event_queue_capacity == 0) {
        throw InvalidConfigurationException("event_queue_capacity must be at least 1");
    }

    build_weight_tables();
}

Orchestrator::~Orchestrator() {
    stop();
}

void Orchestrator::build_weight_tables() {
    WeightTable defaults;
    for (const auto& agent : agents_) {
        defaults[agent.role()] = agent.weight();
    }

    for (IncidentCategory category : kAllCategories) {
        auto it = config_.consensus.category_weights.find(category);
        WeightTable table = (it != config_.consensus.category_weights.end()) ? it->second : defaults;

        for (const auto& [role, weight] : table) {
            (void)weight;
            bool known = std::any_of(agents_.begin(), agents_.end(),
                                     [role = role](const Agent& a) { return a.role() == role; });
            if (!known) {
                throw InvalidConfigurationException(
                    std::string("Weight table for ") + to_string(category) +
                    " names unconfigured role " + to_string(role));
            }
        }
        ConsensusEngine::validate_weights(table);
        weights_[category] = std::move(table);
    }
}

// ==================== Intake ====================

IncidentId Orchestrator::submit_alert(AlertPayload alert) {
    if (alert.description.empty()) {
        throw InvalidAlertException("Alert description must not be empty");
    }

    std::lock_guard<std::mutex> workers_lock(workers_mutex_);
    if (!running_) {
        throw IncidentGuardException("Orchestrator is stopped");
    }
    reap_finished_workers();

    auto ctx = std::make_unique<IncidentContext>();
    ctx->incident.category = alert.category;
    ctx->incident.severity = alert.severity;
    ctx->incident.description = std::move(alert.description);
    ctx->incident.evidence = std::move(alert.evidence);
    ctx->incident.opened_at = WallClock::now();
    ctx->incident.state = IncidentState::Pending;
    ctx->started = Clock::now();
    ctx->deadline = ctx->started + config_.resolution.incident_timeout;
    ctx->cancel = std::make_shared<std::atomic<bool>>(false);

    LedgerEvent opened;
    opened.type = LedgerEventType::Opened;
    opened.message = ctx->incident.description;
    opened.state = IncidentState::Pending;

    // A new stream must start at version 0; a conflict means another
    // writer on a shared ledger took the ID first
    for (;;) {
        ctx->incident.id = next_incident_id_++;
        opened.incident_id = ctx->incident.id;
        opened.incident = ctx->incident;
        try {
            ctx->version = ledger_->append(ctx->incident.id, 0, opened);
            break;
        } catch (const ConcurrentModificationException&) {
            skip_recorded_ids();
        }
    }
    const IncidentId id = ctx->incident.id;

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        incidents_[id] = ctx->incident;
        cancel_flags_[id] = ctx->cancel;
    }

    workers_.emplace(id, std::thread([this, id, ctx = std::move(ctx)]() {
        run_incident(*ctx);
        std::lock_guard<std::mutex> lock(workers_mutex_);
        finished_workers_.push_back(id);
    }));

    return id;
}

// ==================== Incident worker ====================

void Orchestrator::run_incident(IncidentContext& ctx) {
    IncidentLifecycle lifecycle;
    const IncidentCategory category = ctx.incident.category;

    emit_event(incident_event(EventType::IncidentOpened, ctx.incident,
        std::string(to_string(ctx.incident.category)) + " / " +
        to_string(ctx.incident.severity) + ": " + ctx.incident.description));

    try {
        transition(ctx, lifecycle, IncidentState::Analyzing,
                   LedgerEventType::StateChanged, "dispatching to agents");

        for (RoundNumber round = 1;; ++round) {
            RoundOutcome outcome = run_round(ctx, round);
            if (outcome.abandoned) {
                abandon(ctx, lifecycle,
                        std::string(deadline_passed(ctx) ? "incident deadline reached"
                                                         : "orchestrator stopped") +
                        " during round " + std::to_string(round));
                return;
            }

            transition(ctx, lifecycle, IncidentState::Deciding, LedgerEventType::StateChanged,
                       "round " + std::to_string(round) + " complete");

            ConsensusResult result = engine_.decide(ctx.incident.id, round, category,
                                                    outcome.findings, weights_.at(category),
                                                    outcome.excluded);

            LedgerEvent recorded;
            recorded.round = round;
            recorded.message = result.reason;
            MonitorEvent published = incident_event(EventType::QuorumFailed, ctx.incident, result.reason);
            published.round = round;
            if (result.reached()) {
                ctx.last_decision = result.decision;
                recorded.type = LedgerEventType::ConsensusReached;
                recorded.decision = result.decision;
                published.type = EventType::ConsensusReached;
                published.decision = result.decision;
            } else {
                recorded.type = LedgerEventType::QuorumFailed;
            }
            append(ctx, std::move(recorded));
            emit_event(std::move(published));

            if (result.decision) {
                for (AgentRole role : result.decision->suspected_roles) {
                    MonitorEvent suspect = incident_event(EventType::AgentSuspected, ctx.incident,
                        std::string(to_string(role)) + " set aside as a suspected Byzantine agent");
                    suspect.round = round;
                    suspect.role = role;
                    emit_event(std::move(suspect));
                }
            }

            if (deadline_passed(ctx) || ctx.cancel->load()) {
                abandon(ctx, lifecycle, "incident deadline reached while deciding");
                return;
            }

            DriverVerdict verdict = driver_.decide(ctx.incident, result, round,
                                                   Clock::now() < ctx.deadline);

            if (verdict.verdict == Verdict::AnotherRound) {
                transition(ctx, lifecycle, IncidentState::Analyzing,
                           LedgerEventType::StateChanged, verdict.message);
                continue;
            }
            if (verdict.verdict == Verdict::Escalate) {
                escalate(ctx, lifecycle,
                         verdict.reason.value_or(EscalationReason::BelowThreshold),
                         verdict.message);
                return;
            }

            transition(ctx, lifecycle, IncidentState::Executing,
                       LedgerEventType::StateChanged, verdict.message);

            const ConsensusDecision& decision = *result.decision;
            ExecutionOutcome executed = driver_.execute(ctx.incident, decision, ctx.deadline);

            if (executed.success) {
                LedgerEvent done;
                done.type = LedgerEventType::ActionExecuted;
                done.round = round;
                done.message = executed.message;
                done.decision = decision;
                append(ctx, std::move(done));

                MonitorEvent action = incident_event(EventType::ActionExecuted, ctx.incident,
                                                     "'" + decision.action + "' succeeded");
                action.round = round;
                action.decision = decision;
                emit_event(std::move(action));

                transition(ctx, lifecycle, IncidentState::Resolved,
                           LedgerEventType::Resolved, executed.message);

                MonitorEvent resolved = incident_event(EventType::Resolved, ctx.incident,
                                                       "resolved by '" + decision.action + "'");
                resolved.round = round;
                resolved.elapsed_ms = std::chrono::duration<double, std::milli>(
                    Clock::now() - ctx.started).count();
                emit_event(std::move(resolved));
                mark_state(ctx.incident.id, IncidentState::Resolved);
                return;
            }

            if (executed.timed_out && deadline_passed(ctx)) {
                abandon(ctx, lifecycle, "incident deadline reached while executing '" +
                                        decision.action + "'");
                return;
            }

            LedgerEvent failed;
            failed.type = LedgerEventType::ActionFailed;
            failed.round = round;
            failed.message = executed.message;
            failed.decision = decision;
            append(ctx, std::move(failed));

            std::string undo = roll_back(ctx, decision, round);

            escalate(ctx, lifecycle,
                     executed.timed_out ? EscalationReason::ActionTimedOut
                                        : EscalationReason::ActionFailed,
                     undo.empty() ? executed.message : executed.message + "; " + undo);
            return;
        }
    } catch (const ConcurrentModificationException& e) {
        fail_unrecorded(ctx, e.what());
    } catch (const LedgerTimeoutException& e) {
        fail_unrecorded(ctx, e.what());
    } catch (const std::exception& e) {
        fail_internal(ctx, lifecycle, e.what());
    }
}

Orchestrator::RoundOutcome Orchestrator::run_round(IncidentContext& ctx, RoundNumber round) {
    RoundOutcome outcome;

    LedgerEvent started;
    started.type = LedgerEventType::RoundStarted;
    started.round = round;
    started.message = "round " + std::to_string(round);
    append(ctx, std::move(started));

    MonitorEvent round_event = incident_event(EventType::RoundStarted, ctx.incident,
                                              "round " + std::to_string(round));
    round_event.round = round;
    emit_event(std::move(round_event));

    // Only roles weighted for this category are dispatched
    const WeightTable& table = weights_.at(ctx.incident.category);

    struct Dispatch {
        const Agent* agent;
        CircuitBreaker* breaker;
    };
    std::vector<Dispatch> dispatched;
    Duration longest = Duration::zero();

    for (const auto& agent : agents_) {
        if (table.count(agent.role()) == 0) continue;

        CircuitBreaker& breaker = breakers_->breaker(agent.role());
        DispatchPermit permit = breaker.try_dispatch();
        if (!permit) {
            outcome.excluded.push_back(agent.role());
            continue;
        }
        if (permit.transition == BreakerState::HalfOpen) {
            MonitorEvent trial;
            trial.type = EventType::CircuitHalfOpened;
            trial.incident_id = ctx.incident.id;
            trial.role = agent.role();
            trial.breaker_state = BreakerState::HalfOpen;
            trial.message = std::string(agent.name()) + " gets a trial call";
            emit_event(std::move(trial));
        }
        dispatched.push_back({&agent, &breaker});
        longest = std::max(longest, agent.timeout());
    }

    Timestamp round_deadline = std::min(Clock::now() + longest, ctx.deadline);

    struct Slot {
        DispatchResult result;
        std::optional<BreakerState> breaker_transition;
    };
    std::vector<Slot> slots(dispatched.size());
    std::mutex slots_mutex;
    std::condition_variable slots_cv;
    std::size_t completed = 0;

    const Incident snapshot = ctx.incident;
    const Timestamp incident_deadline = ctx.deadline;
    std::shared_ptr<const std::atomic<bool>> cancel = ctx.cancel;

    std::vector<std::thread> threads;
    threads.reserve(dispatched.size());
    try {
        for (std::size_t i = 0; i < dispatched.size(); ++i) {
            threads.emplace_back([&, i]() {
                // Each agent is bounded by its own timeout; the incident
                // deadline only cancels
                AgentHarness harness(*dispatched[i].agent, dispatched[i].breaker);
                DispatchResult result = harness.invoke(snapshot, round, incident_deadline, cancel);
                {
                    std::lock_guard<std::mutex> lock(slots_mutex);
                    slots[i].result = std::move(result);
                    slots[i].breaker_transition = harness.breaker_transition();
                    ++completed;
                }
                slots_cv.notify_all();
            });
        }
    } catch (...) {
        ctx.cancel->store(true);
        for (auto& t : threads) {
            t.join();
        }
        throw;
    }

    {
        std::unique_lock<std::mutex> lock(slots_mutex);
        slots_cv.wait_until(lock, round_deadline, [&]() {
            return completed == dispatched.size() || cancel->load();
        });
    }
    if (deadline_passed(ctx)) {
        ctx.cancel->store(true);
    }
    // Every harness call ends by its agent's timeout or the incident
    // deadline, so joins are short
    for (auto& t : threads) {
        t.join();
    }

    for (std::size_t i = 0; i < slots.size(); ++i) {
        const Agent& agent = *dispatched[i].agent;
        Slot& slot = slots[i];

        if (slot.breaker_transition) {
            MonitorEvent circuit;
            circuit.type = circuit_event(*slot.breaker_transition);
            circuit.incident_id = ctx.incident.id;
            circuit.role = agent.role();
            circuit.breaker_state = slot.breaker_transition;
            circuit.message = agent.name() + " breaker now " + to_string(*slot.breaker_transition);
            emit_event(std::move(circuit));
        }

        if (slot.result.ok()) {
            const Finding& finding = *slot.result.finding;
            ctx.findings.push_back(finding);
            outcome.findings.push_back(finding);

            LedgerEvent recorded;
            recorded.type = LedgerEventType::FindingRecorded;
            recorded.round = round;
            recorded.message = agent.name();
            recorded.finding = finding;
            append(ctx, std::move(recorded));

            MonitorEvent event = incident_event(EventType::FindingRecorded, ctx.incident,
                agent.name() + " recommends '" + finding.action + "'");
            event.round = round;
            event.role = agent.role();
            event.finding = finding;
            emit_event(std::move(event));
        } else {
            const DispatchFailure& failure = *slot.result.failure;
            ctx.failures.push_back(failure);
            outcome.excluded.push_back(agent.role());

            LedgerEvent recorded;
            recorded.type = LedgerEventType::DispatchFailed;
            recorded.round = round;
            recorded.message = failure.message;
            recorded.failure = failure;
            append(ctx, std::move(recorded));

            MonitorEvent event = incident_event(EventType::DispatchFailed, ctx.incident,
                agent.name() + ": " + failure.message);
            event.round = round;
            event.role = agent.role();
            event.failure_kind = failure.kind;
            emit_event(std::move(event));
        }
    }

    outcome.abandoned = deadline_passed(ctx) || cancel->load();
    return outcome;
}

void Orchestrator::transition(IncidentContext& ctx, IncidentLifecycle& lifecycle, IncidentState to,
                              LedgerEventType type, const std::string& message,
                              std::optional<EscalationReason> reason) {
    lifecycle.advance(to);
    ctx.incident.state = to;

    LedgerEvent event;
    event.type = type;
    event.message = message;
    event.state = to;
    event.escalation_reason = reason;
    append(ctx, std::move(event));

    // Terminal states become visible only after their event is published
    if (!is_terminal(to)) {
        mark_state(ctx.incident.id, to);
    }
}

void Orchestrator::escalate(IncidentContext& ctx, IncidentLifecycle& lifecycle,
                            EscalationReason reason, const std::string& message) {
    transition(ctx, lifecycle, IncidentState::Escalating,
               LedgerEventType::StateChanged, message, reason);

    EscalationRecord record = make_escalation(ctx, reason, message);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        escalations_[ctx.incident.id] = record;
    }

    transition(ctx, lifecycle, IncidentState::EscalatedOpen,
               LedgerEventType::Escalated, message, reason);

    MonitorEvent event = incident_event(EventType::Escalated, ctx.incident,
        std::string(to_string(reason)) + ": " + message);
    event.escalation = std::move(record);
    event.decision = ctx.last_decision;
    event.elapsed_ms = std::chrono::duration<double, std::milli>(
        Clock::now() - ctx.started).count();
    emit_event(std::move(event));
    mark_state(ctx.incident.id, IncidentState::EscalatedOpen);
}

void Orchestrator::abandon(IncidentContext& ctx, IncidentLifecycle& lifecycle,
                           const std::string& message) {
    // Outstanding provider calls see this and may stop early
    ctx.cancel->store(true);

    EscalationRecord record = make_escalation(ctx, EscalationReason::Abandoned, message);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        escalations_[ctx.incident.id] = record;
    }

    transition(ctx, lifecycle, IncidentState::Abandoned,
               LedgerEventType::Abandoned, message, EscalationReason::Abandoned);

    MonitorEvent event = incident_event(EventType::Abandoned, ctx.incident, message);
    event.escalation = std::move(record);
    event.elapsed_ms = std::chrono::duration<double, std::milli>(
        Clock::now() - ctx.started).count();
    emit_event(std::move(event));
    mark_state(ctx.incident.id, IncidentState::Abandoned);
}

void Orchestrator::fail_internal(IncidentContext& ctx, IncidentLifecycle& lifecycle,
                                 const std::string& message) {
    std::cerr << "[IncidentGuard] incident " << ctx.incident.id
              << " hit an internal error: " << message << std::endl;
    try {
        if (IncidentLifecycle::is_valid_transition(lifecycle.state(), IncidentState::Escalating)) {
            escalate(ctx, lifecycle, EscalationReason::InternalError, "internal error: " + message);
        } else {
            abandon(ctx, lifecycle, "internal error: " + message);
        }
    } catch (const std::exception& e) {
        fail_unrecorded(ctx, e.what());
    }
}

void Orchestrator::fail_unrecorded(IncidentContext& ctx, const std::string& message) {
    std::cerr << "[IncidentGuard] incident " << ctx.incident.id
              << " could not be recorded: " << message << std::endl;

    ctx.cancel->store(true);
    ctx.incident.state = IncidentState::EscalatedOpen;

    EscalationRecord record = make_escalation(ctx, EscalationReason::LedgerUnavailable, message);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        escalations_[ctx.incident.id] = record;
    }

    MonitorEvent event = incident_event(EventType::Escalated, ctx.incident,
        std::string("LedgerUnavailable: ") + message);
    event.escalation = std::move(record);
    event.elapsed_ms = std::chrono::duration<double, std::milli>(
        Clock::now() - ctx.started).count();
    emit_event(std::move(event));
    mark_state(ctx.incident.id, IncidentState::EscalatedOpen);
}

void Orchestrator::append(IncidentContext& ctx, LedgerEvent event) {
    event.incident_id = ctx.incident.id;
    for (std::size_t attempt = 0;; ++attempt) {
        try {
            ctx.version = ledger_->append(ctx.incident.id, ctx.version, event);
            return;
        } catch (const ConcurrentModificationException&) {
            if (attempt >= config_.ledger.max_append_retries) {
                throw;
            }
            // Resume after another writer's events only if none of them
            // re-opened the incident or moved its state
            auto foreign = ledger_->events(ctx.incident.id, ctx.version);
            for (const auto& e : foreign) {
                if (e.type == LedgerEventType::Opened || e.state.has_value()) {
                    throw;
                }
            }
            ctx.version += foreign.size();
        }
    }
}

std::string Orchestrator::roll_back(IncidentContext& ctx, const ConsensusDecision& decision,
                                    RoundNumber round) {
    if (!config_.resolution.rollback_on_failure || deadline_passed(ctx)) {
        return {};
    }

    RollbackResult undo = driver_.rollback(ctx.incident, decision, ctx.deadline);
    if (!undo.attempted) {
        return {};
    }

    LedgerEvent recorded;
    recorded.type = LedgerEventType::RollbackAttempted;
    recorded.round = round;
    recorded.message = undo.message;
    recorded.decision = decision;
    recorded.rollback_succeeded = undo.success;
    append(ctx, std::move(recorded));

    std::string summary = "rollback of '" + decision.action + "' " +
                          (undo.success ? "succeeded" : "failed") + ": " + undo.message;
    MonitorEvent event = incident_event(EventType::ActionRolledBack, ctx.incident, summary);
    event.round = round;
    event.decision = decision;
    emit_event(std::move(event));
    return summary;
}

EscalationRecord Orchestrator::make_escalation(const IncidentContext& ctx,
                                               EscalationReason reason,
                                               const std::string& message) const {
    EscalationRecord record;
    record.incident_id = ctx.incident.id;
    record.reason = reason;
    record.message = message;
    record.findings = ctx.findings;
    record.failures = ctx.failures;
    record.decision = ctx.last_decision;
    record.created_at = WallClock::now();
    return record;
}

bool Orchestrator::deadline_passed(const IncidentContext& ctx) const {
    return Clock::now() >= ctx.deadline;
}

void Orchestrator::mark_state(IncidentId id, IncidentState state) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        auto it = incidents_.find(id);
        if (it != incidents_.end()) {
            it->second.state = state;
        }
        if (is_terminal(state)) {
            cancel_flags_.erase(id);
        }
    }
    if (is_terminal(state)) {
        terminal_cv_.notify_all();
    }
}

void Orchestrator::skip_recorded_ids() {
    auto recorded = ledger_->incident_ids();
    if (recorded.empty()) return;

    IncidentId floor = recorded.back() + 1;
    IncidentId current = next_incident_id_.load();
    while (current < floor && !next_incident_id_.compare_exchange_weak(current, floor)) {
    }
}

// Called with workers_mutex_ held
void Orchestrator::reap_finished_workers() {
    for (IncidentId id : finished_workers_) {
        auto it = workers_.find(id);
        if (it != workers_.end()) {
            if (it->second.joinable()) it->second.join();
            workers_.erase(it);
        }
    }
    finished_workers_.clear();
}

// ==================== Queries ====================

std::optional<Incident> Orchestrator::get_incident(IncidentId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = incidents_.find(id);
    if (it == incidents_.end()) return std::nullopt;
    return it->second;
}

IncidentState Orchestrator::wait_for_terminal(IncidentId id, Duration timeout) const {
    const Timestamp deadline = Clock::now() + timeout;
    IncidentState state;
    {
        std::unique_lock<std::mutex> lock(state_mutex_);
        if (incidents_.find(id) == incidents_.end()) {
            throw IncidentNotFoundException(id);
        }
        terminal_cv_.wait_until(lock, deadline, [&]() {
            return is_terminal(incidents_.at(id).state);
        });
        state = incidents_.at(id).state;
    }

    if (is_terminal(state)) {
        if (auto publisher = current_publisher()) {
            // Not drained in time only means the monitor lags; the state stands
            bool drained = publisher->flush(std::max(Duration::zero(), deadline - Clock::now()));
            (void)drained;
        }
    }
    return state;
}

std::vector<EscalationRecord> Orchestrator::escalations() const {
    std::vector<EscalationRecord> result;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        result.reserve(escalations_.size());
        for (const auto& [id, record] : escalations_) {
            (void)id;
            result.push_back(record);
        }
    }
    std::sort(result.begin(), result.end(),
              [](const EscalationRecord& a, const EscalationRecord& b) {
                  return a.incident_id < b.incident_id;
              });
    return result;
}

std::optional<EscalationRecord> Orchestrator::escalation_for(IncidentId id) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = escalations_.find(id);
    if (it == escalations_.end()) return std::nullopt;
    return it->second;
}

std::size_t Orchestrator::active_incident_count() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return static_cast<std::size_t>(std::count_if(
        incidents_.begin(), incidents_.end(),
        [](const auto& entry) { return !is_terminal(entry.second.state); }));
}

const WeightTable& Orchestrator::weights_for(IncidentCategory category) const {
    return weights_.at(category);
}

const IncidentLedger& Orchestrator::ledger() const noexcept {
    return *ledger_;
}

CircuitBreakerRegistry& Orchestrator::circuit_breakers() noexcept {
    return *breakers_;
}

const ConsensusEngine& Orchestrator::consensus_engine() const noexcept {
    return engine_;
}

// ==================== Configuration ====================

void Orchestrator::set_monitor(std::shared_ptr<Monitor> monitor) {
    std::shared_ptr<AsyncMonitor> next;
    if (monitor) {
        next = std::make_shared<AsyncMonitor>(std::move(monitor),
                                              config_.runtime.event_queue_capacity);
    }

    std::shared_ptr<AsyncMonitor> previous;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        previous = std::move(publisher_);
        publisher_ = std::move(next);
    }
    if (previous) {
        previous->stop();
    }
}

void Orchestrator::stop() {
    std::vector<std::thread> to_join;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        running_.store(false);
        for (auto& [id, worker] : workers_) {
            (void)id;
            to_join.push_back(std::move(worker));
        }
        workers_.clear();
        finished_workers_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& [id, flag] : cancel_flags_) {
            (void)id;
            flag->store(true);
        }
    }
    for (auto& t : to_join) {
        if (t.joinable()) t.join();
    }

    const Timestamp grace = Clock::now() + config_.runtime.shutdown_grace;
    wait_for_outstanding_calls(grace);

    std::shared_ptr<AsyncMonitor> publisher;
    {
        std::lock_guard<std::mutex> lock(monitor_mutex_);
        publisher = std::move(publisher_);
    }
    if (publisher) {
        if (!publisher->flush(std::max(Duration::zero(), grace - Clock::now()))) {
            std::size_t discarded = publisher->discard_pending();
            std::cerr << "[IncidentGuard] monitor too slow at shutdown, "
                      << discarded << " event(s) discarded" << std::endl;
        }
        publisher->stop();
    }
}

bool Orchestrator::is_running() const noexcept {
    return running_.load();
}

// ==================== Internal ====================

void Orchestrator::emit_event(MonitorEvent event) {
    std::shared_ptr<AsyncMonitor> publisher = current_publisher();
    if (!publisher) return;

    event.timestamp = Clock::now();
    publisher->on_event(event);
}

std::shared_ptr<AsyncMonitor> Orchestrator::current_publisher() const {
    std::lock_guard<std::mutex> lock(monitor_mutex_);
    return publisher_;
}

// Provider and executor calls that ignored cancellation outlive their
// incident on detached threads
void Orchestrator::wait_for_outstanding_calls(Timestamp deadline) const {
    for (const auto& agent : agents_) {
        const auto& tracker = agent.call_tracker();
        if (!tracker->wait_idle(deadline)) {
            std::cerr << "[IncidentGuard] " << agent.name() << " still has "
                      << tracker->outstanding() << " call(s) running at shutdown" << std::endl;
        }
    }
    const auto& actions = driver_.call_tracker();
    if (!actions->wait_idle(deadline)) {
        std::cerr << "[IncidentGuard] executor still has " << actions->outstanding()
                  << " action(s) running at shutdown" << std::endl;
    }
}

} // namespace incidentguard
