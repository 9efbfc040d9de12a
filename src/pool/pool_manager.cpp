#include "pool/pool_manager.hpp"
#include "core/utils.hpp"

#include <condition_variable>
#include <exception>
#include <format>

namespace mcpgate {

namespace {

// Backoff hint for the per-user concurrency ceiling (a held connection frees up)
constexpr std::chrono::seconds kUserLimitRetryAfter{1};

// Extra wait on top of request_timeout before a blocking acquire gives up on its callback
constexpr std::chrono::milliseconds kBlockingAcquireGrace{5000};

} // namespace

PoolManager::BackendSlot::BackendSlot(const std::string& backend_name,
                                      const Config& config,
                                      std::shared_ptr<IClock> clock)
    : name(backend_name),
      pool(backend_name, ConnectionPool::Config{config.max_connections_per_backend,
                                                config.idle_timeout}),
      queue(config.queue_max_size) {
    CircuitBreaker::Config breaker_config;
    breaker_config.failure_threshold = config.circuit_breaker_threshold;
    breaker_config.timeout = config.circuit_breaker_timeout;
    breaker = std::make_shared<CircuitBreaker>(backend_name, breaker_config, std::move(clock));
}

PoolManager::PoolManager(const Config& config,
                         std::shared_ptr<ITransportFactory> factory,
                         std::shared_ptr<IClock> clock,
                         std::shared_ptr<ITaskScheduler> scheduler,
                         std::shared_ptr<EventBus> events)
    : config_(config),
      factory_(std::move(factory)),
      clock_(std::move(clock)),
      scheduler_(std::move(scheduler)),
      events_(std::move(events)) {}

PoolManager::~PoolManager() {
    shutdown();
}

// ============================================================================
// Pool registry
// ============================================================================

void PoolManager::initialize_pool(const std::string& backend) {
    {
        std::shared_lock<std::shared_mutex> lock(slots_mutex_);
        if (slots_.contains(backend)) {
            return;
        }
    }

    std::shared_ptr<BackendSlot> created;
    {
        std::unique_lock<std::shared_mutex> lock(slots_mutex_);
        auto [it, inserted] = slots_.try_emplace(backend, nullptr);
        if (!inserted) {
            return;
        }
        it->second = std::make_shared<BackendSlot>(backend, config_, clock_);
        created = it->second;
    }

    created->breaker->set_on_state_change([this, backend](const StateChangeEvent& e) {
        publish(CircuitStateChanged{backend, e.from, e.to});
    });

    utils::log::info(std::format("ConnectionPool initialized for backend '{}' (max={}, queue={})",
        backend, config_.max_connections_per_backend, config_.queue_max_size));

    publish(PoolInitialized{backend, config_.max_connections_per_backend});
}

bool PoolManager::has_pool(const std::string& backend) const {
    return find_slot(backend) != nullptr;
}

std::shared_ptr<PoolManager::BackendSlot> PoolManager::find_slot(const std::string& backend) const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    const auto it = slots_.find(backend);
    return it != slots_.end() ? it->second : nullptr;
}

std::vector<std::shared_ptr<PoolManager::BackendSlot>> PoolManager::all_slots() const {
    std::shared_lock<std::shared_mutex> lock(slots_mutex_);
    std::vector<std::shared_ptr<BackendSlot>> slots;
    slots.reserve(slots_.size());
    for (const auto& [name, slot] : slots_) {
        slots.push_back(slot);
    }
    return slots;
}

std::shared_ptr<CircuitBreaker> PoolManager::get_breaker(const std::string& backend) const {
    const auto slot = find_slot(backend);
    return slot ? slot->breaker : nullptr;
}

// ============================================================================
// Ceilings
// ============================================================================

bool PoolManager::try_reserve_global() {
    size_t current = total_active_.load(std::memory_order_acquire);
    while (current < config_.max_total_connections) {
        if (total_active_.compare_exchange_weak(current, current + 1,
                                                std::memory_order_acq_rel,
                                                std::memory_order_acquire)) {
            return true;
        }
    }
    return false;
}

void PoolManager::release_global() {
    size_t current = total_active_.load(std::memory_order_acquire);
    while (current > 0 &&
           !total_active_.compare_exchange_weak(current, current - 1,
                                                std::memory_order_acq_rel,
                                                std::memory_order_acquire)) {
    }
}

bool PoolManager::try_reserve_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(users_mutex_);
    auto& outstanding = user_outstanding_[user_id];
    if (outstanding >= config_.max_concurrent_requests_per_user) {
        if (outstanding == 0) {
            user_outstanding_.erase(user_id);
        }
        return false;
    }
    ++outstanding;
    return true;
}

void PoolManager::untrack_user(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(users_mutex_);
    const auto it = user_outstanding_.find(user_id);
    if (it == user_outstanding_.end()) {
        return;
    }
    if (--it->second == 0) {
        user_outstanding_.erase(it);
    }
}

uint32_t PoolManager::user_outstanding(const std::string& user_id) const {
    std::lock_guard<std::mutex> lock(users_mutex_);
    const auto it = user_outstanding_.find(user_id);
    return it != user_outstanding_.end() ? it->second : 0;
}

// ============================================================================
// Acquire
// ============================================================================

void PoolManager::acquire_async(const std::string& backend,
                                const std::string& user_id,
                                const std::string& request_id,
                                AcquireCallback done) {
    if (shutting_down_.load(std::memory_order_acquire)) {
        done(AcquireResult::error(ErrorCode::SHUTTING_DOWN, "Pool manager is shutting down"));
        return;
    }

    const auto slot = find_slot(backend);
    if (!slot) {
        done(AcquireResult::error(ErrorCode::BACKEND_NOT_FOUND,
            std::format("No pool found for backend: {}", backend)));
        return;
    }

    if (slot->breaker->is_open()) {
        done(AcquireResult::error(ErrorCode::CIRCUIT_OPEN,
            std::format("Circuit breaker is open for backend: {}", backend),
            utils::ceil_seconds(config_.circuit_breaker_timeout)));
        return;
    }

    // Held from here until release(), or given back on any rejection below
    if (!try_reserve_user(user_id)) {
        done(AcquireResult::error(ErrorCode::USER_RATE_LIMITED,
            std::format("Concurrent connection limit exceeded for user: {}", user_id),
            kUserLimitRetryAfter));
        return;
    }

    std::shared_ptr<Connection> conn;
    bool create = false;
    bool queued = false;
    Retired retired;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);

        if (try_reserve_global()) {
            conn = slot->pool.take_idle(request_id, user_id, clock_->now(), retired);
            if (!conn) {
                if (slot->pool.reserve_slot()) {
                    create = true;
                } else {
                    release_global();
                }
            }
        }

        if (!conn && !create) {
            queued = enqueue_locked(*slot, user_id, request_id, done);
        }
    }

    close_retired(retired);

    if (queued) {
        return;
    }

    if (conn) {
        done(AcquireResult::ok(std::move(conn)));
        return;
    }

    if (create) {
        done(create_connection(slot, user_id, request_id));
        return;
    }

    untrack_user(user_id);
    done(AcquireResult::error(ErrorCode::QUEUE_FULL,
        std::format("Request queue full for backend: {}", backend)));
}

bool PoolManager::enqueue_locked(BackendSlot& slot,
                                 const std::string& user_id,
                                 const std::string& request_id,
                                 AcquireCallback& done) {
    if (slot.queue.size() >= slot.queue.max_size()) {
        return false;
    }

    QueuedRequest request;
    request.ticket = next_ticket_.fetch_add(1, std::memory_order_relaxed);
    request.request_id = request_id;
    request.user_id = user_id;
    request.enqueued_at = clock_->now();
    request.resolve = std::move(done);

    const auto ticket = request.ticket;
    const auto backend = slot.name;
    request.timeout_task = scheduler_->schedule_after(config_.request_timeout,
        [this, backend, ticket]() { on_queue_timeout(backend, ticket); });

    return slot.queue.push(std::move(request));
}

AcquireResult PoolManager::create_connection(const std::shared_ptr<BackendSlot>& slot,
                                             const std::string& user_id,
                                             const std::string& request_id) {
    std::shared_ptr<IBackendTransport> transport;
    std::string failure = "factory returned no transport";
    try {
        transport = factory_->create_transport(slot->name);
    } catch (const std::exception& e) {
        failure = e.what();
    }

    if (!transport) {
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            slot->pool.cancel_reservation();
        }
        release_global();
        untrack_user(user_id);
        slot->breaker->record_failure();
        utils::log::warn(std::format("Failed to open connection to backend '{}': {}",
            slot->name, failure));
        return AcquireResult::error(ErrorCode::POOL_EXHAUSTED,
            std::format("Failed to open connection to backend '{}': {}", slot->name, failure));
    }

    auto conn = std::make_shared<Connection>(
        utils::generate_uuid(), slot->name, std::move(transport), clock_->now());

    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        if (!shutting_down_.load(std::memory_order_acquire)) {
            slot->pool.commit_created(conn, request_id, user_id, clock_->now());
            return AcquireResult::ok(std::move(conn));
        }
        slot->pool.cancel_reservation();
    }

    // Shutdown raced with creation
    release_global();
    untrack_user(user_id);
    conn->mark_discarded();
    conn->close_transport();
    return AcquireResult::error(ErrorCode::SHUTTING_DOWN, "Pool manager is shutting down");
}

AcquireResult PoolManager::acquire(const std::string& backend,
                                   const std::string& user_id,
                                   const std::string& request_id) {
    struct Waiter {
        std::mutex mutex;
        std::condition_variable cv;
        std::optional<AcquireResult> result;
        bool abandoned = false;
    };
    auto waiter = std::make_shared<Waiter>();

    acquire_async(backend, user_id, request_id, [this, waiter](AcquireResult r) {
        {
            std::lock_guard<std::mutex> lock(waiter->mutex);
            if (!waiter->abandoned) {
                waiter->result = std::move(r);
                waiter->cv.notify_one();
                return;
            }
        }
        // Caller already gave up: hand the connection straight back
        if (r.is_ok()) {
            release(r.value(), true);
        }
    });

    std::unique_lock<std::mutex> lock(waiter->mutex);
    const bool resolved = waiter->cv.wait_for(lock,
        config_.request_timeout + kBlockingAcquireGrace,
        [&waiter]() { return waiter->result.has_value(); });

    if (!resolved) {
        waiter->abandoned = true;
        return AcquireResult::error(ErrorCode::QUEUE_TIMEOUT,
            std::format("Request timeout in queue: {}", request_id));
    }
    return std::move(*waiter->result);
}

// ============================================================================
// Release
// ============================================================================

void PoolManager::release(const std::shared_ptr<Connection>& conn, bool success) {
    if (!conn) {
        return;
    }

    const auto slot = find_slot(conn->backend());
    if (!slot) {
        conn->mark_discarded();
        conn->close_transport();
        return;
    }

    ConnectionPool::ReleaseOutcome outcome;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        outcome = slot->pool.begin_return(conn, clock_->now());
        if (outcome.was_active) {
            record_completion(*slot, outcome.latency, success);
        }
    }

    if (!outcome.was_active) {
        return;
    }

    // No session state may survive into the next holder's conversation
    const bool reusable = conn->reset_transport();

    Retired retired;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        const bool open_pool = reusable && !shutting_down_.load(std::memory_order_acquire);
        slot->pool.complete_return(conn, clock_->now(), open_pool, retired);
    }

    close_retired(retired);

    release_global();
    untrack_user(outcome.user_id);

    if (success) {
        slot->breaker->record_success();
    } else {
        slot->breaker->record_failure();
    }

    publish(ConnectionReleased{slot->name, conn->id(), outcome.user_id, outcome.latency, success});

    process_queue(slot);

    // Global capacity freed: serve backends whose waiters were blocked only by the ceiling
    for (const auto& other : all_slots()) {
        if (other != slot) {
            process_queue(other);
        }
    }
}

void PoolManager::record_completion(BackendSlot& slot,
                                    std::chrono::milliseconds latency,
                                    bool success) {
    const double latency_ms = static_cast<double>(latency.count());

    auto& m = slot.metrics;
    ++m.total_requests;
    if (success) {
        ++m.successful_requests;
    } else {
        ++m.failed_requests;
    }
    m.success_rate = static_cast<double>(m.successful_requests) /
                     static_cast<double>(m.total_requests);
    m.average_latency_ms += (latency_ms - m.average_latency_ms) /
                            static_cast<double>(m.total_requests);

    std::lock_guard<std::mutex> lock(metrics_mutex_);
    if (success) {
        ++successful_requests_;
    } else {
        ++failed_requests_;
    }
    const auto total = successful_requests_ + failed_requests_;
    average_response_ms_ += (latency_ms - average_response_ms_) / static_cast<double>(total);
}

void PoolManager::process_queue(const std::shared_ptr<BackendSlot>& slot) {
    while (!shutting_down_.load(std::memory_order_acquire)) {
        std::optional<QueuedRequest> request;
        std::shared_ptr<Connection> conn;
        bool create = false;
        bool served = false;
        Retired retired;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            if (slot->queue.empty()) {
                break;
            }
            if (slot->pool.idle_count() == 0 && !slot->pool.has_capacity()) {
                break;
            }
            if (!try_reserve_global()) {
                break;
            }

            // The head keeps its place unless it is actually served
            const auto& head = slot->queue.front();
            conn = slot->pool.take_idle(head.request_id, head.user_id, clock_->now(), retired);
            if (!conn) {
                create = slot->pool.reserve_slot();
            }
            served = conn || create;
            if (served) {
                request = slot->queue.pop_front();
            } else {
                release_global();
            }
        }

        close_retired(retired);
        if (!served) {
            break;
        }
        cancel_timeout(*request);

        // The user slot was reserved at enqueue time
        if (conn) {
            request->resolve(AcquireResult::ok(std::move(conn)));
        } else {
            request->resolve(create_connection(slot, request->user_id, request->request_id));
        }
    }
}

void PoolManager::on_queue_timeout(const std::string& backend, uint64_t ticket) {
    const auto slot = find_slot(backend);
    if (!slot) {
        return;
    }

    std::optional<QueuedRequest> request;
    {
        std::lock_guard<std::mutex> lock(slot->mutex);
        request = slot->queue.remove(ticket);
    }

    if (!request) {
        return;
    }

    queue_timeouts_.fetch_add(1, std::memory_order_relaxed);
    untrack_user(request->user_id);
    request->resolve(AcquireResult::error(ErrorCode::QUEUE_TIMEOUT,
        std::format("Request timeout in queue: {}", request->request_id)));
}

// ============================================================================
// Sweep / shutdown
// ============================================================================

size_t PoolManager::sweep() {
    size_t removed = 0;
    const auto now = clock_->now();

    for (const auto& slot : all_slots()) {
        Retired retired;
        std::vector<QueuedRequest> expired;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            removed += slot->pool.reap_idle(now, retired);
            expired = slot->queue.remove_expired(now, config_.request_timeout);
        }

        close_retired(retired);

        for (auto& request : expired) {
            cancel_timeout(request);
            queue_timeouts_.fetch_add(1, std::memory_order_relaxed);
            untrack_user(request.user_id);
            request.resolve(AcquireResult::error(ErrorCode::QUEUE_TIMEOUT,
                std::format("Request timeout in queue: {}", request.request_id)));
        }
        removed += expired.size();
    }

    publish(CleanupCompleted{"pool", removed});
    return removed;
}

void PoolManager::start_cleanup() {
    std::lock_guard<std::mutex> lock(cleanup_task_mutex_);
    if (cleanup_task_ || shutting_down_.load(std::memory_order_acquire)) {
        return;
    }
    cleanup_task_ = scheduler_->schedule_every(config_.cleanup_interval, [this]() { sweep(); });
}

void PoolManager::shutdown() {
    if (shutting_down_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(cleanup_task_mutex_);
        if (cleanup_task_) {
            scheduler_->cancel(*cleanup_task_);
            cleanup_task_.reset();
        }
    }

    size_t closed = 0;
    for (const auto& slot : all_slots()) {
        Retired retired;
        std::vector<QueuedRequest> waiters;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            waiters = slot->queue.drain();
            retired = slot->pool.drain();
        }

        for (auto& request : waiters) {
            cancel_timeout(request);
            request.resolve(AcquireResult::error(ErrorCode::SHUTTING_DOWN,
                "Pool manager is shutting down"));
        }

        close_retired(retired);
        closed += retired.size();
    }

    total_active_.store(0, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(users_mutex_);
        user_outstanding_.clear();
    }

    utils::log::info(std::format("PoolManager shut down: {} connections closed", closed));
}

// ============================================================================
// Status
// ============================================================================

PoolManager::Status PoolManager::get_status() const {
    Status status;

    for (const auto& slot : all_slots()) {
        BackendPoolStatus s;
        s.name = slot->name;
        {
            std::lock_guard<std::mutex> lock(slot->mutex);
            s.active_connections = slot->pool.active_count();
            s.idle_connections = slot->pool.idle_count();
            s.max_connections = slot->pool.max_connections();
            s.queue_size = slot->queue.size();
            s.queue_max_size = slot->queue.max_size();
            s.connections_created = slot->pool.connections_created();
            s.connections_discarded = slot->pool.connections_discarded();
            s.metrics = slot->metrics;
        }
        s.breaker_state = slot->breaker->get_state();
        s.breaker_failure_count = slot->breaker->failure_count();

        status.queued_requests += s.queue_size;
        status.backends.push_back(std::move(s));
    }

    status.total_active = total_active_.load(std::memory_order_acquire);
    status.queue_timeouts = queue_timeouts_.load(std::memory_order_relaxed);
    {
        std::lock_guard<std::mutex> lock(metrics_mutex_);
        status.successful_requests = successful_requests_;
        status.failed_requests = failed_requests_;
        status.average_response_ms = average_response_ms_;
    }
    return status;
}

// ============================================================================
// Helpers
// ============================================================================

void PoolManager::close_retired(const Retired& retired) {
    for (const auto& conn : retired) {
        conn->close_transport();
    }
}

void PoolManager::cancel_timeout(const QueuedRequest& request) {
    if (request.timeout_task) {
        scheduler_->cancel(*request.timeout_task);
    }
}

void PoolManager::publish(const GatewayEvent& event) {
    if (events_) {
        events_->publish(event);
    }
}

} // namespace mcpgate
