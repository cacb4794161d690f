#include "db/generic_connection_pool.hpp"
#include "core/utils.hpp"
#include <format>

namespace pgtenant {

GenericConnectionPool::GenericConnectionPool(
    std::string db_name,
    const PoolConfig& config,
    std::shared_ptr<IConnectionFactory> factory)
    : db_name_(std::move(db_name)),
      config_(config),
      factory_(std::move(factory)),
      semaphore_(static_cast<std::ptrdiff_t>(config.max_connections)) {

    // Pre-warm pool with min_connections
    for (size_t i = 0; i < config_.min_connections; ++i) {
        auto conn = create_connection();
        if (conn) {
            std::lock_guard lock(mutex_);
            idle_connections_.emplace_back(std::move(conn));
        } else {
            utils::log::warn(std::format("Failed to create connection {} during pool initialization for database '{}'", i + 1, db_name_));
        }
    }

    utils::log::info(std::format("ConnectionPool initialized for database '{}': {} connections (min={}, max={})",
        db_name_, total_connections_.load(), config_.min_connections, config_.max_connections));
}

GenericConnectionPool::~GenericConnectionPool() {
    drain();
}

std::unique_ptr<PooledConnection> GenericConnectionPool::acquire(
    std::chrono::milliseconds timeout) {

    if (shutdown_.load(std::memory_order_acquire)) {
        return nullptr;
    }

    // Acquire semaphore slot (blocks if pool full)
    if (!semaphore_.try_acquire_for(timeout)) {
        failed_acquires_.fetch_add(1, std::memory_order_relaxed);
        return nullptr;
    }

    // Re-check shutdown after acquiring semaphore (TOCTOU: shutdown may have
    // been set between the initial check and semaphore acquisition)
    if (shutdown_.load(std::memory_order_acquire)) {
        semaphore_.release();
        return nullptr;
    }

    total_acquires_.fetch_add(1, std::memory_order_relaxed);

    std::unique_ptr<IDbConnection> conn;
    ConnectionMeta meta;

    {
        std::lock_guard lock(mutex_);
        if (!idle_connections_.empty()) {
            conn = std::move(idle_connections_.front());
            idle_connections_.pop_front();
            const auto it = meta_.find(conn.get());
            if (it != meta_.end()) meta = it->second;
        }
    }

    if (!conn) {
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
        meta.created_at = std::chrono::steady_clock::now();
        meta.last_used = meta.created_at;
    }

    const auto now = std::chrono::steady_clock::now();

    // Check max_lifetime: recycle if connection is too old
    bool replace = false;
    if (config_.max_lifetime.count() > 0 && now - meta.created_at > config_.max_lifetime) {
        connections_recycled_.fetch_add(1, std::memory_order_relaxed);
        replace = true;
    } else if (now - meta.last_used > config_.idle_timeout &&
               !conn->is_healthy(config_.health_check_query)) {
        // Only connections idle longer than idle_timeout pay for a round trip
        health_check_failures_.fetch_add(1, std::memory_order_relaxed);
        replace = true;
    }

    if (replace) {
        destroy_connection(std::move(conn));
        conn = create_connection();
        if (!conn) {
            semaphore_.release();
            failed_acquires_.fetch_add(1, std::memory_order_relaxed);
            return nullptr;
        }
    }

    auto return_fn = [this](std::unique_ptr<IDbConnection> c, bool reusable) {
        this->return_connection(std::move(c), reusable);
    };

    return std::make_unique<PooledConnection>(std::move(conn), return_fn);
}

PoolStats GenericConnectionPool::get_stats() const {
    std::lock_guard lock(mutex_);

    PoolStats stats;
    stats.total_connections = total_connections_.load(std::memory_order_relaxed);
    stats.idle_connections = idle_connections_.size();
    stats.active_connections = stats.total_connections - stats.idle_connections;
    stats.total_acquires = total_acquires_.load(std::memory_order_relaxed);
    stats.total_releases = total_releases_.load(std::memory_order_relaxed);
    stats.failed_acquires = failed_acquires_.load(std::memory_order_relaxed);
    stats.health_check_failures = health_check_failures_.load(std::memory_order_relaxed);
    stats.connections_recycled = connections_recycled_.load(std::memory_order_relaxed);
    stats.connections_evicted = connections_evicted_.load(std::memory_order_relaxed);
    stats.session_leaks_detected = session_leaks_detected_.load(std::memory_order_relaxed);
    return stats;
}

void GenericConnectionPool::drain() {
    shutdown_.store(true, std::memory_order_release);

    std::lock_guard lock(mutex_);

    for (auto& conn : idle_connections_) {
        if (conn) {
            meta_.erase(conn.get());
            conn->close();
            total_connections_.fetch_sub(1, std::memory_order_relaxed);
        }
    }
    idle_connections_.clear();

    utils::log::info(std::format("ConnectionPool drained for database '{}'", db_name_));
}

std::unique_ptr<IDbConnection> GenericConnectionPool::create_connection() {
    auto conn = factory_->create(config_.connection_string);
    if (!conn) {
        return nullptr;
    }

    ConnectionMeta meta;
    meta.created_at = std::chrono::steady_clock::now();
    meta.last_used = meta.created_at;

    if (!config_.session_state_query.empty()) {
        auto baseline = probe_session_state(*conn);
        if (!baseline) {
            utils::log::error(std::format(
                "Pool '{}': session state probe failed on new connection", db_name_));
            conn->close();
            return nullptr;
        }
        meta.baseline_state = std::move(*baseline);
    }

    total_connections_.fetch_add(1, std::memory_order_relaxed);
    std::lock_guard lock(mutex_);
    meta_[conn.get()] = std::move(meta);
    return conn;
}

void GenericConnectionPool::destroy_connection(std::unique_ptr<IDbConnection> conn) {
    if (!conn) return;
    {
        std::lock_guard lock(mutex_);
        meta_.erase(conn.get());
    }
    conn->close();
    total_connections_.fetch_sub(1, std::memory_order_relaxed);
}

std::optional<std::string> GenericConnectionPool::probe_session_state(IDbConnection& conn) const {
    const auto rs = conn.execute(config_.session_state_query);
    if (!rs.success || rs.rows.empty() || rs.rows.front().empty()) {
        return std::nullopt;
    }
    return rs.rows.front().front();
}

void GenericConnectionPool::return_connection(std::unique_ptr<IDbConnection> conn, bool reusable) {
    if (!conn) {
        return;
    }

    total_releases_.fetch_add(1, std::memory_order_relaxed);

    if (shutdown_.load(std::memory_order_acquire)) {
        destroy_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    if (!reusable || !conn->is_connected()) {
        connections_evicted_.fetch_add(1, std::memory_order_relaxed);
        utils::log::warn(std::format("Pool '{}': evicting connection released as unusable", db_name_));
        destroy_connection(std::move(conn));
        semaphore_.release();
        return;
    }

    if (!config_.session_state_query.empty()) {
        std::string baseline;
        {
            std::lock_guard lock(mutex_);
            const auto it = meta_.find(conn.get());
            if (it != meta_.end()) baseline = it->second.baseline_state;
        }
        const auto state = probe_session_state(*conn);
        if (!state || *state != baseline) {
            session_leaks_detected_.fetch_add(1, std::memory_order_relaxed);
            connections_evicted_.fetch_add(1, std::memory_order_relaxed);
            utils::log::critical(std::format(
                "ConnectionLeakDetected: pool '{}' got a connection back with session state '{}' (expected '{}'); evicting",
                db_name_, state.value_or("<probe failed>"), baseline));
            destroy_connection(std::move(conn));
            semaphore_.release();
            return;
        }
    }

    {
        std::lock_guard lock(mutex_);
        const auto it = meta_.find(conn.get());
        if (it != meta_.end()) it->second.last_used = std::chrono::steady_clock::now();
        idle_connections_.emplace_back(std::move(conn));
    }

    semaphore_.release();
}

} // namespace pgtenant
