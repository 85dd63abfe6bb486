/**
 * @file unified_manager.cpp
 * @brief Composition root tying the tiered cache, weak references and
 *        memory monitoring together
 *
 * Cleanup levels:
 * - Conservative: expiry and idle demotion sweeps, dead weak handles dropped
 * - Moderate: conservative pass plus the older half of L3 dropped
 * - Aggressive: every tier and every weak reference dropped
 *
 * The level of a pass is the strongest of the requested level, the level
 * implied by memory pressure (usage / critical threshold) and a detected
 * leak.
 */

#include "tiercache/cache/unified_manager.h"
#include "tiercache/common/logger.h"

namespace tiercache {
namespace cache {

namespace {

const UnifiedManagerConfig& validated(const UnifiedManagerConfig& config) {
    config.validate();
    return config;
}

} // namespace

UnifiedManager::UnifiedManager(const UnifiedManagerConfig& config,
                               std::shared_ptr<MemorySampler> sampler,
                               std::shared_ptr<const core::Clock> clock)
    : config_(validated(config)),
      sampler_(std::move(sampler)),
      clock_(clock ? std::move(clock) : core::default_clock()),
      tiered_cache_(std::make_unique<TieredCache>(config_.tiered_cache, clock_)),
      weak_refs_(std::make_unique<WeakReferenceManager>(config_.weak_ref)),
      monitor_(config_.monitoring),
      monitor_timer_("memory-monitor"),
      cleanup_timer_("auto-cleanup") {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.total_memory = sample_memory_locked();
        refresh_stats_locked();
    }

    if (config_.monitoring.enabled) {
        monitor_timer_.start(config_.monitoring.interval, [this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (destroyed_.load(std::memory_order_acquire)) {
                return;
            }
            run_monitor_tick_locked();
        });
    }

    if (config_.cleanup.auto_cleanup) {
        cleanup_timer_.start(config_.cleanup.interval, [this]() {
            std::lock_guard<std::mutex> lock(mutex_);
            if (destroyed_.load(std::memory_order_acquire)) {
                return;
            }
            optimize_locked();
        });
    }

    TIERCACHE_INFO("Unified manager started (L1={}, L2={}, L3={}, cleanup={})",
                   config_.tiered_cache.l1_capacity, config_.tiered_cache.l2_capacity,
                   config_.tiered_cache.l3_capacity, to_string(config_.cleanup.strategy));
}

UnifiedManager::~UnifiedManager() {
    destroy();
}

std::optional<core::Value> UnifiedManager::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return tiered_cache_->get(key);
}

void UnifiedManager::set(const std::string& key, core::Value value, const SetOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (options.weak && config_.weak_ref.enabled && value.is_reference()) {
        WeakRefMetadata metadata;
        metadata.size = options.size ? *options.size : value.estimated_size();
        metadata.type = core::to_string(value.type());
        tiered_cache_->remove(key);
        weak_refs_->create_ref(key, value, metadata);
        refresh_stats_locked();
        return;
    }

    weak_refs_->remove_ref(key);
    tiered_cache_->set(key, std::move(value), options);
    refresh_stats_locked();
}

bool UnifiedManager::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool tiered_removed = tiered_cache_->remove(key);
    const bool weak_removed = weak_refs_->remove_ref(key);
    refresh_stats_locked();
    return tiered_removed || weak_removed;
}

void UnifiedManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    tiered_cache_->clear();
    weak_refs_->clear();
    refresh_stats_locked();
}

void UnifiedManager::create_weak_ref(const std::string& key, const core::Value& target,
                                     std::optional<WeakRefMetadata> metadata) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_.weak_ref.enabled) {
        return;
    }
    weak_refs_->create_ref(key, target, std::move(metadata));
    refresh_stats_locked();
}

std::optional<core::Value> UnifiedManager::get_weak_ref(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    return weak_refs_->get_ref(key);
}

void UnifiedManager::optimize() {
    std::lock_guard<std::mutex> lock(mutex_);
    optimize_locked();
}

size_t UnifiedManager::invalidate_tag(const std::string& tag) {
    std::lock_guard<std::mutex> lock(mutex_);
    const size_t removed = tiered_cache_->invalidate_tag(tag);
    refresh_stats_locked();
    return removed;
}

MemoryStats UnifiedManager::get_stats() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!destroyed_.load(std::memory_order_acquire)) {
        stats_.total_memory = sample_memory_locked();
        refresh_stats_locked();
    }
    return stats_;
}

CacheInfo UnifiedManager::get_cache_info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheInfo info;
    info.cache = tiered_cache_->get_stats();
    info.memory = tiered_cache_->get_memory_usage();
    info.weak_ref = weak_refs_->get_stats();
    return info;
}

MemoryState UnifiedManager::check_memory() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!destroyed_.load(std::memory_order_acquire)) {
        run_monitor_tick_locked();
    }
    return monitor_.state();
}

void UnifiedManager::destroy() {
    if (destroyed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // Without the manager lock: an in-flight callback may still need it
    monitor_timer_.stop();
    cleanup_timer_.stop();

    std::lock_guard<std::mutex> lock(mutex_);
    tiered_cache_->clear();
    weak_refs_->clear();
    monitor_.reset();
    last_cleanup_.reset();
    stats_ = MemoryStats{};

    TIERCACHE_INFO("Unified manager destroyed");
}

bool UnifiedManager::timers_running() const {
    return monitor_timer_.is_running() || cleanup_timer_.is_running();
}

void UnifiedManager::run_monitor_tick_locked() {
    const size_t usage = sample_memory_locked();
    stats_.total_memory = usage;

    switch (monitor_.evaluate(usage)) {
        case MemoryState::CRITICAL:
            perform_cleanup_locked(CleanupStrategy::AGGRESSIVE, usage);
            break;
        case MemoryState::WARNING:
            perform_cleanup_locked(CleanupStrategy::MODERATE, usage);
            break;
        case MemoryState::NORMAL:
            break;
    }
    refresh_stats_locked();

    if (config_.monitoring.adaptive_interval) {
        monitor_timer_.set_interval(MemoryMonitor::next_interval(monitor_.pressure(usage)));
    }
}

void UnifiedManager::optimize_locked() {
    tiered_cache_->optimize();
    const size_t usage = sample_memory_locked();
    stats_.total_memory = usage;
    perform_cleanup_locked(config_.cleanup.strategy, usage);
}

void UnifiedManager::perform_cleanup_locked(CleanupStrategy requested, size_t usage) {
    const double pressure = monitor_.pressure(usage);
    const bool leak = config_.monitoring.leak_detection && monitor_.detect_leak(usage, clock_->now());
    const CleanupStrategy level = MemoryMonitor::select_cleanup_level(requested, pressure, leak);

    switch (level) {
        case CleanupStrategy::AGGRESSIVE:
            tiered_cache_->clear();
            weak_refs_->clear();
            break;
        case CleanupStrategy::MODERATE: {
            tiered_cache_->optimize();
            auto l3_keys = tiered_cache_->l3_keys();
            const size_t drop = l3_keys.size() / 2;
            for (size_t i = 0; i < drop; ++i) {
                tiered_cache_->remove(l3_keys[i]);
            }
            weak_refs_->sweep();
            break;
        }
        case CleanupStrategy::CONSERVATIVE:
            tiered_cache_->optimize();
            weak_refs_->sweep();
            break;
    }

    last_cleanup_ = std::chrono::system_clock::now();
    TIERCACHE_INFO("Cleanup pass ({}): usage {} bytes, pressure {:.2f}{}",
                   to_string(level), usage, pressure, leak ? ", leak suspected" : "");
    refresh_stats_locked();
}

size_t UnifiedManager::sample_memory_locked() {
    if (!sampler_) {
        return tiered_cache_->get_memory_usage().total + weak_refs_->get_stats().total_size;
    }

    auto result = sampler_->sample();
    if (!result.ok()) {
        TIERCACHE_DEBUG("Memory sampling failed, assuming zero usage: {}", result.error());
        return 0;
    }
    return result.value();
}

void UnifiedManager::refresh_stats_locked() {
    const auto cache_stats = tiered_cache_->get_stats();
    const auto usage = tiered_cache_->get_memory_usage();
    const auto weak_stats = weak_refs_->get_stats();

    stats_.cache_memory = usage.total;
    stats_.l1_memory = usage.l1;
    stats_.l2_memory = usage.l2;
    stats_.l3_memory = usage.l3;
    stats_.l1_size = cache_stats.l1_size;
    stats_.l2_size = cache_stats.l2_size;
    stats_.l3_size = cache_stats.l3_size;
    stats_.weak_ref_count = weak_stats.count;
    stats_.weak_ref_memory = weak_stats.total_size;
    stats_.cache_hit_rate = cache_stats.hit_rate;
    stats_.eviction_count = cache_stats.eviction_count;
    stats_.memory_state = monitor_.state();
    stats_.is_warning = monitor_.is_warning();
    stats_.is_critical = monitor_.is_critical();
    stats_.last_cleanup = last_cleanup_;
}

} // namespace cache
} // namespace tiercache
