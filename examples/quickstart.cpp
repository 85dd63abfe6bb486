#include "tiercache/cache/unified_manager.h"
#include "tiercache/common/logger.h"
#include "tiercache/config.h"
#include <iostream>

using namespace tiercache;

int main() {
    common::Logger::Init();
    std::cout << "=== tiercache " << TIERCACHE_VERSION << " Quick Start Example ===" << std::endl;

    // Configure a small cache so the tiers visibly fill up
    cache::UnifiedManagerConfig config;
    config.tiered_cache.l1_capacity = 2;
    config.tiered_cache.l2_capacity = 2;
    config.tiered_cache.l3_capacity = 2;
    config.monitoring.interval = std::chrono::milliseconds(5000);
    config.cleanup.interval = std::chrono::milliseconds(10000);

    std::cout << "Creating manager with L1/L2/L3 capacities "
              << config.tiered_cache.l1_capacity << "/"
              << config.tiered_cache.l2_capacity << "/"
              << config.tiered_cache.l3_capacity << std::endl;

    cache::UnifiedManager manager(config, std::make_shared<cache::ProcessMemorySampler>());

    // Hot writes overflow L1 and sink through the tiers
    cache::SetOptions hot;
    hot.priority = cache::CachePriority::HOT;
    for (const char* route : {"/", "/about", "/blog", "/blog/1", "/blog/2", "/contact", "/login"}) {
        manager.set(route, core::Value(std::string("component for ") + route), hot);
    }
    std::cout << "✅ Stored 7 routes" << std::endl;

    auto first = manager.get("/");
    std::cout << "Lookup '/': " << (first ? "hit" : "miss (discarded from L3)") << std::endl;

    auto latest = manager.get("/login");
    if (latest) {
        std::cout << "Lookup '/login': " << latest->as_string() << std::endl;
    }

    // Weak entries live only as long as the caller keeps the object
    {
        core::Value page(core::ValueObject{{"title", core::Value("Blog")}});
        cache::SetOptions weak;
        weak.weak = true;
        manager.set("page:blog", page, weak);
        std::cout << "Weak lookup while alive: "
                  << (manager.get_weak_ref("page:blog") ? "found" : "missing") << std::endl;
    }
    std::cout << "Weak lookup after release: "
              << (manager.get_weak_ref("page:blog") ? "found" : "missing") << std::endl;

    manager.optimize();

    auto stats = manager.get_stats();
    std::cout << "\nStats:" << std::endl;
    std::cout << "  Process memory: " << stats.total_memory << " bytes" << std::endl;
    std::cout << "  Cache memory:   " << stats.cache_memory << " bytes" << std::endl;
    std::cout << "  L1/L2/L3 items: " << stats.l1_size << "/" << stats.l2_size << "/"
              << stats.l3_size << std::endl;
    std::cout << "  Hit rate:       " << stats.cache_hit_rate << std::endl;
    std::cout << "  Evictions:      " << stats.eviction_count << std::endl;
    std::cout << "  Memory state:   " << cache::to_string(stats.memory_state) << std::endl;

    manager.destroy();
    std::cout << "✅ Manager destroyed" << std::endl;
    return 0;
}
