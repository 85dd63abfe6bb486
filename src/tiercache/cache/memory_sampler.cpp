#include "tiercache/cache/memory_sampler.h"
#include <fstream>
#include <unistd.h>

namespace tiercache {
namespace cache {

ProcessMemorySampler::ProcessMemorySampler(std::string statm_path)
    : statm_path_(std::move(statm_path)) {}

core::Result<size_t> ProcessMemorySampler::sample() {
    std::ifstream statm(statm_path_);
    if (!statm) {
        return core::Result<size_t>::error("Cannot open " + statm_path_);
    }

    // Fields: size resident shared text lib data dt, in pages
    unsigned long size_pages = 0;
    unsigned long resident_pages = 0;
    if (!(statm >> size_pages >> resident_pages)) {
        return core::Result<size_t>::error("Malformed contents in " + statm_path_);
    }

    const long page_size = sysconf(_SC_PAGESIZE);
    if (page_size <= 0) {
        return core::Result<size_t>::error("Page size unavailable");
    }
    return core::Result<size_t>(static_cast<size_t>(resident_pages) * static_cast<size_t>(page_size));
}

} // namespace cache
} // namespace tiercache
