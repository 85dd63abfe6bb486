#pragma once

#include "tiercache/core/result.h"
#include <cstddef>
#include <string>

namespace tiercache {
namespace cache {

/**
 * @brief Source of the memory metric the monitor compares against thresholds
 */
class MemorySampler {
public:
    virtual ~MemorySampler() = default;

    /**
     * @return Bytes in use, or an error when the metric is unavailable
     */
    virtual core::Result<size_t> sample() = 0;
};

/**
 * @brief Resident set size of the current process, from /proc/self/statm
 */
class ProcessMemorySampler : public MemorySampler {
public:
    explicit ProcessMemorySampler(std::string statm_path = "/proc/self/statm");

    core::Result<size_t> sample() override;

private:
    std::string statm_path_;
};

} // namespace cache
} // namespace tiercache
