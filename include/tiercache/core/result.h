#ifndef TIERCACHE_CORE_RESULT_H_
#define TIERCACHE_CORE_RESULT_H_

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace tiercache {
namespace core {

/**
 * @brief Result type for probes that can fail without it being exceptional
 *
 * Usage:
 * ```
 * Result<size_t> sample() {
 *     if (source_unavailable) {
 *         return Result<size_t>::error("source unavailable");
 *     }
 *     return Result<size_t>(4096);
 * }
 *
 * auto result = sample();
 * size_t bytes = result.ok() ? result.value() : 0;
 * ```
 */
template<typename T>
class Result {
public:
    Result(T value) : value_(std::move(value)), error_msg_(std::nullopt) {}

    struct ErrorTag {};
    explicit Result(std::string error_msg, ErrorTag) : value_(), error_msg_(std::move(error_msg)) {}

    Result(Result&& other) noexcept
        : value_(std::move(other.value_)), error_msg_(std::move(other.error_msg_)) {}

    Result& operator=(Result&& other) noexcept {
        if (this != &other) {
            value_ = std::move(other.value_);
            error_msg_ = std::move(other.error_msg_);
        }
        return *this;
    }

    // Result is move-only
    Result(const Result&) = delete;
    Result& operator=(const Result&) = delete;

    bool ok() const { return !error_msg_.has_value(); }

    std::string error() const {
        if (!error_msg_) {
            throw std::logic_error("Attempting to access error of ok result");
        }
        return *error_msg_;
    }

    const T& value() const { return value_; }
    T&& take_value() { return std::move(value_); }

    T value_or(T fallback) const { return ok() ? value_ : fallback; }

    static Result<T> error(const std::string& message) {
        return Result<T>(message, ErrorTag{});
    }

private:
    T value_;
    std::optional<std::string> error_msg_;
};

} // namespace core
} // namespace tiercache

#endif // TIERCACHE_CORE_RESULT_H_
