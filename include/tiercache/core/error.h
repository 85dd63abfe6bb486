#ifndef TIERCACHE_CORE_ERROR_H_
#define TIERCACHE_CORE_ERROR_H_

#include <stdexcept>
#include <string>

namespace tiercache {
namespace core {

/**
 * @brief Base class for all tiercache errors
 */
class Error : public std::runtime_error {
public:
    enum class Code {
        UNKNOWN = 0,
        INVALID_ARGUMENT = 1,
        INVALID_CONFIGURATION = 2,
        TYPE_MISMATCH = 3
    };

    explicit Error(const std::string& message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}
    explicit Error(const char* message, Code code = Code::UNKNOWN)
        : std::runtime_error(message), code_(code) {}

    Code code() const { return code_; }
    const char* what() const noexcept override { return std::runtime_error::what(); }

private:
    Code code_;
};

/**
 * @brief Error indicating invalid arguments or parameters
 */
class InvalidArgumentError : public Error {
public:
    explicit InvalidArgumentError(const std::string& message)
        : Error(message, Code::INVALID_ARGUMENT) {}
    explicit InvalidArgumentError(const char* message)
        : Error(message, Code::INVALID_ARGUMENT) {}
};

/**
 * @brief Error indicating a configuration rejected at construction time
 */
class ConfigurationError : public Error {
public:
    explicit ConfigurationError(const std::string& message)
        : Error(message, Code::INVALID_CONFIGURATION) {}
    explicit ConfigurationError(const char* message)
        : Error(message, Code::INVALID_CONFIGURATION) {}
};

/**
 * @brief Error indicating a value was read as the wrong type
 */
class TypeMismatchError : public Error {
public:
    explicit TypeMismatchError(const std::string& message)
        : Error(message, Code::TYPE_MISMATCH) {}
    explicit TypeMismatchError(const char* message)
        : Error(message, Code::TYPE_MISMATCH) {}
};

} // namespace core
} // namespace tiercache

#endif // TIERCACHE_CORE_ERROR_H_
