#ifndef TIERCACHE_CORE_VALUE_H_
#define TIERCACHE_CORE_VALUE_H_

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tiercache {
namespace core {

class Value;

using ValueArray = std::vector<Value>;
using ValueObject = std::map<std::string, Value>;

/**
 * @brief Dynamically typed cache payload
 *
 * Primitive kinds (boolean, number, string) are stored inline and copied by
 * value. Arrays and objects are reference types: every copy of a Value points
 * at the same container, and equality on them is identity. That reference
 * count is what WeakValue observes.
 */
class Value {
public:
    enum class Type {
        NONE,
        BOOLEAN,
        NUMBER,
        STRING,
        ARRAY,
        OBJECT
    };

    Value();
    Value(bool b);
    Value(int n);
    Value(int64_t n);
    Value(double n);
    Value(const char* s);
    Value(std::string s);
    Value(ValueArray array);
    Value(ValueObject object);

    /**
     * @brief Wrap an existing shared container without copying it
     */
    static Value from_array(std::shared_ptr<ValueArray> array);
    static Value from_object(std::shared_ptr<ValueObject> object);

    Type type() const;
    bool is_none() const { return type() == Type::NONE; }

    /**
     * @brief True for arrays and objects, the kinds a weak handle can track
     */
    bool is_reference() const;

    // Accessors throw TypeMismatchError on the wrong kind
    bool as_bool() const;
    double as_number() const;
    const std::string& as_string() const;
    std::shared_ptr<ValueArray> as_array() const;
    std::shared_ptr<ValueObject> as_object() const;

    /**
     * @brief Heuristic byte footprint used for cache accounting
     *
     * string: length * 2, number: 8, boolean: 4, array: length * 50,
     * object: key count * 100, none: 0.
     */
    size_t estimated_size() const;

    /**
     * @brief Number of strong owners of a reference value, 0 for primitives
     */
    long use_count() const;

    bool operator==(const Value& other) const;
    bool operator!=(const Value& other) const { return !(*this == other); }

private:
    friend class WeakValue;

    using Storage = std::variant<std::monostate,
                                 bool,
                                 double,
                                 std::string,
                                 std::shared_ptr<ValueArray>,
                                 std::shared_ptr<ValueObject>>;

    Storage data_;
};

const char* to_string(Value::Type type);

/**
 * @brief Non-owning handle to a reference-typed Value
 *
 * lock() succeeds while at least one strong Value copy of the target is
 * alive; afterwards the handle is expired and lock() returns std::nullopt.
 */
class WeakValue {
public:
    WeakValue() = default;

    /**
     * @throws InvalidArgumentError if target is not an array or object
     */
    explicit WeakValue(const Value& target);

    std::optional<Value> lock() const;
    bool expired() const;

private:
    std::variant<std::weak_ptr<ValueArray>, std::weak_ptr<ValueObject>> ref_;
};

} // namespace core
} // namespace tiercache

#endif // TIERCACHE_CORE_VALUE_H_
