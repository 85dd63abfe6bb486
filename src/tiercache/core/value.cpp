#include "tiercache/core/value.h"
#include "tiercache/core/error.h"

namespace tiercache {
namespace core {

Value::Value() : data_(std::in_place_type<std::monostate>) {}

Value::Value(bool b) : data_(std::in_place_type<bool>, b) {}

Value::Value(int n) : data_(std::in_place_type<double>, static_cast<double>(n)) {}

Value::Value(int64_t n) : data_(std::in_place_type<double>, static_cast<double>(n)) {}

Value::Value(double n) : data_(std::in_place_type<double>, n) {}

Value::Value(const char* s) : data_(std::in_place_type<std::string>, s ? s : "") {}

Value::Value(std::string s) : data_(std::in_place_type<std::string>, std::move(s)) {}

Value::Value(ValueArray array)
    : data_(std::in_place_type<std::shared_ptr<ValueArray>>,
            std::make_shared<ValueArray>(std::move(array))) {}

Value::Value(ValueObject object)
    : data_(std::in_place_type<std::shared_ptr<ValueObject>>,
            std::make_shared<ValueObject>(std::move(object))) {}

Value Value::from_array(std::shared_ptr<ValueArray> array) {
    if (!array) {
        return Value();
    }
    Value value;
    value.data_.emplace<std::shared_ptr<ValueArray>>(std::move(array));
    return value;
}

Value Value::from_object(std::shared_ptr<ValueObject> object) {
    if (!object) {
        return Value();
    }
    Value value;
    value.data_.emplace<std::shared_ptr<ValueObject>>(std::move(object));
    return value;
}

Value::Type Value::type() const {
    switch (data_.index()) {
        case 1: return Type::BOOLEAN;
        case 2: return Type::NUMBER;
        case 3: return Type::STRING;
        case 4: return Type::ARRAY;
        case 5: return Type::OBJECT;
        default: return Type::NONE;
    }
}

bool Value::is_reference() const {
    Type t = type();
    return t == Type::ARRAY || t == Type::OBJECT;
}

namespace {

[[noreturn]] void throw_mismatch(Value::Type expected, Value::Type actual) {
    throw TypeMismatchError(std::string("Expected ") + to_string(expected) +
                            " value but found " + to_string(actual));
}

} // namespace

bool Value::as_bool() const {
    if (const auto* b = std::get_if<bool>(&data_)) {
        return *b;
    }
    throw_mismatch(Type::BOOLEAN, type());
}

double Value::as_number() const {
    if (const auto* n = std::get_if<double>(&data_)) {
        return *n;
    }
    throw_mismatch(Type::NUMBER, type());
}

const std::string& Value::as_string() const {
    if (const auto* s = std::get_if<std::string>(&data_)) {
        return *s;
    }
    throw_mismatch(Type::STRING, type());
}

std::shared_ptr<ValueArray> Value::as_array() const {
    if (const auto* a = std::get_if<std::shared_ptr<ValueArray>>(&data_)) {
        return *a;
    }
    throw_mismatch(Type::ARRAY, type());
}

std::shared_ptr<ValueObject> Value::as_object() const {
    if (const auto* o = std::get_if<std::shared_ptr<ValueObject>>(&data_)) {
        return *o;
    }
    throw_mismatch(Type::OBJECT, type());
}

size_t Value::estimated_size() const {
    switch (type()) {
        case Type::NONE:
            return 0;
        case Type::BOOLEAN:
            return 4;
        case Type::NUMBER:
            return 8;
        case Type::STRING:
            return std::get<std::string>(data_).size() * 2;
        case Type::ARRAY:
            return std::get<std::shared_ptr<ValueArray>>(data_)->size() * 50;
        case Type::OBJECT:
            return std::get<std::shared_ptr<ValueObject>>(data_)->size() * 100;
    }
    return 100;
}

long Value::use_count() const {
    if (const auto* a = std::get_if<std::shared_ptr<ValueArray>>(&data_)) {
        return a->use_count();
    }
    if (const auto* o = std::get_if<std::shared_ptr<ValueObject>>(&data_)) {
        return o->use_count();
    }
    return 0;
}

bool Value::operator==(const Value& other) const {
    // shared_ptr comparison is pointer identity, which is the intended
    // semantics for arrays and objects
    return data_ == other.data_;
}

const char* to_string(Value::Type type) {
    switch (type) {
        case Value::Type::NONE: return "none";
        case Value::Type::BOOLEAN: return "boolean";
        case Value::Type::NUMBER: return "number";
        case Value::Type::STRING: return "string";
        case Value::Type::ARRAY: return "array";
        case Value::Type::OBJECT: return "object";
    }
    return "unknown";
}

WeakValue::WeakValue(const Value& target) {
    if (const auto* a = std::get_if<std::shared_ptr<ValueArray>>(&target.data_)) {
        ref_ = std::weak_ptr<ValueArray>(*a);
    } else if (const auto* o = std::get_if<std::shared_ptr<ValueObject>>(&target.data_)) {
        ref_ = std::weak_ptr<ValueObject>(*o);
    } else {
        throw InvalidArgumentError(std::string("Cannot create a weak reference to a ") +
                                   to_string(target.type()) + " value");
    }
}

std::optional<Value> WeakValue::lock() const {
    if (const auto* a = std::get_if<std::weak_ptr<ValueArray>>(&ref_)) {
        if (auto strong = a->lock()) {
            return Value::from_array(std::move(strong));
        }
        return std::nullopt;
    }
    if (auto strong = std::get<std::weak_ptr<ValueObject>>(ref_).lock()) {
        return Value::from_object(std::move(strong));
    }
    return std::nullopt;
}

bool WeakValue::expired() const {
    return std::visit([](const auto& ref) { return ref.expired(); }, ref_);
}

} // namespace core
} // namespace tiercache
