#include <gtest/gtest.h>
#include "tiercache/core/value.h"
#include "tiercache/core/error.h"
#include <memory>
#include <string>

namespace tiercache {
namespace core {
namespace {

TEST(ValueTest, DefaultIsNone) {
    Value value;
    EXPECT_TRUE(value.is_none());
    EXPECT_EQ(value.type(), Value::Type::NONE);
    EXPECT_FALSE(value.is_reference());
}

TEST(ValueTest, PrimitiveKinds) {
    EXPECT_EQ(Value(true).type(), Value::Type::BOOLEAN);
    EXPECT_EQ(Value(42).type(), Value::Type::NUMBER);
    EXPECT_EQ(Value(3.5).type(), Value::Type::NUMBER);
    EXPECT_EQ(Value("text").type(), Value::Type::STRING);
    EXPECT_EQ(Value(std::string("text")).type(), Value::Type::STRING);

    EXPECT_TRUE(Value(true).as_bool());
    EXPECT_DOUBLE_EQ(Value(42).as_number(), 42.0);
    EXPECT_EQ(Value("text").as_string(), "text");
}

TEST(ValueTest, ReferenceKinds) {
    Value array(ValueArray{Value(1), Value(2)});
    Value object(ValueObject{{"name", Value("home")}});

    EXPECT_EQ(array.type(), Value::Type::ARRAY);
    EXPECT_EQ(object.type(), Value::Type::OBJECT);
    EXPECT_TRUE(array.is_reference());
    EXPECT_TRUE(object.is_reference());
    EXPECT_EQ(array.as_array()->size(), 2u);
    EXPECT_EQ(object.as_object()->at("name").as_string(), "home");
}

TEST(ValueTest, WrongAccessorThrowsTypeMismatch) {
    Value number(7);
    EXPECT_THROW(number.as_string(), TypeMismatchError);
    EXPECT_THROW(number.as_bool(), TypeMismatchError);
    EXPECT_THROW(number.as_array(), TypeMismatchError);
    EXPECT_THROW(Value("x").as_number(), TypeMismatchError);
    EXPECT_THROW(Value().as_object(), TypeMismatchError);
}

TEST(ValueTest, EstimatedSize) {
    EXPECT_EQ(Value().estimated_size(), 0u);
    EXPECT_EQ(Value(false).estimated_size(), 4u);
    EXPECT_EQ(Value(1.25).estimated_size(), 8u);
    EXPECT_EQ(Value("abcd").estimated_size(), 8u);
    EXPECT_EQ(Value(ValueArray{Value(1), Value(2), Value(3)}).estimated_size(), 150u);
    EXPECT_EQ(Value(ValueObject{{"a", Value(1)}, {"b", Value(2)}}).estimated_size(), 200u);
}

TEST(ValueTest, CopiesShareReferenceTargets) {
    Value original(ValueArray{Value(1)});
    Value copy = original;

    copy.as_array()->push_back(Value(2));
    EXPECT_EQ(original.as_array()->size(), 2u);
    EXPECT_EQ(original, copy);
    EXPECT_EQ(original.use_count(), 2);
}

TEST(ValueTest, EqualityIsIdentityForReferences) {
    Value first(ValueArray{Value(1)});
    Value second(ValueArray{Value(1)});
    EXPECT_NE(first, second);

    EXPECT_EQ(Value("same"), Value("same"));
    EXPECT_EQ(Value(2), Value(2.0));
    EXPECT_NE(Value(true), Value(1));
}

TEST(ValueTest, FromSharedContainer) {
    auto object = std::make_shared<ValueObject>();
    (*object)["k"] = Value(1);

    Value value = Value::from_object(object);
    EXPECT_EQ(value.as_object(), object);
    EXPECT_TRUE(Value::from_array(nullptr).is_none());
}

TEST(ValueTest, TypeNames) {
    EXPECT_STREQ(to_string(Value::Type::NONE), "none");
    EXPECT_STREQ(to_string(Value::Type::ARRAY), "array");
    EXPECT_STREQ(to_string(Value::Type::OBJECT), "object");
}

TEST(WeakValueTest, LockWhileAlive) {
    Value target(ValueObject{{"id", Value(1)}});
    WeakValue weak(target);

    EXPECT_FALSE(weak.expired());
    auto locked = weak.lock();
    ASSERT_TRUE(locked.has_value());
    EXPECT_EQ(*locked, target);
}

TEST(WeakValueTest, ExpiresWithLastStrongCopy) {
    WeakValue weak;
    {
        Value target(ValueArray{Value("x")});
        weak = WeakValue(target);
        EXPECT_FALSE(weak.expired());
    }
    EXPECT_TRUE(weak.expired());
    EXPECT_FALSE(weak.lock().has_value());
}

TEST(WeakValueTest, DoesNotExtendLifetime) {
    Value target(ValueArray{});
    WeakValue weak(target);
    EXPECT_EQ(target.use_count(), 1);
    EXPECT_FALSE(weak.expired());
}

TEST(WeakValueTest, RejectsPrimitives) {
    EXPECT_THROW(WeakValue{Value(1)}, InvalidArgumentError);
    EXPECT_THROW(WeakValue{Value("s")}, InvalidArgumentError);
    EXPECT_THROW(WeakValue{Value()}, InvalidArgumentError);
}

} // namespace
} // namespace core
} // namespace tiercache
