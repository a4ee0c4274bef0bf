// SPDX-License-Identifier: MIT

#include "bulkload/transform.hpp"
#include <gtest/gtest.h>
#include <vector>

namespace bulkload {
namespace {

const std::vector<Transform> kAllTransforms = {
    Transform::None, Transform::Trim, Transform::Upper, Transform::Lower,
    Transform::NullIfBlank, Transform::Bool01, Transform::Number, Transform::String,
};

TEST(TransformTest, ParseNames) {
    EXPECT_EQ(parse_transform("none"), Transform::None);
    EXPECT_EQ(parse_transform(""), Transform::None);
    EXPECT_EQ(parse_transform("trim"), Transform::Trim);
    EXPECT_EQ(parse_transform("upper"), Transform::Upper);
    EXPECT_EQ(parse_transform("lower"), Transform::Lower);
    EXPECT_EQ(parse_transform("nz"), Transform::NullIfBlank);
    EXPECT_EQ(parse_transform("bool01"), Transform::Bool01);
    EXPECT_EQ(parse_transform("number"), Transform::Number);
    EXPECT_EQ(parse_transform("string"), Transform::String);
    EXPECT_FALSE(parse_transform("uppercase").has_value());
}

TEST(TransformTest, NamesRoundTrip) {
    for (auto t : kAllTransforms) {
        EXPECT_EQ(parse_transform(transform_name(t)), t);
    }
}

// Every transform accepts every kind of input without throwing
TEST(TransformTest, TotalOverEdgeInputs) {
    const std::vector<Value> inputs = {
        Undefined{}, nullptr, std::string(""), std::string("  "), std::string("abc"),
        std::string("12"), true, false, int64_t{0}, int64_t{-7}, 2.5,
    };
    for (auto t : kAllTransforms) {
        for (const auto& in : inputs) {
            EXPECT_NO_THROW(apply_transform(in, t)) << transform_name(t);
        }
    }
}

TEST(TransformTest, NoneIsPassthrough) {
    EXPECT_TRUE(is_undefined(apply_transform(Undefined{}, Transform::None)));
    EXPECT_EQ(apply_transform(std::string(" x "), Transform::None), Value{std::string(" x ")});
    EXPECT_EQ(apply_transform(int64_t{3}, Transform::None), Value{int64_t{3}});
}

TEST(TransformTest, CaseAndTrimKeepNullish) {
    for (auto t : {Transform::Trim, Transform::Upper, Transform::Lower}) {
        EXPECT_TRUE(is_undefined(apply_transform(Undefined{}, t)));
        EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(apply_transform(nullptr, t)));
    }
    EXPECT_EQ(apply_transform(std::string("  Ab c "), Transform::Trim), Value{std::string("Ab c")});
    EXPECT_EQ(apply_transform(std::string("aBc"), Transform::Upper), Value{std::string("ABC")});
    EXPECT_EQ(apply_transform(std::string("aBc"), Transform::Lower), Value{std::string("abc")});
}

TEST(TransformTest, CaseCoercesNonStrings) {
    EXPECT_EQ(apply_transform(int64_t{42}, Transform::Trim), Value{std::string("42")});
    EXPECT_EQ(apply_transform(true, Transform::Upper), Value{std::string("TRUE")});
}

TEST(TransformTest, NullIfBlank) {
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(
        apply_transform(Undefined{}, Transform::NullIfBlank)));
    for (const char* s : {"", "   ", "NA", "na", "N/A", " n/a "}) {
        EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(
            apply_transform(std::string(s), Transform::NullIfBlank)))
            << "'" << s << "'";
    }
    EXPECT_EQ(apply_transform(std::string(" x "), Transform::NullIfBlank),
              Value{std::string(" x ")});
    EXPECT_EQ(apply_transform(int64_t{0}, Transform::NullIfBlank), Value{int64_t{0}});
    EXPECT_EQ(apply_transform(std::string("NAN"), Transform::NullIfBlank),
              Value{std::string("NAN")});
}

TEST(TransformTest, Bool01) {
    EXPECT_EQ(apply_transform(true, Transform::Bool01), Value{int64_t{1}});
    EXPECT_EQ(apply_transform(int64_t{1}, Transform::Bool01), Value{int64_t{1}});
    EXPECT_EQ(apply_transform(1.0, Transform::Bool01), Value{int64_t{1}});
    EXPECT_EQ(apply_transform(std::string("TRUE"), Transform::Bool01), Value{int64_t{1}});
    EXPECT_EQ(apply_transform(std::string("yes"), Transform::Bool01), Value{int64_t{0}});
    EXPECT_EQ(apply_transform(int64_t{2}, Transform::Bool01), Value{int64_t{0}});
    EXPECT_EQ(apply_transform(false, Transform::Bool01), Value{int64_t{0}});
    EXPECT_EQ(apply_transform(Undefined{}, Transform::Bool01), Value{int64_t{0}});
    EXPECT_EQ(apply_transform(nullptr, Transform::Bool01), Value{int64_t{0}});
}

TEST(TransformTest, NumberParsesStrings) {
    EXPECT_EQ(apply_transform(std::string("42"), Transform::Number), Value{int64_t{42}});
    EXPECT_EQ(apply_transform(std::string(" -7 "), Transform::Number), Value{int64_t{-7}});
    EXPECT_EQ(apply_transform(std::string("+5"), Transform::Number), Value{int64_t{5}});
    EXPECT_EQ(apply_transform(std::string("2.5"), Transform::Number), Value{2.5});
    EXPECT_EQ(apply_transform(std::string("1e3"), Transform::Number), Value{1000.0});
}

TEST(TransformTest, NumberRejectsNonNumeric) {
    for (const char* s : {"", "  ", "abc", "12abc", "0x10", "+-1"}) {
        EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(
            apply_transform(std::string(s), Transform::Number)))
            << "'" << s << "'";
    }
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(
        apply_transform(Undefined{}, Transform::Number)));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(
        apply_transform(nullptr, Transform::Number)));
}

TEST(TransformTest, NumberKeepsNumbersAndConvertsBooleans) {
    EXPECT_EQ(apply_transform(int64_t{9}, Transform::Number), Value{int64_t{9}});
    EXPECT_EQ(apply_transform(0.25, Transform::Number), Value{0.25});
    EXPECT_EQ(apply_transform(true, Transform::Number), Value{int64_t{1}});
    EXPECT_EQ(apply_transform(false, Transform::Number), Value{int64_t{0}});
}

TEST(TransformTest, StringCoercion) {
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(
        apply_transform(Undefined{}, Transform::String)));
    EXPECT_TRUE(std::holds_alternative<std::nullptr_t>(
        apply_transform(nullptr, Transform::String)));
    EXPECT_EQ(apply_transform(int64_t{12}, Transform::String), Value{std::string("12")});
    EXPECT_EQ(apply_transform(3.0, Transform::String), Value{std::string("3")});
    EXPECT_EQ(apply_transform(false, Transform::String), Value{std::string("false")});
    EXPECT_EQ(apply_transform(std::string(""), Transform::String), Value{std::string("")});
}

}  // namespace
}  // namespace bulkload
