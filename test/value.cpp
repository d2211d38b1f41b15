// Copyright (c) Giacomo Drago <giacomo@giacomodrago.com>
// All rights reserved.

// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
// 1. Redistributions of source code must retain the above copyright
//    notice, this list of conditions and the following disclaimer.
// 2. Redistributions in binary form must reproduce the above copyright
//    notice, this list of conditions and the following disclaimer in the
//    documentation and/or other materials provided with the distribution.
// 3. Neither the name of Giacomo Drago nor the
//    names of its contributors may be used to endorse or promote products
//    derived from this software without specific prior written permission.

// THIS SOFTWARE IS PROVIDED BY GIACOMO DRAGO "AS IS" AND ANY
// EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
// WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
// DISCLAIMED. IN NO EVENT SHALL GIACOMO DRAGO BE LIABLE FOR ANY
// DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
// (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
// LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
// ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
// (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.

#include "nbjson_parser.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>

enum class OrderType
{
    UNKNOWN,
    BUY,
    SELL,
};

namespace nbjson
{

template<>
struct value_as<OrderType>
{
    OrderType operator()(const value v) const
    {
        if (v.type() != String)
        {
            throw bad_value_cast("OrderType must be a string");
        }

        if (v.raw() == "BUY")
        {
            return OrderType::BUY;
        }
        if (v.raw() == "SELL")
        {
            return OrderType::SELL;
        }

        return OrderType::UNKNOWN;
    }
};

template<>
struct value_as<std::optional<OrderType>>
{
    std::optional<OrderType> operator()(const value v) const
    {
        if (v.type() == Null)
        {
            return std::nullopt;
        }

        const OrderType order_type = value_as<OrderType>()(v);
        if (order_type == OrderType::UNKNOWN)
        {
            return std::nullopt;
        }
        return order_type;
    }
};

template<typename T>
struct value_as<T, std::enable_if_t<std::is_floating_point_v<T>>>
{
    T operator()(const value v) const
    {
        // Only here to check that the specialization is picked up
        if (v.raw() == "1")
        {
            return 42;
        }
        return value_as_default<T>(v);
    }
};

} // namespace nbjson

TEST(nbjson_value, default_constructed)
{
    const nbjson::value v;
    ASSERT_EQ(nbjson::Null, v.type());
    ASSERT_EQ("null", v.raw());
    ASSERT_EQ(std::nullopt, v.as<std::optional<int>>());
    ASSERT_THROW(v.as<int>(), nbjson::bad_value_cast);
}

TEST(nbjson_value, strings)
{
    const nbjson::value v(nbjson::String, "Elvis");
    ASSERT_EQ("Elvis", v.as<std::string_view>());
    ASSERT_EQ(std::string("Elvis"), v.as<std::string>());
    ASSERT_EQ(std::string("Elvis"), v.as<std::optional<std::string>>());

    std::string dest;
    v.to(dest);
    ASSERT_EQ("Elvis", dest);

    ASSERT_THROW(v.as<int>(), nbjson::bad_value_cast);
    ASSERT_THROW(v.as<bool>(), nbjson::bad_value_cast);
}

TEST(nbjson_value, booleans)
{
    ASSERT_TRUE(nbjson::value(nbjson::Boolean, "true").as<bool>());
    ASSERT_FALSE(nbjson::value(nbjson::Boolean, "false").as<bool>());
    ASSERT_EQ(true, nbjson::value(nbjson::Boolean, "true").as<std::optional<bool>>());
    ASSERT_THROW(
        nbjson::value(nbjson::Boolean, "true").as<std::string_view>(),
        nbjson::bad_value_cast);
}

TEST(nbjson_value, numbers)
{
    ASSERT_EQ(132, nbjson::value(nbjson::Number, "132").as<int>());
    ASSERT_EQ(-7, nbjson::value(nbjson::Number, "-7").as<std::int64_t>());
    ASSERT_DOUBLE_EQ(80.67, nbjson::value(nbjson::Number, "80.67").as<double>());
    ASSERT_DOUBLE_EQ(
        123.45e-6,
        nbjson::value(nbjson::Number, "123.45e-6").as<double>());

    std::uint8_t small = 0;
    nbjson::value(nbjson::Number, "255").to(small);
    ASSERT_EQ(255, small);

    ASSERT_THROW(
        nbjson::value(nbjson::Number, "256").as<std::uint8_t>(),
        std::range_error);
    ASSERT_THROW(
        nbjson::value(nbjson::Number, "-1").as<unsigned int>(),
        std::range_error);
    ASSERT_THROW(
        nbjson::value(nbjson::Number, "123456789012345678901234567890")
            .as<std::int64_t>(),
        std::range_error);
    ASSERT_THROW(
        nbjson::value(nbjson::Number, "1.5").as<int>(),
        std::range_error);

    ASSERT_THROW(
        nbjson::value(nbjson::Number, "1").as<std::string>(),
        nbjson::bad_value_cast);
}

TEST(nbjson_value, nulls)
{
    const nbjson::value v(nbjson::Null, "null");
    ASSERT_EQ(std::nullopt, v.as<std::optional<int>>());
    ASSERT_EQ(std::nullopt, v.as<std::optional<std::string_view>>());
    ASSERT_THROW(v.as<bool>(), nbjson::bad_value_cast);
    ASSERT_THROW(v.as<std::string>(), nbjson::bad_value_cast);
}

TEST(nbjson_value_as_specializations, string_to_enum)
{
    {
        nbjson::value v(nbjson::String, "BUY");
        ASSERT_EQ(OrderType::BUY, v.as<OrderType>());
        ASSERT_EQ(OrderType::BUY, v.as<std::optional<OrderType>>());
    }
    {
        nbjson::value v(nbjson::Null, "null");
        ASSERT_EQ(std::nullopt, v.as<std::optional<OrderType>>());
    }
    {
        nbjson::value v(nbjson::String, "UNKNOWN");
        ASSERT_EQ(std::nullopt, v.as<std::optional<OrderType>>());
    }
    {
        nbjson::value v(nbjson::Number, "1");
        ASSERT_THROW(v.as<OrderType>(), nbjson::bad_value_cast);
    }
}

TEST(nbjson_value_as_specializations, floating_point)
{
    nbjson::value v(nbjson::Number, "1");
    ASSERT_EQ(1, v.as<int>());

    ASSERT_EQ(42, v.as<double>());
    ASSERT_EQ(42, v.as<float>());

    // std::optional<T> goes through the specialization for T
    ASSERT_EQ(42, v.as<std::optional<double>>());
    ASSERT_EQ(42, v.as<std::optional<float>>());
}

TEST(nbjson_value_as_specializations, floating_point_fallback)
{
    nbjson::value v(nbjson::Number, "12");
    ASSERT_EQ(12, v.as<double>());
    ASSERT_EQ(12, v.as<float>());
}

TEST(nbjson_value_as_specializations, from_parser)
{
    nbjson::parser parser;
    parser.feeder().feed("{\"side\":\"SELL\"}");

    ASSERT_EQ(nbjson::event::StartObject, parser.next_event());
    ASSERT_EQ(nbjson::event::FieldName, parser.next_event());
    ASSERT_EQ(nbjson::event::ValueString, parser.next_event());
    ASSERT_EQ(OrderType::SELL, parser.value().as<OrderType>());
}
