/**
 * @file test_result.cpp
 * @brief Unit tests for Result<T, E> as used with std::error_code.
 */
#include "utils/result.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <system_error>

using mqttop::utils::Result;

namespace
{

// Not default constructible, like the discovery document.
struct Handle
{
    explicit Handle(int v) : value(v) {}
    int value;
};

} // namespace

TEST(ResultTest, ConstructionOk)
{
    auto result = Result<int, std::error_code>::ok(42);
    EXPECT_TRUE(result.is_ok());
    EXPECT_FALSE(result.is_error());
    EXPECT_EQ(result.content(), 42);
}

TEST(ResultTest, ConstructionError)
{
    const auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    auto result = Result<int, std::error_code>::error(ec, 7);
    EXPECT_TRUE(result.is_error());
    EXPECT_EQ(result.error(), ec);
    EXPECT_EQ(result.error_code(), 7);
}

TEST(ResultTest, DefaultIsErrorAndNeedsNoDefaultValue)
{
    Result<Handle, std::error_code> result;
    EXPECT_TRUE(result.is_error());
    EXPECT_THROW({ (void)result.content(); }, std::logic_error);
}

TEST(ResultTest, MoveOutContent)
{
    auto result = Result<std::unique_ptr<Handle>, std::error_code>::ok(std::make_unique<Handle>(3));
    auto handle = std::move(result).content();
    ASSERT_NE(handle, nullptr);
    EXPECT_EQ(handle->value, 3);
}

TEST(ResultTest, ValueOr)
{
    EXPECT_EQ((Result<std::string, std::error_code>::ok("x").value_or("y")), "x");
    EXPECT_EQ((Result<std::string, std::error_code>::error({}).value_or("y")), "y");
}

TEST(ResultTest, ErrorOnSuccessThrows)
{
    auto result = Result<int, std::error_code>::ok(1);
    EXPECT_THROW({ (void)result.error(); }, std::logic_error);
}
