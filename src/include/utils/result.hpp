/**
 * @file result.hpp
 * @brief Generic Result<T, E> type for operations that can fail in expected ways.
 *
 * Design Philosophy:
 * - Distinguishes between success (T) and expected failures (E)
 * - Forces explicit error handling at call sites
 * - No implicit conversions to bool (prevents accidental misuse)
 * - [[nodiscard]] prevents ignoring errors
 *
 * mqttop uses it with `std::error_code` as E, e.g. when loading a persisted
 * discovery document or probing the device identity.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace mqttop::utils
{

/**
 * @class Result
 * @brief Generic Result<T, E> type for operations that can fail in expected ways
 *
 * @tparam T Success value type
 * @tparam E Error type (an enum or `std::error_code`)
 *
 * Usage:
 * @code
 * auto result = Discovery::load(path);
 * if (result.is_ok()) {
 *     Discovery doc = std::move(result).content();
 * } else {
 *     LOGGER_WARN("cannot load: {}", result.error().message());
 * }
 * @endcode
 *
 * Thread Safety: Result objects are not thread-safe.
 */
template <typename T, typename E>
class Result
{
  public:
    using value_type = T;
    using error_type = E;

    /**
     * @brief Create a successful Result containing a value
     * @param value The success value (moved into Result)
     */
    [[nodiscard]] static Result ok(T value)
    {
        Result result;
        result.m_data = std::move(value);
        return result;
    }

    /**
     * @brief Create a failed Result containing an error
     * @param err The error value
     * @param code Optional detailed error code (default 0)
     */
    [[nodiscard]] static Result error(E err, int code = 0)
    {
        Result result;
        result.m_data = ErrorData{err, code};
        return result;
    }

    // Default constructible (starts in error state with default error)
    Result() : m_data(ErrorData{E{}, 0}) {}

    // Movable but not copyable (to avoid accidental copies of large values)
    Result(Result &&) noexcept = default;
    Result &operator=(Result &&) noexcept = default;
    Result(const Result &) = delete;
    Result &operator=(const Result &) = delete;

    [[nodiscard]] bool is_ok() const noexcept { return std::holds_alternative<T>(m_data); }

    [[nodiscard]] bool is_error() const noexcept { return !is_ok(); }

    /**
     * @brief Get the success content (mutable reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &content() &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Get the success content (const reference)
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] const T &content() const &
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(m_data);
    }

    /**
     * @brief Move the success content out of Result
     * @throws std::logic_error if Result is in error state
     */
    [[nodiscard]] T &&content() &&
    {
        if (!is_ok())
        {
            throw std::logic_error("Result::content() called on error state");
        }
        return std::get<T>(std::move(m_data));
    }

    /**
     * @brief Get the success value or a default if error
     */
    [[nodiscard]] T value_or(T default_value) const &
    {
        return is_ok() ? std::get<T>(m_data) : std::move(default_value);
    }

    /**
     * @brief Get the error value
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] E error() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error() called on success state");
        }
        return std::get<ErrorData>(m_data).error_enum;
    }

    /**
     * @brief Get the detailed error code (0 if not set)
     * @throws std::logic_error if Result is in success state
     */
    [[nodiscard]] int error_code() const
    {
        if (is_ok())
        {
            throw std::logic_error("Result::error_code() called on success state");
        }
        return std::get<ErrorData>(m_data).error_code;
    }

  private:
    struct ErrorData
    {
        E error_enum;
        int error_code;
    };

    std::variant<T, ErrorData> m_data;
};

} // namespace mqttop::utils
