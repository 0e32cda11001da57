#pragma once
/**
 * @file token.hpp
 * @brief Completion handle for one asynchronous broker operation.
 *
 * A Token is created pending by the client and completed exactly once, with
 * an empty error_code on success. Waiting is cooperative: a wait that loses
 * the race against its stop token returns "abandoned" and leaves the
 * operation running.
 */
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <system_error>
#include <vector>

namespace mqttop::mqtt
{

class Token
{
  public:
    using CompletionHandler = std::function<void(const std::error_code &)>;

    Token() = default;
    Token(const Token &) = delete;
    Token &operator=(const Token &) = delete;

    bool is_done() const;

    /**
     * @brief Blocks until the operation completes or @p st is triggered.
     * @return true if the operation completed, false if the wait was abandoned.
     */
    bool wait(std::stop_token st = {});

    /// @return true if the operation completed within @p timeout.
    bool wait_for(std::chrono::milliseconds timeout);

    /// The completion error. Empty while pending or on success.
    std::error_code error() const;

    /**
     * @brief Registers a handler run once on completion.
     *
     * Runs immediately on the calling thread if the token is already done,
     * otherwise on the thread that completes it.
     */
    void on_complete(CompletionHandler handler);

    /// Completes the token. Later calls are ignored.
    void complete(std::error_code ec = {});

  private:
    mutable std::mutex m_mutex;
    std::condition_variable_any m_cv;
    bool m_done = false;
    std::error_code m_error;
    std::vector<CompletionHandler> m_handlers;
};

using TokenPtr = std::shared_ptr<Token>;

/// A token that is already complete with @p ec.
TokenPtr make_completed_token(std::error_code ec = {});

/**
 * @brief Waits for @p token unless @p st wins the race.
 *
 * @return The operation's error if it completed, or an empty error_code if it
 *         succeeded or the wait was abandoned. Cancellation is never an error.
 */
std::error_code wait_token(std::stop_token st, const TokenPtr &token);

} // namespace mqttop::mqtt
