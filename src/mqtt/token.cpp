#include "mqtt/token.hpp"

namespace mqttop::mqtt
{

bool Token::is_done() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_done;
}

bool Token::wait(std::stop_token st)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait(lock, st, [this] { return m_done; });
}

bool Token::wait_for(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] { return m_done; });
}

std::error_code Token::error() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

void Token::on_complete(CompletionHandler handler)
{
    if (!handler)
        return;
    std::unique_lock<std::mutex> lock(m_mutex);
    if (!m_done)
    {
        m_handlers.push_back(std::move(handler));
        return;
    }
    auto ec = m_error;
    lock.unlock();
    handler(ec);
}

void Token::complete(std::error_code ec)
{
    std::vector<CompletionHandler> handlers;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_done)
            return;
        m_done = true;
        m_error = ec;
        handlers.swap(m_handlers);
    }
    m_cv.notify_all();
    for (auto &handler : handlers)
    {
        handler(ec);
    }
}

TokenPtr make_completed_token(std::error_code ec)
{
    auto token = std::make_shared<Token>();
    token->complete(ec);
    return token;
}

std::error_code wait_token(std::stop_token st, const TokenPtr &token)
{
    if (!token || !token->wait(std::move(st)))
    {
        return {};
    }
    return token->error();
}

} // namespace mqttop::mqtt
