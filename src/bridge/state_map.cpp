#include "bridge/state_map.hpp"

#include <mutex>

#include <nlohmann/json.hpp>

namespace mqttop::bridge
{

void StateMap::store(const std::string &topic, bool state)
{
    std::unique_lock lock(m_mutex);
    m_states[topic] = state;
}

bool StateMap::compare_and_swap(const std::string &topic, bool expected, bool desired)
{
    std::unique_lock lock(m_mutex);
    auto it = m_states.find(topic);
    if (it == m_states.end() || it->second != expected)
    {
        return false;
    }
    it->second = desired;
    return true;
}

void StateMap::erase(const std::string &topic)
{
    std::unique_lock lock(m_mutex);
    m_states.erase(topic);
}

std::optional<bool> StateMap::get(const std::string &topic) const
{
    std::shared_lock lock(m_mutex);
    if (auto it = m_states.find(topic); it != m_states.end())
    {
        return it->second;
    }
    return std::nullopt;
}

std::map<std::string, bool> StateMap::snapshot() const
{
    std::shared_lock lock(m_mutex);
    return m_states;
}

size_t StateMap::size() const
{
    std::shared_lock lock(m_mutex);
    return m_states.size();
}

std::string StateMap::to_json() const
{
    nlohmann::json j = nlohmann::json::object();
    {
        std::shared_lock lock(m_mutex);
        for (const auto &[topic, state] : m_states)
        {
            j[topic] = state;
        }
    }
    return j.dump();
}

} // namespace mqttop::bridge
