#pragma once
/**
 * @file state_map.hpp
 * @brief Concurrent topic -> liveness map published on the last-will topic.
 */
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>

namespace mqttop::bridge
{

class StateMap
{
  public:
    void store(const std::string &topic, bool state);

    /**
     * @brief Sets @p topic to @p desired if it currently holds @p expected.
     * @return false when the entry is absent or holds another value.
     */
    bool compare_and_swap(const std::string &topic, bool expected, bool desired);

    void erase(const std::string &topic);

    std::optional<bool> get(const std::string &topic) const;
    std::map<std::string, bool> snapshot() const;
    size_t size() const;

    /// Compact JSON object, keys sorted: `{"a/b":true,"c/d":false}`.
    std::string to_json() const;

  private:
    mutable std::shared_mutex m_mutex;
    std::map<std::string, bool> m_states;
};

} // namespace mqttop::bridge
