#pragma once
/**
 * @file memory_metric.hpp
 * @brief System memory usage read from /proc/meminfo.
 *
 * The value is published as a JSON object
 * `{"total": X, "used": X, "available": X, "cached": X, "free": X}` in one
 * binary unit, plus `swapTotal`, `swapUsed` and `swapFree` when swap is
 * included and present.
 */
#include "metrics/byte_size.hpp"
#include "metrics/periodic_metric.hpp"
#include "utils/result.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace mqttop::metrics
{

struct MemoryOptions
{
    std::string topic = "mqttop/metric/memory";
    std::chrono::milliseconds interval{2000};
    /// Unit for the values. Chosen from the total when unset.
    std::optional<ByteSize> size_unit;
    bool include_swap = false;
    std::filesystem::path meminfo_path = "/proc/meminfo";
};

class MemoryMetric final : public PeriodicMetric, public Discoverer
{
  public:
    /// Values in bytes.
    struct Snapshot
    {
        uint64_t total = 0;
        uint64_t free = 0;
        uint64_t available = 0;
        uint64_t used = 0;
        uint64_t cached = 0;
        uint64_t swap_total = 0;
        uint64_t swap_free = 0;
        uint64_t swap_used = 0;
    };

    /**
     * @brief Reads the totals once and builds the metric.
     * @return `Errc::not_supported` when the meminfo file cannot be read or has no MemTotal.
     */
    static utils::Result<std::shared_ptr<MemoryMetric>, std::error_code>
    create(MemoryOptions options);

    ~MemoryMetric() override;

    std::string type() const override { return "memory"; }
    std::string topic() const override { return m_options.topic; }
    std::error_code update() override;
    std::error_code append_text(std::string &out) const override;
    Discoverer *as_discoverer() override { return this; }

    void discover(discovery::Discovery &doc) override;

    Snapshot snapshot() const;
    ByteSize size_unit() const { return m_size; }
    bool include_swap() const { return m_include_swap; }

  private:
    explicit MemoryMetric(MemoryOptions options);

    std::error_code read_totals();

    MemoryOptions m_options;
    ByteSize m_size = ByteSize::Bytes;
    ByteSize m_swap_size = ByteSize::Bytes;
    bool m_include_swap = false;

    mutable std::mutex m_values_mutex;
    Snapshot m_values;
};

} // namespace mqttop::metrics
