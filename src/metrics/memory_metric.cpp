#include "metrics/memory_metric.hpp"
#include "discovery/discovery.hpp"
#include "metrics/errors.hpp"
#include "utils/format_tools.hpp"
#include "utils/logger.hpp"

#include <cerrno>
#include <charconv>
#include <fstream>

#include <fmt/format.h>

namespace mqttop::metrics
{

namespace
{
// Calls @p fn(key, bytes) for every "Key:   value kB" line until it returns false.
template <typename Fn>
std::error_code scan_meminfo(const std::filesystem::path &path, Fn &&fn)
{
    std::ifstream in(path);
    if (!in)
    {
        return {errno ? errno : ENOENT, std::generic_category()};
    }
    std::string line;
    while (std::getline(in, line))
    {
        const auto colon = line.find(':');
        if (colon == std::string::npos)
        {
            continue;
        }
        const std::string_view key(line.data(), colon);
        const auto rest = format_tools::trim_whitespace(std::string_view(line).substr(colon + 1));
        uint64_t value = 0;
        std::from_chars(rest.data(), rest.data() + rest.size(), value);
        // The kernel reports these fields in KiB.
        if (!fn(key, value << 10))
        {
            break;
        }
    }
    if (in.bad())
    {
        return std::make_error_code(std::errc::io_error);
    }
    return {};
}

void append_field(std::string &out, std::string_view key, uint64_t bytes, ByteSize size)
{
    fmt::format_to(std::back_inserter(out), ", \"{}\": ", key);
    append_size(out, bytes, size);
}
} // namespace

MemoryMetric::MemoryMetric(MemoryOptions options)
    : PeriodicMetric(options.interval), m_options(std::move(options)),
      m_include_swap(m_options.include_swap)
{
}

MemoryMetric::~MemoryMetric()
{
    join();
}

utils::Result<std::shared_ptr<MemoryMetric>, std::error_code>
MemoryMetric::create(MemoryOptions options)
{
    using R = utils::Result<std::shared_ptr<MemoryMetric>, std::error_code>;

    std::shared_ptr<MemoryMetric> m(new MemoryMetric(std::move(options)));
    if (auto ec = m->read_totals())
    {
        LOGGER_ERROR("Couldn't initialize memory from '{}': {}", m->m_options.meminfo_path.string(),
                     ec.message());
        return R::error(make_error_code(Errc::not_supported));
    }
    return R::ok(std::move(m));
}

std::error_code MemoryMetric::read_totals()
{
    bool has_swap = false;
    Snapshot values;
    auto ec = scan_meminfo(m_options.meminfo_path,
                           [&](std::string_view key, uint64_t bytes)
                           {
                               if (key == "MemTotal")
                               {
                                   values.total = bytes;
                               }
                               else if (key == "SwapTotal")
                               {
                                   has_swap = true;
                                   values.swap_total = bytes;
                               }
                               return values.total == 0 || !has_swap;
                           });
    if (ec)
    {
        return ec;
    }
    if (values.total == 0)
    {
        return make_error_code(Errc::not_found);
    }

    m_size = m_options.size_unit.value_or(size_of(values.total));
    m_swap_size = size_of(values.swap_total);
    m_include_swap = m_options.include_swap && has_swap;
    if (!m_include_swap)
    {
        values.swap_total = 0;
    }

    std::lock_guard<std::mutex> lock(m_values_mutex);
    m_values = values;
    return {};
}

std::error_code MemoryMetric::update()
{
    Snapshot values;
    {
        std::lock_guard<std::mutex> lock(m_values_mutex);
        values = m_values;
    }

    bool got_available = false;
    auto ec = scan_meminfo(m_options.meminfo_path,
                           [&](std::string_view key, uint64_t bytes)
                           {
                               // Everything of interest comes before the "Dirty" line.
                               if (!key.empty() && key.front() == 'D')
                               {
                                   return false;
                               }
                               if (key == "MemFree")
                               {
                                   values.free = bytes;
                               }
                               else if (key == "MemAvailable")
                               {
                                   values.available = bytes;
                                   got_available = true;
                               }
                               else if (key == "Cached")
                               {
                                   values.cached = bytes;
                               }
                               else if (key == "SwapTotal" && m_include_swap)
                               {
                                   values.swap_total = bytes;
                               }
                               else if (key == "SwapFree" && m_include_swap)
                               {
                                   values.swap_free = bytes;
                               }
                               return true;
                           });
    if (ec)
    {
        return ec;
    }

    if (!got_available)
    {
        values.available = values.free + values.cached;
    }
    values.used = values.available > values.total ? values.total - values.free
                                                  : values.total - values.available;
    if (values.swap_total > 0)
    {
        values.swap_used = values.swap_total - values.swap_free;
    }

    std::lock_guard<std::mutex> lock(m_values_mutex);
    m_values = values;
    return {};
}

MemoryMetric::Snapshot MemoryMetric::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_values_mutex);
    return m_values;
}

std::error_code MemoryMetric::append_text(std::string &out) const
{
    const Snapshot v = snapshot();
    out += "{\"total\": ";
    append_size(out, v.total, m_size);
    append_field(out, "used", v.used, m_size);
    append_field(out, "available", v.available, m_size);
    append_field(out, "cached", v.cached, m_size);
    append_field(out, "free", v.free, m_size);
    if (v.swap_total > 0)
    {
        append_field(out, "swapTotal", v.swap_total, m_swap_size);
        append_field(out, "swapUsed", v.swap_used, m_swap_size);
        append_field(out, "swapFree", v.swap_free, m_swap_size);
    }
    out += '}';
    return {};
}

void MemoryMetric::discover(discovery::Discovery &doc)
{
    namespace opt = discovery::opt;
    const std::string node = type();
    const std::string base = doc.origin().name + "_memory";
    const std::string avail = discovery::availability_template(topic());
    const std::string unit(to_string(m_size));
    const std::string swap_unit(to_string(m_swap_size));

    auto sensor = [&](const std::string &id, const char *name, const char *icon)
    {
        return discovery::Component{
            {opt::Platform, discovery::platform::Sensor},
            {opt::Name, name},
            {opt::Icon, icon},
            {opt::EntityCategory, discovery::kDiagnostic},
            {opt::AvailabilityTopic, doc.availability_topic()},
            {opt::AvailabilityTemplate, avail},
            {opt::StateTopic, topic()},
            {opt::UniqueId, id},
        };
    };
    auto size_sensor = [&](const std::string &suffix, const char *name, const char *icon,
                           const char *field, const std::string &size_unit)
    {
        const std::string id = base + suffix;
        auto cmp = sensor(id, name, icon);
        cmp[opt::DeviceClass] = "data_size";
        cmp[opt::ValueTemplate] = fmt::format("{{{{ value_json.{} }}}}", field);
        cmp[opt::UnitOfMeasurement] = size_unit;
        cmp[opt::EnabledByDefault] = false;
        doc.add_component(node, id, std::move(cmp));
    };

    auto usage = sensor(base, "Memory usage", "mdi:memory");
    usage[opt::ValueTemplate] = "{{ 100 * value_json.used / value_json.total }}";
    usage[opt::UnitOfMeasurement] = "%";
    usage[opt::SuggestedDisplayPrecision] = 1;
    usage[opt::JsonAttributesTopic] = topic();
    usage[opt::JsonAttributesTemplate] = fmt::format(
        "{{{{ dict(value_json|items|rejectattr('0', 'match', '^swap')|list + [('size_unit', "
        "\"{}\")]) | tojson }}}}",
        unit);
    doc.add_component(node, base, std::move(usage));

    size_sensor("_total", "Memory total", "mdi:memory", "total", unit);
    size_sensor("_used", "Memory used", "mdi:memory", "used", unit);
    size_sensor("_free", "Memory free", "mdi:memory", "free", unit);
    size_sensor("_cached", "Memory cached", "mdi:memory", "cached", unit);
    size_sensor("_available", "Memory available", "mdi:memory", "available", unit);

    if (!m_include_swap)
    {
        return;
    }

    const std::string swap_id = base + "_swap";
    auto swap = sensor(swap_id, "Swap usage", "mdi:database");
    swap[opt::ValueTemplate] = "{{ 100 * value_json.swapUsed / value_json.swapTotal }}";
    swap[opt::UnitOfMeasurement] = "%";
    swap[opt::SuggestedDisplayPrecision] = 1;
    swap[opt::JsonAttributesTopic] = topic();
    swap[opt::JsonAttributesTemplate] = fmt::format(
        "{{{{ {{'total': value_json.swapTotal, 'used': value_json.swapUsed, 'free': "
        "value_json.swapFree, 'size_unit': \"{}\"}} | tojson }}}}",
        swap_unit);
    doc.add_component(node, swap_id, std::move(swap));

    size_sensor("_swap_total", "Swap total", "mdi:database", "swapTotal", swap_unit);
    size_sensor("_swap_used", "Swap used", "mdi:database", "swapUsed", swap_unit);
    size_sensor("_swap_free", "Swap free", "mdi:database", "swapFree", swap_unit);
}

} // namespace mqttop::metrics
