/*******************************************************************************
 * @file lifecycle.cpp
 * @brief Implementation of the dependency-ordered module lifecycle manager.
 ******************************************************************************/
#include "mqttop_base.hpp"
#include "utils/lifecycle.hpp"

#include <algorithm>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

namespace
{
constexpr size_t kDebugInfoReserveBytes = 2048;

void validate_module_name(std::string_view name, const char *param_name)
{
    if (name.empty())
    {
        throw std::invalid_argument(std::string("Lifecycle: ") + param_name +
                                    " must not be empty.");
    }
    if (name.size() > mqttop::utils::ModuleDef::MAX_MODULE_NAME_LEN)
    {
        throw std::length_error(std::string("Lifecycle: ") + param_name + " exceeds maximum of " +
                                std::to_string(mqttop::utils::ModuleDef::MAX_MODULE_NAME_LEN) +
                                " characters.");
    }
}

struct ShutdownOutcome
{
    bool success;
    bool timed_out;
    std::string exception_msg;
};

/**
 * @brief Runs `func` on a thread with a real deadline.
 *
 * The completion state is shared with the thread so that a callback that
 * outlives the deadline (its thread is detached) never touches this frame.
 */
ShutdownOutcome timedShutdown(const std::function<void()> &func,
                              std::chrono::milliseconds timeout)
{
    if (!func)
    {
        return {true, false, {}};
    }

    struct SharedState
    {
        std::atomic<bool> completed{false};
        std::exception_ptr ex_ptr{nullptr};
    };
    auto state = std::make_shared<SharedState>();

    std::thread thread(
        [func, state]()
        {
            try
            {
                func();
            }
            catch (...)
            {
                state->ex_ptr = std::current_exception();
            }
            state->completed.store(true, std::memory_order_release);
        });

    if (timeout.count() > 0)
    {
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!state->completed.load(std::memory_order_acquire))
        {
            if (std::chrono::steady_clock::now() >= deadline)
            {
                thread.detach();
                return {false, true, {}};
            }
            constexpr std::chrono::milliseconds kPollInterval(10);
            std::this_thread::sleep_for(kPollInterval);
        }
    }
    thread.join();

    if (state->ex_ptr)
    {
        try
        {
            std::rethrow_exception(state->ex_ptr);
        }
        catch (const std::exception &e)
        {
            return {false, false, e.what()};
        }
        catch (...)
        {
            return {false, false, "unknown exception"};
        }
    }
    return {true, false, {}};
}

} // namespace

namespace mqttop::utils
{

struct InternalModuleDef
{
    std::string name;
    std::vector<std::string> dependencies;
    std::function<void()> startup;
    std::function<void()> shutdown;
    std::chrono::milliseconds shutdown_timeout{0};
};

class ModuleDefImpl
{
  public:
    InternalModuleDef def;
};

ModuleDef::ModuleDef(std::string_view name) : pImpl(std::make_unique<ModuleDefImpl>())
{
    validate_module_name(name, "module name");
    pImpl->def.name = std::string(name);
}
ModuleDef::~ModuleDef() = default;
ModuleDef::ModuleDef(ModuleDef &&other) noexcept = default;
ModuleDef &ModuleDef::operator=(ModuleDef &&other) noexcept = default;

void ModuleDef::add_dependency(std::string_view dependency_name)
{
    if (dependency_name.empty())
    {
        return;
    }
    validate_module_name(dependency_name, "dependency name");
    pImpl->def.dependencies.emplace_back(dependency_name);
}

void ModuleDef::set_startup(LifecycleCallback startup_func)
{
    if (startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func] { startup_func(nullptr); };
    }
}

void ModuleDef::set_startup(LifecycleCallback startup_func, std::string_view arg)
{
    if (arg.size() > MAX_CALLBACK_PARAM_STRLEN)
    {
        throw std::length_error("Lifecycle: startup argument exceeds maximum length.");
    }
    if (startup_func != nullptr)
    {
        pImpl->def.startup = [startup_func, s = std::string(arg)] { startup_func(s.c_str()); };
    }
}

void ModuleDef::set_shutdown(LifecycleCallback shutdown_func, std::chrono::milliseconds timeout)
{
    if (shutdown_func != nullptr)
    {
        pImpl->def.shutdown = [shutdown_func] { shutdown_func(nullptr); };
        pImpl->def.shutdown_timeout = timeout;
    }
}

class LifecycleManagerImpl
{
  public:
    LifecycleManagerImpl()
        : m_pid(mqttop::platform::get_pid()),
          m_app_name(mqttop::platform::get_executable_name())
    {
    }

    enum class ModuleStatus : std::uint8_t
    {
        Registered,
        Initializing,
        Started,
        Failed,
        Shutdown,
        FailedShutdown,
        ShutdownTimeout
    };

    struct InternalGraphNode
    {
        InternalModuleDef def;
        std::vector<InternalGraphNode *> dependents;
        std::atomic<ModuleStatus> status = {ModuleStatus::Registered};
    };

    void registerModule(InternalModuleDef def);
    void initialize(std::source_location loc);
    void finalize(std::source_location loc);

    std::atomic<bool> m_is_initialized = {false};
    std::atomic<bool> m_is_finalized = {false};

  private:
    void buildStaticGraph();
    static std::vector<InternalGraphNode *>
    topologicalSort(const std::vector<InternalGraphNode *> &nodes);
    static void shutdownModuleWithTimeout(InternalGraphNode &mod, std::string &debug_info);
    [[noreturn]] void printStatusAndAbort(const std::string &msg, const std::string &mod = "");

    const uint64_t m_pid;
    const std::string m_app_name;
    std::mutex m_registry_mutex;
    std::vector<InternalModuleDef> m_registered_modules;
    std::map<std::string, InternalGraphNode, std::less<>> m_module_graph;
    std::vector<InternalGraphNode *> m_startup_order;
    std::vector<InternalGraphNode *> m_shutdown_order;
};

void LifecycleManagerImpl::registerModule(InternalModuleDef def)
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    if (m_is_initialized.load(std::memory_order_acquire))
    {
        fmt::print(stderr, "[MQTTOP_LifeCycle] FATAL: register_module called after "
                           "initialization. Module: '{}'\n",
                   def.name);
        mqttop::debug::print_stack_trace();
        std::abort();
    }
    m_registered_modules.push_back(std::move(def));
}

void LifecycleManagerImpl::initialize(std::source_location loc)
{
    if (m_is_initialized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }
    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[MQTTOP_LifeCycle] [{}]:PID[{}]\n"
                              "     **** initialize() triggered from {} ({}:{})\n",
                              m_app_name, m_pid, loc.function_name(),
                              mqttop::format_tools::filename_only(loc.file_name()), loc.line());
    try
    {
        buildStaticGraph();
        std::vector<InternalGraphNode *> nodes;
        for (auto &entry : m_module_graph)
        {
            nodes.push_back(&entry.second);
        }
        m_startup_order = topologicalSort(nodes);
    }
    catch (const std::runtime_error &e)
    {
        printStatusAndAbort(e.what());
    }

    m_shutdown_order = m_startup_order;
    std::reverse(m_shutdown_order.begin(), m_shutdown_order.end());

    for (auto *mod : m_startup_order)
    {
        try
        {
            debug_info += fmt::format("     -> Starting module: '{}'...", mod->def.name);
            mod->status.store(ModuleStatus::Initializing, std::memory_order_release);
            if (mod->def.startup)
            {
                mod->def.startup();
            }
            mod->status.store(ModuleStatus::Started, std::memory_order_release);
            debug_info += "done.\n";
        }
        catch (const std::exception &e)
        {
            mod->status.store(ModuleStatus::Failed, std::memory_order_release);
            MQTTOP_DEBUG("{}", debug_info);
            printStatusAndAbort("Exception during startup: " + std::string(e.what()),
                                mod->def.name);
        }
    }
    debug_info += "     -> Application initialization complete.\n";
    MQTTOP_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::finalize(std::source_location loc)
{
    if (!m_is_initialized.load(std::memory_order_acquire) ||
        m_is_finalized.exchange(true, std::memory_order_acq_rel))
    {
        return;
    }

    std::string debug_info;
    debug_info.reserve(kDebugInfoReserveBytes);
    debug_info += fmt::format("[MQTTOP_LifeCycle] [{}]:PID[{}]\n"
                              "     **** finalize() called from {} ({}:{})\n",
                              m_app_name, m_pid, loc.function_name(),
                              mqttop::format_tools::filename_only(loc.file_name()), loc.line());

    for (auto *mod : m_shutdown_order)
    {
        if (mod->status.load(std::memory_order_acquire) == ModuleStatus::Started)
        {
            shutdownModuleWithTimeout(*mod, debug_info);
        }
        else
        {
            debug_info += fmt::format("     <- Skipping module '{}' (not started).\n",
                                      mod->def.name);
        }
    }
    debug_info += "     <- Application finalization complete.\n";
    MQTTOP_DEBUG("{}", debug_info);
}

void LifecycleManagerImpl::shutdownModuleWithTimeout(InternalGraphNode &mod,
                                                     std::string &debug_info)
{
    debug_info += fmt::format("     <- Shutting down module: '{}'...", mod.def.name);

    auto outcome = timedShutdown(mod.def.shutdown, mod.def.shutdown_timeout);

    if (outcome.success)
    {
        mod.status.store(ModuleStatus::Shutdown, std::memory_order_release);
        debug_info += "done.\n";
    }
    else if (outcome.timed_out)
    {
        mod.status.store(ModuleStatus::ShutdownTimeout, std::memory_order_release);
        debug_info +=
            fmt::format("TIMEOUT ({}ms)! Thread detached.\n", mod.def.shutdown_timeout.count());
    }
    else
    {
        mod.status.store(ModuleStatus::FailedShutdown, std::memory_order_release);
        debug_info += fmt::format("\n     **** ERROR: module '{}' threw on shutdown: {}\n",
                                  mod.def.name, outcome.exception_msg);
    }
}

void LifecycleManagerImpl::buildStaticGraph()
{
    std::lock_guard<std::mutex> lock(m_registry_mutex);
    for (auto &def : m_registered_modules)
    {
        if (m_module_graph.contains(def.name))
        {
            throw std::runtime_error("Duplicate module name: " + def.name);
        }
        const std::string name = def.name;
        m_module_graph[name].def = std::move(def);
    }
    for (auto &entry : m_module_graph)
    {
        for (const auto &dep_name : entry.second.def.dependencies)
        {
            auto iter = m_module_graph.find(dep_name);
            if (iter == m_module_graph.end())
            {
                throw std::runtime_error("Undefined dependency: " + dep_name);
            }
            iter->second.dependents.push_back(&entry.second);
        }
    }
    m_registered_modules.clear();
}

/**
 * @brief Kahn's algorithm over the given nodes.
 * @throws std::runtime_error If a circular dependency is detected.
 */
std::vector<LifecycleManagerImpl::InternalGraphNode *>
LifecycleManagerImpl::topologicalSort(const std::vector<InternalGraphNode *> &nodes)
{
    std::vector<InternalGraphNode *> sorted_order;
    sorted_order.reserve(nodes.size());
    std::vector<InternalGraphNode *> zero_degree_queue;
    std::map<InternalGraphNode *, size_t> in_degrees;
    for (auto *node : nodes)
    {
        in_degrees[node] = 0;
    }
    for (auto *node : nodes)
    {
        for (auto *dep : node->dependents)
        {
            if (in_degrees.contains(dep))
            {
                in_degrees[dep]++;
            }
        }
    }
    for (auto *node : nodes)
    {
        if (in_degrees[node] == 0)
        {
            zero_degree_queue.push_back(node);
        }
    }
    size_t head = 0;
    while (head < zero_degree_queue.size())
    {
        InternalGraphNode *current = zero_degree_queue[head++];
        sorted_order.push_back(current);
        for (InternalGraphNode *dependent : current->dependents)
        {
            if (in_degrees.contains(dependent) && --in_degrees[dependent] == 0)
            {
                zero_degree_queue.push_back(dependent);
            }
        }
    }
    if (sorted_order.size() != nodes.size())
    {
        std::vector<std::string> cycle_nodes;
        for (auto const &[cycle_node, degree] : in_degrees)
        {
            if (degree > 0)
            {
                cycle_nodes.push_back(cycle_node->def.name);
            }
        }
        throw std::runtime_error("Circular dependency detected involving: " +
                                 fmt::format("{}", fmt::join(cycle_nodes, ", ")));
    }
    return sorted_order;
}

void LifecycleManagerImpl::printStatusAndAbort(const std::string &msg, const std::string &mod)
{
    fmt::print(stderr, "\n\n[MQTTOP_LifeCycle] FATAL: {}. Aborting.\n", msg);
    if (!mod.empty())
    {
        fmt::print(stderr, "[MQTTOP_LifeCycle] Module '{}' was point of failure.\n", mod);
    }
    fmt::print(stderr, "\n--- Module Status ---\n");
    for (auto const &[name, node] : m_module_graph)
    {
        fmt::print(stderr, "  - '{}'\n", name);
    }
    fmt::print(stderr, "---------------------\n\n");
    mqttop::debug::print_stack_trace();
    std::fflush(stderr);
    std::abort();
}

// ============================================================================
// LifecycleManager public API (thin delegation layer)
// ============================================================================

LifecycleManager::LifecycleManager() : pImpl(std::make_unique<LifecycleManagerImpl>()) {}
LifecycleManager::~LifecycleManager() = default;

LifecycleManager &LifecycleManager::instance()
{
    static LifecycleManager instance;
    return instance;
}

void LifecycleManager::register_module(ModuleDef &&module_def)
{
    if (!module_def.pImpl)
    {
        return;
    }
    pImpl->registerModule(std::move(module_def.pImpl->def));
}

void LifecycleManager::initialize(std::source_location loc)
{
    pImpl->initialize(loc);
}

void LifecycleManager::finalize(std::source_location loc)
{
    pImpl->finalize(loc);
}

bool LifecycleManager::is_initialized() const noexcept
{
    return pImpl->m_is_initialized.load(std::memory_order_acquire);
}

bool LifecycleManager::is_finalized() const noexcept
{
    return pImpl->m_is_finalized.load(std::memory_order_acquire);
}

} // namespace mqttop::utils
