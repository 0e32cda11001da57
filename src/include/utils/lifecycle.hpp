#pragma once

/*******************************************************************************
 * @file lifecycle.hpp
 * @brief Manages application startup and shutdown with dependency-aware modules.
 *
 * Modules declare their dependencies by name and the `LifecycleManager`
 * performs a topological sort to determine the initialization sequence; they
 * are shut down in reverse order, each bounded by its own timeout. Cyclic or
 * undefined dependencies are fatal.
 *
 * The application's `main` owns the lifecycle through the `LifecycleGuard`
 * RAII helper:
 *
 * ```cpp
 * int main(int argc, char* argv[]) {
 *     mqttop::utils::LifecycleGuard app_lifecycle(mqttop::utils::MakeModDefList(
 *         mqttop::utils::Logger::GetLifecycleModule(),
 *         mqttop::crypto::GetLifecycleModule()));
 *
 *     LOGGER_INFO("Application started successfully.");
 *     // ... run the bridge ...
 *     return 0; // ~LifecycleGuard finalizes every module.
 * }
 * ```
 ******************************************************************************/
#include "mqttop_base.hpp"
#include "mqttop_utils_export.h"

#include <memory>
#include <utility>
#include <vector>

namespace mqttop::utils
{

class LifecycleManagerImpl;

/// Collects move-only ModuleDefs into a vector for LifecycleGuard.
template <typename... Mods> inline std::vector<ModuleDef> MakeModDefList(Mods &&...mods)
{
    std::vector<ModuleDef> list;
    list.reserve(sizeof...(Mods));
    (list.emplace_back(std::forward<Mods>(mods)), ...);
    return list;
}

/**
 * @class LifecycleManager
 * @brief Singleton that orchestrates initialization and finalization of all
 *        registered modules.
 */
class MQTTOP_UTILS_EXPORT LifecycleManager
{
  public:
    static LifecycleManager &instance();

    /**
     * @brief Registers a module. Must be called before `initialize()`.
     *
     * Registering after initialization is a programming error and aborts.
     */
    void register_module(ModuleDef &&module_def);

    /**
     * @brief Starts all registered modules in dependency order. Idempotent.
     *
     * Aborts with a status report on a duplicate name, an undefined or circular
     * dependency, or a startup callback that throws.
     */
    void initialize(std::source_location loc = std::source_location::current());

    /// Shuts down all started modules in reverse order. Idempotent.
    void finalize(std::source_location loc = std::source_location::current());

    bool is_initialized() const noexcept;
    bool is_finalized() const noexcept;

    LifecycleManager(const LifecycleManager &) = delete;
    LifecycleManager &operator=(const LifecycleManager &) = delete;

  private:
    LifecycleManager();
    ~LifecycleManager();
    std::unique_ptr<LifecycleManagerImpl> pImpl;
};

inline void RegisterModule(ModuleDef &&module_def)
{
    LifecycleManager::instance().register_module(std::move(module_def));
}

inline bool IsAppInitialized()
{
    return LifecycleManager::instance().is_initialized();
}

inline bool IsAppFinalized()
{
    return LifecycleManager::instance().is_finalized();
}

inline void InitializeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().initialize(loc);
}

inline void FinalizeApp(std::source_location loc = std::source_location::current())
{
    LifecycleManager::instance().finalize(loc);
}

class LifecycleGuard
{
  private:
    std::source_location m_loc;

  public:
    // Default: no modules provided. If this is the first guard, InitializeApp() is called.
    LifecycleGuard(std::source_location loc = std::source_location::current()) : m_loc(loc)
    {
        init_owner_if_first({});
    }

    // Usage: LifecycleGuard guard(MakeModDefList(ModuleDef("Mod1"), ModuleDef("Mod2")));
    explicit LifecycleGuard(std::vector<ModuleDef> &&modules,
                            std::source_location loc = std::source_location::current())
        : m_loc(loc)
    {
        MQTTOP_DEBUG("[MQTTOP_LifeCycle] LifecycleGuard constructed in function {}. ({}:{})",
                     m_loc.function_name(), mqttop::format_tools::filename_only(m_loc.file_name()),
                     m_loc.line());
        init_owner_if_first(std::move(modules));
    }

    LifecycleGuard(const LifecycleGuard &) = delete;
    LifecycleGuard &operator=(const LifecycleGuard &) = delete;
    LifecycleGuard(LifecycleGuard &&) = delete;
    LifecycleGuard &operator=(LifecycleGuard &&) = delete;

    /**
     * @brief Finalizes the application if this guard is the owner.
     *
     * @warning Static objects whose destructors use lifecycle services (the
     *          Logger) may run after this guard has shut them down; their log
     *          calls are then silently dropped.
     */
    ~LifecycleGuard() noexcept
    {
        if (m_is_owner)
        {
            mqttop::utils::FinalizeApp(m_loc);
        }
    }

    bool is_owner() const noexcept { return m_is_owner; }

  private:
    static std::atomic_bool &owner_flag()
    {
        static std::atomic_bool flag{false};
        return flag;
    }

    void init_owner_if_first(std::vector<ModuleDef> &&modules)
    {
        bool expected = false;
        if (owner_flag().compare_exchange_strong(expected, true, std::memory_order_acq_rel))
        {
            m_is_owner = true;
            for (auto &m : modules)
            {
                mqttop::utils::RegisterModule(std::move(m));
            }
            // Always initialize, even if no modules were supplied.
            mqttop::utils::InitializeApp(m_loc);
        }
        else
        {
            m_is_owner = false;
            MQTTOP_DEBUG("[MQTTOP_LifeCycle] [{}:{}] WARNING: LifecycleGuard constructed but an "
                         "owner already exists. This guard is a no-op; provided modules (if any) "
                         "were ignored. Constructor was located in function {}. ({}:{}).",
                         mqttop::platform::get_executable_name(), mqttop::platform::get_pid(),
                         m_loc.function_name(),
                         mqttop::format_tools::filename_only(m_loc.file_name()), m_loc.line());
        }
    }

    bool m_is_owner{false};
};

} // namespace mqttop::utils
