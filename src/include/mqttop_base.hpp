#pragma once
/**
 * @file mqttop_base.hpp
 * @brief Layer 1: Basic modules built on mqttop_platform.
 *
 * Provides format_tools, debug_info, Result, the bounded Channel used between
 * threads, and module_def for lifecycle module registration.
 * Include this when you need formatting, debug utilities or inter-thread queues.
 */
#include "mqttop_platform.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "utils/format_tools.hpp"
#include "utils/debug_info.hpp"
#include "utils/result.hpp"
#include "utils/channel.hpp"
#include "utils/module_def.hpp"
