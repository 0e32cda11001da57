#pragma once
/**
 * @file mqttop_service.hpp
 * @brief Layer 2: Service modules built on mqttop_base.
 *
 * Provides lifecycle management, logging, the callback dispatcher and
 * cryptographic utilities. Include this when you need application lifecycle,
 * Logger or CryptoUtils.
 */
#include "mqttop_base.hpp"

#include "utils/callback_dispatcher.hpp"
#include "utils/crypto_utils.hpp"
#include "utils/lifecycle.hpp"
#include "utils/logger.hpp"
