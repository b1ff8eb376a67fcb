#pragma once

#include "pl/dbg.h"
#include "pl/warn.h"

/// @file pl/log.h
/// @brief Per-subsystem logging categories
///
/// Each category is compiled out unless its switch is defined before this
/// header is included (or on the command line):
///
///   #define PULSELED_LOG_PWM_ENABLED
///   #include "pl/log.h"
///
///   PL_LOG_PWM("countertop " << top);

/// @brief Sequencer peripheral logging
/// Logs configuration, sequence starts and stops
#ifdef PULSELED_LOG_PWM_ENABLED
    #define PL_LOG_PWM(X) PL_WARN(X)
#else
    #define PL_LOG_PWM(X) PL_DBG_NO_OP(X)
#endif

/// @brief WS2812 driver logging
/// Logs frame encoding, frame delays and ownership transitions
#ifdef PULSELED_LOG_WS2812_ENABLED
    #define PL_LOG_WS2812(X) PL_WARN(X)
#else
    #define PL_LOG_WS2812(X) PL_DBG_NO_OP(X)
#endif

/// @brief Cooperative runtime logging
#ifdef PULSELED_LOG_ASYNC_ENABLED
    #define PL_LOG_ASYNC(X) PL_WARN(X)
#else
    #define PL_LOG_ASYNC(X) PL_DBG_NO_OP(X)
#endif
