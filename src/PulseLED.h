#pragma once

/// @file PulseLED.h
/// Central include file for PulseLED: WS2812 output through a DMA-fed PWM
/// sequencer.

/// Current PulseLED version number, as an integer.
/// E.g. 1000000 for version "1.0.0", with:
/// * 1 digit for the major version
/// * 3 digits for the minor version
/// * 3 digits for the patch version
#define PULSELED_VERSION 1000000

#include "pulseled_config.h"

#include "pl/assert.h"
#include "pl/async.h"
#include "pl/colorutils.h"
#include "pl/delay.h"
#include "pl/log.h"
#include "pl/result.h"
#include "pl/rgb8.h"
#include "pl/span.h"
#include "pl/time.h"
#include "pl/warn.h"
#include "pl/ws2812_pwm.h"

#include "platforms/sequence_pwm.h"
