#pragma once

/// @file led_sysdefs_arm_nrf52.h
/// nRF52 system definitions for PulseLED.

#ifndef F_CPU
    #define F_CPU 64000000 // the NRF52 series has a 64MHz CPU
#endif

#include <nrfx.h>
#include <hal/nrf_gpio.h>

// EasyDMA can only read from Data RAM.
#define PULSELED_NRF52_RAM_MASK 0xE0000000UL
#define PULSELED_NRF52_RAM_BASE 0x20000000UL
