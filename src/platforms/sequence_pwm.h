#pragma once

/// @file platforms/sequence_pwm.h
/// Access to the PWM sequencers of the current platform. The returned
/// instances live forever (static storage); nullptr means no such
/// instance.

#include "pl/pwm/sequence_pwm.h"

namespace pl {
namespace platforms {

/// Number of sequencer instances on this platform.
int sequencePwmCount();

/// Sequencer `index` (PWM0 -> 0), or nullptr if out of range.
SequencePwm *getSequencePwm(int index);

} // namespace platforms
} // namespace pl
