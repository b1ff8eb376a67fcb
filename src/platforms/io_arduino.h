#pragma once

// Arduino cores (nRF52 included) print through Serial.

#include <Arduino.h>

namespace pl {

inline void print_arduino(const char *str) { Serial.print(str); }

inline void println_arduino(const char *str) { Serial.println(str); }

} // namespace pl
