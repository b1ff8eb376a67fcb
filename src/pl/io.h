#pragma once

#define PL_IO_H_INCLUDED

namespace pl {

// Low-level print functions that avoid printf/sprintf dependencies.
// These use the most efficient output method for each platform.

// Print a string without newline
void print(const char *str);

// Print a string with newline
#ifndef PL_DBG_PRINTLN_DECLARED
void println(const char *str);
#endif

#ifdef PULSELED_TESTING

typedef void (*print_handler_t)(const char *);
typedef void (*println_handler_t)(const char *);

// Inject function handlers for testing
void inject_print_handler(print_handler_t handler);
void inject_println_handler(println_handler_t handler);

// Clear all injected handlers (restores default behavior)
void clear_io_handlers();

#endif // PULSELED_TESTING

} // namespace pl
