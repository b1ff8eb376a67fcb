#include "pl/io.h"

// Platform-specific I/O implementations
#if defined(PULSELED_TESTING) || defined(PULSELED_STUB_IMPL) || defined(__linux__) || defined(__APPLE__)
#include "platforms/io_native.h"
#define PL_IO_NATIVE 1
#elif defined(ARDUINO)
#include "platforms/io_arduino.h"
#define PL_IO_ARDUINO 1
#endif

namespace pl {

#ifdef PULSELED_TESTING
// Lazy statics avoid global constructors.
static print_handler_t &get_print_handler() {
    static print_handler_t handler = nullptr;
    return handler;
}

static println_handler_t &get_println_handler() {
    static println_handler_t handler = nullptr;
    return handler;
}

void inject_print_handler(print_handler_t handler) { get_print_handler() = handler; }

void inject_println_handler(println_handler_t handler) { get_println_handler() = handler; }

void clear_io_handlers() {
    get_print_handler() = nullptr;
    get_println_handler() = nullptr;
}
#endif

void print(const char *str) {
    if (!str) return;

#ifdef PULSELED_TESTING
    if (get_print_handler()) {
        get_print_handler()(str);
        return;
    }
#endif

#if defined(PL_IO_NATIVE)
    print_native(str);
#elif defined(PL_IO_ARDUINO)
    print_arduino(str);
#else
    (void)str;  // No console on this target.
#endif
}

void println(const char *str) {
    if (!str) return;

#ifdef PULSELED_TESTING
    if (get_println_handler()) {
        get_println_handler()(str);
        return;
    }
#endif

#if defined(PL_IO_NATIVE)
    println_native(str);
#elif defined(PL_IO_ARDUINO)
    println_arduino(str);
#else
    (void)str;
#endif
}

} // namespace pl
