#include "pl/assert.h"

#include "pl/io.h"
#include "platforms/time_platform.h"

namespace pl {

void fatal(const char *file, int line, const char *message) {
    StrStream out;
    out << "FATAL " << file << "(" << line << "): " << message;
    println(out.c_str());
    platforms::halt();
}

} // namespace pl
