#include "pl/pwm/frame_waiter.h"

#include "pl/delay.h"

namespace pl {

void BlockingWait::wait(u32 us) { delayMicroseconds(us); }

void CooperativeWait::wait(u32 us) { suspendMicroseconds(us); }

} // namespace pl
