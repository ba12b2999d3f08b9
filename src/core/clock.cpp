#include <chmesh/core/clock.h>

namespace chmesh {

const Clock& SystemClock() {
    static SteadyClock clock;
    return clock;
}

} // namespace chmesh
