#pragma once

#include <cstdint>

namespace framelink {

// Readiness interest / report bitmap, with epoll values.
// Registrations are level-triggered. Error and hang-up conditions are always reported by epoll and
// surface as transport errors on the next read or write.
using EventBmp = uint32_t;

inline constexpr EventBmp EventIn = 0x001;
inline constexpr EventBmp EventOut = 0x004;

}  // namespace framelink
