#pragma once

namespace fomin {

// Default seed for reproducible batch sampling and synthetic data.
inline constexpr unsigned int kDefaultSeed = 123u;

} // namespace fomin
