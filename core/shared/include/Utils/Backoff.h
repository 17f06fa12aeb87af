/**
 * @file Backoff.h
 * @brief Exponential backoff delay calculation (Shared Library)
 * @author NemoBridge Development Team
 */

#ifndef NEMOBRIDGE_UTILS_BACKOFF_H
#define NEMOBRIDGE_UTILS_BACKOFF_H

#include <algorithm>
#include <chrono>

namespace NemoBridge {
namespace Utils {

/**
 * @brief Backoff settings
 */
struct BackoffConfig {
  std::chrono::milliseconds base_delay{1000};  ///< first delay
  std::chrono::milliseconds max_delay{30000};  ///< cap
  double backoff_multiplier = 2.0;             ///< growth per failure
};

/**
 * @brief min(base * multiplier^failures_before, max)
 * @param failures_before failures counted before the current one
 */
inline std::chrono::milliseconds
computeBackoffDelay(const BackoffConfig &config, int failures_before) {
  double delay = static_cast<double>(config.base_delay.count());
  const double cap = static_cast<double>(config.max_delay.count());
  for (int i = 0; i < failures_before && delay < cap; ++i) {
    delay *= config.backoff_multiplier;
  }
  delay = std::min(delay, cap);
  return std::chrono::milliseconds(static_cast<long long>(delay));
}

} // namespace Utils
} // namespace NemoBridge

#endif // NEMOBRIDGE_UTILS_BACKOFF_H
