#pragma once

namespace reactdom {

// Time slice handed to each idle callback by the default host.
inline constexpr double frameYieldMs = 5.0;

// Priority timeout constants (in milliseconds)
inline constexpr double userBlockingPriorityTimeout = 250.0;
inline constexpr double normalPriorityTimeout = 5000.0;
inline constexpr double lowPriorityTimeout = 10000.0;
inline constexpr double maxSigned31BitInt = 1073741823.0;

// Paint request support
inline constexpr bool enableRequestPaint = true;

} // namespace reactdom
