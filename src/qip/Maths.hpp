#pragma once

namespace qip {

//==============================================================================
//! Returns maximum of any number of parameters (variadic function)
template <typename T, typename... Args> T max(T first, Args... rest) {
  if constexpr (sizeof...(rest) == 0) {
    return first;
  } else {
    const auto max_rest = max(rest...);
    if (first >= max_rest)
      return first;
    return max_rest;
  }
}
//! Returns minimum of any number of parameters (variadic function)
template <typename T, typename... Args> T min(T first, Args... rest) {
  if constexpr (sizeof...(rest) == 0) {
    return first;
  } else {
    const auto min_rest = min(rest...);
    if (first <= min_rest)
      return first;
    return min_rest;
  }
}

} // namespace qip
