#pragma once
#include <fmt/color.h>
#include <fmt/format.h>
#include <string>
#include <unistd.h> // isatty
#include <utility>

namespace IO {

#if defined(__GNUC__) || defined(__clang__)
inline const bool enable_text_style = isatty(STDOUT_FILENO);
#else
inline const bool enable_text_style = false;
#endif

//! Formats text, adding the ANSI codes for text_style only if use_style is true
template <typename... Args>
std::string styled(bool use_style, const fmt::text_style &ts,
                   fmt::format_string<Args...> fs, Args &&...args) {
  const auto text = fmt::format(fs, std::forward<Args>(args)...);
  return use_style ? fmt::format(ts, "{}", text) : text;
}

//! wrapper for text_style formatted fmt::print. Will only apply styling if
//! output is a terminal (stops ANSI characters written to file with >> or |tee)
template <typename... Args>
void styled_print(const fmt::text_style &ts, fmt::format_string<Args...> fs,
                  Args &&...args) {
  fmt::print("{}", styled(enable_text_style, ts, fs,
                          std::forward<Args>(args)...));
}

inline void warning() {
  styled_print(fg(fmt::color::orange) | fmt::emphasis::bold, "\nWARNING\n");
}

} // namespace IO
