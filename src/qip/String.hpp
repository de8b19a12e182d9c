#pragma once
#include <algorithm>
#include <cctype>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace qip {

//==============================================================================
//! return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
inline char tolower(char ch) {
  // https://en.cppreference.com/w/cpp/string/byte/tolower
  return static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
}

inline bool isspace(char ch) {
  return std::isspace(static_cast<unsigned char>(ch)) != 0;
}

inline bool isdigit(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

//==============================================================================
//! Case insensitive string compare. Essentially: LowerCase(s1)==LowerCase(s2)
inline bool ci_compare(std::string_view s1, std::string_view s2) {
  return std::equal(
      s1.cbegin(), s1.cend(), s2.cbegin(), s2.cend(),
      [](char c1, char c2) { return qip::tolower(c1) == qip::tolower(c2); });
}

//==============================================================================
//! A simple non-optimised implementation of the Levenshtein distance (case
//! insensitive)
inline auto ci_Levenstein(std::string_view a, std::string_view b) {
  // https://en.wikipedia.org/wiki/Levenshtein_distance
  std::vector<size_t> d_t((a.size() + 1) * (b.size() + 1), size_t(-1));
  auto d = [&](size_t ia, size_t ib) -> size_t & {
    return d_t[ia * (b.size() + 1) + ib];
  };
  std::function<size_t(size_t, size_t)> LevensteinInt =
      [&](size_t ia, size_t ib) -> size_t {
    if (d(ia, ib) != size_t(-1))
      return d(ia, ib);
    size_t dist = 0;
    if (ib >= b.size())
      dist = a.size() - ia;
    else if (ia >= a.size())
      dist = b.size() - ib;
    else if (qip::tolower(a[ia]) == qip::tolower(b[ib]))
      dist = LevensteinInt(ia + 1, ib + 1);
    else
      dist = 1 + std::min(std::min(LevensteinInt(ia, ib + 1),
                                   LevensteinInt(ia + 1, ib)),
                          LevensteinInt(ia + 1, ib + 1));
    d(ia, ib) = dist;
    return dist;
  };
  return LevensteinInt(0, 0);
}

//! Finds the closest match (case insensitive) in list to test_string (return
//! iterator)
inline auto ci_closest_match(std::string_view test_string,
                             const std::vector<std::string> &list) {
  auto compare = [&test_string](const auto &s1, const auto &s2) {
    return qip::ci_Levenstein(s1, test_string) <
           qip::ci_Levenstein(s2, test_string);
  };
  return std::min_element(list.cbegin(), list.cend(), compare);
}

//==============================================================================
//! Checks if a string-like s is integer-like (including -)
/*!
e.g., The input strings "16" and "-12" would both return 'true', while "12x" or
"12.5" would not. Leading character may be a digit, '+' or '-'
*/
inline bool string_is_integer(std::string_view s) {
  return !s.empty() &&
         // checks if all non-leading characters are integer digits
         std::find_if(s.cbegin() + 1, s.cend(),
                      [](auto c) { return !qip::isdigit(c); }) == s.cend() &&
         // checks if leading character is one of: digit, '+', or '-'
         (qip::isdigit(s[0]) ||
          ((s[0] == '-' || s[0] == '+') && s.size() > 1));
}

//==============================================================================
//! Removes leading and trailing white space
inline std::string_view trim(std::string_view s) {
  while (!s.empty() && qip::isspace(s.front()))
    s.remove_prefix(1);
  while (!s.empty() && qip::isspace(s.back()))
    s.remove_suffix(1);
  return s;
}

//! Splits a string at any of the delimiter characters. Empty pieces (e.g.,
//! from repeated delimiters) are dropped
inline std::vector<std::string> split_any(std::string_view s,
                                          std::string_view delims) {
  std::vector<std::string> out;
  std::string tmp;
  for (const auto c : s) {
    if (delims.find(c) != std::string_view::npos) {
      if (!tmp.empty())
        out.push_back(tmp);
      tmp.clear();
    } else {
      tmp += c;
    }
  }
  if (!tmp.empty())
    out.push_back(tmp);
  return out;
}

//==============================================================================
//! Word-wraps text at 'at' characters; every line is prefixed with 'indent'.
//! Existing new-lines are kept. Words longer than a line are not split
inline std::string wrap(std::string_view text, std::size_t at = 80,
                        const std::string &indent = "") {
  std::string out;
  std::string line = indent;
  bool line_empty = true;
  const auto flush = [&]() {
    out += line + "\n";
    line = indent;
    line_empty = true;
  };
  std::string word;
  const auto add_word = [&]() {
    if (word.empty())
      return;
    if (!line_empty && line.size() + 1 + word.size() > at)
      flush();
    if (!line_empty)
      line += ' ';
    line += word;
    line_empty = false;
    word.clear();
  };
  for (const auto c : text) {
    if (c == '\n') {
      add_word();
      flush();
    } else if (c == ' ') {
      add_word();
    } else {
      word += c;
    }
  }
  add_word();
  if (!line_empty)
    flush();
  return out;
}

} // namespace qip
