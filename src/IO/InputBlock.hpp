#pragma once
#include "qip/String.hpp"
#include <istream>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace IO {

//==============================================================================
//! Removes comments: '//', '#' and '!' (to end of line), and /* block */
std::string strip_comments(std::string_view text);

//! Parses the entire string as a T. Empty if it cannot be parsed, or if any
//! characters are left over (e.g., "12x" is not an int)
template <typename T>
std::optional<T> parse_value(const std::string &text) {
  if constexpr (std::is_same_v<T, std::string>) {
    return text;
  } else {
    T value{};
    std::istringstream ss(text);
    ss >> value;
    if (ss.fail() || !(ss >> std::ws).eof())
      return std::nullopt;
    return value;
  }
}

//==============================================================================
//! key = value pair, as given in input. An empty value means "not set"
struct Option {
  std::string key;
  std::string value_str;
};

//==============================================================================
/*!
@brief Input options, read from a file or string, in named blocks:
@details
  Format is, e.g.,

    ThreeJ{
      j1 = 1/2; j2 = 1/2; j3 = 1;
      m1 = 1/2; m2 = -1/2; m3 = 0;
    }
    Output{ precision = 10; exact = true; }

  - Block and option names are case insensitive
  - White space is ignored, except inside quote marks (which are removed)
  - Comments: '//', '#', '!' to end of line, and C-style block comments
  - If an option is given twice, the later one is used
  - Blocks may contain blocks
*/
class InputBlock {
  std::string m_name{};
  std::vector<Option> m_options{};
  std::vector<InputBlock> m_blocks{};

public:
  InputBlock() = default;

  //! From list of options
  InputBlock(std::string_view name, std::initializer_list<Option> options = {})
      : m_name(name), m_options(options) {}

  //! Parses string, in Block{option=value;} format
  InputBlock(std::string_view name, const std::string &text) : m_name(name) {
    add(text);
  }

  //! Parses entire stream (e.g., input file), in Block{option=value;} format
  InputBlock(std::string_view name, std::istream &is) : m_name(name) {
    std::ostringstream ss;
    ss << is.rdbuf();
    add(ss.str());
  }

  //! Adds option to end of list
  void add(Option option) { m_options.push_back(std::move(option)); }
  //! Parses string, adding its options and blocks
  void add(const std::string &text);

  const std::string &name() const { return m_name; }
  const std::vector<Option> &options() const { return m_options; }
  const std::vector<InputBlock> &blocks() const { return m_blocks; }

  //! Value of option 'key' as T. Empty if not given, set to "" or "default",
  //! or cannot be parsed as T. bool: true/yes/y/1 are true, all else false
  template <typename T = std::string>
  std::optional<T> get(std::string_view key) const;

  //! Value of option 'key', or default_value if not set
  template <typename T> T get(std::string_view key, T default_value) const {
    static_assert(!std::is_same_v<T, const char *>,
                  "Cannot use get with const char* - use std::string");
    return get<T>(key).value_or(default_value);
  }

  //! Copy of the (last) block with given name, if it exists
  std::optional<InputBlock> getBlock(std::string_view name) const;

  //! Writes options and blocks, in the same format as input
  void print(std::ostream &os, int depth = 0) const;

  //! Checks each option and block is in 'list' ({name, description} pairs;
  //! blocks are listed as "Name{}"). Warns about any that are not (likely a
  //! spelling mistake), then prints the list. Also prints the list if
  //! print_all is true, or if the 'help' option is given. Returns false if
  //! any unknown options/blocks were found.
  bool check(const std::vector<std::pair<std::string, std::string>> &list,
             bool print_all = false) const;

private:
  const Option *find_option(std::string_view key) const;
  // Reads options and blocks, starting at pos, up to this block's closing '}'
  void parse(std::string_view text, std::size_t &pos);
};

//==============================================================================
template <typename T>
std::optional<T> InputBlock::get(std::string_view key) const {
  const auto option = find_option(key);
  if (!option)
    return std::nullopt;
  const auto &str = option->value_str;
  if (str.empty() || qip::ci_compare(str, "default"))
    return std::nullopt;
  if constexpr (std::is_same_v<T, bool>) {
    for (const auto yes : {"true", "yes", "y", "1"}) {
      if (qip::ci_compare(str, yes))
        return true;
    }
    return false;
  } else {
    return parse_value<T>(str);
  }
}

} // namespace IO
