#include "IO/InputBlock.hpp"
#include "IO/Styled.hpp"
#include <algorithm>
#include <fmt/format.h>
#include <fmt/ostream.h>

namespace IO {

namespace {
// Reads characters up to (not including) the first of 'stops' found outside
// quote marks. White space outside quotes is dropped, quote marks removed
std::string read_token(std::string_view text, std::size_t &pos,
                       std::string_view stops) {
  std::string token;
  char quote = '\0';
  for (; pos < text.size(); ++pos) {
    const auto c = text[pos];
    if (quote != '\0') {
      if (c == quote)
        quote = '\0';
      else
        token += c;
    } else if (c == '"' || c == '\'') {
      quote = c;
    } else if (stops.find(c) != std::string_view::npos) {
      break;
    } else if (!qip::isspace(c)) {
      token += c;
    }
  }
  return token;
}
} // namespace

//==============================================================================
std::string strip_comments(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (text.compare(i, 2, "/*") == 0) {
      const auto close = text.find("*/", i + 2);
      if (close == std::string_view::npos)
        break;
      i = close + 1;
    } else if (text.compare(i, 2, "//") == 0 || text[i] == '#' ||
               text[i] == '!') {
      const auto eol = text.find('\n', i);
      if (eol == std::string_view::npos)
        break;
      // keep the newline
      i = eol - 1;
    } else {
      out += text[i];
    }
  }
  return out;
}

//==============================================================================
void InputBlock::add(const std::string &text) {
  const auto clean = strip_comments(text);
  // A stray '}' ends parse() early; just carry on after it
  std::size_t pos = 0;
  while (pos < clean.size())
    parse(clean, pos);
}

void InputBlock::parse(std::string_view text, std::size_t &pos) {
  while (pos < text.size()) {
    const auto key = read_token(text, pos, "=;{}");
    std::string value;
    if (pos < text.size() && text[pos] == '=') {
      ++pos;
      value = read_token(text, pos, ";{}");
    }
    const auto end = pos < text.size() ? text[pos++] : ';';

    if (end == '{') {
      // Block may not be closed: then it runs to the end of the text
      m_blocks.emplace_back(key).parse(text, pos);
      continue;
    }
    if (!key.empty())
      m_options.push_back({key, value});
    if (end == '}')
      return;
  }
}

//==============================================================================
const Option *InputBlock::find_option(std::string_view key) const {
  // later options override earlier ones
  const auto option =
      std::find_if(m_options.crbegin(), m_options.crend(),
                   [&](const Option &o) { return qip::ci_compare(o.key, key); });
  return option == m_options.crend() ? nullptr : &*option;
}

std::optional<InputBlock> InputBlock::getBlock(std::string_view name) const {
  const auto block = std::find_if(
      m_blocks.crbegin(), m_blocks.crend(),
      [&](const InputBlock &b) { return qip::ci_compare(b.m_name, name); });
  if (block == m_blocks.crend())
    return std::nullopt;
  return *block;
}

//==============================================================================
void InputBlock::print(std::ostream &os, int depth) const {
  const std::string indent(2 * std::size_t(depth), ' ');
  for (const auto &[key, value] : m_options) {
    if (value.empty())
      fmt::print(os, "{}{};\n", indent, key);
    else if (value.find(' ') != std::string::npos)
      fmt::print(os, "{}{} = '{}';\n", indent, key, value);
    else
      fmt::print(os, "{}{} = {};\n", indent, key, value);
  }
  for (const auto &block : m_blocks) {
    fmt::print(os, "{}{}{{\n", indent, block.m_name);
    block.print(os, depth + 1);
    fmt::print(os, "{}}}\n", indent);
  }
}

//==============================================================================
bool InputBlock::check(
    const std::vector<std::pair<std::string, std::string>> &list,
    bool print_all) const {

  const auto listed = [&list](std::string_view name) {
    return std::any_of(list.cbegin(), list.cend(), [&](const auto &item) {
      return qip::ci_compare(item.first, name);
    });
  };

  std::vector<std::string> names;
  for (const auto &item : list)
    names.push_back(item.first);
  const auto did_you_mean = [&names](std::string_view bad) {
    const auto closest = qip::ci_closest_match(bad, names);
    if (closest != names.cend())
      fmt::print("Did you mean: {} ?\n", *closest);
  };

  bool all_ok = true;
  for (const auto &[key, value] : m_options) {
    if (qip::ci_compare(key, "help")) {
      print_all = true;
      continue;
    }
    if (!listed(key)) {
      all_ok = false;
      IO::warning();
      fmt::print("Unclear input option in {}: {} = {};\n"
                 "Option may be ignored!\n"
                 "Check spelling (or update list of options)\n",
                 m_name, key, value);
      did_you_mean(key);
    }
  }

  for (const auto &block : m_blocks) {
    const auto block_name = block.m_name + "{}";
    if (!listed(block_name)) {
      all_ok = false;
      IO::warning();
      fmt::print("Unclear input block within {}: {}\n"
                 "Block and containing options may be ignored!\n"
                 "Check spelling (or update list of options)\n",
                 m_name, block_name);
      did_you_mean(block_name);
    }
  }

  if (!all_ok || print_all) {
    fmt::print("\nAvailable {} options/blocks are:\n{}{{\n", m_name, m_name);
    for (const auto &[name, description] : list)
      fmt::print("  {};  // {}\n", name, description);
    fmt::print("}}\n\n");
  }
  return all_ok;
}

} // namespace IO
