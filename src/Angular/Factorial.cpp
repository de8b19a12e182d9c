#include "Angular/Factorial.hpp"
#include <cstdlib>
#include <iostream>

namespace Angular {

//==============================================================================
void FactorialTable::fill(int max_n) {
  std::lock_guard<std::mutex> lock(m_mutex);
  fill_unlocked(max_n);
}

void FactorialTable::fill_unlocked(int max_n) {
  if (m_table.empty())
    m_table.push_back(Integer{1});
  const auto current = static_cast<int>(m_table.size()) - 1;
  if (max_n <= current)
    return;
  for (int n = current + 1; n <= max_n; ++n) {
    m_table.push_back(m_table.back() * n);
  }
}

//==============================================================================
const Integer &FactorialTable::get(int n) {
  if (n < 0) {
    // Only reachable if a symbol that fails its selection rules reaches the
    // Racah sums. Not a user-input error.
    std::cerr << "\nFail 31 in FactorialTable: negative argument n=" << n
              << "\n";
    std::abort();
  }
  std::lock_guard<std::mutex> lock(m_mutex);
  fill_unlocked(n);
  return m_table[std::size_t(n)];
}

std::size_t FactorialTable::size() const {
  std::lock_guard<std::mutex> lock(m_mutex);
  return m_table.size();
}

void FactorialTable::clear() {
  std::lock_guard<std::mutex> lock(m_mutex);
  m_table.clear();
  m_table.shrink_to_fit();
}

//==============================================================================
FactorialTable &factorial_table() {
  static FactorialTable table;
  return table;
}

const Integer &factorial(int n) { return factorial_table().get(n); }

Integer binomial(int n, int k) {
  if (k < 0 || k > n)
    return Integer{0};
  return factorial(n) / (factorial(k) * factorial(n - k));
}

} // namespace Angular
