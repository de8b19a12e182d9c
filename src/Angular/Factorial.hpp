#pragma once
#include "Angular/Rational.hpp"
#include <cstddef>
#include <deque>
#include <mutex>

namespace Angular {

//==============================================================================
/*!
@brief Lookup table of exact factorials, 0! ... n!
@details
  - Table grows on demand: asking for n! fills every m! for m <= n
  - Values are arbitrary precision (Angular::Integer); never overflow
  - Thread safe: fill and lookup are guarded by a mutex, so several threads
    may populate the table at once
  - Stored in a deque: growing the table never moves existing entries, so
    references returned by get() stay valid until clear()
\par Usage
  - Usually accessed through the free functions factorial() and binomial(),
    which share one process-wide table
*/
class FactorialTable {
public:
  //! Pre-fills table up to max_n! (optional)
  explicit FactorialTable(int max_n = 0) { fill(max_n); }

  //! Extends table so it contains all factorials up to max_n!
  void fill(int max_n);

  //! Returns n!. n must be non-negative (programming error otherwise: aborts)
  const Integer &get(int n);

  //! Number of stored factorials (largest stored is (size()-1)!)
  std::size_t size() const;

  //! Frees memory; the next call re-fills from 0!. Invalidates references
  //! returned by get(). Useful for testing
  void clear();

private:
  void fill_unlocked(int max_n);

  std::deque<Integer> m_table{};
  mutable std::mutex m_mutex{};
};

//==============================================================================
//! Process-wide factorial table used by factorial() and binomial()
FactorialTable &factorial_table();

//! n! (exact). Negative n is a programming error (aborts)
const Integer &factorial(int n);

//! Binomial coefficient (n, k) = n!/(k!(n-k)!). Zero if k<0 or k>n
Integer binomial(int n, int k);

} // namespace Angular
