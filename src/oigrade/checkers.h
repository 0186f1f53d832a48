#ifndef OIGRADE_CHECKERS_H_
#define OIGRADE_CHECKERS_H_

#include <oigrade/checker.h>

// Certificate checkers: accept any output that proves a feasible construction
// with the expected objective value.

// Input: "N K", then N crayons "R G B" with channels in [0, 256).
// Output: colorfulness, then K crayons chosen from the input multiset.
class PasteleChecker : public Checker {
 public:
  static constexpr int kChannelRange = 256;
  CheckResult Check(const CheckerInput&) const override;
};

// Input: K, the least number of pieces. Output: N, then N cuts "X1 Y1 X2 Y2"
// with both endpoints on the boundary of the [-5000, 5000]^2 square.
class RezChecker : public Checker {
 public:
  static constexpr long long kHalfSide = 5000;
  CheckResult Check(const CheckerInput&) const override;
};

// Input: "N K", then M, then M song ids. Output: number of disk accesses,
// then for each song a window "A B" of length K that contains it.
class KolekcijaChecker : public Checker {
 public:
  CheckResult Check(const CheckerInput&) const override;
};

#endif  // OIGRADE_CHECKERS_H_
