#include "checkers.h"

#include <cmath>
#include <vector>
#include <utility>
#include <algorithm>

#include <fmt/core.h>

#include "check_utils.h"

namespace {

// Parsed first line of an actual output: the claimed objective value
std::optional<CheckResult> CheckClaim(const std::vector<std::string_view>& actual_lines,
                                      long long expected, const char* name, long long& claimed) {
  auto val = ParseInt(actual_lines[0]);
  if (!val) return CheckResult{false, fmt::format("Invalid {}: {}", name, Strip(actual_lines[0]))};
  claimed = *val;
  if (claimed != expected) {
    return CheckResult{false, fmt::format("{} mismatch: got {}", name, claimed)};
  }
  return std::nullopt;
}

} // namespace

CheckResult PasteleChecker::Check(const CheckerInput& in) const {
  constexpr long long R = kChannelRange;
  auto input_lines = SplitLines(in.input);
  auto header = StoredInts(input_lines[0], 2, "input header");
  long long n = header[0], k = header[1];
  if (n < 0 || k < 0) throw CheckerError("negative N or K");

  std::vector<int> count(R * R * R);
  auto Index = [](long long r, long long g, long long b) { return (r * R + g) * R + b; };
  for (long long i = 1; i <= n; i++) {
    auto c = StoredInts(StoredLine(input_lines, i, "crayon"), 3, "crayon");
    if (std::any_of(c.begin(), c.end(), [](long long x) { return x < 0 || x >= R; })) {
      throw CheckerError("crayon out of range in input");
    }
    count[Index(c[0], c[1], c[2])]++;
  }
  long long expected = StoredInt(SplitLines(in.expected)[0], "expected colorfulness");

  auto actual_lines = SplitLines(in.actual);
  long long claimed;
  if (auto res = CheckClaim(actual_lines, expected, "Colorfulness", claimed)) return *res;
  if ((long long)actual_lines.size() < k + 1) {
    return {false, fmt::format("Not enough crayons: got {}", actual_lines.size() - 1)};
  }

  long long min_c[3] = {R, R, R}, max_c[3] = {-1, -1, -1};
  for (long long i = 1; i <= k; i++) {
    auto c = ParseInts(actual_lines[i]);
    if (!c || c->size() != 3) return {false, fmt::format("Invalid crayon format on line {}", i + 1)};
    long long r = (*c)[0], g = (*c)[1], b = (*c)[2];
    if (r < 0 || r >= R || g < 0 || g >= R || b < 0 || b >= R) {
      return {false, fmt::format("Crayon ({}, {}, {}) out of range", r, g, b)};
    }
    int& cnt = count[Index(r, g, b)];
    if (cnt <= 0) {
      return {false, fmt::format("Crayon ({}, {}, {}) not available (not in input or already used)", r, g, b)};
    }
    cnt--;
    for (int j = 0; j < 3; j++) {
      min_c[j] = std::min(min_c[j], (*c)[j]);
      max_c[j] = std::max(max_c[j], (*c)[j]);
    }
  }
  long long computed = std::max({max_c[0] - min_c[0], max_c[1] - min_c[1], max_c[2] - min_c[2]});
  if (computed != claimed) {
    return {false, fmt::format("Computed colorfulness is {}, but claimed {}", computed, claimed)};
  }
  return {true, "OK"};
}

CheckResult RezChecker::Check(const CheckerInput& in) const {
  long long k = StoredInt(in.input, "K");
  long long expected = StoredInt(SplitLines(in.expected)[0], "expected N");

  auto actual_lines = SplitLines(in.actual);
  long long n;
  if (auto res = CheckClaim(actual_lines, expected, "N", n)) return *res;
  if ((long long)actual_lines.size() < n + 1) {
    return {false, fmt::format("Expected {} cuts, got {}", n, actual_lines.size() - 1)};
  }

  struct Cut { long long x1, y1, x2, y2; };
  std::vector<Cut> cuts;
  for (long long i = 1; i <= n; i++) {
    auto c = ParseInts(actual_lines[i]);
    if (!c || c->size() != 4) return {false, fmt::format("Invalid cut format on line {}", i + 1)};
    cuts.push_back({(*c)[0], (*c)[1], (*c)[2], (*c)[3]});
  }
  auto OnBoundary = [](long long x, long long y) {
    if (x < -kHalfSide || x > kHalfSide || y < -kHalfSide || y > kHalfSide) return false;
    return x == -kHalfSide || x == kHalfSide || y == -kHalfSide || y == kHalfSide;
  };
  for (size_t i = 0; i < cuts.size(); i++) {
    const Cut& c = cuts[i];
    if (!OnBoundary(c.x1, c.y1)) {
      return {false, fmt::format("Cut {} endpoint ({}, {}) not on boundary", i + 1, c.x1, c.y1)};
    }
    if (!OnBoundary(c.x2, c.y2)) {
      return {false, fmt::format("Cut {} endpoint ({}, {}) not on boundary", i + 1, c.x2, c.y2)};
    }
  }

  // Both endpoints lie on the boundary of a convex region, so the segments meet
  // inside it exactly when their supporting lines do.
  auto IntersectsInside = [](const Cut& a, const Cut& b) {
    double denom = double(a.x1 - a.x2) * (b.y1 - b.y2) - double(a.y1 - a.y2) * (b.x1 - b.x2);
    if (std::fabs(denom) < 1e-10) return false; // parallel or degenerate
    double t = (double(a.x1 - b.x1) * (b.y1 - b.y2) - double(a.y1 - b.y1) * (b.x1 - b.x2)) / denom;
    double px = a.x1 + t * (a.x2 - a.x1);
    double py = a.y1 + t * (a.y2 - a.y1);
    return -kHalfSide < px && px < kHalfSide && -kHalfSide < py && py < kHalfSide;
  };
  long long intersections = 0;
  for (size_t i = 0; i < cuts.size(); i++) {
    for (size_t j = i + 1; j < cuts.size(); j++) {
      if (IntersectsInside(cuts[i], cuts[j])) intersections++;
    }
  }
  long long pieces = 1 + n + intersections;
  if (pieces < k) {
    return {false, fmt::format("Cuts create only {} pieces, not enough", pieces)};
  }
  return {true, "OK"};
}

namespace {

// Number of distinct integers covered by closed intervals; O(M log M)
long long CountCovered(std::vector<std::pair<long long, long long>> intervals) {
  if (intervals.empty()) return 0;
  std::sort(intervals.begin(), intervals.end());
  long long total = 0;
  auto [cur_start, cur_end] = intervals[0];
  for (size_t i = 1; i < intervals.size(); i++) {
    auto [start, end] = intervals[i];
    if (start <= cur_end + 1) { // overlapping or adjacent
      cur_end = std::max(cur_end, end);
    } else {
      total += cur_end - cur_start + 1;
      cur_start = start, cur_end = end;
    }
  }
  return total + (cur_end - cur_start + 1);
}

} // namespace

CheckResult KolekcijaChecker::Check(const CheckerInput& in) const {
  auto input_lines = SplitLines(in.input);
  auto header = ParseInts(input_lines[0]);
  if (!header || header->size() < 2) throw CheckerError("malformed input header");
  long long n = (*header)[0], k = (*header)[1];
  long long m = StoredInt(StoredLine(input_lines, 1, "M"), "M");
  std::vector<long long> songs;
  for (long long i = 0; i < m; i++) {
    songs.push_back(StoredInt(StoredLine(input_lines, 2 + i, "song"), "song"));
  }
  long long expected = StoredInt(SplitLines(in.expected)[0], "expected disk accesses");

  auto actual_lines = SplitLines(in.actual);
  long long claimed;
  if (auto res = CheckClaim(actual_lines, expected, "Disk accesses", claimed)) return *res;
  if ((long long)actual_lines.size() < m + 1) {
    return {false, fmt::format("Expected {} intervals, got {}", m, actual_lines.size() - 1)};
  }

  std::vector<std::pair<long long, long long>> intervals;
  for (long long i = 1; i <= m; i++) {
    auto w = ParseInts(actual_lines[i]);
    if (!w || w->size() != 2) return {false, fmt::format("Invalid interval format on line {}", i + 1)};
    intervals.emplace_back((*w)[0], (*w)[1]);
  }
  for (size_t i = 0; i < intervals.size(); i++) {
    auto [a, b] = intervals[i];
    // bounds first so that the length cannot overflow
    if (a < 1 || a > n || b < 1 || b > n) {
      return {false, fmt::format("Interval {} [{}, {}] out of bounds", i + 1, a, b)};
    }
    if (b - a + 1 != k) {
      return {false, fmt::format("Interval {} [{}, {}] has wrong length {}", i + 1, a, b, b - a + 1)};
    }
    if (songs[i] < a || songs[i] > b) {
      return {false, fmt::format("Interval {} [{}, {}] does not contain its song", i + 1, a, b)};
    }
  }
  long long distinct = CountCovered(std::move(intervals));
  if (distinct != claimed) {
    return {false, fmt::format("Actual disk accesses should be {}, claimed {}", distinct, claimed)};
  }
  return {true, "OK"};
}

void RegisterBuiltinCheckers(CheckerRegistry& registry) {
  registry.Register("pastele", std::make_unique<PasteleChecker>());
  registry.Register("rez", std::make_unique<RezChecker>());
  registry.Register("kolekcija", std::make_unique<KolekcijaChecker>());
}
