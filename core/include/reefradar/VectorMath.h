#pragma once
#include <vector>
#include <cstddef>

namespace reefradar {

// ---------- vector utilities ----------
double dot(const std::vector<double>& a, const std::vector<double>& b);
double l2_norm(const std::vector<double>& v);

// dot(a,b) / (|a| |b|); exactly 0.0 when either norm is 0.
// Vectors of different length are compared over the shorter prefix.
double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b);

// arithmetic mean of v[begin, end); 0.0 for an empty range
double mean_range(const std::vector<double>& v, std::size_t begin, std::size_t end);

// ---------- signal statistics ----------
double rms(const std::vector<float>& x);
double peak_abs(const std::vector<float>& x);

// number of i with sign(x[i]) != sign(x[i-1]), sign in {-1, 0, 1}
std::size_t zero_crossings(const std::vector<float>& x);

} // namespace reefradar
