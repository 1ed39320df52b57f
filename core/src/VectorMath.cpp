#include "reefradar/VectorMath.h"
#include <algorithm>
#include <cmath>

namespace reefradar {

namespace {

inline int signum(float x) {
    return (x > 0.0f) - (x < 0.0f);
}

} // namespace

double dot(const std::vector<double>& a, const std::vector<double>& b) {
    const std::size_t n = std::min(a.size(), b.size());
    double s = 0.0;
    for (std::size_t i = 0; i < n; ++i) s += a[i] * b[i];
    return s;
}

double l2_norm(const std::vector<double>& v) {
    double s = 0.0;
    for (double x : v) s += x * x;
    return std::sqrt(s);
}

double cosine_similarity(const std::vector<double>& a, const std::vector<double>& b) {
    const double na = l2_norm(a);
    const double nb = l2_norm(b);
    if (na == 0.0 || nb == 0.0) return 0.0;
    return dot(a, b) / (na * nb);
}

double mean_range(const std::vector<double>& v, std::size_t begin, std::size_t end) {
    end = std::min(end, v.size());
    if (begin >= end) return 0.0;
    double acc = 0.0;
    for (std::size_t i = begin; i < end; ++i) acc += v[i];
    return acc / static_cast<double>(end - begin);
}

double rms(const std::vector<float>& x) {
    if (x.empty()) return 0.0;
    double acc = 0.0;
    for (float v : x) acc += static_cast<double>(v) * static_cast<double>(v);
    return std::sqrt(acc / static_cast<double>(x.size()));
}

double peak_abs(const std::vector<float>& x) {
    double p = 0.0;
    for (float v : x) p = std::max(p, std::abs(static_cast<double>(v)));
    return p;
}

std::size_t zero_crossings(const std::vector<float>& x) {
    std::size_t count = 0;
    for (std::size_t i = 1; i < x.size(); ++i) {
        if (signum(x[i]) != signum(x[i - 1])) ++count;
    }
    return count;
}

} // namespace reefradar
