#pragma once
#include <cmath>
#include <iterator>
#include <numeric>

namespace ewa::analysis {

// 总体均值/标准差（ddof = 0），空区间返回 0
template<typename It>
inline double mean(It first, It last) {
    const auto n = std::distance(first, last);
    if (n <= 0) return 0.0;
    return std::accumulate(first, last, 0.0) / static_cast<double>(n);
}

template<typename It>
inline double stddev(It first, It last) {
    const auto n = std::distance(first, last);
    if (n <= 0) return 0.0;
    const double m = mean(first, last);
    double acc = 0.0;
    for (auto it = first; it != last; ++it) {
        const double d = *it - m;
        acc += d * d;
    }
    return std::sqrt(acc / static_cast<double>(n));
}

} // namespace ewa::analysis
