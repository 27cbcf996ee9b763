//
// Copyright (c) 2025 Vinnie Falco (vinnie dot falco at gmail dot com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/nbtls
//

#ifndef BOOST_NBTLS_BENCH_BENCHMARK_HPP
#define BOOST_NBTLS_BENCH_BENCHMARK_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>
#include <string>
#include <vector>

namespace bench {

class stopwatch
{
public:
    using clock = std::chrono::steady_clock;

    stopwatch()
        : start_(clock::now())
    {
    }

    void reset()
    {
        start_ = clock::now();
    }

    double elapsed_seconds() const
    {
        return std::chrono::duration<double>(clock::now() - start_).count();
    }

    double elapsed_us() const
    {
        return std::chrono::duration<double, std::micro>(
            clock::now() - start_).count();
    }

private:
    clock::time_point start_;
};

// Collects samples and reports percentiles
class statistics
{
public:
    void add(double value)
    {
        samples_.push_back(value);
    }

    std::size_t count() const
    {
        return samples_.size();
    }

    double mean() const
    {
        if (samples_.empty())
            return 0.0;
        return std::accumulate(samples_.begin(), samples_.end(), 0.0) /
            static_cast<double>(samples_.size());
    }

    // p in [0, 1], linear interpolation between ranks
    double percentile(double p) const
    {
        if (samples_.empty())
            return 0.0;

        std::vector<double> sorted = samples_;
        std::sort(sorted.begin(), sorted.end());

        double index = p * static_cast<double>(sorted.size() - 1);
        auto lower = static_cast<std::size_t>(std::floor(index));
        auto upper = static_cast<std::size_t>(std::ceil(index));
        double frac = index - static_cast<double>(lower);
        return sorted[lower] * (1.0 - frac) + sorted[upper] * frac;
    }

    double min() const
    {
        return samples_.empty() ? 0.0 :
            *std::min_element(samples_.begin(), samples_.end());
    }

    double max() const
    {
        return samples_.empty() ? 0.0 :
            *std::max_element(samples_.begin(), samples_.end());
    }

private:
    std::vector<double> samples_;
};

inline std::string format_rate(double ops_per_sec)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (ops_per_sec >= 1e3)
        oss << (ops_per_sec / 1e3) << " Kops/s";
    else
        oss << ops_per_sec << " ops/s";
    return oss.str();
}

inline std::string format_throughput(double bytes_per_sec)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (bytes_per_sec >= 1e9)
        oss << (bytes_per_sec / 1e9) << " GB/s";
    else if (bytes_per_sec >= 1e6)
        oss << (bytes_per_sec / 1e6) << " MB/s";
    else
        oss << (bytes_per_sec / 1e3) << " KB/s";
    return oss.str();
}

inline std::string format_latency(double microseconds)
{
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);
    if (microseconds >= 1e3)
        oss << (microseconds / 1e3) << " ms";
    else
        oss << microseconds << " us";
    return oss.str();
}

inline void print_header(char const* name)
{
    std::cout << "\n=== " << name << " ===\n";
}

inline void print_latency_stats(statistics const& stats, char const* label)
{
    std::cout << "  " << label << " (" << stats.count() << " samples):\n";
    std::cout << "    mean:  " << format_latency(stats.mean()) << "\n";
    std::cout << "    p50:   " << format_latency(stats.percentile(0.50)) << "\n";
    std::cout << "    p99:   " << format_latency(stats.percentile(0.99)) << "\n";
    std::cout << "    min:   " << format_latency(stats.min()) << "\n";
    std::cout << "    max:   " << format_latency(stats.max()) << "\n";
}

} // namespace bench

#endif
