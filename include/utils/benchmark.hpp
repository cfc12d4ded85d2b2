#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <iostream>
#include <numeric>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bench {

// Latency summary of one benchmark (or the average over several runs)
struct Result {
    std::string  name;
    double       mean_ns_per_op = 0.0;
    double       p50_ns         = 0.0;
    double       p99_ns         = 0.0;
    double       max_ns         = 0.0;
    std::size_t  iterations     = 0;
    std::size_t  runs           = 1;
    std::size_t  batch_size     = 1;
};

// steady_clock timer; any type with now()/to_ns() can be plugged in instead
struct ChronoTimer {
    using clock      = std::chrono::steady_clock;
    using time_point = clock::time_point;

    static time_point now() noexcept {
        return clock::now();
    }

    static double to_ns(time_point start, time_point end) noexcept {
        return static_cast<double>(
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count());
    }
};

namespace detail {

// Fills mean/p50/p99/max from per-op samples; sorts the samples.
inline void summarize_samples(std::vector<double>& samples, Result& out)
{
    if (samples.empty()) {
        return;
    }

    out.mean_ns_per_op = std::accumulate(samples.begin(), samples.end(), 0.0)
                       / static_cast<double>(samples.size());

    std::sort(samples.begin(), samples.end());
    const std::size_t n = samples.size();

    auto pick = [&](double p) {
        auto idx = static_cast<std::size_t>(p * static_cast<double>(n - 1) + 0.5);
        return samples[std::min(idx, n - 1)];
    };

    out.p50_ns = pick(0.50);
    out.p99_ns = pick(0.99);
    out.max_ns = samples.back();
}

} // namespace detail

// Calls fn(i) for i in [0, iterations). The first `warmup` calls are not
// timed, the rest are timed in batches of `batch_size` and each batch gives
// one ns/op sample.
template <typename Timer = ChronoTimer, typename F>
Result run_batched(std::string_view name,
                   std::size_t      iterations,
                   std::size_t      batch_size,
                   F&&              fn,
                   std::size_t      warmup = 0)
{
    Result res;
    res.name       = std::string(name);
    res.iterations = iterations;
    res.batch_size = std::max<std::size_t>(batch_size, 1);

    warmup = std::min(warmup, iterations);
    for (std::size_t i = 0; i < warmup; ++i) {
        fn(i);
    }

    std::vector<double> samples;
    samples.reserve((iterations - warmup) / res.batch_size + 1);

    for (std::size_t i = warmup; i < iterations;) {
        const std::size_t end = std::min(iterations, i + res.batch_size);
        const std::size_t ops = end - i;

        auto t0 = Timer::now();
        for (; i < end; ++i) {
            fn(i);
        }
        auto t1 = Timer::now();

        samples.push_back(Timer::to_ns(t0, t1) / static_cast<double>(ops));
    }

    detail::summarize_samples(samples, res);
    return res;
}

// Averages `runs` results produced by make_run(run_index).
template <typename MakeRun>
Result run_averaged(std::string_view name, std::size_t runs, MakeRun&& make_run)
{
    Result agg;
    agg.name = std::string(name);
    agg.runs = runs;

    if (runs == 0) {
        return agg;
    }

    for (std::size_t r = 0; r < runs; ++r) {
        Result s = make_run(r);
        if (r == 0) {
            agg.iterations = s.iterations;
            agg.batch_size = s.batch_size;
        }
        agg.mean_ns_per_op += s.mean_ns_per_op;
        agg.p50_ns         += s.p50_ns;
        agg.p99_ns         += s.p99_ns;
        agg.max_ns          = std::max(agg.max_ns, s.max_ns);
    }

    const double inv = 1.0 / static_cast<double>(runs);
    agg.mean_ns_per_op *= inv;
    agg.p50_ns         *= inv;
    agg.p99_ns         *= inv;
    return agg;
}

inline void print(const Result& r, std::ostream& os = std::cout)
{
    os << "[bench] " << r.name
       << " (runs=" << r.runs
       << ", iters=" << r.iterations
       << ", batch=" << r.batch_size << "):\n";

    if (r.iterations == 0) {
        os << "  no iterations\n";
        return;
    }

    os << "  mean ns/op: " << r.mean_ns_per_op;
    if (r.mean_ns_per_op > 0.0) {
        os << ", " << 1e9 / r.mean_ns_per_op << " ops/s\n";
    } else {
        os << "\n";
    }
    os << "  p50 ns:     " << r.p50_ns << "\n";
    os << "  p99 ns:     " << r.p99_ns << "\n";
    os << "  max ns:     " << r.max_ns << "\n";
}

} // namespace bench
