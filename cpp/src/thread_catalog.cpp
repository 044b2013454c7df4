#include "boltjoint/thread_catalog.hpp"

#include <cmath>
#include <stdexcept>

namespace boltjoint {

BoltGeometry MetricThread::geometry() const {
    return metric_thread(d, P);
}

BoltGeometry metric_thread(double d, double P) {
    if (!(d > 0.0)) {
        throw std::invalid_argument("metric_thread: nominal diameter must be positive");
    }
    if (!(P > 0.0)) {
        throw std::invalid_argument("metric_thread: pitch must be positive");
    }

    BoltGeometry geom;
    geom.d = d;
    geom.P = P;
    geom.d2 = d - 0.649519 * P;
    geom.d3 = d - 1.226869 * P;
    geom.alpha_deg = 30.0;

    if (!(geom.d3 > 0.0)) {
        throw std::invalid_argument("metric_thread: pitch too coarse for diameter");
    }
    return geom;
}

const std::vector<MetricThread>& metric_coarse_threads() {
    static const std::vector<MetricThread> threads = {
        {"M3",   3.0, 0.50,  4.6,  3.4},
        {"M4",   4.0, 0.70,  5.9,  4.5},
        {"M5",   5.0, 0.80,  6.9,  5.5},
        {"M6",   6.0, 1.00,  8.9,  6.6},
        {"M8",   8.0, 1.25, 11.6,  9.0},
        {"M10", 10.0, 1.50, 14.6, 11.0},
        {"M12", 12.0, 1.75, 16.6, 13.5},
        {"M14", 14.0, 2.00, 19.6, 15.5},
        {"M16", 16.0, 2.00, 22.5, 17.5},
        {"M20", 20.0, 2.50, 28.2, 22.0},
        {"M24", 24.0, 3.00, 33.6, 26.0},
        {"M30", 30.0, 3.50, 42.8, 33.0},
        {"M36", 36.0, 4.00, 51.1, 39.0},
    };
    return threads;
}

std::optional<MetricThread> find_metric_coarse(double d) {
    for (const auto& thread : metric_coarse_threads()) {
        if (std::abs(thread.d - d) < 1e-9) {
            return thread;
        }
    }
    return std::nullopt;
}

} // namespace boltjoint
