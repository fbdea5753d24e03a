#include "pcflow/debug.hpp"
#include "pcflow/config.hpp"

namespace pcflow {
namespace trace {

Tracer::Tracer() : enabled_(config::trace_from_env()) {}

Tracer &Tracer::instance() {
    static Tracer tracer;
    return tracer;
}

void Tracer::record(const std::string &op_name, const std::string &desc,
                    std::chrono::nanoseconds duration, size_t num_layers) {
    if (!enabled_)
        return;

    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back({op_name, desc, std::chrono::steady_clock::now(),
                       duration, num_layers});
}

std::string Tracer::dump() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::ostringstream oss;

    oss << "=== pcflow Trace (" << events_.size() << " events) ===\n";
    oss << std::left << std::setw(24) << "Operation" << std::setw(15)
        << "Duration(us)" << std::setw(10) << "Layers"
        << "Description\n";
    oss << std::string(80, '-') << "\n";

    std::chrono::nanoseconds total_time{0};
    size_t total_layers = 0;

    for (const auto &event : events_) {
        double duration_us = event.duration.count() / 1000.0;

        oss << std::left << std::setw(24) << event.op_name << std::setw(15)
            << std::fixed << std::setprecision(2) << duration_us
            << std::setw(10) << event.num_layers << event.description << "\n";

        total_time += event.duration;
        total_layers += event.num_layers;
    }

    oss << std::string(80, '-') << "\n";
    oss << "Total time: " << (total_time.count() / 1000.0) << " us\n";
    oss << "Total layers: " << total_layers << "\n";

    return oss.str();
}

ScopedTrace::ScopedTrace(const std::string &op_name, const std::string &desc)
    : op_name_(op_name), desc_(desc) {
    if (Tracer::instance().is_enabled()) {
        start_ = std::chrono::steady_clock::now();
    }
}

ScopedTrace::~ScopedTrace() {
    if (Tracer::instance().is_enabled()) {
        auto end = std::chrono::steady_clock::now();
        auto duration =
            std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
        Tracer::instance().record(op_name_, desc_, duration, num_layers_);
    }
}

} // namespace trace
} // namespace pcflow
