#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace pcflow {
namespace trace {

struct TraceEvent {
    std::string op_name;
    std::string description;
    std::chrono::steady_clock::time_point timestamp;
    std::chrono::nanoseconds duration;
    size_t num_layers; // Layers produced by the traced step
};

class Tracer {
  public:
    static Tracer &instance();

    void enable() { enabled_ = true; }
    void disable() { enabled_ = false; }
    bool is_enabled() const { return enabled_; }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.clear();
    }

    void record(const std::string &op_name, const std::string &desc,
                std::chrono::nanoseconds duration, size_t num_layers);

    std::string dump() const;

    // Snapshot of the recorded events
    std::vector<TraceEvent> events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events_;
    }

  private:
    Tracer();
    std::atomic<bool> enabled_{false};
    mutable std::mutex mutex_;
    std::vector<TraceEvent> events_;
};

inline void enable() { Tracer::instance().enable(); }
inline void disable() { Tracer::instance().disable(); }
inline void clear() { Tracer::instance().clear(); }
inline std::string dump() { return Tracer::instance().dump(); }
inline bool is_enabled() { return Tracer::instance().is_enabled(); }

class ScopedTrace {
  public:
    explicit ScopedTrace(const std::string &op_name,
                         const std::string &desc = "");
    ~ScopedTrace();

    ScopedTrace(const ScopedTrace &) = delete;
    ScopedTrace &operator=(const ScopedTrace &) = delete;

    // Set once the traced step knows how much it produced
    void set_num_layers(size_t n) { num_layers_ = n; }
    void set_description(const std::string &desc) { desc_ = desc; }

  private:
    std::string op_name_;
    std::string desc_;
    std::chrono::steady_clock::time_point start_;
    size_t num_layers_ = 0;
};

} // namespace trace
} // namespace pcflow
