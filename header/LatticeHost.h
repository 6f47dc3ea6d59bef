#pragma once
#include "LatticeEngine.h"
#include <functional>
#include <memory>
#include <mutex>
#include <type_traits>
#include <utility>
#include <vector>

// Owns the live engine and serialises every call on it behind one mutex.
// reset() swaps in a freshly constructed engine; the old one is destroyed before reset() returns.
//
// Engine events are held back while the engine lock is taken and delivered after it is released,
// one batch at a time. Subscribers may therefore call back into the host (status(), snapshot(),
// even step()) from inside a handler.
class LatticeHost {
public:
    using ClockFactory = std::function<std::unique_ptr<FrameClock>()>;

    struct Status {
        size_t node_count;
        size_t cluster_count;
        double time;
        uint64_t frame_index;
    };

    LatticeHost(EventBus& event_bus, size_t entity_count, size_t group_count, uint64_t seed,
                const LatticeEngine::Config& config = LatticeEngine::Config{},
                ClockFactory clock_factory = make_steady_clock);

    void reset(size_t entity_count, size_t group_count, uint64_t seed);

    AggregateStats step(double dt, const PointerInfluence* pointer = nullptr);
    EntitySnapshot add_entity(double x, double y);
    bool remove_entity(EntityId id);
    void collapse(double x, double y);
    PhysicsParams::MergeResult set_parameters(const std::unordered_map<std::string, double>& partial);
    bool set_mode(const std::string& mode);
    void queue_pointer(const PointerInfluence& pointer);

    LatticeSnapshot snapshot() const;
    Status status() const;

    // Run fn with exclusive access to the engine; events it causes are delivered after the lock is released
    template <class Fn>
    auto with_engine(Fn&& fn) -> decltype(fn(std::declval<LatticeEngine&>())) {
        using Result = decltype(fn(std::declval<LatticeEngine&>()));
        std::vector<LatticeEngine::PendingEvent> events;
        if constexpr (std::is_void_v<Result>) {
            {
                std::lock_guard<std::mutex> lock(mtx_);
                fn(*engine_);
                events = engine_->take_pending_events();
            }
            deliver(events);
        } else {
            Result result = [&]() -> Result {
                std::lock_guard<std::mutex> lock(mtx_);
                Result r = fn(*engine_);
                events = engine_->take_pending_events();
                return r;
            }();
            deliver(events);
            return result;
        }
    }

private:
    std::unique_ptr<LatticeEngine> build_engine(size_t entity_count, size_t group_count, uint64_t seed) const;

    // Runs fn under the engine lock and hands back its result with the events it produced
    template <class Fn>
    auto locked(Fn&& fn, std::vector<LatticeEngine::PendingEvent>& events) -> decltype(fn(std::declval<LatticeEngine&>())) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto result = fn(*engine_);
        events = engine_->take_pending_events();
        return result;
    }

    // Emit a batch on the caller's bus. Batches never interleave; the same thread may re-enter.
    void deliver(std::vector<LatticeEngine::PendingEvent>& events);

    EventBus& event_bus_;
    LatticeEngine::Config config_;
    ClockFactory clock_factory_;
    mutable std::mutex mtx_;
    std::recursive_mutex delivery_mtx_;
    std::unique_ptr<LatticeEngine> engine_;
};
