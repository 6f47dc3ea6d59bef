#include "LatticeHost.h"
#include <iostream>

LatticeHost::LatticeHost(EventBus& event_bus, size_t entity_count, size_t group_count, uint64_t seed,
                         const LatticeEngine::Config& config, ClockFactory clock_factory)
    : event_bus_(event_bus), config_(config),
      clock_factory_(clock_factory ? std::move(clock_factory) : ClockFactory(make_steady_clock)) {
    // Every engine this host builds queues its events for deliver()
    config_.defer_events = true;
    engine_ = build_engine(entity_count, group_count, seed);
    std::vector<LatticeEngine::PendingEvent> events = engine_->take_pending_events();
    deliver(events);
}

std::unique_ptr<LatticeEngine> LatticeHost::build_engine(size_t entity_count, size_t group_count,
                                                         uint64_t seed) const {
    auto engine = std::make_unique<LatticeEngine>(event_bus_, seed, config_, clock_factory_());
    engine->initialize(entity_count, group_count);
    return engine;
}

void LatticeHost::deliver(std::vector<LatticeEngine::PendingEvent>& events) {
    if (events.empty()) return;
    std::lock_guard<std::recursive_mutex> lock(delivery_mtx_);
    for (auto& emit : events) emit();
    events.clear();
}

void LatticeHost::reset(size_t entity_count, size_t group_count, uint64_t seed) {
    // Build outside the lock so readers are only blocked for the swap itself.
    // The fresh engine is not shared yet, so its reset event can be taken without the lock.
    std::unique_ptr<LatticeEngine> fresh = build_engine(entity_count, group_count, seed);
    std::vector<LatticeEngine::PendingEvent> events = fresh->take_pending_events();
    {
        std::lock_guard<std::mutex> lock(mtx_);
        engine_.swap(fresh);
    }
    // fresh now holds the previous engine and is destroyed here
    fresh.reset();
    std::cout << "LatticeHost: reset to " << entity_count << " entities, " << group_count
              << " groups (seed " << seed << ")\n";
    deliver(events);
}

AggregateStats LatticeHost::step(double dt, const PointerInfluence* pointer) {
    std::vector<LatticeEngine::PendingEvent> events;
    const AggregateStats stats = locked([&](LatticeEngine& e) { return e.step(dt, pointer); }, events);
    deliver(events);
    return stats;
}

EntitySnapshot LatticeHost::add_entity(double x, double y) {
    std::vector<LatticeEngine::PendingEvent> events;
    const EntitySnapshot added = locked([&](LatticeEngine& e) { return e.add_entity(x, y); }, events);
    deliver(events);
    return added;
}

bool LatticeHost::remove_entity(EntityId id) {
    std::vector<LatticeEngine::PendingEvent> events;
    const bool removed = locked([&](LatticeEngine& e) { return e.remove_entity(id); }, events);
    deliver(events);
    return removed;
}

void LatticeHost::collapse(double x, double y) {
    std::vector<LatticeEngine::PendingEvent> events;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        engine_->collapse(x, y);
        events = engine_->take_pending_events();
    }
    deliver(events);
}

PhysicsParams::MergeResult LatticeHost::set_parameters(const std::unordered_map<std::string, double>& partial) {
    std::vector<LatticeEngine::PendingEvent> events;
    PhysicsParams::MergeResult result = locked([&](LatticeEngine& e) { return e.set_parameters(partial); }, events);
    deliver(events);
    return result;
}

bool LatticeHost::set_mode(const std::string& mode) {
    std::vector<LatticeEngine::PendingEvent> events;
    const bool changed = locked([&](LatticeEngine& e) { return e.set_mode(mode); }, events);
    deliver(events);
    return changed;
}

void LatticeHost::queue_pointer(const PointerInfluence& pointer) {
    std::lock_guard<std::mutex> lock(mtx_);
    engine_->queue_pointer(pointer);
}

LatticeSnapshot LatticeHost::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return engine_->snapshot();
}

LatticeHost::Status LatticeHost::status() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return Status{engine_->get_entity_count(), engine_->get_cluster_count(),
                  engine_->get_time(), engine_->get_frame_index()};
}
