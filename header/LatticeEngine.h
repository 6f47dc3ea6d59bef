#pragma once
#include "EventSystem.h"
#include "FrameClock.h"
#include "LatticeEntity.h"
#include "LatticeParams.h"
#include "LatticeSnapshot.h"
#include "ResonanceGroup.h"
#include "ClusterDetector.h"
#include <Eigen/Dense>
#include <deque>
#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Frame-stepped consciousness lattice: entities, resonance groups, clusters and the global aggregate.
// Not thread-safe; callers serialise access (see LatticeHost).
class LatticeEngine {
public:
    struct Config {
        WorldRules world;                       // walls, tunneling, pointer reach, attention sigma
        ClusterDetector::Config clustering;
        double max_frame_dt;                    // ceiling on the elapsed time integrated per step
        double collapse_radius;
        double collapse_push;                   // outward speed at the collapse point
        double spawn_extent;                    // initial entities in [-extent, extent]^2
        double group_center_extent;
        double group_radius_min, group_radius_max;
        double nominal_frequency;
        double frequency_jitter;
        bool enable_threading;                  // OpenMP pairwise pass (if available)
        size_t threading_threshold;             // minimum entity count before going parallel
        bool defer_events;                      // hold events until take_pending_events() instead of emitting inline

        Config()
            : max_frame_dt(0.05)
            , collapse_radius(200.0)
            , collapse_push(5.0)
            , spawn_extent(500.0)
            , group_center_extent(400.0)
            , group_radius_min(150.0)
            , group_radius_max(250.0)
            , nominal_frequency(40.0)
            , frequency_jitter(5.0)
            , enable_threading(true)
            , threading_threshold(512)
            , defer_events(false)
        {}
    };

    LatticeEngine(EventBus& event_bus, uint64_t seed, const Config& config = Config{},
                  std::unique_ptr<FrameClock> clock = nullptr);
    ~LatticeEngine();

    LatticeEngine(const LatticeEngine&) = delete;
    LatticeEngine& operator=(const LatticeEngine&) = delete;

    // Seed groups and entities; discards any previous world state
    void initialize(size_t entity_count, size_t group_count);

    // One complete frame; pointer overrides the queued influence when given
    AggregateStats step(double dt, const PointerInfluence* pointer = nullptr);

    // Entity management
    EntitySnapshot add_entity(double x, double y);
    bool remove_entity(EntityId id);
    const LatticeEntity* find_entity(EntityId id) const;

    void collapse(double x, double y);

    // Configuration
    PhysicsParams::MergeResult set_parameters(const std::unordered_map<std::string, double>& partial);
    const PhysicsParams& get_parameters() const { return params_; }
    bool set_mode(const std::string& mode);
    VisualizationMode get_mode() const { return mode_; }
    void queue_pointer(const PointerInfluence& pointer);
    size_t queued_pointer_count() const { return pointer_queue_.size(); }

    // Read-only views
    LatticeSnapshot snapshot() const;
    AggregateStats compute_aggregate() const;

    size_t get_entity_count() const { return entities_.size(); }
    size_t get_group_count() const { return groups_.size(); }
    size_t get_cluster_count() const { return clusters_.size(); }
    const std::vector<LatticeEntity>& get_entities() const { return entities_; }
    const std::vector<ResonanceGroup>& get_groups() const { return groups_; }
    const std::vector<LatticeCluster>& get_clusters() const { return clusters_; }
    const std::vector<double>& get_resonance_weights() const { return resonance_weights_; }
    double get_time() const { return time_; }
    uint64_t get_frame_index() const { return frame_index_; }
    uint64_t get_seed() const { return seed_; }
    const Config& get_config() const { return config_; }

    // Events held back under Config::defer_events, in emission order. Each one emits on the bus when called.
    using PendingEvent = std::function<void()>;
    std::vector<PendingEvent> take_pending_events();

private:
    #ifdef LATTICE_TESTING
        friend struct LatticeTestHooks;
    #endif

    LatticeEntity spawn_entity(const Vector2d& position);
    void normalize_attention();
    void refresh_group_membership();

    // Frame pipeline
    void accumulate_repulsion(double dt);
    void apply_repulsion();
    void modulate_groups();
    void advance_entities(double dt, const PointerInfluence* pointer);
    void update_clusters();

    EntitySnapshot make_entity_snapshot(const LatticeEntity& entity) const;

    template <typename T>
    void publish(const char* event_type, const T& event) {
        if (!config_.defer_events) {
            event_bus_.emit(event_type, event);
            return;
        }
        EventBus* bus = &event_bus_;
        pending_events_.push_back([bus, event_type, event]() { bus->emit(event_type, event); });
    }

    EventBus& event_bus_;
    Config config_;
    PhysicsParams params_;
    VisualizationMode mode_;
    std::unique_ptr<FrameClock> clock_;
    LatticeRng rng_;
    uint64_t seed_;

    // Entity arena; index order is collection order
    std::vector<LatticeEntity> entities_;
    std::vector<ResonanceGroup> groups_;
    std::vector<LatticeCluster> clusters_;
    std::vector<double> resonance_weights_;
    ClusterDetector cluster_detector_;

    std::deque<PointerInfluence> pointer_queue_;
    std::vector<PendingEvent> pending_events_;
    EntityId next_id_;
    double time_;
    uint64_t frame_index_;

    // Per-frame scratch: pre-update positions/radii and accumulated repulsion
    std::vector<Vector2d> frame_positions_;
    std::vector<double> frame_radii_;
    std::vector<Vector2d> repulsion_;
};
