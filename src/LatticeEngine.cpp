#include "LatticeEngine.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

#ifdef _OPENMP
#include <omp.h>
#endif


LatticeEngine::LatticeEngine(EventBus& event_bus, uint64_t seed, const Config& config,
                             std::unique_ptr<FrameClock> clock)
    : event_bus_(event_bus), config_(config), mode_(VisualizationMode::Consciousness),
      clock_(clock ? std::move(clock) : make_steady_clock()),
      rng_(seed), seed_(seed), cluster_detector_(config.clustering),
      next_id_(1), time_(0.0), frame_index_(0) {
}

LatticeEngine::~LatticeEngine() = default;


//===========================================================================================
//==                                   SEEDING                                             ==
//===========================================================================================

void LatticeEngine::initialize(size_t entity_count, size_t group_count) {
    if (group_count == 0) {
        std::cerr << "LatticeEngine: group_count must be at least 1, using 1\n";
        group_count = 1;
    }

    entities_.clear();
    groups_.clear();
    clusters_.clear();
    pointer_queue_.clear();
    time_ = 0.0;
    frame_index_ = 0;

    resonance_weights_ = sample_resonance_weights(group_count, rng_);

    std::uniform_real_distribution<double> center_dist(-config_.group_center_extent, config_.group_center_extent);
    std::uniform_real_distribution<double> radius_dist(config_.group_radius_min, config_.group_radius_max);
    groups_.reserve(group_count);
    for (size_t g = 0; g < group_count; ++g) {
        const double cx = center_dist(rng_);
        const double cy = center_dist(rng_);
        groups_.emplace_back(static_cast<int>(g), Vector2d(cx, cy), radius_dist(rng_), resonance_weights_[g]);
    }

    std::uniform_real_distribution<double> spawn_dist(-config_.spawn_extent, config_.spawn_extent);
    entities_.reserve(entity_count);
    for (size_t i = 0; i < entity_count; ++i) {
        const double x = spawn_dist(rng_);
        const double y = spawn_dist(rng_);
        entities_.push_back(spawn_entity(Vector2d(x, y)));
    }

    refresh_group_membership();
    normalize_attention();

    std::cout << "LatticeEngine initialized with " << entity_count << " entities across "
              << group_count << " groups (seed " << seed_ << ")\n";

    #ifdef _OPENMP
        if (config_.enable_threading) {
            std::cout << "OpenMP pairwise pass enabled above " << config_.threading_threshold
                      << " entities with " << omp_get_max_threads() << " threads\n";
        }
    #endif

    LatticeResetEvent event{entity_count, group_count, seed_};
    publish(Events::LATTICE_RESET, event);
}

LatticeEntity LatticeEngine::spawn_entity(const Vector2d& position) {
    std::uniform_int_distribution<int> group_dist(0, static_cast<int>(groups_.size()) - 1);
    std::uniform_real_distribution<double> jitter(-config_.frequency_jitter, config_.frequency_jitter);
    std::uniform_real_distribution<double> phase_dist(0.0, TWO_PI);
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    LatticeEntity entity;
    entity.id = next_id_++;
    entity.position = position;
    entity.group_id = group_dist(rng_);
    entity.resonance_weight = resonance_weights_[static_cast<size_t>(entity.group_id)];
    entity.base_frequency = config_.nominal_frequency;
    entity.frequency = config_.nominal_frequency + jitter(rng_);
    entity.phase = wrap_phase(phase_dist(rng_));

    for (Vector2d* v : {&entity.capabilities.logic, &entity.capabilities.memory,
                        &entity.capabilities.processing, &entity.capabilities.creativity,
                        &entity.capabilities.social}) {
        const double a = unit(rng_);
        const double b = unit(rng_);
        *v = Vector2d(a, b);
    }
    return entity;
}

void LatticeEngine::normalize_attention() {
    /*
     * Normalised Gaussian densities, evaluated relative to the largest exponent.
     * exp(x_i - x_max) / sum_j exp(x_j - x_max) equals density_i / sum_j density_j,
     * but the largest term is always exp(0) = 1, so the total never underflows
     * for entities far outside the world.
     */
    if (entities_.empty()) return;
    const double sigma = config_.world.attention_sigma;

    double max_exponent = -std::numeric_limits<double>::infinity();
    for (const auto& e : entities_) {
        max_exponent = std::max(max_exponent, e.attention_exponent(sigma));
    }

    double total = 0.0;
    for (auto& e : entities_) {
        e.attention = std::exp(e.attention_exponent(sigma) - max_exponent);
        total += e.attention;
    }

    if (!std::isfinite(total) || total <= 0.0) {
        // Only reachable with non-finite positions; keep the field summing to one
        const double uniform = 1.0 / static_cast<double>(entities_.size());
        for (auto& e : entities_) e.attention = uniform;
        return;
    }
    for (auto& e : entities_) e.attention /= total;
}

void LatticeEngine::refresh_group_membership() {
    for (auto& g : groups_) g.refresh_membership(entities_);
}


//===========================================================================================
//==                                   FRAME PIPELINE                                      ==
//===========================================================================================

AggregateStats LatticeEngine::step(double dt, const PointerInfluence* pointer) {
    double elapsed = clock_->elapsed(dt);
    if (!std::isfinite(elapsed) || elapsed < 0.0) elapsed = 0.0;
    elapsed = std::min(elapsed, config_.max_frame_dt);

    time_ += elapsed * params_.time_dilation;

    PointerInfluence queued;
    const PointerInfluence* influence = pointer;
    if (!influence && !pointer_queue_.empty()) {
        queued = pointer_queue_.front();
        pointer_queue_.pop_front();
        influence = &queued;
    }

    accumulate_repulsion(elapsed);
    apply_repulsion();
    modulate_groups();
    advance_entities(elapsed, influence);
    update_clusters();

    ++frame_index_;
    const AggregateStats stats = compute_aggregate();

    FrameAdvancedEvent event{elapsed, stats.node_count, stats.cluster_count, frame_index_, time_};
    publish(Events::FRAME_ADVANCED, event);
    return stats;
}

void LatticeEngine::accumulate_repulsion(double dt) {
    /*
     * Pairwise soft repulsion between overlapping entities.
     * All forces come from a copy of the pre-update positions and radii, so the
     * result does not depend on iteration order (or on the thread count).
     */
    const size_t n = entities_.size();
    frame_positions_.resize(n);
    frame_radii_.resize(n);
    repulsion_.assign(n, Vector2d::Zero());
    for (size_t i = 0; i < n; ++i) {
        frame_positions_[i] = entities_[i].position;
        frame_radii_[i] = entities_[i].radius;
    }

    const double strength = 0.5 * dt * REFERENCE_HZ * params_.elasticity;
    const Vector2d* positions = frame_positions_.data();
    const double* radii = frame_radii_.data();
    Vector2d* out = repulsion_.data();

    auto force_on = [&](size_t i) {
        Vector2d acc = Vector2d::Zero();
        for (size_t j = 0; j < n; ++j) {
            if (i == j) continue;
            const Vector2d delta = positions[j] - positions[i];
            const double distance = delta.norm();
            const double min_distance = radii[i] + radii[j] + 10.0;
            // Coincident entities have no separation angle; skip them
            if (distance < min_distance && distance > 0.0) {
                const double force = (min_distance - distance) / min_distance;
                acc -= (delta / distance) * (force * strength);
            }
        }
        out[i] = acc;
    };

    #ifdef _OPENMP
    if (config_.enable_threading && n >= config_.threading_threshold) {
        const long long count = static_cast<long long>(n);
        #pragma omp parallel for schedule(static)
        for (long long i = 0; i < count; ++i) {
            force_on(static_cast<size_t>(i));
        }
    } else
    #endif
    {
        for (size_t i = 0; i < n; ++i) force_on(i);
    }
}

void LatticeEngine::apply_repulsion() {
    for (size_t i = 0; i < entities_.size(); ++i) {
        entities_[i].velocity += repulsion_[i];
    }
}

void LatticeEngine::modulate_groups() {
    for (auto& g : groups_) g.modulate(entities_, time_);
}

void LatticeEngine::advance_entities(double dt, const PointerInfluence* pointer) {
    AdvanceContext ctx{params_, pointer, clock_->now(), config_.world, rng_};
    for (auto& e : entities_) e.advance(dt, ctx);
}

void LatticeEngine::update_clusters() {
    clusters_ = cluster_detector_.detect(entities_);
}

AggregateStats LatticeEngine::compute_aggregate() const {
    AggregateStats stats;
    stats.node_count = entities_.size();
    stats.cluster_count = clusters_.size();
    stats.time = time_;
    if (entities_.empty()) return stats;

    double total_re = 0.0, total_im = 0.0;
    double total_attention = 0.0, total_phase = 0.0;
    for (const auto& e : entities_) {
        const size_t g = static_cast<size_t>(e.group_id);
        const double weight = g < resonance_weights_.size() ? resonance_weights_[g] : 0.0;
        total_re += e.consciousness_re * weight;
        total_im += e.consciousness_im * weight;
        total_attention += e.attention;
        total_phase += e.phase;
    }

    const double n = static_cast<double>(entities_.size());
    stats.consciousness_magnitude = std::hypot(total_re, total_im);
    stats.global_resonance = stats.consciousness_magnitude / n;
    stats.average_attention = total_attention / n;

    double degrees = std::fmod(total_phase / n * 180.0 / (TWO_PI / 2.0), 360.0);
    if (degrees < 0.0) degrees += 360.0;
    if (degrees >= 360.0) degrees = 0.0;
    stats.average_phase_degrees = degrees;
    return stats;
}


//===========================================================================================
//==                                   MUTATION API                                        ==
//===========================================================================================

EntitySnapshot LatticeEngine::add_entity(double x, double y) {
    if (groups_.empty()) {
        // Never initialised: give the entity a single full-weight group to belong to
        resonance_weights_.assign(1, 1.0);
        groups_.emplace_back(0, Vector2d::Zero(), config_.group_radius_max, 1.0);
    }

    entities_.push_back(spawn_entity(Vector2d(x, y)));
    LatticeEntity& added = entities_.back();
    added.attention = added.attention_density(config_.world.attention_sigma);

    refresh_group_membership();
    normalize_attention();

    EntityAddedEvent event{added.id, x, y, added.group_id};
    publish(Events::ENTITY_ADDED, event);
    return make_entity_snapshot(entities_.back());
}

bool LatticeEngine::remove_entity(EntityId id) {
    auto it = std::find_if(entities_.begin(), entities_.end(),
                           [id](const LatticeEntity& e) { return e.id == id; });
    if (it == entities_.end()) {
        std::cerr << "LatticeEngine: remove_entity ignored unknown id " << id << "\n";
        return false;
    }

    // Order-preserving erase keeps collection order (and thus cluster discovery order) stable
    entities_.erase(it);
    refresh_group_membership();
    // Cluster member indices refer to the old arena layout
    clusters_.clear();
    for (auto& e : entities_) e.cluster_id = -1;
    normalize_attention();

    EntityRemovedEvent event{id, entities_.size()};
    publish(Events::ENTITY_REMOVED, event);
    return true;
}

const LatticeEntity* LatticeEngine::find_entity(EntityId id) const {
    for (const auto& e : entities_) {
        if (e.id == id) return &e;
    }
    return nullptr;
}

void LatticeEngine::collapse(double x, double y) {
    const Vector2d origin(x, y);
    size_t affected = 0;
    for (auto& e : entities_) {
        const Vector2d away = e.position - origin;
        const double distance = away.norm();
        if (distance >= config_.collapse_radius) continue;

        e.consciousness_re = 0.0;
        e.consciousness_im = 0.0;
        e.phase = wrap_phase(e.phase + TWO_PI / 2.0);

        if (distance > 0.0) {
            const double push = (config_.collapse_radius - distance) / config_.collapse_radius * config_.collapse_push;
            e.velocity += (away / distance) * push;
        }
        ++affected;
    }

    CollapseEvent event{x, y, affected};
    publish(Events::COLLAPSE_TRIGGERED, event);
}

PhysicsParams::MergeResult LatticeEngine::set_parameters(const std::unordered_map<std::string, double>& partial) {
    PhysicsParams::MergeResult result = params_.merge(partial);
    for (const auto& key : result.ignored_keys) {
        std::cerr << "LatticeEngine: ignoring parameter '" << key << "' (unknown key or non-finite value)\n";
    }

    ParametersChangedEvent event{result.applied, result.ignored};
    publish(Events::PARAMETERS_CHANGED, event);
    return result;
}

bool LatticeEngine::set_mode(const std::string& mode) {
    VisualizationMode parsed;
    if (!parse_visualization_mode(mode, parsed)) {
        std::cerr << "LatticeEngine: ignoring unknown mode '" << mode << "'\n";
        return false;
    }
    mode_ = parsed;

    ModeChangedEvent event{visualization_mode_name(mode_)};
    publish(Events::MODE_CHANGED, event);
    return true;
}

void LatticeEngine::queue_pointer(const PointerInfluence& pointer) {
    pointer_queue_.push_back(pointer);
}

std::vector<LatticeEngine::PendingEvent> LatticeEngine::take_pending_events() {
    std::vector<PendingEvent> out;
    out.swap(pending_events_);
    return out;
}


//===========================================================================================
//==                                   SNAPSHOTS                                           ==
//===========================================================================================

EntitySnapshot LatticeEngine::make_entity_snapshot(const LatticeEntity& e) const {
    EntitySnapshot s;
    s.id = e.id;
    s.x = e.position.x();
    s.y = e.position.y();
    s.radius = e.radius;
    s.frequency = e.frequency;
    s.phase = e.phase;
    s.attention = e.attention;
    s.consciousness_re = e.consciousness_re;
    s.consciousness_im = e.consciousness_im;
    s.group_id = e.group_id;
    s.cluster_id = e.cluster_id;
    s.consciousness_depth = e.consciousness_depth;
    s.self_awareness = e.self_awareness;
    s.thought_intensity = e.thought_intensity;
    s.recursion_level = e.recursion_level;
    return s;
}

LatticeSnapshot LatticeEngine::snapshot() const {
    LatticeSnapshot out;

    out.entities.reserve(entities_.size());
    for (const auto& e : entities_) out.entities.push_back(make_entity_snapshot(e));

    out.groups.reserve(groups_.size());
    for (const auto& g : groups_) {
        out.groups.push_back({g.id(), g.center().x(), g.center().y(), g.radius(),
                              g.resonance_weight(), g.members().size()});
    }

    out.clusters.reserve(clusters_.size());
    for (const auto& c : clusters_) {
        ClusterSnapshot cs;
        cs.id = c.id;
        cs.nodes.reserve(c.members.size());
        for (size_t idx : c.members) {
            if (idx < entities_.size()) cs.nodes.push_back(entities_[idx].id);
        }
        cs.center_x = c.centroid.x();
        cs.center_y = c.centroid.y();
        cs.recursion_depth = c.recursion_depth;
        cs.complexity_score = c.complexity_score;
        out.clusters.push_back(std::move(cs));
    }

    out.global_stats = compute_aggregate();
    out.mode = visualization_mode_name(mode_);
    out.params = params_.as_map();
    out.resonance_weights = resonance_weights_;
    out.time = time_;
    return out;
}
