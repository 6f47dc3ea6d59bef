// Headless driver: steps a lattice at a 60 Hz cadence and prints aggregate statistics.
#include "EventSystem.h"
#include "LatticeHost.h"

#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

namespace {

struct CliOptions {
    size_t entities = 128;
    size_t groups = 3;
    int frames = 600;
    uint64_t seed = 1234567ULL;
    int report_every = 60;
    bool realtime = false;
};

void print_help() {
    std::cout << "Usage: lattice_headless [options]\n"
              << "  --entities N     Number of entities (default 128)\n"
              << "  --groups G       Number of resonance groups (default 3)\n"
              << "  --frames F       Frames to simulate (default 600)\n"
              << "  --seed S         Random seed\n"
              << "  --report N       Print statistics every N frames (default 60)\n"
              << "  --realtime       Sleep to hold a 60 Hz wall-clock cadence\n"
              << "  --help           Show this help\n";
}

bool parse_size(const char* value, size_t& out) {
    try {
        out = static_cast<size_t>(std::stoull(value));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_int(const char* value, int& out) {
    try {
        out = std::stoi(value);
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

bool parse_seed(const char* value, uint64_t& out) {
    try {
        out = static_cast<uint64_t>(std::stoull(value));
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

// Returns false when the program should exit (help requested)
bool parse_cli(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_help();
            return false;
        }
        if (arg == "--realtime") {
            opts.realtime = true;
            continue;
        }
        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << arg << ", ignoring\n";
            continue;
        }
        const char* value = argv[++i];
        bool ok = true;
        if (arg == "--entities") ok = parse_size(value, opts.entities);
        else if (arg == "--groups") ok = parse_size(value, opts.groups);
        else if (arg == "--frames") ok = parse_int(value, opts.frames);
        else if (arg == "--seed") ok = parse_seed(value, opts.seed);
        else if (arg == "--report") ok = parse_int(value, opts.report_every);
        else std::cerr << "Unknown option " << arg << ", ignoring\n";
        if (!ok) std::cerr << "Invalid value '" << value << "' for " << arg << ", keeping default\n";
    }
    if (opts.report_every < 1) opts.report_every = 1;
    return true;
}

void print_stats(const AggregateStats& s, uint64_t frame) {
    std::cout << std::fixed << std::setprecision(4)
              << "frame " << std::setw(6) << frame
              << "  |C| " << s.consciousness_magnitude
              << "  resonance " << s.global_resonance
              << "  attention " << s.average_attention
              << "  phase " << std::setprecision(1) << s.average_phase_degrees << " deg"
              << "  nodes " << s.node_count
              << "  clusters " << s.cluster_count
              << "  t " << std::setprecision(3) << s.time << "s\n";
}

} // namespace

int main(int argc, char** argv) {
    CliOptions opts;
    if (!parse_cli(argc, argv, opts)) return 0;

    EventBus bus;
    size_t collapse_hits = 0;
    bus.subscribe<CollapseEvent>(Events::COLLAPSE_TRIGGERED, [&](const CollapseEvent& e) {
        collapse_hits += e.affected;
    });

    // Realtime runs measure wall time; batch runs replay the nominal frame length
    LatticeHost host(bus, opts.entities, opts.groups, opts.seed, LatticeEngine::Config{},
                     opts.realtime ? LatticeHost::ClockFactory(make_steady_clock)
                                   : LatticeHost::ClockFactory(make_replay_clock));

    constexpr double frame_dt = 1.0 / 60.0;
    const auto frame_period = std::chrono::duration<double>(frame_dt);
    const int midpoint = opts.frames / 2;

    for (int frame = 1; frame <= opts.frames; ++frame) {
        const auto frame_start = std::chrono::steady_clock::now();

        if (frame == midpoint) {
            const EntitySnapshot added = host.add_entity(0.0, 0.0);
            host.collapse(0.0, 0.0);
            std::cout << "Added entity " << added.id << " at origin and collapsed "
                      << collapse_hits << " entities around it\n";
        }

        const AggregateStats stats = host.step(frame_dt);
        if (frame % opts.report_every == 0) print_stats(stats, static_cast<uint64_t>(frame));

        if (opts.realtime) {
            std::this_thread::sleep_until(frame_start +
                std::chrono::duration_cast<std::chrono::steady_clock::duration>(frame_period));
        }
    }

    const LatticeHost::Status status = host.status();
    std::cout << "Finished " << status.frame_index << " frames: " << status.node_count << " nodes, "
              << status.cluster_count << " clusters, t=" << status.time << "s\n";
    return 0;
}
