/// @file main.cpp
/// @brief Broad Phase Demo
///
/// Moves a field of boxes around a wrapping world and, every frame, rebuilds a
/// GridHash from the current positions, collects candidate pairs through it
/// and confirms them with an exact overlap test. Settings come from a JSON
/// file (broadphase_demo.json by default, or the first argument).

#include <gridhash/core/core.hpp>
#include <gridhash/spatial/spatial.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <vector>

namespace {

/// Simulation settings read from the "simulation" object
struct SimulationSettings {
    std::size_t bodies = 400;
    std::size_t frames = 120;
    float world_size = 1024.0f;
    float min_size = 4.0f;
    float max_size = 48.0f;
    float max_speed = 6.0f;
    std::uint32_t seed = 1337;
    std::size_t report_every = 30;
};

/// A moving box
struct Body {
    float x = 0.0f;
    float y = 0.0f;
    float w = 0.0f;
    float h = 0.0f;
    float vx = 0.0f;
    float vy = 0.0f;
    std::uint32_t id = 0;
};

struct FrameResult {
    std::size_t candidates = 0;
    std::size_t contacts = 0;
};

/// Locate the demo config relative to common working directories
std::filesystem::path find_config_path() {
    std::vector<std::filesystem::path> candidates = {
        "broadphase_demo.json",
        "examples/broadphase_demo/broadphase_demo.json",
        "../examples/broadphase_demo/broadphase_demo.json",
        "../../examples/broadphase_demo/broadphase_demo.json",
    };

    for (const auto& path : candidates) {
        if (std::filesystem::exists(path)) {
            return std::filesystem::absolute(path);
        }
    }
    return candidates.front();
}

gridhash_core::Result<nlohmann::json> read_json(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return gridhash_core::Error(gridhash_core::ErrorCode::IOError,
                                    "Cannot open demo config: " + path.string());
    }

    try {
        return nlohmann::json::parse(file);
    } catch (const nlohmann::json::parse_error& e) {
        return gridhash_core::Error(gridhash_core::ErrorCode::ParseError, e.what())
            .with_context("path", path.string());
    }
}

SimulationSettings parse_settings(const nlohmann::json& j) {
    SimulationSettings s;
    if (!j.is_object()) {
        spdlog::warn("'simulation' is not an object, using defaults");
        return s;
    }
    s.bodies = j.value("bodies", s.bodies);
    s.frames = j.value("frames", s.frames);
    s.world_size = j.value("world_size", s.world_size);
    s.min_size = j.value("min_size", s.min_size);
    s.max_size = j.value("max_size", s.max_size);
    s.max_speed = j.value("max_speed", s.max_speed);
    s.seed = j.value("seed", s.seed);
    s.report_every = j.value("report_every", s.report_every);
    return s;
}

std::vector<Body> spawn_bodies(const SimulationSettings& settings) {
    std::mt19937 rng(settings.seed);
    std::uniform_real_distribution<float> position(0.0f, settings.world_size);
    std::uniform_real_distribution<float> size(settings.min_size, settings.max_size);
    std::uniform_real_distribution<float> velocity(-settings.max_speed, settings.max_speed);

    std::vector<Body> bodies(settings.bodies);
    for (std::size_t i = 0; i < bodies.size(); ++i) {
        auto& b = bodies[i];
        b.x = position(rng);
        b.y = position(rng);
        b.w = size(rng);
        b.h = size(rng);
        b.vx = velocity(rng);
        b.vy = velocity(rng);
        b.id = static_cast<std::uint32_t>(i);
    }
    return bodies;
}

/// Advance positions, wrapping at the world edges
void step(std::vector<Body>& bodies, float world_size) {
    for (auto& b : bodies) {
        b.x += b.vx;
        b.y += b.vy;
        if (b.x < 0.0f) b.x += world_size;
        if (b.x >= world_size) b.x -= world_size;
        if (b.y < 0.0f) b.y += world_size;
        if (b.y >= world_size) b.y -= world_size;
    }
}

/// Broad phase through the grid, narrow phase with an exact overlap test.
/// Each unordered pair is counted once (probe id < candidate id).
gridhash_core::Result<FrameResult> run_frame(gridhash_spatial::GridHash<std::uint32_t>& grid,
                                             const std::vector<Body>& bodies) {
    auto populated = grid.populate_with(bodies, [](const Body& b) { return b.id; });
    if (!populated) {
        return populated.error();
    }

    FrameResult result;
    for (const auto& probe : bodies) {
        grid.query_unique(probe, [&](std::uint32_t other) {
            if (other <= probe.id) {
                return;
            }
            ++result.candidates;
            if (gridhash_spatial::overlaps(probe, bodies[other])) {
                ++result.contacts;
            }
        });
    }
    return result;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
    gridhash_core::init_logging();
    spdlog::info("=== Broad Phase Demo ===");

    std::filesystem::path config_path = argc > 1 ? std::filesystem::path(argv[1]) : find_config_path();
    spdlog::info("Config: {}", config_path.string());

    auto document = read_json(config_path);
    if (!document) {
        spdlog::error("{}", gridhash_core::build_error_chain(document.error()));
        return EXIT_FAILURE;
    }

    // Logging
    gridhash_core::LogConfig log_config;
    std::string level_name = document->value("log_level", std::string("info"));
    if (auto level = gridhash_core::parse_log_level(level_name)) {
        log_config.level = *level;
    } else {
        spdlog::warn("Unknown log level '{}', using info", level_name);
    }
    gridhash_core::configure_logging(log_config);

    // Grid
    if (!document->contains("grid")) {
        spdlog::error("Demo config has no 'grid' object");
        return EXIT_FAILURE;
    }
    auto grid_config = gridhash_spatial::GridHashConfig::from_json((*document)["grid"]);
    if (!grid_config) {
        spdlog::error("Invalid grid config: {}", gridhash_core::build_error_chain(grid_config.error()));
        return EXIT_FAILURE;
    }

    auto grid = gridhash_spatial::GridHash<std::uint32_t>::create(*grid_config);
    if (!grid) {
        spdlog::error("Failed to create grid: {}", grid.error().message());
        return EXIT_FAILURE;
    }
    spdlog::info("Grid: spacing={}, max_entries={}, buckets={}, rounding={}",
                 grid->spacing(), grid->max_entries(), grid->cell_count(),
                 gridhash_spatial::cell_rounding_name(grid->rounding()));

    // Simulation
    SimulationSettings settings;
    if (document->contains("simulation")) {
        settings = parse_settings((*document)["simulation"]);
    }
    auto bodies = spawn_bodies(settings);
    spdlog::info("Simulating {} bodies for {} frames in a {}x{} world",
                 bodies.size(), settings.frames, settings.world_size, settings.world_size);

    std::size_t skipped = 0;
    std::size_t total_contacts = 0;
    std::size_t total_candidates = 0;
    auto started = std::chrono::steady_clock::now();

    for (std::size_t frame = 0; frame < settings.frames; ++frame) {
        step(bodies, settings.world_size);

        auto result = run_frame(*grid, bodies);
        if (!result) {
            ++skipped;
            spdlog::warn("Frame {} skipped: {}", frame, result.error().message());
            continue;
        }

        total_candidates += result->candidates;
        total_contacts += result->contacts;

        if (settings.report_every > 0 && frame % settings.report_every == 0) {
            spdlog::info("Frame {}: {} candidate pairs, {} contacts, {}",
                         frame, result->candidates, result->contacts,
                         gridhash_spatial::format_stats(grid->stats()));
        }
    }

    auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started);
    std::size_t all_pairs = bodies.size() * (bodies.size() - (bodies.empty() ? 0 : 1)) / 2;

    spdlog::info("=== Summary ===");
    spdlog::info("Frames: {} run, {} skipped, {:.2f} ms total", settings.frames - skipped, skipped, elapsed.count());
    spdlog::info("Candidate pairs: {} (brute force would test {} per frame)", total_candidates, all_pairs);
    spdlog::info("Contacts: {}", total_contacts);
    if (skipped > 0) {
        spdlog::info("Error summary:\n{}", gridhash_core::debug::error_stats_summary());
    }

    gridhash_core::shutdown_logging();
    return skipped == settings.frames && settings.frames > 0 ? EXIT_FAILURE : EXIT_SUCCESS;

    } catch (const std::exception& e) {
        spdlog::error("FATAL EXCEPTION: {}", e.what());
        spdlog::default_logger()->flush();
        return EXIT_FAILURE;
    }
}
