/// @file main.cpp
/// @brief coherence_monitor - destination-side stand-in for a renderer
///
/// Creates the shared memory for a connection name, waits for the
/// authoring host, logs every event and answers each viewport with a
/// generated RGB24 test pattern. With --json a snapshot of the scene
/// context is printed every time the host applies mesh changes.

#include <coherence/scene/bridge.hpp>
#include <coherence/core/config.hpp>
#include <coherence/core/log.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

using json = nlohmann::json;
using coherence_scene::Bridge;
using coherence_scene::BridgeEvent;
using coherence_scene::BridgeRole;
using coherence_scene::SceneContext;

namespace {

std::atomic<bool> g_running{true};

void handle_signal(int) {
    g_running = false;
}

struct Options {
    std::string config_path;
    std::string name;
    bool json = false;
    std::uint64_t frames = 0;
};

json vec_to_json(coherence_math::Vec3 v) {
    return json::array({v.x, v.y, v.z});
}

json snapshot(const SceneContext& context) {
    json root;

    json objects = json::array();
    for (const auto& [name, object] : context.objects()) {
        const auto& transform = object->transform();
        objects.push_back({
            {"name", name},
            {"id", object->id()},
            {"type", coherence_scene::scene_object_type_name(object->type())},
            {"mesh", object->mesh_name()},
            {"material", object->material()},
            {"display", coherence_scene::display_mode_name(object->display_mode())},
            {"vertex_count", object->vertex_count()},
            {"triangle_count", object->triangle_count()},
            {"position", vec_to_json(transform.position)},
            {"scale", vec_to_json(transform.scale)},
        });
    }
    root["objects"] = std::move(objects);

    json meshes = json::array();
    for (const auto& [name, buffers] : context.mesh_buffers()) {
        meshes.push_back({
            {"name", name},
            {"version", buffers->version()},
            {"vertices", buffers->vertices().size()},
            {"normals", buffers->normals().size()},
            {"colors", buffers->colors().size()},
            {"indices", buffers->triangles().size()},
        });
    }
    root["meshes"] = std::move(meshes);

    json viewports = json::array();
    for (const auto& [id, viewport] : context.viewports()) {
        const auto& camera = viewport->camera();
        viewports.push_back({
            {"id", id},
            {"width", camera.width},
            {"height", camera.height},
            {"perspective", camera.is_perspective != 0},
            {"visible_objects", viewport->visible_objects()},
        });
    }
    root["viewports"] = std::move(viewports);

    json images = json::array();
    for (const auto& [name, image] : context.images()) {
        images.push_back({{"name", name}, {"width", image->width()}, {"height", image->height()}});
    }
    root["images"] = std::move(images);

    json components = json::array();
    for (const auto& [key, component] : context.components()) {
        components.push_back({
            {"target", component->target()},
            {"name", component->component_name()},
            {"enabled", component->enabled()},
            {"properties", component->properties().size()},
        });
    }
    root["components"] = std::move(components);

    return root;
}

/// Diagonal gradient that shifts each frame
void fill_pattern(std::vector<std::uint8_t>& rgb, std::int32_t width, std::int32_t height, std::uint64_t frame) {
    rgb.resize(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * 3);
    std::size_t i = 0;
    for (std::int32_t y = 0; y < height; ++y) {
        for (std::int32_t x = 0; x < width; ++x) {
            rgb[i++] = static_cast<std::uint8_t>((x + frame) & 0xFF);
            rgb[i++] = static_cast<std::uint8_t>((y + frame) & 0xFF);
            rgb[i++] = static_cast<std::uint8_t>((x + y) & 0xFF);
        }
    }
}

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
              << "\n"
              << "Options:\n"
              << "  --config PATH   TOML configuration file\n"
              << "  --name NAME     Connection name (overrides the config)\n"
              << "  --json          Print a scene snapshot after each mesh update\n"
              << "  --frames N      Exit after sending N render frames\n"
              << "  --help, -h      Show this help message\n";
}

} // anonymous namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char** argv) {
    Options options;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--json") {
            options.json = true;
        } else if ((arg == "--config" || arg == "--name" || arg == "--frames") && i + 1 < argc) {
            std::string value = argv[++i];
            if (arg == "--config") {
                options.config_path = value;
            } else if (arg == "--name") {
                options.name = value;
            } else {
                try {
                    options.frames = std::stoull(value);
                } catch (const std::exception&) {
                    std::cerr << "Invalid frame count: " << value << "\n";
                    return 1;
                }
            }
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    coherence_core::BridgeConfig config;
    if (!options.config_path.empty()) {
        auto loaded = coherence_core::load_config(options.config_path);
        if (!loaded) {
            spdlog::error("Failed to load config: {}", loaded.error().message());
            return 1;
        }
        config = std::move(loaded).value();
    }
    if (!options.name.empty()) {
        config.connection_name = options.name;
    }
    if (auto valid = coherence_core::validate_config(config); !valid) {
        spdlog::error("Invalid config: {}", valid.error().message());
        return 1;
    }
    coherence_core::apply_logging_config(config);

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    auto log = coherence_core::get_logger("monitor");
    Bridge bridge(config, BridgeRole::Destination);

    bool reconnect = false;
    bridge.set_event_handler([&](BridgeEvent event, const std::string& target) {
        log->info("{} {}", coherence_scene::bridge_event_name(event), target);

        if (event == BridgeEvent::PeerDisconnected || event == BridgeEvent::ConnectionLost) {
            reconnect = true;
        } else if (event == BridgeEvent::MeshUpdated && options.json && bridge.context()) {
            std::cout << snapshot(*bridge.context()).dump(2) << std::endl;
        }
    });

    std::vector<std::uint8_t> rgb;
    std::uint64_t frames_sent = 0;

    while (g_running) {
        if (!bridge.is_connected_to_shared_memory()) {
            auto connected = bridge.connect("coherence_monitor 1.0.0");
            if (!connected) {
                log->error("Failed to create shared memory: {}", connected.error().message());
                return 1;
            }
            log->info("Waiting for a host on '{}'", config.connection_name);
            reconnect = false;
        }

        bridge.update();

        if (reconnect) {
            // A fresh set of rings for the next host session
            bridge.disconnect();
            continue;
        }

        if (bridge.is_connected() && bridge.context()) {
            for (const auto& [id, viewport] : bridge.context()->viewports()) {
                const auto& camera = viewport->camera();
                if (camera.width <= 0 || camera.height <= 0) {
                    continue;
                }

                fill_pattern(rgb, camera.width, camera.height, frames_sent);
                auto sent = bridge.send_render_frame(id, camera.width, camera.height, rgb);
                if (!sent) {
                    log->warn("Frame for viewport {} not sent: {}", id, sent.error().message());
                } else if (*sent) {
                    ++frames_sent;
                }
            }
        }

        if (options.frames > 0 && frames_sent >= options.frames) {
            log->info("Sent {} frames, exiting", frames_sent);
            break;
        }

        std::this_thread::sleep_for(std::chrono::milliseconds(16));
    }

    bridge.disconnect();
    coherence_core::shutdown_logging();
    return 0;
}
