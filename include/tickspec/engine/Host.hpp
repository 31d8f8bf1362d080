// include/tickspec/engine/Host.hpp
#pragma once

#include <cstdint>
#include <string>

#include <entt/entt.hpp>

#include "tickspec/engine/Components.hpp"
#include "tickspec/engine/SceneTree.hpp"

namespace tickspec::engine {

struct HostConfig {
    double frame_dt     = 1.0 / 60.0; // delta fed to each frame (seconds)
    double max_frame_dt = 0.25;       // clamp for measured deltas in realtime mode
    bool   realtime     = false;      // pace frames against the wall clock
};

struct GameTime {
    double        dt_seconds {0.0};
    double        time_since_start {0.0};
    std::uint64_t frame_index {0};
};

// Minimal headless engine: a scene tree plus a frame loop that ticks every
// Tickable node once per frame until someone asks it to quit.
class Host {
public:
    explicit Host(const HostConfig& cfg = {});

    Host(const Host&)            = delete;
    Host& operator=(const Host&) = delete;

    // Adds a node under the scene root with the given per-frame callback.
    entt::entity Attach(std::string name, Tickable tickable);

    // One frame: advance time, then run tickables.
    void Tick(double dt_seconds);

    // Runs frames until RequestQuit. Returns the requested exit code.
    int Run();

    void RequestQuit(int exit_code);
    bool ShouldQuit() const noexcept { return m_quitRequested; }
    int  ExitCode() const noexcept { return m_exitCode; }

    SceneTree&        Scene() noexcept { return m_scene; }
    const GameTime&   Time() const noexcept { return m_time; }
    const HostConfig& Config() const noexcept { return m_config; }

private:
    HostConfig m_config{};
    SceneTree  m_scene;
    GameTime   m_time{};
    bool       m_quitRequested = false;
    int        m_exitCode      = 0;
};

} // namespace tickspec::engine
