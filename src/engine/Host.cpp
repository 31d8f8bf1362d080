// src/engine/Host.cpp
#include "tickspec/engine/Host.hpp"
#include "tickspec/engine/Systems.hpp"

#include <algorithm>
#include <chrono>
#include <thread>
#include <utility>

#include <spdlog/spdlog.h>

namespace tickspec::engine {

namespace {

using Clock     = std::chrono::steady_clock; // monotonic clock
using seconds_d = std::chrono::duration<double>;

} // namespace

Host::Host(const HostConfig& cfg)
    : m_config(cfg)
{
    if (m_config.frame_dt <= 0.0)
        m_config.frame_dt = 1.0 / 60.0;
    if (m_config.max_frame_dt < m_config.frame_dt)
        m_config.max_frame_dt = m_config.frame_dt;
}

entt::entity Host::Attach(std::string name, Tickable tickable)
{
    const entt::entity e = m_scene.CreateNode(std::move(name), m_scene.Root());
    m_scene.Registry().emplace<Tickable>(e, std::move(tickable));
    return e;
}

void Host::Tick(double dt_seconds)
{
    m_time.dt_seconds        = dt_seconds;
    m_time.time_since_start += dt_seconds;
    m_time.frame_index++;

    UpdateTickables(m_scene.Registry(), dt_seconds);
}

void Host::RequestQuit(int exit_code)
{
    if (m_quitRequested)
        return;

    m_quitRequested = true;
    m_exitCode      = exit_code;
    spdlog::info("Host quit requested (exit code {}) after {} frames.", exit_code, m_time.frame_index);
}

int Host::Run()
{
    spdlog::info("Host loop started. frame_dt={:.4f}s realtime={}", m_config.frame_dt, m_config.realtime);

    const seconds_d frameBudget(m_config.frame_dt);
    auto last = Clock::now();

    while (!m_quitRequested)
    {
        double dt = m_config.frame_dt;

        if (m_config.realtime)
        {
            const auto deadline = last + std::chrono::duration_cast<Clock::duration>(frameBudget);
            std::this_thread::sleep_until(deadline);

            const auto now = Clock::now();
            dt   = std::clamp(seconds_d(now - last).count(), 0.0, m_config.max_frame_dt);
            last = now;
        }

        Tick(dt);
    }

    spdlog::info("Host loop finished. frames={} simulated={:.3f}s", m_time.frame_index, m_time.time_since_start);
    return m_exitCode;
}

} // namespace tickspec::engine
