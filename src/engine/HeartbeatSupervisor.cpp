#include "engine/HeartbeatSupervisor.h"

#include <algorithm>

#include "common/Logger.h"

namespace tradeguard {
namespace engine {

const char* toString(HeartbeatVerdict verdict) {
    switch (verdict) {
        case HeartbeatVerdict::HEALTHY: return "HEALTHY";
        case HeartbeatVerdict::RESTART_ATTEMPTED: return "RESTART_ATTEMPTED";
        case HeartbeatVerdict::EMERGENCY: return "EMERGENCY";
        case HeartbeatVerdict::HALTED: return "HALTED";
    }
    return "HEALTHY";
}

HeartbeatSupervisor::HeartbeatSupervisor(
    const HeartbeatConfig& config,
    std::chrono::milliseconds loop_period,
    RestartFn restart_loop,
    EmergencyFn emergency_stop
)
    : config_(config)
    , stall_threshold_(std::chrono::milliseconds(
          static_cast<long long>(static_cast<double>(loop_period.count()) * config.stall_multiplier)))
    , restart_loop_(std::move(restart_loop))
    , emergency_stop_(std::move(emergency_stop))
{
    recordTick();
}

HeartbeatSupervisor::~HeartbeatSupervisor() {
    stop();
}

int64_t HeartbeatSupervisor::toNanos(Clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch()).count();
}

void HeartbeatSupervisor::start() {
    if (running_) {
        return;
    }
    if (worker_thread_ && worker_thread_->joinable()) {
        worker_thread_->join();
    }
    reset();
    running_ = true;
    worker_thread_ = std::make_unique<std::thread>(&HeartbeatSupervisor::run, this);
    LOG_INFO("HeartbeatSupervisor started - pulse {} ms, stall after {} ms, max restarts {}",
             config_.heartbeat_period_ms, stall_threshold_.count(), config_.max_restart_attempts);
}

void HeartbeatSupervisor::stop() {
    bool was_running = false;
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        was_running = running_.exchange(false);
    }
    wake_.notify_all();
    // A stop issued from the pulse thread itself is joined by the next stop()
    if (worker_thread_ && worker_thread_->joinable() &&
        worker_thread_->get_id() != std::this_thread::get_id()) {
        worker_thread_->join();
        worker_thread_.reset();
    }
    if (was_running) {
        LOG_INFO("HeartbeatSupervisor stopped");
    }
}

void HeartbeatSupervisor::run() {
    const auto period = std::chrono::milliseconds(std::max(1, config_.heartbeat_period_ms));
    while (running_) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            wake_.wait_for(lock, period, [this] { return !running_; });
        }
        if (!running_) {
            break;
        }
        check();
    }
}

void HeartbeatSupervisor::recordTick(Clock::time_point now) {
    last_tick_ns_ = toNanos(now);
    restart_attempts_ = 0;
}

void HeartbeatSupervisor::reset(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(check_mutex_);
    halted_ = false;
    recordTick(now);
}

std::chrono::milliseconds HeartbeatSupervisor::sinceLastTick(Clock::time_point now) const {
    const int64_t elapsed_ns = toNanos(now) - last_tick_ns_.load();
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::nanoseconds(elapsed_ns));
}

HeartbeatVerdict HeartbeatSupervisor::check(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(check_mutex_);
    ++pulses_;

    if (halted_) {
        return HeartbeatVerdict::HALTED;
    }

    const auto idle = sinceLastTick(now);
    if (idle <= stall_threshold_) {
        LOG_DEBUG("Heartbeat ok - last tick {} ms ago", idle.count());
        return HeartbeatVerdict::HEALTHY;
    }

    if (restart_attempts_ < config_.max_restart_attempts) {
        const int attempt = ++restart_attempts_;
        LOG_WARN("Control loop stalled ({} ms since last tick) - restart attempt {}/{}",
                 idle.count(), attempt, config_.max_restart_attempts);
        bool restarted = false;
        if (restart_loop_) {
            try {
                restarted = restart_loop_(attempt);
            } catch (const std::exception& e) {
                LOG_ERROR("Restart attempt {} threw: {}", attempt, e.what());
            }
        }
        if (!restarted) {
            LOG_WARN("Restart attempt {} failed", attempt);
        }
        return HeartbeatVerdict::RESTART_ATTEMPTED;
    }

    halted_ = true;
    const std::string reason = "control loop stalled; " + std::to_string(config_.max_restart_attempts) +
                               " restart attempts exhausted";
    LOG_ERROR("Heartbeat: {}", reason);
    if (emergency_stop_) {
        emergency_stop_(reason);
    }
    return HeartbeatVerdict::EMERGENCY;
}

} // namespace engine
} // namespace tradeguard
