#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "engine/EngineConfig.h"

namespace tradeguard {
namespace engine {

enum class HeartbeatVerdict {
    HEALTHY,
    RESTART_ATTEMPTED,
    EMERGENCY,          // restart attempts exhausted; emergency callback ran
    HALTED              // emergency already fired, supervisor idle
};

const char* toString(HeartbeatVerdict verdict);

// Watches control-loop liveness on its own period. The loop calls
// recordTick(); a tick older than stall_multiplier x loop period is a stall.
class HeartbeatSupervisor {
public:
    using Clock = std::chrono::steady_clock;
    using RestartFn = std::function<bool(int attempt)>;
    using EmergencyFn = std::function<void(const std::string& reason)>;

    HeartbeatSupervisor(
        const HeartbeatConfig& config,
        std::chrono::milliseconds loop_period,
        RestartFn restart_loop,
        EmergencyFn emergency_stop
    );
    ~HeartbeatSupervisor();

    // Arms the supervisor; the stall clock starts now.
    void start();
    void stop();
    bool isRunning() const { return running_; }

    // Fresh tick: resets the restart attempt counter
    void recordTick(Clock::time_point now = Clock::now());

    // One pulse
    HeartbeatVerdict check(Clock::time_point now = Clock::now());

    // Clears the halted state after a manual re-arm
    void reset(Clock::time_point now = Clock::now());

    int restartAttempts() const { return restart_attempts_; }
    long long pulseCount() const { return pulses_; }
    bool halted() const { return halted_; }
    std::chrono::milliseconds stallThreshold() const { return stall_threshold_; }
    std::chrono::milliseconds sinceLastTick(Clock::time_point now = Clock::now()) const;

private:
    void run();
    static int64_t toNanos(Clock::time_point tp);

    HeartbeatConfig config_;
    std::chrono::milliseconds stall_threshold_;
    RestartFn restart_loop_;
    EmergencyFn emergency_stop_;

    std::atomic<int64_t> last_tick_ns_{0};
    std::atomic<int> restart_attempts_{0};
    std::atomic<long long> pulses_{0};
    std::atomic<bool> halted_{false};
    std::mutex check_mutex_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::unique_ptr<std::thread> worker_thread_;
};

} // namespace engine
} // namespace tradeguard
