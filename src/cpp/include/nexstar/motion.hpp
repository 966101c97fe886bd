#pragma once

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

#include "constants.hpp"
#include "protocol.hpp"
#include "types.hpp"

namespace nexstar {

/// Variable-rate motion on the two mount axes.
///
/// A timed move starts the axis and arms a stop timer on a background
/// thread; the timer is cancelled by any later move or stop, or by
/// destruction. Every public operation holds the motion mutex from
/// cancelling the previous timer until its own commands are sent and any
/// new timer is armed, so callers on different threads are applied one
/// after another. step() is a blocking start-sleep-stop sequence.
class MotionController {
public:
    /// Receives true once a move has been sent and false once a stop has.
    using StateCallback = std::function<void(bool moving)>;

    /// Construct over a protocol client (non-owning pointer).
    explicit MotionController(ProtocolClient* protocol,
                              StateCallback on_state = nullptr);
    ~MotionController();

    MotionController(const MotionController&) = delete;
    MotionController& operator=(const MotionController&) = delete;

    /// Start moving at rate until told otherwise.
    void start(Direction direction, int rate);

    /// Start moving and stop the axis after duration seconds without blocking.
    void start_for(Direction direction, int rate, double duration);

    /// Move for STEP_DURATION seconds, like one hand-controller button press.
    void step(Direction direction, int rate = DEFAULT_MOVE_RATE);

    /// Stop one axis.
    void stop(Axis axis);

    /// Stop both axes.
    void stop_all();

    /// Disarm a pending timed stop. Returns once the timer thread has exited.
    void cancel_scheduled_stop();

    /// True while a timed stop is armed.
    bool has_scheduled_stop() const;

private:
    ProtocolClient* protocol_;
    StateCallback on_state_;
    std::mutex mutex_;

    std::thread timer_;
    mutable std::mutex timer_mutex_;
    std::condition_variable timer_cv_;
    bool timer_cancelled_ = false;
    bool timer_pending_   = false;
    std::uint64_t timer_generation_ = 0;

    // Callers hold mutex_.
    void cancel_timer();
    void send_move(Direction direction, int rate);

    void run_timer(Axis axis, double duration, std::uint64_t generation);
};

} // namespace nexstar
