#include "nexstar/motion.hpp"

#include <chrono>

#include <spdlog/spdlog.h>

#include "nexstar/errors.hpp"

namespace nexstar {

MotionController::MotionController(ProtocolClient* protocol, StateCallback on_state)
    : protocol_(protocol)
    , on_state_(std::move(on_state)) {
}

MotionController::~MotionController() {
    cancel_scheduled_stop();
}

void MotionController::start(Direction direction, int rate) {
    ProtocolClient::validate_rate(rate);
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_timer();
    send_move(direction, rate);
}

void MotionController::start_for(Direction direction, int rate, double duration) {
    ProtocolClient::validate_rate(rate);
    if (!(duration > 0.0)) {
        throw InvalidParameterError("Duration must be positive, got " +
                                    std::to_string(duration));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_timer();
    send_move(direction, rate);

    std::lock_guard<std::mutex> timer_lock(timer_mutex_);
    timer_cancelled_ = false;
    timer_pending_ = true;
    timer_ = std::thread(&MotionController::run_timer, this, axis_of(direction),
                         duration, ++timer_generation_);
}

void MotionController::step(Direction direction, int rate) {
    ProtocolClient::validate_rate(rate);
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_timer();
    send_move(direction, rate);
    std::this_thread::sleep_for(std::chrono::duration<double>(STEP_DURATION));
    protocol_->variable_rate_motion(axis_of(direction), MotionDirection::POSITIVE, 0);
    if (on_state_) {
        on_state_(false);
    }
}

void MotionController::stop(Axis axis) {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_timer();
    protocol_->variable_rate_motion(axis, MotionDirection::POSITIVE, 0);
    spdlog::debug("Stopped motion on {} axis", to_string(axis));
    if (on_state_) {
        on_state_(false);
    }
}

void MotionController::stop_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_timer();
    protocol_->variable_rate_motion(Axis::AZIMUTH, MotionDirection::POSITIVE, 0);
    protocol_->variable_rate_motion(Axis::ALTITUDE, MotionDirection::POSITIVE, 0);
    spdlog::debug("Stopped motion on both axes");
    if (on_state_) {
        on_state_(false);
    }
}

void MotionController::cancel_scheduled_stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_timer();
}

bool MotionController::has_scheduled_stop() const {
    std::lock_guard<std::mutex> lock(timer_mutex_);
    return timer_pending_;
}

void MotionController::cancel_timer() {
    std::thread timer;
    {
        std::lock_guard<std::mutex> lock(timer_mutex_);
        timer_cancelled_ = true;
        timer_pending_ = false;
        timer = std::move(timer_);
    }
    timer_cv_.notify_all();
    if (timer.joinable()) {
        timer.join();
    }
}

void MotionController::send_move(Direction direction, int rate) {
    spdlog::debug("Moving {} at rate {}", to_string(direction), rate);
    protocol_->variable_rate_motion(axis_of(direction), sign_of(direction), rate);
    if (on_state_) {
        on_state_(true);
    }
}

void MotionController::run_timer(Axis axis, double duration, std::uint64_t generation) {
    {
        std::unique_lock<std::mutex> lock(timer_mutex_);
        bool cancelled = timer_cv_.wait_for(
            lock, std::chrono::duration<double>(duration),
            [this] { return timer_cancelled_; });
        if (cancelled) {
            return;
        }
        timer_pending_ = false;
    }

    try {
        protocol_->variable_rate_motion(axis, MotionDirection::POSITIVE, 0);
        spdlog::debug("Timed stop on {} axis after {:.2f}s", to_string(axis), duration);
    } catch (const NexStarError& e) {
        spdlog::error("Timed stop on {} axis failed: {}", to_string(axis), e.what());
        return;
    }

    // A newer operation that cancelled this timer owns the reported state.
    std::lock_guard<std::mutex> lock(timer_mutex_);
    if (timer_cancelled_ || generation != timer_generation_) {
        return;
    }
    if (on_state_) {
        on_state_(false);
    }
}

} // namespace nexstar
