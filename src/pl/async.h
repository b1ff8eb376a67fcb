#pragma once

/// @file async.h
/// @brief Cooperative task pumping for PulseLED
///
/// Long waits in PulseLED (the frame delay of Ws2812Pwm::writeAsync in
/// particular) hand the processor to every registered async_runner
/// while they wait, instead of spinning.
///
/// @section Usage
/// @code
/// class Heartbeat : public pl::async_runner {
///   public:
///     void update() override {
///         if (pl::micros() - mLast >= 500000) {
///             mLast = pl::micros();
///             toggleLed();
///         }
///     }
///     bool has_active_tasks() const override { return true; }
///     pl::size active_task_count() const override { return 1; }
///   private:
///     pl::u32 mLast = 0;
/// };
///
/// Heartbeat heartbeat;
///
/// void setup() {
///     pl::AsyncManager::instance().register_runner(&heartbeat);
/// }
///
/// void loop() {
///     strip.writeAsync(colors);  // heartbeat keeps running during the frame
/// }
/// @endcode

#include "pl/int.h"

#ifndef PULSELED_MAX_ASYNC_RUNNERS
#define PULSELED_MAX_ASYNC_RUNNERS 8
#endif

namespace pl {

/// @brief Generic cooperative task runner interface
class async_runner {
  public:
    virtual ~async_runner() = default;

    /// Update this async runner (called during async pumping)
    virtual void update() = 0;

    /// Check if this runner has active tasks
    virtual bool has_active_tasks() const = 0;

    /// Get number of active tasks (for debugging/monitoring)
    virtual pl::size active_task_count() const = 0;
};

/// @brief Async runner registry (singleton)
///
/// Storage is a fixed table of PULSELED_MAX_ASYNC_RUNNERS pointers. A
/// runner that is already being updated is skipped by nested pumps, so a
/// runner may itself call pl::suspendMicroseconds() without recursing
/// into its own update().
class AsyncManager {
  public:
    static AsyncManager &instance();

    /// Register an async runner. Returns false if the table is full.
    bool register_runner(async_runner *runner);

    void unregister_runner(async_runner *runner);

    /// Update all registered async runners
    void update_all();

    bool has_active_tasks() const;

    pl::size total_active_tasks() const;

    pl::size runner_count() const { return mCount; }

  private:
    AsyncManager();

    struct Slot {
        async_runner *runner;
        bool updating;
    };

    Slot mSlots[PULSELED_MAX_ASYNC_RUNNERS];
    pl::size mCount;
};

/// @brief Run all registered async runners once
void async_run();

/// @brief Pump async runners and give the processor to the platform scheduler
/// for a short slice.
void async_yield();

pl::size async_active_tasks();

bool async_has_tasks();

} // namespace pl
