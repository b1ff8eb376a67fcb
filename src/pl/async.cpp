#include "pl/async.h"

#include "pulseled_config.h"
#include "pl/log.h"
#include "platforms/time_platform.h"

namespace pl {

AsyncManager &AsyncManager::instance() {
    static AsyncManager manager;
    return manager;
}

AsyncManager::AsyncManager() : mCount(0) {
    for (pl::size i = 0; i < PULSELED_MAX_ASYNC_RUNNERS; ++i) {
        mSlots[i].runner = nullptr;
        mSlots[i].updating = false;
    }
}

bool AsyncManager::register_runner(async_runner *runner) {
    if (!runner) {
        return false;
    }
    for (pl::size i = 0; i < mCount; ++i) {
        if (mSlots[i].runner == runner) {
            return true;
        }
    }
    if (mCount >= PULSELED_MAX_ASYNC_RUNNERS) {
        PL_WARN("async runner table full (" << int(PULSELED_MAX_ASYNC_RUNNERS) << ")");
        return false;
    }
    mSlots[mCount].runner = runner;
    mSlots[mCount].updating = false;
    ++mCount;
    PL_LOG_ASYNC("registered runner, count=" << mCount);
    return true;
}

void AsyncManager::unregister_runner(async_runner *runner) {
    for (pl::size i = 0; i < mCount; ++i) {
        if (mSlots[i].runner == runner) {
            // Keep registration order stable for the remaining runners.
            for (pl::size j = i + 1; j < mCount; ++j) {
                mSlots[j - 1] = mSlots[j];
            }
            --mCount;
            mSlots[mCount].runner = nullptr;
            mSlots[mCount].updating = false;
            return;
        }
    }
}

void AsyncManager::update_all() {
    pl::size i = 0;
    while (i < mCount) {
        Slot &slot = mSlots[i];
        if (!slot.runner || slot.updating) {
            ++i;
            continue;
        }
        async_runner *runner = slot.runner;
        slot.updating = true;
        runner->update();
        // The runner may have unregistered itself (or others) meanwhile, which
        // shifts the later slots down. Resume right after its current slot, or
        // at the same index if it is gone.
        pl::size next = i;
        for (pl::size j = 0; j < mCount; ++j) {
            if (mSlots[j].runner == runner) {
                mSlots[j].updating = false;
                next = j + 1;
                break;
            }
        }
        i = next;
    }
}

bool AsyncManager::has_active_tasks() const {
    for (pl::size i = 0; i < mCount; ++i) {
        if (mSlots[i].runner && mSlots[i].runner->has_active_tasks()) {
            return true;
        }
    }
    return false;
}

pl::size AsyncManager::total_active_tasks() const {
    pl::size total = 0;
    for (pl::size i = 0; i < mCount; ++i) {
        if (mSlots[i].runner) {
            total += mSlots[i].runner->active_task_count();
        }
    }
    return total;
}

void async_run() { AsyncManager::instance().update_all(); }

void async_yield() {
    async_run();
    platforms::yieldMicroseconds(PULSELED_ASYNC_SLICE_US);
}

pl::size async_active_tasks() { return AsyncManager::instance().total_active_tasks(); }

bool async_has_tasks() { return AsyncManager::instance().has_active_tasks(); }

} // namespace pl
