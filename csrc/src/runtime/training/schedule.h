// Copyright (c) 2026, Invergent SA, developed by Flavius Burca
// Copyright (c) 2025, IST Austria, developed by Erik Schultheis
// SPDX-License-Identifier: Apache-2.0
//

#ifndef SPECTRON_SRC_RUNTIME_TRAINING_SCHEDULE_H
#define SPECTRON_SRC_RUNTIME_TRAINING_SCHEDULE_H

#include <algorithm> // std::clamp
#include <stdexcept>

#include <fmt/core.h>

/**
 * @brief Interface for scalar schedules evaluated per training step.
 *
 * A schedule maps an integer step index (typically starting at 0) to a float
 * value (e.g., a learning-rate multiplier).
 */
class ISchedule {
public:
    /** @brief Virtual destructor. */
    virtual ~ISchedule() = default;

    /**
     * @brief Evaluate the schedule at a given step.
     * @param step Current step index (typically >= 0).
     * @return Scheduled value for the given step.
     */
    virtual float eval(int step) const = 0;
};

/**
 * @brief Stable phase followed by a linear cooldown to a floor.
 *
 * Behavior:
 * - While step / total < 1 - cooldown: returns 1.
 * - Afterwards: w + (1 - w) * floor, with w = (1 - step / total) / cooldown.
 */
class StableDecaySchedule : public ISchedule {
public:
    /**
     * @param total_steps Total number of training steps.
     * @param cooldown_frac Fraction of the run spent in cooldown, in (0, 1].
     * @param floor Multiplier reached at the end of training.
     * @throws std::invalid_argument For a non-positive step count or a cooldown outside (0, 1].
     */
    StableDecaySchedule(int total_steps, float cooldown_frac, float floor)
        : mTotalSteps(total_steps), mCooldownFrac(cooldown_frac), mFloor(floor) {
        if (total_steps <= 0) {
            throw std::invalid_argument(fmt::format("StableDecaySchedule: total steps must be positive, got {}", total_steps));
        }
        if (!(cooldown_frac > 0.f && cooldown_frac <= 1.f)) {
            throw std::invalid_argument(fmt::format("StableDecaySchedule: cooldown fraction must be in (0, 1], got {}", cooldown_frac));
        }
    }

    float eval(int step) const override {
        double x = (double)step / mTotalSteps;
        if (x < 1.0 - mCooldownFrac) {
            return 1.f;
        }
        double w = (1.0 - x) / mCooldownFrac;
        return static_cast<float>(w + (1.0 - w) * mFloor);
    }

private:
    int mTotalSteps;
    float mCooldownFrac;
    float mFloor;
};

/**
 * @brief Linear warmup from @p start to @p end over a fixed number of steps, constant afterwards.
 */
class MomentumWarmupSchedule : public ISchedule {
public:
    MomentumWarmupSchedule(int warmup_steps, float start, float end)
        : mWarmupSteps(warmup_steps), mStart(start), mEnd(end) {
        if (warmup_steps < 0) {
            throw std::invalid_argument(fmt::format("MomentumWarmupSchedule: negative warmup {}", warmup_steps));
        }
    }

    float eval(int step) const override {
        if (mWarmupSteps == 0) {
            return mEnd;
        }
        double frac = std::clamp((double)step / mWarmupSteps, 0.0, 1.0);
        return static_cast<float>((1.0 - frac) * mStart + frac * mEnd);
    }

private:
    int mWarmupSteps;
    float mStart;
    float mEnd;
};

#endif //SPECTRON_SRC_RUNTIME_TRAINING_SCHEDULE_H
