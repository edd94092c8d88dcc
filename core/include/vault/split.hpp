#pragma once

#include <cstdint>

namespace vault {

/**
 * Two-way partition of an amount. `primary + secondary` always equals
 * the amount that was split; the secondary share absorbs the rounding
 * remainder.
 */
struct Split {
    uint64_t primary = 0;
    uint64_t secondary = 0;
};

/// Addition that throws ArithmeticOverflow instead of wrapping.
uint64_t checked_add(uint64_t a, uint64_t b);

/// Subtraction that throws ArithmeticOverflow on underflow.
uint64_t checked_sub(uint64_t a, uint64_t b);

/// Multiplication that throws ArithmeticOverflow instead of wrapping.
uint64_t checked_mul(uint64_t a, uint64_t b);

/**
 * Split `amount` so that `primary = floor(amount * primary_percent / 100)`
 * and `secondary = amount - primary`.
 *
 * @throws SettlementError InvalidInput if primary_percent > 100,
 *         ArithmeticOverflow if amount * primary_percent overflows,
 *         SplitInvariantViolated if the shares do not sum to amount.
 */
Split split(uint64_t amount, uint32_t primary_percent);

/// Convenience for `split(amount, percent).primary`.
uint64_t percent_of(uint64_t amount, uint32_t percent);

} // namespace vault
