#include "vault/split.hpp"
#include "vault/errors.hpp"
#include <limits>
#include <string>

namespace vault {

uint64_t checked_add(uint64_t a, uint64_t b) {
    if (a > std::numeric_limits<uint64_t>::max() - b) {
        throw SettlementError::overflow("addition overflow: " + std::to_string(a) + " + " +
                                        std::to_string(b));
    }
    return a + b;
}

uint64_t checked_sub(uint64_t a, uint64_t b) {
    if (b > a) {
        throw SettlementError::overflow("subtraction underflow: " + std::to_string(a) + " - " +
                                        std::to_string(b));
    }
    return a - b;
}

uint64_t checked_mul(uint64_t a, uint64_t b) {
    if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
        throw SettlementError::overflow("multiplication overflow: " + std::to_string(a) + " * " +
                                        std::to_string(b));
    }
    return a * b;
}

Split split(uint64_t amount, uint32_t primary_percent) {
    if (primary_percent > 100) {
        throw SettlementError::invalid_input("split percent must be <= 100, got " +
                                             std::to_string(primary_percent));
    }

    Split result;
    result.primary = checked_mul(amount, primary_percent) / 100;
    result.secondary = checked_sub(amount, result.primary);

    if (checked_add(result.primary, result.secondary) != amount) {
        throw SettlementError(ErrorCode::SplitInvariantViolated,
                              "split shares do not sum to " + std::to_string(amount));
    }
    return result;
}

uint64_t percent_of(uint64_t amount, uint32_t percent) {
    return split(amount, percent).primary;
}

} // namespace vault
