#pragma once

#include "roundabout/types.hpp"
#include <string>

namespace roundabout {

// Four-dimensional resource amount. Used as a ceiling (budget), as a
// cumulative balance (usage), and as a per-operation estimate.
struct ResourceVector {
    ResourceQuantity llm_calls{0};
    ResourceQuantity compute_units{0};
    ResourceQuantity storage_bytes{0};
    ResourceQuantity execution_time_ms{0};

    ResourceVector& operator+=(const ResourceVector& other) noexcept;
    bool is_zero() const noexcept;
    bool is_non_negative() const noexcept;
};

using ResourceBudget = ResourceVector;
using ResourceUsage = ResourceVector;
using ResourceEstimate = ResourceVector;

ResourceVector operator+(ResourceVector lhs, const ResourceVector& rhs) noexcept;
bool operator==(const ResourceVector& lhs, const ResourceVector& rhs) noexcept;
bool operator!=(const ResourceVector& lhs, const ResourceVector& rhs) noexcept;

// Per-dimension budget minus usage, floored at zero
ResourceVector remaining(const ResourceBudget& budget, const ResourceUsage& usage) noexcept;

// Per-dimension floor(v * ratio)
ResourceVector scaled_floor(const ResourceVector& v, double ratio) noexcept;

// Per-dimension ceil(v * ratio), zero stays zero
ResourceVector scaled_ceil(const ResourceVector& v, double ratio) noexcept;

// True if every dimension of usage is <= the matching budget dimension
bool fits_within(const ResourceUsage& usage, const ResourceBudget& budget) noexcept;

// True if any dimension of usage is > budget * ratio
bool exceeds_fraction(const ResourceUsage& usage, const ResourceBudget& budget,
                      double ratio) noexcept;

// Calls, compute and storage strictly below budget. Execution time is
// governed by the wall-clock rule instead.
bool has_remaining(const ResourceUsage& usage, const ResourceBudget& budget) noexcept;

std::string to_string(const ResourceVector& v);

} // namespace roundabout
