#include "roundabout/resource_budget.hpp"

#include <algorithm>
#include <cmath>

namespace roundabout {

namespace {

// Absorbs representation error of ratios such as 0.3 so that 10 * 0.3 floors to 3
constexpr double kRoundingSlack = 1e-9;

ResourceQuantity floor_mul(ResourceQuantity q, double ratio) {
    return static_cast<ResourceQuantity>(
        std::floor(static_cast<double>(q) * ratio + kRoundingSlack));
}

ResourceQuantity ceil_mul(ResourceQuantity q, double ratio) {
    return static_cast<ResourceQuantity>(
        std::ceil(static_cast<double>(q) * ratio - kRoundingSlack));
}

bool over(ResourceQuantity used, ResourceQuantity limit, double ratio) {
    return static_cast<double>(used) > static_cast<double>(limit) * ratio + kRoundingSlack;
}

} // anonymous namespace

ResourceVector& ResourceVector::operator+=(const ResourceVector& other) noexcept {
    llm_calls += other.llm_calls;
    compute_units += other.compute_units;
    storage_bytes += other.storage_bytes;
    execution_time_ms += other.execution_time_ms;
    return *this;
}

bool ResourceVector::is_zero() const noexcept {
    return llm_calls == 0 && compute_units == 0 &&
           storage_bytes == 0 && execution_time_ms == 0;
}

bool ResourceVector::is_non_negative() const noexcept {
    return llm_calls >= 0 && compute_units >= 0 &&
           storage_bytes >= 0 && execution_time_ms >= 0;
}

ResourceVector operator+(ResourceVector lhs, const ResourceVector& rhs) noexcept {
    lhs += rhs;
    return lhs;
}

bool operator==(const ResourceVector& lhs, const ResourceVector& rhs) noexcept {
    return lhs.llm_calls == rhs.llm_calls &&
           lhs.compute_units == rhs.compute_units &&
           lhs.storage_bytes == rhs.storage_bytes &&
           lhs.execution_time_ms == rhs.execution_time_ms;
}

bool operator!=(const ResourceVector& lhs, const ResourceVector& rhs) noexcept {
    return !(lhs == rhs);
}

ResourceVector remaining(const ResourceBudget& budget, const ResourceUsage& usage) noexcept {
    ResourceVector r;
    r.llm_calls = std::max<ResourceQuantity>(0, budget.llm_calls - usage.llm_calls);
    r.compute_units = std::max<ResourceQuantity>(0, budget.compute_units - usage.compute_units);
    r.storage_bytes = std::max<ResourceQuantity>(0, budget.storage_bytes - usage.storage_bytes);
    r.execution_time_ms =
        std::max<ResourceQuantity>(0, budget.execution_time_ms - usage.execution_time_ms);
    return r;
}

ResourceVector scaled_floor(const ResourceVector& v, double ratio) noexcept {
    return {floor_mul(v.llm_calls, ratio),
            floor_mul(v.compute_units, ratio),
            floor_mul(v.storage_bytes, ratio),
            floor_mul(v.execution_time_ms, ratio)};
}

ResourceVector scaled_ceil(const ResourceVector& v, double ratio) noexcept {
    return {ceil_mul(v.llm_calls, ratio),
            ceil_mul(v.compute_units, ratio),
            ceil_mul(v.storage_bytes, ratio),
            ceil_mul(v.execution_time_ms, ratio)};
}

bool fits_within(const ResourceUsage& usage, const ResourceBudget& budget) noexcept {
    return usage.llm_calls <= budget.llm_calls &&
           usage.compute_units <= budget.compute_units &&
           usage.storage_bytes <= budget.storage_bytes &&
           usage.execution_time_ms <= budget.execution_time_ms;
}

bool exceeds_fraction(const ResourceUsage& usage, const ResourceBudget& budget,
                      double ratio) noexcept {
    return over(usage.llm_calls, budget.llm_calls, ratio) ||
           over(usage.compute_units, budget.compute_units, ratio) ||
           over(usage.storage_bytes, budget.storage_bytes, ratio) ||
           over(usage.execution_time_ms, budget.execution_time_ms, ratio);
}

bool has_remaining(const ResourceUsage& usage, const ResourceBudget& budget) noexcept {
    return usage.llm_calls < budget.llm_calls &&
           usage.compute_units < budget.compute_units &&
           usage.storage_bytes < budget.storage_bytes;
}

std::string to_string(const ResourceVector& v) {
    return "{calls=" + std::to_string(v.llm_calls) +
           ", compute=" + std::to_string(v.compute_units) +
           ", storage=" + std::to_string(v.storage_bytes) +
           ", time_ms=" + std::to_string(v.execution_time_ms) + "}";
}

} // namespace roundabout
