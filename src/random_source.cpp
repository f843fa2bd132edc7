#include "roundabout/random_source.hpp"

namespace roundabout {

SeededRandomSource::SeededRandomSource(std::uint64_t seed)
    : engine_(seed) {}

double SeededRandomSource::next_unit() {
    std::lock_guard<std::mutex> lock(mutex_);
    return dist_(engine_);
}

} // namespace roundabout
