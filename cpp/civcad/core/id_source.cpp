#include "civcad/core/id_source.h"

namespace civcad {

SequentialIdSource::SequentialIdSource(std::uint32_t first)
    : next_(first == 0 ? 1 : first) {}

std::uint32_t SequentialIdSource::next() {
    return next_++;
}

void SequentialIdSource::reset(std::uint32_t first) {
    next_ = first == 0 ? 1 : first;
}

} // namespace civcad
