#pragma once

#include <cstdint>

namespace civcad {

// Source of fresh identifiers for entities, layers, blocks and viewports.
// Injected so that tests and replays stay deterministic.
class IdSource {
public:
    virtual ~IdSource() = default;
    virtual std::uint32_t next() = 0;
};

class SequentialIdSource final : public IdSource {
public:
    explicit SequentialIdSource(std::uint32_t first = 1);

    std::uint32_t next() override;
    std::uint32_t peek() const noexcept { return next_; }
    void reset(std::uint32_t first = 1);

private:
    std::uint32_t next_;
};

} // namespace civcad
