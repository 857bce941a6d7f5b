#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace civcad {

enum class KernelError : std::uint32_t {
    Ok = 0,
    EntityNotFound = 1,
    UnknownBlock = 2,
    InvalidHatchSource = 3,
};

const char* kernelErrorName(KernelError error) noexcept;

// Thrown for caller bugs only: commands built against missing ids, unknown block names.
// Degenerate geometry never throws.
class KernelException : public std::runtime_error {
public:
    KernelException(KernelError code, const std::string& message);

    KernelError code() const noexcept { return code_; }

private:
    KernelError code_;
};

} // namespace civcad
