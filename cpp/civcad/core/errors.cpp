#include "civcad/core/errors.h"

namespace civcad {

const char* kernelErrorName(KernelError error) noexcept {
    switch (error) {
        case KernelError::Ok: return "Ok";
        case KernelError::EntityNotFound: return "EntityNotFound";
        case KernelError::UnknownBlock: return "UnknownBlock";
        case KernelError::InvalidHatchSource: return "InvalidHatchSource";
    }
    return "Unknown";
}

KernelException::KernelException(KernelError code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

} // namespace civcad
