#include "nullsafe/core/failures.hpp"
#include "nullsafe/core/constants.hpp"

namespace nullsafe {

std::string_view FailureTypeName(const FailureType type) noexcept {
    switch (type) {
        case FailureType::IllegalArgument:
            return "IllegalArgument";
        case FailureType::IllegalState:
            return "IllegalState";
        case FailureType::NullReference:
            return "NullReference";
        case FailureType::Construction:
            return "Construction";
    }
    return "Unknown";
}

NullsafeError::NullsafeError(const FailureType type, const std::string& message)
    : std::runtime_error(message)
    , type_(type) {}

IllegalArgumentError::IllegalArgumentError()
    : IllegalArgumentError(std::string(ErrorMessages::ILLEGAL_ARGUMENT)) {}

IllegalArgumentError::IllegalArgumentError(const std::string& message)
    : NullsafeError(FailureType::IllegalArgument, message) {}

IllegalStateError::IllegalStateError()
    : IllegalStateError(std::string(ErrorMessages::ILLEGAL_STATE)) {}

IllegalStateError::IllegalStateError(const std::string& message)
    : NullsafeError(FailureType::IllegalState, message) {}

NullReferenceError::NullReferenceError()
    : NullReferenceError(std::string(ErrorMessages::NULL_REFERENCE)) {}

NullReferenceError::NullReferenceError(const std::string& message)
    : NullsafeError(FailureType::NullReference, message) {}

ConstructionFailure::ConstructionFailure()
    : ConstructionFailure(std::string(ErrorMessages::CONSTRUCTION_FAILED)) {}

ConstructionFailure::ConstructionFailure(const std::string& message)
    : NullsafeError(FailureType::Construction, message) {}

} // namespace nullsafe
