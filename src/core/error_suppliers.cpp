#include "nullsafe/core/error_suppliers.hpp"

namespace nullsafe {

const ErrorSupplier<IllegalArgumentError>& ErrorSuppliers::IllegalArgument() {
    static const ErrorSupplier<IllegalArgumentError> supplier = []() {
        return IllegalArgumentError();
    };
    return supplier;
}

const ErrorSupplier<IllegalStateError>& ErrorSuppliers::IllegalState() {
    static const ErrorSupplier<IllegalStateError> supplier = []() {
        return IllegalStateError();
    };
    return supplier;
}

const ErrorSupplier<NullReferenceError>& ErrorSuppliers::NullReference() {
    static const ErrorSupplier<NullReferenceError> supplier = []() {
        return NullReferenceError();
    };
    return supplier;
}

ErrorSupplier<IllegalArgumentError> ErrorSuppliers::IllegalArgument(std::string message) {
    return [message = std::move(message)]() {
        return IllegalArgumentError(message);
    };
}

ErrorSupplier<IllegalStateError> ErrorSuppliers::IllegalState(std::string message) {
    return [message = std::move(message)]() {
        return IllegalStateError(message);
    };
}

ErrorSupplier<NullReferenceError> ErrorSuppliers::NullReference(std::string message) {
    return [message = std::move(message)]() {
        return NullReferenceError(message);
    };
}

} // namespace nullsafe
