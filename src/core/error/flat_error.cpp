#include "flat_error.h"

#include <iomanip>
#include <sstream>

#include "type_name.h"
#include "../logging/logger.h"

namespace flat::core::error {

FlatError::FlatError(std::string_view original_type_name,
                     std::string message,
                     std::unique_ptr<FlatError> source)
    : original_type_name_(original_type_name)
    , message_(std::move(message))
    , source_(std::move(source)) {
}

FlatError::FlatError(const FlatError& other)
    : std::exception(other)
    , ErrorSource(other)
    , original_type_name_(other.original_type_name_)
    , message_(other.message_)
    , source_(other.source_ ? std::make_unique<FlatError>(*other.source_) : nullptr) {
}

FlatError& FlatError::operator=(const FlatError& other) {
    if (this != &other) {
        FlatError copy(other);
        *this = std::move(copy);
    }
    return *this;
}

FlatError FlatError::from_any(const std::exception& error) {
    // Rebuilt rather than copied: a FlatError rethrown with
    // std::throw_with_nested carries its cause outside the FlatError subobject.
    if (const auto* flat = dynamic_cast<const FlatError*>(&error)) {
        return FlatError(flat->original_type_name_, flat->message_, capture_source(error));
    }

    return FlatError(type_name(typeid(error)), error.what(), capture_source(error));
}

FlatError FlatError::from_exception_ptr(std::exception_ptr eptr) {
    if (!eptr) {
        return FlatError(config::UNKNOWN_TYPE_LABEL, config::UNKNOWN_EXCEPTION_MESSAGE, nullptr);
    }

    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        return from_any(e);
    } catch (...) {
        FLAT_LOG_DEBUG(logging::library_logger(),
                       "flattening exception payload not derived from std::exception");
        return FlatError(config::UNKNOWN_TYPE_LABEL, config::UNKNOWN_EXCEPTION_MESSAGE, nullptr);
    }
}

std::unique_ptr<FlatError> FlatError::capture_source(const std::exception& error) {
    std::unique_ptr<FlatError> source;

    const SourceKind kind = with_source(error, [&source](const std::exception& cause) {
        source = std::make_unique<FlatError>(from_any(cause));
    });

    if (kind == SourceKind::Foreign) {
        FLAT_LOG_DEBUG(logging::library_logger(),
                       "source of '{}' is not derived from std::exception", error.what());
        source = std::make_unique<FlatError>(FlatError(
            config::UNKNOWN_TYPE_LABEL, config::UNKNOWN_NESTED_MESSAGE, nullptr));
    }

    return source;
}

std::string FlatError::describe() const {
    std::ostringstream oss;
    oss << "FlatError { original_type_name: " << std::quoted(std::string(original_type_name_))
        << ", message: " << std::quoted(message_)
        << ", source: ";
    if (source_) {
        oss << "Some(" << source_->describe() << ")";
    } else {
        oss << "None";
    }
    oss << " }";
    return oss.str();
}

bool operator==(const FlatError& lhs, const FlatError& rhs) noexcept {
    const FlatError* a = &lhs;
    const FlatError* b = &rhs;

    while (a && b) {
        if (a->original_type_name_ != b->original_type_name_ ||
            a->message_ != b->message_) {
            return false;
        }
        a = a->flat_source();
        b = b->flat_source();
    }

    return a == b;
}

} // namespace flat::core::error
