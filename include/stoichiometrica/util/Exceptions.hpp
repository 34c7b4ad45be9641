/// @file Exceptions.hpp
/// @brief Exception types carrying an ErrorCode
/// @details Validation problems and balancing failures are reported by
/// throwing; the numeric code stays available for callers that map
/// exceptions back to status codes.

#pragma once

#include "stoichiometrica/util/ErrorCodes.hpp"
#include <stdexcept>
#include <string>

namespace Stoichiometrica {

/// @brief Base class for all library errors
class StoichiometricaError : public std::runtime_error {
public:
    StoichiometricaError(int code, const std::string& detail)
        : std::runtime_error(composeMessage(code, detail)), code_(code) {}

    /// @brief Error code from ErrorCode namespace
    int code() const noexcept { return code_; }

private:
    static std::string composeMessage(int code, const std::string& detail) {
        std::string message = ErrorCode::getMessage(code);
        if (!detail.empty()) {
            message += ": " + detail;
        }
        return message;
    }

    int code_;
};

/// @brief Bad input: coefficients, formulas, equation strings
class ValidationError : public StoichiometricaError {
public:
    using StoichiometricaError::StoichiometricaError;
};

/// @brief The equation cannot be balanced
class BalancingError : public StoichiometricaError {
public:
    using StoichiometricaError::StoichiometricaError;
};

} // namespace Stoichiometrica
