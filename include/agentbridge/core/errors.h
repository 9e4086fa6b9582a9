#pragma once

#include <stdexcept>
#include <string>

namespace agentbridge {
namespace core {

/**
 * @brief Categories of failures surfaced by the bridge
 *
 * The category decides how a failure propagates: AdapterNotFound and Store
 * abort an operation, the others are reported inside a response.
 */
enum class ErrorCode {
    ADAPTER_NOT_FOUND,   ///< Protocol not registered or disabled (fatal, not retried)
    TRANSFORM,           ///< Malformed or incomplete native/canonical input
    FIDELITY_THRESHOLD,  ///< Data-quality rejection, nothing persisted
    STORE,               ///< Version conflict or persistence failure
    TIMEOUT,             ///< Adapter stage exceeded its deadline (retryable)
    CACHE                ///< Cache failure, degrades to a miss
};

/**
 * @brief Name of the error class for a category, e.g. "FidelityThresholdError"
 */
const char* errorCodeName(ErrorCode code);

/**
 * @brief Inverse of errorCodeName()
 * @throws std::invalid_argument for an unknown name
 */
ErrorCode parseErrorCode(const std::string& name);

/**
 * @brief Base exception for all bridge failures
 */
class BridgeError : public std::runtime_error {
public:
    BridgeError(ErrorCode code, const std::string& message)
        : std::runtime_error(message), code_(code) {}

    ErrorCode code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

class AdapterNotFoundError : public BridgeError {
public:
    explicit AdapterNotFoundError(const std::string& protocolId)
        : BridgeError(ErrorCode::ADAPTER_NOT_FOUND,
                      "No enabled adapter registered for protocol: " + protocolId),
          protocolId_(protocolId) {}

    const std::string& protocolId() const noexcept { return protocolId_; }

private:
    std::string protocolId_;
};

class TransformError : public BridgeError {
public:
    explicit TransformError(const std::string& message)
        : BridgeError(ErrorCode::TRANSFORM, message) {}
};

class FidelityThresholdError : public BridgeError {
public:
    FidelityThresholdError(double fidelity, double minimum)
        : BridgeError(ErrorCode::FIDELITY_THRESHOLD,
                      "Fidelity " + std::to_string(fidelity) +
                      " is below the required minimum " + std::to_string(minimum)),
          fidelity_(fidelity), minimum_(minimum) {}

    double fidelity() const noexcept { return fidelity_; }
    double minimum() const noexcept { return minimum_; }

private:
    double fidelity_;
    double minimum_;
};

enum class StoreErrorKind {
    VERSION_CONFLICT,
    PERSISTENCE,
    INTEGRITY
};

class StoreError : public BridgeError {
public:
    StoreError(StoreErrorKind kind, const std::string& message)
        : BridgeError(ErrorCode::STORE, message), kind_(kind) {}

    StoreErrorKind kind() const noexcept { return kind_; }

private:
    StoreErrorKind kind_;
};

class TimeoutError : public BridgeError {
public:
    explicit TimeoutError(const std::string& message)
        : BridgeError(ErrorCode::TIMEOUT, message) {}
};

class CacheError : public BridgeError {
public:
    explicit CacheError(const std::string& message)
        : BridgeError(ErrorCode::CACHE, message) {}
};

} // namespace core
} // namespace agentbridge
