#include "agentbridge/core/errors.h"

namespace agentbridge {
namespace core {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::ADAPTER_NOT_FOUND: return "AdapterNotFoundError";
        case ErrorCode::TRANSFORM: return "TransformError";
        case ErrorCode::FIDELITY_THRESHOLD: return "FidelityThresholdError";
        case ErrorCode::STORE: return "StoreError";
        case ErrorCode::TIMEOUT: return "TimeoutError";
        case ErrorCode::CACHE: return "CacheError";
    }
    return "BridgeError";
}

ErrorCode parseErrorCode(const std::string& name) {
    for (ErrorCode code : {ErrorCode::ADAPTER_NOT_FOUND, ErrorCode::TRANSFORM, ErrorCode::FIDELITY_THRESHOLD,
                           ErrorCode::STORE, ErrorCode::TIMEOUT, ErrorCode::CACHE}) {
        if (name == errorCodeName(code)) {
            return code;
        }
    }
    throw std::invalid_argument("Unknown error code: " + name);
}

} // namespace core
} // namespace agentbridge
