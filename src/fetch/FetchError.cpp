#include "egress/fetch/FetchError.h"

namespace egress {

const char* FetchError::KindName(Kind kind) {
    switch (kind) {
        case Kind::kDisposed: return "Disposed";
        case Kind::kAddressBlocked: return "AddressBlocked";
        case Kind::kAdmissionLimit: return "AdmissionLimit";
        case Kind::kContentLengthExceeded: return "ContentLengthExceeded";
        case Kind::kTransportFailure: return "TransportFailure";
        case Kind::kInvalidArgument: return "InvalidArgument";
        case Kind::kResponseFormat: return "ResponseFormat";
    }
    return "Unknown";
}

} // namespace egress
