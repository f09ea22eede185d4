#include "transfer/errors.hpp"

namespace transfer {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NOT_FOUND:
            return "not_found";
        case ErrorKind::IO:
            return "io_error";
        case ErrorKind::INTEGRITY:
            return "integrity_error";
        case ErrorKind::METADATA:
            return "metadata_error";
        case ErrorKind::CANCELLED:
            return "cancelled";
    }
    return "unknown";
}

ErrorKind error_kind_from_string(const std::string& name) {
    if(name == "not_found") return ErrorKind::NOT_FOUND;
    if(name == "io_error") return ErrorKind::IO;
    if(name == "integrity_error") return ErrorKind::INTEGRITY;
    if(name == "metadata_error") return ErrorKind::METADATA;
    if(name == "cancelled") return ErrorKind::CANCELLED;
    throw std::invalid_argument("Unknown error kind: " + name);
}

TransferError::TransferError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(to_string(kind)) + ": " + message),
      kind_(kind),
      message_(message) {
}

}
