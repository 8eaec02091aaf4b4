#include "sep39/errors.hpp"

namespace sep39 {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::PayloadTooLarge:
            return "PayloadTooLarge";
        case ErrorKind::InvalidDescriptor:
            return "InvalidDescriptor";
        case ErrorKind::MissingSizeParameter:
            return "MissingSizeParameter";
        case ErrorKind::MalformedMetadata:
            return "MalformedMetadata";
        case ErrorKind::InvalidFrame:
            return "InvalidFrame";
        case ErrorKind::InvalidLength:
            return "InvalidLength";
        case ErrorKind::TruncatedMetadata:
            return "TruncatedMetadata";
        case ErrorKind::AttachmentCountMismatch:
            return "AttachmentCountMismatch";
        case ErrorKind::ChecksumMismatch:
            return "ChecksumMismatch";
        case ErrorKind::InvalidEncoding:
            return "InvalidEncoding";
    }
    return "Unknown";
}

Error::Error(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(ErrorKindName(kind)) + ": " + message), kind_(kind) {}

}  // namespace sep39
