#pragma once

#include <stdexcept>
#include <string>

namespace sep39 {

enum class ErrorKind {
    PayloadTooLarge,
    InvalidDescriptor,
    MissingSizeParameter,
    MalformedMetadata,
    InvalidFrame,
    InvalidLength,
    TruncatedMetadata,
    AttachmentCountMismatch,
    ChecksumMismatch,
    InvalidEncoding,
};

const char* ErrorKindName(ErrorKind kind);

// Every encode/decode validation failure. Nothing is retried or partially
// returned once one of these is thrown.
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message);

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace sep39
