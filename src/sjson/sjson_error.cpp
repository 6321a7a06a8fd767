/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#include "sjson/sjson_error.h"

namespace sjson {
const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::UnknownShape:
            return "UnknownShape";
        case ErrorKind::InvalidField:
            return "InvalidField";
        case ErrorKind::InvalidBooleanValue:
            return "InvalidBooleanValue";
        case ErrorKind::InvalidNumberCharacter:
            return "InvalidNumberCharacter";
        case ErrorKind::InvalidBCDNybble:
            return "InvalidBCDNybble";
        case ErrorKind::InvalidNumberLiteral:
            return "InvalidNumberLiteral";
        case ErrorKind::CannotDecodeString:
            return "CannotDecodeString";
        case ErrorKind::DecodeLengthMismatch:
            return "DecodeLengthMismatch";
        case ErrorKind::IndexOutOfRange:
            return "IndexOutOfRange";
    }
    return "Unknown";
}

CodecError::CodecError(ErrorKind kind, const std::string& message)
    : std::runtime_error(std::string(error_kind_name(kind)) + ": " + message), kind_(kind) {}
}  // namespace sjson
