/**
 * Copyright (c) 2026 sjson contributors - SJSON binary node codec
 */
#pragma once

#include <stdexcept>
#include <string>

namespace sjson {
enum class ErrorKind {
    UnknownShape,
    InvalidField,
    InvalidBooleanValue,
    InvalidNumberCharacter,
    InvalidBCDNybble,
    InvalidNumberLiteral,
    CannotDecodeString,
    DecodeLengthMismatch,
    IndexOutOfRange,
};

const char* error_kind_name(ErrorKind kind);

// Every encode/decode failure. Nothing is retried or corrected in place.
class CodecError : public std::runtime_error {
   public:
    CodecError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

   private:
    ErrorKind kind_;
};
}  // namespace sjson
