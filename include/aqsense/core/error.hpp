// Copyright (c) 2025 Michael Smith
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>
#include <string>

#include "types.hpp"

namespace aqsense {

/**
 * @brief Base class for every error raised by aqsense
 *
 * Carries an ErrorKind so callers can branch on the category without
 * catching each concrete type. The message is prefixed with the kind name.
 */
class Error : public std::runtime_error {
public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_string(kind)) + ": " + message),
          kind_(kind),
          message_(message) {}

    ErrorKind kind() const noexcept { return kind_; }

    /// Message without the kind prefix
    const std::string& message() const noexcept { return message_; }

private:
    ErrorKind kind_;
    std::string message_;
};

/// Malformed static description (bit mask, byte index, names, lookup table)
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& message) : Error(ErrorKind::configuration, message) {}
};

/// Write argument outside its documented set, or unknown field name
class ValidationError : public Error {
public:
    explicit ValidationError(const std::string& message) : Error(ErrorKind::validation, message) {}
};

/// Raw bytes could not be decoded, or a value could not be encoded
class CodecError : public Error {
public:
    explicit CodecError(const std::string& message) : Error(ErrorKind::codec, message) {}
};

/// Bus NACK, timeout, short read or integrity check failure
class TransportError : public Error {
public:
    explicit TransportError(const std::string& message) : Error(ErrorKind::transport, message) {}
};

/// Write on a read-only register, read on a write-only register, wrong mode
class UnsupportedOperation : public Error {
public:
    explicit UnsupportedOperation(const std::string& message)
        : Error(ErrorKind::unsupported_operation, message) {}
};

/// Device answered but reported a failure
class DeviceError : public Error {
public:
    explicit DeviceError(const std::string& message) : Error(ErrorKind::device, message) {}
};

} // namespace aqsense
