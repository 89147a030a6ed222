#pragma once
#include <stdexcept>
#include <string>

namespace fdk {

class FdkError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A codec could not convert between bytes and the requested type.
/// Carries the codec's own message, unmodified.
class CoercionError : public FdkError {
public:
    using FdkError::FdkError;
};

class ConfigError : public FdkError {
public:
    using FdkError::FdkError;
};

class TransportError : public FdkError {
public:
    using FdkError::FdkError;
};

/// Thrown by function handlers to fail the current call.
class FunctionError : public FdkError {
public:
    using FdkError::FdkError;
};

} // namespace fdk
