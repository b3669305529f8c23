#pragma once

#include <stdexcept>
#include <string>

namespace docprint {

/// Base class for fatal rendering failures.
/// Thrown inside the engine; render() converts it to a RenderError.
class RenderException : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Invalid page geometry or layout parameters (e.g. non-positive width).
class ConfigurationError : public RenderException {
public:
    using RenderException::RenderException;
};

/// The document tree does not have the expected shape.
class InvalidDocumentError : public RenderException {
public:
    using RenderException::RenderException;
};

enum class RenderErrorKind {
    Configuration,
    InvalidDocument,
};

/// Error value surfaced at the render() boundary
struct RenderError {
    RenderErrorKind kind = RenderErrorKind::Configuration;
    std::string message;
};

} // namespace docprint
