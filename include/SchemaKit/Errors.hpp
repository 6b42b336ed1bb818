#pragma once

#include <stdexcept>
#include <string>

namespace SchemaKit {

/// The source document could not be fetched, parsed or understood.
class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A declared type deliberately not handled by the current options.
class UnsupportedError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A $ref could not be resolved (missing document, bad pointer, external URI).
class ReferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A $ref was reached again while its own target was still being inlined.
class CyclicReferenceError : public ReferenceError {
public:
    using ReferenceError::ReferenceError;
};

} // namespace SchemaKit
