#pragma once

#include <stdexcept>
#include <string>

namespace pdf_outline {

class OutlineError : public std::runtime_error {
public:
    explicit OutlineError(const std::string& message) : std::runtime_error(message) {}
};

// A page (or the whole file) could not be decoded
class MalformedDocumentError : public OutlineError {
public:
    explicit MalformedDocumentError(const std::string& message, int page = -1)
        : OutlineError(message), page_(page) {}

    int page() const { return page_; }

private:
    int page_;
};

// Password protected, or nothing extractable
class UnsupportedDocumentError : public OutlineError {
public:
    using OutlineError::OutlineError;
};

class ResourceExceededError : public OutlineError {
public:
    using OutlineError::OutlineError;
};

// Raised when a pipeline stage receives data it should never see
class InvariantViolation : public OutlineError {
public:
    using OutlineError::OutlineError;
};

} // namespace pdf_outline
