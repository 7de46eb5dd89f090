#pragma once

#include <stdexcept>
#include <string>

namespace clausetree {
    // Terminal failures of a single document extraction.
    enum class ErrorKind {
        NotFound,
        PermissionDenied,
        MalformedInput,
        EmptyExtraction,
        NoStructureDetected
    };

    inline const char *ErrorKindName(const ErrorKind kind) noexcept {
        switch (kind) {
            case ErrorKind::NotFound:
                return "NotFound";
            case ErrorKind::PermissionDenied:
                return "PermissionDenied";
            case ErrorKind::MalformedInput:
                return "MalformedInput";
            case ErrorKind::EmptyExtraction:
                return "EmptyExtraction";
            case ErrorKind::NoStructureDetected:
                return "NoStructureDetected";
        }
        return "Unknown";
    }

    class ExtractionError : public std::runtime_error {
    public:
        ExtractionError(const ErrorKind kind, const std::string &message)
            : std::runtime_error(message), kind_(kind) {
        }

        [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

    private:
        ErrorKind kind_;
    };

    // Raised when the caller's cancel flag was set while pages were read.
    class ExtractionCancelled : public std::runtime_error {
    public:
        ExtractionCancelled() : std::runtime_error("Extraction cancelled.") {
        }
    };
} // namespace clausetree
