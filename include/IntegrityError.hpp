// === include/IntegrityError.hpp ===
#pragma once
#include <stdexcept>
#include <string>
#include <vector>

enum class ErrorKind {
    None = 0,
    RootPathNotFound,   // fatal
    StoreAlreadyExists, // fatal unless overwrite
    StoreNotFound,      // fatal
    SchemaMismatch,     // fatal
    FileUnreadable,     // soft
    RemoteLookupFailed, // soft
    StoreWriteFailed,   // fatal
    StoreReadFailed,    // fatal
    InvalidConfig       // fatal
};

const char* error_kind_name(ErrorKind kind);

// Fatal condition raised inside scanner/store code; converted to a result
// status at the operation boundary.
class IntegrityError : public std::runtime_error {
public:
    IntegrityError(ErrorKind kind, const std::string& msg)
        : std::runtime_error(msg), kind_(kind) {}
    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Soft failure: accumulated next to the primary result
struct Warning {
    ErrorKind   kind{ErrorKind::None};
    std::string subject; // path or hex digest
    std::string message;
};

// Common status part of every operation result
struct OperationStatus {
    bool ok = false;
    ErrorKind error_kind = ErrorKind::None;
    std::string error;
    std::vector<Warning> warnings;

    void fail(ErrorKind kind, const std::string& msg) {
        ok = false;
        error_kind = kind;
        error = msg;
    }
};
