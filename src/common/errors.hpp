#pragma once
#include <stdexcept>
#include <string>

namespace shardcat {

    enum class ErrorKind : int {
        Runtime = 0,          // anything not covered below
        SchemaMismatch,       // file column sets disagree
        ColumnMismatch,       // concatenation inputs have different columns
        ColumnNotFound,
        UnsupportedLayout,    // codec: file readable but not in a supported layout
        Corrupt,              // codec: file truncated or inconsistent
        NotFound,             // codec: file or group missing
        InvalidMode,          // bad open-mode string
        CommunicatorMismatch, // stores bound to different process groups
        IOFailure             // directory creation or file write failed
    };

    const char* error_kind_name(ErrorKind kind);
    ErrorKind error_kind_from_name(const std::string& name);

    class CatalogError : public std::runtime_error {
    public:
        CatalogError(ErrorKind kind, const std::string& msg)
            : std::runtime_error(msg), kind_(kind) {}
        ErrorKind kind() const noexcept { return kind_; }
    private:
        ErrorKind kind_;
    };

    struct SchemaMismatch : CatalogError {
        explicit SchemaMismatch(const std::string& m) : CatalogError(ErrorKind::SchemaMismatch, m) {}
    };
    struct ColumnMismatch : CatalogError {
        explicit ColumnMismatch(const std::string& m) : CatalogError(ErrorKind::ColumnMismatch, m) {}
    };
    struct ColumnNotFound : CatalogError {
        explicit ColumnNotFound(const std::string& m) : CatalogError(ErrorKind::ColumnNotFound, m) {}
    };
    struct UnsupportedLayout : CatalogError {
        explicit UnsupportedLayout(const std::string& m) : CatalogError(ErrorKind::UnsupportedLayout, m) {}
    };
    struct Corrupt : CatalogError {
        explicit Corrupt(const std::string& m) : CatalogError(ErrorKind::Corrupt, m) {}
    };
    struct NotFound : CatalogError {
        explicit NotFound(const std::string& m) : CatalogError(ErrorKind::NotFound, m) {}
    };
    struct InvalidMode : CatalogError {
        explicit InvalidMode(const std::string& m) : CatalogError(ErrorKind::InvalidMode, m) {}
    };
    struct CommunicatorMismatch : CatalogError {
        explicit CommunicatorMismatch(const std::string& m) : CatalogError(ErrorKind::CommunicatorMismatch, m) {}
    };
    struct IOFailure : CatalogError {
        explicit IOFailure(const std::string& m) : CatalogError(ErrorKind::IOFailure, m) {}
    };

    // Throw the exception type matching 'kind'. Used to re-raise an error that was
    // detected on one rank and broadcast to the others.
    [[noreturn]] void raise(ErrorKind kind, const std::string& msg);

} // namespace shardcat
