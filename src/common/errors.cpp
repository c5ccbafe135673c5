#include "common/errors.hpp"

namespace shardcat {

    static const char* const kKindNames[] = {
        "Runtime",
        "SchemaMismatch",
        "ColumnMismatch",
        "ColumnNotFound",
        "UnsupportedLayout",
        "Corrupt",
        "NotFound",
        "InvalidMode",
        "CommunicatorMismatch",
        "IOFailure"
    };

    const char* error_kind_name(ErrorKind kind) {
        const int k = static_cast<int>(kind);
        if (k < 0 || k >= (int)(sizeof(kKindNames) / sizeof(kKindNames[0]))) return kKindNames[0];
        return kKindNames[k];
    }

    ErrorKind error_kind_from_name(const std::string& name) {
        const int n = (int)(sizeof(kKindNames) / sizeof(kKindNames[0]));
        for (int k = 0; k < n; ++k) {
            if (name == kKindNames[k]) return static_cast<ErrorKind>(k);
        }
        return ErrorKind::Runtime;
    }

    void raise(ErrorKind kind, const std::string& msg) {
        switch (kind) {
        case ErrorKind::SchemaMismatch:       throw SchemaMismatch(msg);
        case ErrorKind::ColumnMismatch:       throw ColumnMismatch(msg);
        case ErrorKind::ColumnNotFound:       throw ColumnNotFound(msg);
        case ErrorKind::UnsupportedLayout:    throw UnsupportedLayout(msg);
        case ErrorKind::Corrupt:              throw Corrupt(msg);
        case ErrorKind::NotFound:             throw NotFound(msg);
        case ErrorKind::InvalidMode:          throw InvalidMode(msg);
        case ErrorKind::CommunicatorMismatch: throw CommunicatorMismatch(msg);
        case ErrorKind::IOFailure:            throw IOFailure(msg);
        case ErrorKind::Runtime:
        default:
            throw CatalogError(ErrorKind::Runtime, msg);
        }
    }

} // namespace shardcat
