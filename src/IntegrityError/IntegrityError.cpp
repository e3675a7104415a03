#include "IntegrityError.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "None";
        case ErrorKind::RootPathNotFound:   return "RootPathNotFound";
        case ErrorKind::StoreAlreadyExists: return "StoreAlreadyExists";
        case ErrorKind::StoreNotFound:      return "StoreNotFound";
        case ErrorKind::SchemaMismatch:     return "SchemaMismatch";
        case ErrorKind::FileUnreadable:     return "FileUnreadable";
        case ErrorKind::RemoteLookupFailed: return "RemoteLookupFailed";
        case ErrorKind::StoreWriteFailed:   return "StoreWriteFailed";
        case ErrorKind::StoreReadFailed:    return "StoreReadFailed";
        case ErrorKind::InvalidConfig:      return "InvalidConfig";
    }
    return "Unknown";
}
