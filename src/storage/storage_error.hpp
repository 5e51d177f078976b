#ifndef STORIFY_SRC_STORAGE_STORAGE_ERROR_HPP_
#define STORIFY_SRC_STORAGE_STORAGE_ERROR_HPP_

#include <cerrno>
#include <expected>
#include <string>
#include <system_error>
#include <type_traits>

namespace Storify::Storage
{

//------------------------------------------------------------------------------//
// Error Codes declared for Object Store Operations
//------------------------------------------------------------------------------//

// clang-format off
enum class StorageErrc {
    Success = 0,             // Not an error
    NotFound,                // Object or container does not exist
    InvalidArgument,         // Caller misuse (conflicting options, bad values)
    IsADirectory,            // Expected an object, found a directory
    NotADirectory,           // Expected a directory, found an object
    ConcurrentModification,  // Witness changed between checkpoints
    PreconditionFailed,      // Caller supplied size/etag precondition did not hold
    RangeNotSatisfiable,     // Backend rejected a range past EOF
    PermissionDenied,        // Operation not permitted
    IOError,                 // General I/O error during read/write/etc.
    NotSupported,            // Operation or provider not supported
    AlreadyExists,           // Attempted to create something that already exists
    InvalidPath,             // Path format or content is invalid for the store
    SizeLimitExceeded,       // Object larger than the configured limit
    UnknownError,            // An unspecified error occurred
};
// clang-format on

// Caller-facing taxonomy every StorageErrc collapses into.
enum class ErrorKind {
    NotFound,
    InvalidArgument,
    ConcurrentModification,
    BackendFailure,
};

std::error_code make_error_code(StorageErrc e);

inline StorageErrc ErrnoToStorageErrc(int err_no)
{
    switch (err_no) {
        case 0:
            return StorageErrc::Success;
        case ENOENT:
            return StorageErrc::NotFound;
        case EACCES:
        case EPERM:
            return StorageErrc::PermissionDenied;
        case EIO:
            return StorageErrc::IOError;
        case EINVAL:
            return StorageErrc::InvalidArgument;
        case EEXIST:
            return StorageErrc::AlreadyExists;
        case ENOTDIR:
            return StorageErrc::NotADirectory;
        case EISDIR:
            return StorageErrc::IsADirectory;
        case ENAMETOOLONG:
            return StorageErrc::InvalidPath;
        case EOPNOTSUPP:
            return StorageErrc::NotSupported;

        default:
            return StorageErrc::UnknownError;
    }
}

//------------------------------------------------------------------------------//
// Error Category Definition (Private Implementation Detail)
//------------------------------------------------------------------------------//
namespace detail
{
class StorageErrorCategory : public std::error_category
{
    public:
    const char* name() const noexcept override { return "Storify::Storage"; }
    std::string message(int ev) const override
    {
        switch (static_cast<StorageErrc>(ev)) {
            case StorageErrc::Success:
                return "Success";
            case StorageErrc::NotFound:
                return "Path not found";
            case StorageErrc::InvalidArgument:
                return "Invalid argument";
            case StorageErrc::IsADirectory:
                return "Path is a directory";
            case StorageErrc::NotADirectory:
                return "Path is not a directory";
            case StorageErrc::ConcurrentModification:
                return "Concurrent modification detected";
            case StorageErrc::PreconditionFailed:
                return "Precondition failed";
            case StorageErrc::RangeNotSatisfiable:
                return "Range not satisfiable";
            case StorageErrc::PermissionDenied:
                return "Permission denied";
            case StorageErrc::IOError:
                return "Input/output error";
            case StorageErrc::NotSupported:
                return "Operation not supported";
            case StorageErrc::AlreadyExists:
                return "Path already exists";
            case StorageErrc::InvalidPath:
                return "Invalid path";
            case StorageErrc::SizeLimitExceeded:
                return "Object exceeds the size limit; use --force to override";
            case StorageErrc::UnknownError:
                return "Unknown storage error";
            default:
                return "Unrecognized error code";
        }
    }
};
}  // namespace detail

// Global instance of the category
inline const detail::StorageErrorCategory storage_error_category;

// Make the enum usable with std::error_code
inline std::error_code make_error_code(StorageErrc e)
{
    return {static_cast<int>(e), storage_error_category};
}

//------------------------------------------------------------------------------//
// Result Type Alias
//------------------------------------------------------------------------------//
template <typename T>
using StorageResult = std::expected<T, std::error_code>;

//------------------------------------------------------------------------------//
// Helpers
//------------------------------------------------------------------------------//

inline bool IsErrc(const std::error_code& ec, StorageErrc errc)
{
    return ec.category() == storage_error_category && ec.value() == static_cast<int>(errc);
}

inline ErrorKind Classify(const std::error_code& ec)
{
    if (ec.category() != storage_error_category) {
        return ErrorKind::BackendFailure;
    }
    switch (static_cast<StorageErrc>(ec.value())) {
        case StorageErrc::NotFound:
            return ErrorKind::NotFound;
        case StorageErrc::InvalidArgument:
        case StorageErrc::IsADirectory:
        case StorageErrc::NotADirectory:
        case StorageErrc::PreconditionFailed:
        case StorageErrc::InvalidPath:
        case StorageErrc::SizeLimitExceeded:
            return ErrorKind::InvalidArgument;
        case StorageErrc::ConcurrentModification:
            return ErrorKind::ConcurrentModification;
        default:
            return ErrorKind::BackendFailure;
    }
}

inline const char* ErrorKindToString(ErrorKind kind)
{
    switch (kind) {
        case ErrorKind::NotFound:
            return "NotFound";
        case ErrorKind::InvalidArgument:
            return "InvalidArgument";
        case ErrorKind::ConcurrentModification:
            return "ConcurrentModification";
        case ErrorKind::BackendFailure:
            return "BackendFailure";
        default:
            return "Unknown";
    }
}

}  // namespace Storify::Storage

// Enable std::error_code implicit conversion for StorageErrc
namespace std
{
template <>
struct is_error_code_enum<Storify::Storage::StorageErrc> : true_type {
};
}  // namespace std

#endif  // STORIFY_SRC_STORAGE_STORAGE_ERROR_HPP_
