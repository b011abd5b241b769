#include "FileOpsError.hpp"

#include <cerrno>

const char* ToString(FileErrorKind Kind)
{
    switch (Kind)
    {
    case FileErrorKind::None:               return "None";
    case FileErrorKind::SourceNotFound:     return "SourceNotFound";
    case FileErrorKind::PermissionDenied:   return "PermissionDenied";
    case FileErrorKind::DiskFull:           return "DiskFull";
    case FileErrorKind::SizeMismatch:       return "SizeMismatch";
    case FileErrorKind::HashMismatch:       return "HashMismatch";
    case FileErrorKind::ConflictUnresolved: return "ConflictUnresolved";
    case FileErrorKind::RetryExhausted:     return "RetryExhausted";
    case FileErrorKind::Cancelled:          return "Cancelled";
    case FileErrorKind::IOError:            return "IOError";
    default:                                return "Unknown";
    }
}

FileErrorKind ClassifyErrno(int ErrorNumber)
{
    switch (ErrorNumber)
    {
    case ENOENT:
    case ENOTDIR:
        return FileErrorKind::SourceNotFound;
    case EACCES:
    case EPERM:
    case EROFS:
        return FileErrorKind::PermissionDenied;
    case ENOSPC:
#ifdef EDQUOT
    case EDQUOT:
#endif
        return FileErrorKind::DiskFull;
    default:
        return FileErrorKind::IOError;
    }
}

FileErrorKind ClassifyErrorCode(const std::error_code& Code)
{
    if (!Code)
    {
        return FileErrorKind::None;
    }
    if (Code == std::errc::no_such_file_or_directory || Code == std::errc::not_a_directory)
    {
        return FileErrorKind::SourceNotFound;
    }
    if (Code == std::errc::permission_denied || Code == std::errc::operation_not_permitted || Code == std::errc::read_only_file_system)
    {
        return FileErrorKind::PermissionDenied;
    }
    if (Code == std::errc::no_space_on_device)
    {
        return FileErrorKind::DiskFull;
    }
    if (Code.category() == std::generic_category() || Code.category() == std::system_category())
    {
        return ClassifyErrno(Code.value());
    }
    return FileErrorKind::IOError;
}

FileOperationError::FileOperationError(FileErrorKind Kind, const std::string& Message) : std::runtime_error(Message), Kind(Kind)
{
}

FileResult FileResult::Ok()
{
    FileResult Result;
    Result.Success = true;
    return Result;
}

FileResult FileResult::Failure(FileErrorKind Kind, const std::string& Message)
{
    FileResult Result;
    Result.Success = false;
    Result.Kind = Kind;
    Result.Error = Message;
    return Result;
}

FileResult FileResult::Cancelled()
{
    return Failure(FileErrorKind::Cancelled, "Operation cancelled");
}
