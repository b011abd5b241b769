#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <system_error>

enum class FileErrorKind
{
    None,
    SourceNotFound,
    PermissionDenied,
    DiskFull,
    SizeMismatch,
    HashMismatch,
    ConflictUnresolved,
    RetryExhausted,
    Cancelled,
    IOError
};

const char* ToString(FileErrorKind Kind);

// Size and hash mismatches are both verification failures
inline bool IsVerificationMismatch(FileErrorKind Kind)
{
    return Kind == FileErrorKind::SizeMismatch || Kind == FileErrorKind::HashMismatch;
}

FileErrorKind ClassifyErrno(int ErrorNumber);
FileErrorKind ClassifyErrorCode(const std::error_code& Code);

class FileOperationError : public std::runtime_error
{
public:
    FileOperationError(FileErrorKind Kind, const std::string& Message);

    FileErrorKind GetKind() const { return Kind; }

private:
    FileErrorKind Kind;
};

struct FileResult
{
    bool Success = false;
    std::string Error;
    FileErrorKind Kind = FileErrorKind::None;

    static FileResult Ok();
    static FileResult Failure(FileErrorKind Kind, const std::string& Message);
    static FileResult Cancelled();

    bool IsCancelled() const { return Kind == FileErrorKind::Cancelled; }
};

// Keyed by destination path (batch APIs), relative path (directory compare) or manifest name
using ResultMap = std::map<std::string, FileResult>;
