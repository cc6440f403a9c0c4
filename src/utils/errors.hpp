#ifndef ERRORS_HPP
#define ERRORS_HPP

enum class ErrorCode {
    Ok,
    FileNotFound,
    InputReadFailed,
    InvalidArguments,
    InvalidConfigFormat,
    UnknownConfigOption,
    MalformedLine,
    OutputWriteFailed,
    PrivilegedUser,
    Count
};

using Err = ErrorCode;

inline const char *ErrorText[static_cast<int>(ErrorCode::Count)] = {
    "No error",
    "File not found",
    "Failed to read input",
    "Invalid arguments",
    "Config file has invalid format",
    "Unknown config option",
    "Line does not match expected format",
    "Failed to write output",
    "Refusing to run with administrative privileges",
};

// Process exit status reported to the container host.
inline int ExitCode(Err err) {
    switch (err) {
        case Err::Ok:
            return 0;
        case Err::FileNotFound:
        case Err::InvalidArguments:
        case Err::InvalidConfigFormat:
        case Err::UnknownConfigOption:
            return 2;
        case Err::MalformedLine:
            return 3;
        default:
            return 1;
    }
}

#endif
