#pragma once

#include <cerrno>
#include <cstring>
#include <string>

#include "tabsync/util.hpp"

namespace tabsync {

enum class ErrorCategory {
    None,
    Config,
    Network,
    Http,
    Parse,
    Filesystem,
    Transfer,
    Integrity,
    Internal
};

enum class ErrorCode {
    None,
    Unknown,
    ConfigMissing,
    ConfigInvalid,
    MissingRequiredField,
    UnsupportedScheme,
    TransportFailure,
    Timeout,
    DnsFailure,
    ConnectFailure,
    HttpStatus,
    HttpNotFound,
    ParseFailure,
    UnsafePath,
    FileNotFound,
    PermissionDenied,
    ResourceExhausted,
    IoFailure,
    LocalStateConflict,
    LaunchFailure,
    NonZeroExit,
    CorruptFile
};

struct ErrorInfo {
    ErrorCategory category{ErrorCategory::None};
    ErrorCode code{ErrorCode::None};
    int httpStatus{0};
    bool retryable{false};
    std::string userMessage;
    std::string detail;
};

inline const char* errorCategoryLabel(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::Config: return "Config";
        case ErrorCategory::Network: return "Network";
        case ErrorCategory::Http: return "HTTP";
        case ErrorCategory::Parse: return "Parse";
        case ErrorCategory::Filesystem: return "Filesystem";
        case ErrorCategory::Transfer: return "Transfer";
        case ErrorCategory::Integrity: return "Integrity";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

inline const char* errorCodeLabel(ErrorCode c) {
    switch (c) {
        case ErrorCode::None: return "None";
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::ConfigMissing: return "ConfigMissing";
        case ErrorCode::ConfigInvalid: return "ConfigInvalid";
        case ErrorCode::MissingRequiredField: return "MissingRequiredField";
        case ErrorCode::UnsupportedScheme: return "UnsupportedScheme";
        case ErrorCode::TransportFailure: return "TransportFailure";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::DnsFailure: return "DnsFailure";
        case ErrorCode::ConnectFailure: return "ConnectFailure";
        case ErrorCode::HttpStatus: return "HttpStatus";
        case ErrorCode::HttpNotFound: return "HttpNotFound";
        case ErrorCode::ParseFailure: return "ParseFailure";
        case ErrorCode::UnsafePath: return "UnsafePath";
        case ErrorCode::FileNotFound: return "FileNotFound";
        case ErrorCode::PermissionDenied: return "PermissionDenied";
        case ErrorCode::ResourceExhausted: return "ResourceExhausted";
        case ErrorCode::IoFailure: return "IoFailure";
        case ErrorCode::LocalStateConflict: return "LocalStateConflict";
        case ErrorCode::LaunchFailure: return "LaunchFailure";
        case ErrorCode::NonZeroExit: return "NonZeroExit";
        case ErrorCode::CorruptFile: return "CorruptFile";
        default: return "Unknown";
    }
}

inline std::string describeError(const ErrorInfo& e) {
    std::string out = std::string(errorCategoryLabel(e.category)) + "/" + errorCodeLabel(e.code);
    if (!e.detail.empty()) out += ": " + e.detail;
    return out;
}

inline int parseHttpStatusFromMessage(const std::string& msg) {
    // Accept simple forms like "HTTP 401 ..." or "(HTTP 404)".
    auto pos = msg.find("HTTP ");
    if (pos == std::string::npos) pos = msg.find("HTTP");
    if (pos == std::string::npos) return 0;
    pos = msg.find_first_of("0123456789", pos);
    if (pos == std::string::npos) return 0;
    int code = 0;
    int digits = 0;
    while (pos < msg.size() && std::isdigit(static_cast<unsigned char>(msg[pos])) && digits < 3) {
        code = code * 10 + (msg[pos] - '0');
        ++pos;
        ++digits;
    }
    return digits == 3 ? code : 0;
}

// Structural damage in a file we expected to be able to parse.
inline ErrorInfo corruptFileError(const std::string& detail) {
    ErrorInfo out;
    out.category = ErrorCategory::Integrity;
    out.code = ErrorCode::CorruptFile;
    out.retryable = true;
    out.userMessage = "File structure is corrupt.";
    out.detail = detail;
    return out;
}

// Map a failed system call to a Filesystem error. Says nothing about file contents.
inline ErrorInfo errorFromErrno(int errnum, const std::string& what) {
    ErrorInfo out;
    out.category = ErrorCategory::Filesystem;
    out.detail = what + ": " + std::strerror(errnum);
    switch (errnum) {
        case ENOENT:
        case ENOTDIR:
            out.code = ErrorCode::FileNotFound;
            out.userMessage = "File not found.";
            break;
        case EACCES:
        case EPERM:
            out.code = ErrorCode::PermissionDenied;
            out.userMessage = "Permission denied.";
            break;
        case EMFILE:
        case ENFILE:
        case ENOMEM:
        case ENOSPC:
            out.code = ErrorCode::ResourceExhausted;
            out.userMessage = "System resources exhausted.";
            out.retryable = true;
            break;
        default:
            out.code = ErrorCode::IoFailure;
            out.userMessage = "Storage I/O error.";
            out.retryable = true;
            break;
    }
    return out;
}

inline ErrorInfo classifyError(const std::string& detail, ErrorCategory hint = ErrorCategory::None) {
    ErrorInfo out;
    out.detail = detail;
    out.category = hint;
    out.code = ErrorCode::Unknown;

    const std::string l = util::toLower(detail);
    const int http = parseHttpStatusFromMessage(detail);
    if (http > 0) out.httpStatus = http;

    auto set = [&](ErrorCategory cat, ErrorCode code, const char* user, bool retryable) {
        out.category = cat;
        out.code = code;
        out.userMessage = user;
        out.retryable = retryable;
    };

    if (l.find("missing config") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigMissing, "Configuration file is missing.", false);
    } else if (l.find("invalid config") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::ConfigInvalid, "Configuration is invalid.", false);
    } else if (l.find("config missing") != std::string::npos) {
        set(ErrorCategory::Config, ErrorCode::MissingRequiredField, "Required setting is missing.", false);
    } else if (l.find("unsupported url scheme") != std::string::npos || l.find("tls not implemented") != std::string::npos) {
        set(hint == ErrorCategory::None ? ErrorCategory::Config : hint, ErrorCode::UnsupportedScheme,
            "URL scheme is not supported here.", false);
    } else if (l.find("unsafe path") != std::string::npos) {
        set(ErrorCategory::Parse, ErrorCode::UnsafePath, "Manifest contains an unsafe path.", false);
    } else if (http == 404) {
        set(ErrorCategory::Http, ErrorCode::HttpNotFound, "Requested resource was not found (404).", false);
    } else if (http >= 400 && http < 600) {
        set(ErrorCategory::Http, ErrorCode::HttpStatus, "Server returned an HTTP error.", http >= 500);
    } else if (l.find("dns") != std::string::npos || l.find("resolve") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::DnsFailure, "DNS lookup failed.", true);
    } else if (l.find("connect failed") != std::string::npos || l.find("socket") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::ConnectFailure, "Failed to connect to server.", true);
    } else if (l.find("timeout") != std::string::npos || l.find("timed out") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::Timeout, "Network operation timed out.", true);
    } else if (l.find("recv failed") != std::string::npos || l.find("send failed") != std::string::npos ||
               l.find("http request failed") != std::string::npos) {
        set(ErrorCategory::Network, ErrorCode::TransportFailure, "Network transport failed.", true);
    } else if (l.find("failed to launch") != std::string::npos || l.find("exec failed") != std::string::npos) {
        set(ErrorCategory::Transfer, ErrorCode::LaunchFailure, "Transfer tool could not be started.", false);
    } else if (l.find("exited with") != std::string::npos) {
        set(ErrorCategory::Transfer, ErrorCode::NonZeroExit, "Transfer tool reported a failure.", true);
    } else if (l.find("parse") != std::string::npos || l.find("malformed") != std::string::npos ||
               l.find("json") != std::string::npos) {
        set(ErrorCategory::Parse, ErrorCode::ParseFailure, "Received malformed data.", false);
    } else if (l.find("permission denied") != std::string::npos) {
        set(ErrorCategory::Filesystem, ErrorCode::PermissionDenied, "Permission denied.", false);
    } else if (l.find("no such file") != std::string::npos || l.find("not found") != std::string::npos) {
        set(ErrorCategory::Filesystem, ErrorCode::FileNotFound, "File not found.", false);
    } else if (l.find("write failed") != std::string::npos || l.find("read failed") != std::string::npos ||
               l.find("open failed") != std::string::npos) {
        set(ErrorCategory::Filesystem, ErrorCode::IoFailure, "Storage I/O error.", true);
    }

    // Fill any missing defaults.
    if (out.category == ErrorCategory::None) out.category = hint == ErrorCategory::None ? ErrorCategory::Internal : hint;
    if (out.userMessage.empty()) {
        switch (out.category) {
            case ErrorCategory::Config: out.userMessage = "Configuration error."; break;
            case ErrorCategory::Network: out.userMessage = "Network error."; out.retryable = true; break;
            case ErrorCategory::Http: out.userMessage = "Server returned an error."; break;
            case ErrorCategory::Parse: out.userMessage = "Data parsing error."; break;
            case ErrorCategory::Filesystem: out.userMessage = "Storage error."; out.retryable = true; break;
            case ErrorCategory::Transfer: out.userMessage = "Transfer error."; break;
            case ErrorCategory::Integrity: out.userMessage = "File failed integrity check."; out.retryable = true; break;
            case ErrorCategory::Internal: out.userMessage = "Internal application error."; break;
            default: out.userMessage = "Unknown error."; break;
        }
    }

    return out;
}

} // namespace tabsync
