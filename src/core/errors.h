#pragma once

#include <functional>
#include <iosfwd>
#include <stdexcept>
#include <string>

enum class ErrorKind {
    MissingLength,
    InvalidLength,
    InvalidParallelism,
    EmptyResource,
    TransportError,
    UnexpectedStatus,
    IOError,
    InvalidConfig,
    JobFailed
};

/// Stable name of an error kind, used in logs and JSON reports.
const char* errorKindName(ErrorKind kind);

/// Base exception for every failure raised by the download core.
class DownloadError : public std::runtime_error {
public:
    DownloadError(ErrorKind kind, const std::string& what)
        : std::runtime_error(what), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

/// Exception thrown on HTTP / network errors.
class HttpError : public DownloadError {
public:
    explicit HttpError(const std::string& what,
                       int curl_code = 0,
                       long http_status = 0,
                       ErrorKind kind = ErrorKind::TransportError)
        : DownloadError(kind, what),
          curl_code_(curl_code),
          http_status_(http_status) {}

    int curlCode() const noexcept { return curl_code_; }
    long httpStatus() const noexcept { return http_status_; }

private:
    int curl_code_;
    long http_status_;
};

/// Run body and return its exit status. Any std::exception escaping it is
/// logged, printed to err as "error (<kind>): <message>" and turned into 1.
int runReportingErrors(const std::function<int()>& body, std::ostream& err);
