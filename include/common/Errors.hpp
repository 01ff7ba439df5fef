#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace ddns::common {

/// Base error for all application-level exceptions.
/// Carries HTTP status code and machine-readable error code slug.
struct AppError : public std::runtime_error {
  int _iHttpStatus;
  std::string _sErrorCode;

  explicit AppError(int iHttpStatus, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _iHttpStatus(iHttpStatus),
        _sErrorCode(std::move(sCode)) {}
};

/// 400 Bad Request: malformed arguments or contract violations
/// (e.g. mismatched batch array lengths). Never retried.
struct ValidationError : AppError {
  explicit ValidationError(std::string sCode, std::string sMsg)
      : AppError(400, std::move(sCode), std::move(sMsg)) {}
};

/// 404 Not Found: content store has no document for the locator.
struct NotFoundError : AppError {
  explicit NotFoundError(std::string sCode, std::string sMsg)
      : AppError(404, std::move(sCode), std::move(sMsg)) {}
};

/// 409 Conflict: dequeue on an empty work queue.
struct EmptyQueueError : AppError {
  explicit EmptyQueueError(std::string sCode, std::string sMsg)
      : AppError(409, std::move(sCode), std::move(sMsg)) {}
};

/// 422 Unprocessable Entity: content reference or record set could not be decoded.
struct ContentDecodeError : AppError {
  explicit ContentDecodeError(std::string sCode, std::string sMsg)
      : AppError(422, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: ledger RPC failure (transport error or RPC error object).
struct LedgerError : AppError {
  explicit LedgerError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// 502 Bad Gateway: content store transport failure.
struct ContentStoreError : AppError {
  explicit ContentStoreError(std::string sCode, std::string sMsg)
      : AppError(502, std::move(sCode), std::move(sMsg)) {}
};

/// 504 Gateway Timeout: a resolution tier call exceeded its time budget.
struct TierTimeoutError : AppError {
  explicit TierTimeoutError(std::string sCode, std::string sMsg)
      : AppError(504, std::move(sCode), std::move(sMsg)) {}
};

}  // namespace ddns::common
