#pragma once
#include <stdexcept>
#include <string>

namespace Monofs
{
  enum class ErrorKind
  {
    NotFound,
    AlreadyExists,
    StreamBusy,
    DecodeError,
    StoreUnavailable,
    NotAFile,
    NotADirectory,
    NotASymLink,
    InvalidPath,
    TooManyLinks
  };

  [[nodiscard]] const char *ToString(ErrorKind kind) noexcept;

  /// @brief Base of every error raised by Monofs.
  class Error : public std::runtime_error
  {
  public:
    Error(ErrorKind kind, const std::string &message)
        : std::runtime_error(message),
          m_Kind(kind)
    {
    }

    [[nodiscard]] ErrorKind Kind() const noexcept
    {
      return m_Kind;
    }

  private:
    ErrorKind m_Kind;
  };

  /// @brief Missing name or CID.
  class NotFoundError : public Error
  {
  public:
    explicit NotFoundError(const std::string &what) : Error(ErrorKind::NotFound, "not found: " + what) {}
  };

  /// @brief Duplicate name on create.
  class AlreadyExistsError : public Error
  {
  public:
    explicit AlreadyExistsError(const std::string &what) : Error(ErrorKind::AlreadyExists, "already exists: " + what) {}
  };

  /// @brief A second output stream was requested while one is still open.
  class StreamBusyError : public Error
  {
  public:
    explicit StreamBusyError(const std::string &what) : Error(ErrorKind::StreamBusy, "stream busy: " + what) {}
  };

  /// @brief Malformed or incompatible stored block. Indicates store corruption or format drift.
  class DecodeError : public Error
  {
  public:
    explicit DecodeError(const std::string &what) : Error(ErrorKind::DecodeError, "decode error: " + what) {}
  };

  /// @brief Underlying store I/O failure. Retryable at the caller's discretion.
  class StoreUnavailableError : public Error
  {
  public:
    explicit StoreUnavailableError(const std::string &what) : Error(ErrorKind::StoreUnavailable, "store unavailable: " + what) {}
  };

  class NotAFileError : public Error
  {
  public:
    explicit NotAFileError(const std::string &what) : Error(ErrorKind::NotAFile, "not a file: " + what) {}
  };

  class NotADirectoryError : public Error
  {
  public:
    explicit NotADirectoryError(const std::string &what) : Error(ErrorKind::NotADirectory, "not a directory: " + what) {}
  };

  class NotASymLinkError : public Error
  {
  public:
    explicit NotASymLinkError(const std::string &what) : Error(ErrorKind::NotASymLink, "not a symlink: " + what) {}
  };

  /// @brief Path resolution followed more symlinks than allowed, usually because of a link loop.
  class TooManyLinksError : public Error
  {
  public:
    explicit TooManyLinksError(const std::string &what) : Error(ErrorKind::TooManyLinks, "too many levels of symlinks: " + what) {}
  };

  class InvalidPathError : public Error
  {
  public:
    explicit InvalidPathError(const std::string &what) : Error(ErrorKind::InvalidPath, "invalid path: " + what) {}
  };
}
