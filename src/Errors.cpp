#include "Errors.hpp"

const char *Monofs::ToString(ErrorKind kind) noexcept
{
  switch (kind)
  {
  case ErrorKind::NotFound:
    return "NotFound";
  case ErrorKind::AlreadyExists:
    return "AlreadyExists";
  case ErrorKind::StreamBusy:
    return "StreamBusy";
  case ErrorKind::DecodeError:
    return "DecodeError";
  case ErrorKind::StoreUnavailable:
    return "StoreUnavailable";
  case ErrorKind::NotAFile:
    return "NotAFile";
  case ErrorKind::NotADirectory:
    return "NotADirectory";
  case ErrorKind::NotASymLink:
    return "NotASymLink";
  case ErrorKind::InvalidPath:
    return "InvalidPath";
  case ErrorKind::TooManyLinks:
    return "TooManyLinks";
  }
  return "Unknown";
}
