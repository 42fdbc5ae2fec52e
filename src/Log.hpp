#pragma once
#include <cstdint>
#include <string>
#include <string_view>

/// @brief Minimal leveled logging to stdout/stderr, one line per message: "Component: message".
namespace Monofs::Log
{
  enum class Level : std::uint8_t
  {
    Error = 0,
    Info = 1,
    Debug = 2
  };

  void SetLevel(Level level) noexcept;
  [[nodiscard]] Level GetLevel() noexcept;

  /// @brief Parse "error", "info" or "debug" (case-sensitive).
  /// @throws std::invalid_argument on any other value.
  [[nodiscard]] Level ParseLevel(std::string_view text);

  void Error(std::string_view component, const std::string &message);
  void Info(std::string_view component, const std::string &message);
  void Debug(std::string_view component, const std::string &message);
}
