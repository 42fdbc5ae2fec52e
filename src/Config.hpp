#pragma once
#include "Log.hpp"
#include <cstddef>
#include <string>

namespace Monofs
{
  /// @brief Tunables shared by a store and every entity created against it.
  struct Config
  {
    static constexpr std::size_t DefaultChunkSize = 256 * 1024;
    static constexpr int DefaultCompressionLevel = 3;

    /// @brief Maximum size of one content chunk. File content is split at multiples of this size.
    std::size_t ChunkSize{DefaultChunkSize};

    /// @brief zstd level used by on-disk stores. Never affects CIDs.
    int CompressionLevel{DefaultCompressionLevel};

    Log::Level LogLevel{Log::Level::Error};

    /// @brief Set one option by name ("chunk-size", "compression-level", "log-level").
    /// @throws std::invalid_argument for unknown keys or malformed values.
    void Set(const std::string &key, const std::string &value);

    /// @brief Check the bounds that @ref Set enforces on values assigned directly.
    /// @throws std::invalid_argument when a field is out of range.
    void Validate() const;

    /// @brief Defaults overlaid with MONOFS_CHUNK_SIZE, MONOFS_COMPRESSION_LEVEL and MONOFS_LOG_LEVEL.
    [[nodiscard]] static Config FromEnvironment();
  };
}
