#pragma once
#include "../Config.hpp"
#include "../Types.hpp"
#include <cstdint>
#include <string_view>

namespace Monofs
{
  /// @brief Block accounting of one store instance.
  struct StoreStats
  {
    /// @brief Distinct blocks held by the store.
    std::uint64_t Blocks = 0;
    /// @brief Put calls that actually stored a new block.
    std::uint64_t Writes = 0;
    /// @brief Every Put call, including deduplicated ones.
    std::uint64_t Puts = 0;
    std::uint64_t Gets = 0;
    std::uint64_t BytesWritten = 0;
  };

  /// @brief Pluggable key-addressed block storage.
  ///
  /// Blocks are keyed by the SHA256 of their bytes. Putting identical bytes twice yields
  /// the same CID and stores them once. Implementations must tolerate concurrent Put/Get
  /// from unrelated entities; entities never assume exclusive access.
  class Store
  {
  public:
    /// @throws std::invalid_argument when @p config is out of range.
    explicit Store(const Config &config)
        : m_Config(config)
    {
      m_Config.Validate();
    }

    virtual ~Store() = default;

    Store(const Store &) = delete;
    Store &operator=(const Store &) = delete;

    /// @brief Store a block.
    /// @return CID of the block.
    /// @throws StoreUnavailableError on I/O failure.
    [[nodiscard]] virtual Cid Put(std::string_view block) = 0;

    /// @brief Fetch a block. The result is byte-identical to what was put under @p cid.
    /// @throws NotFoundError when the CID is unknown to this store.
    /// @throws DecodeError when the stored block fails its integrity check.
    /// @throws StoreUnavailableError on I/O failure.
    [[nodiscard]] virtual Bytes Get(const Cid &cid) const = 0;

    [[nodiscard]] virtual bool Has(const Cid &cid) const = 0;

    [[nodiscard]] virtual StoreStats Stats() const = 0;

    [[nodiscard]] inline const Config &GetConfig() const noexcept
    {
      return m_Config;
    }

  private:
    const Config m_Config;
  };
}
