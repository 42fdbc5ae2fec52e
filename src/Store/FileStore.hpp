#pragma once
#include "Store.hpp"
#include <atomic>
#include <filesystem>
#include <memory>

namespace Monofs
{
  /// @brief Directory-backed block store.
  ///
  /// Blocks are kept zstd-compressed under <root>/Objects/aa/bb/<identity>. Writes go to
  /// <root>/Objects/.tmp and are installed by rename, so concurrent puts of identical bytes
  /// converge to one object. Reads decompress and re-hash every block before returning it.
  class FileStore : public Store
  {
  public:
    /// @throws StoreUnavailableError when the object directory cannot be created.
    [[nodiscard]] static std::shared_ptr<FileStore> Open(const std::filesystem::path &root, const Config &config = {})
    {
      return std::shared_ptr<FileStore>(new FileStore(root, config));
    }

  public:
    [[nodiscard]] inline const std::filesystem::path &Root() const noexcept
    {
      return m_Root;
    }

    /// @brief Location of the object file for the given identity.
    [[nodiscard]] std::filesystem::path ObjectPath(const Cid &cid) const;

    [[nodiscard]] Cid Put(std::string_view block) override;
    [[nodiscard]] Bytes Get(const Cid &cid) const override;
    [[nodiscard]] bool Has(const Cid &cid) const override;
    [[nodiscard]] StoreStats Stats() const override;

  private:
    FileStore(const std::filesystem::path &root, const Config &config);

  private:
    const std::filesystem::path m_Root;
    std::atomic<std::uint64_t> m_Writes{0};
    std::atomic<std::uint64_t> m_Puts{0};
    mutable std::atomic<std::uint64_t> m_Gets{0};
    std::atomic<std::uint64_t> m_BytesWritten{0};
  };
}
