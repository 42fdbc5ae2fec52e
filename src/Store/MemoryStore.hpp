#pragma once
#include "Store.hpp"
#include <map>
#include <memory>
#include <mutex>

namespace Monofs
{
  /// @brief Thread-safe in-memory arena of immutable blocks keyed by CID.
  class MemoryStore : public Store
  {
  public:
    [[nodiscard]] static std::shared_ptr<MemoryStore> Open(const Config &config = {})
    {
      return std::shared_ptr<MemoryStore>(new MemoryStore(config));
    }

  public:
    [[nodiscard]] Cid Put(std::string_view block) override;
    [[nodiscard]] Bytes Get(const Cid &cid) const override;
    [[nodiscard]] bool Has(const Cid &cid) const override;
    [[nodiscard]] StoreStats Stats() const override;

  private:
    explicit MemoryStore(const Config &config);

  private:
    mutable std::mutex m_Mutex;
    std::map<Cid, Bytes> m_Blocks;
    mutable StoreStats m_Stats;
  };
}
