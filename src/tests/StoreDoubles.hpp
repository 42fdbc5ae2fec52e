#pragma once
#include "../Errors.hpp"
#include "../Store/MemoryStore.hpp"

#include <atomic>

/// @brief In-memory store whose writes can be switched off to simulate an unreachable backend.
class FlakyStore : public Monofs::Store
{
public:
  explicit FlakyStore(const Monofs::Config &config = {})
      : Store(config), m_Inner(Monofs::MemoryStore::Open(config))
  {
  }

  void FailPuts(bool fail) noexcept { m_FailPuts = fail; }

  [[nodiscard]] Monofs::Cid Put(std::string_view block) override
  {
    if (m_FailPuts)
      throw Monofs::StoreUnavailableError("injected write failure");
    return m_Inner->Put(block);
  }

  [[nodiscard]] Monofs::Bytes Get(const Monofs::Cid &cid) const override { return m_Inner->Get(cid); }
  [[nodiscard]] bool Has(const Monofs::Cid &cid) const override { return m_Inner->Has(cid); }
  [[nodiscard]] Monofs::StoreStats Stats() const override { return m_Inner->Stats(); }

private:
  std::shared_ptr<Monofs::MemoryStore> m_Inner;
  std::atomic<bool> m_FailPuts{false};
};

inline Monofs::Config SmallChunks(std::size_t chunkSize = 4)
{
  Monofs::Config config;
  config.ChunkSize = chunkSize;
  return config;
}
