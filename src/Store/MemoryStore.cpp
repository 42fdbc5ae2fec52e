#include "MemoryStore.hpp"
#include "../CAS/CAS.hpp"
#include "../Errors.hpp"

using namespace Monofs;

MemoryStore::MemoryStore(const Config &config)
    : Store(config)
{
}

Cid MemoryStore::Put(std::string_view block)
{
  const auto cid = CAS::Identify(block);

  std::lock_guard<std::mutex> lock(m_Mutex);
  m_Stats.Puts++;
  auto [it, inserted] = m_Blocks.try_emplace(cid, block);
  if (inserted)
  {
    m_Stats.Writes++;
    m_Stats.BytesWritten += block.size();
  }

  return cid;
}

Bytes MemoryStore::Get(const Cid &cid) const
{
  std::lock_guard<std::mutex> lock(m_Mutex);
  m_Stats.Gets++;
  auto it = m_Blocks.find(cid);
  if (it == m_Blocks.end())
    throw NotFoundError("block " + CAS::ToHexString(cid));

  return it->second;
}

bool MemoryStore::Has(const Cid &cid) const
{
  std::lock_guard<std::mutex> lock(m_Mutex);
  return m_Blocks.contains(cid);
}

StoreStats MemoryStore::Stats() const
{
  std::lock_guard<std::mutex> lock(m_Mutex);
  StoreStats result = m_Stats;
  result.Blocks = m_Blocks.size();
  return result;
}
