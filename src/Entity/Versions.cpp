#include "Versions.hpp"
#include "../CAS/CAS.hpp"
#include "../Errors.hpp"
#include <set>

using namespace Monofs;

std::vector<Cid> Monofs::Versions::History(const Cid &cid, const std::shared_ptr<Store> &store)
{
  std::vector<Cid> chain;
  std::set<Cid> seen;

  std::optional<Cid> current = cid;
  while (current)
  {
    if (!seen.insert(*current).second)
      throw DecodeError("version chain loops at " + CAS::ToHexString(*current));

    const auto node = Block::FromBlock(store->Get(*current));
    chain.push_back(*current);
    current = Block::GetMetadata(node).PreviousVersion;
  }

  return chain;
}

std::unique_ptr<Entity> Monofs::Versions::LoadVersion(const Cid &cid, const std::shared_ptr<Store> &store, std::size_t steps)
{
  Cid current = cid;
  for (std::size_t i = 0; i < steps; i++)
  {
    const auto node = Block::FromBlock(store->Get(current));
    const auto &previous = Block::GetMetadata(node).PreviousVersion;
    if (!previous)
      throw NotFoundError("version " + std::to_string(steps) + " before " + CAS::ToHexString(cid));

    current = *previous;
  }

  return Entity::Load(current, store);
}
