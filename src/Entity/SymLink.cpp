#include "SymLink.hpp"
#include "../CAS/CAS.hpp"
#include "../Errors.hpp"
#include "../Log.hpp"

using namespace Monofs;

namespace
{
  void CheckTarget(const std::string &target)
  {
    if (target.empty())
      throw InvalidPathError("symlink target is empty");
  }
}

SymLink::SymLink(const std::shared_ptr<Store> &store, Metadata metadata, std::optional<Cid> cid, std::string target)
    : Entity(store, std::move(metadata), std::move(cid)),
      m_Target(std::move(target))
{
}

std::unique_ptr<SymLink> SymLink::New(const std::shared_ptr<Store> &store, const std::string &target)
{
  ::CheckTarget(target);
  return std::unique_ptr<SymLink>(new SymLink(store, Metadata::Create(EntityKind::SymLink), std::nullopt, target));
}

std::unique_ptr<SymLink> SymLink::Load(const Cid &cid, const std::shared_ptr<Store> &store)
{
  auto node = Block::FromBlock(store->Get(cid));
  auto *link = std::get_if<SymLinkNode>(&node);
  if (!link)
    throw NotASymLinkError(CAS::ToHexString(cid));

  return Restore(std::move(*link), cid, store);
}

std::unique_ptr<SymLink> SymLink::Restore(SymLinkNode node, const Cid &cid, const std::shared_ptr<Store> &store)
{
  return std::unique_ptr<SymLink>(new SymLink(store, std::move(node.Meta), cid, std::move(node.Target)));
}

void SymLink::SetTarget(const std::string &target)
{
  ::CheckTarget(target);
  if (target == m_Target)
    return;

  m_Target = target;
  MarkDirty();
}

bool SymLink::IsDirty() const
{
  return OwnDirty();
}

Cid SymLink::Checkpoint()
{
  if (!IsDirty() && GetCid())
    return *GetCid();

  SymLinkNode node{NextMetadata(), m_Target};
  const Cid cid = GetStore()->Put(Block::ToBlock(node));
  Log::Debug("SymLink", "checkpoint " + CAS::ToHexString(cid) + " -> " + m_Target);

  Committed(cid, std::move(node.Meta));
  return cid;
}

Node SymLink::ToNode() const
{
  if (IsDirty() || !GetCid())
    throw std::logic_error("SymLink: unpersisted changes, checkpoint first");

  return SymLinkNode{GetMetadata(), m_Target};
}
