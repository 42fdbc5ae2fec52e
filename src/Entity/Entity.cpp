#include "Entity.hpp"
#include "../CAS/CAS.hpp"
#include "../Errors.hpp"
#include "Dir.hpp"
#include "File.hpp"
#include "SymLink.hpp"
#include <algorithm>

using namespace Monofs;

Entity::Entity(std::shared_ptr<Store> store, Metadata metadata, std::optional<Cid> cid)
    : m_Store(std::move(store)),
      m_Metadata(std::move(metadata)),
      m_Cid(std::move(cid)),
      m_Dirty(!m_Cid)
{
  if (!m_Store)
    throw std::invalid_argument("Entity: store must not be null");
}

std::unique_ptr<Entity> Entity::Load(const Cid &cid, const std::shared_ptr<Store> &store)
{
  auto node = Block::FromBlock(store->Get(cid));
  if (auto *file = std::get_if<FileNode>(&node))
    return File::Restore(std::move(*file), cid, store);
  if (auto *link = std::get_if<SymLinkNode>(&node))
    return SymLink::Restore(std::move(*link), cid, store);

  return Dir::Restore(std::get<DirNode>(std::move(node)), cid, store);
}

void Entity::SetAttribute(const std::string &key, const std::string &value)
{
  auto [it, inserted] = m_Metadata.Attributes.try_emplace(key, value);
  if (!inserted)
  {
    if (it->second == value)
      return;
    it->second = value;
  }
  m_Dirty = true;
}

std::optional<std::string> Entity::GetAttribute(const std::string &key) const
{
  auto it = m_Metadata.Attributes.find(key);
  if (it == m_Metadata.Attributes.end())
    return std::nullopt;
  return it->second;
}

bool Entity::RemoveAttribute(const std::string &key)
{
  if (m_Metadata.Attributes.erase(key) == 0)
    return false;

  m_Dirty = true;
  return true;
}

File &Entity::AsFile()
{
  if (Kind() != EntityKind::File)
    throw NotAFileError(m_Cid ? CAS::ToHexString(*m_Cid) : std::string("unpersisted ") + ToString(Kind()));
  return static_cast<File &>(*this);
}

const File &Entity::AsFile() const
{
  return const_cast<Entity *>(this)->AsFile();
}

Dir &Entity::AsDir()
{
  if (Kind() != EntityKind::Directory)
    throw NotADirectoryError(m_Cid ? CAS::ToHexString(*m_Cid) : std::string("unpersisted ") + ToString(Kind()));
  return static_cast<Dir &>(*this);
}

const Dir &Entity::AsDir() const
{
  return const_cast<Entity *>(this)->AsDir();
}

SymLink &Entity::AsSymLink()
{
  if (Kind() != EntityKind::SymLink)
    throw NotASymLinkError(m_Cid ? CAS::ToHexString(*m_Cid) : std::string("unpersisted ") + ToString(Kind()));
  return static_cast<SymLink &>(*this);
}

const SymLink &Entity::AsSymLink() const
{
  return const_cast<Entity *>(this)->AsSymLink();
}

Metadata Entity::NextMetadata() const
{
  Metadata next = m_Metadata;
  next.PreviousVersion = m_Cid;
  next.ModifiedAt = std::max(Now(), m_Metadata.ModifiedAt);
  return next;
}

void Entity::Committed(const Cid &cid, Metadata metadata)
{
  m_Metadata = std::move(metadata);
  m_Cid = cid;
  m_Dirty = false;
}
