#include "Dir.hpp"
#include "../CAS/CAS.hpp"
#include "../Errors.hpp"
#include "../Log.hpp"
#include "File.hpp"
#include "Path.hpp"
#include "SymLink.hpp"
#include <algorithm>

using namespace Monofs;

Dir::Dir(const std::shared_ptr<Store> &store, Metadata metadata, std::optional<Cid> cid)
    : Entity(store, std::move(metadata), std::move(cid))
{
}

std::unique_ptr<Dir> Dir::New(const std::shared_ptr<Store> &store)
{
  return std::unique_ptr<Dir>(new Dir(store, Metadata::Create(EntityKind::Directory), std::nullopt));
}

std::unique_ptr<Dir> Dir::Load(const Cid &cid, const std::shared_ptr<Store> &store)
{
  auto node = Block::FromBlock(store->Get(cid));
  auto *dir = std::get_if<DirNode>(&node);
  if (!dir)
    throw NotADirectoryError(CAS::ToHexString(cid));

  return Restore(std::move(*dir), cid, store);
}

std::unique_ptr<Dir> Dir::Restore(DirNode node, const Cid &cid, const std::shared_ptr<Store> &store)
{
  auto dir = std::unique_ptr<Dir>(new Dir(store, std::move(node.Meta), cid));
  dir->m_Entries.reserve(node.Entries.size());
  for (auto &entry : node.Entries)
    dir->m_Entries.push_back(Child{std::move(entry.Name), entry.Kind, entry.Target, nullptr});

  return dir;
}

Dir::Child *Dir::Find(const std::string &name) noexcept
{
  auto it = std::find_if(m_Entries.begin(), m_Entries.end(), [&](const Child &c)
                         { return c.Name == name; });
  return it == m_Entries.end() ? nullptr : &*it;
}

const Dir::Child *Dir::Find(const std::string &name) const noexcept
{
  return const_cast<Dir *>(this)->Find(name);
}

Entity &Dir::Insert(const std::string &name, std::unique_ptr<Entity> entity)
{
  Path::ValidateSegment(name);
  if (Find(name))
    throw AlreadyExistsError(name);

  const auto kind = entity->Kind();
  m_Entries.push_back(Child{name, kind, std::nullopt, std::move(entity)});
  MarkDirty();

  return *m_Entries.back().Loaded;
}

File &Dir::CreateFile(const std::string &name)
{
  return Insert(name, File::New(GetStore())).AsFile();
}

Dir &Dir::CreateDir(const std::string &name)
{
  return Insert(name, Dir::New(GetStore())).AsDir();
}

SymLink &Dir::CreateSymLink(const std::string &name, const std::string &target)
{
  return Insert(name, SymLink::New(GetStore(), target)).AsSymLink();
}

Entity &Dir::Put(const std::string &name, std::unique_ptr<Entity> entity)
{
  if (!entity)
    throw std::invalid_argument("Dir::Put: entity must not be null");

  return Insert(name, std::move(entity));
}

void Dir::Remove(const std::string &name)
{
  auto it = std::find_if(m_Entries.begin(), m_Entries.end(), [&](const Child &c)
                         { return c.Name == name; });
  if (it == m_Entries.end())
    throw NotFoundError(name);
  if (it->Loaded && it->Loaded->Kind() == EntityKind::File && it->Loaded->AsFile().HasOpenOutputStream())
    throw StreamBusyError(name);

  m_Entries.erase(it);
  MarkDirty();
}

void Dir::Rename(const std::string &from, const std::string &to)
{
  Path::ValidateSegment(to);

  Child *child = Find(from);
  if (!child)
    throw NotFoundError(from);
  if (from == to)
    return;
  if (Find(to))
    throw AlreadyExistsError(to);

  child->Name = to;
  MarkDirty();
}

Entity &Dir::Get(const std::string &name)
{
  Child *child = Find(name);
  if (!child)
    throw NotFoundError(name);

  if (!child->Loaded)
  {
    auto entity = Entity::Load(*child->Target, GetStore());
    if (entity->Kind() != child->Kind)
      throw DecodeError("entry '" + name + "' is listed as a " + ToString(child->Kind) + " but stores a " + ToString(entity->Kind()));

    child->Loaded = std::move(entity);
  }

  return *child->Loaded;
}

File &Dir::GetFile(const std::string &name)
{
  return Get(name).AsFile();
}

Dir &Dir::GetDir(const std::string &name)
{
  return Get(name).AsDir();
}

SymLink &Dir::GetSymLink(const std::string &name)
{
  return Get(name).AsSymLink();
}

bool Dir::Contains(const std::string &name) const noexcept
{
  return Find(name) != nullptr;
}

std::vector<EntryRef> Dir::GetEntries() const
{
  std::vector<EntryRef> result;
  result.reserve(m_Entries.size());
  for (const auto &child : m_Entries)
    result.push_back(EntryRef{child.Name, child.Kind, child.Target, child.Dirty()});

  return result;
}

bool Dir::IsDirty() const
{
  if (OwnDirty())
    return true;

  return std::any_of(m_Entries.begin(), m_Entries.end(), [](const Child &c)
                     { return c.Dirty(); });
}

Cid Dir::Checkpoint()
{
  if (!IsDirty() && GetCid())
    return *GetCid();

  // Children first: this block embeds their CIDs.
  for (auto &child : m_Entries)
  {
    if (!child.Loaded)
      continue;

    const Cid childCid = child.Loaded->Checkpoint();
    if (child.Target != childCid)
    {
      child.Target = childCid;
      MarkDirty();
    }
  }

  DirNode node;
  node.Meta = NextMetadata();
  node.Entries.reserve(m_Entries.size());
  for (const auto &child : m_Entries)
    node.Entries.push_back(DirEntry{child.Name, child.Kind, *child.Target});

  const Cid cid = GetStore()->Put(Block::ToBlock(node));
  Log::Debug("Dir", "checkpoint " + CAS::ToHexString(cid) + " (" + std::to_string(node.Entries.size()) + " entries)");

  Committed(cid, std::move(node.Meta));
  return cid;
}

Node Dir::ToNode() const
{
  if (IsDirty() || !GetCid())
    throw std::logic_error("Dir: unpersisted changes, checkpoint first");

  DirNode node;
  node.Meta = GetMetadata();
  node.Entries.reserve(m_Entries.size());
  for (const auto &child : m_Entries)
    node.Entries.push_back(DirEntry{child.Name, child.Kind, *child.Target});

  return node;
}
