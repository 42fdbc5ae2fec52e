#include "Vault.hpp"
#include "CAS/CAS.hpp"
#include "Entity/File.hpp"
#include "Entity/Path.hpp"
#include "Entity/SymLink.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <fstream>
#include <set>
#include <vector>

using namespace Monofs;
namespace fs = std::filesystem;

namespace
{
  constexpr size_t IN_CHUNK = 1u << 20; // 1 MiB

  /// @brief Chunk CIDs the local file would get if it were checkpointed with @p chunkSize.
  std::vector<Cid> LocalChunkCids(const fs::path &file, size_t chunkSize)
  {
    std::ifstream in(file, std::ios::binary);
    if (!in)
      throw std::runtime_error("Vault: cannot open input " + file.string());

    std::vector<Cid> result;
    std::vector<char> buf(chunkSize);
    for (;;)
    {
      in.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      std::streamsize got = in.gcount();
      if (got <= 0)
        break;

      result.push_back(CAS::Identify(Block::ToChunkBlock(std::string_view(buf.data(), static_cast<size_t>(got)))));
    }

    if (in.bad())
      throw std::runtime_error("Vault: read failed " + file.string());

    return result;
  }
}

Vault::Vault(const fs::path &archive, const Config &config)
    : m_ArchiveRoot(archive)
{
  m_Store = FileStore::Open(m_ArchiveRoot, config);
  m_Database = DB::Database::Open(m_ArchiveRoot / "content.db");
  Log::Info("Vault", m_ArchiveRoot.string());
}

Cid Vault::Push(const fs::path &localFolder)
{
  if (!fs::is_directory(localFolder))
    throw std::runtime_error("Vault: not a directory " + localFolder.string());

  auto latest = m_Database->LatestRoot(RootName);
  auto root = latest ? Dir::Load(latest->Target, m_Store) : Dir::New(m_Store);

  Import(*root, localFolder);

  const Cid cid = root->Checkpoint();
  if (!latest || latest->Target != cid)
    m_Database->RecordRoot(RootName, cid);
  else
    Log::Info("Vault", "nothing changed");

  return cid;
}

void Vault::Import(Dir &dir, const fs::path &localFolder)
{
  std::set<std::string> seen;

  for (const auto &entry : fs::directory_iterator(localFolder))
  {
    const std::string name = entry.path().filename().string();
    if (!Path::IsValidSegment(name))
      continue;

    const bool isLink = entry.is_symlink();
    const bool isDir = !isLink && entry.is_directory();
    if (!isLink && !isDir && !entry.is_regular_file())
      continue;

    seen.insert(name);

    const EntityKind kind = isLink ? EntityKind::SymLink : isDir ? EntityKind::Directory : EntityKind::File;
    if (dir.Contains(name) && dir.Get(name).Kind() != kind)
      dir.Remove(name);

    if (isLink)
    {
      const std::string target = fs::read_symlink(entry.path()).string();
      if (dir.Contains(name))
        dir.GetSymLink(name).SetTarget(target);
      else
        dir.CreateSymLink(name, target);
    }
    else if (isDir)
    {
      Dir &child = dir.Contains(name) ? dir.GetDir(name) : dir.CreateDir(name);
      Import(child, entry.path());
    }
    else
    {
      ImportFile(dir, name, entry.path());
    }
  }

  for (const auto &ref : dir.GetEntries())
  {
    if (!seen.contains(ref.Name))
    {
      Log::Info("Vault", "removing '" + ref.Name + "'");
      dir.Remove(ref.Name);
    }
  }
}

void Vault::ImportFile(Dir &dir, const std::string &name, const fs::path &localFile)
{
  if (dir.Contains(name))
  {
    const File &existing = dir.GetFile(name);
    if (!existing.IsDirty() && existing.ChunkCids() == ::LocalChunkCids(localFile, m_Store->GetConfig().ChunkSize))
      return;
  }

  Log::Info("Vault", "Uploading '" + localFile.string() + "'...");

  File &file = dir.Contains(name) ? dir.GetFile(name) : dir.CreateFile(name);

  std::ifstream in(localFile, std::ios::binary);
  if (!in)
    throw std::runtime_error("Vault: cannot open input " + localFile.string());

  auto out = file.GetOutputStream();
  std::vector<char> inBuf(IN_CHUNK);
  for (;;)
  {
    in.read(inBuf.data(), static_cast<std::streamsize>(inBuf.size()));
    std::streamsize got = in.gcount();
    if (got <= 0)
      break;

    out.Write(std::string_view(inBuf.data(), static_cast<size_t>(got)));
  }

  if (in.bad())
    throw std::runtime_error("Vault: read failed " + localFile.string());

  out.Close();
}

void Vault::Pop(const fs::path &localFolder, const std::optional<Cid> &version)
{
  Cid cid{};
  if (version)
  {
    cid = *version;
  }
  else
  {
    auto latest = m_Database->LatestRoot(RootName);
    if (!latest)
      throw NotFoundError("no root has been pushed to " + m_ArchiveRoot.string());
    cid = latest->Target;
  }

  auto root = Dir::Load(cid, m_Store);
  fs::create_directories(localFolder);
  Materialize(*root, localFolder);
}

void Vault::Materialize(Dir &dir, const fs::path &localFolder)
{
  for (const auto &ref : dir.GetEntries())
  {
    const fs::path target = localFolder / ref.Name;

    if (ref.Kind == EntityKind::Directory)
    {
      fs::create_directories(target);
      Materialize(dir.GetDir(ref.Name), target);
      continue;
    }

    if (ref.Kind == EntityKind::SymLink)
    {
      std::error_code ec;
      fs::remove(target, ec);
      fs::create_symlink(dir.GetSymLink(ref.Name).GetTarget(), target, ec);
      if (ec)
        throw std::runtime_error("Vault: cannot create symlink " + target.string() + ": " + ec.message());
      continue;
    }

    // temp file (atomic install)
    const fs::path tmpFile = localFolder / ("." + ref.Name + ".part");
    {
      std::ofstream out(tmpFile, std::ios::binary | std::ios::trunc);
      if (!out)
        throw std::runtime_error("Vault: cannot open temp output " + tmpFile.string());

      auto in = dir.GetFile(ref.Name).GetInputStream();
      std::vector<char> buf(IN_CHUNK);
      while (size_t got = in.Read(buf.data(), buf.size()))
      {
        out.write(buf.data(), static_cast<std::streamsize>(got));
        if (!out)
          throw std::runtime_error("Vault: write failed " + tmpFile.string());
      }
    }

    std::error_code ec;
    fs::rename(tmpFile, target, ec);
    if (ec)
    {
      fs::remove(tmpFile, ec);
      throw std::runtime_error("Vault: install failed " + target.string());
    }
  }
}

std::vector<std::shared_ptr<DB::Root>> Vault::History()
{
  return m_Database->RootHistory(RootName);
}
