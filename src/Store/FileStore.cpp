#include "FileStore.hpp"
#include "../CAS/CAS.hpp"
#include "../Errors.hpp"
#include "../Log.hpp"
#include <fstream>
#include <random>
#include <thread>

using namespace Monofs;
namespace fs = std::filesystem;

/// @brief Private helper declarations
namespace
{
  inline fs::path ObjectStore(const fs::path &root) noexcept
  {
    return root / "Objects";
  }

  inline fs::path TempDir(const fs::path &root) noexcept
  {
    return ObjectStore(root) / ".tmp";
  }

  inline fs::path CASLocation(const fs::path &objectStore, const std::string &identity) noexcept
  {
    return objectStore / identity.substr(0, 2) / identity.substr(2, 2) / identity;
  }

  inline uint64_t Rand64() noexcept
  {
    static thread_local std::mt19937_64 rng{
        std::random_device{}() ^
        (uint64_t(std::hash<std::thread::id>{}(std::this_thread::get_id())) << 1)};
    return rng();
  }
}

FileStore::FileStore(const fs::path &root, const Config &config)
    : Store(config),
      m_Root(root)
{
  std::error_code ec;
  fs::create_directories(::TempDir(m_Root), ec);
  if (ec)
    throw StoreUnavailableError("cannot create " + ::TempDir(m_Root).string() + ": " + ec.message());

  Log::Info("FileStore", "opened " + m_Root.string());
}

fs::path FileStore::ObjectPath(const Cid &cid) const
{
  return ::CASLocation(::ObjectStore(m_Root), CAS::ToHexString(cid));
}

Cid FileStore::Put(std::string_view block)
{
  m_Puts++;

  const Cid cid = CAS::Identify(block);
  const fs::path objPath = ObjectPath(cid);

  std::error_code ec;
  if (fs::exists(objPath, ec))
  {
    Log::Debug("FileStore", "dedup " + CAS::ToHexString(cid));
    return cid;
  }

  const Bytes frame = CAS::Compress(block, GetConfig().CompressionLevel);

  const fs::path tmpPath = ::TempDir(m_Root) / ("tmp-" + std::to_string(::Rand64()) + ".zst");
  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out)
      throw StoreUnavailableError("open temp failed: " + tmpPath.string());

    out.write(frame.data(), static_cast<std::streamsize>(frame.size()));
    out.flush();
    if (!out)
    {
      out.close();
      fs::remove(tmpPath, ec);
      throw StoreUnavailableError("write failed: " + tmpPath.string());
    }
  }

  fs::create_directories(objPath.parent_path(), ec);
  if (ec)
  {
    fs::remove(tmpPath, ec);
    throw StoreUnavailableError("cannot create " + objPath.parent_path().string());
  }

  // Atomic install: try rename; if target already exists, drop temp
  fs::rename(tmpPath, objPath, ec);
  if (ec)
  {
    std::error_code ec2;
    const bool installed = fs::exists(objPath, ec2);
    fs::remove(tmpPath, ec2);
    if (!installed)
      throw StoreUnavailableError("rename failed: " + ec.message());

    // Another writer already stored it
    return cid;
  }

  m_Writes++;
  m_BytesWritten += block.size();
  Log::Debug("FileStore", "stored " + CAS::ToHexString(cid) + " (" + std::to_string(block.size()) + " bytes)");

  return cid;
}

Bytes FileStore::Get(const Cid &cid) const
{
  m_Gets++;

  const fs::path obj = ObjectPath(cid);
  std::error_code ec;
  if (!fs::exists(obj, ec))
  {
    if (ec)
      throw StoreUnavailableError("cannot stat " + obj.string() + ": " + ec.message());
    throw NotFoundError("block " + CAS::ToHexString(cid));
  }

  std::ifstream in(obj, std::ios::binary);
  if (!in)
    throw StoreUnavailableError("cannot open object " + obj.string());

  Bytes frame((std::istreambuf_iterator<char>(in)), {});
  if (in.bad())
    throw StoreUnavailableError("read failed: " + obj.string());

  Bytes block = CAS::Decompress(frame);
  if (CAS::Identify(block) != cid)
    throw DecodeError("integrity check failed for block " + CAS::ToHexString(cid));

  return block;
}

bool FileStore::Has(const Cid &cid) const
{
  std::error_code ec;
  return fs::exists(ObjectPath(cid), ec);
}

StoreStats FileStore::Stats() const
{
  StoreStats result;
  result.Writes = m_Writes.load();
  result.Puts = m_Puts.load();
  result.Gets = m_Gets.load();
  result.BytesWritten = m_BytesWritten.load();

  const fs::path objectStore = ::ObjectStore(m_Root);
  std::error_code ec;
  for (auto it = fs::recursive_directory_iterator(objectStore, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec))
  {
    if (it->path().filename() == ".tmp")
    {
      it.disable_recursion_pending();
      continue;
    }

    if (it->is_regular_file())
      result.Blocks++;
  }

  if (ec)
    throw StoreUnavailableError("cannot scan " + objectStore.string() + ": " + ec.message());

  return result;
}
