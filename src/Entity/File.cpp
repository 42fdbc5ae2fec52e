#include "File.hpp"
#include "../CAS/CAS.hpp"
#include "../Errors.hpp"
#include "../Log.hpp"
#include <algorithm>

using namespace Monofs;

File::File(const std::shared_ptr<Store> &store, Metadata metadata, std::optional<Cid> cid)
    : Entity(store, std::move(metadata), std::move(cid))
{
}

File::~File()
{
  if (m_OpenStream)
    m_OpenStream->Detach();
}

std::unique_ptr<File> File::New(const std::shared_ptr<Store> &store)
{
  return std::unique_ptr<File>(new File(store, Metadata::Create(EntityKind::File), std::nullopt));
}

std::unique_ptr<File> File::Load(const Cid &cid, const std::shared_ptr<Store> &store)
{
  auto node = Block::FromBlock(store->Get(cid));
  auto *file = std::get_if<FileNode>(&node);
  if (!file)
    throw NotAFileError(CAS::ToHexString(cid));

  return Restore(std::move(*file), cid, store);
}

std::unique_ptr<File> File::Restore(FileNode node, const Cid &cid, const std::shared_ptr<Store> &store)
{
  auto file = std::unique_ptr<File>(new File(store, std::move(node.Meta), cid));
  file->m_Chunks = std::move(node.Chunks);
  file->m_Size = node.Size;
  return file;
}

OutputStream File::GetOutputStream()
{
  if (m_OpenStream)
    throw StreamBusyError(GetCid() ? CAS::ToHexString(*GetCid()) : "unpersisted file");

  return OutputStream(*this);
}

InputStream File::GetInputStream() const
{
  if (m_Pending)
    return InputStream(m_Pending);

  return InputStream(GetStore(), m_Chunks, m_Size);
}

Bytes File::ReadAll() const
{
  return GetInputStream().ReadAll();
}

std::uint64_t File::Size() const noexcept
{
  return m_Pending ? m_Pending->size() : m_Size;
}

bool File::IsDirty() const
{
  return OwnDirty();
}

Cid File::Checkpoint()
{
  if (!IsDirty() && GetCid())
    return *GetCid();

  FileNode node;
  node.Meta = NextMetadata();

  if (m_Pending)
  {
    const std::string_view content(*m_Pending);
    const std::size_t chunkSize = GetStore()->GetConfig().ChunkSize;

    node.Size = content.size();
    node.Chunks.reserve((content.size() + chunkSize - 1) / chunkSize);
    for (std::size_t offset = 0; offset < content.size(); offset += chunkSize)
      node.Chunks.push_back(GetStore()->Put(Block::ToChunkBlock(content.substr(offset, chunkSize))));
  }
  else
  {
    node.Size = m_Size;
    node.Chunks = m_Chunks;
  }

  const Cid cid = GetStore()->Put(Block::ToBlock(node));
  Log::Debug("File", "checkpoint " + CAS::ToHexString(cid) + " (" + std::to_string(node.Size) + " bytes, " + std::to_string(node.Chunks.size()) + " chunks)");

  m_Chunks = std::move(node.Chunks);
  m_Size = node.Size;
  m_Pending.reset();
  Committed(cid, std::move(node.Meta));

  return cid;
}

Node File::ToNode() const
{
  if (IsDirty() || !GetCid())
    throw std::logic_error("File: unpersisted changes, checkpoint first");

  return FileNode{GetMetadata(), m_Size, m_Chunks};
}

void File::CommitStream(std::shared_ptr<const Bytes> content) noexcept
{
  m_Pending = std::move(content);
  m_OpenStream = nullptr;
  MarkDirty();
}

void File::ReleaseStream() noexcept
{
  m_OpenStream = nullptr;
}
