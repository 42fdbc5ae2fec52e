#include "FileStreams.hpp"
#include "../Errors.hpp"
#include "Block.hpp"
#include "File.hpp"
#include <algorithm>
#include <cstring>
#include <utility>

using namespace Monofs;

OutputStream::OutputStream(File &file)
    : m_File(&file)
{
  m_File->m_OpenStream = this;
}

OutputStream::OutputStream(OutputStream &&other) noexcept
    : m_File(std::exchange(other.m_File, nullptr)),
      m_Buffer(std::move(other.m_Buffer))
{
  if (m_File)
    m_File->m_OpenStream = this;
}

OutputStream::~OutputStream()
{
  Abort();
}

void OutputStream::Write(std::string_view data)
{
  if (!m_File)
    throw std::logic_error("OutputStream: write to a closed stream");

  m_Buffer.append(data.data(), data.size());
}

void OutputStream::Close()
{
  if (!m_File)
    throw std::logic_error("OutputStream: stream is already closed");

  auto content = std::make_shared<const Bytes>(std::move(m_Buffer));
  std::exchange(m_File, nullptr)->CommitStream(std::move(content));
  m_Buffer.clear();
}

void OutputStream::Abort() noexcept
{
  if (!m_File)
    return;

  std::exchange(m_File, nullptr)->ReleaseStream();
  m_Buffer.clear();
}

void OutputStream::Detach() noexcept
{
  m_File = nullptr;
  m_Buffer.clear();
}

InputStream::InputStream(std::shared_ptr<const Bytes> pending)
    : m_Current(std::move(pending)),
      m_Size(m_Current->size())
{
}

InputStream::InputStream(std::shared_ptr<Store> store, std::vector<Cid> chunks, std::uint64_t size)
    : m_Store(std::move(store)),
      m_Chunks(std::move(chunks)),
      m_Size(size)
{
}

bool InputStream::Fill()
{
  while (!m_Current || m_CurrentPos == m_Current->size())
  {
    if (m_NextChunk == m_Chunks.size())
    {
      if (m_Position != m_Size)
        throw DecodeError("file content is shorter than its recorded size");
      return false;
    }

    const Bytes block = m_Store->Get(m_Chunks[m_NextChunk++]);
    m_Current = std::make_shared<const Bytes>(Block::FromChunkBlock(block));
    m_CurrentPos = 0;

    if (m_Position + m_Current->size() > m_Size)
      throw DecodeError("file content is longer than its recorded size");
  }

  return true;
}

std::size_t InputStream::Read(char *buffer, std::size_t size)
{
  if (size == 0 || !Fill())
    return 0;

  const std::size_t n = std::min(size, m_Current->size() - m_CurrentPos);
  std::memcpy(buffer, m_Current->data() + m_CurrentPos, n);
  m_CurrentPos += n;
  m_Position += n;

  return n;
}

Bytes InputStream::ReadAll()
{
  Bytes result;
  result.reserve(static_cast<std::size_t>(m_Size - m_Position));

  while (Fill())
  {
    result.append(m_Current->data() + m_CurrentPos, m_Current->size() - m_CurrentPos);
    m_Position += m_Current->size() - m_CurrentPos;
    m_CurrentPos = m_Current->size();
  }

  return result;
}
