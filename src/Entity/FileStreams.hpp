#pragma once
#include "../Store/Store.hpp"
#include <memory>
#include <string_view>
#include <vector>

namespace Monofs
{
  class File;

  /// @brief Buffered writer over a File.
  ///
  /// Bytes accumulate in the stream's own buffer. Close() makes them the file's pending
  /// content, replacing whatever was there. Dropping the stream without Close() discards the
  /// buffer and leaves the file untouched. Only one OutputStream may be open per File. A stream
  /// whose File is destroyed first is closed, and its buffered bytes are dropped.
  class OutputStream
  {
  public:
    OutputStream(OutputStream &&other) noexcept;
    OutputStream &operator=(OutputStream &&) = delete;
    OutputStream(const OutputStream &) = delete;
    OutputStream &operator=(const OutputStream &) = delete;
    ~OutputStream();

    /// @throws std::logic_error once the stream is closed.
    void Write(std::string_view data);

    /// @brief Commit the buffered bytes as the file's pending content and release the file.
    void Close();

    /// @brief Discard the buffered bytes and release the file.
    void Abort() noexcept;

    [[nodiscard]] inline bool IsOpen() const noexcept
    {
      return m_File != nullptr;
    }

    [[nodiscard]] inline std::uint64_t BytesBuffered() const noexcept
    {
      return m_Buffer.size();
    }

  private:
    friend class File;
    explicit OutputStream(File &file);

    /// @brief Called by the File's destructor.
    void Detach() noexcept;

  private:
    File *m_File;
    Bytes m_Buffer;
  };

  /// @brief Lazy, finite, single-pass reader over one version of a File's content.
  ///
  /// Reads a persisted file chunk by chunk on demand; reads pending content from an in-memory
  /// snapshot taken when the stream was opened. Not restartable: open a new stream to read again.
  class InputStream
  {
  public:
    InputStream(InputStream &&) noexcept = default;
    InputStream &operator=(InputStream &&) noexcept = default;
    InputStream(const InputStream &) = delete;
    InputStream &operator=(const InputStream &) = delete;

    /// @brief Read up to @p size bytes.
    /// @return Bytes copied into @p buffer; 0 once the content is exhausted.
    /// @throws NotFoundError, DecodeError, StoreUnavailableError from the store.
    std::size_t Read(char *buffer, std::size_t size);

    /// @brief Drain everything that has not been read yet.
    [[nodiscard]] Bytes ReadAll();

    /// @brief Total content size of the version being read.
    [[nodiscard]] inline std::uint64_t Size() const noexcept
    {
      return m_Size;
    }

    [[nodiscard]] inline std::uint64_t Position() const noexcept
    {
      return m_Position;
    }

    [[nodiscard]] inline bool AtEnd() const noexcept
    {
      return m_Position == m_Size;
    }

  private:
    friend class File;
    explicit InputStream(std::shared_ptr<const Bytes> pending);
    InputStream(std::shared_ptr<Store> store, std::vector<Cid> chunks, std::uint64_t size);

    /// @brief Make sure the current buffer has unread bytes. Returns false at end of content.
    bool Fill();

  private:
    std::shared_ptr<Store> m_Store;
    std::vector<Cid> m_Chunks;
    std::size_t m_NextChunk = 0;
    std::shared_ptr<const Bytes> m_Current;
    std::size_t m_CurrentPos = 0;
    std::uint64_t m_Size = 0;
    std::uint64_t m_Position = 0;
  };
}
