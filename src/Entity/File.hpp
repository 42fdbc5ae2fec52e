#pragma once
#include "Entity.hpp"
#include "FileStreams.hpp"

namespace Monofs
{
  /// @brief File content as an ordered list of content-addressed chunks plus metadata.
  ///
  /// Content is changed through an OutputStream and read through an InputStream. At checkpoint
  /// the pending content is split into chunks of the store's configured chunk size; each chunk is
  /// stored as its own block, so unchanged chunks of a rewritten file deduplicate.
  class File final : public Entity
  {
  public:
    [[nodiscard]] static std::unique_ptr<File> New(const std::shared_ptr<Store> &store);

    /// @throws NotAFileError when @p cid is a directory.
    [[nodiscard]] static std::unique_ptr<File> Load(const Cid &cid, const std::shared_ptr<Store> &store);

  public:
    ~File() override;

    /// @throws StreamBusyError when another output stream is still open.
    [[nodiscard]] OutputStream GetOutputStream();

    [[nodiscard]] InputStream GetInputStream() const;

    [[nodiscard]] Bytes ReadAll() const;

    /// @brief Size of the current content, pending or persisted.
    [[nodiscard]] std::uint64_t Size() const noexcept;

    /// @brief Chunk CIDs of the last checkpointed version.
    [[nodiscard]] inline const std::vector<Cid> &ChunkCids() const noexcept
    {
      return m_Chunks;
    }

    [[nodiscard]] inline bool HasOpenOutputStream() const noexcept
    {
      return m_OpenStream != nullptr;
    }

    [[nodiscard]] bool IsDirty() const override;
    Cid Checkpoint() override;
    [[nodiscard]] Node ToNode() const override;

  private:
    friend class Entity;
    friend class OutputStream;

    File(const std::shared_ptr<Store> &store, Metadata metadata, std::optional<Cid> cid);

    [[nodiscard]] static std::unique_ptr<File> Restore(FileNode node, const Cid &cid, const std::shared_ptr<Store> &store);

    void CommitStream(std::shared_ptr<const Bytes> content) noexcept;
    void ReleaseStream() noexcept;

  private:
    std::vector<Cid> m_Chunks;
    std::uint64_t m_Size = 0;
    std::shared_ptr<const Bytes> m_Pending;
    /// @brief The open output stream, if any. Detached when this File is destroyed.
    OutputStream *m_OpenStream = nullptr;
  };
}
