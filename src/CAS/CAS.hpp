#pragma once
#include "../Types.hpp"
#include <string_view>

struct evp_md_ctx_st;

/// @brief Content addressing primitives: SHA256 identities (OpenSSL EVP) and zstd block compression.
namespace Monofs::CAS
{
  /// @brief Calculate the identity of the given bytes.
  /// @param data Canonical bytes of one block.
  /// @return SHA256 identity
  [[nodiscard]] Cid Identify(std::string_view data);

  [[nodiscard]] std::string ToHexString(const Cid &identity);

  /// @brief Parse a 64 character hexadecimal identity.
  /// @throws DecodeError when the text is not a valid identity.
  [[nodiscard]] Cid FromHexString(std::string_view hex);

  /// @brief Compress a block into one zstd frame.
  /// @param data Uncompressed bytes.
  /// @param level zstd compression level.
  [[nodiscard]] Bytes Compress(std::string_view data, int level);

  /// @brief Decompress one zstd frame produced by @ref Compress.
  /// @throws DecodeError on corrupt or truncated frames.
  [[nodiscard]] Bytes Decompress(std::string_view frame);

  /// @brief Incremental SHA256 over data that arrives in pieces.
  class Hasher
  {
  public:
    Hasher();
    ~Hasher();

    Hasher(const Hasher &) = delete;
    Hasher &operator=(const Hasher &) = delete;

    void Update(std::string_view data);

    /// @brief Finalize the digest. The hasher cannot be updated afterwards.
    [[nodiscard]] Cid Finish();

  private:
    evp_md_ctx_st *m_Context = nullptr;
  };
}
