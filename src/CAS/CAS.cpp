#include "CAS.hpp"
#include "../Errors.hpp"
#include <cstring>
#include <openssl/evp.h>
#include <vector>
#include <zstd.h>

using namespace Monofs;

/// @brief Private helper declarations
namespace
{
  [[nodiscard]] std::string ToHex(const unsigned char *d, size_t n);
  [[nodiscard]] EVP_MD_CTX *InitHash();
  void UpdateHash(EVP_MD_CTX *md, const char *data, size_t len);
  [[nodiscard]] Cid CloseHash(EVP_MD_CTX *md);

  [[nodiscard]] int FromHexDigit(char c) noexcept
  {
    if (c >= '0' && c <= '9')
      return c - '0';
    if (c >= 'a' && c <= 'f')
      return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
      return c - 'A' + 10;
    return -1;
  }
}

Cid Monofs::CAS::Identify(std::string_view data)
{
  Hasher hasher;
  hasher.Update(data);
  return hasher.Finish();
}

std::string Monofs::CAS::ToHexString(const Cid &identity)
{
  return ::ToHex(identity.data(), identity.size());
}

Cid Monofs::CAS::FromHexString(std::string_view hex)
{
  Cid result{};
  if (hex.size() != result.size() * 2)
    throw DecodeError("identity must have " + std::to_string(result.size() * 2) + " hex characters");

  for (size_t i = 0; i < result.size(); i++)
  {
    int hi = ::FromHexDigit(hex[2 * i]);
    int lo = ::FromHexDigit(hex[2 * i + 1]);
    if (hi < 0 || lo < 0)
      throw DecodeError("identity contains non-hex characters");

    result[i] = static_cast<uint8_t>((hi << 4) | lo);
  }

  return result;
}

Bytes Monofs::CAS::Compress(std::string_view data, int level)
{
  ZSTD_CCtx *cctx = ZSTD_createCCtx();
  if (!cctx)
    throw std::runtime_error("ZSTD_createCCtx failed");

  ZSTD_CCtx_setPledgedSrcSize(cctx, static_cast<unsigned long long>(data.size()));
  ZSTD_CCtx_setParameter(cctx, ZSTD_c_contentSizeFlag, 1); // store original size in frame
  ZSTD_CCtx_setParameter(cctx, ZSTD_c_compressionLevel, level);

  constexpr size_t OUT_CHUNK = 1u << 17; // 128 KiB
  std::vector<char> outBuf(OUT_CHUNK);
  Bytes result;
  result.reserve(ZSTD_compressBound(data.size()));

  ZSTD_inBuffer zin{data.data(), data.size(), 0};
  for (;;)
  {
    ZSTD_outBuffer zout{outBuf.data(), outBuf.size(), 0};
    size_t r = ZSTD_compressStream2(cctx, &zout, &zin, ZSTD_e_end);

    if (ZSTD_isError(r))
    {
      ZSTD_freeCCtx(cctx);
      throw std::runtime_error(std::string("zstd compressStream2 failed: ") + ZSTD_getErrorName(r));
    }

    result.append(outBuf.data(), zout.pos);

    if (r == 0)
      break; // done
  }

  ZSTD_freeCCtx(cctx);
  return result;
}

Bytes Monofs::CAS::Decompress(std::string_view frame)
{
  ZSTD_DCtx *dctx = ZSTD_createDCtx();
  if (!dctx)
    throw std::runtime_error("ZSTD_createDCtx failed");

  const size_t outChunk = ZSTD_DStreamOutSize();
  std::vector<char> outBuf(outChunk);
  Bytes result;

  ZSTD_inBuffer zin{frame.data(), frame.size(), 0};
  bool frameEnded = false;
  while (!frameEnded)
  {
    ZSTD_outBuffer zout{outBuf.data(), outBuf.size(), 0};
    size_t const r = ZSTD_decompressStream(dctx, &zout, &zin);

    if (ZSTD_isError(r))
    {
      ZSTD_freeDCtx(dctx);
      throw DecodeError(std::string("zstd decompressStream failed: ") + ZSTD_getErrorName(r));
    }

    result.append(outBuf.data(), zout.pos);

    if (r == 0)
    {
      frameEnded = true;
    }
    else if (zin.pos == zin.size && zout.pos < zout.size)
    {
      // decoder still expects more input: the stored frame is truncated
      ZSTD_freeDCtx(dctx);
      throw DecodeError("unexpected end of compressed frame");
    }
  }

  ZSTD_freeDCtx(dctx);

  if (zin.pos != zin.size)
    throw DecodeError("trailing bytes after compressed frame");

  return result;
}

CAS::Hasher::Hasher()
    : m_Context(::InitHash())
{
}

CAS::Hasher::~Hasher()
{
  if (m_Context)
    EVP_MD_CTX_free(m_Context);
}

void CAS::Hasher::Update(std::string_view data)
{
  if (!m_Context)
    throw std::logic_error("Hasher: update after finish");

  ::UpdateHash(m_Context, data.data(), data.size());
}

Cid CAS::Hasher::Finish()
{
  if (!m_Context)
    throw std::logic_error("Hasher: finished twice");

  auto md = m_Context;
  m_Context = nullptr;
  return ::CloseHash(md);
}

namespace
{
  EVP_MD_CTX *InitHash()
  {
    EVP_MD_CTX *md = EVP_MD_CTX_new();
    if (!md)
      throw std::runtime_error("EVP_MD_CTX_new failed");

    if (EVP_DigestInit_ex(md, EVP_sha256(), nullptr) != 1)
    {
      EVP_MD_CTX_free(md);
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }

    return md;
  }

  void UpdateHash(EVP_MD_CTX *md, const char *data, size_t len)
  {
    if (EVP_DigestUpdate(md, data, len) != 1)
      throw std::runtime_error("EVP_DigestUpdate failed");
  }

  Cid CloseHash(EVP_MD_CTX *md)
  {
    // finalize hash
    unsigned char mdBuf[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (EVP_DigestFinal_ex(md, mdBuf, &mdLen) != 1)
    {
      EVP_MD_CTX_free(md);
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    EVP_MD_CTX_free(md);

    Cid result{};
    if (mdLen != result.size())
      throw std::runtime_error("unexpected digest length: " + std::to_string(mdLen));

    std::memcpy(result.data(), mdBuf, result.size());
    return result;
  }

  std::string ToHex(const unsigned char *d, size_t n)
  {
    static const char *H = "0123456789abcdef";

    std::string s;
    s.resize(n * 2);

    for (size_t i = 0; i < n; i++)
    {
      s[2 * i] = H[(d[i] >> 4) & 0xF];
      s[2 * i + 1] = H[d[i] & 0xF];
    }

    return s;
  }
}
