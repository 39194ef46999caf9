/**
 * @file Container.cpp
 * @brief Container sniffing and zstd/xz decoding.
 * @note Decoders use the streaming APIs so frames without a recorded content
 *       size (common for kmod-compressed modules) decode the same way.
 */

#include "src/object/inc/Container.hpp"

#include <lzma.h> // lzma_stream_decoder, lzma_code, lzma_end
#include <zstd.h> // ZSTD_decompressStream, ZSTD_DStreamOutSize

#include <cstring> // std::memcmp
#include <memory>  // std::unique_ptr

#include <fmt/core.h>

namespace modscout {

namespace object {

namespace {

/* ----------------------------- Constants ----------------------------- */

/// Output growth step for the xz decoder.
constexpr std::size_t XZ_CHUNK_SIZE = 256 * 1024;

/// Build a table entry from a byte signature.
template <std::size_t N>
constexpr ContainerCodec makeCodec(ContainerKind kind, const std::uint8_t (&magic)[N],
                                   bool passthrough, DecodeFn decode) noexcept {
  static_assert(N <= MAX_MAGIC_SIZE, "signature too long");
  ContainerCodec codec{};
  codec.kind = kind;
  for (std::size_t i = 0; i < N; ++i) {
    codec.magic[i] = magic[i];
  }
  codec.magicLen = N;
  codec.passthrough = passthrough;
  codec.decode = decode;
  return codec;
}

constexpr std::uint8_t ELF_MAGIC[] = {0x7F, 'E', 'L', 'F'};
constexpr std::uint8_t ZSTD_MAGIC[] = {0x28, 0xB5, 0x2F, 0xFD};
constexpr std::uint8_t XZ_MAGIC[] = {0xFD, '7', 'z', 'X', 'Z', 0x00};
constexpr std::uint8_t GZIP_MAGIC[] = {0x1F, 0x8B};
constexpr std::uint8_t BZIP2_MAGIC[] = {'B', 'Z', 'h'};
constexpr std::uint8_t LZ4_MAGIC[] = {0x04, 0x22, 0x4D, 0x18};

const ContainerCodec DEFAULT_CODECS[] = {
    makeCodec(ContainerKind::RAW_ELF, ELF_MAGIC, true, nullptr),
    makeCodec(ContainerKind::ZSTD, ZSTD_MAGIC, false, &decodeZstd),
    makeCodec(ContainerKind::XZ, XZ_MAGIC, false, &decodeXz),
    makeCodec(ContainerKind::GZIP, GZIP_MAGIC, false, nullptr),
    makeCodec(ContainerKind::BZIP2, BZIP2_MAGIC, false, nullptr),
    makeCodec(ContainerKind::LZ4, LZ4_MAGIC, false, nullptr),
};

/* ----------------------------- liblzma Helpers ----------------------------- */

/// Releases decoder state on scope exit.
class LzmaStreamGuard {
public:
  explicit LzmaStreamGuard(lzma_stream& strm) noexcept : strm_(strm) {}
  ~LzmaStreamGuard() { lzma_end(&strm_); }

  LzmaStreamGuard(const LzmaStreamGuard&) = delete;
  LzmaStreamGuard& operator=(const LzmaStreamGuard&) = delete;

private:
  lzma_stream& strm_;
};

const char* lzmaRetString(lzma_ret ret) noexcept {
  switch (ret) {
  case LZMA_MEM_ERROR:
    return "out of memory";
  case LZMA_MEMLIMIT_ERROR:
    return "memory limit reached";
  case LZMA_FORMAT_ERROR:
    return "not an xz stream";
  case LZMA_OPTIONS_ERROR:
    return "unsupported compression options";
  case LZMA_DATA_ERROR:
    return "corrupt data";
  case LZMA_BUF_ERROR:
    return "truncated input";
  default:
    return "internal decoder error";
  }
}

/* ----------------------------- libzstd Helpers ----------------------------- */

struct ZstdDCtxDeleter {
  void operator()(ZSTD_DCtx* ctx) const noexcept { ZSTD_freeDCtx(ctx); }
};

using ZstdDCtxPtr = std::unique_ptr<ZSTD_DCtx, ZstdDCtxDeleter>;

} // namespace

/* ----------------------------- Status Helpers ----------------------------- */

const char* toString(ObjectStatus status) noexcept {
  switch (status) {
  case ObjectStatus::OK:
    return "OK";
  case ObjectStatus::UNKNOWN_CONTAINER:
    return "UNKNOWN_CONTAINER";
  case ObjectStatus::UNSUPPORTED_CONTAINER:
    return "UNSUPPORTED_CONTAINER";
  case ObjectStatus::DECOMPRESS_FAILED:
    return "DECOMPRESS_FAILED";
  case ObjectStatus::NOT_AN_OBJECT:
    return "NOT_AN_OBJECT";
  case ObjectStatus::MALFORMED_OBJECT:
    return "MALFORMED_OBJECT";
  }
  return "UNKNOWN";
}

const char* toString(ContainerKind kind) noexcept {
  switch (kind) {
  case ContainerKind::UNKNOWN:
    return "unknown";
  case ContainerKind::RAW_ELF:
    return "elf";
  case ContainerKind::ZSTD:
    return "zstd";
  case ContainerKind::XZ:
    return "xz";
  case ContainerKind::GZIP:
    return "gzip";
  case ContainerKind::BZIP2:
    return "bzip2";
  case ContainerKind::LZ4:
    return "lz4";
  }
  return "unknown";
}

/* ----------------------------- ContainerCodec Methods ----------------------------- */

bool ContainerCodec::matches(std::span<const std::uint8_t> data) const noexcept {
  if (magicLen == 0 || data.size() < magicLen) {
    return false;
  }
  return std::memcmp(data.data(), magic.data(), magicLen) == 0;
}

/* ----------------------------- API ----------------------------- */

std::span<const ContainerCodec> defaultCodecs() noexcept { return DEFAULT_CODECS; }

const ContainerCodec* sniffContainer(std::span<const std::uint8_t> data,
                                     std::span<const ContainerCodec> codecs) noexcept {
  for (const ContainerCodec& codec : codecs) {
    if (codec.matches(data)) {
      return &codec;
    }
  }
  return nullptr;
}

ContainerKind detectContainer(std::span<const std::uint8_t> data) noexcept {
  const ContainerCodec* codec = sniffContainer(data);
  return (codec != nullptr) ? codec->kind : ContainerKind::UNKNOWN;
}

ObjectStatus decodeContainer(ByteBuffer& data, std::string& detail,
                             std::span<const ContainerCodec> codecs) {
  const ContainerCodec* codec = sniffContainer(data, codecs);
  if (codec == nullptr) {
    detail = "unrecognised container format";
    return ObjectStatus::UNKNOWN_CONTAINER;
  }

  if (codec->passthrough) {
    return ObjectStatus::OK;
  }

  if (codec->decode == nullptr) {
    detail = fmt::format("unsupported container format '{}'", toString(codec->kind));
    return ObjectStatus::UNSUPPORTED_CONTAINER;
  }

  ByteBuffer decoded;
  std::string error;
  if (!codec->decode(data, decoded, error)) {
    detail = fmt::format("{} decompression failed: {}", toString(codec->kind), error);
    return ObjectStatus::DECOMPRESS_FAILED;
  }

  data = std::move(decoded);
  return ObjectStatus::OK;
}

bool decodeZstd(std::span<const std::uint8_t> in, ByteBuffer& out, std::string& error) {
  return decodeZstd(in, out, error, MAX_DECODED_SIZE);
}

bool decodeZstd(std::span<const std::uint8_t> in, ByteBuffer& out, std::string& error,
                std::size_t maxOutput) {
  out.clear();

  ZstdDCtxPtr ctx(ZSTD_createDCtx());
  if (!ctx) {
    error = "cannot allocate decoder context";
    return false;
  }

  const std::size_t CHUNK = ZSTD_DStreamOutSize();
  ZSTD_inBuffer input{in.data(), in.size(), 0};
  std::size_t total = 0;
  std::size_t hint = 0;

  for (;;) {
    out.resize(total + CHUNK);
    ZSTD_outBuffer output{out.data() + total, CHUNK, 0};
    hint = ZSTD_decompressStream(ctx.get(), &output, &input);
    if (ZSTD_isError(hint) != 0U) {
      out.clear();
      error = ZSTD_getErrorName(hint);
      return false;
    }
    total += output.pos;
    if (total > maxOutput) {
      out.clear();
      error = fmt::format("decoded size exceeds {} bytes", maxOutput);
      return false;
    }

    // Input drained and the decoder had room to spare: nothing left buffered.
    if (input.pos == input.size && output.pos < output.size) {
      break;
    }
  }
  out.resize(total);

  if (hint != 0) {
    out.clear();
    error = "truncated frame";
    return false;
  }
  return true;
}

bool decodeXz(std::span<const std::uint8_t> in, ByteBuffer& out, std::string& error) {
  return decodeXz(in, out, error, MAX_DECODED_SIZE);
}

bool decodeXz(std::span<const std::uint8_t> in, ByteBuffer& out, std::string& error,
              std::size_t maxOutput) {
  out.clear();

  lzma_stream strm = LZMA_STREAM_INIT;
  lzma_ret ret = lzma_stream_decoder(&strm, XZ_MEMORY_LIMIT, LZMA_CONCATENATED);
  if (ret != LZMA_OK) {
    error = lzmaRetString(ret);
    return false;
  }
  LzmaStreamGuard guard(strm);

  strm.next_in = in.data();
  strm.avail_in = in.size();

  std::size_t total = 0;
  for (;;) {
    out.resize(total + XZ_CHUNK_SIZE);
    strm.next_out = out.data() + total;
    strm.avail_out = XZ_CHUNK_SIZE;

    ret = lzma_code(&strm, LZMA_FINISH);
    total += XZ_CHUNK_SIZE - strm.avail_out;
    if (total > maxOutput) {
      out.clear();
      error = fmt::format("decoded size exceeds {} bytes", maxOutput);
      return false;
    }

    if (ret == LZMA_STREAM_END) {
      break;
    }
    if (ret != LZMA_OK) {
      out.clear();
      error = lzmaRetString(ret);
      return false;
    }
  }

  out.resize(total);
  return true;
}

} // namespace object

} // namespace modscout
