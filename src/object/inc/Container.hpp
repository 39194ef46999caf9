#ifndef MODSCOUT_OBJECT_CONTAINER_HPP
#define MODSCOUT_OBJECT_CONTAINER_HPP
/**
 * @file Container.hpp
 * @brief Container sniffing and decompression for module files.
 * @note Thread-safe: All functions are stateless and safe to call concurrently.
 *
 * Module files ship either as plain ELF objects or wrapped in a compressor
 * (kmod installs .ko.zst / .ko.xz). The container is identified from the
 * leading magic bytes, never from the file name. Classification is a table
 * of ContainerCodec entries: each maps a signature to a kind and, when the
 * kind is decodable, to a decoder. New formats are added by extending the
 * table or by passing a custom one.
 */

#include <array>   // std::array
#include <cstddef> // std::size_t
#include <cstdint> // std::uint8_t
#include <span>    // std::span
#include <string>  // std::string
#include <vector>  // std::vector

namespace modscout {

namespace object {

/* ----------------------------- Constants ----------------------------- */

/// Longest signature any codec matches on.
inline constexpr std::size_t MAX_MAGIC_SIZE = 8;

/// Largest decompressed image accepted by the built-in decoders.
inline constexpr std::size_t MAX_DECODED_SIZE = std::size_t{2} << 30;

/// Decoder memory limit handed to liblzma.
inline constexpr std::uint64_t XZ_MEMORY_LIMIT = std::uint64_t{256} << 20;

/// Owned byte buffer.
using ByteBuffer = std::vector<std::uint8_t>;

/* ----------------------------- ObjectStatus ----------------------------- */

/**
 * @brief Status codes for container decoding and object parsing.
 */
enum class ObjectStatus : std::uint8_t {
  OK = 0,
  UNKNOWN_CONTAINER,     ///< No signature matched.
  UNSUPPORTED_CONTAINER, ///< Signature matched a format without a decoder.
  DECOMPRESS_FAILED,     ///< Decoder rejected the stream.
  NOT_AN_OBJECT,         ///< Not an ELF image, or an ELF class/encoding we do not read.
  MALFORMED_OBJECT,      ///< ELF image with inconsistent or out-of-bounds tables.
};

/// @brief Human-readable status string.
[[nodiscard]] const char* toString(ObjectStatus status) noexcept;

/* ----------------------------- ContainerKind ----------------------------- */

/**
 * @brief Detected container type.
 */
enum class ContainerKind : std::uint8_t {
  UNKNOWN = 0,
  RAW_ELF,
  ZSTD,
  XZ,
  GZIP,
  BZIP2,
  LZ4,
};

/// @brief Short name ("elf", "zstd", "xz", ...).
[[nodiscard]] const char* toString(ContainerKind kind) noexcept;

/* ----------------------------- ContainerCodec ----------------------------- */

/**
 * @brief Decoder callback.
 * @param in Compressed stream.
 * @param out Receives the decompressed bytes.
 * @param error Set to a description on failure.
 * @return true on success.
 */
using DecodeFn = bool (*)(std::span<const std::uint8_t> in, ByteBuffer& out, std::string& error);

/**
 * @brief One entry of the classification table.
 *
 * passthrough entries describe data that is already a parseable object;
 * entries with neither passthrough nor decode are recognised but unsupported.
 */
struct ContainerCodec {
  ContainerKind kind{ContainerKind::UNKNOWN};
  std::array<std::uint8_t, MAX_MAGIC_SIZE> magic{};
  std::size_t magicLen{0};
  bool passthrough{false};
  DecodeFn decode{nullptr};

  /// @brief True if data starts with this codec's signature.
  [[nodiscard]] bool matches(std::span<const std::uint8_t> data) const noexcept;
};

/* ----------------------------- API ----------------------------- */

/**
 * @brief Built-in classification table.
 *
 * ELF (passthrough), zstd and xz (decoded), gzip, bzip2 and lz4
 * (recognised, unsupported).
 */
[[nodiscard]] std::span<const ContainerCodec> defaultCodecs() noexcept;

/**
 * @brief Find the table entry whose signature prefixes data.
 * @return Matching entry, or nullptr if none matches.
 */
[[nodiscard]] const ContainerCodec*
sniffContainer(std::span<const std::uint8_t> data,
               std::span<const ContainerCodec> codecs = defaultCodecs()) noexcept;

/// @brief Convenience: kind of the matching entry, UNKNOWN if none.
[[nodiscard]] ContainerKind detectContainer(std::span<const std::uint8_t> data) noexcept;

/**
 * @brief Replace data with its decoded contents.
 *
 * Passthrough containers are left untouched (no copy).
 *
 * @param data In: file contents. Out: raw object bytes (unchanged on failure).
 * @param detail Set to a description on failure.
 * @param codecs Classification table.
 * @return OK, UNKNOWN_CONTAINER, UNSUPPORTED_CONTAINER or DECOMPRESS_FAILED.
 * @note Allocates the decompressed buffer.
 */
[[nodiscard]] ObjectStatus decodeContainer(ByteBuffer& data, std::string& detail,
                                           std::span<const ContainerCodec> codecs = defaultCodecs());

/// @brief Decode one or more concatenated zstd frames (libzstd streaming API).
[[nodiscard]] bool decodeZstd(std::span<const std::uint8_t> in, ByteBuffer& out,
                              std::string& error);

/// @brief As above, failing once the output would exceed maxOutput bytes.
[[nodiscard]] bool decodeZstd(std::span<const std::uint8_t> in, ByteBuffer& out,
                              std::string& error, std::size_t maxOutput);

/// @brief Decode one or more concatenated .xz streams (liblzma).
[[nodiscard]] bool decodeXz(std::span<const std::uint8_t> in, ByteBuffer& out, std::string& error);

/// @brief As above, failing once the output would exceed maxOutput bytes.
[[nodiscard]] bool decodeXz(std::span<const std::uint8_t> in, ByteBuffer& out, std::string& error,
                            std::size_t maxOutput);

} // namespace object

} // namespace modscout

#endif // MODSCOUT_OBJECT_CONTAINER_HPP
