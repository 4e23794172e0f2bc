#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <purebuf/core/purebuf_endian.hpp>
#include <purebuf/core/purebuf_types.hpp>
#include <purebuf/serdes/purebuf_tag.hpp>
#include <purebuf/serdes/purebuf_varint.hpp>
#include <span>
#include <utility>
#include <vector>

namespace Purebuf::serdes {

/**
 * @brief Growable byte sink the encoder writes into.
 *
 * All writes append. Length-delimited blocks whose size is not known up front
 * are written with begin_length_delimited()/end_length_delimited().
 */
class OutputStream {
   public:
    OutputStream() = default;

    void write_varint(uint64_t value) {
        std::array<std::byte, Varint::max_size> scratch{};
        const std::size_t n = Varint::encode(value, scratch, 0);
        buffer_.insert(buffer_.end(), scratch.begin(), scratch.begin() + n);
    }

    void write_tag(FieldNumber number, WireType wire_type) {
        write_varint(MakeTag(number, wire_type));
    }

    /**
     * @brief Writes the raw little-endian layout of a 4 or 8 byte value.
     */
    template <typename T>
        requires(sizeof(T) == 4 || sizeof(T) == 8)
    void write_fixed(T value) {
        std::array<std::byte, sizeof(T)> scratch{};
        StoreLittleEndian<T>(value, scratch);
        buffer_.insert(buffer_.end(), scratch.begin(), scratch.end());
    }

    void write_raw(std::span<const std::byte> bytes) {
        buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
    }

    void write_length_delimited(std::span<const std::byte> bytes) {
        write_varint(bytes.size());
        write_raw(bytes);
    }

    /**
     * @brief Reserves Varint::max_size bytes for a length prefix.
     * @return The offset of the reserved prefix, to be passed to
     * end_length_delimited() once the content is written.
     */
    [[nodiscard]] std::size_t begin_length_delimited() {
        const std::size_t len_offset = buffer_.size();
        buffer_.resize(len_offset + Varint::max_size);
        return len_offset;
    }

    /**
     * @brief Encodes the actual length into the reserved prefix and shifts
     * the content back over the unused part of the reservation.
     */
    void end_length_delimited(std::size_t len_offset) {
        const std::size_t content_start = len_offset + Varint::max_size;
        const std::size_t content_size = buffer_.size() - content_start;

        std::array<std::byte, Varint::max_size> scratch{};
        const std::size_t n = Varint::encode(content_size, scratch, 0);
        std::copy(scratch.begin(), scratch.begin() + n,
                  buffer_.begin() + static_cast<std::ptrdiff_t>(len_offset));
        buffer_.erase(
            buffer_.begin() + static_cast<std::ptrdiff_t>(len_offset + n),
            buffer_.begin() + static_cast<std::ptrdiff_t>(content_start));
    }

    [[nodiscard]] std::size_t size() const noexcept { return buffer_.size(); }

    [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
        return buffer_;
    }

    [[nodiscard]] std::vector<std::byte> release() && noexcept {
        return std::move(buffer_);
    }

   private:
    std::vector<std::byte> buffer_;
};

/**
 * @brief Read cursor over a caller-owned byte span.
 *
 * Each embedded message is decoded from a nested stream bounded to its length
 * prefix; the nesting depth travels with the stream.
 */
class InputStream {
   public:
    explicit InputStream(std::span<const std::byte> input,
                         std::size_t max_depth = DefaultMaxDepth) noexcept
        : input_(input), max_depth_(max_depth) {}

    [[nodiscard]] bool at_end() const noexcept {
        return offset_ >= input_.size();
    }

    [[nodiscard]] std::size_t remaining() const noexcept {
        return input_.size() - offset_;
    }

    [[nodiscard]] std::size_t depth() const noexcept { return depth_; }

    [[nodiscard]] auto read_varint() noexcept -> std::expected<uint64_t, Error> {
        const auto res = Varint::decode(input_, offset_);
        if (!res) {
            return std::unexpected(Error::deserialization("invalid varint"));
        }
        offset_ += res->second;
        return res->first;
    }

    [[nodiscard]] auto read_tag() noexcept
        -> std::expected<std::pair<FieldNumber, WireType>, Error> {
        const auto raw = Varint::decode(input_, offset_);
        if (!raw) {
            return std::unexpected(Error::deserialization("invalid tag varint"));
        }
        if (raw->first > UINT32_MAX) {
            return std::unexpected(Error::deserialization("tag out of range"));
        }
        offset_ += raw->second;
        return ParseTag(raw->first);
    }

    template <typename T>
        requires(sizeof(T) == 4 || sizeof(T) == 8)
    [[nodiscard]] auto read_fixed() noexcept -> std::expected<T, Error> {
        if (remaining() < sizeof(T)) {
            return std::unexpected(
                Error::deserialization("truncated fixed-width value"));
        }
        const std::span<const std::byte, sizeof(T)> bytes{
            input_.data() + offset_, sizeof(T)};
        offset_ += sizeof(T);
        return LoadLittleEndian<T>(bytes);
    }

    /**
     * @brief Reads a length prefix and returns the block it frames.
     */
    [[nodiscard]] auto read_length_delimited() noexcept
        -> std::expected<std::span<const std::byte>, Error> {
        const auto len = read_varint();
        if (!len) {
            return std::unexpected(Error::deserialization("invalid length"));
        }
        if (*len > remaining()) {
            return std::unexpected(
                Error::deserialization("length exceeds remaining input"));
        }
        const auto block =
            input_.subspan(offset_, static_cast<std::size_t>(*len));
        offset_ += block.size();
        return block;
    }

    /**
     * @brief Discards one payload of the given wire type.
     */
    [[nodiscard]] std::optional<Error> skip(WireType wire_type) noexcept {
        switch (wire_type) {
            case WireType::Varint:
                if (auto res = read_varint(); !res) {
                    return res.error();
                }
                return std::nullopt;
            case WireType::Fixed64:
                if (auto res = read_fixed<uint64_t>(); !res) {
                    return res.error();
                }
                return std::nullopt;
            case WireType::LengthDelimited:
                if (auto res = read_length_delimited(); !res) {
                    return res.error();
                }
                return std::nullopt;
            case WireType::Fixed32:
                if (auto res = read_fixed<uint32_t>(); !res) {
                    return res.error();
                }
                return std::nullopt;
        }
        return Error::deserialization("unsupported wire type");
    }

    /**
     * @brief Stream over an embedded message body, one level deeper.
     */
    [[nodiscard]] auto nested(std::span<const std::byte> block) const noexcept
        -> std::expected<InputStream, Error> {
        if (depth_ + 1 > max_depth_) {
            return std::unexpected(Error::depth_limit());
        }
        InputStream child{block, max_depth_};
        child.depth_ = depth_ + 1;
        return child;
    }

    /**
     * @brief Stream over a packed block at the current depth.
     */
    [[nodiscard]] InputStream bounded(
        std::span<const std::byte> block) const noexcept {
        InputStream child{block, max_depth_};
        child.depth_ = depth_;
        return child;
    }

   private:
    std::span<const std::byte> input_;
    std::size_t offset_{0};
    std::size_t depth_{0};
    std::size_t max_depth_;
};

}  // namespace Purebuf::serdes
