/*
   Copyright 2022 The Driftgate Authors

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#ifndef DRIFTGATE_DECODING_BORSH_HPP_
#define DRIFTGATE_DECODING_BORSH_HPP_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>

#include <driftgate/common/base.hpp>
#include <driftgate/decoding/error.hpp>

namespace driftgate::decoding {

//! Sequential little-endian reader over the Borsh layout used by on-chain programs.
//! Every read throws DecodeError when the input is exhausted.
class BorshReader {
  public:
    explicit BorshReader(ByteView data) : data_{data} {}

    uint8_t read_u8();
    uint16_t read_u16();
    uint32_t read_u32();
    uint64_t read_u64();
    int32_t read_i32();
    int64_t read_i64();
    bool read_bool();

    ByteView read_bytes(std::size_t length);

    //! Solana compact-u16 length prefix (1 to 3 bytes, 7 bits each).
    uint16_t read_shortvec_length();

    //! One-byte tag, 0 for absent, 1 for present followed by the value.
    template <typename T, typename Read>
    std::optional<T> read_option(Read read) {
        const auto tag = read_u8();
        if (tag == 0) {
            return std::nullopt;
        }
        if (tag != 1) {
            throw DecodeError{"invalid option tag " + std::to_string(tag) + " at offset " + std::to_string(offset_ - 1)};
        }
        return read();
    }

    //! One discriminant byte indexing the variant list in declaration order.
    template <typename E>
    E read_enum(std::size_t variant_count, const char* type_name) {
        const auto discriminant = read_u8();
        if (discriminant >= variant_count) {
            throw DecodeError{std::string{"invalid "} + type_name + " discriminant " + std::to_string(discriminant)};
        }
        return static_cast<E>(discriminant);
    }

    std::size_t offset() const noexcept { return offset_; }
    std::size_t remaining() const noexcept { return data_.size() - offset_; }

    //! Throw if any byte is left unread.
    void expect_end(const char* what) const;

  private:
    const uint8_t* consume(std::size_t length);

    ByteView data_;
    std::size_t offset_{0};
};

class BorshWriter {
  public:
    void write_u8(uint8_t value) { bytes_.push_back(value); }
    void write_u16(uint16_t value);
    void write_u32(uint32_t value);
    void write_u64(uint64_t value);
    void write_i32(int32_t value);
    void write_i64(int64_t value);
    void write_bool(bool value) { bytes_.push_back(value ? 1 : 0); }
    void write_bytes(ByteView bytes) { bytes_.append(bytes); }
    void write_shortvec_length(uint16_t length);

    template <typename T, typename Write>
    void write_option(const std::optional<T>& value, Write write) {
        if (value) {
            write_u8(1);
            write(*value);
        } else {
            write_u8(0);
        }
    }

    template <typename E>
    void write_enum(E value) { write_u8(static_cast<uint8_t>(value)); }

    const Bytes& bytes() const noexcept { return bytes_; }
    Bytes release() { return std::move(bytes_); }

  private:
    Bytes bytes_;
};

} // namespace driftgate::decoding

#endif // DRIFTGATE_DECODING_BORSH_HPP_
