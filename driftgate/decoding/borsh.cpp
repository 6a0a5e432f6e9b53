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

#include "borsh.hpp"

#include <boost/endian/conversion.hpp>

namespace driftgate::decoding {

const uint8_t* BorshReader::consume(std::size_t length) {
    if (length > remaining()) {
        throw DecodeError{"unexpected end of data: need " + std::to_string(length) + " bytes at offset " +
            std::to_string(offset_) + ", " + std::to_string(remaining()) + " left"};
    }
    const uint8_t* position = data_.data() + offset_;
    offset_ += length;
    return position;
}

uint8_t BorshReader::read_u8() {
    return *consume(1);
}

uint16_t BorshReader::read_u16() {
    return boost::endian::load_little_u16(consume(2));
}

uint32_t BorshReader::read_u32() {
    return boost::endian::load_little_u32(consume(4));
}

uint64_t BorshReader::read_u64() {
    return boost::endian::load_little_u64(consume(8));
}

int32_t BorshReader::read_i32() {
    return boost::endian::load_little_s32(consume(4));
}

int64_t BorshReader::read_i64() {
    return boost::endian::load_little_s64(consume(8));
}

bool BorshReader::read_bool() {
    const auto value = read_u8();
    if (value > 1) {
        throw DecodeError{"invalid bool value " + std::to_string(value) + " at offset " + std::to_string(offset_ - 1)};
    }
    return value == 1;
}

ByteView BorshReader::read_bytes(std::size_t length) {
    return {consume(length), length};
}

uint16_t BorshReader::read_shortvec_length() {
    uint32_t value{0};
    for (std::size_t i{0}; i < 3; ++i) {
        const uint8_t byte = read_u8();
        value |= static_cast<uint32_t>(byte & 0x7f) << (7 * i);
        if ((byte & 0x80) == 0) {
            // Reject aliases: a zero continuation byte would encode the same value longer
            if (i > 0 && byte == 0) {
                throw DecodeError{"non-canonical compact-u16 length"};
            }
            if (value > 0xffff) {
                throw DecodeError{"compact-u16 length overflow"};
            }
            return static_cast<uint16_t>(value);
        }
    }
    throw DecodeError{"compact-u16 length longer than 3 bytes"};
}

void BorshReader::expect_end(const char* what) const {
    if (remaining() != 0) {
        throw DecodeError{std::string{what} + ": " + std::to_string(remaining()) + " trailing bytes"};
    }
}

void BorshWriter::write_u16(uint16_t value) {
    uint8_t buffer[2];
    boost::endian::store_little_u16(buffer, value);
    bytes_.append(buffer, sizeof(buffer));
}

void BorshWriter::write_u32(uint32_t value) {
    uint8_t buffer[4];
    boost::endian::store_little_u32(buffer, value);
    bytes_.append(buffer, sizeof(buffer));
}

void BorshWriter::write_u64(uint64_t value) {
    uint8_t buffer[8];
    boost::endian::store_little_u64(buffer, value);
    bytes_.append(buffer, sizeof(buffer));
}

void BorshWriter::write_i32(int32_t value) {
    uint8_t buffer[4];
    boost::endian::store_little_s32(buffer, value);
    bytes_.append(buffer, sizeof(buffer));
}

void BorshWriter::write_i64(int64_t value) {
    uint8_t buffer[8];
    boost::endian::store_little_s64(buffer, value);
    bytes_.append(buffer, sizeof(buffer));
}

void BorshWriter::write_shortvec_length(uint16_t length) {
    uint32_t value{length};
    while (true) {
        uint8_t byte = value & 0x7f;
        value >>= 7;
        if (value == 0) {
            bytes_.push_back(byte);
            return;
        }
        bytes_.push_back(byte | 0x80);
    }
}

} // namespace driftgate::decoding
