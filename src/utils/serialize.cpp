#include "utils/serialize.h"
#include <stdexcept>

namespace rentledger {
namespace utils {

static constexpr uint64_t MAX_STRING_LENGTH = 1 << 20;

void ByteBuffer::writeUint8(uint8_t value) {
    data_.push_back(value);
}

void ByteBuffer::writeUint32(uint32_t value) {
    data_.push_back(static_cast<uint8_t>(value >> 24));
    data_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    data_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    data_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void ByteBuffer::writeUint64(uint64_t value) {
    for (int i = 7; i >= 0; i--) {
        data_.push_back(static_cast<uint8_t>((value >> (i * 8)) & 0xFF));
    }
}

void ByteBuffer::writeBool(bool value) {
    writeUint8(value ? 1 : 0);
}

void ByteBuffer::writeVarInt(uint64_t value) {
    while (value >= 0x80) {
        data_.push_back(static_cast<uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    data_.push_back(static_cast<uint8_t>(value));
}

void ByteBuffer::writeString(const std::string& value) {
    writeVarInt(value.length());
    data_.insert(data_.end(), value.begin(), value.end());
}

uint8_t ByteBuffer::readUint8() {
    checkRead(1);
    return data_[readPos_++];
}

uint32_t ByteBuffer::readUint32() {
    checkRead(4);
    uint32_t value = (static_cast<uint32_t>(data_[readPos_]) << 24) |
                     (static_cast<uint32_t>(data_[readPos_ + 1]) << 16) |
                     (static_cast<uint32_t>(data_[readPos_ + 2]) << 8) |
                     static_cast<uint32_t>(data_[readPos_ + 3]);
    readPos_ += 4;
    return value;
}

uint64_t ByteBuffer::readUint64() {
    checkRead(8);
    uint64_t value = 0;
    for (int i = 0; i < 8; i++) {
        value = (value << 8) | static_cast<uint64_t>(data_[readPos_ + i]);
    }
    readPos_ += 8;
    return value;
}

bool ByteBuffer::readBool() {
    return readUint8() != 0;
}

uint64_t ByteBuffer::readVarInt() {
    uint64_t value = 0;
    int shift = 0;

    while (true) {
        checkRead(1);
        uint8_t byte = data_[readPos_++];
        value |= static_cast<uint64_t>(byte & 0x7F) << shift;

        if ((byte & 0x80) == 0) break;
        shift += 7;

        if (shift >= 64) {
            throw std::runtime_error("VarInt overflow");
        }
    }
    return value;
}

std::string ByteBuffer::readString() {
    uint64_t length = readVarInt();
    if (length > MAX_STRING_LENGTH) {
        throw std::runtime_error("String too long");
    }
    checkRead(length);

    std::string value(data_.begin() + readPos_, data_.begin() + readPos_ + length);
    readPos_ += length;
    return value;
}

void ByteBuffer::checkRead(uint64_t bytes) const {
    if (bytes > data_.size() - readPos_) {
        throw std::runtime_error("Buffer underflow");
    }
}

}
}
