#include "reader.hpp"

namespace Ferret::Binary {

namespace {
template <typename T>
T read_be(const std::vector<uint8_t>& data, size_t& offset) {
    if (offset + sizeof(T) > data.size()) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value = static_cast<T>((value << 8) | data[offset + i]);
    }
    offset += sizeof(T);
    return value;
}
}  // namespace

uint8_t Reader::read_uint8() {
    if (offset_ >= data_.size()) {
        throw std::out_of_range("Attempt to read past end of buffer.");
    }
    return data_[offset_++];
}

uint16_t Reader::read_uint16_be() {
    return read_be<uint16_t>(data_, offset_);
}

uint32_t Reader::read_uint32_be() {
    return read_be<uint32_t>(data_, offset_);
}

uint64_t Reader::read_uint64_be() {
    return read_be<uint64_t>(data_, offset_);
}

std::vector<uint8_t> Reader::read_bytes(size_t length) {
    if (length > remaining())
        throw std::out_of_range("Attempt to read past end of buffer.");
    std::vector<uint8_t> out(data_.begin() + offset_, data_.begin() + offset_ + length);
    offset_ += length;
    return out;
}

std::string Reader::read_string(size_t length) {
    if (length > remaining())
        throw std::out_of_range("Attempt to read past end of buffer.");
    std::string s(reinterpret_cast<const char*>(data_.data() + offset_), length);
    offset_ += length;
    return s;
}

std::string Reader::read_blob() {
    uint32_t length = read_uint32_be();
    return read_string(length);
}
}  // namespace Ferret::Binary
