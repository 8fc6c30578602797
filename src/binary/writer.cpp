#include "writer.hpp"
#include <limits>
#include <stdexcept>

namespace Ferret::Binary {

namespace {
template <typename T>
void write_be(std::vector<uint8_t>& data, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        data.push_back((value >> ((sizeof(T) - 1 - i) * 8)) & 0xFF);
    }
}
}  // namespace

void Writer::write_uint8(uint8_t value) {
    data_.push_back(value);
}

void Writer::write_uint16_be(uint16_t value) {
    write_be(data_, value);
}

void Writer::write_uint32_be(uint32_t value) {
    write_be(data_, value);
}

void Writer::write_uint64_be(uint64_t value) {
    write_be(data_, value);
}

void Writer::write_bytes(const uint8_t* bytes, size_t length) {
    data_.insert(data_.end(), bytes, bytes + length);
}

void Writer::write_string(const std::string& value) {
    data_.insert(data_.end(), value.begin(), value.end());
}

void Writer::write_blob(const std::string& value) {
    if (value.size() > std::numeric_limits<uint32_t>::max())
        throw std::length_error("Blob exceeds 4 GiB");
    write_uint32_be(static_cast<uint32_t>(value.size()));
    write_string(value);
}
}  // namespace Ferret::Binary
