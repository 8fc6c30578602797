#ifndef FERRET_BINARY_WRITER_HPP
#define FERRET_BINARY_WRITER_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace Ferret::Binary {
class Writer {
public:
    explicit Writer(std::vector<uint8_t>& data) : data_(data) {
    }

    void write_uint8(uint8_t value);
    void write_uint16_be(uint16_t value);
    void write_uint32_be(uint32_t value);
    void write_uint64_be(uint64_t value);
    void write_bytes(const uint8_t* bytes, size_t length);
    void write_string(const std::string& value);

    // u32be length prefix followed by the raw bytes.
    void write_blob(const std::string& value);

    size_t size() const {
        return data_.size();
    }

private:
    std::vector<uint8_t>& data_;
};
}  // namespace Ferret::Binary

#endif  // FERRET_BINARY_WRITER_HPP
