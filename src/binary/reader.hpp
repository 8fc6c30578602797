#ifndef FERRET_BINARY_READER_HPP
#define FERRET_BINARY_READER_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace Ferret::Binary {
class Reader {
public:
    explicit Reader(const std::vector<uint8_t>& data) : data_(data), offset_(0) {
    }

    uint8_t              read_uint8();
    uint16_t             read_uint16_be();
    uint32_t             read_uint32_be();
    uint64_t             read_uint64_be();
    std::vector<uint8_t> read_bytes(size_t length);
    std::string          read_string(size_t length);
    std::string          read_blob();

    bool eof() const {
        return offset_ >= data_.size();
    }
    size_t offset() const {
        return offset_;
    }
    size_t remaining() const {
        return data_.size() - offset_;
    }

private:
    const std::vector<uint8_t>& data_;
    size_t                      offset_;
};
}  // namespace Ferret::Binary

#endif  // FERRET_BINARY_READER_HPP
