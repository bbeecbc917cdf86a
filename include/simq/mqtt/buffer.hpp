#pragma once

#include <simq/mqtt/errors.hpp>

#include <cstdint>
#include <cstring>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace simq::mqtt {

    // Remaining Length codec (MQTT 3.1.1, section 2.2.3)
    namespace varint {

        constexpr uint32_t MAX_VALUE = 268435455;  // 2^28 - 1
        constexpr size_t MAX_BYTES = 4;

        /// @brief Encodes value into out, returns the number of bytes written (1..4).
        inline size_t encode(uint32_t value, uint8_t* out) {
            if (value > MAX_VALUE) {
                throw PreconditionException("remaining length " + std::to_string(value) +
                    " exceeds " + std::to_string(MAX_VALUE));
            }

            size_t offset = 0;
            while (value > 0x7F) {
                out[offset++] = static_cast<uint8_t>((value & 0x7F) | 0x80);
                value >>= 7;
            }
            out[offset++] = static_cast<uint8_t>(value);
            return offset;
        }

        inline std::vector<uint8_t> encode(uint32_t value) {
            uint8_t bytes[MAX_BYTES];
            size_t len = encode(value, bytes);
            return std::vector<uint8_t>(bytes, bytes + len);
        }

        /// @brief Decodes from a byte source; next_byte() is called once per byte.
        template<typename NextByte>
        uint32_t decode(NextByte&& next_byte) {
            uint32_t value = 0;
            unsigned shift = 0;

            for (size_t i = 0; i < MAX_BYTES; ++i) {
                uint8_t byte = next_byte();
                value |= static_cast<uint32_t>(byte & 0x7F) << shift;
                if ((byte & 0x80) == 0) {
                    return value;
                }
                shift += 7;
            }

            throw FramingMismatchException("remaining length not terminated within 4 bytes");
        }

    } // namespace varint

    // Growable byte buffer with big-endian MQTT primitives. Writes append,
    // reads consume from an independent read position.
    class Buffer {
    private:
        std::vector<uint8_t> data_;
        size_t read_pos_ = 0;

        void require(size_t len) const {
            if (read_pos_ + len > data_.size()) {
                throw FramingMismatchException(len, data_.size() - read_pos_, "buffer underflow");
            }
        }

    public:
        explicit Buffer(size_t initial_capacity = 256) {
            data_.reserve(initial_capacity);
        }

        Buffer(const uint8_t* bytes, size_t len) : data_(bytes, bytes + len) {}

        explicit Buffer(std::vector<uint8_t> bytes) : data_(std::move(bytes)) {}

        // Write operations
        void write_byte(uint8_t byte) {
            data_.push_back(byte);
        }

        void write_uint16(uint16_t value) {
            // Network byte order (big-endian)
            data_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
            data_.push_back(static_cast<uint8_t>(value & 0xFF));
        }

        void write_bytes(const uint8_t* bytes, size_t len) {
            if (len == 0) return;
            data_.insert(data_.end(), bytes, bytes + len);
        }

        void write_bytes(std::string_view bytes) {
            write_bytes(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
        }

        // Length-prefixed UTF-8 string / binary field.
        void write_string(std::string_view str) {
            if (str.length() > 0xFFFF) {
                throw PreconditionException("string length " + std::to_string(str.length()) +
                    " exceeds 65535");
            }

            write_uint16(static_cast<uint16_t>(str.length()));
            write_bytes(str);
        }

        void write_variable_length(uint32_t value) {
            uint8_t bytes[varint::MAX_BYTES];
            size_t len = varint::encode(value, bytes);
            write_bytes(bytes, len);
        }

        // Read operations
        uint8_t read_byte() {
            require(1);
            return data_[read_pos_++];
        }

        uint16_t read_uint16() {
            require(2);
            uint16_t value = static_cast<uint16_t>((data_[read_pos_] << 8) | data_[read_pos_ + 1]);
            read_pos_ += 2;
            return value;
        }

        std::string read_string() {
            uint16_t len = read_uint16();
            require(len);
            std::string result(reinterpret_cast<const char*>(data_.data() + read_pos_), len);
            read_pos_ += len;
            return result;
        }

        std::vector<uint8_t> read_bytes(size_t len) {
            require(len);
            std::vector<uint8_t> result(data_.begin() + read_pos_, data_.begin() + read_pos_ + len);
            read_pos_ += len;
            return result;
        }

        uint32_t read_variable_length() {
            return varint::decode([this]() { return read_byte(); });
        }

        // State
        const uint8_t* data() const { return data_.data(); }
        size_t size() const { return data_.size(); }
        size_t available() const { return data_.size() - read_pos_; }
        bool empty() const { return data_.empty(); }

        void clear() {
            data_.clear();
            read_pos_ = 0;
        }

        const std::vector<uint8_t>& bytes() const { return data_; }

        std::string to_hex_string() const {
            std::ostringstream ss;
            ss << std::hex << std::setfill('0');
            for (size_t i = 0; i < data_.size(); ++i) {
                if (i > 0) ss << ' ';
                ss << std::setw(2) << static_cast<int>(data_[i]);
            }
            return ss.str();
        }
    };

} // namespace simq::mqtt
