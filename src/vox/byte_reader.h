#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace voxscene::vox {

using VoxDict = std::vector<std::pair<std::string, std::string>>;

inline std::uint32_t readU32Le(std::span<const std::uint8_t> bytes, std::size_t offset) {
    return
        static_cast<std::uint32_t>(bytes[offset + 0]) |
        (static_cast<std::uint32_t>(bytes[offset + 1]) << 8u) |
        (static_cast<std::uint32_t>(bytes[offset + 2]) << 16u) |
        (static_cast<std::uint32_t>(bytes[offset + 3]) << 24u);
}

inline std::int32_t readI32Le(std::span<const std::uint8_t> bytes, std::size_t offset) {
    return static_cast<std::int32_t>(readU32Le(bytes, offset));
}

// Sequential little-endian reader over one chunk payload. Any read past the end
// latches the failed state and yields zero values; check ok() once at the end.
class ByteReader {
public:
    explicit ByteReader(std::span<const std::uint8_t> bytes) : m_bytes(bytes) {}

    std::int32_t readI32() {
        if (!require(4u)) {
            return 0;
        }
        const std::int32_t value = readI32Le(m_bytes, m_cursor);
        m_cursor += 4u;
        return value;
    }

    std::uint8_t readU8() {
        if (!require(1u)) {
            return 0u;
        }
        return m_bytes[m_cursor++];
    }

    std::string readString() {
        const std::int32_t length = readI32();
        if (length < 0) {
            m_failed = true;
            return {};
        }
        if (!require(static_cast<std::size_t>(length))) {
            return {};
        }
        std::string value(reinterpret_cast<const char*>(m_bytes.data() + m_cursor), static_cast<std::size_t>(length));
        m_cursor += static_cast<std::size_t>(length);
        return value;
    }

    VoxDict readDict() {
        VoxDict dict;
        const std::int32_t pairCount = readI32();
        if (pairCount < 0) {
            m_failed = true;
            return dict;
        }
        for (std::int32_t i = 0; i < pairCount && ok(); ++i) {
            std::string key = readString();
            std::string value = readString();
            if (ok()) {
                dict.emplace_back(std::move(key), std::move(value));
            }
        }
        return dict;
    }

    void skip(std::size_t byteCount) {
        if (require(byteCount)) {
            m_cursor += byteCount;
        }
    }

    [[nodiscard]] bool ok() const { return !m_failed; }
    [[nodiscard]] std::size_t remaining() const { return m_failed ? 0u : (m_bytes.size() - m_cursor); }
    [[nodiscard]] std::size_t position() const { return m_cursor; }

private:
    bool require(std::size_t byteCount) {
        if (m_failed || byteCount > (m_bytes.size() - m_cursor)) {
            m_failed = true;
            return false;
        }
        return true;
    }

    std::span<const std::uint8_t> m_bytes;
    std::size_t m_cursor = 0;
    bool m_failed = false;
};

// Last value wins for repeated keys.
inline const std::string* findDictValue(const VoxDict& dict, std::string_view key) {
    const std::string* found = nullptr;
    for (const auto& [entryKey, entryValue] : dict) {
        if (entryKey == key) {
            found = &entryValue;
        }
    }
    return found;
}

} // namespace voxscene::vox
