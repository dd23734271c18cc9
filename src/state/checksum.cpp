#include "state/checksum.hpp"

#include <array>
#include <bit>
#include <map>
#include <string>

namespace projstate {

namespace {

// ── CRC32 (IEEE 802.3 polynomial) ────────────────────────────────────────────

constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1)
                crc = (crc >> 1) ^ 0xEDB88320;
            else
                crc >>= 1;
        }
        table[i] = crc;
    }
    return table;
}

constexpr auto kCrc32Table = make_crc32_table();

// ── Little-endian serialisation helpers ──────────────────────────────────────

void append_u8(std::vector<uint8_t>& buf, uint8_t v) {
    buf.push_back(v);
}

void append_u32(std::vector<uint8_t>& buf, uint32_t v) {
    for (int i = 0; i < 4; ++i) {
        buf.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }
}

void append_u64(std::vector<uint8_t>& buf, uint64_t v) {
    for (int i = 0; i < 8; ++i) {
        buf.push_back(static_cast<uint8_t>(v >> (i * 8)));
    }
}

void append_str(std::vector<uint8_t>& buf, const std::string& s) {
    append_u32(buf, static_cast<uint32_t>(s.size()));
    buf.insert(buf.end(), s.begin(), s.end());
}

void append_map(std::vector<uint8_t>& buf,
                const std::map<std::string, std::string>& m) {
    append_u32(buf, static_cast<uint32_t>(m.size()));
    for (const auto& [key, value] : m) {
        append_str(buf, key);
        append_str(buf, value);
    }
}

} // anonymous namespace

uint32_t crc32(const uint8_t* data, std::size_t length) {
    uint32_t crc = 0xFFFFFFFF;
    for (std::size_t i = 0; i < length; ++i) {
        crc = kCrc32Table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

std::vector<uint8_t> encode_state(const ProjectState& state) {
    std::vector<uint8_t> buf;
    buf.reserve(64 + state.classes.size() * 96);

    append_str(buf, state.project_path);
    append_str(buf, state.project_name);

    append_u32(buf, static_cast<uint32_t>(state.classes.size()));
    for (const auto& cls : state.classes) {
        append_str(buf, cls.name);

        append_u8(buf, cls.file_path ? 1 : 0);
        if (cls.file_path) {
            append_str(buf, *cls.file_path);
        }

        append_u8(buf, cls.last_modified ? 1 : 0);
        if (cls.last_modified) {
            append_u64(buf, std::bit_cast<uint64_t>(*cls.last_modified));
        }

        append_map(buf, cls.attributes);
    }

    append_map(buf, state.extensions);
    return buf;
}

uint32_t state_checksum(const ProjectState& state) {
    const auto buf = encode_state(state);
    return crc32(buf.data(), buf.size());
}

} // namespace projstate
