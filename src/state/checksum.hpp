#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "state/project_state.hpp"

namespace projstate {

// CRC-32 (IEEE 802.3 polynomial 0xEDB88320).
[[nodiscard]] uint32_t crc32(const uint8_t* data, std::size_t length);

// ── Canonical encoding ───────────────────────────────────────────────────────
//
// Deterministic little-endian byte encoding of a ProjectState, used only for
// checksums (never written to disk):
//
//   [project_path: str][project_name: str]
//   [class_count: u32]
//     [name: str][has_path: u8][file_path: str?]
//     [has_mtime: u8][last_modified: f64 bits u64?]
//     [attr_count: u32]([key: str][value: str] × attr_count)   × class_count
//   [ext_count: u32]([key: str][value: str] × ext_count)
//
//   str = [length: u32 LE][bytes]
//
// Maps are ordered, so equal states always produce identical bytes.
[[nodiscard]] std::vector<uint8_t> encode_state(const ProjectState& state);

// CRC-32 of encode_state(state).
[[nodiscard]] uint32_t state_checksum(const ProjectState& state);

} // namespace projstate
