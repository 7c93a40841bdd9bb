#pragma once

/// @file state_codec.hpp
/// @brief Deterministic binary encoding of GameState and StateSnapshot, and
///        the SHA-256 checksum derived from it.
///
/// All integers are written little-endian and all maps are ordered, so the
/// same logical state always produces the same bytes on every platform.
/// Snapshot layout:
///   [4: "GSIM"] [4: format] [str: id] [8: timestampUs] [8: version]
///   [str: checksum] [state body]
/// where str is [4: length][N: bytes].

#include "gsim/foundation/game_result.hpp"
#include "gsim/state/game_state.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace gsim::state {

class StateCodec {
public:
    /// Encoding of everything in @p state except its checksum.
    [[nodiscard]] static std::vector<uint8_t> encodeState(const GameState& state);

    /// Lower-case hex SHA-256 of encodeState(@p state).
    [[nodiscard]] static std::string computeChecksum(const GameState& state);

    [[nodiscard]] static std::vector<uint8_t> encodeSnapshot(const StateSnapshot& snapshot);

    /// @return CorruptedSnapshot for truncated or malformed input,
    ///         InvalidSnapshot for an unsupported format revision.
    [[nodiscard]] static foundation::GameResult<StateSnapshot> decodeSnapshot(
        std::span<const uint8_t> bytes);
};

/// Lower-case hex SHA-256 of @p bytes (OpenSSL EVP).
[[nodiscard]] std::string sha256Hex(std::span<const uint8_t> bytes);

}  // namespace gsim::state
