/**
 * @file SnapshotCodec.hpp
 * @brief Lossless JSON form of a PlayerState.
 */

#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "domain/PlayerState.hpp"

namespace casefile::infrastructure {

/**
 * @class SnapshotCodec
 * @brief Encodes every PlayerState field; decoding replays the state's own commands.
 *
 * Decoding through the commands keeps the PlayerState invariants intact even
 * for hand-edited files. A file whose counters disagree with its history is
 * rejected.
 */
class SnapshotCodec {
public:
    static constexpr int kFormatVersion = 1;

    static nlohmann::json Encode(const domain::PlayerState& state);
    static std::string EncodeToString(const domain::PlayerState& state);

    /** @throws domain::PersistenceError on malformed or inconsistent data. */
    static domain::PlayerState Decode(const nlohmann::json& j);

    /** @throws domain::PersistenceError on malformed or inconsistent data. */
    static domain::PlayerState DecodeFromString(const std::string& text);
};

} // namespace casefile::infrastructure
