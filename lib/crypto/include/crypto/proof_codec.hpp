#pragma once

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

#include <nlohmann/json.hpp>

#include "crypto/commitment_tree.hpp"

namespace Ballot::Crypto::CommitmentTree {

// {"leaf": "..", "path": [{"hash": "..", "position": "left"|"right"}], "root": ".."}
[[nodiscard]] nlohmann::json proof_to_json(const Proof& proof);

[[nodiscard]] std::string encode(const Proof& proof, int indent = -1);

// Error::MalformedProof for unparsable text, missing or mistyped fields, or an
// unknown position string.
[[nodiscard]]
auto proof_from_json(const nlohmann::json& j) -> std::expected<Proof, std::error_code>;

[[nodiscard]]
auto decode(std::string_view text) -> std::expected<Proof, std::error_code>;

} // namespace Ballot::Crypto::CommitmentTree
