#include "crypto/proof_codec.hpp"
#include "crypto/error.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace Ballot::Crypto::CommitmentTree {
using nlohmann::json;

namespace {

    std::optional<Side> parse_side(std::string_view s)
    {
        if (s == "left")
            return Side::Left;
        if (s == "right")
            return Side::Right;
        return std::nullopt;
    }

    bool is_string_field(const json& j, const char* key)
    {
        return j.contains(key) && j.at(key).is_string();
    }

    std::unexpected<std::error_code> malformed()
    {
        return std::unexpected(make_error_code(Error::MalformedProof));
    }

} // namespace

json proof_to_json(const Proof& proof)
{
    json path = json::array();
    for (const auto& step : proof.path) {
        path.push_back(json { { "hash", step.hash }, { "position", std::string(to_string(step.position)) } });
    }

    return json {
        { "leaf", proof.leaf },
        { "path", std::move(path) },
        { "root", proof.root }
    };
}

std::string encode(const Proof& proof, int indent)
{
    return proof_to_json(proof).dump(indent);
}

auto proof_from_json(const json& j) -> std::expected<Proof, std::error_code>
{
    if (!j.is_object()) {
        return malformed();
    }
    if (!is_string_field(j, "leaf") || !is_string_field(j, "root")) {
        return malformed();
    }
    if (!j.contains("path") || !j.at("path").is_array()) {
        return malformed();
    }

    std::vector<PathStep> path;
    path.reserve(j.at("path").size());

    for (const auto& entry : j.at("path")) {
        if (!entry.is_object() || !is_string_field(entry, "hash") || !is_string_field(entry, "position")) {
            return malformed();
        }
        auto side = parse_side(entry.at("position").get_ref<const std::string&>());
        if (!side) {
            return malformed();
        }
        path.push_back({ .hash = entry.at("hash").get<std::string>(), .position = *side });
    }

    return Proof {
        .leaf = j.at("leaf").get<std::string>(),
        .path = std::move(path),
        .root = j.at("root").get<std::string>()
    };
}

auto decode(std::string_view text) -> std::expected<Proof, std::error_code>
{
    // allow_exceptions = false: 解析失败返回 discarded 值而不是抛异常
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return malformed();
    }
    return proof_from_json(j);
}

} // namespace Ballot::Crypto::CommitmentTree
