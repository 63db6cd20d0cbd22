#pragma once

#include <model/lexical_graph.hpp>
#include <query/views.hpp>
#include <nlohmann/json.hpp>
#include <optional>

namespace Slowosiec {

// nlohmann::json conversions, found by ADL. Text is copied out of the graph,
// so the JSON value may outlive it. Missing references render as null.

void to_json(nlohmann::json& j, const Metadata& meta);
void to_json(nlohmann::json& j, const LexicalUnitView& view);
void to_json(nlohmann::json& j, const SynsetView& view);
void to_json(nlohmann::json& j, const RelationTypeView& view);
void to_json(nlohmann::json& j, const LexicalRelationView& view);
void to_json(nlohmann::json& j, const SynsetRelationView& view);

/// A resolved view, or null for an id that did not resolve.
template <typename View>
nlohmann::json optional_to_json(const std::optional<View>& view) {
    if (!view) return nullptr;
    return *view;
}

} // namespace Slowosiec
