#pragma once

#include "distribution/distribution.hpp"
#include "pattern/node.hpp"
#include "pattern/pattern.hpp"

#include <nlohmann/json.hpp>

namespace regen {

using Json = nlohmann::json;

// JSON form of the parsed tree, used by --dump-ast and by the tests to
// compare trees structurally

void to_json(Json &j, const Distribution &distribution);
void to_json(Json &j, const ClassMember &member);
void to_json(Json &j, const Node &node);
void to_json(Json &j, const Pattern &pattern);

} // namespace regen
