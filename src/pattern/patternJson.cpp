#include "pattern/patternJson.hpp"

namespace regen {

namespace {

class JsonBuilder : public NodeVisitor {
public:
  Json result;

  void visit(const LiteralNode &node) override {
    result = Json{{"type", "literal"},
                  {"char", std::string(1, node.character())},
                  {"offset", node.offset()}};
  }

  void visit(const WildcardNode &node) override {
    result = Json{{"type", "wildcard"}, {"offset", node.offset()}};
  }

  void visit(const CharClassNode &node) override {
    result = Json{{"type", "class"},
                  {"negated", node.negated()},
                  {"bracketed", node.bracketed()},
                  {"members", node.members()},
                  {"alphabet", node.alphabet()},
                  {"offset", node.offset()}};
    if (node.distribution()) {
      result["distribution"] = *node.distribution();
    }
  }

  void visit(const ConcatNode &node) override {
    Json children = Json::array();
    for (const auto &child : node.children()) {
      children.push_back(Json(*child));
    }
    result = Json{{"type", "concat"},
                  {"children", std::move(children)},
                  {"offset", node.offset()}};
  }

  void visit(const AlternationNode &node) override {
    Json branches = Json::array();
    for (const auto &branch : node.branches()) {
      branches.push_back(Json(*branch));
    }
    result = Json{{"type", "alternation"},
                  {"branches", std::move(branches)},
                  {"offset", node.offset()}};
  }

  void visit(const QuantifiedNode &node) override {
    Json quantified = Json{{"type", "quantified"},
                           {"min", node.min()},
                           {"child", Json(node.child())},
                           {"offset", node.offset()}};
    if (node.unbounded()) {
      quantified["max"] = "unbounded";
    } else {
      quantified["max"] = node.max();
    }
    if (node.distribution()) {
      quantified["distribution"] = *node.distribution();
    }
    result = std::move(quantified);
  }
};

} // namespace

void to_json(Json &j, const Distribution &distribution) {
  j = Json{{"kind", distribution.kindName()}};

  if (auto *constant = distribution.get<Constant>()) {
    j["value"] = constant->value;
  } else if (auto *bernoulli = distribution.get<Bernoulli>()) {
    j["probability"] = bernoulli->probability;
  } else if (auto *binomial = distribution.get<Binomial>()) {
    j["trials"] = binomial->trials;
    j["probability"] = binomial->probability;
  } else if (auto *categorical = distribution.get<Categorical>()) {
    j["weights"] = categorical->weights;
  } else if (auto *geometric = distribution.get<Geometric>()) {
    j["probability"] = geometric->probability;
    j["offset"] = geometric->offset;
  } else if (auto *zipf = distribution.get<Zipf>()) {
    j["exponent"] = zipf->exponent;
    j["ranks"] = zipf->ranks;
  }
}

void to_json(Json &j, const ClassMember &member) {
  switch (member.type) {
  case ClassMember::Type::Literal:
    j = Json{{"literal", std::string(1, member.character)}};
    break;
  case ClassMember::Type::Shorthand:
    j = Json{{"shorthand", std::string("\\") + member.character}};
    break;
  case ClassMember::Type::Posix:
    j = Json{{"posix", member.name}};
    break;
  case ClassMember::Type::Wildcard:
    j = Json{{"wildcard", true}};
    break;
  }
}

void to_json(Json &j, const Node &node) {
  JsonBuilder builder;
  node.accept(builder);
  j = std::move(builder.result);
}

void to_json(Json &j, const Pattern &pattern) {
  j = Json{{"source", pattern.source()},
           {"anchoredStart", pattern.anchoredStart()},
           {"anchoredEnd", pattern.anchoredEnd()},
           {"root", Json(pattern.root())}};
}

} // namespace regen
