#include "parser/parser.hpp"
#include "parser/patternError.hpp"
#include "pattern/charSet.hpp"
#include "pattern/patternJson.hpp"

#include <gtest/gtest.h>

#include <optional>

using namespace regen;

namespace {

template <typename T> const T &as(const Node &node) {
  return dynamic_cast<const T &>(node);
}

// The error of the given type thrown by parsing source, if any
template <typename Error>
std::optional<Error> errorOf(const std::string &source) {
  try {
    parse(source);
  } catch (const Error &error) {
    return error;
  } catch (const PatternError &error) {
    ADD_FAILURE() << "unexpected error kind: " << error.what();
  }
  return std::nullopt;
}

} // namespace

// ============================================================================
// Structure
// ============================================================================

TEST(ParserTest, SingleLiteral) {
  Pattern pattern = parse("a");
  ASSERT_EQ(pattern.root().kind(), NodeKind::Literal);
  EXPECT_EQ(as<LiteralNode>(pattern.root()).character(), 'a');
  EXPECT_FALSE(pattern.anchoredStart());
  EXPECT_FALSE(pattern.anchoredEnd());
  EXPECT_EQ(pattern.source(), "a");
}

TEST(ParserTest, ConcatenationIsFlat) {
  Pattern pattern = parse("abc");
  const auto &concat = as<ConcatNode>(pattern.root());
  ASSERT_EQ(concat.children().size(), 3u);
  EXPECT_EQ(as<LiteralNode>(*concat.children()[0]).character(), 'a');
  EXPECT_EQ(as<LiteralNode>(*concat.children()[1]).character(), 'b');
  EXPECT_EQ(as<LiteralNode>(*concat.children()[2]).character(), 'c');
}

TEST(ParserTest, AlternationIsFlat) {
  Pattern pattern = parse("a|b|c");
  const auto &alternation = as<AlternationNode>(pattern.root());
  ASSERT_EQ(alternation.branches().size(), 3u);
  EXPECT_EQ(as<LiteralNode>(*alternation.branches()[2]).character(), 'c');
}

TEST(ParserTest, ConcatenationBindsTighterThanAlternation) {
  Pattern pattern = parse("ab|cd");
  const auto &alternation = as<AlternationNode>(pattern.root());
  ASSERT_EQ(alternation.branches().size(), 2u);
  EXPECT_EQ(alternation.branches()[0]->kind(), NodeKind::Concat);
  EXPECT_EQ(alternation.branches()[1]->kind(), NodeKind::Concat);
}

TEST(ParserTest, QuantifierBindsToPreviousAtom) {
  Pattern pattern = parse("ab*");
  const auto &concat = as<ConcatNode>(pattern.root());
  ASSERT_EQ(concat.children().size(), 2u);
  const auto &quantified = as<QuantifiedNode>(*concat.children()[1]);
  EXPECT_EQ(as<LiteralNode>(quantified.child()).character(), 'b');
}

TEST(ParserTest, GroupContentTakesGroupPosition) {
  Pattern pattern = parse("a(bc)d");
  const auto &concat = as<ConcatNode>(pattern.root());
  ASSERT_EQ(concat.children().size(), 3u);
  const auto &inner = as<ConcatNode>(*concat.children()[1]);
  EXPECT_EQ(inner.children().size(), 2u);
  EXPECT_EQ(as<LiteralNode>(*concat.children()[2]).character(), 'd');
}

TEST(ParserTest, GroupAddsNoNode) {
  Pattern pattern = parse("((a))");
  EXPECT_EQ(pattern.root().kind(), NodeKind::Literal);
}

TEST(ParserTest, NestedAlternationIsKept) {
  Pattern pattern = parse("(a|b)|c");
  const auto &alternation = as<AlternationNode>(pattern.root());
  ASSERT_EQ(alternation.branches().size(), 2u);
  EXPECT_EQ(alternation.branches()[0]->kind(), NodeKind::Alternation);
}

TEST(ParserTest, QuantifiedGroup) {
  Pattern pattern = parse("(ab)+");
  const auto &quantified = as<QuantifiedNode>(pattern.root());
  EXPECT_EQ(quantified.child().kind(), NodeKind::Concat);
  EXPECT_EQ(quantified.min(), 1u);
  EXPECT_TRUE(quantified.unbounded());
}

TEST(ParserTest, Anchors) {
  Pattern pattern = parse("^ab$");
  EXPECT_TRUE(pattern.anchoredStart());
  EXPECT_TRUE(pattern.anchoredEnd());
  EXPECT_EQ(pattern.root().kind(), NodeKind::Concat);
}

TEST(ParserTest, EscapedReservedCharacterIsLiteral) {
  Pattern pattern = parse("\\*\\(");
  const auto &concat = as<ConcatNode>(pattern.root());
  EXPECT_EQ(as<LiteralNode>(*concat.children()[0]).character(), '*');
  EXPECT_EQ(as<LiteralNode>(*concat.children()[1]).character(), '(');
}

TEST(ParserTest, DotIsWildcard) {
  EXPECT_EQ(parse(".").root().kind(), NodeKind::Wildcard);
}

TEST(ParserTest, NodesRecordOffsets) {
  Pattern pattern = parse("ab(c|d)");
  const auto &concat = as<ConcatNode>(pattern.root());
  EXPECT_EQ(concat.offset(), 0u);
  EXPECT_EQ(concat.children()[1]->offset(), 1u);
  EXPECT_EQ(concat.children()[2]->offset(), 3u);
}

TEST(ParserTest, ParsingIsRepeatable) {
  const std::string source = "^(ab|c{2,5~Bin(0.5)})[^xyz]~Zipf(2)\\d+$";
  EXPECT_EQ(Json(parse(source)), Json(parse(source)));
}

// ============================================================================
// Quantifiers
// ============================================================================

TEST(ParserTest, ShortQuantifiers) {
  Pattern plus = parse("a+");
  EXPECT_EQ(as<QuantifiedNode>(plus.root()).min(), 1u);
  EXPECT_TRUE(as<QuantifiedNode>(plus.root()).unbounded());

  Pattern question = parse("a?");
  EXPECT_EQ(as<QuantifiedNode>(question.root()).min(), 0u);
  EXPECT_EQ(as<QuantifiedNode>(question.root()).max(), 1u);

  Pattern star = parse("a*");
  EXPECT_EQ(as<QuantifiedNode>(star.root()).min(), 0u);
  EXPECT_TRUE(as<QuantifiedNode>(star.root()).unbounded());
}

TEST(ParserTest, LongQuantifiers) {
  Pattern exact = parse("a{3}");
  EXPECT_EQ(as<QuantifiedNode>(exact.root()).min(), 3u);
  EXPECT_EQ(as<QuantifiedNode>(exact.root()).max(), 3u);
  EXPECT_FALSE(as<QuantifiedNode>(exact.root()).distribution().has_value());

  Pattern range = parse("a{2,5}");
  EXPECT_EQ(as<QuantifiedNode>(range.root()).min(), 2u);
  EXPECT_EQ(as<QuantifiedNode>(range.root()).max(), 5u);

  Pattern open = parse("a{2,}");
  EXPECT_EQ(as<QuantifiedNode>(open.root()).min(), 2u);
  EXPECT_TRUE(as<QuantifiedNode>(open.root()).unbounded());
}

TEST(ParserTest, ExactCountWithDistributionIsOverridden) {
  Pattern pattern = parse("a{2~Ber(0.5)}");
  const auto &quantified = as<QuantifiedNode>(pattern.root());
  EXPECT_EQ(quantified.min(), 0u);
  EXPECT_TRUE(quantified.unbounded());
  EXPECT_EQ(quantified.distribution(), Distribution::bernoulli(0.5));
}

TEST(ParserTest, BaselineSuppliesDefaults) {
  Pattern geometric = parse("a{3~Geo(0.2)}");
  EXPECT_EQ(as<QuantifiedNode>(geometric.root()).distribution(),
            Distribution::geometric(0.2, 3));

  Pattern binomial = parse("a{4~Bin(0.25)}");
  EXPECT_EQ(as<QuantifiedNode>(binomial.root()).distribution(),
            Distribution::binomial(4, 0.25));

  Pattern constant = parse("a{6~Const}");
  EXPECT_EQ(as<QuantifiedNode>(constant.root()).distribution(),
            Distribution::constant(6));

  Pattern zipf = parse("a{5~Zipf}");
  EXPECT_EQ(as<QuantifiedNode>(zipf.root()).distribution(),
            Distribution::zipf(1.0, 5));

  Pattern defaults = parse("a{2~Geo}");
  EXPECT_EQ(as<QuantifiedNode>(defaults.root()).distribution(),
            Distribution::geometric(0.5, 2));
}

TEST(ParserTest, RangeWithDistributionKeepsBounds) {
  Pattern pattern = parse("a{2,5~Bin(0.5)}");
  const auto &quantified = as<QuantifiedNode>(pattern.root());
  EXPECT_EQ(quantified.min(), 2u);
  EXPECT_EQ(quantified.max(), 5u);
  EXPECT_EQ(quantified.distribution(), Distribution::binomial(2, 0.5));
}

TEST(ParserTest, ShortQuantifierWithDistribution) {
  Pattern pattern = parse("a+~Geo(0.3)");
  const auto &quantified = as<QuantifiedNode>(pattern.root());
  EXPECT_EQ(quantified.min(), 1u);
  EXPECT_TRUE(quantified.unbounded());
  EXPECT_EQ(quantified.distribution(), Distribution::geometric(0.3, 1));
}

TEST(ParserTest, DistributionNamesAreCaseInsensitive) {
  Pattern lower = parse("a{1~geo(0.5)}");
  Pattern upper = parse("a{1~GEO(0.5)}");
  EXPECT_EQ(as<QuantifiedNode>(lower.root()).distribution(),
            as<QuantifiedNode>(upper.root()).distribution());
}

TEST(ParserTest, CategoricalRepeatWeights) {
  Pattern positional = parse("a{0~Cat(1,2,3)}");
  EXPECT_EQ(as<QuantifiedNode>(positional.root()).distribution(),
            Distribution::categorical({1, 2, 3}));

  Pattern keyed = parse("a{0~Cat(0=1,3=2)}");
  EXPECT_EQ(as<QuantifiedNode>(keyed.root()).distribution(),
            Distribution::categorical({1, 0, 0, 2}));
}

TEST(ParserTest, MixedPositionalAndNamedParameters) {
  Pattern first = parse("a{1~Bin(0.5,n=6)}");
  Pattern second = parse("a{1~Bin(n=6,0.5)}");
  Pattern both = parse("a{1~Bin(6,0.5)}");
  EXPECT_EQ(as<QuantifiedNode>(first.root()).distribution(),
            Distribution::binomial(6, 0.5));
  EXPECT_EQ(as<QuantifiedNode>(second.root()).distribution(),
            Distribution::binomial(6, 0.5));
  EXPECT_EQ(as<QuantifiedNode>(both.root()).distribution(),
            Distribution::binomial(6, 0.5));

  Pattern zipf = parse("a{1~Zipf(k=4,s=2)}");
  EXPECT_EQ(as<QuantifiedNode>(zipf.root()).distribution(),
            Distribution::zipf(2, 4));
}

TEST(ParserTest, ExponentNotation) {
  Pattern pattern = parse("a{0~Cat(1e-3,1)}");
  EXPECT_EQ(as<QuantifiedNode>(pattern.root()).distribution(),
            Distribution::categorical({0.001, 1}));
}

// ============================================================================
// Character classes
// ============================================================================

TEST(ParserTest, ShorthandClass) {
  Pattern pattern = parse("\\d");
  const auto &cls = as<CharClassNode>(pattern.root());
  EXPECT_FALSE(cls.bracketed());
  EXPECT_FALSE(cls.negated());
  EXPECT_EQ(cls.alphabet(), "0123456789");
}

TEST(ParserTest, LiteralClass) {
  Pattern pattern = parse("[cab]");
  const auto &cls = as<CharClassNode>(pattern.root());
  EXPECT_TRUE(cls.bracketed());
  EXPECT_EQ(cls.alphabet(), "cab");
  EXPECT_EQ(cls.members().size(), 3u);
}

TEST(ParserTest, HyphenIsLiteralInClass) {
  EXPECT_EQ(as<CharClassNode>(parse("[a-z]").root()).alphabet(), "a-z");
}

TEST(ParserTest, NegatedClass) {
  Pattern pattern = parse("[^abc]");
  const auto &cls = as<CharClassNode>(pattern.root());
  EXPECT_TRUE(cls.negated());
  EXPECT_EQ(cls.alphabet().size(), charset::defaultUniverse().size() - 3);
  EXPECT_EQ(cls.alphabet().find('a'), std::string::npos);
}

TEST(ParserTest, ClassMembersOfEveryKind) {
  Pattern pattern = parse("[[:digit:]x\\]\\w.]");
  const auto &cls = as<CharClassNode>(pattern.root());
  ASSERT_EQ(cls.members().size(), 5u);
  EXPECT_EQ(cls.members()[0].type, ClassMember::Type::Posix);
  EXPECT_EQ(cls.members()[0].name, "digit");
  EXPECT_EQ(cls.members()[1].character, 'x');
  EXPECT_EQ(cls.members()[2].character, ']');
  EXPECT_EQ(cls.members()[3].type, ClassMember::Type::Shorthand);
  EXPECT_EQ(cls.members()[4].type, ClassMember::Type::Wildcard);
  EXPECT_EQ(cls.alphabet().substr(0, 12), "0123456789x]");
}

TEST(ParserTest, ReservedCharactersInClassAreLiterals) {
  EXPECT_EQ(as<CharClassNode>(parse("[a|*]").root()).alphabet(), "a|*");
}

TEST(ParserTest, ClassCategoricalWithRemainder) {
  Pattern pattern = parse("[abc]~Cat(a=0.5,.=0.5)");
  EXPECT_EQ(as<CharClassNode>(pattern.root()).distribution(),
            Distribution::categorical({0.5, 0.25, 0.25}));
}

TEST(ParserTest, ClassCategoricalSharesLeftoverMass) {
  Pattern pattern = parse("[abc]~Cat(b=0.5)");
  EXPECT_EQ(as<CharClassNode>(pattern.root()).distribution(),
            Distribution::categorical({0.25, 0.5, 0.25}));
}

TEST(ParserTest, ClassCategoricalEscapedDotIsMember) {
  Pattern pattern = parse("[a\\.]~Cat(\\.=3,a=1)");
  const auto &cls = as<CharClassNode>(pattern.root());
  EXPECT_EQ(cls.alphabet(), "a.");
  EXPECT_EQ(cls.distribution(), Distribution::categorical({1, 3}));
}

TEST(ParserTest, ClassContextDefaults) {
  Pattern binomial = parse("[abc]~Bin(0.5)");
  EXPECT_EQ(as<CharClassNode>(binomial.root()).distribution(),
            Distribution::binomial(2, 0.5));

  Pattern zipf = parse("[abcd]~Zipf");
  EXPECT_EQ(as<CharClassNode>(zipf.root()).distribution(),
            Distribution::zipf(1.0, 4));

  Pattern geometric = parse("\\d~Geo(0.5)");
  EXPECT_EQ(as<CharClassNode>(geometric.root()).distribution(),
            Distribution::geometric(0.5));

  Pattern constant = parse("[abc]~Const(2)");
  EXPECT_EQ(as<CharClassNode>(constant.root()).distribution(),
            Distribution::constant(2));
}

TEST(ParserTest, AnnotatedClassCanBeQuantified) {
  Pattern pattern = parse("[ab]~Cat(3,1){4}");
  const auto &quantified = as<QuantifiedNode>(pattern.root());
  EXPECT_EQ(quantified.min(), 4u);
  const auto &cls = as<CharClassNode>(quantified.child());
  EXPECT_EQ(cls.distribution(), Distribution::categorical({3, 1}));
}

// ============================================================================
// Syntax errors
// ============================================================================

TEST(ParserTest, UnmatchedParenthesisIsLocatedAtTheParenthesis) {
  auto error = errorOf<SyntaxError>("a(b");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->offset(), 1u);
  EXPECT_EQ(error->message(), "unmatched '('");
  EXPECT_EQ(error->construct(), "')'");
}

TEST(ParserTest, RenderedErrorPointsAtOffset) {
  auto error = errorOf<SyntaxError>("a(b");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->render("a(b"),
            "syntax error at column 2: unmatched '('\n  a(b\n   ^");
}

TEST(ParserTest, SyntaxErrorOffsets) {
  const std::vector<std::pair<std::string, size_t>> cases = {
      {"a)", 1},        // unmatched ')'
      {"[abc", 0},      // unmatched '['
      {"a{3", 1},       // unmatched '{'
      {"*a", 0},        // nothing to repeat
      {"a**", 2},       // stacked quantifier
      {"a||b", 1},      // empty alternative
      {"|a", 0},        // empty alternative
      {"a|", 1},        // empty alternative
      {"()", 0},        // empty group
      {"", 0},          // empty pattern
      {"a^b", 1},       // misplaced anchor
      {"a$b", 1},       // misplaced anchor
      {"ab\\", 2},      // unterminated escape
      {"[[:foo:]]", 1}, // unknown POSIX class
      {"[]", 0},        // empty class
      {"a~Geo", 1},     // annotation on a literal
      {"a{x}", 2},      // not a count
      {"a{2~(0.5)}", 4}, // missing distribution name
      {"a{2~Ber(-)}", 8}, // malformed number
      {"a}", 1},        // unmatched '}'
  };
  for (const auto &[source, offset] : cases) {
    auto error = errorOf<SyntaxError>(source);
    ASSERT_TRUE(error) << source;
    EXPECT_EQ(error->offset(), offset) << source << ": " << error->what();
  }
}

TEST(ParserTest, UnterminatedParameterList) {
  EXPECT_TRUE(errorOf<SyntaxError>("a{2~Ber(0.5}"));
  EXPECT_TRUE(errorOf<SyntaxError>("a{2~Ber(0.5"));
  EXPECT_TRUE(errorOf<SyntaxError>("a{2~Ber(x)}"));
}

// ============================================================================
// Validation errors
// ============================================================================

TEST(ParserTest, UnknownDistribution) {
  auto error = errorOf<ValidationError>("a{2~Foo}");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->offset(), 3u);
  EXPECT_EQ(error->construct(), "~Foo");
}

TEST(ParserTest, DomainErrorIsLocatedAtAnnotation) {
  auto error = errorOf<ValidationError>("a{2~Ber(1.5)}");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->offset(), 3u);
  EXPECT_EQ(error->construct(), "~Ber");
}

TEST(ParserTest, InvertedBounds) {
  auto error = errorOf<ValidationError>("a{5,2}");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->offset(), 1u);
  EXPECT_EQ(error->construct(), "{5,2}");
}

TEST(ParserTest, ParameterErrors) {
  // too many positional parameters
  EXPECT_TRUE(errorOf<ValidationError>("a{2~Ber(0.5,0.5)}"));
  // conflicting duplicate assignment
  EXPECT_TRUE(errorOf<ValidationError>("a{2~Ber(0.5,p=0.5)}"));
  EXPECT_TRUE(errorOf<ValidationError>("a{2~Bin(5,p=0.5)}"));
  // integral parameters
  EXPECT_TRUE(errorOf<ValidationError>("a{2~Bin(2.5,0.5)}"));
  EXPECT_TRUE(errorOf<ValidationError>("a{2~Const(-1)}"));
  // Cat needs a weight and digit keys
  EXPECT_TRUE(errorOf<ValidationError>("a{2~Cat}"));
  EXPECT_TRUE(errorOf<ValidationError>("a{2~Cat(x=1)}"));
  EXPECT_TRUE(errorOf<ValidationError>("a{2~Cat(0,0)}"));
}

TEST(ParserTest, UnknownKeyIsLocatedAtTheKey) {
  auto error = errorOf<ValidationError>("a{2~Ber(q=0.5)}");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->offset(), 8u);
  EXPECT_EQ(error->construct(), "q");
}

TEST(ParserTest, RepeatCountLimit) {
  EXPECT_TRUE(errorOf<ValidationError>("a{2000000}"));
  EXPECT_TRUE(errorOf<ValidationError>("a{1,99999999999999999999999}"));
  EXPECT_NO_THROW(parse("a{1000000}"));
}

TEST(ParserTest, EmptyEffectiveAlphabet) {
  auto error = errorOf<ValidationError>("x[^[:print:]]");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->offset(), 1u);
  EXPECT_EQ(error->construct(), "[^[:print:]]");
  EXPECT_TRUE(errorOf<ValidationError>("[^.]"));
}

TEST(ParserTest, ClassDistributionErrors) {
  // not a member
  EXPECT_TRUE(errorOf<ValidationError>("[abc]~Cat(x=1)"));
  // more weights than members
  EXPECT_TRUE(errorOf<ValidationError>("[ab]~Cat(1,1,1)"));
  // index outside the class
  EXPECT_TRUE(errorOf<ValidationError>("[abc]~Const(3)"));
  // no mass at all
  EXPECT_TRUE(errorOf<ValidationError>("[abc]~Cat(a=0,.=0)"));
}

TEST(ParserTest, GeometricNeedsProbabilityBelowOne) {
  auto error = errorOf<ValidationError>("a{2~Geo(1)}");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->offset(), 3u);
  EXPECT_EQ(error->construct(), "~Geo");
  EXPECT_TRUE(errorOf<ValidationError>("[ab]~Geo(p=1.0)"));
}

TEST(ParserTest, GroupDepthLimit) {
  size_t depth = Parser::MAX_GROUP_DEPTH;
  EXPECT_NO_THROW(
      parse(std::string(depth, '(') + "a" + std::string(depth, ')')));

  auto error = errorOf<ValidationError>(std::string(depth + 1, '(') + "a" +
                                        std::string(depth + 1, ')'));
  ASSERT_TRUE(error);
  EXPECT_EQ(error->offset(), depth);
  EXPECT_EQ(error->construct(), "(");

  // far beyond the limit the error is the same, not a crash
  std::string deep = std::string(200000, '(') + "a" + std::string(200000, ')');
  EXPECT_TRUE(errorOf<ValidationError>(deep));
}

TEST(ParserTest, SiblingGroupsDoNotAddUp) {
  std::string sequence;
  for (size_t i = 0; i < Parser::MAX_GROUP_DEPTH + 10; i++) {
    sequence += "(a)";
  }
  EXPECT_NO_THROW(parse(sequence));
}

TEST(ParserTest, UnderflowingNumberRoundsToZero) {
  Pattern pattern = parse("a{0,1~Ber(1e-400)}");
  EXPECT_EQ(as<QuantifiedNode>(pattern.root()).distribution(),
            Distribution::bernoulli(0.0));
}

TEST(ParserTest, OverflowingNumberIsAValidationError) {
  auto error = errorOf<ValidationError>("a{0,1~Ber(1e400)}");
  ASSERT_TRUE(error);
  EXPECT_EQ(error->offset(), 10u);
  EXPECT_EQ(error->construct(), "1e400");
}
