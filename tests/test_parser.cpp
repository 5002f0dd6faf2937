#include <gtest/gtest.h>
#include <intexpr/parser.hpp>

#include <string>
#include <utility>
#include <vector>

namespace {

using namespace intexpr;

static std::string dump(std::string_view text) {
    auto r = Parser(text).parse();
    if (!r) return "error: " + r.error().message;
    return to_string(*r.value());
}

static Error parse_failure(std::string_view text) {
    auto r = Parser(text).parse();
    EXPECT_FALSE(r.ok()) << text;
    if (r) return Error{};
    return r.error();
}

TEST(Parser, SimpleFunctionCall) {
    auto r = Parser("max(1, 2)").parse();
    ASSERT_TRUE(r.ok());
    const Node& n = *r.value();
    ASSERT_TRUE(n.is<FunctionCall>());
    EXPECT_EQ(n.as<FunctionCall>().name, "max");
    EXPECT_EQ(n.as<FunctionCall>().args.size(), 2u);
}

TEST(Parser, ZeroArgumentCall) {
    auto r = Parser("random()").parse();
    ASSERT_TRUE(r.ok());
    ASSERT_TRUE(r.value()->is<FunctionCall>());
    EXPECT_TRUE(r.value()->as<FunctionCall>().args.empty());
}

TEST(Parser, NestedCallsAndExpressionArguments) {
    EXPECT_EQ(dump("max(max(10, 14), 15)"), "(call max (call max 10 14) 15)");
    EXPECT_EQ(dump("max(1 + 2, 3 * 4)"), "(call max (+ 1 2) (* 3 4))");
    EXPECT_EQ(dump("2 + max(3, 4) * 5"), "(+ 2 (* (call max 3 4) 5))");
}

TEST(Parser, Precedence) {
    EXPECT_EQ(dump("2 + 3 * 4"), "(+ 2 (* 3 4))");
    EXPECT_EQ(dump("10 - 6 / 2"), "(- 10 (/ 6 2))");
    EXPECT_EQ(dump("(2 + 3) * 4"), "(* (+ 2 3) 4)");
}

TEST(Parser, LeftAssociative) {
    EXPECT_EQ(dump("10 - 3 - 2"), "(- (- 10 3) 2)");
    EXPECT_EQ(dump("100 / 5 / 2"), "(/ (/ 100 5) 2)");
    EXPECT_EQ(dump("1 + 2 - 3 + 4"), "(+ (- (+ 1 2) 3) 4)");
}

TEST(Parser, UnaryChainsNestRight) {
    EXPECT_EQ(dump("--5"), "(neg (neg 5))");
    EXPECT_EQ(dump("-+5"), "(neg (pos 5))");
    EXPECT_EQ(dump("-(5 + 3)"), "(neg (+ 5 3))");
    EXPECT_EQ(dump("-3 * -4"), "(* (neg 3) (neg 4))");
}

TEST(Parser, ParsingIsRepeatable) {
    const std::string text = "abs(-5) + max(1, 2, 3) * (7 - -2)";
    Parser p(text);
    auto a = p.parse();
    auto b = p.parse();
    auto c = Parser(text).parse();
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    ASSERT_TRUE(c.ok());
    EXPECT_EQ(*a.value(), *b.value());
    EXPECT_EQ(*a.value(), *c.value());
}

TEST(Parser, StructuralEqualityDistinguishesTrees) {
    auto a = Parser("1 - 2 - 3").parse();
    auto b = Parser("1 - (2 - 3)").parse();
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_NE(*a.value(), *b.value());
}

TEST(Parser, MatchesHandBuiltTree) {
    std::vector<NodePtr> args;
    args.push_back(make_integer(1));
    args.push_back(make_unary(UnaryOperator::Minus, make_integer(2)));
    NodePtr want = make_binary(BinaryOperator::Mul, make_call("f", std::move(args)), make_integer(3));

    auto r = Parser("f(1, -2) * 3").parse();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(*r.value(), *want);
}

TEST(Parser, WhitespaceInsensitive) {
    auto a = Parser("  10  +  2  ").parse();
    auto b = Parser("10+2").parse();
    ASSERT_TRUE(a.ok());
    ASSERT_TRUE(b.ok());
    EXPECT_EQ(*a.value(), *b.value());
}

TEST(Parser, BareIdentifierIsRejected) {
    Error e = parse_failure("max");
    EXPECT_EQ(e.kind, ErrorKind::Parse);
    EXPECT_NE(e.message.find("variables are not supported"), std::string::npos);
    EXPECT_EQ(e.offset, 0u);

    e = parse_failure("1 + max");
    EXPECT_EQ(e.kind, ErrorKind::Parse);
    EXPECT_NE(e.message.find("variables are not supported"), std::string::npos);
    EXPECT_EQ(e.offset, 4u);
}

TEST(Parser, MissingRightParen) {
    Error e = parse_failure("(2 + 3");
    EXPECT_EQ(e.kind, ErrorKind::Parse);
    EXPECT_NE(e.message.find("Expected RPAREN, got EOF"), std::string::npos);
    EXPECT_EQ(e.offset, 6u);
}

TEST(Parser, MissingOperand) {
    Error e = parse_failure("2 +");
    EXPECT_EQ(e.kind, ErrorKind::Parse);
    EXPECT_NE(e.message.find("got EOF"), std::string::npos);
    EXPECT_EQ(e.offset, 3u);
}

TEST(Parser, TrailingInput) {
    Error e = parse_failure("1 2");
    EXPECT_EQ(e.kind, ErrorKind::Parse);
    EXPECT_NE(e.message.find("Expected EOF, got INTEGER"), std::string::npos);
    EXPECT_EQ(e.offset, 2u);

    e = parse_failure("(1))");
    EXPECT_EQ(e.kind, ErrorKind::Parse);
    EXPECT_EQ(e.offset, 3u);
}

TEST(Parser, MalformedArgumentLists) {
    EXPECT_EQ(parse_failure("f(1,)").kind, ErrorKind::Parse);
    EXPECT_EQ(parse_failure("f(,1)").kind, ErrorKind::Parse);
    EXPECT_EQ(parse_failure("f(1 2)").kind, ErrorKind::Parse);
    EXPECT_EQ(parse_failure("f(1").kind, ErrorKind::Parse);
}

TEST(Parser, EmptyInput) {
    Error e = parse_failure("   ");
    EXPECT_EQ(e.kind, ErrorKind::Parse);
    EXPECT_EQ(e.offset, 3u);
}

TEST(Parser, NegatedSmallestLiteralFolds) {
    EXPECT_EQ(dump("-9223372036854775808"), "-9223372036854775808");
    EXPECT_EQ(dump("--9223372036854775808"), "(neg -9223372036854775808)");
    EXPECT_EQ(dump("2 * -9223372036854775808"), "(* 2 -9223372036854775808)");
    EXPECT_EQ(dump("-9223372036854775807"), "(neg 9223372036854775807)");
}

TEST(Parser, UnnegatedSmallestMagnitudeIsOutOfRange) {
    Error e = parse_failure("9223372036854775808");
    EXPECT_EQ(e.kind, ErrorKind::Lex);
    EXPECT_EQ(e.offset, 0u);

    e = parse_failure("1 - 9223372036854775808");
    EXPECT_EQ(e.kind, ErrorKind::Lex);
    EXPECT_EQ(e.offset, 4u);

    e = parse_failure("-(9223372036854775808)");
    EXPECT_EQ(e.kind, ErrorKind::Lex);
    EXPECT_EQ(e.offset, 2u);

    e = parse_failure("+9223372036854775808");
    EXPECT_EQ(e.kind, ErrorKind::Lex);
    EXPECT_EQ(e.offset, 1u);
}

TEST(Parser, LexErrorsPassThrough) {
    Error e = parse_failure("1 + #");
    EXPECT_EQ(e.kind, ErrorKind::Lex);
    EXPECT_EQ(e.offset, 4u);
}

} // namespace
