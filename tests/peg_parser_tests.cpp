#include <catch2/catch.hpp>
#include <peg_parser/PegParsingExpressionParser.hpp>
#include "peg_parser/PegExceptions.hpp"
#include "peg_parser/PegStructs.hpp"
#include "peg_parser/PegTokenizer.hpp"
#include <regex>

TEST_CASE("Tokenizer matches strings", "[tokenizer]") {
  peg::PegTokenizer t{"a b c def"};
  peg::ParsingState state;
  peg::ReadSet reads;
  auto shouldMatch = [&](const char* param) {
    auto ret = t.matchString(state, param, false, reads);
    REQUIRE(ret);
    state = *ret;
    state = t.skipWhitespaces(state, reads);
  };
  auto shouldNotMatch = [&](const char* param) {
    auto ret = t.matchString(state, param, false, reads);
    REQUIRE(!ret);
  };
  shouldMatch("a");
  shouldMatch("b");
  shouldMatch("c");
  shouldNotMatch("abc");
  state = peg::ParsingState{};
  shouldMatch("a");
  shouldMatch("b");
  shouldMatch("c");
  shouldMatch("de");
  shouldNotMatch("gef");
  shouldMatch("f");
  state = peg::ParsingState{};
  shouldMatch("a");
  shouldMatch("b");
  shouldMatch("c");
  shouldMatch("def");
  shouldNotMatch("a");
  shouldNotMatch("f");
}

TEST_CASE("Tokenizer respects word boundaries", "[tokenizer]") {
  peg::PegTokenizer t{"ENDIF END_ END"};
  peg::ReadSet reads;
  REQUIRE(!t.matchString(peg::ParsingState{0}, "END", true, reads));
  REQUIRE(t.matchString(peg::ParsingState{0}, "END", false, reads));
  REQUIRE(!t.matchString(peg::ParsingState{6}, "END", true, reads));
  auto ret = t.matchString(peg::ParsingState{11}, "END", true, reads);
  REQUIRE(ret);
  REQUIRE(ret->offset == 14);
}

TEST_CASE("Tokenizer matches character classes", "[tokenizer]") {
  peg::PegTokenizer t{"a b c def"};
  peg::ParsingState state;
  peg::ReadSet reads;
  auto shouldMatchClass = [&](const char* param) {
    auto ret = t.matchCharClass(state, std::regex{param}, reads);
    REQUIRE(ret);
    state = *ret;
    state = t.skipWhitespaces(state, reads);
  };
  auto shouldNotMatchClass = [&](const char* param) {
    auto ret = t.matchCharClass(state, std::regex{param}, reads);
    REQUIRE(!ret);
  };
  shouldMatchClass("[a-z]");
  shouldMatchClass("[b]");
  shouldMatchClass("[abc]");
  shouldNotMatchClass("[f]");
  shouldMatchClass("[d-f]");
}

TEST_CASE("Tokenizer matches character classes 2", "[tokenizer]") {
  peg::PegTokenizer t{"5 + 3"};
  peg::ParsingState state;
  peg::ReadSet reads;
  auto shouldMatchClass = [&](const char* param) {
    auto ret = t.matchCharClass(state, std::regex{param}, reads);
    REQUIRE(ret);
    state = *ret;
    state = t.skipWhitespaces(state, reads);
  };
  auto shouldMatch = [&](const char* param) {
    auto ret = t.matchString(state, param, false, reads);
    REQUIRE(ret);
    state = *ret;
    state = t.skipWhitespaces(state, reads);
  };
  shouldMatchClass("[\\d]");
  shouldMatch("+");
  shouldMatchClass("[\\d]");
  REQUIRE(t.isEmpty(state));
  REQUIRE(!t.matchAnyChar(state, reads));
}

TEST_CASE("Tokenizer matches numbers, strings and identifiers", "[tokenizer]") {
  peg::ReadSet reads;
  {
    peg::PegTokenizer t{"12.5e-3x"};
    auto ret = t.matchNumber(peg::ParsingState{}, reads);
    REQUIRE(ret);
    REQUIRE(ret->offset == 7);
  }
  {
    peg::PegTokenizer t{"12.x"};
    auto ret = t.matchNumber(peg::ParsingState{}, reads);
    REQUIRE(ret);
    REQUIRE(ret->offset == 2);
  }
  {
    peg::PegTokenizer t{R"('it\'s' "open)"};
    auto ret = t.matchQuoted(peg::ParsingState{}, reads);
    REQUIRE(ret);
    REQUIRE(ret->offset == 7);
    REQUIRE(!t.matchQuoted(peg::ParsingState{8}, reads));
  }
  {
    peg::PegTokenizer t{"_name1 9lives"};
    auto ret = t.matchIdentifier(peg::ParsingState{}, reads);
    REQUIRE(ret);
    REQUIRE(ret->offset == 6);
    REQUIRE(!t.matchIdentifier(peg::ParsingState{7}, reads));
  }
  {
    peg::PegTokenizer t{"a\r\nb\n"};
    REQUIRE(t.matchNewline(peg::ParsingState{1}, reads)->offset == 3);
    REQUIRE(t.matchNewline(peg::ParsingState{4}, reads)->offset == 5);
    REQUIRE(!t.matchNewline(peg::ParsingState{0}, reads));
  }
}

TEST_CASE("Tokenizer skips comments", "[tokenizer]") {
  std::vector<peg::CommentPattern> comments{ peg::makeCommentPattern("//.*"), peg::makeCommentPattern(R"(/\*[\s\S]*?\*/)") };
  peg::PegTokenizer t{"  // one\n /* two\n three */ x"};
  peg::ReadSet reads;
  auto state = t.skipIgnored(peg::ParsingState{}, comments, reads);
  REQUIRE(state.offset == 27);
  REQUIRE(t.getPosition(state) == std::make_pair<size_t, size_t>(3, 11));
  REQUIRE(comments.at(0).literalPrefix == "//");
  REQUIRE(comments.at(1).literalPrefix == "/*");
  REQUIRE(peg::makeCommentPattern("#|;").literalPrefix.empty());
  REQUIRE_THROWS_AS(peg::makeCommentPattern("(unclosed"), peg::GrammarError);
}

TEST_CASE("Comment patterns are sorted by shape", "[tokenizer]") {
  using peg::CommentShape;
  REQUIRE(peg::makeCommentPattern("//.*").shape == CommentShape::TO_LINE_END);
  REQUIRE(peg::makeCommentPattern("#").shape == CommentShape::LITERAL);
  REQUIRE(peg::makeCommentPattern(R"(%[\s\S]*)").shape == CommentShape::TO_INPUT_END);

  auto block = peg::makeCommentPattern(R"(/\*[\s\S]*?\*/)");
  REQUIRE(block.shape == CommentShape::UNTIL_TERMINATOR);
  REQUIRE(block.terminator == "*/");
  REQUIRE(block.crossesLines);
  auto html = peg::makeCommentPattern("<!--.*?-->");
  REQUIRE(html.shape == CommentShape::UNTIL_TERMINATOR);
  REQUIRE(html.literalPrefix == "<!--");
  REQUIRE(html.terminator == "-->");
  REQUIRE(!html.crossesLines);

  REQUIRE(peg::makeCommentPattern("--[^\n]*").shape == CommentShape::REGEX);
  REQUIRE(peg::makeCommentPattern("#|;").shape == CommentShape::REGEX);
  REQUIRE(peg::makeCommentPattern(R"(/\*.*?\d)").shape == CommentShape::REGEX);
}

TEST_CASE("Tokenizer matches long comments", "[tokenizer]") {
  const std::string body(100000, 'c');
  peg::ReadSet reads;
  {
    peg::PegTokenizer t{"//" + body + "\nx"};
    auto ret = t.matchComment(peg::ParsingState{}, peg::makeCommentPattern("//.*"), reads);
    REQUIRE(ret);
    REQUIRE(ret->offset == 100002);
  }
  auto block = peg::makeCommentPattern(R"(/\*[\s\S]*?\*/)");
  {
    peg::PegTokenizer t{"/*" + body + "\n*/x*/"};
    auto ret = t.matchComment(peg::ParsingState{}, block, reads);
    REQUIRE(ret);
    REQUIRE(ret->offset == 100005);
  }
  {
    peg::PegTokenizer t{"/*" + body};
    peg::ReadSet unterminated;
    REQUIRE(!t.matchComment(peg::ParsingState{}, block, unterminated));
    // the whole rest of the text decided that
    REQUIRE(unterminated.intersects(100002, 100003));
  }
  {
    auto html = peg::makeCommentPattern("<!--.*?-->");
    peg::PegTokenizer t{"<!-- a -->b <!-- c\n -->"};
    auto ret = t.matchComment(peg::ParsingState{}, html, reads);
    REQUIRE(ret);
    REQUIRE(ret->offset == 10);
    REQUIRE(!t.matchComment(peg::ParsingState{12}, html, reads));
  }
  {
    // other patterns only see a bounded window
    peg::PegTokenizer t{"#" + body};
    auto ret = t.matchComment(peg::ParsingState{}, peg::makeCommentPattern("#[a-z]*"), reads);
    REQUIRE(ret);
    REQUIRE(ret->offset == peg::MAX_REGEX_COMMENT_LENGTH);
  }
}

TEST_CASE("Tokenizer records what it reads", "[tokenizer]") {
  peg::PegTokenizer t{"abc def"};
  peg::ReadSet reads;
  auto ret = t.matchIdentifier(peg::ParsingState{}, reads);
  REQUIRE(ret);
  REQUIRE(reads.intersects(3, 4));
  REQUIRE(!reads.intersects(4, 5));
  auto after = t.skipWhitespaces(*ret, reads);
  REQUIRE(after.offset == 4);
  REQUIRE(reads.intersects(4, 5));
  REQUIRE(!reads.intersects(5, 8));
  REQUIRE(reads.getIntervals().size() == 1);
}

TEST_CASE("ReadSet merges and shifts intervals", "[tokenizer]") {
  peg::ReadSet reads;
  reads.add(5, 7);
  reads.add(1, 2);
  reads.add(10, 12);
  REQUIRE(reads.getIntervals().size() == 3);
  reads.add(2, 5);
  REQUIRE(reads.getIntervals().size() == 2);
  REQUIRE(reads.getIntervals().at(0) == std::make_pair<size_t, size_t>(1, 7));
  REQUIRE(reads.intersects(6, 8));
  REQUIRE(!reads.intersects(7, 10));
  REQUIRE(!reads.intersects(8, 8));

  reads.shift(8, 8, 3);
  REQUIRE(reads.getIntervals().at(0) == std::make_pair<size_t, size_t>(1, 7));
  REQUIRE(reads.getIntervals().at(1) == std::make_pair<size_t, size_t>(13, 15));
  reads.shift(8, 10, -2);
  REQUIRE(reads.getIntervals().at(1) == std::make_pair<size_t, size_t>(11, 13));

  peg::ReadSet other;
  other.add(7, 11);
  reads.merge(other);
  REQUIRE(reads.getIntervals().size() == 1);
  REQUIRE(reads.getIntervals().at(0) == std::make_pair<size_t, size_t>(1, 13));
}

TEST_CASE("LineTable maps offsets to lines and columns", "[tokenizer]") {
  peg::LineTable lines{"ab\ncd\n\ne"};
  REQUIRE(lines.getPosition(0) == std::make_pair<size_t, size_t>(1, 1));
  REQUIRE(lines.getPosition(2) == std::make_pair<size_t, size_t>(1, 3));
  REQUIRE(lines.getPosition(3) == std::make_pair<size_t, size_t>(2, 1));
  REQUIRE(lines.getPosition(6) == std::make_pair<size_t, size_t>(3, 1));
  REQUIRE(lines.getPosition(7) == std::make_pair<size_t, size_t>(4, 1));
  REQUIRE(lines.getPosition(8) == std::make_pair<size_t, size_t>(4, 2));
}

TEST_CASE("LineTable follows edits", "[tokenizer]") {
  peg::LineTable lines{"ab\ncd\n\ne"};
  lines.applyEdit(1, 3, "X\nY\n");
  peg::LineTable fresh{"aX\nY\nd\n\ne"};
  REQUIRE(lines.getLineCount() == 5);
  for(size_t offset = 0; offset <= 9; ++offset) {
    REQUIRE(lines.getPosition(offset) == fresh.getPosition(offset));
  }

  lines.applyEdit(2, 6, "");
  peg::LineTable shorter{"aXe"};
  REQUIRE(lines.getLineCount() == 1);
  REQUIRE(lines.getPosition(2) == shorter.getPosition(2));

  peg::PegTokenizer t{"x = 1;\ny = 2;"};
  t.applyEdit(0, 0, "\n");
  REQUIRE(t.getCode() == "\nx = 1;\ny = 2;");
  REQUIRE(t.getPosition(peg::ParsingState{8}) == std::make_pair<size_t, size_t>(3, 1));
}

TEST_CASE("ParsingExpression stringify", "[parser]") {
  auto rule = std::make_shared<peg::SequenceParsingExpression>(std::vector<peg::sp<peg::ParsingExpression>>{
      std::make_shared<peg::TerminalParsingExpression>("a"),
      std::make_shared<peg::ChoiceParsingExpression>(std::vector<peg::sp<peg::ParsingExpression>>{
          std::make_shared<peg::TerminalParsingExpression>("c"),
          std::make_shared<peg::TerminalParsingExpression>("d")
      }),
      std::make_shared<peg::TerminalParsingExpression>("b")
  });
  REQUIRE(rule->dump() == "'a' ('c' / 'd') 'b'");
  REQUIRE(rule->getKind() == peg::ExpressionKind::SEQUENCE);
  REQUIRE(rule->getChildren().size() == 3);
}

TEST_CASE("ExpressionTokenizer simple", "[parser]") {
  std::string s = "( that is) gre+at*";
  peg::ExpressionTokenizer tokenizer{s};
  REQUIRE(*tokenizer.currentToken() == "(");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "that");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "is");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == ")");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "gre");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "+");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "at");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "*");
  tokenizer.advance();
  REQUIRE(!tokenizer.currentToken().has_value());
  tokenizer.advance();
  REQUIRE(!tokenizer.currentToken().has_value());
}

TEST_CASE("ExpressionTokenizer string and class", "[parser]") {
  std::string s = "'strings \\'are' [so great and] nice";
  peg::ExpressionTokenizer tokenizer{s};
  REQUIRE(*tokenizer.currentToken() == "'strings \\'are'");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "[so great and]");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "nice");
  tokenizer.advance();
  REQUIRE(!tokenizer.currentToken().has_value());
}

TEST_CASE("ExpressionTokenizer string and class escapes", "[parser]") {
  std::string s = R"('strings \\' [\]x] "dq" nice)";
  peg::ExpressionTokenizer tokenizer{s};
  REQUIRE(*tokenizer.currentToken() == R"('strings \\')");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == R"([\]x])");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "\"dq\"");
  tokenizer.advance();
  REQUIRE(*tokenizer.currentToken() == "nice");
}

TEST_CASE("ExpressionTokenizer advanced", "[parser]") {
  std::string s = "'a' ('b' / 'c') !@x:d &.";
  peg::ExpressionTokenizer tokenizer{s};
  std::vector<std::string> tokens;
  while(tokenizer.currentToken()) {
    tokens.push_back(*tokenizer.currentToken());
    tokenizer.advance();
  }
  REQUIRE(tokens == std::vector<std::string>{"'a'", "(", "'b'", "/", "'c'", ")", "!", "@x:", "d", "&", "."});
}

auto parseThenStringifyStaysSame = [] (const char* str) {
  auto res = peg::stringToParsingExpression(str);
  REQUIRE(res);
  REQUIRE(str == res->dump());
};
auto parseThenStringifyStaysSameAfter = [] (const char* str, const char* after) {
  auto res = peg::stringToParsingExpression(str);
  REQUIRE(res);
  REQUIRE(after == res->dump());
};

TEST_CASE("ParsingExpression from string simple", "[parser]") {
  parseThenStringifyStaysSameAfter("'a' 'b'", "'a' 'b'");
  parseThenStringifyStaysSameAfter("'a' 'b' 'c'", "'a' 'b' 'c'");
  parseThenStringifyStaysSameAfter("'a' 'b' 'c' / 'd'", "('a' 'b' 'c' / 'd')");
  parseThenStringifyStaysSameAfter("\"a\"", "'a'");
  parseThenStringifyStaysSame("'a' ('b' / 'c')");
  parseThenStringifyStaysSame("'a' ('b' / 'c') 'd'");
}

TEST_CASE("ParsingExpression from string quantifiers", "[parser]") {
  parseThenStringifyStaysSameAfter("'a'+", "('a')+");
  parseThenStringifyStaysSameAfter("'a'? 'b' 'c'*", "('a')? 'b' ('c')*");
  parseThenStringifyStaysSame("('a')? ('b' 'c')*");
  parseThenStringifyStaysSame("Product (('+' / '-') Product)*");
  parseThenStringifyStaysSame("Value");
}

TEST_CASE("ParsingExpression from string predicates and labels", "[parser]") {
  parseThenStringifyStaysSameAfter("!'a' .", "!('a') .");
  parseThenStringifyStaysSameAfter("&IDENT IDENT", "&(IDENT) IDENT");
  // a prefix operator applies to the whole suffix expression
  parseThenStringifyStaysSameAfter("!'a'*", "!(('a')*)");
  parseThenStringifyStaysSame("@lhs:IDENT '=' @rhs:NUMBER");
  auto labeled = peg::stringToParsingExpression("@name:IDENT");
  REQUIRE(labeled->getLabel());
  REQUIRE(*labeled->getLabel() == "name");
}

TEST_CASE("ParsingExpression from string tokens and classes", "[parser]") {
  parseThenStringifyStaysSameAfter("[\\d]", "[\\d]");
  parseThenStringifyStaysSameAfter("'\\n' '\\''", "'\\n' '\\''");
  auto token = peg::stringToParsingExpression("NUMBER");
  REQUIRE(token->getKind() == peg::ExpressionKind::TOKEN_REF);
  auto ref = peg::stringToParsingExpression("number");
  REQUIRE(ref->getKind() == peg::ExpressionKind::RULE_REF);
  auto empty = peg::stringToParsingExpression("");
  REQUIRE(empty->getKind() == peg::ExpressionKind::LITERAL);
  REQUIRE(empty->dump() == "''");
}

TEST_CASE("ParsingExpression from string rejects malformed patterns", "[parser]") {
  REQUIRE_THROWS_AS(peg::stringToParsingExpression("'abc"), peg::GrammarError);
  REQUIRE_THROWS_AS(peg::stringToParsingExpression("[abc"), peg::GrammarError);
  REQUIRE_THROWS_AS(peg::stringToParsingExpression("('a' 'b'"), peg::GrammarError);
  REQUIRE_THROWS_AS(peg::stringToParsingExpression("'a' )"), peg::GrammarError);
  REQUIRE_THROWS_AS(peg::stringToParsingExpression("'a' | 'b'"), peg::GrammarError);
  REQUIRE_THROWS_AS(peg::stringToParsingExpression("@bad 'a'"), peg::GrammarError);
  REQUIRE_THROWS_AS(peg::stringToParsingExpression("'a' !"), peg::GrammarError);
  REQUIRE_THROWS_AS(peg::stringToParsingExpression("[z-a]"), peg::GrammarError);
}
