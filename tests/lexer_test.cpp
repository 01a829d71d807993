#include <gtest/gtest.h>

#include "stapel.hpp"

using namespace stapel;

namespace {

std::vector<Token> lex(Lexer &lexer) {
	std::vector<Token> tokens;
	while (true) {
		auto token = lexer.next();
		if (!has(token)) break;
		push(tokens, std::move(*token));
	}
	return tokens;
}

std::vector<Token> lex(const std::string &text) {
	Lexer lexer(Source { .name = "test", .text = text });
	auto tokens = lex(lexer);
	EXPECT_TRUE(lexer.errors.empty());
	return tokens;
}

}

TEST(Lexer, Numbers) {
	const auto tokens = lex("1 -2 +3 3.5 -0.25");
	ASSERT_EQ(tokens.size(), 5u);
	EXPECT_EQ(tokens[0].type, Token::Integer);
	EXPECT_EQ(tokens[0].integer, 1);
	EXPECT_EQ(tokens[1].integer, -2);
	EXPECT_EQ(tokens[2].integer, 3);
	EXPECT_EQ(tokens[3].type, Token::Float);
	EXPECT_DOUBLE_EQ(tokens[3].floating, 3.5);
	EXPECT_DOUBLE_EQ(tokens[4].floating, -0.25);
}

TEST(Lexer, SignsAloneAreCalls) {
	const auto tokens = lex("- + -x");
	ASSERT_EQ(tokens.size(), 3u);
	for (const auto &token : tokens) {
		EXPECT_EQ(token.type, Token::Call);
	}
	EXPECT_EQ(tokens[2].text, "-x");
}

TEST(Lexer, WordsAndDelimiters) {
	const auto tokens = lex("(dupe [nil 'sym]) scope:where");
	ASSERT_EQ(tokens.size(), 8u);
	EXPECT_EQ(tokens[0].type, Token::BlockStart);
	EXPECT_EQ(tokens[1].type, Token::Call);
	EXPECT_EQ(tokens[1].text, "dupe");
	EXPECT_EQ(tokens[2].type, Token::ListStart);
	EXPECT_EQ(tokens[3].type, Token::Nil);
	EXPECT_EQ(tokens[4].type, Token::Symbol);
	EXPECT_EQ(tokens[4].text, "sym");
	EXPECT_EQ(tokens[5].type, Token::ListEnd);
	EXPECT_EQ(tokens[6].type, Token::BlockEnd);
	EXPECT_EQ(tokens[7].text, "scope:where");
}

TEST(Lexer, StringEscapes) {
	const auto tokens = lex(R"("a\nb\t\"q\" \\")");
	ASSERT_EQ(tokens.size(), 1u);
	EXPECT_EQ(tokens[0].type, Token::String);
	EXPECT_EQ(tokens[0].text, "a\nb\t\"q\" \\");
}

TEST(Lexer, CommentsRunToEndOfLine) {
	const auto tokens = lex("1 ; 2 3\n4");
	ASSERT_EQ(tokens.size(), 2u);
	EXPECT_EQ(tokens[0].integer, 1);
	EXPECT_EQ(tokens[1].integer, 4);
}

TEST(Lexer, UnterminatedString) {
	Lexer lexer(Source { .name = "test", .text = "1 \"abc" });
	lex(lexer);
	ASSERT_EQ(lexer.errors.size(), 1u);
	EXPECT_EQ(lexer.errors[0].kind, Error::UnterminatedString);
}

TEST(Lexer, InvalidEscape) {
	Lexer lexer(Source { .name = "test", .text = R"("\q")" });
	lex(lexer);
	ASSERT_FALSE(lexer.errors.empty());
	EXPECT_EQ(lexer.errors[0].kind, Error::InvalidEscape);
}

TEST(Lexer, MalformedNumbers) {
	for (const char *text : { "1.2.3", "12abc", "99999999999999999999" }) {
		Lexer lexer(Source { .name = "test", .text = text });
		lex(lexer);
		ASSERT_EQ(lexer.errors.size(), 1u) << text;
		EXPECT_EQ(lexer.errors[0].kind, Error::MalformedLiteral) << text;
	}
}

TEST(Lexer, EmptySymbol) {
	Lexer lexer(Source { .name = "test", .text = "' 1" });
	const auto tokens = lex(lexer);
	ASSERT_EQ(lexer.errors.size(), 1u);
	EXPECT_EQ(lexer.errors[0].kind, Error::MalformedLiteral);
	ASSERT_EQ(tokens.size(), 1u);
	EXPECT_EQ(tokens[0].integer, 1);
}

TEST(Lexer, ErrorLocation) {
	Lexer lexer(Source { .name = "file.st", .text = "1 2\n  \"oops" });
	lex(lexer);
	ASSERT_EQ(lexer.errors.size(), 1u);
	ASSERT_TRUE(has(lexer.errors[0].location));
	const Location &loc = *lexer.errors[0].location;
	EXPECT_EQ(loc.source, "file.st");
	EXPECT_EQ(loc.line, 2u);
	EXPECT_EQ(loc.column, 3u);
}
