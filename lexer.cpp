#include <cerrno>
#include <cstdlib>
#include <cstring>

#include "./stapel.hpp"

namespace stapel {

namespace {

bool is_space(char ch) {
	return ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r' || ch == '\f' || ch == '\v';
}

bool is_delimiter(char ch) {
	return is_space(ch) || strchr("()[]\";'", ch) != nullptr;
}

bool is_control(char ch) {
	const auto byte = static_cast<unsigned char>(ch);
	return byte < 0x20 || byte == 0x7f;
}

bool is_digit(char ch) {
	return '0' <= ch && ch <= '9';
}

bool starts_number(const std::string &word) {
	if (word.empty()) return false;
	if (is_digit(word[0])) return true;
	return (word[0] == '-' || word[0] == '+') && word.size() > 1 && is_digit(word[1]);
}

}

void Lexer::report(Error::Kind kind, std::string message, size_t offset) {
	push(errors, Error {
		.kind = kind,
		.message = std::move(message),
		.location = source.locate(offset),
	});
}

void Lexer::skip_blank() {
	const std::string &text = source.text;
	while (pos < text.size()) {
		const char ch = text[pos];
		if (is_space(ch)) {
			++pos;
		} else if (ch == ';') {
			while (pos < text.size() && text[pos] != '\n') ++pos;
		} else if (is_control(ch)) {
			report(Error::UnexpectedCharacter, "unexpected control character", pos);
			++pos;
		} else {
			break;
		}
	}
}

maybe_t<Token> Lexer::read_string() {
	const std::string &text = source.text;
	const size_t start = pos;
	++pos; // opening quote

	std::string contents;
	while (true) {
		if (pos >= text.size()) {
			report(Error::UnterminatedString, "unterminated string literal", start);
			return {};
		}

		const char ch = text[pos++];
		if (ch == '"') break;
		if (ch != '\\') {
			contents += ch;
			continue;
		}

		if (pos >= text.size()) {
			report(Error::UnterminatedString, "unterminated string literal", start);
			return {};
		}
		const char esc = text[pos++];
		switch (esc) {
			case 'n': contents += '\n'; break;
			case 't': contents += '\t'; break;
			case 'r': contents += '\r'; break;
			case '0': contents += '\0'; break;
			case '\\': contents += '\\'; break;
			case '"': contents += '"'; break;
			case '\'': contents += '\''; break;
			default: {
				report(Error::InvalidEscape, std::string("invalid escape sequence `\\") + esc + "`", pos - 2);
				contents += esc;
			} break;
		}
	}

	Token token { .type = Token::String };
	token.text = std::move(contents);
	token.offset = start;
	return token;
}

maybe_t<Token> Lexer::read_symbol() {
	const std::string &text = source.text;
	const size_t start = pos;
	++pos; // quote

	const size_t name_start = pos;
	while (pos < text.size() && !is_delimiter(text[pos]) && !is_control(text[pos])) ++pos;

	if (pos == name_start) {
		report(Error::MalformedLiteral, "expected a name after `'`", start);
		return next();
	}

	Token token { .type = Token::Symbol };
	token.text = text.substr(name_start, pos - name_start);
	token.offset = start;
	return token;
}

maybe_t<Token> Lexer::read_word() {
	const std::string &text = source.text;
	const size_t start = pos;
	while (pos < text.size() && !is_delimiter(text[pos]) && !is_control(text[pos])) ++pos;

	std::string word = text.substr(start, pos - start);

	Token token { .type = Token::Call };
	token.offset = start;

	if (starts_number(word)) {
		const char *begin = word.c_str();
		char *end = nullptr;
		errno = 0;

		if (word.find('.') != std::string::npos) {
			const double value = strtod(begin, &end);
			if (*end != '\0') {
				report(Error::MalformedLiteral, "malformed float literal `" + word + "`", start);
				return next();
			}
			token.type = Token::Float;
			token.floating = value;
		} else {
			const long long value = strtoll(begin, &end, 10);
			if (*end != '\0') {
				report(Error::MalformedLiteral, "malformed integer literal `" + word + "`", start);
				return next();
			}
			if (errno == ERANGE) {
				report(Error::MalformedLiteral, "integer literal `" + word + "` does not fit in 64 bits", start);
				return next();
			}
			token.type = Token::Integer;
			token.integer = value;
		}
		token.text = std::move(word);
		return token;
	}

	if (word == "nil") token.type = Token::Nil;
	token.text = std::move(word);
	return token;
}

maybe_t<Token> Lexer::next() {
	skip_blank();

	if (pos >= source.text.size()) return {};

	const char ch = source.text[pos];
	Token token;
	token.offset = pos;
	switch (ch) {
		case '(': token.type = Token::BlockStart; break;
		case ')': token.type = Token::BlockEnd; break;
		case '[': token.type = Token::ListStart; break;
		case ']': token.type = Token::ListEnd; break;
		case '"': return read_string();
		case '\'': return read_symbol();
		default: return read_word();
	}

	token.text = std::string(1, ch);
	++pos;
	return token;
}

}
