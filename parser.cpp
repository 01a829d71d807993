#include "./stapel.hpp"

namespace stapel {

namespace {

enum frame_mode_t {
	FRAME_Block,
	FRAME_List,
};

const char *closer_of(frame_mode_t mode) {
	return mode == FRAME_Block ? ")" : "]";
}

}

Exprs Parser::parse() {
	std::vector<Exprs> blocks(1);
	std::vector<frame_mode_t> modes;
	std::vector<size_t> openers;

	while (true) {
		const auto token = lexer.next();
		if (!lexer.errors.empty()) {
			error = lexer.errors.front();
			return {};
		}
		if (!has(token)) break;

		const Token &tok = *token;
		switch (tok.type) {
			case Token::Integer: {
				push(blocks.back(), Expr::new_integer(tok.integer));
			} break;
			case Token::Float: {
				push(blocks.back(), Expr::new_float(tok.floating));
			} break;
			case Token::String: {
				push(blocks.back(), Expr::new_string(tok.text));
			} break;
			case Token::Symbol: {
				push(blocks.back(), Expr::new_symbol(tok.text));
			} break;
			case Token::Call: {
				if (tok.text == "true") {
					push(blocks.back(), Expr::new_boolean(true));
				} else if (tok.text == "false") {
					push(blocks.back(), Expr::new_boolean(false));
				} else if (tok.text == "_") {
					push(blocks.back(), Expr::new_underscore());
				} else {
					push(blocks.back(), Expr::new_call(tok.text));
				}
			} break;
			case Token::Nil: {
				push(blocks.back(), Expr::new_nil());
			} break;
			case Token::BlockStart:
			case Token::ListStart: {
				push(blocks, Exprs {});
				push(modes, tok.type == Token::BlockStart ? FRAME_Block : FRAME_List);
				push(openers, tok.offset);
			} break;
			case Token::BlockEnd:
			case Token::ListEnd: {
				const frame_mode_t expected = tok.type == Token::BlockEnd ? FRAME_Block : FRAME_List;
				if (modes.empty() || modes.back() != expected) {
					std::string message = "mismatched brackets: unexpected `" + tok.text + "`";
					if (!modes.empty()) {
						message += std::string(", expected `") + closer_of(modes.back()) + "`";
					}
					error = Error {
						.kind = Error::MismatchedBracket,
						.message = std::move(message),
						.location = lexer.source.locate(tok.offset),
					};
					return {};
				}

				pop(modes);
				pop(openers);
				Exprs items = pop(blocks);
				push(blocks.back(), expected == FRAME_Block
					? Expr::new_block(std::move(items))
					: Expr::new_list(std::move(items)));
			} break;
		}
	}

	if (length(blocks) != 1) {
		error = Error {
			.kind = Error::UnbalancedBlock,
			.message = std::string("unbalanced blocks: missing `") + closer_of(modes.back()) + "`",
			.location = lexer.source.locate(openers.back()),
		};
		return {};
	}

	return pop(blocks);
}

Exprs parse(Lexer &lexer, maybe_t<Error> &error) {
	Parser parser(lexer);
	Exprs exprs = parser.parse();
	error = parser.error;
	return exprs;
}

}
