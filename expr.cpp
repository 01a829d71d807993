#include <cmath>
#include <fstream>
#include <iterator>
#include <limits>
#include <ostream>
#include <sstream>

#include "./stapel.hpp"

namespace stapel {

/*** SECTION: Sources ***/

maybe_t<Source> Source::from_path(const std::string &path) {
	std::ifstream file(path, std::ios::binary);
	if (!file) return {};

	std::string text { std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>() };
	if (file.bad()) return {};

	return Source { .name = path, .text = std::move(text) };
}

Location Source::locate(size_t offset) const {
	size_t line = 1;
	size_t column = 1;
	for (size_t i = 0; i < offset && i < text.size(); ++i) {
		if (text[i] == '\n') {
			++line;
			column = 1;
		} else {
			++column;
		}
	}
	return { .source = name, .line = line, .column = column };
}

/*** SECTION: Val arithmetic ***/

namespace {

constexpr int64_t INT_MAX_V = std::numeric_limits<int64_t>::max();
constexpr int64_t INT_MIN_V = std::numeric_limits<int64_t>::min();

int64_t saturating_add(int64_t a, int64_t b) {
	if (b > 0 && a > INT_MAX_V - b) return INT_MAX_V;
	if (b < 0 && a < INT_MIN_V - b) return INT_MIN_V;
	return a + b;
}

int64_t saturating_sub(int64_t a, int64_t b) {
	if (b < 0 && a > INT_MAX_V + b) return INT_MAX_V;
	if (b > 0 && a < INT_MIN_V + b) return INT_MIN_V;
	return a - b;
}

int64_t saturating_mul(int64_t a, int64_t b) {
	if (a == 0 || b == 0) return 0;

	const bool negative = (a < 0) != (b < 0);
	if (a == INT_MIN_V || b == INT_MIN_V) {
		if (a == 1 || b == 1) return INT_MIN_V;
		return negative ? INT_MIN_V : INT_MAX_V;
	}

	const int64_t abs_a = a < 0 ? -a : a;
	const int64_t abs_b = b < 0 ? -b : b;
	if (abs_a > INT_MAX_V / abs_b) {
		return negative ? INT_MIN_V : INT_MAX_V;
	}
	return a * b;
}

// The only overflowing quotient is INT_MIN / -1.
int64_t saturating_div(int64_t a, int64_t b) {
	if (a == INT_MIN_V && b == -1) return INT_MAX_V;
	return a / b;
}

}

bool operator==(const Val &lhs, const Val &rhs) {
	if (lhs.type != rhs.type) return false;
	switch (lhs.type) {
		case Val::Integer: return lhs.integer == rhs.integer;
		case Val::Float: return lhs.floating == rhs.floating;
	}
	return false;
}

namespace {

ValResult ok(Val value, Val lhs, Val rhs) {
	return ValResult { .fail = ValResult::None, .value = value, .lhs = lhs, .rhs = rhs };
}

ValResult failed(ValResult::Fail fail, Val lhs, Val rhs) {
	return ValResult { .fail = fail, .value = {}, .lhs = lhs, .rhs = rhs };
}

}

ValResult add(Val lhs, Val rhs) {
	if (lhs.type != rhs.type) return failed(ValResult::Mismatch, lhs, rhs);
	if (lhs.type == Val::Integer) return ok(Val::new_integer(saturating_add(lhs.integer, rhs.integer)), lhs, rhs);
	return ok(Val::new_float(lhs.floating + rhs.floating), lhs, rhs);
}

ValResult sub(Val lhs, Val rhs) {
	if (lhs.type != rhs.type) return failed(ValResult::Mismatch, lhs, rhs);
	if (lhs.type == Val::Integer) return ok(Val::new_integer(saturating_sub(lhs.integer, rhs.integer)), lhs, rhs);
	return ok(Val::new_float(lhs.floating - rhs.floating), lhs, rhs);
}

ValResult mul(Val lhs, Val rhs) {
	if (lhs.type != rhs.type) return failed(ValResult::Mismatch, lhs, rhs);
	if (lhs.type == Val::Integer) return ok(Val::new_integer(saturating_mul(lhs.integer, rhs.integer)), lhs, rhs);
	return ok(Val::new_float(lhs.floating * rhs.floating), lhs, rhs);
}

ValResult div(Val lhs, Val rhs) {
	if (lhs.type != rhs.type) return failed(ValResult::Mismatch, lhs, rhs);
	if (lhs.type == Val::Integer) {
		if (rhs.integer == 0) return failed(ValResult::ZeroDivisor, lhs, rhs);
		return ok(Val::new_integer(saturating_div(lhs.integer, rhs.integer)), lhs, rhs);
	}
	return ok(Val::new_float(lhs.floating / rhs.floating), lhs, rhs);
}

ValResult rem(Val lhs, Val rhs) {
	if (lhs.type != rhs.type) return failed(ValResult::Mismatch, lhs, rhs);
	if (lhs.type == Val::Integer) {
		if (rhs.integer == 0) return failed(ValResult::ZeroDivisor, lhs, rhs);
		if (lhs.integer == INT_MIN_V && rhs.integer == -1) return ok(Val::new_integer(0), lhs, rhs);
		return ok(Val::new_integer(lhs.integer % rhs.integer), lhs, rhs);
	}
	return ok(Val::new_float(std::fmod(lhs.floating, rhs.floating)), lhs, rhs);
}

/*** SECTION: Expr ***/

Expr Expr::from_val(Val val) {
	switch (val.type) {
		case Val::Integer: return new_integer(val.integer);
		case Val::Float: return new_float(val.floating);
	}
	return new_nil();
}

maybe_t<Val> Expr::to_val() const {
	if (kind == Integer) return Val::new_integer(integer);
	if (kind == Float) return Val::new_float(floating);
	return {};
}

bool Expr::is_truthy() const {
	switch (kind) {
		case Nil: return false;
		case Boolean: return boolean;
		case Integer: return integer != 0;
		case Float: return floating != 0.0;
		case String:
		case Symbol:
		case Call:
		case Block:
		case List:
		case Record:
		case Function:
		case SExpr:
		case Underscore:
			return true;
	}
	return true;
}

bool operator==(const Expr &lhs, const Expr &rhs) {
	// numbers and booleans coerce across kinds
	if (lhs.kind != rhs.kind) {
		if (lhs.kind == Expr::Integer && rhs.kind == Expr::Float) {
			return static_cast<double>(lhs.integer) == rhs.floating;
		}
		if (lhs.kind == Expr::Float && rhs.kind == Expr::Integer) {
			return lhs.floating == static_cast<double>(rhs.integer);
		}
		if (lhs.kind == Expr::Integer && rhs.kind == Expr::Boolean) {
			return (lhs.integer != 0) == rhs.boolean;
		}
		if (lhs.kind == Expr::Boolean && rhs.kind == Expr::Integer) {
			return lhs.boolean == (rhs.integer != 0);
		}
		return false;
	}

	switch (lhs.kind) {
		case Expr::Nil:
		case Expr::Underscore:
			return true;
		case Expr::Boolean: return lhs.boolean == rhs.boolean;
		case Expr::Integer: return lhs.integer == rhs.integer;
		case Expr::Float: return lhs.floating == rhs.floating;
		case Expr::String:
		case Expr::Symbol:
		case Expr::Call:
			return lhs.text == rhs.text;
		case Expr::Block:
		case Expr::List:
			return lhs.items == rhs.items;
		case Expr::Record: return lhs.record == rhs.record;
		case Expr::Function: return lhs.scope == rhs.scope && lhs.items == rhs.items;
		case Expr::SExpr: return lhs.text == rhs.text && lhs.items == rhs.items;
	}
	return false;
}

const char *kind_name(Expr::Kind kind) {
	switch (kind) {
		case Expr::Nil: return "nil";
		case Expr::Boolean: return "boolean";
		case Expr::Integer: return "integer";
		case Expr::Float: return "float";
		case Expr::String: return "string";
		case Expr::Symbol: return "symbol";
		case Expr::Call: return "call";
		case Expr::Block: return "block";
		case Expr::List: return "list";
		case Expr::Record: return "record";
		case Expr::Function: return "function";
		case Expr::SExpr: return "sexpr";
		case Expr::Underscore: return "underscore";
	}
	return "unknown";
}

maybe_t<Expr::Kind> kind_from_name(const std::string &name) {
	for (int i = Expr::Nil; i <= Expr::Underscore; ++i) {
		const auto kind = static_cast<Expr::Kind>(i);
		if (name == kind_name(kind)) return kind;
	}
	return {};
}

/*** SECTION: Rendering ***/

namespace {

enum render_t {
	RENDER_Display,
	RENDER_Debug,
};

std::string float_string(double value) {
	std::ostringstream ss;
	ss << value;
	std::string res = ss.str();
	if (std::isfinite(value) && res.find_first_of(".e") == std::string::npos) {
		res += ".0";
	}
	return res;
}

std::string escape(const std::string &text) {
	std::string res = "\"";
	for (const char ch : text) {
		switch (ch) {
			case '\n': res += "\\n"; break;
			case '\t': res += "\\t"; break;
			case '\r': res += "\\r"; break;
			case '\0': res += "\\0"; break;
			case '\\': res += "\\\\"; break;
			case '"': res += "\\\""; break;
			default: res += ch;
		}
	}
	res += '"';
	return res;
}

void render(std::string &out, const Expr &expr, render_t mode);

// Items inside collections always use the debug form.
void render_seq(std::string &out, const Exprs &items, render_t mode) {
	for (size_t i = 0; i < items.size(); ++i) {
		if (i) out += ' ';
		render(out, items[i], mode);
	}
}

void render(std::string &out, const Expr &expr, render_t mode) {
	switch (expr.kind) {
		case Expr::Nil: out += "nil"; break;
		case Expr::Underscore: out += "_"; break;
		case Expr::Boolean: out += expr.boolean ? "true" : "false"; break;
		case Expr::Integer: out += std::to_string(expr.integer); break;
		case Expr::Float: out += float_string(expr.floating); break;
		case Expr::String: {
			out += mode == RENDER_Debug ? escape(expr.text) : expr.text;
		} break;
		case Expr::Symbol: {
			if (mode == RENDER_Debug) out += '\'';
			out += expr.text;
		} break;
		case Expr::Call: out += expr.text; break;
		case Expr::Block: {
			out += '(';
			render_seq(out, expr.items, RENDER_Debug);
			out += ')';
		} break;
		case Expr::List: {
			out += '[';
			render_seq(out, expr.items, RENDER_Debug);
			out += ']';
		} break;
		case Expr::Record: {
			out += '{';
			bool first = true;
			for (const auto &[key, value] : expr.record) {
				if (!first) out += ", ";
				first = false;
				out += key;
				out += ": ";
				render(out, value, RENDER_Debug);
			}
			out += '}';
		} break;
		case Expr::Function: {
			out += "(fn";
			if (!expr.items.empty()) out += ' ';
			render_seq(out, expr.items, RENDER_Debug);
			out += ')';
		} break;
		case Expr::SExpr: {
			out += '(';
			out += expr.text;
			if (!expr.items.empty()) out += ' ';
			render_seq(out, expr.items, RENDER_Debug);
			out += ')';
		} break;
	}
}

void render_pretty(std::string &out, const Expr &expr, size_t depth) {
	const std::string indent(depth * 2, ' ');
	const std::string inner((depth + 1) * 2, ' ');

	const char *open = nullptr;
	const char *close = nullptr;
	switch (expr.kind) {
		case Expr::Block: open = "("; close = ")"; break;
		case Expr::List: open = "["; close = "]"; break;
		case Expr::Record: open = "{"; close = "}"; break;
		case Expr::Nil:
		case Expr::Boolean:
		case Expr::Integer:
		case Expr::Float:
		case Expr::String:
		case Expr::Symbol:
		case Expr::Call:
		case Expr::Function:
		case Expr::SExpr:
		case Expr::Underscore:
			break;
	}

	const bool empty = expr.items.empty() && expr.record.empty();
	if (open == nullptr || empty) {
		render(out, expr, RENDER_Debug);
		return;
	}

	out += open;
	out += '\n';
	if (expr.kind == Expr::Record) {
		for (const auto &[key, value] : expr.record) {
			out += inner;
			out += key;
			out += ": ";
			render_pretty(out, value, depth + 1);
			out += '\n';
		}
	} else {
		for (const auto &item : expr.items) {
			out += inner;
			render_pretty(out, item, depth + 1);
			out += '\n';
		}
	}
	out += indent;
	out += close;
}

}

std::string to_string(const Expr &expr) {
	std::string out;
	render(out, expr, RENDER_Display);
	return out;
}

std::string debug_string(const Expr &expr) {
	std::string out;
	render(out, expr, RENDER_Debug);
	return out;
}

std::string pretty_string(const Expr &expr) {
	std::string out;
	render_pretty(out, expr, 0);
	return out;
}

std::ostream &operator<<(std::ostream &os, const Expr &expr) {
	return os << debug_string(expr);
}

/*** SECTION: Errors ***/

const char *error_kind_name(Error::Kind kind) {
	switch (kind) {
		case Error::MalformedLiteral: return "malformed literal";
		case Error::UnterminatedString: return "unterminated string";
		case Error::InvalidEscape: return "invalid escape";
		case Error::UnexpectedCharacter: return "unexpected character";
		case Error::MismatchedBracket: return "mismatched bracket";
		case Error::UnbalancedBlock: return "unbalanced block";
		case Error::StackUnderflow: return "stack underflow";
		case Error::IpBounds: return "instruction pointer out of bounds";
		case Error::UnsupportedOperands: return "unsupported operands";
		case Error::TypeMismatch: return "type mismatch";
		case Error::UnknownName: return "unknown name";
		case Error::IndexOutOfBounds: return "index out of bounds";
		case Error::DivisionByZero: return "division by zero";
		case Error::InvalidCast: return "invalid cast";
		case Error::AssertionFailed: return "assertion failed";
		case Error::InvalidRecur: return "invalid recur";
		case Error::CallDepth: return "call depth exceeded";
		case Error::ImportFailed: return "import failed";
	}
	return "error";
}

std::ostream &operator<<(std::ostream &os, const Error &error) {
	os << error_kind_name(error.kind) << ": " << error.message;
	if (!error.operands.empty()) {
		os << " (operands:";
		for (const auto &operand : error.operands) {
			os << ' ' << operand;
		}
		os << ')';
	}
	if (has(error.location)) {
		const Location &loc = get(error.location);
		os << " @ " << loc.source << ':' << loc.line << ':' << loc.column;
	}
	return os;
}

}
