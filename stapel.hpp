#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stapel {

struct Expr;
struct Scope;
struct Context;
struct Engine;
struct VM;

using idx_t = uint64_t;
static_assert(
	sizeof(idx_t) == sizeof(size_t),
	"Expected word size to be 64 bits"
);

template<typename T>
using maybe_t = std::optional<T>;

template<typename T>
bool has(const maybe_t<T> &maybe) { return maybe.has_value(); }
template<typename T>
T get(const maybe_t<T> &maybe) { return maybe.value(); }
template<typename T>
T get_or(const maybe_t<T> &maybe, T alternative) {
	return maybe.value_or(alternative);
}

template<typename T>
void push(std::vector<T> &vec, T value) {
	vec.push_back(std::move(value));
}
template<typename T>
T pop(std::vector<T> &vec) {
	T res = std::move(vec.back());
	vec.pop_back();
	return res;
}
template<typename T>
size_t length(const std::vector<T> &vec) {
	return vec.size();
}

constexpr size_t MAX_FRAMES = 4096;
constexpr size_t DEFAULT_JOURNAL_LEN = 20;
constexpr size_t MAX_JOURNAL_LEN = 1000000;

/*** SECTION: Sources ***/

struct Location {
	std::string source;
	size_t line;
	size_t column;
};

struct Source {
	std::string name;
	std::string text;

	static maybe_t<Source> from_path(const std::string &path);

	Location locate(size_t offset) const;
};

/*** SECTION: Machine values ***/

// Numeric value carried by Push ops.
struct Val {
	enum Type {
		Integer,
		Float,
	} type;
	union {
		int64_t integer;
		double floating;
	};

	static Val new_integer(int64_t integer) {
		Val val { .type = Integer };
		val.integer = integer;
		return val;
	}
	static Val new_float(double floating) {
		Val val { .type = Float };
		val.floating = floating;
		return val;
	}
};

bool operator==(const Val &lhs, const Val &rhs);

// On failure `value` is empty; the operands are kept either way.
struct ValResult {
	enum Fail {
		None,
		Mismatch,
		ZeroDivisor,
	} fail;
	maybe_t<Val> value;
	Val lhs;
	Val rhs;

	bool ok() const { return fail == None; }
};

ValResult add(Val lhs, Val rhs);
ValResult sub(Val lhs, Val rhs);
ValResult mul(Val lhs, Val rhs);
ValResult div(Val lhs, Val rhs);
ValResult rem(Val lhs, Val rhs);

/*** SECTION: Expressions ***/

using Exprs = std::vector<Expr>;
using RecordMap = std::map<std::string, Expr>;

struct Expr {
	enum Kind {
		Nil,
		Boolean,
		Integer,
		Float,
		String,
		Symbol,
		Call,
		Block,
		List,
		Record,
		Function,
		SExpr,
		Underscore,
	} kind = Nil;
	union {
		bool boolean;
		int64_t integer = 0;
		double floating;
	};
	// String contents, Symbol/Call name, SExpr call name.
	std::string text;
	// Block, List, Function body, SExpr body.
	Exprs items;
	RecordMap record;
	// Function only.
	std::shared_ptr<Scope> scope;

	static Expr new_nil() { return {}; }
	static Expr new_underscore() {
		Expr expr;
		expr.kind = Underscore;
		return expr;
	}
	static Expr new_boolean(bool boolean) {
		Expr expr;
		expr.kind = Boolean;
		expr.boolean = boolean;
		return expr;
	}
	static Expr new_integer(int64_t integer) {
		Expr expr;
		expr.kind = Integer;
		expr.integer = integer;
		return expr;
	}
	static Expr new_float(double floating) {
		Expr expr;
		expr.kind = Float;
		expr.floating = floating;
		return expr;
	}
	static Expr new_string(std::string text) {
		Expr expr;
		expr.kind = String;
		expr.text = std::move(text);
		return expr;
	}
	static Expr new_symbol(std::string name) {
		Expr expr;
		expr.kind = Symbol;
		expr.text = std::move(name);
		return expr;
	}
	static Expr new_call(std::string name) {
		Expr expr;
		expr.kind = Call;
		expr.text = std::move(name);
		return expr;
	}
	static Expr new_block(Exprs items) {
		Expr expr;
		expr.kind = Block;
		expr.items = std::move(items);
		return expr;
	}
	static Expr new_list(Exprs items) {
		Expr expr;
		expr.kind = List;
		expr.items = std::move(items);
		return expr;
	}
	static Expr new_record(RecordMap record) {
		Expr expr;
		expr.kind = Record;
		expr.record = std::move(record);
		return expr;
	}
	static Expr new_function(std::shared_ptr<Scope> scope, Exprs body) {
		Expr expr;
		expr.kind = Function;
		expr.scope = std::move(scope);
		expr.items = std::move(body);
		return expr;
	}
	static Expr new_sexpr(std::string call, Exprs body) {
		Expr expr;
		expr.kind = SExpr;
		expr.text = std::move(call);
		expr.items = std::move(body);
		return expr;
	}
	static Expr from_val(Val val);

	maybe_t<Val> to_val() const;
	bool is_truthy() const;
	bool is_nil() const { return kind == Nil; }
	bool is_callable() const {
		return kind == Block || kind == Function || kind == SExpr;
	}
};

bool operator==(const Expr &lhs, const Expr &rhs);
inline bool operator!=(const Expr &lhs, const Expr &rhs) { return !(lhs == rhs); }

const char *kind_name(Expr::Kind kind);
maybe_t<Expr::Kind> kind_from_name(const std::string &name);

// `print` form: strings unquoted, symbols bare.
std::string to_string(const Expr &expr);
// `debug` form: strings quoted and escaped, symbols with a leading quote.
std::string debug_string(const Expr &expr);
// `pretty` form: debug form with one nested item per line.
std::string pretty_string(const Expr &expr);

std::ostream &operator<<(std::ostream &os, const Expr &expr);

/*** SECTION: Errors ***/

struct Error {
	enum Kind {
		// lexing and parsing
		MalformedLiteral,
		UnterminatedString,
		InvalidEscape,
		UnexpectedCharacter,
		MismatchedBracket,
		UnbalancedBlock,

		// execution
		StackUnderflow,
		IpBounds,
		UnsupportedOperands,
		TypeMismatch,
		UnknownName,
		IndexOutOfBounds,
		DivisionByZero,
		InvalidCast,
		AssertionFailed,
		InvalidRecur,
		CallDepth,
		ImportFailed,
	} kind;
	std::string message;
	// The values popped by the failing operation, left to right.
	Exprs operands = {};
	maybe_t<Location> location = {};
};

const char *error_kind_name(Error::Kind kind);
std::ostream &operator<<(std::ostream &os, const Error &error);

/*** SECTION: Lexer ***/

struct Token {
	enum Type {
		Integer,
		Float,
		String,
		Symbol,
		Call,
		Nil,
		BlockStart,
		BlockEnd,
		ListStart,
		ListEnd,
	} type;
	union {
		int64_t integer = 0;
		double floating;
	};
	std::string text;
	size_t offset = 0;
};

struct Lexer {
	Source source;
	size_t pos = 0;
	std::vector<Error> errors;

	explicit Lexer(Source source) : source(std::move(source)) { }

	maybe_t<Token> next();

private:
	void skip_blank();
	maybe_t<Token> read_string();
	maybe_t<Token> read_symbol();
	maybe_t<Token> read_word();
	void report(Error::Kind kind, std::string message, size_t offset);
};

/*** SECTION: Parser ***/

struct Parser {
	Lexer &lexer;
	maybe_t<Error> error;

	explicit Parser(Lexer &lexer) : lexer(lexer) { }

	// Empty on failure, with `error` set.
	Exprs parse();
};

Exprs parse(Lexer &lexer, maybe_t<Error> &error);

/*** SECTION: Intrinsics ***/

enum intrinsic_t {
	IN_Add,
	IN_Sub,
	IN_Mul,
	IN_Div,
	IN_Rem,

	IN_Eq,
	IN_Ne,
	IN_Lt,
	IN_Le,
	IN_Gt,
	IN_Ge,

	IN_Or,
	IN_And,
	IN_Not,
	IN_Assert,

	IN_Drop,
	IN_Dupe,
	IN_Swap,
	IN_Rot,

	IN_Len,
	IN_Nth,
	IN_Split,
	IN_Concat,
	IN_Push,
	IN_Pop,
	IN_Insert,
	IN_Prop,
	IN_Has,
	IN_Remove,
	IN_Keys,
	IN_Values,

	IN_Cast,
	IN_TypeOf,

	IN_Lazy,
	IN_If,
	IN_Halt,
	IN_Call,
	IN_Recur,
	IN_OrElse,

	IN_Let,
	IN_Def,
	IN_Set,
	IN_Get,

	IN_Debug,
	IN_Print,
	IN_Pretty,
	IN_Import,

	IN_COUNT,
};

struct Intrinsic {
	const char *name;
	const char *desc;
	void (*fun)(VM&);
};

extern const Intrinsic intrinsics[IN_COUNT];

maybe_t<intrinsic_t> find_intrinsic(const std::string &name);

/*** SECTION: Instructions ***/

struct Op {
	enum Type {
		Push,
		Const,
		Closure,
		Intrinsic,
		Call,
		ListStart,
		ListEnd,
		End,
	} type;
	Val val = Val::new_integer(0);
	intrinsic_t intrinsic = IN_COUNT;
	// Const value, Closure body (as a Block), Call name (as a Call).
	Expr expr = {};

	static Op new_push(Val val) { return { .type = Push, .val = val }; }
	static Op new_const(Expr expr) { return { .type = Const, .expr = std::move(expr) }; }
	static Op new_closure(Exprs body) {
		return { .type = Closure, .expr = Expr::new_block(std::move(body)) };
	}
	static Op new_intrinsic(intrinsic_t intrinsic) {
		return { .type = Intrinsic, .intrinsic = intrinsic };
	}
	static Op new_call(std::string name) {
		return { .type = Call, .expr = Expr::new_call(std::move(name)) };
	}
	static Op new_list_start() { return { .type = ListStart }; }
	static Op new_list_end() { return { .type = ListEnd }; }
	static Op new_end() { return { .type = End }; }
};

using Ops = std::vector<Op>;

bool operator==(const Op &lhs, const Op &rhs);
std::ostream &operator<<(std::ostream &os, const Op &op);

// Lowers `exprs` into `ops` and terminates the stream with one End.
void compile(const Exprs &exprs, Ops &ops);
Ops compile(const Exprs &exprs);

/*** SECTION: Context ***/

using Stack = std::vector<Expr>;

struct Scope {
	std::shared_ptr<Scope> parent;
	std::unordered_map<std::string, Expr> lets;

	explicit Scope(std::shared_ptr<Scope> parent = nullptr) : parent(std::move(parent)) { }

	// Searches this scope, then its parents.
	Expr *find(const std::string &name);
	const Expr *find(const std::string &name) const;
};

struct ScopeItem {
	Expr value;
};

using ScopeItems = std::map<std::string, std::shared_ptr<ScopeItem>>;

// Fixed-capacity history of stack snapshots, oldest evicted first.
// Slots are allocated as entries arrive, up to `max_len`.
struct Journal {
	explicit Journal(size_t max_len) : max_len(max_len) { }

	void record(const Stack &stack);
	std::vector<Stack> entries() const;
	size_t size() const { return buffer.size(); }
	size_t capacity() const { return max_len; }

private:
	std::vector<Stack> buffer;
	size_t max_len;
	// Oldest entry once the buffer is full.
	size_t head = 0;
};

// Parses a journal length flag. Nothing when malformed or above MAX_JOURNAL_LEN.
maybe_t<size_t> parse_journal_len(const std::string &str);

struct Context {
	std::shared_ptr<Scope> scope;
	ScopeItems items;
	maybe_t<Journal> journal;
	std::vector<Source> sources;

	Context();

	Context &with_journal(size_t max_len);

	void add_source(Source source);

	const Expr *let_get(const std::string &name) const;
	void let(const std::string &name, Expr value);
	// Rebinds the nearest existing `let`. False if there is none.
	bool let_set(const std::string &name, Expr value);

	std::shared_ptr<ScopeItem> scope_item(const std::string &name) const;
	void def(const std::string &name, Expr value);
	const ScopeItems &scope_items() const { return items; }
};

/*** SECTION: Modules ***/

using module_fn_t = void (*)(VM&);

struct Module {
	std::string name;
	std::map<std::string, module_fn_t> funcs;

	explicit Module(std::string name) : name(std::move(name)) { }

	Module &add_func(const std::string &func_name, module_fn_t fun);
	maybe_t<module_fn_t> func(const std::string &func_name) const;
};

struct Engine {
	std::map<std::string, Module> modules;
	// Disables importing source files.
	bool sandbox = false;

	Engine &add_module(Module module);
	const Module *module(const std::string &name) const;
};

// Standard modules that `import` can load by name.
maybe_t<Module> std_module(const std::string &name);
Module scope_module();

enum name_kind_t {
	NK_Unresolved,
	NK_Intrinsic,
	NK_Module,
	NK_Let,
	NK_Item,
};

name_kind_t resolve_name(const Engine &engine, const Context &context, const std::string &name);

/*** SECTION: Virtual machine ***/

struct Frame {
	std::shared_ptr<const Ops> ops;
	idx_t ip = 0;
	// Scope to restore on return; null for the root frame.
	std::shared_ptr<Scope> caller_scope;
	// Entered by `if`; `recur` skips over branch frames.
	bool branch = false;
	// Length of the register file when the frame was entered.
	size_t marks = 0;
};

struct VM {
	enum Step {
		Continue,
		Halt,
		Fail,
	};

	Engine &engine;
	Context &context;
	Stack stack;
	// Stack heights saved by ListStart.
	std::vector<Val> registers;
	std::vector<Frame> frames;
	maybe_t<Error> error;
	bool halted = false;
	std::ostream *out;

	VM(Engine &engine, Context &context);
	VM(const VM&) = delete;
	VM &operator=(const VM&) = delete;
	~VM();

	// Replaces the program; the stack is kept.
	void compile(const Exprs &exprs);
	void load(Ops ops);

	const Ops &ops() const;
	idx_t ip() const;

	Step step();
	Step run();

	void stack_push(Expr value);
	maybe_t<Expr> stack_pop();
	const Expr &stack_peek(idx_t nth = 0) const;

	// Invokes a callable, calls a symbol by name, or pushes anything else back.
	// False when this failed.
	bool invoke(const Expr &value, bool branch = false);
	void call_name(const std::string &name);
	// Runs `ops` in a new frame whose scope is a child of `parent`.
	bool enter(Ops ops, std::shared_ptr<Scope> parent, bool branch = false);
	void halt() { halted = true; }
	void recur();

	// Records the error and pushes `operands` back onto the stack.
	void fail(Error::Kind kind, std::string message, Exprs operands = {});
	// After a failure, pushes back values popped before the failing call.
	void restore(Exprs operands);

private:
	bool stack_dirty = false;

	void leave();
	void unwind();
	void exec(const Op &op);
};

}
