#include <cerrno>
#include <cmath>
#include <compare>
#include <cstdlib>
#include <iostream>
#include <limits>
#include <sstream>

#include "./stapel.hpp"

namespace stapel {

namespace {

#define fail_fun(fun, kind, msg, ...) do { \
		vm.fail(Error::kind, std::string("error in `") + (fun) + "`: " + (msg), { __VA_ARGS__ }); \
		return; \
	} while (0)
#define check_stack_len_ge(fun, expr) if (length(vm.stack) < (expr)) \
	fail_fun(fun, StackUnderflow, "stack length should be >= " #expr)

Expr take(VM &vm) {
	return get(vm.stack_pop());
}

bool is_seq(const Expr &expr) {
	return expr.kind == Expr::List || expr.kind == Expr::Block;
}

Expr same_seq(const Expr &like, Exprs items) {
	return like.kind == Expr::Block
		? Expr::new_block(std::move(items))
		: Expr::new_list(std::move(items));
}

maybe_t<std::string> key_of(const Expr &expr) {
	if (expr.kind == Expr::Symbol || expr.kind == Expr::String) return expr.text;
	return {};
}

// Indices are non-negative integers.
maybe_t<size_t> index_of(const Expr &expr) {
	if (expr.kind != Expr::Integer || expr.integer < 0) return {};
	return static_cast<size_t>(expr.integer);
}

std::string kinds(const Expr &lhs, const Expr &rhs) {
	return std::string(kind_name(lhs.kind)) + " and " + kind_name(rhs.kind);
}

/*** SECTION: Arithmetic and comparison ***/

void arithmetic(VM &vm, const char *fun, ValResult (*op)(Val, Val)) {
	check_stack_len_ge(fun, 2);
	Expr rhs = take(vm);
	Expr lhs = take(vm);

	const auto l = lhs.to_val();
	const auto r = rhs.to_val();
	if (!has(l) || !has(r)) {
		fail_fun(fun, UnsupportedOperands, "cannot apply to " + kinds(lhs, rhs), lhs, rhs);
	}

	const ValResult res = op(get(l), get(r));
	switch (res.fail) {
		case ValResult::None: break;
		case ValResult::Mismatch:
			fail_fun(fun, UnsupportedOperands, "cannot apply to " + kinds(lhs, rhs), lhs, rhs);
		case ValResult::ZeroDivisor:
			fail_fun(fun, DivisionByZero, "integer division by zero", lhs, rhs);
	}
	vm.stack_push(Expr::from_val(get(res.value)));
}

maybe_t<std::partial_ordering> order(const Expr &lhs, const Expr &rhs) {
	if (lhs.kind == Expr::Integer && rhs.kind == Expr::Integer) {
		return lhs.integer <=> rhs.integer;
	}
	const auto l = lhs.to_val();
	const auto r = rhs.to_val();
	if (has(l) && has(r)) {
		const double a = get(l).type == Val::Integer ? static_cast<double>(get(l).integer) : get(l).floating;
		const double b = get(r).type == Val::Integer ? static_cast<double>(get(r).integer) : get(r).floating;
		return a <=> b;
	}
	if (lhs.kind == Expr::String && rhs.kind == Expr::String) {
		return lhs.text.compare(rhs.text) <=> 0;
	}
	return {};
}

void comparison(VM &vm, const char *fun, bool (*pred)(std::partial_ordering)) {
	check_stack_len_ge(fun, 2);
	Expr rhs = take(vm);
	Expr lhs = take(vm);

	const auto ord = order(lhs, rhs);
	if (!has(ord)) {
		fail_fun(fun, UnsupportedOperands, "cannot compare " + kinds(lhs, rhs), lhs, rhs);
	}
	vm.stack_push(Expr::new_boolean(pred(get(ord))));
}

/*** SECTION: Casting ***/

maybe_t<int64_t> parse_integer(const std::string &text) {
	if (text.empty()) return {};
	char *end = nullptr;
	errno = 0;
	const long long value = strtoll(text.c_str(), &end, 10);
	if (*end != '\0' || errno == ERANGE) return {};
	return value;
}

maybe_t<double> parse_float(const std::string &text) {
	if (text.empty()) return {};
	char *end = nullptr;
	const double value = strtod(text.c_str(), &end);
	if (*end != '\0') return {};
	return value;
}

int64_t clamp_to_integer(double value) {
	constexpr double max = static_cast<double>(std::numeric_limits<int64_t>::max());
	constexpr double min = static_cast<double>(std::numeric_limits<int64_t>::min());
	if (value >= max) return std::numeric_limits<int64_t>::max();
	if (value <= min) return std::numeric_limits<int64_t>::min();
	return static_cast<int64_t>(value);
}

maybe_t<Expr> cast_to(const Expr &value, Expr::Kind target) {
	if (value.kind == target) return value;

	switch (target) {
		case Expr::Integer: {
			if (value.kind == Expr::Float && !std::isnan(value.floating)) {
				return Expr::new_integer(clamp_to_integer(value.floating));
			}
			if (value.kind == Expr::Boolean) return Expr::new_integer(value.boolean ? 1 : 0);
			if (value.kind == Expr::String) {
				const auto parsed = parse_integer(value.text);
				if (has(parsed)) return Expr::new_integer(get(parsed));
			}
		} break;
		case Expr::Float: {
			if (value.kind == Expr::Integer) return Expr::new_float(static_cast<double>(value.integer));
			if (value.kind == Expr::Boolean) return Expr::new_float(value.boolean ? 1.0 : 0.0);
			if (value.kind == Expr::String) {
				const auto parsed = parse_float(value.text);
				if (has(parsed)) return Expr::new_float(get(parsed));
			}
		} break;
		case Expr::String: return Expr::new_string(to_string(value));
		case Expr::Boolean: return Expr::new_boolean(value.is_truthy());
		case Expr::Symbol: {
			if (value.kind == Expr::String || value.kind == Expr::Call) return Expr::new_symbol(value.text);
		} break;
		case Expr::Call: {
			if (value.kind == Expr::String || value.kind == Expr::Symbol) return Expr::new_call(value.text);
		} break;
		case Expr::List: {
			if (value.kind == Expr::Block) return Expr::new_list(value.items);
			if (value.kind == Expr::Record) {
				Exprs pairs;
				for (const auto &[key, item] : value.record) {
					push(pairs, Expr::new_list({ Expr::new_symbol(key), item }));
				}
				return Expr::new_list(std::move(pairs));
			}
			if (value.kind == Expr::String) {
				Exprs chars;
				for (const char ch : value.text) push(chars, Expr::new_string(std::string(1, ch)));
				return Expr::new_list(std::move(chars));
			}
		} break;
		case Expr::Block: {
			if (value.kind == Expr::List) return Expr::new_block(value.items);
		} break;
		case Expr::Record: {
			if (!is_seq(value)) break;
			RecordMap record;
			for (const auto &pair : value.items) {
				if (!is_seq(pair) || length(pair.items) != 2) return {};
				const auto key = key_of(pair.items[0]);
				if (!has(key)) return {};
				record[get(key)] = pair.items[1];
			}
			return Expr::new_record(std::move(record));
		} break;
		case Expr::SExpr: {
			if (!is_seq(value) || value.items.empty()) break;
			const Expr &head = value.items.front();
			if (head.kind != Expr::Call && head.kind != Expr::Symbol) break;
			return Expr::new_sexpr(head.text, Exprs(value.items.begin() + 1, value.items.end()));
		} break;
		case Expr::Nil:
		case Expr::Function:
		case Expr::Underscore:
			break;
	}
	return {};
}

/*** SECTION: Bindings ***/

// Pops `value name` for let, def and set.
bool take_binding(VM &vm, const char *fun, std::string &name, Expr &value) {
	if (length(vm.stack) < 2) {
		vm.fail(Error::StackUnderflow, std::string("error in `") + fun + "`: stack length should be >= 2");
		return false;
	}
	Expr key = take(vm);
	value = take(vm);

	const auto text = key_of(key);
	if (!has(text)) {
		vm.fail(Error::TypeMismatch,
			std::string("error in `") + fun + "`: expected a symbol name, got " + kind_name(key.kind),
			{ value, key });
		return false;
	}
	name = get(text);
	return true;
}

void import_source(VM &vm, const Expr &name) {
	const std::string &path = name.text;
	auto source = Source::from_path(path);
	if (!has(source)) {
		fail_fun("import", ImportFailed, "cannot read `" + path + "`", name);
	}

	Lexer lexer(get(source));
	maybe_t<Error> error;
	const Exprs exprs = parse(lexer, error);
	if (has(error)) {
		std::ostringstream ss;
		ss << get(error);
		fail_fun("import", ImportFailed, "`" + path + "`: " + ss.str(), name);
	}

	vm.context.add_source(std::move(get(source)));
	if (!vm.enter(compile(exprs), vm.context.scope)) vm.restore({ name });
}

}

/*** SECTION: Intrinsics Array ***/

const Intrinsic intrinsics[IN_COUNT] = {
	/* ARITHMETIC */
	{ "+", "a b -- a+b", [](VM &vm) { arithmetic(vm, "+", add); } },
	{ "-", "a b -- a-b", [](VM &vm) { arithmetic(vm, "-", sub); } },
	{ "*", "a b -- a*b", [](VM &vm) { arithmetic(vm, "*", mul); } },
	{ "/", "a b -- a/b", [](VM &vm) { arithmetic(vm, "/", stapel::div); } },
	{ "%", "a b -- a%b", [](VM &vm) { arithmetic(vm, "%", rem); } },

	/* COMPARISON */
	{ "=", "a b -- a=b", [](VM &vm) {
		check_stack_len_ge("=", 2);
		const Expr rhs = take(vm);
		const Expr lhs = take(vm);
		vm.stack_push(Expr::new_boolean(lhs == rhs));
	} },
	{ "!=", "a b -- a!=b", [](VM &vm) {
		check_stack_len_ge("!=", 2);
		const Expr rhs = take(vm);
		const Expr lhs = take(vm);
		vm.stack_push(Expr::new_boolean(lhs != rhs));
	} },
	{ "<", "a b -- a<b", [](VM &vm) {
		comparison(vm, "<", [](std::partial_ordering ord) { return ord < 0; });
	} },
	{ "<=", "a b -- a<=b", [](VM &vm) {
		comparison(vm, "<=", [](std::partial_ordering ord) { return ord <= 0; });
	} },
	{ ">", "a b -- a>b", [](VM &vm) {
		comparison(vm, ">", [](std::partial_ordering ord) { return ord > 0; });
	} },
	{ ">=", "a b -- a>=b", [](VM &vm) {
		comparison(vm, ">=", [](std::partial_ordering ord) { return ord >= 0; });
	} },

	/* BOOLEAN */
	{ "or", "a b -- a||b ; on truthiness", [](VM &vm) {
		check_stack_len_ge("or", 2);
		const bool rhs = take(vm).is_truthy();
		const bool lhs = take(vm).is_truthy();
		vm.stack_push(Expr::new_boolean(lhs || rhs));
	} },
	{ "and", "a b -- a&&b ; on truthiness", [](VM &vm) {
		check_stack_len_ge("and", 2);
		const bool rhs = take(vm).is_truthy();
		const bool lhs = take(vm).is_truthy();
		vm.stack_push(Expr::new_boolean(lhs && rhs));
	} },
	{ "not", "a -- !a", [](VM &vm) {
		check_stack_len_ge("not", 1);
		vm.stack_push(Expr::new_boolean(!take(vm).is_truthy()));
	} },
	{ "assert", "a msg -- ; fails with msg unless a is truthy", [](VM &vm) {
		check_stack_len_ge("assert", 2);
		Expr message = take(vm);
		Expr value = take(vm);
		if (!value.is_truthy()) {
			fail_fun("assert", AssertionFailed, to_string(message), value, message);
		}
	} },

	/* STACK OPERATIONS */
	{ "drop", "a --", [](VM &vm) {
		check_stack_len_ge("drop", 1);
		take(vm);
	} },
	{ "dupe", "a -- a a", [](VM &vm) {
		check_stack_len_ge("dupe", 1);
		vm.stack_push(vm.stack_peek());
	} },
	{ "swap", "a b -- b a", [](VM &vm) {
		check_stack_len_ge("swap", 2);
		Expr top = take(vm);
		Expr under_top = take(vm);
		vm.stack_push(std::move(top));
		vm.stack_push(std::move(under_top));
	} },
	{ "rot", "a b c -- b c a", [](VM &vm) {
		check_stack_len_ge("rot", 3);
		Expr c = take(vm);
		Expr b = take(vm);
		Expr a = take(vm);
		vm.stack_push(std::move(b));
		vm.stack_push(std::move(c));
		vm.stack_push(std::move(a));
	} },

	/* COLLECTIONS */
	{ "len", "coll -- n", [](VM &vm) {
		check_stack_len_ge("len", 1);
		Expr coll = take(vm);
		size_t len = 0;
		if (is_seq(coll)) len = length(coll.items);
		else if (coll.kind == Expr::Record) len = coll.record.size();
		else if (coll.kind == Expr::String) len = coll.text.size();
		else fail_fun("len", TypeMismatch, std::string("cannot take the length of ") + kind_name(coll.kind), coll);
		vm.stack_push(Expr::new_integer(static_cast<int64_t>(len)));
	} },
	{ "nth", "coll n -- item ; nil when out of range", [](VM &vm) {
		check_stack_len_ge("nth", 2);
		Expr n = take(vm);
		Expr coll = take(vm);
		if (n.kind != Expr::Integer) {
			fail_fun("nth", TypeMismatch, std::string("index must be an integer, got ") + kind_name(n.kind), coll, n);
		}
		const auto idx = index_of(n);
		if (is_seq(coll)) {
			vm.stack_push(has(idx) && get(idx) < length(coll.items) ? coll.items[get(idx)] : Expr::new_nil());
		} else if (coll.kind == Expr::String) {
			vm.stack_push(has(idx) && get(idx) < coll.text.size()
				? Expr::new_string(std::string(1, coll.text[get(idx)]))
				: Expr::new_nil());
		} else {
			fail_fun("nth", TypeMismatch, std::string("cannot index ") + kind_name(coll.kind), coll, n);
		}
	} },
	{ "split", "coll n -- left right", [](VM &vm) {
		check_stack_len_ge("split", 2);
		Expr n = take(vm);
		Expr coll = take(vm);
		const auto idx = index_of(n);
		if (!has(idx)) {
			fail_fun("split", TypeMismatch, "split point must be a non-negative integer", coll, n);
		}
		if (is_seq(coll)) {
			if (get(idx) > length(coll.items)) {
				fail_fun("split", IndexOutOfBounds, "split point " + std::to_string(get(idx)) + " is past the end", coll, n);
			}
			const auto mid = coll.items.begin() + static_cast<std::ptrdiff_t>(get(idx));
			vm.stack_push(same_seq(coll, Exprs(coll.items.begin(), mid)));
			vm.stack_push(same_seq(coll, Exprs(mid, coll.items.end())));
		} else if (coll.kind == Expr::String) {
			if (get(idx) > coll.text.size()) {
				fail_fun("split", IndexOutOfBounds, "split point " + std::to_string(get(idx)) + " is past the end", coll, n);
			}
			vm.stack_push(Expr::new_string(coll.text.substr(0, get(idx))));
			vm.stack_push(Expr::new_string(coll.text.substr(get(idx))));
		} else {
			fail_fun("split", TypeMismatch, std::string("cannot split ") + kind_name(coll.kind), coll, n);
		}
	} },
	{ "concat", "a b -- ab", [](VM &vm) {
		check_stack_len_ge("concat", 2);
		Expr rhs = take(vm);
		Expr lhs = take(vm);
		if (lhs.kind != rhs.kind) {
			fail_fun("concat", TypeMismatch, "cannot concatenate " + kinds(lhs, rhs), lhs, rhs);
		}
		switch (lhs.kind) {
			case Expr::List:
			case Expr::Block: {
				Exprs items = lhs.items;
				items.insert(items.end(), rhs.items.begin(), rhs.items.end());
				vm.stack_push(same_seq(lhs, std::move(items)));
			} break;
			case Expr::String: {
				vm.stack_push(Expr::new_string(lhs.text + rhs.text));
			} break;
			case Expr::Record: {
				RecordMap record = rhs.record;
				record.insert(lhs.record.begin(), lhs.record.end());
				vm.stack_push(Expr::new_record(std::move(record)));
			} break;
			case Expr::Nil:
			case Expr::Boolean:
			case Expr::Integer:
			case Expr::Float:
			case Expr::Symbol:
			case Expr::Call:
			case Expr::Function:
			case Expr::SExpr:
			case Expr::Underscore:
				fail_fun("concat", TypeMismatch, "cannot concatenate " + kinds(lhs, rhs), lhs, rhs);
		}
	} },
	{ "push", "coll item -- coll'", [](VM &vm) {
		check_stack_len_ge("push", 2);
		Expr item = take(vm);
		Expr coll = take(vm);
		if (is_seq(coll)) {
			push(coll.items, std::move(item));
			vm.stack_push(std::move(coll));
		} else if (coll.kind == Expr::String && item.kind == Expr::String) {
			coll.text += item.text;
			vm.stack_push(std::move(coll));
		} else {
			fail_fun("push", TypeMismatch, std::string("cannot push ") + kind_name(item.kind) + " onto " + kind_name(coll.kind), coll, item);
		}
	} },
	{ "pop", "coll -- coll' item ; item is nil when empty", [](VM &vm) {
		check_stack_len_ge("pop", 1);
		Expr coll = take(vm);
		if (is_seq(coll)) {
			Expr item = coll.items.empty() ? Expr::new_nil() : pop(coll.items);
			vm.stack_push(std::move(coll));
			vm.stack_push(std::move(item));
		} else if (coll.kind == Expr::String) {
			Expr item = Expr::new_nil();
			if (!coll.text.empty()) {
				item = Expr::new_string(std::string(1, coll.text.back()));
				coll.text.pop_back();
			}
			vm.stack_push(std::move(coll));
			vm.stack_push(std::move(item));
		} else {
			fail_fun("pop", TypeMismatch, std::string("cannot pop from ") + kind_name(coll.kind), coll);
		}
	} },
	{ "insert", "record key value -- record' ; list index value -- list'", [](VM &vm) {
		check_stack_len_ge("insert", 3);
		Expr value = take(vm);
		Expr key = take(vm);
		Expr coll = take(vm);
		if (coll.kind == Expr::Record) {
			const auto name = key_of(key);
			if (!has(name)) {
				fail_fun("insert", TypeMismatch, std::string("record keys must be symbols or strings, got ") + kind_name(key.kind), coll, key, value);
			}
			coll.record[get(name)] = std::move(value);
			vm.stack_push(std::move(coll));
		} else if (is_seq(coll)) {
			const auto idx = index_of(key);
			if (!has(idx) || get(idx) > length(coll.items)) {
				fail_fun("insert", IndexOutOfBounds, "cannot insert at " + debug_string(key), coll, key, value);
			}
			coll.items.insert(coll.items.begin() + static_cast<std::ptrdiff_t>(get(idx)), std::move(value));
			vm.stack_push(std::move(coll));
		} else {
			fail_fun("insert", TypeMismatch, std::string("cannot insert into ") + kind_name(coll.kind), coll, key, value);
		}
	} },
	{ "prop", "record key -- value ; nil when missing", [](VM &vm) {
		check_stack_len_ge("prop", 2);
		Expr key = take(vm);
		Expr coll = take(vm);
		const auto name = key_of(key);
		if (coll.kind != Expr::Record || !has(name)) {
			fail_fun("prop", TypeMismatch, "cannot read property of " + kinds(coll, key), coll, key);
		}
		const auto it = coll.record.find(get(name));
		vm.stack_push(it == coll.record.end() ? Expr::new_nil() : it->second);
	} },
	{ "has", "record key -- bool ; list item -- bool ; str sub -- bool", [](VM &vm) {
		check_stack_len_ge("has", 2);
		Expr key = take(vm);
		Expr coll = take(vm);
		if (coll.kind == Expr::Record) {
			const auto name = key_of(key);
			if (!has(name)) {
				fail_fun("has", TypeMismatch, std::string("record keys must be symbols or strings, got ") + kind_name(key.kind), coll, key);
			}
			vm.stack_push(Expr::new_boolean(coll.record.count(get(name)) > 0));
		} else if (is_seq(coll)) {
			bool found = false;
			for (const auto &item : coll.items) {
				if (item == key) {
					found = true;
					break;
				}
			}
			vm.stack_push(Expr::new_boolean(found));
		} else if (coll.kind == Expr::String && key.kind == Expr::String) {
			vm.stack_push(Expr::new_boolean(coll.text.find(key.text) != std::string::npos));
		} else {
			fail_fun("has", TypeMismatch, "cannot search " + kinds(coll, key), coll, key);
		}
	} },
	{ "remove", "record key -- record' ; list index -- list'", [](VM &vm) {
		check_stack_len_ge("remove", 2);
		Expr key = take(vm);
		Expr coll = take(vm);
		if (coll.kind == Expr::Record) {
			const auto name = key_of(key);
			if (!has(name)) {
				fail_fun("remove", TypeMismatch, std::string("record keys must be symbols or strings, got ") + kind_name(key.kind), coll, key);
			}
			coll.record.erase(get(name));
			vm.stack_push(std::move(coll));
		} else if (is_seq(coll)) {
			const auto idx = index_of(key);
			if (!has(idx) || get(idx) >= length(coll.items)) {
				fail_fun("remove", IndexOutOfBounds, "cannot remove " + debug_string(key), coll, key);
			}
			coll.items.erase(coll.items.begin() + static_cast<std::ptrdiff_t>(get(idx)));
			vm.stack_push(std::move(coll));
		} else {
			fail_fun("remove", TypeMismatch, std::string("cannot remove from ") + kind_name(coll.kind), coll, key);
		}
	} },
	{ "keys", "record -- [keys]", [](VM &vm) {
		check_stack_len_ge("keys", 1);
		Expr coll = take(vm);
		if (coll.kind != Expr::Record) {
			fail_fun("keys", TypeMismatch, std::string("expected a record, got ") + kind_name(coll.kind), coll);
		}
		Exprs keys;
		for (const auto &entry : coll.record) push(keys, Expr::new_symbol(entry.first));
		vm.stack_push(Expr::new_list(std::move(keys)));
	} },
	{ "values", "record -- [values]", [](VM &vm) {
		check_stack_len_ge("values", 1);
		Expr coll = take(vm);
		if (coll.kind != Expr::Record) {
			fail_fun("values", TypeMismatch, std::string("expected a record, got ") + kind_name(coll.kind), coll);
		}
		Exprs values;
		for (const auto &entry : coll.record) push(values, entry.second);
		vm.stack_push(Expr::new_list(std::move(values)));
	} },

	/* TYPES */
	{ "cast", "a type -- b", [](VM &vm) {
		check_stack_len_ge("cast", 2);
		Expr type = take(vm);
		Expr value = take(vm);
		const auto name = key_of(type);
		const auto target = has(name) ? kind_from_name(get(name)) : maybe_t<Expr::Kind> {};
		if (!has(target)) {
			fail_fun("cast", InvalidCast, "unknown type " + debug_string(type), value, type);
		}
		const auto res = cast_to(value, get(target));
		if (!has(res)) {
			fail_fun("cast", InvalidCast, std::string("cannot cast ") + kind_name(value.kind) + " to " + get(name), value, type);
		}
		vm.stack_push(get(res));
	} },
	{ "type-of", "a -- name", [](VM &vm) {
		check_stack_len_ge("type-of", 1);
		vm.stack_push(Expr::new_string(kind_name(take(vm).kind)));
	} },

	/* CONTROL */
	{ "lazy", "a -- (a) ; defers a value without evaluating it", [](VM &vm) {
		check_stack_len_ge("lazy", 1);
		Expr value = take(vm);
		if (value.kind == Expr::Block) {
			vm.stack_push(std::move(value));
		} else {
			vm.stack_push(Expr::new_block({ std::move(value) }));
		}
	} },
	{ "if", "cond (then) (else) -- ; cond (then) -- ; runs one branch, "
			"taking the two-branch form whenever the value under the top is callable", [](VM &vm) {
		check_stack_len_ge("if", 2);
		Expr top = take(vm);
		if (!top.is_callable()) {
			fail_fun("if", TypeMismatch, std::string("expected a block, got ") + kind_name(top.kind), top);
		}

		if (length(vm.stack) >= 2 && vm.stack_peek().is_callable()) {
			Expr then_branch = take(vm);
			const Expr cond = take(vm);
			if (!vm.invoke(cond.is_truthy() ? then_branch : top, true)) {
				vm.restore({ cond, then_branch, top });
			}
		} else {
			const Expr cond = take(vm);
			if (cond.is_truthy() && !vm.invoke(top, true)) vm.restore({ cond, top });
		}
	} },
	{ "halt", "-- ; stops the machine", [](VM &vm) {
		vm.halt();
	} },
	{ "call", "f -- ; runs a block, function or named word", [](VM &vm) {
		check_stack_len_ge("call", 1);
		Expr fun = take(vm);
		if ((fun.kind == Expr::Symbol || fun.kind == Expr::Call)
				&& resolve_name(vm.engine, vm.context, fun.text) == NK_Unresolved) {
			fail_fun("call", UnknownName, "unknown name `" + fun.text + "`", fun);
		}
		if (!vm.invoke(fun)) vm.restore({ fun });
	} },
	{ "recur", "-- ; restarts the current block or function", [](VM &vm) {
		vm.recur();
	} },
	{ "or-else", "a b -- a|b ; b when a is nil", [](VM &vm) {
		check_stack_len_ge("or-else", 2);
		Expr fallback = take(vm);
		Expr value = take(vm);
		vm.stack_push(value.is_nil() ? std::move(fallback) : std::move(value));
	} },

	/* SCOPE */
	{ "let", "value 'name -- ; binds for the rest of the block", [](VM &vm) {
		std::string name;
		Expr value;
		if (!take_binding(vm, "let", name, value)) return;
		vm.context.let(name, std::move(value));
	} },
	{ "def", "value 'name -- ; binds persistently", [](VM &vm) {
		std::string name;
		Expr value;
		if (!take_binding(vm, "def", name, value)) return;
		vm.context.def(name, std::move(value));
	} },
	{ "set", "value 'name -- ; rebinds an existing name", [](VM &vm) {
		std::string name;
		Expr value;
		if (!take_binding(vm, "set", name, value)) return;
		if (vm.context.let_set(name, value)) return;

		const auto item = vm.context.scope_item(name);
		if (!item) {
			fail_fun("set", UnknownName, "unknown name `" + name + "`", value, Expr::new_symbol(name));
		}
		item->value = std::move(value);
	} },
	{ "get", "'name -- value ; nil when unbound", [](VM &vm) {
		check_stack_len_ge("get", 1);
		Expr key = take(vm);
		const auto name = key_of(key);
		if (!has(name)) {
			fail_fun("get", TypeMismatch, std::string("expected a symbol name, got ") + kind_name(key.kind), key);
		}
		if (const Expr *value = vm.context.let_get(get(name))) {
			vm.stack_push(*value);
		} else if (const auto item = vm.context.scope_item(get(name))) {
			vm.stack_push(item->value);
		} else {
			vm.stack_push(Expr::new_nil());
		}
	} },

	/* OUTPUT */
	{ "debug", "a -- a ; prints the debug form", [](VM &vm) {
		check_stack_len_ge("debug", 1);
		*vm.out << debug_string(vm.stack_peek()) << std::endl;
	} },
	{ "print", "a -- ; prints a", [](VM &vm) {
		check_stack_len_ge("print", 1);
		*vm.out << to_string(take(vm)) << std::endl;
	} },
	{ "pretty", "a -- ; prints a across several lines", [](VM &vm) {
		check_stack_len_ge("pretty", 1);
		*vm.out << pretty_string(take(vm)) << std::endl;
	} },

	/* MODULES */
	{ "import", "name -- ; loads a standard module or runs a source file", [](VM &vm) {
		check_stack_len_ge("import", 1);
		Expr name = take(vm);
		if (!has(key_of(name))) {
			fail_fun("import", TypeMismatch, std::string("expected a module name or path, got ") + kind_name(name.kind), name);
		}

		if (vm.engine.module(name.text)) return;
		auto module = std_module(name.text);
		if (has(module)) {
			vm.engine.add_module(std::move(get(module)));
			return;
		}
		if (vm.engine.sandbox) {
			fail_fun("import", ImportFailed, "file imports are disabled in sandbox mode", name);
		}
		import_source(vm, name);
	} },
};

#undef check_stack_len_ge
#undef fail_fun

maybe_t<intrinsic_t> find_intrinsic(const std::string &name) {
	idx_t i = IN_COUNT;
	while (i --> 0) {
		if (name == intrinsics[i].name) return static_cast<intrinsic_t>(i);
	}
	return {};
}

}
