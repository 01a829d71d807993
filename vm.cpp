#include <algorithm>
#include <iostream>

#include "./stapel.hpp"

namespace stapel {

/*** SECTION: Compiler ***/

namespace {

bool is_function_literal(const Expr &block) {
	return !block.items.empty()
		&& block.items.front().kind == Expr::Call
		&& block.items.front().text == "fn";
}

void compile_expr(const Expr &expr, Ops &ops) {
	switch (expr.kind) {
		case Expr::Integer:
		case Expr::Float: {
			push(ops, Op::new_push(get(expr.to_val())));
		} break;
		case Expr::Call: {
			const auto intrinsic = find_intrinsic(expr.text);
			if (has(intrinsic)) {
				push(ops, Op::new_intrinsic(get(intrinsic)));
			} else {
				push(ops, Op::new_call(expr.text));
			}
		} break;
		case Expr::List: {
			push(ops, Op::new_list_start());
			for (const auto &item : expr.items) {
				compile_expr(item, ops);
			}
			push(ops, Op::new_list_end());
		} break;
		case Expr::Block: {
			if (is_function_literal(expr)) {
				push(ops, Op::new_closure(Exprs(expr.items.begin() + 1, expr.items.end())));
			} else {
				push(ops, Op::new_const(expr));
			}
		} break;
		case Expr::Nil:
		case Expr::Boolean:
		case Expr::String:
		case Expr::Symbol:
		case Expr::Record:
		case Expr::Function:
		case Expr::SExpr:
		case Expr::Underscore: {
			push(ops, Op::new_const(expr));
		} break;
	}
}

}

void compile(const Exprs &exprs, Ops &ops) {
	for (const auto &expr : exprs) {
		compile_expr(expr, ops);
	}
	push(ops, Op::new_end());
}

Ops compile(const Exprs &exprs) {
	Ops ops;
	compile(exprs, ops);
	return ops;
}

bool operator==(const Op &lhs, const Op &rhs) {
	if (lhs.type != rhs.type) return false;
	switch (lhs.type) {
		case Op::Push: return lhs.val == rhs.val;
		case Op::Intrinsic: return lhs.intrinsic == rhs.intrinsic;
		case Op::Const:
		case Op::Closure:
		case Op::Call:
			return lhs.expr == rhs.expr;
		case Op::ListStart:
		case Op::ListEnd:
		case Op::End:
			return true;
	}
	return false;
}

std::ostream &operator<<(std::ostream &os, const Op &op) {
	switch (op.type) {
		case Op::Push: return os << "push " << Expr::from_val(op.val);
		case Op::Const: return os << "const " << op.expr;
		case Op::Closure: return os << "closure " << op.expr;
		case Op::Intrinsic: {
			if (op.intrinsic >= IN_COUNT) return os << "intrinsic <invalid>";
			return os << "intrinsic " << intrinsics[op.intrinsic].name;
		}
		case Op::Call: return os << "call " << op.expr.text;
		case Op::ListStart: return os << "list-start";
		case Op::ListEnd: return os << "list-end";
		case Op::End: return os << "end";
	}
	return os;
}

/*** SECTION: Virtual machine ***/

VM::VM(Engine &engine, Context &context)
: engine(engine), context(context), out(&std::cout)
{ }

VM::~VM() {
	unwind();
}

void VM::load(Ops ops) {
	unwind();
	registers.clear();
	error.reset();
	halted = false;

	push(frames, Frame {
		.ops = std::make_shared<const Ops>(std::move(ops)),
	});
}

void VM::compile(const Exprs &exprs) {
	load(stapel::compile(exprs));
}

const Ops &VM::ops() const {
	static const Ops empty;
	if (frames.empty()) return empty;
	return *frames.front().ops;
}

idx_t VM::ip() const {
	if (frames.empty()) return 0;
	return frames.back().ip;
}

void VM::stack_push(Expr value) {
	push(stack, std::move(value));
	stack_dirty = true;
}

maybe_t<Expr> VM::stack_pop() {
	if (stack.empty()) return {};
	stack_dirty = true;
	return pop(stack);
}

const Expr &VM::stack_peek(idx_t nth) const {
	return stack[length(stack)-1 - nth];
}

void VM::fail(Error::Kind kind, std::string message, Exprs operands) {
	if (has(error)) return;

	for (const auto &operand : operands) {
		push(stack, operand);
	}
	error = Error {
		.kind = kind,
		.message = std::move(message),
		.operands = std::move(operands),
	};
}

void VM::restore(Exprs operands) {
	if (!has(error)) return;

	for (const auto &operand : operands) {
		push(stack, operand);
	}
	error->operands.insert(error->operands.end(), operands.begin(), operands.end());
}

bool VM::enter(Ops ops, std::shared_ptr<Scope> parent, bool branch) {
	if (length(frames) >= MAX_FRAMES) {
		fail(Error::CallDepth, "call depth exceeded " + std::to_string(MAX_FRAMES) + " frames");
		return false;
	}

	push(frames, Frame {
		.ops = std::make_shared<const Ops>(std::move(ops)),
		.ip = 0,
		.caller_scope = context.scope,
		.branch = branch,
		.marks = length(registers),
	});
	context.scope = std::make_shared<Scope>(std::move(parent));
	return true;
}

void VM::leave() {
	const Frame frame = pop(frames);
	// list marks left by a frame that did not reach its ListEnd
	if (length(registers) > frame.marks) registers.resize(frame.marks);
	if (frame.caller_scope) {
		context.scope = frame.caller_scope;
	}
}

void VM::unwind() {
	while (length(frames) > 1) leave();
	frames.clear();
}

bool VM::invoke(const Expr &value, bool branch) {
	switch (value.kind) {
		case Expr::Block: {
			return enter(stapel::compile(value.items), context.scope, branch);
		}
		case Expr::Function: {
			return enter(stapel::compile(value.items), value.scope, branch);
		}
		case Expr::SExpr: {
			Exprs body = value.items;
			push(body, Expr::new_call(value.text));
			return enter(stapel::compile(body), context.scope, branch);
		}
		case Expr::Symbol:
		case Expr::Call: {
			call_name(value.text);
		} break;
		case Expr::Nil:
		case Expr::Boolean:
		case Expr::Integer:
		case Expr::Float:
		case Expr::String:
		case Expr::List:
		case Expr::Record:
		case Expr::Underscore: {
			stack_push(value);
		} break;
	}
	return !has(error);
}

void VM::call_name(const std::string &name) {
	switch (resolve_name(engine, context, name)) {
		case NK_Intrinsic: {
			intrinsics[get(find_intrinsic(name))].fun(*this);
		} break;
		case NK_Module: {
			const size_t colon = name.find(':');
			const std::string module_name = name.substr(0, colon);
			const std::string func_name = name.substr(colon + 1);

			const auto fun = engine.module(module_name)->func(func_name);
			if (!has(fun)) {
				fail(Error::UnknownName, "unknown function `" + func_name + "` in module `" + module_name + "`");
				return;
			}
			get(fun)(*this);
		} break;
		case NK_Let: {
			const Expr value = *context.let_get(name);
			if (value.is_callable()) invoke(value);
			else stack_push(value);
		} break;
		case NK_Item: {
			const Expr value = context.scope_item(name)->value;
			if (value.is_callable()) invoke(value);
			else stack_push(value);
		} break;
		case NK_Unresolved: {
			fail(Error::UnknownName, "unknown name `" + name + "`");
		} break;
	}
}

void VM::recur() {
	// branch frames belong to the block or function that ran `if`
	size_t target = length(frames);
	while (target --> 1) {
		if (!frames[target].branch) break;
	}
	if (target == 0) {
		fail(Error::InvalidRecur, "`recur` is only valid inside a block or function");
		return;
	}

	while (length(frames) > target + 1) leave();

	Frame &frame = frames.back();
	frame.ip = 0;
	if (length(registers) > frame.marks) registers.resize(frame.marks);
	context.scope = std::make_shared<Scope>(context.scope->parent);
}

void VM::exec(const Op &op) {
	switch (op.type) {
		case Op::Push: {
			stack_push(Expr::from_val(op.val));
		} break;
		case Op::Const: {
			stack_push(op.expr);
		} break;
		case Op::Closure: {
			stack_push(Expr::new_function(context.scope, op.expr.items));
		} break;
		case Op::Intrinsic: {
			if (op.intrinsic >= IN_COUNT) {
				fail(Error::UnknownName, "invalid intrinsic id " + std::to_string(op.intrinsic));
				return;
			}
			intrinsics[op.intrinsic].fun(*this);
		} break;
		case Op::Call: {
			call_name(op.expr.text);
		} break;
		case Op::ListStart: {
			push(registers, Val::new_integer(static_cast<int64_t>(length(stack))));
		} break;
		case Op::ListEnd: {
			if (registers.empty()) {
				fail(Error::StackUnderflow, "list end without a matching list start");
				return;
			}
			// the list body may have consumed values from below its start
			const size_t mark = std::min<size_t>(pop(registers).integer, length(stack));
			Exprs items(stack.begin() + mark, stack.end());
			stack.resize(mark);
			stack_push(Expr::new_list(std::move(items)));
		} break;
		case Op::End: {
			if (length(frames) > 1) {
				leave();
			} else {
				halt();
			}
		} break;
	}
}

VM::Step VM::step() {
	if (has(error)) return Fail;
	if (halted) return Halt;
	if (frames.empty()) {
		fail(Error::IpBounds, "no program loaded");
		return Fail;
	}

	// exec may push or pop frames; keep this stream alive until it returns
	const std::shared_ptr<const Ops> ops = frames.back().ops;
	const idx_t at = frames.back().ip;
	frames.back().ip = std::min<idx_t>(at + 1, length(*ops));

	if (at >= length(*ops)) {
		fail(Error::IpBounds, "instruction pointer " + std::to_string(at) + " is past the end of the program");
		return Fail;
	}

	stack_dirty = false;
	exec((*ops)[at]);

	if (has(error)) return Fail;
	if (stack_dirty && has(context.journal)) {
		context.journal->record(stack);
	}
	if (halted) return Halt;
	return Continue;
}

VM::Step VM::run() {
	while (true) {
		const Step res = step();
		if (res != Continue) return res;
	}
}

}
