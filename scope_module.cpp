#include "./stapel.hpp"

namespace stapel {

namespace {

const char *where_name(name_kind_t kind) {
	switch (kind) {
		case NK_Intrinsic: return "intrinsic";
		case NK_Module: return "module";
		case NK_Let: return "let";
		case NK_Item: return "scope";
		case NK_Unresolved: return nullptr;
	}
	return nullptr;
}

// name -- "intrinsic" | "module" | "let" | "scope" | nil
void scope_where(VM &vm) {
	const auto top = vm.stack_pop();
	if (!has(top)) {
		vm.fail(Error::StackUnderflow, "error in `scope:where`: stack length should be >= 1");
		return;
	}

	const Expr &name = *top;
	if (name.kind != Expr::Symbol && name.kind != Expr::String) {
		vm.stack_push(Expr::new_nil());
		return;
	}

	const char *where = where_name(resolve_name(vm.engine, vm.context, name.text));
	vm.stack_push(where ? Expr::new_string(where) : Expr::new_nil());
}

// -- [['name value] ...]
void scope_dump(VM &vm) {
	Exprs items;
	for (const auto &[name, item] : vm.context.scope_items()) {
		push(items, Expr::new_list({
			Expr::new_symbol(name),
			item ? item->value : Expr::new_nil(),
		}));
	}
	vm.stack_push(Expr::new_list(std::move(items)));
}

}

Module scope_module() {
	Module module("scope");
	module
		.add_func("where", scope_where)
		.add_func("dump", scope_dump);
	return module;
}

}
