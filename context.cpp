#include <algorithm>

#include "./stapel.hpp"

namespace stapel {

/*** SECTION: Scope ***/

Expr *Scope::find(const std::string &name) {
	for (Scope *scope = this; scope; scope = scope->parent.get()) {
		const auto it = scope->lets.find(name);
		if (it != scope->lets.end()) return &it->second;
	}
	return nullptr;
}

const Expr *Scope::find(const std::string &name) const {
	for (const Scope *scope = this; scope; scope = scope->parent.get()) {
		const auto it = scope->lets.find(name);
		if (it != scope->lets.end()) return &it->second;
	}
	return nullptr;
}

/*** SECTION: Journal ***/

void Journal::record(const Stack &stack) {
	if (max_len == 0) return;

	if (buffer.size() < max_len) {
		push(buffer, stack);
		return;
	}
	buffer[head] = stack;
	head = (head + 1) % max_len;
}

std::vector<Stack> Journal::entries() const {
	std::vector<Stack> res;
	res.reserve(buffer.size());
	for (size_t i = 0; i < buffer.size(); ++i) {
		push(res, buffer[(head + i) % buffer.size()]);
	}
	return res;
}

maybe_t<size_t> parse_journal_len(const std::string &str) {
	if (str.empty()) return {};

	size_t res = 0;
	for (const char c : str) {
		if (c < '0' || c > '9') return {};
		res = res * 10 + (c - '0');
		if (res > MAX_JOURNAL_LEN) return {};
	}
	return res;
}

/*** SECTION: Context ***/

Context::Context() : scope(std::make_shared<Scope>()) { }

Context &Context::with_journal(size_t max_len) {
	journal.emplace(std::min(max_len, MAX_JOURNAL_LEN));
	return *this;
}

void Context::add_source(Source source) {
	push(sources, std::move(source));
}

const Expr *Context::let_get(const std::string &name) const {
	return scope->find(name);
}

void Context::let(const std::string &name, Expr value) {
	scope->lets[name] = std::move(value);
}

bool Context::let_set(const std::string &name, Expr value) {
	Expr *slot = scope->find(name);
	if (!slot) return false;
	*slot = std::move(value);
	return true;
}

std::shared_ptr<ScopeItem> Context::scope_item(const std::string &name) const {
	const auto it = items.find(name);
	if (it == items.end()) return nullptr;
	return it->second;
}

void Context::def(const std::string &name, Expr value) {
	const auto it = items.find(name);
	if (it != items.end()) {
		it->second->value = std::move(value);
		return;
	}
	items[name] = std::make_shared<ScopeItem>(ScopeItem { .value = std::move(value) });
}

/*** SECTION: Modules ***/

Module &Module::add_func(const std::string &func_name, module_fn_t fun) {
	funcs[func_name] = fun;
	return *this;
}

maybe_t<module_fn_t> Module::func(const std::string &func_name) const {
	const auto it = funcs.find(func_name);
	if (it == funcs.end()) return {};
	return it->second;
}

Engine &Engine::add_module(Module module) {
	const std::string name = module.name;
	modules.insert_or_assign(name, std::move(module));
	return *this;
}

const Module *Engine::module(const std::string &name) const {
	const auto it = modules.find(name);
	if (it == modules.end()) return nullptr;
	return &it->second;
}

maybe_t<Module> std_module(const std::string &name) {
	if (name == "scope") return scope_module();
	return {};
}

name_kind_t resolve_name(const Engine &engine, const Context &context, const std::string &name) {
	if (has(find_intrinsic(name))) return NK_Intrinsic;

	const size_t colon = name.find(':');
	if (colon != std::string::npos && colon > 0 && engine.module(name.substr(0, colon))) {
		return NK_Module;
	}

	if (context.let_get(name)) return NK_Let;
	if (context.scope_item(name)) return NK_Item;
	return NK_Unresolved;
}

}
