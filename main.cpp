#include <cstdlib>
#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "./stapel.hpp"

using namespace stapel;

namespace {

void writestring(const std::string &str) {
	std::cout << str;
}
void writestringl(const std::string &str) {
	std::cout << str << std::endl;
}

enum run_mode_t {
	MODE_Repl,
	MODE_Stdin,
	MODE_Run,
};

struct Options {
	run_mode_t mode = MODE_Repl;
	std::string path;
	bool journal = false;
	size_t journal_len = DEFAULT_JOURNAL_LEN;
	bool sandbox = false;
	bool enable_scope = false;
};

const char *usage_text =
	"usage: stapel [flags] [repl | >]\n"
	"       stapel [flags] stdin | -\n"
	"       stapel [flags] run <path>\n"
	"\n"
	"flags:\n"
	"  -j, --journal              record stack snapshots after each step\n"
	"  --journal-length N, --jl N keep the last N snapshots (default 20)\n"
	"  -s, --sandbox              disable file imports\n"
	"  --enable-all               enable every standard module\n"
	"  --enable-scope             enable the scope module\n";

maybe_t<Options> parse_args(int argc, char **argv) {
	Options options;
	bool have_mode = false;

	for (int i = 1; i < argc; ++i) {
		const std::string arg = argv[i];

		if (arg == "-j" || arg == "--journal") {
			options.journal = true;
		} else if (arg == "--journal-length" || arg == "--jl") {
			if (i + 1 >= argc) {
				std::cerr << "error: `" << arg << "` expects a length" << std::endl;
				return {};
			}
			const auto len = parse_journal_len(argv[++i]);
			if (!has(len)) {
				std::cerr << "error: invalid journal length `" << argv[i] << "`" << std::endl;
				return {};
			}
			options.journal = true;
			options.journal_len = get(len);
		} else if (arg == "-s" || arg == "--sandbox") {
			options.sandbox = true;
		} else if (arg == "--enable-all" || arg == "--enable-scope") {
			options.enable_scope = true;
		} else if (have_mode) {
			std::cerr << "error: unexpected argument `" << arg << "`" << std::endl;
			return {};
		} else if (arg == "repl" || arg == ">") {
			have_mode = true;
			options.mode = MODE_Repl;
		} else if (arg == "stdin" || arg == "-") {
			have_mode = true;
			options.mode = MODE_Stdin;
		} else if (arg == "run") {
			if (i + 1 >= argc) {
				std::cerr << "error: `run` expects a path" << std::endl;
				return {};
			}
			have_mode = true;
			options.mode = MODE_Run;
			options.path = argv[++i];
		} else {
			std::cerr << "error: unknown argument `" << arg << "`" << std::endl;
			return {};
		}
	}

	return options;
}

/*** SECTION: Session ***/

struct Session {
	const Options &options;
	Engine engine;
	std::unique_ptr<Context> context;
	std::unique_ptr<VM> vm;
	Ops last_ops;

	explicit Session(const Options &options) : options(options) {
		engine.sandbox = options.sandbox;
		if (options.enable_scope) engine.add_module(scope_module());
		reset();
	}

	void reset() {
		// the VM refers to the context, so it goes first
		vm.reset();
		context = std::make_unique<Context>();
		if (options.journal) context->with_journal(options.journal_len);
		vm = std::make_unique<VM>(engine, *context);
		last_ops.clear();
	}
};

void print_stack(std::ostream &os, const Stack &stack) {
	os << "stack:";
	if (stack.empty()) os << " empty.";
	for (const auto &item : stack) {
		os << ' ' << item;
	}
	os << std::endl;
}

// REPL lines are not kept as sources.
bool evaluate(Session &session, Source source, bool track = true) {
	if (track) session.context->add_source(source);

	Lexer lexer(std::move(source));
	maybe_t<Error> error;
	const Exprs exprs = parse(lexer, error);
	if (has(error)) {
		std::cerr << "error: " << get(error) << std::endl;
		return false;
	}

	VM &vm = *session.vm;
	vm.compile(exprs);
	session.last_ops = vm.ops();

	const VM::Step res = vm.run();
	if (res == VM::Fail) {
		std::cerr << "error: " << get(vm.error) << std::endl;
		print_stack(std::cerr, vm.stack);
		return false;
	}

	print_stack(std::cout, vm.stack);
	return true;
}

/*** SECTION: REPL ***/

void print_help() {
	writestringl("commands:");
	writestringl("  :exit     leave the repl");
	writestringl("  :clear    clear the screen");
	writestringl("  :reset    discard the stack and every binding");
	writestringl("  :help     show this text");
	writestringl("  :ops      show the last compiled program");
	writestringl("  :journal  show the recorded stack snapshots");
	writestringl("");
	writestringl("intrinsics:");
	for (idx_t i = 0; i < IN_COUNT; ++i) {
		writestring("  ");
		writestring(intrinsics[i].name);
		writestring(" ( ");
		writestring(intrinsics[i].desc);
		writestringl(" )");
	}
}

void print_ops(const Ops &ops) {
	if (ops.empty()) {
		writestringl("no program.");
		return;
	}
	for (idx_t i = 0; i < length(ops); ++i) {
		std::cout << i << ": " << ops[i] << std::endl;
	}
}

void print_journal(const Context &context) {
	if (!has(context.journal)) {
		writestringl("journal disabled; start with --journal");
		return;
	}
	const auto entries = context.journal->entries();
	if (entries.empty()) {
		writestringl("journal empty.");
		return;
	}
	for (idx_t i = 0; i < length(entries); ++i) {
		std::cout << i << ": ";
		print_stack(std::cout, entries[i]);
	}
}

// Returns false when the repl should stop.
bool run_command(Session &session, const std::string &line) {
	const std::string command = line.substr(0, line.find_first_of(" \t"));

	if (command == ":exit") return false;

	if (command == ":clear") {
		writestring("\x1b[2J\x1b[H");
		std::cout.flush();
	} else if (command == ":reset") {
		session.reset();
		writestringl("reset.");
	} else if (command == ":help") {
		print_help();
	} else if (command == ":ops") {
		print_ops(session.last_ops);
	} else if (command == ":journal") {
		print_journal(*session.context);
	} else {
		std::cerr << "error: unknown command `" << command << "`; try :help" << std::endl;
	}
	return true;
}

int repl(Session &session) {
	while (true) {
		writestring("> ");
		std::string line;
		std::getline(std::cin, line);

		if (std::cin.eof() || std::cin.fail()) {
			writestringl("");
			break;
		}

		if (!line.empty() && line[0] == ':') {
			if (!run_command(session, line)) break;
			continue;
		}

		evaluate(session, Source { .name = "repl", .text = line }, false);
	}
	return EXIT_SUCCESS;
}

}

int main(int argc, char **argv) {
	const auto options = parse_args(argc, argv);
	if (!has(options)) {
		std::cerr << usage_text;
		return EXIT_FAILURE;
	}

	Session session(*options);

	switch (options->mode) {
		case MODE_Repl: return repl(session);
		case MODE_Stdin: {
			std::string text { std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>() };
			const bool ok = evaluate(session, Source { .name = "stdin", .text = std::move(text) });
			return ok ? EXIT_SUCCESS : EXIT_FAILURE;
		}
		case MODE_Run: {
			auto source = Source::from_path(options->path);
			if (!has(source)) {
				std::cerr << "error: cannot read `" << options->path << "`" << std::endl;
				return EXIT_FAILURE;
			}
			const bool ok = evaluate(session, std::move(*source));
			return ok ? EXIT_SUCCESS : EXIT_FAILURE;
		}
	}
	return EXIT_FAILURE;
}
