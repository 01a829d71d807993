#include <filesystem>
#include <fstream>

#include <gtest/gtest.h>

#include "stapel.hpp"
#include "test_util.hpp"

using namespace stapel;
using stapel::test::Harness;

namespace {

std::string write_temp(const std::string &name, const std::string &text) {
	const auto path = std::filesystem::temp_directory_path() / name;
	std::ofstream file(path);
	file << text;
	return path.string();
}

}

TEST(Resolution, Priority) {
	Engine engine;
	Context context;

	EXPECT_EQ(resolve_name(engine, context, "+"), NK_Intrinsic);
	EXPECT_EQ(resolve_name(engine, context, "x"), NK_Unresolved);

	context.def("x", Expr::new_integer(1));
	EXPECT_EQ(resolve_name(engine, context, "x"), NK_Item);

	context.let("x", Expr::new_integer(2));
	EXPECT_EQ(resolve_name(engine, context, "x"), NK_Let);

	context.let("dupe", Expr::new_integer(3));
	EXPECT_EQ(resolve_name(engine, context, "dupe"), NK_Intrinsic);
}

TEST(Resolution, QualifiedNames) {
	Engine engine;
	Context context;

	EXPECT_EQ(resolve_name(engine, context, "scope:where"), NK_Unresolved);
	engine.add_module(scope_module());
	EXPECT_EQ(resolve_name(engine, context, "scope:where"), NK_Module);
	EXPECT_EQ(resolve_name(engine, context, "other:where"), NK_Unresolved);
	EXPECT_EQ(resolve_name(engine, context, ":where"), NK_Unresolved);
}

TEST(Modules, Registry) {
	Engine engine;
	EXPECT_EQ(engine.module("scope"), nullptr);
	engine.add_module(scope_module());
	ASSERT_NE(engine.module("scope"), nullptr);
	EXPECT_TRUE(has(engine.module("scope")->func("where")));
	EXPECT_TRUE(has(engine.module("scope")->func("dump")));
	EXPECT_FALSE(has(engine.module("scope")->func("nope")));

	EXPECT_TRUE(has(std_module("scope")));
	EXPECT_FALSE(has(std_module("fs")));
}

TEST(ScopeModule, Where) {
	Harness h;
	h.engine.add_module(scope_module());
	EXPECT_EQ(h.eval(
		"1 'item def 2 'local let "
		"'+ scope:where 'scope:dump scope:where 'local scope:where \"item\" scope:where 'none scope:where 5 scope:where"
	), VM::Halt);
	EXPECT_EQ(h.stack(), "\"intrinsic\" \"module\" \"let\" \"scope\" nil nil");
}

TEST(ScopeModule, Dump) {
	Harness h;
	h.engine.add_module(scope_module());
	EXPECT_EQ(h.eval("1 'a def \"x\" 'b def (1 'c let) call scope:dump"), VM::Halt);
	EXPECT_EQ(h.stack(), "[['a 1] ['b \"x\"]]");
}

TEST(ScopeModule, UnknownFunction) {
	Harness h;
	h.engine.add_module(scope_module());
	EXPECT_EQ(h.eval("scope:nope"), VM::Fail);
	EXPECT_EQ(h.error_kind(), Error::UnknownName);
}

TEST(ScopeModule, NotRegistered) {
	Harness h;
	EXPECT_EQ(h.eval("'a scope:where"), VM::Fail);
	EXPECT_EQ(h.error_kind(), Error::UnknownName);
}

TEST(Import, StandardModule) {
	Harness h;
	EXPECT_EQ(h.eval("'scope import 'dupe scope:where"), VM::Halt);
	EXPECT_EQ(h.stack(), "\"intrinsic\"");
	EXPECT_NE(h.engine.module("scope"), nullptr);

	// importing twice is harmless
	EXPECT_EQ(h.eval("\"scope\" import"), VM::Halt);
}

TEST(Import, SourceFile) {
	const std::string path = write_temp("stapel_import_test.st", "; helpers\n(dupe *) 'square def\n10 'ten def\n");

	Harness h;
	EXPECT_EQ(h.eval("\"" + path + "\" import ten square"), VM::Halt);
	EXPECT_EQ(h.stack(), "100");
	ASSERT_EQ(h.context.sources.size(), 1u);
	EXPECT_EQ(h.context.sources[0].name, path);

	std::filesystem::remove(path);
}

TEST(Import, FileLetsStayInTheFile) {
	const std::string path = write_temp("stapel_import_let_test.st", "1 'hidden let\n");

	Harness h;
	EXPECT_EQ(h.eval("\"" + path + "\" import hidden"), VM::Fail);
	EXPECT_EQ(h.error_kind(), Error::UnknownName);

	std::filesystem::remove(path);
}

TEST(Import, Failures) {
	Harness missing;
	EXPECT_EQ(missing.eval("\"/nonexistent/stapel/file.st\" import"), VM::Fail);
	EXPECT_EQ(missing.error_kind(), Error::ImportFailed);
	EXPECT_EQ(missing.stack(), "\"/nonexistent/stapel/file.st\"");

	const std::string path = write_temp("stapel_import_bad_test.st", "(1 2");
	Harness broken;
	EXPECT_EQ(broken.eval("\"" + path + "\" import"), VM::Fail);
	EXPECT_EQ(broken.error_kind(), Error::ImportFailed);
	std::filesystem::remove(path);

	Harness sandboxed;
	sandboxed.engine.sandbox = true;
	EXPECT_EQ(sandboxed.eval("\"" + path + "\" import"), VM::Fail);
	EXPECT_EQ(sandboxed.error_kind(), Error::ImportFailed);
	EXPECT_EQ(sandboxed.eval("'scope import"), VM::Halt);
}
