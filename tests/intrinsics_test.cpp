#include <set>
#include <string>

#include <gtest/gtest.h>

#include "stapel.hpp"
#include "test_util.hpp"

using namespace stapel;
using stapel::test::Harness;

namespace {

// Runs `text` on a fresh machine and renders the resulting stack.
std::string run(const std::string &text) {
	Harness h;
	EXPECT_EQ(h.eval(text), VM::Halt) << text << ": " << (has(h.vm.error) ? h.vm.error->message : "");
	return h.stack();
}

maybe_t<Error::Kind> run_fail(const std::string &text) {
	Harness h;
	EXPECT_EQ(h.eval(text), VM::Fail) << text;
	return h.error_kind();
}

}

TEST(Intrinsics, TableMatchesEnum) {
	std::set<std::string> names;
	for (idx_t i = 0; i < IN_COUNT; ++i) {
		EXPECT_EQ(find_intrinsic(intrinsics[i].name), static_cast<intrinsic_t>(i)) << intrinsics[i].name;
		EXPECT_TRUE(names.insert(intrinsics[i].name).second) << intrinsics[i].name;
		EXPECT_NE(intrinsics[i].fun, nullptr);
	}
	EXPECT_STREQ(intrinsics[IN_Add].name, "+");
	EXPECT_STREQ(intrinsics[IN_OrElse].name, "or-else");
	EXPECT_STREQ(intrinsics[IN_TypeOf].name, "type-of");
	EXPECT_STREQ(intrinsics[IN_Import].name, "import");
	EXPECT_FALSE(has(find_intrinsic("fn")));
}

TEST(Intrinsics, Arithmetic) {
	EXPECT_EQ(run("7 2 + 7 2 - 7 2 * 7 2 / 7 2 %"), "9 5 14 3 1");
	EXPECT_EQ(run("1.5 2.5 + 1.0 4.0 /"), "4.0 0.25");
	EXPECT_EQ(run("9223372036854775807 1 +"), "9223372036854775807");
}

TEST(Intrinsics, ArithmeticFailures) {
	EXPECT_EQ(run_fail("1 2.0 +"), Error::UnsupportedOperands);
	EXPECT_EQ(run_fail("\"a\" \"b\" *"), Error::UnsupportedOperands);
	EXPECT_EQ(run_fail("1 0 /"), Error::DivisionByZero);
	EXPECT_EQ(run_fail("1 0 %"), Error::DivisionByZero);

	Harness h;
	EXPECT_EQ(h.eval("1 0 /"), VM::Fail);
	EXPECT_EQ(h.stack(), "1 0");
}

TEST(Intrinsics, Comparison) {
	EXPECT_EQ(run("1 2 < 2 2 <= 3 2 > 2 3 >="), "true true true false");
	EXPECT_EQ(run("1 1.5 < \"a\" \"b\" <"), "true true");
	EXPECT_EQ(run("1 1.0 = 1 true = \"1\" 1 = 'a 'a = [1 2] [1 2] !="), "true true false true false");
	EXPECT_EQ(run_fail("1 \"a\" <"), Error::UnsupportedOperands);
}

TEST(Intrinsics, Boolean) {
	EXPECT_EQ(run("true false and true false or 0 not nil not 1 not"), "false true true true false");
}

TEST(Intrinsics, Assert) {
	EXPECT_EQ(run("1 \"fine\" assert"), "");

	Harness h;
	EXPECT_EQ(h.eval("false \"boom\" assert"), VM::Fail);
	EXPECT_EQ(h.error_kind(), Error::AssertionFailed);
	EXPECT_NE(h.vm.error->message.find("boom"), std::string::npos);
}

TEST(Intrinsics, StackOperations) {
	EXPECT_EQ(run("1 2 drop"), "1");
	EXPECT_EQ(run("1 dupe"), "1 1");
	EXPECT_EQ(run("1 2 swap"), "2 1");
	EXPECT_EQ(run("1 2 3 rot"), "2 3 1");
	EXPECT_EQ(run_fail("1 2 rot"), Error::StackUnderflow);
}

TEST(Intrinsics, Length) {
	EXPECT_EQ(run("[1 2 3] len (1) len \"abcd\" len [] len"), "3 1 4 0");
	EXPECT_EQ(run_fail("1 len"), Error::TypeMismatch);
}

TEST(Intrinsics, Nth) {
	EXPECT_EQ(run("[1 2 3] 1 nth [1 2 3] 3 nth \"abc\" 0 nth"), "2 nil \"a\"");
	EXPECT_EQ(run_fail("[1] 'a nth"), Error::TypeMismatch);
}

TEST(Intrinsics, Split) {
	EXPECT_EQ(run("[1 2 3] 1 split"), "[1] [2 3]");
	EXPECT_EQ(run("\"hello\" 2 split"), "\"he\" \"llo\"");
	EXPECT_EQ(run_fail("[1 2] 5 split"), Error::IndexOutOfBounds);
}

TEST(Intrinsics, Concat) {
	EXPECT_EQ(run("[1] [2 3] concat \"ab\" \"c\" concat"), "[1 2 3] \"abc\"");
	EXPECT_EQ(run_fail("[1] \"a\" concat"), Error::TypeMismatch);
}

TEST(Intrinsics, PushPop) {
	EXPECT_EQ(run("[1 2] 3 push"), "[1 2 3]");
	EXPECT_EQ(run("[1 2] pop"), "[1] 2");
	EXPECT_EQ(run("[] pop"), "[] nil");
	EXPECT_EQ(run_fail("1 2 push"), Error::TypeMismatch);
}

TEST(Intrinsics, ListInsertRemoveHas) {
	EXPECT_EQ(run("[1 3] 1 2 insert"), "[1 2 3]");
	EXPECT_EQ(run("[1 2 3] 0 remove"), "[2 3]");
	EXPECT_EQ(run("[1 2 3] 2 has [1 2 3] 5 has \"hello\" \"ell\" has"), "true false true");
	EXPECT_EQ(run_fail("[1] 3 0 insert"), Error::IndexOutOfBounds);
	EXPECT_EQ(run_fail("[1] 1 remove"), Error::IndexOutOfBounds);
}

TEST(Intrinsics, Records) {
	const std::string rec = "[['a 1] ['b 2]] \"record\" cast ";
	EXPECT_EQ(run(rec), "{a: 1, b: 2}");
	EXPECT_EQ(run(rec + "'a prop"), "1");
	EXPECT_EQ(run(rec + "'z prop"), "nil");
	EXPECT_EQ(run(rec + "'c 3 insert 'c prop"), "3");
	EXPECT_EQ(run(rec + "'a remove"), "{b: 2}");
	EXPECT_EQ(run(rec + "dupe 'a has swap 'z has"), "true false");
	EXPECT_EQ(run(rec + "dupe keys swap values"), "['a 'b] [1 2]");
	EXPECT_EQ(run(rec + "len"), "2");
	EXPECT_EQ(run(rec + "[['b 5]] \"record\" cast concat"), "{a: 1, b: 5}");
	EXPECT_EQ(run_fail("[1 2] 'a prop"), Error::TypeMismatch);
	EXPECT_EQ(run_fail("[1 2] keys"), Error::TypeMismatch);
}

TEST(Intrinsics, Cast) {
	EXPECT_EQ(run("\"42\" \"integer\" cast 3.9 \"integer\" cast true \"integer\" cast"), "42 3 1");
	EXPECT_EQ(run("1 \"float\" cast \"2.5\" \"float\" cast"), "1.0 2.5");
	EXPECT_EQ(run("12 \"string\" cast 'sym \"string\" cast"), "\"12\" \"sym\"");
	EXPECT_EQ(run("0 \"boolean\" cast \"\" \"boolean\" cast"), "false true");
	EXPECT_EQ(run("\"x\" \"symbol\" cast"), "'x");
	EXPECT_EQ(run("(1 2) \"list\" cast [1 2] 'block cast"), "[1 2] (1 2)");
	EXPECT_EQ(run_fail("\"x\" \"integer\" cast"), Error::InvalidCast);
	EXPECT_EQ(run_fail("1 \"number\" cast"), Error::InvalidCast);
	EXPECT_EQ(run_fail("[1 2] \"record\" cast"), Error::InvalidCast);
}

TEST(Intrinsics, TypeOf) {
	EXPECT_EQ(run("1 type-of 1.0 type-of \"s\" type-of 's type-of nil type-of [] type-of () type-of"),
		"\"integer\" \"float\" \"string\" \"symbol\" \"nil\" \"list\" \"block\"");
	EXPECT_EQ(run("(fn) type-of"), "\"function\"");
}

TEST(Intrinsics, Lazy) {
	EXPECT_EQ(run("5 lazy"), "(5)");
	EXPECT_EQ(run("5 lazy call"), "5");
	EXPECT_EQ(run("(1 2) lazy"), "(1 2)");
}

TEST(Intrinsics, If) {
	EXPECT_EQ(run("true (1) (2) if"), "1");
	EXPECT_EQ(run("false (1) (2) if"), "2");
	EXPECT_EQ(run("0 (1) if"), "");
	EXPECT_EQ(run("1 (1) if"), "1");
	EXPECT_EQ(run_fail("true 1 if"), Error::TypeMismatch);
}

TEST(Intrinsics, IfTakesTwoBranchesWhenTheNextValueIsCallable) {
	// the block under the top is the then branch, so `(1)` is the condition
	EXPECT_EQ(run("(1) (2) (3) if"), "2");
	EXPECT_EQ(run("nil (2) (3) if"), "3");
	EXPECT_NE(std::string(intrinsics[IN_If].desc).find("callable"), std::string::npos);
}

TEST(Intrinsics, Call) {
	EXPECT_EQ(run("1 2 '+ call"), "3");
	EXPECT_EQ(run("7 call"), "7");
	EXPECT_EQ(run("(fn 2 3 *) call"), "6");

	Harness h;
	EXPECT_EQ(h.eval("'nope call"), VM::Fail);
	EXPECT_EQ(h.error_kind(), Error::UnknownName);
	EXPECT_EQ(h.stack(), "'nope");
}

TEST(Intrinsics, OrElse) {
	EXPECT_EQ(run("nil 5 or-else 1 5 or-else false 5 or-else"), "5 1 false");
}

TEST(Intrinsics, Bindings) {
	EXPECT_EQ(run("1 'a let 5 'a set a"), "5");
	EXPECT_EQ(run("1 \"a\" def 2 'a set a"), "2");
	EXPECT_EQ(run("4 'a let 'a get 'missing get"), "4 nil");
	EXPECT_EQ(run_fail("1 'missing set"), Error::UnknownName);
	EXPECT_EQ(run_fail("1 2 let"), Error::TypeMismatch);
}

TEST(Intrinsics, SetReachesEnclosingLets) {
	EXPECT_EQ(run("1 'a let (9 'a set) call a"), "9");
}

TEST(Intrinsics, Output) {
	Harness h;
	EXPECT_EQ(h.eval("\"hi\" print 'a debug [1 [2]] pretty"), VM::Halt);
	EXPECT_EQ(h.out.str(), "hi\n'a\n[\n  1\n  [\n    2\n  ]\n]\n");
	EXPECT_EQ(h.stack(), "'a");
}
