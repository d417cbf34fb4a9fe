#include <catch2/catch_test_macros.hpp>

#include <string>

#include "syntax/parser.h"

using namespace analysis_sandbox;

namespace {

std::string Dump(const std::string& source) {
  SyntaxNode tree;
  SyntaxErrorInfo error;
  INFO(source);
  REQUIRE(ParseModule(source, tree, &error));
  return DumpTree(tree);
}

SyntaxErrorInfo ParseFailure(const std::string& source) {
  SyntaxNode tree;
  SyntaxErrorInfo error;
  INFO(source);
  REQUIRE_FALSE(ParseModule(source, tree, &error));
  return error;
}

}  // namespace

TEST_CASE("Parser builds the expected tree", "[parser]") {
  SECTION("Imports") {
    REQUIRE(Dump("import os.path as p\n") == "(Module (Import os.path as p))");
    REQUIRE(Dump("from ..x import a as b, c\n") == "(Module (ImportFrom ..x a as b c))");
  }

  SECTION("Calls and attributes") {
    REQUIRE(Dump("df.head(5)\n") == "(Module (ExprStmt (Call (Attribute df head) 5)))");
  }

  SECTION("Binary chains stay flat") {
    REQUIRE(Dump("x = a + b\n") == "(Module (Assign x (BinOp:+ a b)))");
  }

  SECTION("Empty module") {
    REQUIRE(Dump("") == "(Module)");
    REQUIRE(Dump("# only a comment\n") == "(Module)");
  }
}

TEST_CASE("Parser accepts typical analysis code", "[parser]") {
  const char* programs[] = {
      "result = df.groupby('region')['sales'].sum().sort_values(ascending=False)\n",
      "for i, row in enumerate(rows):\n    if row > 2:\n        continue\n    total += row\n",
      "def summarize(values, *, scale=1.0, **kw):\n    return [v * scale for v in values if v]\n",
      "class Point:\n    def __init__(self, x):\n        self.x = x\n",
      "try:\n    x = 1 / 0\nexcept ZeroDivisionError as e:\n    x = None\nfinally:\n    pass\n",
      "with ctx() as a, other() as b:\n    pass\n",
      "squares = {k: v ** 2 for k, v in pairs.items()}\n",
      "label = f\"{name!r:>10} has {count:,} rows ({ratio:.1%})\"\n",
      "value = a if cond else b\n",
      "fn = lambda x, y=2: x + y\n",
      "if (n := len(data)) > 10:\n    print(n)\n",
      "async def fetch():\n    await thing()\n",
      "matrix[1:3, ::2] = 0\n",
      "print(*args, sep='', **options)\n",
      "x = (yield_value := 3)\n",
      "while True:\n    break\nelse:\n    pass\n",
  };
  for (const char* program : programs) {
    SyntaxNode tree;
    SyntaxErrorInfo error;
    INFO(program);
    INFO(error.ToString());
    REQUIRE(ParseModule(program, tree, &error));
  }
}

TEST_CASE("Parser reports syntax errors with positions", "[parser]") {
  SECTION("Missing colon") {
    auto error = ParseFailure("if x\n    y = 1\n");
    REQUIRE(error.message == "expected ':'");
    REQUIRE(error.line == 1);
  }

  SECTION("Missing indented block") {
    auto error = ParseFailure("if x:\ny = 1\n");
    REQUIRE(error.message == "expected an indented block after 'if' statement on line 1");
    REQUIRE(error.line == 2);
  }

  SECTION("Python 2 print statement") {
    auto error = ParseFailure("print 'hello'\n");
    REQUIRE(error.message == "Missing parentheses in call to 'print'. Did you mean print(...)?");
  }

  SECTION("Scope checks") {
    REQUIRE(ParseFailure("return 1\n").message == "'return' outside function");
    REQUIRE(ParseFailure("break\n").message == "'break' outside loop");
    REQUIRE(ParseFailure("yield 1\n").message == "'yield' outside function");
  }

  SECTION("Invalid assignment targets") {
    REQUIRE(ParseFailure("f() = 1\n").message == "cannot assign to function call");
    REQUIRE(ParseFailure("1 = x\n").message == "cannot assign to literal");
  }

  SECTION("Argument ordering") {
    REQUIRE(ParseFailure("f(a=1, b)\n").message == "positional argument follows keyword argument");
  }

  SECTION("Unexpected indent") {
    REQUIRE(ParseFailure("x = 1\n    y = 2\n").message == "unexpected indent");
  }

  SECTION("Lexer errors surface through the parser") {
    auto error = ParseFailure("x = (1,\n");
    REQUIRE(error.message == "'(' was never closed");
    REQUIRE(error.line == 1);
    REQUIRE(error.column == 5);
  }

  SECTION("F-string fields are parsed") {
    REQUIRE(ParseFailure("s = f'{}'\n").message == "f-string: empty expression not allowed");
    REQUIRE(ParseFailure("s = f'a}'\n").message == "f-string: single '}' is not allowed");
  }
}

TEST_CASE("Parser bounds nesting depth", "[parser]") {
  std::string deep(kMaxNestingDepth + 50, '(');
  deep += "1";
  deep += std::string(kMaxNestingDepth + 50, ')');
  deep += "\n";
  auto error = ParseFailure(deep);
  REQUIRE(error.message == "expression too deeply nested");
}

TEST_CASE("Walk visits in source order", "[parser]") {
  SyntaxNode tree;
  REQUIRE(ParseModule("a = b(c)\nd.e\n", tree));
  std::string names;
  Walk(tree, [&](const SyntaxNode& node) {
    if (auto* name = std::get_if<NameNode>(&node)) {
      names += name->id;
    }
    return true;
  });
  REQUIRE(names == "abcd");
}
