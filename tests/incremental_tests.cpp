#include <catch2/catch.hpp>
#include "peg_parser/PegExceptions.hpp"
#include "peg_parser/PegGrammarCompiler.hpp"
#include "peg_parser/PegIncrementalParser.hpp"

static const char* EXPRESSION_GRAMMAR = R"(
program   <- statement*
statement <- IDENT '=' expr ';'
expr      <- term (('+' / '-') term)*
term      <- NUMBER / IDENT
)";

static peg::sp<peg::Grammar> expressionGrammar() {
    return peg::compileGrammar(EXPRESSION_GRAMMAR, "expressions");
}

// The patched tree has to look exactly like the tree of a fresh parse.
static void requireSameAsFreshParse(const peg::IncrementalParser& parser) {
    REQUIRE(parser.getTree());
    peg::PegInterpreter interpreter{ expressionGrammar() };
    auto fresh = interpreter.parse(parser.getSource());
    REQUIRE(parser.getTree()->toJson() == fresh.toJson());
    REQUIRE(parser.getTree()->dump() == fresh.dump());
    REQUIRE(parser.getTree()->size() == fresh.size());
}

TEST_CASE("Source edits", "[incremental]") {
    peg::SourceEdit insert{ .offset = 3, .oldLength = 0, .newText = "abc" };
    REQUIRE(insert.delta() == 3);
    REQUIRE(insert.newLength() == 3);
    peg::SourceEdit remove{ .offset = 3, .oldLength = 5 };
    REQUIRE(remove.delta() == -5);
    REQUIRE(remove.newLength() == 0);
}

TEST_CASE("Growing an expression patches the statement", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    auto& initial = parser.parse("x = 10;");
    REQUIRE(initial.findAll("statement").size() == 1);

    auto& tree = parser.applyEdit(6, 0, " + 5");
    REQUIRE(parser.getSource() == "x = 10 + 5;");
    REQUIRE(tree);
    auto expr = tree->findFirst("expr");
    REQUIRE(expr);
    REQUIRE((*tree)[*expr].children.size() == 3);
    REQUIRE((*tree)[(*tree)[*expr].children.at(1)].type == "Operator");
    REQUIRE(std::get<std::string>((*tree)[(*tree)[*expr].children.at(1)].value) == "+");
    auto numbers = tree->findAll("Number");
    REQUIRE(numbers.size() == 2);
    REQUIRE(std::get<int64_t>((*tree)[numbers.at(1)].value) == 5);
    REQUIRE((*tree)[numbers.at(1)].column == 10);
    requireSameAsFreshParse(parser);

    auto& stats = parser.getStats();
    REQUIRE(stats.totalParses == 2);
    REQUIRE(stats.incrementalCount == 1);
    REQUIRE(stats.fullReparseCount == 0);
    REQUIRE(stats.getLastParseMs() >= 0.0);
}

TEST_CASE("Changing a value patches the expression", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    (void)parser.parse("a = 1;\nb = 2;");
    auto firstStatement = parser.getTree()->findAll("statement").at(0);

    parser.applyEdit(11, 1, "7");
    REQUIRE(parser.getSource() == "a = 1;\nb = 7;");
    REQUIRE(parser.getStats().incrementalCount == 1);
    requireSameAsFreshParse(parser);

    auto& tree = *parser.getTree();
    // nodes outside the patched region keep their ids
    REQUIRE(tree.findAll("statement").at(0) == firstStatement);
    auto numbers = tree.findAll("Number");
    REQUIRE(std::get<int64_t>(tree[numbers.at(0)].value) == 1);
    REQUIRE(std::get<int64_t>(tree[numbers.at(1)].value) == 7);
    REQUIRE(tree[numbers.at(1)].line == 2);
    REQUIRE(tree[numbers.at(1)].column == 5);
}

TEST_CASE("Edits produce the same tree as a fresh parse", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    (void)parser.parse("x = 10;");

    SECTION("value change") {
        parser.applyEdit(4, 2, "15");
        REQUIRE(parser.getSource() == "x = 15;");
        requireSameAsFreshParse(parser);
        REQUIRE(parser.getStats().incrementalCount == 1);
    }
    SECTION("expression growing step by step") {
        parser.applyEdit(6, 0, " - y");
        requireSameAsFreshParse(parser);
        parser.applyEdit(10, 0, " + 3");
        REQUIRE(parser.getSource() == "x = 10 - y + 3;");
        requireSameAsFreshParse(parser);
        REQUIRE(parser.getTree()->findAll("term").size() == 3);
    }
    SECTION("statement insertion and deletion") {
        parser.applyEdit(7, 0, "\ny = 2;\nz = 3;");
        requireSameAsFreshParse(parser);
        REQUIRE(parser.getTree()->findAll("statement").size() == 3);

        parser.applyEdit(8, 7, "");
        REQUIRE(parser.getSource() == "x = 10;\nz = 3;");
        requireSameAsFreshParse(parser);
        REQUIRE(parser.getTree()->findAll("statement").size() == 2);
    }
    SECTION("newline insertion moves later lines") {
        parser.applyEdit(7, 0, "\ny = 2;");
        parser.applyEdit(7, 0, "\n");
        REQUIRE(parser.getSource() == "x = 10;\n\ny = 2;");
        requireSameAsFreshParse(parser);
        auto second = parser.getTree()->findAll("statement").at(1);
        REQUIRE((*parser.getTree())[second].line == 3);
    }
    SECTION("renaming the target") {
        parser.applyEdit(0, 1, "total");
        REQUIRE(parser.getSource() == "total = 10;");
        requireSameAsFreshParse(parser);
    }
    SECTION("replacing everything") {
        parser.applyEdit(0, 7, "a = b - 1;");
        requireSameAsFreshParse(parser);
    }
}

TEST_CASE("A syntax error keeps the previous tree", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    (void)parser.parse("x = 1;");

    auto& tree = parser.applyEdit(4, 1, "");
    REQUIRE(parser.getSource() == "x = ;");
    REQUIRE(tree);
    REQUIRE(parser.isStale());
    REQUIRE(std::get<int64_t>((*tree)[*tree->findFirst("Number")].value) == 1);
    REQUIRE(parser.getStats().fullReparseCount == 1);

    parser.applyEdit(4, 0, "2");
    REQUIRE(parser.getSource() == "x = 2;");
    REQUIRE(!parser.isStale());
    requireSameAsFreshParse(parser);
    REQUIRE(parser.getStats().fullReparseCount == 2);
    REQUIRE(parser.getStats().totalParses == 3);

    // back on the incremental path once the tree is current again
    parser.applyEdit(4, 1, "3");
    REQUIRE(parser.getStats().incrementalCount == 1);
    requireSameAsFreshParse(parser);
}

TEST_CASE("Parsing invalid text leaves no tree", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    REQUIRE_THROWS_AS(parser.parse("x = = 1;"), peg::SyntaxError);
    REQUIRE(!parser.getTree());
    REQUIRE(parser.getRegions().empty());
    REQUIRE(parser.getStats().totalParses == 1);

    // an edit without a tree parses the whole text
    parser.applyEdit(4, 2, "");
    REQUIRE(parser.getSource() == "x = 1;");
    REQUIRE(!parser.isStale());
    requireSameAsFreshParse(parser);
    REQUIRE(parser.getStats().fullReparseCount == 1);
}

TEST_CASE("Regions cover the rule nodes below the root", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    auto& tree = parser.parse("x = 10;");
    auto& regions = parser.getRegions();
    REQUIRE(regions.size() == 3);
    REQUIRE(tree[regions.at(0).node].type == "statement");
    REQUIRE(regions.at(0).start == 0);
    REQUIRE(regions.at(0).end == 7);
    REQUIRE(tree[regions.at(1).node].type == "expr");
    REQUIRE(regions.at(1).start == 4);
    REQUIRE(regions.at(1).end == 6);
    REQUIRE(tree[regions.at(2).node].type == "term");
    for(auto& region : regions) {
        REQUIRE(region.node != tree.getRoot());
        REQUIRE(tree[region.node].rule == region.rule);
    }

    parser.applyEdit(6, 0, " + 5");
    REQUIRE(parser.getStats().incrementalCount == 1);
    auto& patched = parser.getRegions();
    REQUIRE(patched.size() == 4);
    REQUIRE(patched.at(0).end == 11);
    REQUIRE(patched.at(1).start == 4);
    REQUIRE(patched.at(1).end == 10);
    REQUIRE(patched.at(3).start == 9);

    parser.applyEdit(4, 2, "");
    REQUIRE(parser.getSource() == "x =  + 5;");
    REQUIRE(parser.isStale());
    REQUIRE(parser.getRegions().empty());
}

TEST_CASE("Invalidating forces a full parse", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    (void)parser.parse("x = 10;");
    parser.invalidate();
    REQUIRE(parser.getRegions().empty());

    parser.applyEdit(4, 2, "11");
    REQUIRE(parser.getStats().fullReparseCount == 1);
    REQUIRE(parser.getStats().incrementalCount == 0);
    requireSameAsFreshParse(parser);
    REQUIRE(!parser.getRegions().empty());

    parser.applyEdit(4, 2, "12");
    REQUIRE(parser.getStats().incrementalCount == 1);
    requireSameAsFreshParse(parser);
}

TEST_CASE("Resetting forgets the document", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    (void)parser.parse("x = 10;");
    parser.applyEdit(4, 2, "11");
    parser.reset();
    REQUIRE(!parser.getTree());
    REQUIRE(parser.getSource().empty());
    REQUIRE(parser.getStats().totalParses == 0);
    REQUIRE(parser.getStats().incrementalCount == 0);

    parser.applyEdit(100, 5, "y = 1;");
    REQUIRE(parser.getSource() == "y = 1;");
    requireSameAsFreshParse(parser);
}

TEST_CASE("Batches of edits apply from the back", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    (void)parser.parse("x = 1;\ny = 2;");
    std::vector<peg::SourceEdit> edits{
        { .offset = 4, .oldLength = 1, .newText = "10" },
        { .offset = 11, .oldLength = 1, .newText = "20" },
    };
    auto& tree = parser.applyEdits(edits);
    REQUIRE(parser.getSource() == "x = 10;\ny = 20;");
    REQUIRE(tree);
    requireSameAsFreshParse(parser);
    REQUIRE(parser.getStats().totalParses == 3);
    REQUIRE(parser.getStats().incrementalCount + parser.getStats().fullReparseCount == 2);
}

TEST_CASE("Out of range edits are clamped", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    (void)parser.parse("x = 1;");
    parser.applyEdit(6, 10, "\ny = 2;");
    REQUIRE(parser.getSource() == "x = 1;\ny = 2;");
    requireSameAsFreshParse(parser);
}

TEST_CASE("Comments inside an edited region", "[incremental]") {
    auto grammar = expressionGrammar();
    grammar->setCommentPatterns({ "//.*" });
    peg::IncrementalParser parser{ grammar };
    (void)parser.parse("x = 1; // one\ny = 2;");
    parser.applyEdit(10, 3, "two");
    REQUIRE(parser.getSource() == "x = 1; // two\ny = 2;");
    peg::PegInterpreter interpreter{ grammar };
    REQUIRE(parser.getTree()->toJson() == interpreter.parse(parser.getSource()).toJson());

    // turning the comment marker into a division sign is a syntax error
    parser.applyEdit(7, 2, "/");
    REQUIRE(parser.isStale());
}

static std::string numberedStatements(size_t count) {
    std::string source;
    for(size_t i = 0; i < count; ++i) {
        source += "v" + std::to_string(i) + " = " + std::to_string(i) + ";\n";
    }
    return source;
}

static size_t findSemicolon(const std::string& source, size_t index) {
    size_t pos = source.find(';');
    for(size_t i = 0; i < index; ++i) {
        pos = source.find(';', pos + 1);
    }
    return pos;
}

TEST_CASE("Edits in a large document stay local", "[incremental]") {
    peg::IncrementalParser parser{ expressionGrammar() };
    auto& initial = parser.parse(numberedStatements(500));
    auto statements = initial.findAll("statement");
    auto first = statements.front();
    auto last = statements.back();

    // more edits than the tree keeps pending before moving every node
    for(size_t i = 0; i < 100; ++i) {
        auto offset = findSemicolon(parser.getSource(), (i * 37) % 500);
        parser.applyEdit(offset, 0, " + 1");
        if(i == 10) {
            requireSameAsFreshParse(parser);
        }
    }
    REQUIRE(parser.getStats().incrementalCount == 100);
    REQUIRE(parser.getStats().fullReparseCount == 0);
    requireSameAsFreshParse(parser);

    auto& tree = *parser.getTree();
    REQUIRE(tree.findAll("statement").front() == first);
    REQUIRE(tree.findAll("statement").back() == last);
    REQUIRE(tree[last].line == 500);
    REQUIRE(tree.getSourceText(last).substr(0, 6) == "v499 =");
    REQUIRE(tree.getSource() == parser.getSource());
}

TEST_CASE("Edits inside a long comment", "[incremental]") {
    auto grammar = expressionGrammar();
    grammar->setCommentPatterns({ "//.*", R"(/\*[\s\S]*?\*/)" });
    peg::IncrementalParser parser{ grammar };
    const std::string body(100000, 'c');
    (void)parser.parse("x = 1; //" + body + "\ny = 2; /*" + body + "*/ z = 3;");

    parser.applyEdit(5000, 1, "d");
    parser.applyEdit(150000, 0, "\n");
    peg::PegInterpreter interpreter{ grammar };
    REQUIRE(parser.getTree()->toJson() == interpreter.parse(parser.getSource()).toJson());
    REQUIRE(!parser.isStale());
    REQUIRE((*parser.getTree())[parser.getTree()->findAll("statement").at(2)].line == 3);
}

TEST_CASE("An undefined start rule does not escape an edit", "[incremental]") {
    auto grammar = expressionGrammar();
    grammar->setStartRule("missing");
    peg::IncrementalParser parser{ grammar };
    REQUIRE_THROWS_AS(parser.parse("x = 1;"), peg::GrammarError);
    REQUIRE(!parser.getTree());

    REQUIRE_NOTHROW(parser.applyEdit(4, 1, "2"));
    REQUIRE(parser.getSource() == "x = 2;");
    REQUIRE(!parser.getTree());
    REQUIRE(!parser.isStale());
    REQUIRE(parser.getStats().fullReparseCount == 1);
}
