#include <gtest/gtest.h>

#include "solver/parser.h"

namespace {

/// Parses the text and returns the ParseError message, empty if parsing succeeded
std::string parseErrorOf(std::string_view text) {
    try {
        parseDimacs(text);
    } catch (const ParseError& error) {
        return error.what();
    }
    return "";
}

bool startsWith(const std::string& message, std::string_view prefix) {
    return message.rfind(prefix, 0) == 0;
}

}

TEST(ParserTest, ParsesClauses) {
    std::istringstream in("c a comment\nc another one\np cnf 3 2\n1 -2 0\n2 3\n -1 0\n");
    FileParser parser(in);

    EXPECT_EQ(parser.variableCount, 3u);
    EXPECT_EQ(parser.clauseCount, 2u);
    std::vector<std::vector<LiteralID>> expected { { 1, -2 }, { 2, 3, -1 } };
    EXPECT_EQ(parser.rawClauses, expected);

    Formula formula = parser.formula();
    EXPECT_EQ(formula.variableCount(), 3u);
    EXPECT_EQ(formula.clauses.size(), 2u);
    EXPECT_EQ(formula.remainingCount, 2u);
}

TEST(ParserTest, AcceptsTrailingWhitespaceAndBlankLines) {
    EXPECT_EQ(parseErrorOf("\np cnf 1 1\n1 0\n\n  \t\n"), "");
    EXPECT_EQ(parseErrorOf("p cnf 2 1\r\n1 2 0\r\n"), "");
}

TEST(ParserTest, DropsTautologiesWhileBuilding) {
    Formula formula = parseDimacs("p cnf 2 2\n1 -1 0\n2 0\n");
    EXPECT_EQ(formula.clauses.size(), 1u);
    EXPECT_EQ(formula.droppedTautologies, 1u);
    EXPECT_EQ(formula.remainingCount, 1u);
}

TEST(ParserTest, MissingProblemLine) {
    EXPECT_EQ(parseErrorOf(""), "Missing problem line");
    EXPECT_EQ(parseErrorOf("c only comments\nc here\n"), "Missing problem line");
}

TEST(ParserTest, WrongNumberOfProblemLineTokens) {
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 1\n1 0\n"), "Wrong number of parameters in problem line"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 1 1 1\n1 0\n"), "Wrong number of parameters in problem line"));
    EXPECT_TRUE(startsWith(parseErrorOf("1 0\n"), "Wrong number of parameters in problem line"));
}

TEST(ParserTest, WrongProblemLineLiterals) {
    EXPECT_TRUE(startsWith(parseErrorOf("q cnf 1 1\n1 0\n"), "Invalid problem line"));
    EXPECT_TRUE(startsWith(parseErrorOf("p dnf 1 1\n1 0\n"), "Only cnf-formatted inputs are supported"));
}

TEST(ParserTest, InvalidCounts) {
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf x 1\n1 0\n"), "Third problem line parameter invalid"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf -1 1\n1 0\n"), "Third problem line parameter invalid"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 1 1x\n1 0\n"), "Fourth problem line parameter invalid"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 99999999999 1\n1 0\n"), "Third problem line parameter out of range"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 4294967295 1\n1 0\n"), "Third problem line parameter out of range"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 1 99999999999\n1 0\n"), "Fourth problem line parameter out of range"));
}

TEST(ParserTest, IllegalLiterals) {
    EXPECT_EQ(parseErrorOf("p cnf 2 1\n1 a 0\n"), "Illegal variable 'a'");
    EXPECT_EQ(parseErrorOf("p cnf 2 1\n1 2x 0\n"), "Illegal variable '2x'");
    EXPECT_EQ(parseErrorOf("p cnf 2 1\n1 -0 2 0\n"), "Illegal variable '-0'");
    EXPECT_EQ(parseErrorOf("p cnf 2 1\n1 00 2 0\n"), "Illegal variable '00'");
}

TEST(ParserTest, VariableOutOfRange) {
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 1\n1 3 0\n"), "Variable out of range '3'"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 1\n-3 0\n"), "Variable out of range '-3'"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 1\n-2147483648 0\n"), "Variable out of range"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 1\n99999999999 0\n"), "Variable out of range"));
}

TEST(ParserTest, NotEnoughClauses) {
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 2\n1 2 0\n"), "Not enough clauses"));
    // An unterminated clause does not count
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 2\n1 2 0\n-1\n"), "Not enough clauses"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 1\n"), "Not enough clauses"));
}

TEST(ParserTest, HugeDeclaredClauseCountIsNotPreallocated) {
    EXPECT_EQ(parseErrorOf("p cnf 1 2000000000\n1 0\n"), "Not enough clauses: expected 2000000000, got 1");
}

TEST(ParserTest, TooManyClauses) {
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 1\n1 0\n2 0\n"), "Too many clauses"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 1\n1 0\n2\n"), "Too many clauses"));
    EXPECT_TRUE(startsWith(parseErrorOf("p cnf 2 0\n1 0\n"), "Too many clauses"));
}

TEST(ParserTest, EmptyClauseSet) {
    Formula formula = parseDimacs("p cnf 2 0\n");
    EXPECT_TRUE(formula.clauses.empty());
    EXPECT_EQ(formula.remainingCount, 0u);
    EXPECT_EQ(formula.variableCount(), 2u);
}

TEST(ParserTest, EmptyClause) {
    Formula formula = parseDimacs("p cnf 1 2\n1 0\n0\n");
    EXPECT_EQ(formula.clauses.size(), 2u);
    EXPECT_TRUE(formula.clauses[1].empty());
    EXPECT_TRUE(formula.contradiction);
}
