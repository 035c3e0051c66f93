#pragma once

#include <stdexcept>
#include <string_view>

#include "./formula.h"

// --------------------- File Parsing -----------------------------------------

/// Malformed DIMACS input
class ParseError: public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Reads a DIMACS CNF file, the resulting Formula is built by formula()
class FileParser {
public:
    /// Parses the whole stream, throws ParseError on malformed input
    explicit FileParser(std::istream& in);

    /// Builds the Formula from the parsed clauses
    Formula formula() const;

    uint32_t variableCount = 0;
    uint32_t clauseCount = 0;

    std::vector<std::vector<LiteralID>> rawClauses;

private:
    void parseProblemLine(std::istream& in);
    void parseClauses(std::istream& in);
    void addLiteral(std::string_view token);

    std::vector<LiteralID> currentLiterals;
};

/// Parses DIMACS text into a Formula
Formula parseDimacs(std::istream& in);
Formula parseDimacs(std::string_view text);
