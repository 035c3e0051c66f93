#include "./parser.h"

#include <charconv>
#include <limits>

namespace {

/// Parses a whole token as a number, ec is set for garbage and for overflow
template<typename Number>
std::errc parseNumber(std::string_view token, Number& value) {
    const char* end = token.data() + token.size();
    auto [ptr, ec] = std::from_chars(token.data(), end, value);
    if (ec == std::errc() && ptr != end) return std::errc::invalid_argument;
    return ec;
}

/// Problem line parameters, bounded by the largest representable DIMACS literal
uint32_t parseCount(std::string_view token, const char* name) {
    uint32_t value = 0;
    std::errc ec = parseNumber(token, value);
    ASSURE_OR_THROW(ec != std::errc::invalid_argument, ParseError,
        name << " problem line parameter invalid: '" << token << "'");
    ASSURE_OR_THROW(ec == std::errc() && value <= (uint32_t) std::numeric_limits<LiteralID>::max(), ParseError,
        name << " problem line parameter out of range: '" << token << "'");
    return value;
}

}

FileParser::FileParser(std::istream& in) {
    parseProblemLine(in);
    parseClauses(in);
    ASSURE_OR_THROW(!in.bad(), ParseError, "Error while reading input");
}

void FileParser::parseProblemLine(std::istream& in) {
    std::string line;
    while (true) {
        ASSURE_OR_THROW(std::getline(in, line), ParseError, "Missing problem line");

        // Skip comment line
        if (!line.empty() && line[0] == 'c') continue;
        if (line.find_first_not_of(" \t\r") == std::string::npos) continue;
        break;
    }

    std::istringstream params(line);
    std::vector<std::string> tokens;
    for (std::string token; params >> token;) {
        tokens.push_back(token);
    }

    ASSURE_OR_THROW(tokens.size() == 4, ParseError,
        "Wrong number of parameters in problem line: expected 4, got " << tokens.size());
    ASSURE_OR_THROW(tokens[0] == "p", ParseError, "Invalid problem line: '" << line << "'");
    ASSURE_OR_THROW(tokens[1] == "cnf", ParseError, "Only cnf-formatted inputs are supported, got '" << tokens[1] << "'");

    variableCount = parseCount(tokens[2], "Third");
    clauseCount = parseCount(tokens[3], "Fourth");
    DEV_PRINT("Problem line: " << variableCount << " variables, " << clauseCount << " clauses");
}

void FileParser::parseClauses(std::istream& in) {
    for (std::string token; in >> token;) {
        ASSURE_OR_THROW(rawClauses.size() < clauseCount, ParseError,
            "Too many clauses: expected " << clauseCount << ", found more at '" << token << "'");
        addLiteral(token);
    }

    ASSURE_OR_THROW(rawClauses.size() == clauseCount, ParseError,
        "Not enough clauses: expected " << clauseCount << ", got " << rawClauses.size());
}

void FileParser::addLiteral(std::string_view token) {
    if (token == "0") {
        rawClauses.push_back(std::move(currentLiterals));
        currentLiterals.clear();
        return;
    }

    LiteralID literal = 0;
    std::errc ec = parseNumber(token, literal);
    ASSURE_OR_THROW(ec != std::errc::invalid_argument, ParseError, "Illegal variable '" << token << "'");
    ASSURE_OR_THROW(ec == std::errc() && literal != std::numeric_limits<LiteralID>::min()
        && (uint32_t) std::abs(literal) <= variableCount, ParseError,
        "Variable out of range '" << token << "', the problem line declares " << variableCount << " variables");
    // Only the plain "0" terminates a clause, "-0" or "00" are rejected
    ASSURE_OR_THROW(literal != 0, ParseError, "Illegal variable '" << token << "'");

    currentLiterals.push_back(literal);
}

Formula FileParser::formula() const {
    return Formula(variableCount, rawClauses);
}

Formula parseDimacs(std::istream& in) {
    return FileParser(in).formula();
}

Formula parseDimacs(std::string_view text) {
    std::istringstream in { std::string(text) };
    return parseDimacs(in);
}
