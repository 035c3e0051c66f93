#pragma once

#include "../common/utils.h"

// --------------------- Literals / Clauses -----------------------------------------

/// A Variable ID in [0, variable count)
/// DIMACS variable N has the ID N - 1
using VariableID = uint32_t;
/// A DIMACS Literal in (-max_int, max_int), 0 terminates a clause
/// -N = NOT N
using LiteralID = int;
/// Index of a Clause in the Formula's clause arena
using ClauseID = uint32_t;

/// A Variable with a polarity, e.g. p or !q
struct Literal {
    VariableID id = 0;
    bool negated = false;

    /// Converts a DIMACS literal (3, -42) to a Literal (ids 2 and 41)
    static Literal fromDimacs(LiteralID literal) {
        return Literal { .id = (VariableID) std::abs(literal) - 1, .negated = literal < 0 };
    }

    static Literal positive(VariableID id) { return Literal { .id = id, .negated = false }; }

    LiteralID toDimacs() const {
        LiteralID variable = (LiteralID) id + 1;
        return negated ? -variable : variable;
    }

    Literal operator!() const { return Literal { .id = id, .negated = !negated }; }

    bool operator==(const Literal& other) const = default;
};

inline std::ostream& operator<<(std::ostream& os, const Literal& literal) {
    return os << literal.toDimacs();
}

/// A disjunction of Literals, never contains both p and !p
class Clause {
public:
    std::vector<Literal> literals;

    bool contains(Literal literal) const {
        return std::find(literals.begin(), literals.end(), literal) != literals.end();
    }

    size_t size() const { return literals.size(); }
    bool empty() const { return literals.empty(); }
};

inline std::ostream& operator<<(std::ostream& os, const Clause& clause) {
    os << "(";
    for (const auto& literal: clause.literals) {
        os << literal << ", ";
    }
    os << ")";
    return os;
}
