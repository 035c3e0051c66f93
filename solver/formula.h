#pragma once

#include <optional>

#include "./assignment.h"

/// Reverse index entry: a Clause mentioning a Variable, and whether it mentions it negated
struct Occurrence {
    ClauseID clause;
    bool negated;
};

/// Result of revisiting a Clause after one of its Literals became false
enum ClauseStatus {
    UNRESOLVED,
    SATISFIED,
    UNIT,
    VIOLATED,
};

/// A set of Clauses together with the live Assignment and the bookkeeping
/// for unit propagation and backtracking.
///
/// Clauses and the reverse index are fixed at construction, afterwards the Formula
/// is only modified through assign() and unassign().
class Formula {
public:
    /// Builds the Formula from DIMACS clauses, dropping tautologies (p v !p)
    Formula(uint32_t variableCount, const std::vector<std::vector<LiteralID>>& rawClauses);

    /// Assigns a decision Literal and everything unit propagation derives from it.
    /// All assignments are recorded as one group on the undo log
    void assign(Literal decision);

    /// Reverts the most recent assign(decision) including all propagated Literals
    void unassign(Literal decision);

    /// The DPLL search, returns true once all clauses are satisfied.
    /// On false the Formula is restored to the state before the call
    bool search();

    /// Runs the search and returns a total assignment if the Formula is satisfiable
    std::optional<Assignment> solve();

    /// Whether some Literal of the Clause is true under the current assignment
    bool isSatisfied(ClauseID id) const;

    size_t variableCount() const { return assignment.size(); }

    /// Prints the Clauses and the reverse index
    void print(std::ostream& out) const;

    /// Prints the Clauses that are not yet satisfied
    void printClauses(std::ostream& out) const;

    /// Checks whether the cached state matches the assignment
    void consistencyCheck() const;

    /// The non-tautological clauses in input order
    std::vector<Clause> clauses;
    /// Cache of Clause satisfaction, parallel to clauses
    std::vector<bool> satisfied;

    Assignment assignment;

    /// Variable -> Clauses that contain the Variable
    std::vector<std::vector<Occurrence>> reverseIndex;

    /// Number of Clauses not yet satisfied
    size_t remainingCount = 0;
    /// Set if some Clause has no unassigned or true Literal left
    bool contradiction = false;
    /// All Variables below the cursor are assigned
    VariableID searchCursor = 0;

    /// One group per decision: The decision followed by the propagated Literals in assignment order
    std::vector<std::vector<Literal>> undoLog;

    /// Number of Clauses dropped during construction as they contain p and !p
    size_t droppedTautologies = 0;

    /// Performance Counters to look into the algorithm
    struct PerfCounters {
        size_t decisions = 0;
        size_t unitProps = 0;
        size_t conflicts = 0;
        size_t backtracks = 0;
    };
    PerfCounters perf;

private:
    void addClause(const std::vector<LiteralID>& rawLiterals);

    /// Assigns the Literal and queues it for propagation in the current undo group
    void enqueue(Literal literal);

    /// Walks the Clauses of an assigned Literal, marks satisfied ones and
    /// queues the Literals of Clauses that became unit
    void propagate(Literal literal);

    /// Recounts a Clause after one of its Literals became false
    ClauseStatus visitClause(ClauseID id, Literal& unit) const;

    /// The lowest unassigned Variable at or above the cursor
    Literal nextUnassigned() const;

    /// Empty input clauses are violated under every assignment
    bool hasEmptyClause = false;
};

inline std::ostream& operator<<(std::ostream& os, const Formula::PerfCounters& perf) {
    os << "decisions: " << perf.decisions
       << ", unit propagations: " << perf.unitProps
       << ", conflicts: " << perf.conflicts
       << ", backtracks: " << perf.backtracks;
    return os;
}
