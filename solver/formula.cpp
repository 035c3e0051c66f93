#include "./formula.h"

#include <stdexcept>

// --------------------- Construction -----------------------------------------

Formula::Formula(uint32_t variableCount, const std::vector<std::vector<LiteralID>>& rawClauses):
    assignment(variableCount), reverseIndex(variableCount) {
    clauses.reserve(rawClauses.size());
    for (const auto& rawLiterals: rawClauses) {
        addClause(rawLiterals);
    }

    satisfied.assign(clauses.size(), false);
    remainingCount = clauses.size();
    contradiction = hasEmptyClause;
}

void Formula::addClause(const std::vector<LiteralID>& rawLiterals) {
    Clause clause;
    for (LiteralID rawLiteral: rawLiterals) {
        ASSURE_OR_THROW(rawLiteral != 0, std::invalid_argument, "Literal 0 inside a clause");
        ASSURE_OR_THROW(std::abs((int64_t) rawLiteral) <= (int64_t) variableCount(), std::invalid_argument,
            "Literal " << rawLiteral << " exceeds variable count " << variableCount());

        Literal literal = Literal::fromDimacs(rawLiteral);
        // Tautology: (a v -a) = T
        if (clause.contains(!literal)) {
            DEV_PRINT("Tautology clause " << clause << " " << literal);
            droppedTautologies++;
            return;
        }
        if (!clause.contains(literal))
            clause.literals.push_back(literal);
    }

    ClauseID clauseID = clauses.size();
    for (Literal literal: clause.literals) {
        reverseIndex[literal.id].push_back(Occurrence { .clause = clauseID, .negated = literal.negated });
    }

    if (clause.empty()) {
        DEV_PRINT("Empty clause C" << clauseID);
        hasEmptyClause = true;
    }

    clauses.push_back(std::move(clause));
}

// --------------------- Assignment / Propagation -----------------------------------------

void Formula::assign(Literal decision) {
    DEV_PRINT("Decide " << decision);
    perf.decisions++;

    // Propagation only reaches Variables above the decision, everything below is assigned
    searchCursor = decision.id + 1;

    undoLog.emplace_back();
    enqueue(decision);

    // The undo group doubles as the propagation queue
    for (size_t head = 0; head < undoLog.back().size(); head++) {
        propagate(undoLog.back()[head]);
        if (contradiction) {
            perf.conflicts++;
            break;
        }
    }
}

void Formula::enqueue(Literal literal) {
    assignment.assign(literal);
    undoLog.back().push_back(literal);
}

void Formula::propagate(Literal literal) {
    for (const auto& [clauseID, negated]: reverseIndex[literal.id]) {
        // Skip clauses that are already satisfied (= speedup through caching)
        if (satisfied[clauseID]) continue;

        if (negated == literal.negated) {
            DEV_PRINT("C" << clauseID << " sat by L" << literal);
            satisfied[clauseID] = true;
            remainingCount--;
            continue;
        }

        Literal unit;
        switch (visitClause(clauseID, unit)) {
        case ClauseStatus::VIOLATED:
            DEV_PRINT("Conflict C" << clauseID << " = " << clauses[clauseID]);
            contradiction = true;
            return;
        case ClauseStatus::UNIT:
            DEV_PRINT("C" << clauseID << " unit " << unit);
            perf.unitProps++;
            enqueue(unit);
            break;
        case ClauseStatus::SATISFIED:
        case ClauseStatus::UNRESOLVED:
            break;
        }
    }
}

ClauseStatus Formula::visitClause(ClauseID id, Literal& unit) const {
    size_t unassignedCount = 0;
    for (Literal literal: clauses[id].literals) {
        // True but not yet propagated, the clause gets marked once the literal is processed
        if (assignment.isSatisfied(literal)) return ClauseStatus::SATISFIED;

        if (!assignment.isAssigned(literal.id)) {
            unassignedCount++;
            unit = literal;
        }
    }

    if (unassignedCount == 0) return ClauseStatus::VIOLATED;
    if (unassignedCount == 1) return ClauseStatus::UNIT;
    return ClauseStatus::UNRESOLVED;
}

void Formula::unassign(Literal decision) {
    DEV_ASSURE(!undoLog.empty(), "Empty undo log");
    DEV_ASSURE(undoLog.back().front() == decision, "Wrong unassign " << undoLog.back().front() << " != " << decision);
    DEV_PRINT("Undo " << decision << " (" << undoLog.back().size() << " literals)");

    std::vector<Literal> group = std::move(undoLog.back());
    undoLog.pop_back();

    for (auto it = group.rbegin(); it != group.rend(); ++it) {
        Literal literal = *it;
        assignment.unassign(literal);

        for (const auto& [clauseID, negated]: reverseIndex[literal.id]) {
            if (negated != literal.negated || !satisfied[clauseID]) continue;

            // Another Literal might still satisfy the clause
            if (!isSatisfied(clauseID)) {
                satisfied[clauseID] = false;
                remainingCount++;
            }
        }
    }

    contradiction = hasEmptyClause;
    searchCursor = decision.id;
}

bool Formula::isSatisfied(ClauseID id) const {
    for (Literal literal: clauses[id].literals) {
        if (assignment.isSatisfied(literal)) return true;
    }
    return false;
}

// --------------------- DPLL -----------------------------------------

bool Formula::search() {
    DEV_ONLY(consistencyCheck());

    if (remainingCount == 0) return true;
    if (contradiction) return false;

    Literal next = nextUnassigned();

    assign(next);
    if (search()) return true;
    unassign(next);

    perf.backtracks++;
    assign(!next);
    if (search()) return true;
    unassign(!next);

    return false;
}

Literal Formula::nextUnassigned() const {
    for (VariableID id = searchCursor; id < variableCount(); id++) {
        if (!assignment.isAssigned(id))
            return Literal::positive(id);
    }

    // Undecided Formulas always have an unassigned Variable left
    UNREACHABLE;
    return Literal {};
}

std::optional<Assignment> Formula::solve() {
    if (!search()) return std::nullopt;

    Assignment result = assignment;
    result.complete();
    return result;
}

// --------------------- Diagnostics -----------------------------------------

void Formula::print(std::ostream& out) const {
    out << "CLAUSES:\n";
    for (ClauseID id = 0; id < clauses.size(); id++) {
        out << "C" << id << (satisfied[id] ? " (sat)" : "") << " -> " << clauses[id] << "\n";
    }

    out << "VARIABLES:\n";
    for (VariableID id = 0; id < variableCount(); id++) {
        switch (assignment.state(id)) {
        case VariableState::ASSIGNED_TRUE: out << id + 1 << " T -> ("; break;
        case VariableState::ASSIGNED_FALSE: out << id + 1 << " F -> ("; break;
        case VariableState::UNASSIGNED: out << id + 1 << " ? -> ("; break;
        }

        for (const auto& [clauseID, negated]: reverseIndex[id]) {
            out << (negated ? "-C" : "+C") << clauseID << ", ";
        }
        out << ")\n";
    }
}

void Formula::printClauses(std::ostream& out) const {
    for (ClauseID id = 0; id < clauses.size(); id++) {
        if (satisfied[id]) continue;

        out << "C" << id << " not satisfied:\n";
        for (Literal literal: clauses[id].literals) {
            out << literal;
            if (assignment.isAssigned(literal.id)) {
                out << "=" << (assignment.isSatisfied(literal) ? "T" : "F");
            }
            out << ", ";
        }
        out << "\n";
    }
}

void Formula::consistencyCheck() const {
    ASSURE(satisfied.size() == clauses.size(), "Inconsistent satisfied flags");

    size_t unsatisfiedCount = 0;
    for (ClauseID id = 0; id < clauses.size(); id++) {
        if (!satisfied[id]) unsatisfiedCount++;
        // With a contradiction propagation stopped early, so true literals may be unmarked
        if (!contradiction) {
            ASSURE(satisfied[id] == isSatisfied(id), "Inconsistent satisfied flag C" << id);
        } else if (satisfied[id]) {
            ASSURE(isSatisfied(id), "Inconsistent satisfied flag C" << id);
        }

        for (Literal literal: clauses[id].literals) {
            const auto& occurrences = reverseIndex[literal.id];
            bool indexed = std::any_of(occurrences.begin(), occurrences.end(), [&](const Occurrence& occurrence) {
                return occurrence.clause == id && occurrence.negated == literal.negated;
            });
            ASSURE(indexed, "Inconsistent reverse index C" << id << " " << literal);
        }
    }
    ASSURE(remainingCount == unsatisfiedCount, "Inconsistent remaining count " << remainingCount << " != " << unsatisfiedCount);

    for (VariableID id = 0; id < variableCount(); id++) {
        for (const auto& [clauseID, negated]: reverseIndex[id]) {
            ASSURE(clauseID < clauses.size(), "Lost clause " << clauseID);
            ASSURE(clauses[clauseID].contains(Literal { .id = id, .negated = negated }), "Inconsistent reverse index " << id + 1);
        }
    }

    for (VariableID id = 0; id < searchCursor && id < variableCount(); id++) {
        ASSURE(assignment.isAssigned(id), "Unassigned variable " << id + 1 << " below cursor " << searchCursor);
    }
}
