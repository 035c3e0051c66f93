#pragma once

#include "./literal.h"

enum VariableState : uint8_t {
    UNASSIGNED = 0,
    ASSIGNED_TRUE = 1,
    ASSIGNED_FALSE = 2,
};

/// The current value of every Variable
class Assignment {
public:
    explicit Assignment(size_t variableCount):
        states(variableCount, VariableState::UNASSIGNED) {}

    /// Assigns the Variable so that the Literal becomes true.
    /// The Variable must not be assigned yet
    void assign(Literal literal) {
        DEV_ASSURE(!isAssigned(literal.id), "Double assignment of " << literal);
        states[literal.id] = literal.negated ? VariableState::ASSIGNED_FALSE : VariableState::ASSIGNED_TRUE;
    }

    void unassign(Literal literal) {
        states[literal.id] = VariableState::UNASSIGNED;
    }

    bool isAssigned(VariableID id) const {
        return states[id] != VariableState::UNASSIGNED;
    }

    /// Whether the Variable is assigned to the polarity the Literal represents
    bool isSatisfied(Literal literal) const {
        return states[literal.id] == (literal.negated ? VariableState::ASSIGNED_FALSE : VariableState::ASSIGNED_TRUE);
    }

    /// Whether the Variable is assigned to the opposite polarity
    bool isFalsified(Literal literal) const {
        return isSatisfied(!literal);
    }

    VariableState state(VariableID id) const { return states[id]; }
    size_t size() const { return states.size(); }

    /// Assigns all remaining unassigned Variables to true
    void complete();

    /// Prints the assignment in DIMACS syntax, e.g. "1 -2 3 0"
    /// Unassigned variables are left out
    void print(std::ostream& out) const;

    bool operator==(const Assignment& other) const = default;

private:
    std::vector<VariableState> states;
};

inline std::ostream& operator<<(std::ostream& os, const Assignment& assignment) {
    assignment.print(os);
    return os;
}
