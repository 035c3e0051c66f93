#include "./assignment.h"

void Assignment::complete() {
    for (auto& state: states) {
        if (state == VariableState::UNASSIGNED)
            state = VariableState::ASSIGNED_TRUE;
    }
}

void Assignment::print(std::ostream& out) const {
    for (VariableID id = 0; id < states.size(); id++) {
        if (states[id] == VariableState::UNASSIGNED) continue;

        Literal literal { .id = id, .negated = states[id] == VariableState::ASSIGNED_FALSE };
        out << literal << " ";
    }
    out << "0";
}
