#pragma once

#include <optional>

#include "./utils.h"
#include "../solver/formula.h"

#define negate(var) -(int)(var)

enum Result {
    SAT = 10,
    UNSAT = 20,
    TERMINATE = 0
};

template<typename Base>
class ProblemBase: public Base {
public:
    using Base::Base;

    template<typename ...Types>
    void add_literal(int lit, Types... literals) {
        this->add_one_literal(lit);
        if constexpr (sizeof...(literals) > 0)
            this->add_literal(literals...);
    }

    template<typename ...Types>
    void add_clause(Types... literals) {
        DEV_PRINT("add clause");
        this->add_literal(literals...);
        this->end_clause();
    }
};

/// Collects clauses, the variable count grows with the literals seen
class ClauseCollector {
public:
    /// The clause count is only a hint, the real count is taken from the clauses added
    void add_header(uint32_t variable_count, uint32_t clause_count) {
        variableCount = std::max(variableCount, variable_count);
    }

    void add_one_literal(int lit) {
        DEV_ASSURE(lit != 0, "");
        variableCount = std::max(variableCount, (uint32_t) std::abs(lit));
        current.push_back(lit);
    }

    void end_clause() {
        clauses.push_back(std::move(current));
        current.clear();
    }

    void clear() {
        variableCount = 0;
        clauses.clear();
        current.clear();
    }

protected:
    uint32_t variableCount = 0;
    std::vector<std::vector<LiteralID>> clauses;
    std::vector<LiteralID> current;
};

/// Writes the problem as a DIMACS CNF file
class DIMACSProblem: public ClauseCollector {
public:
    explicit DIMACSProblem(std::ostream& out = std::cout): out(out) {}

    /// Emits the header with the real counts followed by the clauses
    Result solve() {
        out << "p cnf " << variableCount << " " << clauses.size() << "\n";
        for (const auto& clause: clauses) {
            for (LiteralID lit: clause) out << lit << " ";
            out << "0\n";
        }
        out.flush();
        return Result::TERMINATE;
    }

    bool get_assignment(int lit) {
        UNREACHABLE;
        return false;
    }

private:
    std::ostream& out;
};

/// Solves the problem in-process with the DPLL Formula
class DPLLProblem: public ClauseCollector {
public:
    Result solve() {
        Formula formula(variableCount, clauses);
        model = formula.solve();
        perf = formula.perf;
        return model ? Result::SAT : Result::UNSAT;
    }

    void clear() {
        ClauseCollector::clear();
        model.reset();
    }

    bool get_assignment(int lit) {
        DEV_ASSURE(lit != 0, "");
        ASSURE(model.has_value(), "No model, solve() did not return SAT");
        return model->isSatisfied(Literal::fromDimacs(lit));
    }

    Formula::PerfCounters perf;

private:
    std::optional<Assignment> model;
};
