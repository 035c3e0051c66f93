#pragma once

extern "C" {
#include <kissat.h>
}

#include "./generate.h"

/// Reference backend, solves with Kissat via IPASIR
class KISSATProblem {
public:
    KISSATProblem() {
        DEV_PRINT("Initializing Kissat");
        instance = kissat_init();
        DEV_PRINT("Initializing Kissat done");
    }

    ~KISSATProblem() { kissat_release(instance); }

    KISSATProblem(const KISSATProblem&) = delete;
    KISSATProblem& operator=(const KISSATProblem&) = delete;

    void add_header(uint32_t variable_count, uint32_t clause_count) {
    }

    void add_one_literal(int lit) {
        DEV_ASSURE(lit != 0, "");
        DEV_PRINT("Add Literal " << lit);
        kissat_add(instance, lit);
    }

    void end_clause() {
        DEV_PRINT("End Clause");
        kissat_add(instance, 0);
    }

    Result solve() {
        DEV_PRINT("Solve ");
        return Result(kissat_solve(instance));
    }

    void clear() {
        kissat_release(instance);
        instance = kissat_init();
    }

    bool get_assignment(int lit) {
        DEV_ASSURE(lit != 0, "");
        return kissat_value(instance, lit) > 0;
    }

private:
    kissat* instance;
};
