// DPLL SAT Solver, implements backtracking search with Unit Propagation

#include "common/utils.h"
#include "solver/parser.h"

#define SOLUTION_FOUND(assignment) \
  std::cerr << "\n\nSolution Found after " << duration() << ":\n"; \
  std::cout << assignment << "\n"; \
  exit(0);

#define NO_SOLUTION(details) { std::cerr << "\n\nNo Solution possible after " << duration() << ": " << details << "\n"; std::cout << "UNSAT\n"; exit(1); }

#define INPUT_ERROR(details) { std::cerr << "Invalid input: " << details << "\n"; exit(2); }

// --------------------- MAIN -----------------------------------------

int main(int argc, char* argv[]) {
    std::cerr << "DPLL SAT Solver\n";

    if (argc > 2) INPUT_ERROR("Usage: ./dpll <file?>");

    std::optional<Formula> formula;
    try {
        if (argc == 2) {
            char* filename = argv[1];

            std::fstream fs;
            fs.open(filename, std::fstream::in);
            if (!fs.is_open()) INPUT_ERROR("Cannot open '" << filename << "'");

            formula.emplace(parseDimacs(fs));
        } else {
            formula.emplace(parseDimacs(std::cin));
        }
    } catch (const ParseError& error) {
        INPUT_ERROR(error.what());
    }

    PRINT("Parsed " << formula->variableCount() << " variables, " << formula->clauses.size() << " clauses ("
        << formula->droppedTautologies << " tautologies dropped) in " << duration());

    // Exclude file parsing time from measurements to make them more stable
    restartTime();

    DEV_ONLY(formula->print(std::cerr));

    auto solution = formula->solve();

    PRINT("DPLL: " << formula->perf);
    DEV_ONLY(formula->print(std::cerr));

    if (!solution) NO_SOLUTION("Search exhausted");

    SOLUTION_FOUND(*solution);
}
