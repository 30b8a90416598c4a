#include <grnfit.h>
#include <chrono>
#include <iostream>
#include <fmt/core.h>

using std::cout, std::cerr, std::endl;
using Eigen::VectorXd;

int main(int argc, char** argv)
{
  CoreProblem::Ptr problem;
  std::vector<VectorXd> solutions;
  try {
    YAML::Node yaml = YAML::LoadFile("config.yaml");
    problem = CoreProblem::loadConfig(yaml);
    if (yaml["KnownSolutions"]) {
      for (const YAML::Node& sol : yaml["KnownSolutions"]) {
        VectorXd x(sol.size());
        for (size_t i = 0; i < sol.size(); ++i)
          x(i) = sol[i].as<double>();
        solutions.push_back(x);
      }
    }
  }
  catch (const YAML::Exception& e) {
    cerr << "Could not read config.yaml: " << e.what() << endl;
    return 1;
  }
  catch (const ConfigError& e) {
    cerr << "Bad config: " << e.what() << endl;
    return 1;
  }
  cout << problem->str() << endl;

  // Without known solutions, look at the middle of the box.
  if (solutions.empty())
    solutions.push_back((problem->lower_ + problem->upper_) / 2);

  for (size_t i = 0; i < solutions.size(); ++i) {
    const VectorXd& x = solutions[i];
    double cost;
    auto start = std::chrono::high_resolution_clock::now();
    try {
      cost = problem->evaluate(x);
    }
    catch (const std::invalid_argument& e) {
      cerr << fmt::format("Solution {}: {}", i, e.what()) << endl;
      continue;
    }
    catch (const ConstraintViolation& e) {
      cerr << fmt::format("Solution {}: {}", i, e.what()) << endl;
      continue;
    }
    auto end = std::chrono::high_resolution_clock::now();
    double seconds = std::chrono::duration<double>(end - start).count();

    cout << fmt::format("Solution {}: cost {:.6g} ({:.3f} seconds)", i, cost, seconds) << endl;
    cout << problem->formatSolution(x) << endl;

    if (problem->network_.numReactions() > 0) {
      PrunedModel pruned = removeLowestReaction(problem->network_, x);
      cout << fmt::format("  Weakest reaction: {} -> {}",
                          problem->network_.nodeName(pruned.removed_col_),
                          problem->network_.nodeName(pruned.removed_row_)) << endl;
    }
  }

  return 0;
}
