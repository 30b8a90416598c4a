#pragma once

#include <algorithm>
#include <limits>
#include <Eigen/Dense>
#include <boost/numeric/ublas/vector.hpp>
#include <boost/numeric/ublas/matrix.hpp>
#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <vector>
#include <map>
#include <set>
#include <memory>
#include <mutex>
#include <string>
#include <yaml-cpp/yaml.h>

class WorkerPool;

// Just gives the prefix option for free.
class Printable
{
public:
  virtual ~Printable() {}

  virtual std::string _str() const = 0;
  std::string str(const std::string& prefix="") const
  {
    std::istringstream iss(_str());
    std::ostringstream oss;
    for (std::string line; std::getline(iss, line); )
      oss << prefix << line + "\n";

    // Remove trailing newline.
    std::string result = oss.str();
    if (result.size() >= 2)
      result.erase(std::remove(result.end() - 2, result.end(), '\n'), result.cend());
    return result;
  }
};

// Bad network, dataset or options.  Only ever thrown while a problem is being built.
class ConfigError : public std::runtime_error
{
public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

// Out-of-bounds decision vector under BoundsPolicy::Reject.
class ConstraintViolation : public std::domain_error
{
public:
  explicit ConstraintViolation(const std::string& msg) : std::domain_error(msg) {}
};

void configAssert(bool flag, const std::string& msg);

enum class PerturbationMode { Independent, Compounding };
enum class PerturbationTarget { Decay, Vmax };
enum class BoundsPolicy { Reject, Clamp };

PerturbationMode parsePerturbationMode(const std::string& name);
PerturbationTarget parsePerturbationTarget(const std::string& name);
BoundsPolicy parseBoundsPolicy(const std::string& name);
std::string modeName(PerturbationMode mode);
std::string targetName(PerturbationTarget target);
std::string policyName(BoundsPolicy policy);

// Which entries of the n x n reaction matrix are free parameters.
// active_(i, j) means node j regulates node i.  Reactions are numbered in row-major order.
class InteractionMask
{
public:
  typedef Eigen::Array<bool, Eigen::Dynamic, Eigen::Dynamic> BoolArray;
  typedef Eigen::Array<bool, Eigen::Dynamic, 1> BoolVector;

  BoolArray active_;

  InteractionMask(int num_nodes = 0);
  InteractionMask(const BoolArray& active);
  static InteractionMask fromFlattened(const BoolVector& flat, int num_nodes);

  int numNodes() const { return active_.rows(); }
  int numActive() const { return active_.count(); }
  bool active(int row, int col) const { return active_(row, col); }
  void set(int row, int col, bool value) { active_(row, col) = value; }
  // (row, col) of the reaction_idx'th active entry.
  std::pair<int, int> position(int reaction_idx) const;
  BoolVector flattened() const;

  // Writes strengths into the active entries of *scratch and zeros everything else.
  const Eigen::MatrixXd& decode(const Eigen::VectorXd& strengths, Eigen::MatrixXd* scratch) const;
  Eigen::VectorXd encode(const Eigen::MatrixXd& reactions) const;
};

// Named transcription factors plus the mask of who regulates whom.
class ReactionNetwork : public Printable
{
public:
  // regulator name -> names of the nodes it regulates
  typedef std::map<std::string, std::set<std::string>> Edges;

  std::vector<std::string> names_;  // sorted; position is the node id
  InteractionMask mask_;

  // With correction, a node that nobody regulates is given every node (itself included) as regulator.
  ReactionNetwork(const Edges& edges, bool correction = true);
  ReactionNetwork(const YAML::Node& yaml, bool correction = true);
  ReactionNetwork(const std::vector<std::string>& names, const InteractionMask& mask);

  int numNodes() const { return names_.size(); }
  int numReactions() const { return mask_.numActive(); }
  int nodeIdx(const std::string& name) const;
  const std::string& nodeName(int idx) const { return names_[idx]; }
  std::vector<int> regulators(int idx) const;
  ReactionNetwork withoutReaction(int reaction_idx) const;
  std::string _str() const;

private:
  void build(const Edges& edges, bool correction);
};

// Decoded decision vector: n decay rates, n saturation maxima, m reaction strengths.
// A value object.  Perturbations produce modified copies.
class ModelParameters : public Printable
{
public:
  Eigen::ArrayXd lambda_;
  Eigen::ArrayXd vmax_;
  Eigen::VectorXd strengths_;
  Eigen::MatrixXd reactions_;  // K, decoded from strengths_ through the mask

  ModelParameters(const InteractionMask& mask, const Eigen::VectorXd& x);

  int numNodes() const { return lambda_.size(); }
  int dimension() const { return 2 * lambda_.size() + strengths_.size(); }
  Eigen::VectorXd toVector() const;
  ModelParameters perturbed(PerturbationTarget target, int factor, double multiplier) const;
  // n x (2 + n): [lambda | vmax | K]
  Eigen::MatrixXd solutionMatrix() const;
  std::string _str() const;
};

typedef boost::numeric::ublas::vector<double> OdeState;
typedef boost::numeric::ublas::matrix<double> OdeJacobian;

// dx_i/dt = -lambda_i x_i + vmax_i / (1 + exp(-sum_j K_ij x_j))
// exp() overflow gives an infinite denominator, i.e. zero production.  This is not an error.
class RegulatoryOde
{
public:
  RegulatoryOde(const ModelParameters& params);

  void derivative(const double* x, double* dxdt);
  void jacobian(const double* x, OdeJacobian& jac);
  Eigen::VectorXd derivative(const Eigen::VectorXd& x);

private:
  const ModelParameters& params_;
  Eigen::VectorXd drive_;  // K x, reused between calls
  Eigen::ArrayXd production_;
};

class Integrator
{
public:
  typedef std::shared_ptr<Integrator> Ptr;
  typedef std::shared_ptr<const Integrator> ConstPtr;

  virtual ~Integrator() {}
  // One row per entry of times.  Row 0 is y0 at times[0].  times must be ascending.
  virtual Eigen::ArrayXXd integrate(const ModelParameters& params, const Eigen::VectorXd& y0,
                                    const Eigen::VectorXd& times) const = 0;
};

// Rosenbrock4 dense output with the analytic Jacobian.
// If the solver takes more than max_steps_ internal steps in one call, cannot find a step size, or the
// state leaves [-kStateLimit, kStateLimit], the remaining rows repeat the last state that was recorded.
class RosenbrockIntegrator : public Integrator
{
public:
  static constexpr double kStateLimit = 1e50;

  double abs_tol_;
  double rel_tol_;
  int max_steps_;
  bool verbose_;

  RosenbrockIntegrator(double abs_tol = 1e-8, double rel_tol = 1e-6, int max_steps = 100000000,
                       bool verbose = false);
  Eigen::ArrayXXd integrate(const ModelParameters& params, const Eigen::VectorXd& y0,
                            const Eigen::VectorXd& times) const;
};

// k x (k + w).  Columns [0, k) are perturbation magnitudes, diagonal is the perturbation applied
// to factor i, the rest of row i is the time sequence used for factor i.
class PerturbationDataset : public Printable
{
public:
  typedef std::shared_ptr<PerturbationDataset> Ptr;
  typedef std::shared_ptr<const PerturbationDataset> ConstPtr;

  Eigen::MatrixXd table_;

  PerturbationDataset(const Eigen::MatrixXd& table, int num_nodes);

  int numFactors() const { return table_.rows(); }
  int numTimes() const { return table_.cols() - table_.rows(); }
  Eigen::MatrixXd magnitudes() const { return table_.leftCols(numFactors()); }
  Eigen::VectorXd times(int factor) const { return table_.row(factor).tail(numTimes()).transpose(); }
  // Diagonal magnitudes are relative changes, so zero means unperturbed.
  double multiplier(int factor) const { return 1.0 + table_(factor, factor); }
  std::string _str() const;
};

// Measured time courses for the non-perturbation part of the fit.
class TimeSeriesData : public Printable
{
public:
  typedef std::shared_ptr<TimeSeriesData> Ptr;
  typedef std::shared_ptr<const TimeSeriesData> ConstPtr;

  Eigen::VectorXd times_;
  Eigen::ArrayXXd mean_;   // num times x n
  Eigen::ArrayXd sigma_;   // n

  TimeSeriesData(const Eigen::VectorXd& times, const Eigen::ArrayXXd& mean, const Eigen::ArrayXd& sigma);
  // Mean over replicates; sigma is the time-averaged unbiased standard deviation of each node.
  static TimeSeriesData fromReplicates(const Eigen::VectorXd& times, const std::vector<Eigen::ArrayXXd>& replicates);

  int numNodes() const { return mean_.cols(); }
  // sum((mean - trajectory / colwise max)^2 / sigma^2)
  double cost(const Eigen::ArrayXXd& trajectory) const;
  std::string _str() const;
};

class EvaluationOptions
{
public:
  PerturbationMode mode_;
  PerturbationTarget target_;
  BoundsPolicy bounds_policy_;
  bool parallel_;
  int num_workers_;
  int max_steps_;
  double abs_tol_;
  double rel_tol_;
  double perturbation_factor_;
  bool verbose_;

  EvaluationOptions();
  EvaluationOptions(const YAML::Node& yaml);
  std::string str() const;
};

// Control trajectories of one evaluation, keyed by the exact contents of the time sequence.
class BaselineCache
{
public:
  typedef std::vector<uint64_t> Key;

  static Key key(const Eigen::VectorXd& times);
  const Eigen::ArrayXXd* find(const Eigen::VectorXd& times) const;
  const Eigen::ArrayXXd& insert(const Eigen::VectorXd& times, const Eigen::ArrayXXd& trajectory);
  size_t size() const { return entries_.size(); }

private:
  std::map<Key, Eigen::ArrayXXd> entries_;
};

// Cost of a parameter set against perturbation data.
class PerturbationEvaluator
{
public:
  typedef std::shared_ptr<PerturbationEvaluator> Ptr;
  typedef std::shared_ptr<const PerturbationEvaluator> ConstPtr;

  static constexpr double kResponseClip = 2.0;

  virtual ~PerturbationEvaluator() {}
  virtual double cost(const ModelParameters& params) const = 0;

  // ratio - 1, with values above kResponseClip (+inf included) and NaN set to kResponseClip.
  // -inf and large negative values are kept.  Row-major over the k x k block.
  static Eigen::VectorXd responseResiduals(const Eigen::ArrayXXd& ratios);
  // Least-squares residual sum of the residual column against the flattened magnitudes.
  // Infinite if any residual is -inf.
  static double reduceResponses(const Eigen::ArrayXXd& ratios, const Eigen::MatrixXd& magnitudes);
  // Final-time perturbed / control for the first num_factors nodes.
  static Eigen::ArrayXd finalRatio(const Eigen::ArrayXXd& treated, const Eigen::ArrayXXd& control, int num_factors);
};

class SequentialEvaluator : public PerturbationEvaluator
{
public:
  Eigen::VectorXd y0_;
  PerturbationDataset::ConstPtr dataset_;
  Integrator::ConstPtr integrator_;
  PerturbationMode mode_;
  PerturbationTarget target_;

  SequentialEvaluator(const Eigen::VectorXd& y0, PerturbationDataset::ConstPtr dataset,
                      Integrator::ConstPtr integrator,
                      PerturbationMode mode = PerturbationMode::Independent,
                      PerturbationTarget target = PerturbationTarget::Decay);

  double cost(const ModelParameters& params) const;
  // k x k final-time ratios, one row per perturbed factor.
  Eigen::ArrayXXd responses(const ModelParameters& params) const;
  // Row of responses() for one factor, perturbing an unmodified copy of params.
  Eigen::ArrayXd factorResponse(const ModelParameters& params, int factor) const;
};

// Fans factors out to a long-lived pool of workers.  Always uses independent perturbations.
// Calls are serialized; use one instance per optimizer thread for concurrency.
class ParallelEvaluator : public PerturbationEvaluator
{
public:
  ParallelEvaluator(const InteractionMask& mask, const SequentialEvaluator& prototype, int num_workers);
  ~ParallelEvaluator();

  double cost(const ModelParameters& params) const;
  Eigen::ArrayXXd responses(const ModelParameters& params) const;
  int numWorkers() const;

private:
  PerturbationDataset::ConstPtr dataset_;
  std::unique_ptr<WorkerPool> pool_;
  mutable std::mutex mutex_;
};

// What the optimizer sees: dimension, bounds, evaluate().
class CoreProblem : public Printable
{
public:
  typedef std::shared_ptr<CoreProblem> Ptr;
  typedef std::shared_ptr<const CoreProblem> ConstPtr;

  static constexpr double kPenaltyCost = std::numeric_limits<double>::max();

  ReactionNetwork network_;
  Eigen::VectorXd y0_;
  EvaluationOptions options_;
  PerturbationDataset::ConstPtr perturbations_;
  TimeSeriesData::ConstPtr time_series_;
  Integrator::ConstPtr integrator_;
  PerturbationEvaluator::Ptr evaluator_;
  Eigen::VectorXd lower_;
  Eigen::VectorXd upper_;

  // integrator defaults to a RosenbrockIntegrator configured from options.
  CoreProblem(const ReactionNetwork& network, const Eigen::VectorXd& y0,
              PerturbationDataset::ConstPtr perturbations, TimeSeriesData::ConstPtr time_series,
              const EvaluationOptions& options = EvaluationOptions(),
              Integrator::ConstPtr integrator = Integrator::ConstPtr());

  static Ptr loadConfig(const std::string& path);
  static Ptr loadConfig(const YAML::Node& yaml);

  int dimension() const { return 2 * network_.numNodes() + network_.numReactions(); }
  // lambda and vmax in [0, 20], reaction strengths in [-20, 20] by default.
  void setDefaultBounds(double lambda_lo = 0, double lambda_hi = 20, double vmax_lo = 0, double vmax_hi = 20,
                        double k_lo = -20, double k_hi = 20);
  void setBounds(const Eigen::VectorXd& lower, const Eigen::VectorXd& upper);
  bool feasible(const Eigen::VectorXd& x) const;

  double evaluate(const Eigen::VectorXd& x) const;
  ModelParameters decode(const Eigen::VectorXd& x) const;
  double perturbationCost(const ModelParameters& params) const;
  double timeSeriesCost(const ModelParameters& params) const;

  std::string formatSolution(const Eigen::VectorXd& x) const;
  std::string _str() const;
};

// Drops the reaction with the smallest |strength| (first one on ties) from both network and vector.
struct PrunedModel
{
  ReactionNetwork network_;
  Eigen::VectorXd x_;
  int removed_row_;
  int removed_col_;
};

PrunedModel removeLowestReaction(const ReactionNetwork& network, const Eigen::VectorXd& x);
