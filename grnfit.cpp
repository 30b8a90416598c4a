#include <grnfit.h>
#include <comms.h>
#include <cmath>
#include <cstring>
#include <iostream>
#include <limits>
#include <thread>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <boost/numeric/odeint.hpp>

using namespace std;
using Eigen::ArrayXd, Eigen::ArrayXXd, Eigen::VectorXd, Eigen::MatrixXd;
namespace odeint = boost::numeric::odeint;

void configAssert(bool flag, const std::string& msg)
{
  if (!flag)
    throw ConfigError(msg);
}

PerturbationMode parsePerturbationMode(const std::string& name)
{
  if (name == "independent")
    return PerturbationMode::Independent;
  else if (name == "compounding")
    return PerturbationMode::Compounding;
  throw ConfigError(fmt::format("Unknown perturbation mode \"{}\", expected independent or compounding.", name));
}

PerturbationTarget parsePerturbationTarget(const std::string& name)
{
  if (name == "decay")
    return PerturbationTarget::Decay;
  else if (name == "vmax")
    return PerturbationTarget::Vmax;
  throw ConfigError(fmt::format("Unknown perturbation target \"{}\", expected decay or vmax.", name));
}

BoundsPolicy parseBoundsPolicy(const std::string& name)
{
  if (name == "reject")
    return BoundsPolicy::Reject;
  else if (name == "clamp")
    return BoundsPolicy::Clamp;
  throw ConfigError(fmt::format("Unknown bounds policy \"{}\", expected reject or clamp.", name));
}

std::string modeName(PerturbationMode mode)
{
  return mode == PerturbationMode::Independent ? "independent" : "compounding";
}

std::string targetName(PerturbationTarget target)
{
  return target == PerturbationTarget::Decay ? "decay" : "vmax";
}

std::string policyName(BoundsPolicy policy)
{
  return policy == BoundsPolicy::Reject ? "reject" : "clamp";
}

static bool isAscending(const VectorXd& times)
{
  for (int i = 1; i < times.size(); ++i)
    if (!(times(i) >= times(i - 1)))
      return false;
  return true;
}

static VectorXd yamlVector(const YAML::Node& yaml, const std::string& what)
{
  configAssert(yaml && yaml.IsSequence(), fmt::format("{} must be a list of numbers.", what));
  VectorXd vec(yaml.size());
  for (size_t i = 0; i < yaml.size(); ++i)
    vec(i) = yaml[i].as<double>();
  return vec;
}

static MatrixXd yamlMatrix(const YAML::Node& yaml, const std::string& what)
{
  configAssert(yaml && yaml.IsSequence() && yaml.size() > 0, fmt::format("{} must be a non-empty list of rows.", what));
  configAssert(yaml[0].IsSequence(), fmt::format("{}: row 0 is not a list.", what));
  MatrixXd mat(yaml.size(), yaml[0].size());
  for (size_t i = 0; i < yaml.size(); ++i) {
    const YAML::Node& row = yaml[i];
    configAssert(row.IsSequence() && row.size() == size_t(mat.cols()),
                 fmt::format("{}: row {} has a different length than row 0 ({}).", what, i, mat.cols()));
    for (size_t j = 0; j < row.size(); ++j)
      mat(i, j) = row[j].as<double>();
  }
  return mat;
}

static std::pair<double, double> yamlRange(const YAML::Node& yaml, const std::string& key,
                                           double lo, double hi)
{
  if (!yaml[key])
    return std::make_pair(lo, hi);
  VectorXd range = yamlVector(yaml[key], "Bounds." + key);
  configAssert(range.size() == 2, fmt::format("Bounds.{} must be [lower, upper].", key));
  return std::make_pair(range(0), range(1));
}


/************************************************************
 * InteractionMask
 ************************************************************/

InteractionMask::InteractionMask(int num_nodes) :
  active_(BoolArray::Constant(num_nodes, num_nodes, false))
{
}

InteractionMask::InteractionMask(const BoolArray& active) :
  active_(active)
{
  if (active_.rows() != active_.cols())
    throw std::invalid_argument(fmt::format("Interaction mask must be square, got {}x{}.", active_.rows(), active_.cols()));
}

InteractionMask InteractionMask::fromFlattened(const BoolVector& flat, int num_nodes)
{
  if (flat.size() != num_nodes * num_nodes)
    throw std::invalid_argument(fmt::format("Flattened mask has {} entries, expected {}.", flat.size(), num_nodes * num_nodes));
  InteractionMask mask(num_nodes);
  for (int i = 0; i < num_nodes; ++i)
    for (int j = 0; j < num_nodes; ++j)
      mask.active_(i, j) = flat(i * num_nodes + j);
  return mask;
}

std::pair<int, int> InteractionMask::position(int reaction_idx) const
{
  int idx = 0;
  for (int i = 0; i < active_.rows(); ++i)
    for (int j = 0; j < active_.cols(); ++j)
      if (active_(i, j)) {
        if (idx == reaction_idx)
          return std::make_pair(i, j);
        ++idx;
      }
  throw std::out_of_range(fmt::format("Reaction {} does not exist, mask has {}.", reaction_idx, numActive()));
}

InteractionMask::BoolVector InteractionMask::flattened() const
{
  int n = numNodes();
  BoolVector flat(n * n);
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < n; ++j)
      flat(i * n + j) = active_(i, j);
  return flat;
}

const Eigen::MatrixXd& InteractionMask::decode(const Eigen::VectorXd& strengths, Eigen::MatrixXd* scratch) const
{
  if (strengths.size() != numActive())
    throw std::invalid_argument(fmt::format("Got {} reaction strengths for a mask with {} reactions.",
                                            strengths.size(), numActive()));
  int n = numNodes();
  if (scratch->rows() != n || scratch->cols() != n)
    scratch->resize(n, n);
  scratch->setZero();

  int idx = 0;
  for (int i = 0; i < n; ++i)
    for (int j = 0; j < n; ++j)
      if (active_(i, j))
        (*scratch)(i, j) = strengths(idx++);
  return *scratch;
}

Eigen::VectorXd InteractionMask::encode(const Eigen::MatrixXd& reactions) const
{
  if (reactions.rows() != numNodes() || reactions.cols() != numNodes())
    throw std::invalid_argument(fmt::format("Reaction matrix is {}x{}, mask is {}x{}.",
                                            reactions.rows(), reactions.cols(), numNodes(), numNodes()));
  VectorXd strengths(numActive());
  int idx = 0;
  for (int i = 0; i < numNodes(); ++i)
    for (int j = 0; j < numNodes(); ++j)
      if (active_(i, j))
        strengths(idx++) = reactions(i, j);
  return strengths;
}


/************************************************************
 * ReactionNetwork
 ************************************************************/

ReactionNetwork::ReactionNetwork(const Edges& edges, bool correction)
{
  build(edges, correction);
}

ReactionNetwork::ReactionNetwork(const YAML::Node& yaml, bool correction)
{
  Edges edges;
  try {
    configAssert(yaml.IsSequence(), "Network must be a list of {name, regulates} entries.");
    for (const YAML::Node& entry : yaml) {
      configAssert(bool(entry["name"]), "Every Network entry needs a name.");
      string name = entry["name"].as<string>();
      set<string>& targets = edges[name];
      if (entry["regulates"])
        for (const YAML::Node& target : entry["regulates"])
          targets.insert(target.as<string>());
    }
  }
  catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("Malformed Network section: {}", e.what()));
  }
  build(edges, correction);
}

ReactionNetwork::ReactionNetwork(const std::vector<std::string>& names, const InteractionMask& mask) :
  names_(names),
  mask_(mask)
{
  configAssert(int(names_.size()) == mask_.numNodes(),
               fmt::format("{} node names for a {}x{} mask.", names_.size(), mask_.numNodes(), mask_.numNodes()));
}

void ReactionNetwork::build(const Edges& edges, bool correction)
{
  set<string> all;
  for (const auto& edge : edges) {
    all.insert(edge.first);
    all.insert(edge.second.begin(), edge.second.end());
  }
  configAssert(!all.empty(), "Network has no nodes.");
  names_.assign(all.begin(), all.end());

  mask_ = InteractionMask(names_.size());
  for (const auto& edge : edges) {
    int regulator = nodeIdx(edge.first);
    for (const string& target : edge.second)
      mask_.set(nodeIdx(target), regulator, true);
  }

  if (correction)
    for (int i = 0; i < numNodes(); ++i)
      if (!mask_.active_.row(i).any())
        mask_.active_.row(i).setConstant(true);
}

int ReactionNetwork::nodeIdx(const std::string& name) const
{
  auto it = std::find(names_.begin(), names_.end(), name);
  configAssert(it != names_.end(), fmt::format("Unknown node \"{}\".", name));
  return it - names_.begin();
}

std::vector<int> ReactionNetwork::regulators(int idx) const
{
  vector<int> regs;
  for (int j = 0; j < numNodes(); ++j)
    if (mask_.active(idx, j))
      regs.push_back(j);
  return regs;
}

ReactionNetwork ReactionNetwork::withoutReaction(int reaction_idx) const
{
  std::pair<int, int> pos = mask_.position(reaction_idx);
  InteractionMask mask = mask_;
  mask.set(pos.first, pos.second, false);
  return ReactionNetwork(names_, mask);
}

std::string ReactionNetwork::_str() const
{
  std::ostringstream oss;
  oss << "ReactionNetwork with " << numNodes() << " nodes and " << numReactions() << " reactions" << endl;
  for (int i = 0; i < numNodes(); ++i) {
    vector<string> regs;
    for (int j : regulators(i))
      regs.push_back(names_[j]);
    oss << fmt::format("  {} ({}) <- [{}]", names_[i], i, fmt::join(regs, ", ")) << endl;
  }
  return oss.str();
}


/************************************************************
 * ModelParameters
 ************************************************************/

ModelParameters::ModelParameters(const InteractionMask& mask, const Eigen::VectorXd& x)
{
  int n = mask.numNodes();
  int m = mask.numActive();
  if (x.size() != 2 * n + m)
    throw std::invalid_argument(fmt::format("Decision vector has {} entries, expected 2 * {} + {} = {}.",
                                            x.size(), n, m, 2 * n + m));
  lambda_ = x.head(n).array();
  vmax_ = x.segment(n, n).array();
  strengths_ = x.tail(m);
  mask.decode(strengths_, &reactions_);
}

Eigen::VectorXd ModelParameters::toVector() const
{
  int n = numNodes();
  VectorXd x(dimension());
  x.head(n) = lambda_.matrix();
  x.segment(n, n) = vmax_.matrix();
  x.tail(strengths_.size()) = strengths_;
  return x;
}

ModelParameters ModelParameters::perturbed(PerturbationTarget target, int factor, double multiplier) const
{
  if (factor < 0 || factor >= numNodes())
    throw std::out_of_range(fmt::format("Factor {} is not one of the {} nodes.", factor, numNodes()));
  ModelParameters copy = *this;
  if (target == PerturbationTarget::Decay)
    copy.lambda_(factor) *= multiplier;
  else
    copy.vmax_(factor) *= multiplier;
  return copy;
}

Eigen::MatrixXd ModelParameters::solutionMatrix() const
{
  int n = numNodes();
  MatrixXd sol(n, 2 + n);
  sol.col(0) = lambda_.matrix();
  sol.col(1) = vmax_.matrix();
  sol.rightCols(n) = reactions_;
  return sol;
}

std::string ModelParameters::_str() const
{
  std::ostringstream oss;
  oss << "ModelParameters" << endl;
  oss << "  lambda: " << lambda_.transpose() << endl;
  oss << "  vmax: " << vmax_.transpose() << endl;
  oss << "  K: " << endl;
  for (int i = 0; i < reactions_.rows(); ++i)
    oss << "    " << reactions_.row(i) << endl;
  return oss.str();
}


/************************************************************
 * RegulatoryOde
 ************************************************************/

RegulatoryOde::RegulatoryOde(const ModelParameters& params) :
  params_(params),
  drive_(params.numNodes()),
  production_(params.numNodes())
{
}

void RegulatoryOde::derivative(const double* x, double* dxdt)
{
  int n = params_.numNodes();
  Eigen::Map<const VectorXd> y(x, n);
  Eigen::Map<VectorXd> dy(dxdt, n);

  drive_.noalias() = params_.reactions_ * y;
  // exp() may overflow to inf, in which case production is exactly zero.
  production_ = params_.vmax_ / (1.0 + (-drive_.array()).exp());
  dy = (production_ - params_.lambda_ * y.array()).matrix();
}

void RegulatoryOde::jacobian(const double* x, OdeJacobian& jac)
{
  int n = params_.numNodes();
  Eigen::Map<const VectorXd> y(x, n);
  drive_.noalias() = params_.reactions_ * y;

  for (int i = 0; i < n; ++i) {
    double s = 1.0 / (1.0 + std::exp(-drive_(i)));
    double gain = params_.vmax_(i) * s * (1.0 - s);
    for (int j = 0; j < n; ++j)
      jac(i, j) = gain * params_.reactions_(i, j);
    jac(i, i) -= params_.lambda_(i);
  }
}

Eigen::VectorXd RegulatoryOde::derivative(const Eigen::VectorXd& x)
{
  if (x.size() != params_.numNodes())
    throw std::invalid_argument(fmt::format("State has {} entries, model has {} nodes.", x.size(), params_.numNodes()));
  VectorXd dxdt(x.size());
  derivative(x.data(), dxdt.data());
  return dxdt;
}


/************************************************************
 * RosenbrockIntegrator
 ************************************************************/

namespace
{
  struct OdeSystem
  {
    RegulatoryOde* ode_;
    void operator()(const OdeState& x, OdeState& dxdt, double t) const
    {
      for (size_t i = 0; i < x.size(); ++i)
        if (!std::isfinite(x[i]) || std::abs(x[i]) > RosenbrockIntegrator::kStateLimit)
          throw odeint::odeint_error(fmt::format("State diverged at t = {}: x[{}] = {}.", t, i, x[i]));
      ode_->derivative(&x[0], &dxdt[0]);
    }
  };

  struct OdeSystemJacobian
  {
    RegulatoryOde* ode_;
    void operator()(const OdeState& x, OdeJacobian& jac, double t, OdeState& dfdt) const
    {
      ode_->jacobian(&x[0], jac);
      // Autonomous system.
      for (size_t i = 0; i < dfdt.size(); ++i)
        dfdt[i] = 0.0;
    }
  };

  // Like odeint::max_step_checker, but the count is not reset at each output time.
  class StepBudget
  {
  public:
    explicit StepBudget(int max_steps) : max_steps_(max_steps), steps_(0) {}

    void reset() {}

    void operator()()
    {
      if (steps_++ >= max_steps_)
        throw odeint::no_progress_error(fmt::format("Max number of steps exceeded ({}).", max_steps_));
    }

  private:
    int max_steps_;
    int steps_;
  };
}

RosenbrockIntegrator::RosenbrockIntegrator(double abs_tol, double rel_tol, int max_steps, bool verbose) :
  abs_tol_(abs_tol),
  rel_tol_(rel_tol),
  max_steps_(max_steps),
  verbose_(verbose)
{
  if (!(abs_tol_ > 0) || !(rel_tol_ > 0) || max_steps_ < 1)
    throw std::invalid_argument(fmt::format("Bad integrator settings: abs_tol {}, rel_tol {}, max_steps {}.",
                                            abs_tol_, rel_tol_, max_steps_));
}

Eigen::ArrayXXd RosenbrockIntegrator::integrate(const ModelParameters& params, const Eigen::VectorXd& y0,
                                                const Eigen::VectorXd& times) const
{
  int n = params.numNodes();
  if (y0.size() != n)
    throw std::invalid_argument(fmt::format("y0 has {} entries, model has {} nodes.", y0.size(), n));

  ArrayXXd trajectory(times.size(), n);
  if (times.size() == 0)
    return trajectory;

  RegulatoryOde ode(params);
  OdeState x(n);
  for (int i = 0; i < n; ++i)
    x[i] = y0(i);

  int num_recorded = 0;
  auto observer = [&](const OdeState& state, double t) {
    for (int j = 0; j < n; ++j)
      trajectory(num_recorded, j) = state[j];
    ++num_recorded;
  };

  double span = times(times.size() - 1) - times(0);
  double dt = span > 0 ? span / 1000.0 : 1e-3;
  try {
    odeint::integrate_times(odeint::make_dense_output(abs_tol_, rel_tol_, odeint::rosenbrock4<double>()),
                            std::make_pair(OdeSystem{&ode}, OdeSystemJacobian{&ode}),
                            x, times.data(), times.data() + times.size(), dt,
                            observer, StepBudget(max_steps_));
  }
  catch (const odeint::odeint_error& e) {
    if (verbose_)
      cout << fmt::format("[RosenbrockIntegrator] stopped after {} of {} output times: {}",
                          num_recorded, times.size(), e.what()) << endl;
  }

  // Best effort: hold the last state reached.
  ArrayXd last = y0.array();
  if (num_recorded > 0)
    last = trajectory.row(num_recorded - 1).transpose();
  for (int i = num_recorded; i < times.size(); ++i)
    trajectory.row(i) = last.transpose();
  return trajectory;
}


/************************************************************
 * Datasets
 ************************************************************/

PerturbationDataset::PerturbationDataset(const Eigen::MatrixXd& table, int num_nodes) :
  table_(table)
{
  int k = table_.rows();
  configAssert(k >= 1, "Perturbation table is empty.");
  configAssert(table_.cols() > k,
               fmt::format("Perturbation table is {}x{}; it needs k magnitude columns plus at least one time column.",
                           k, table_.cols()));
  configAssert(k <= num_nodes, fmt::format("{} perturbed factors but only {} nodes.", k, num_nodes));
  configAssert(table_.allFinite(), "Perturbation table contains non-finite values.");
  for (int i = 0; i < k; ++i)
    configAssert(isAscending(times(i)), fmt::format("Time sequence of factor {} is not ascending.", i));
}

std::string PerturbationDataset::_str() const
{
  std::ostringstream oss;
  oss << "PerturbationDataset: " << numFactors() << " factors, " << numTimes() << " time points each" << endl;
  oss << "  Magnitudes: " << endl;
  MatrixXd mags = magnitudes();
  for (int i = 0; i < mags.rows(); ++i)
    oss << "    " << mags.row(i) << endl;
  return oss.str();
}

TimeSeriesData::TimeSeriesData(const Eigen::VectorXd& times, const Eigen::ArrayXXd& mean, const Eigen::ArrayXd& sigma) :
  times_(times),
  mean_(mean),
  sigma_(sigma)
{
  configAssert(times_.size() >= 1, "Time series has no time points.");
  configAssert(mean_.rows() == times_.size(),
               fmt::format("Time series has {} times but {} rows of data.", times_.size(), mean_.rows()));
  configAssert(sigma_.size() == mean_.cols(),
               fmt::format("Time series has {} columns but {} sigmas.", mean_.cols(), sigma_.size()));
  configAssert(isAscending(times_), "Time series times are not ascending.");
  configAssert(mean_.allFinite() && times_.allFinite(), "Time series contains non-finite values.");
  configAssert((sigma_ > 0).all(), fmt::format("Time series sigma must be positive, got {}.", fmt::join(sigma_, ", ")));
}

TimeSeriesData TimeSeriesData::fromReplicates(const Eigen::VectorXd& times, const std::vector<Eigen::ArrayXXd>& replicates)
{
  configAssert(replicates.size() >= 2, "At least two replicates are needed to estimate sigma.");
  int rows = replicates[0].rows();
  int cols = replicates[0].cols();
  ArrayXXd mean = ArrayXXd::Zero(rows, cols);
  for (size_t r = 0; r < replicates.size(); ++r) {
    configAssert(replicates[r].rows() == rows && replicates[r].cols() == cols,
                 fmt::format("Replicate {} is {}x{}, replicate 0 is {}x{}.",
                             r, replicates[r].rows(), replicates[r].cols(), rows, cols));
    mean += replicates[r];
  }
  mean /= replicates.size();

  ArrayXXd var = ArrayXXd::Zero(rows, cols);
  for (const ArrayXXd& rep : replicates)
    var += (rep - mean).square();
  var /= replicates.size() - 1;
  ArrayXd sigma = var.sqrt().colwise().mean().transpose();

  return TimeSeriesData(times, mean, sigma);
}

double TimeSeriesData::cost(const Eigen::ArrayXXd& trajectory) const
{
  if (trajectory.rows() != mean_.rows() || trajectory.cols() != mean_.cols())
    throw std::invalid_argument(fmt::format("Trajectory is {}x{}, data is {}x{}.",
                                            trajectory.rows(), trajectory.cols(), mean_.rows(), mean_.cols()));
  Eigen::Array<double, 1, Eigen::Dynamic> colmax = trajectory.colwise().maxCoeff();
  ArrayXXd residual = mean_ - trajectory.rowwise() / colmax;
  return (residual.square().rowwise() / sigma_.square().transpose()).sum();
}

std::string TimeSeriesData::_str() const
{
  std::ostringstream oss;
  oss << "TimeSeriesData: " << times_.size() << " time points, " << numNodes() << " nodes" << endl;
  oss << "  times: " << times_.transpose() << endl;
  oss << "  sigma: " << sigma_.transpose() << endl;
  return oss.str();
}


/************************************************************
 * EvaluationOptions
 ************************************************************/

EvaluationOptions::EvaluationOptions() :
  mode_(PerturbationMode::Independent),
  target_(PerturbationTarget::Decay),
  bounds_policy_(BoundsPolicy::Reject),
  parallel_(false),
  num_workers_(std::max(1u, std::thread::hardware_concurrency())),
  max_steps_(100000000),
  abs_tol_(1e-8),
  rel_tol_(1e-6),
  perturbation_factor_(1.0),
  verbose_(false)
{
}

EvaluationOptions::EvaluationOptions(const YAML::Node& yaml) :
  EvaluationOptions()
{
  try {
    if (yaml["mode"])
      mode_ = parsePerturbationMode(yaml["mode"].as<string>());
    if (yaml["target"])
      target_ = parsePerturbationTarget(yaml["target"].as<string>());
    if (yaml["bounds_policy"])
      bounds_policy_ = parseBoundsPolicy(yaml["bounds_policy"].as<string>());
    if (yaml["parallel"])
      parallel_ = yaml["parallel"].as<bool>();
    if (yaml["workers"])
      num_workers_ = yaml["workers"].as<int>();
    if (yaml["max_steps"]) {
      // Accepts 1e8 style values.
      double steps = yaml["max_steps"].as<double>();
      configAssert(steps >= 1 && steps <= std::numeric_limits<int>::max(),
                   fmt::format("Evaluation.max_steps must be between 1 and {}, got {}.",
                               std::numeric_limits<int>::max(), steps));
      max_steps_ = static_cast<int>(steps);
    }
    if (yaml["abs_tol"])
      abs_tol_ = yaml["abs_tol"].as<double>();
    if (yaml["rel_tol"])
      rel_tol_ = yaml["rel_tol"].as<double>();
    if (yaml["verbose"])
      verbose_ = yaml["verbose"].as<bool>();
  }
  catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("Malformed Evaluation section: {}", e.what()));
  }

  configAssert(num_workers_ >= 1, fmt::format("Evaluation.workers must be at least 1, got {}.", num_workers_));
  configAssert(max_steps_ >= 1, fmt::format("Evaluation.max_steps must be at least 1, got {}.", max_steps_));
  configAssert(abs_tol_ > 0 && rel_tol_ > 0, "Evaluation tolerances must be positive.");
  configAssert(!(parallel_ && mode_ == PerturbationMode::Compounding),
               "Parallel evaluation only supports independent perturbations.");
}

std::string EvaluationOptions::str() const
{
  return fmt::format("mode: {}, target: {}, bounds_policy: {}, parallel: {}, workers: {}, "
                     "max_steps: {}, abs_tol: {}, rel_tol: {}, perturbation factor: {}",
                     modeName(mode_), targetName(target_), policyName(bounds_policy_), parallel_, num_workers_,
                     max_steps_, abs_tol_, rel_tol_, perturbation_factor_);
}


/************************************************************
 * BaselineCache
 ************************************************************/

BaselineCache::Key BaselineCache::key(const Eigen::VectorXd& times)
{
  Key k(times.size());
  for (int i = 0; i < times.size(); ++i) {
    double t = times(i);
    if (t == 0.0)
      t = 0.0;  // -0.0
    memcpy(&k[i], &t, sizeof(t));
  }
  return k;
}

const Eigen::ArrayXXd* BaselineCache::find(const Eigen::VectorXd& times) const
{
  auto it = entries_.find(key(times));
  if (it == entries_.end())
    return nullptr;
  return &it->second;
}

const Eigen::ArrayXXd& BaselineCache::insert(const Eigen::VectorXd& times, const Eigen::ArrayXXd& trajectory)
{
  return entries_[key(times)] = trajectory;
}


/************************************************************
 * Perturbation evaluators
 ************************************************************/

Eigen::VectorXd PerturbationEvaluator::responseResiduals(const Eigen::ArrayXXd& ratios)
{
  VectorXd residuals(ratios.size());
  for (int i = 0; i < ratios.rows(); ++i)
    for (int j = 0; j < ratios.cols(); ++j) {
      double r = ratios(i, j) - 1.0;
      if (std::isnan(r) || r > kResponseClip)
        r = kResponseClip;
      residuals(i * ratios.cols() + j) = r;
    }
  return residuals;
}

double PerturbationEvaluator::reduceResponses(const Eigen::ArrayXXd& ratios, const Eigen::MatrixXd& magnitudes)
{
  if (ratios.rows() != magnitudes.rows() || ratios.cols() != magnitudes.cols())
    throw std::invalid_argument(fmt::format("Responses are {}x{}, magnitudes are {}x{}.",
                                            ratios.rows(), ratios.cols(), magnitudes.rows(), magnitudes.cols()));
  MatrixXd design = responseResiduals(ratios);
  if (!design.allFinite())
    return std::numeric_limits<double>::infinity();
  VectorXd observed(magnitudes.size());
  for (int i = 0; i < magnitudes.rows(); ++i)
    for (int j = 0; j < magnitudes.cols(); ++j)
      observed(i * magnitudes.cols() + j) = magnitudes(i, j);

  // Minimum-norm solution, so an all-zero design gives coefficient 0.
  VectorXd coeff = design.completeOrthogonalDecomposition().solve(observed);
  return (observed - design * coeff).squaredNorm();
}

Eigen::ArrayXd PerturbationEvaluator::finalRatio(const Eigen::ArrayXXd& treated, const Eigen::ArrayXXd& control,
                                                 int num_factors)
{
  int last = treated.rows() - 1;
  return treated.row(last).head(num_factors).transpose() / control.row(last).head(num_factors).transpose();
}

SequentialEvaluator::SequentialEvaluator(const Eigen::VectorXd& y0, PerturbationDataset::ConstPtr dataset,
                                         Integrator::ConstPtr integrator,
                                         PerturbationMode mode, PerturbationTarget target) :
  y0_(y0),
  dataset_(dataset),
  integrator_(integrator),
  mode_(mode),
  target_(target)
{
  if (!dataset_ || !integrator_)
    throw std::invalid_argument("SequentialEvaluator needs a dataset and an integrator.");
  configAssert(dataset_->numFactors() <= y0_.size(),
               fmt::format("{} perturbed factors but y0 has {} entries.", dataset_->numFactors(), y0_.size()));
}

double SequentialEvaluator::cost(const ModelParameters& params) const
{
  return reduceResponses(responses(params), dataset_->magnitudes());
}

Eigen::ArrayXXd SequentialEvaluator::responses(const ModelParameters& params) const
{
  int k = dataset_->numFactors();
  ArrayXXd ratios(k, k);
  BaselineCache cache;
  ModelParameters current = params;

  for (int i = 0; i < k; ++i) {
    const ModelParameters& base = (mode_ == PerturbationMode::Compounding) ? current : params;
    VectorXd times = dataset_->times(i);

    const ArrayXXd* control = cache.find(times);
    if (!control)
      control = &cache.insert(times, integrator_->integrate(base, y0_, times));

    ModelParameters treated = base.perturbed(target_, i, dataset_->multiplier(i));
    ArrayXXd trajectory = integrator_->integrate(treated, y0_, times);
    ratios.row(i) = finalRatio(trajectory, *control, k).transpose();

    if (mode_ == PerturbationMode::Compounding)
      current = treated;
  }
  return ratios;
}

Eigen::ArrayXd SequentialEvaluator::factorResponse(const ModelParameters& params, int factor) const
{
  if (factor < 0 || factor >= dataset_->numFactors())
    throw std::out_of_range(fmt::format("Factor {} is not one of the {} perturbed factors.", factor, dataset_->numFactors()));
  VectorXd times = dataset_->times(factor);
  ArrayXXd control = integrator_->integrate(params, y0_, times);
  ArrayXXd treated = integrator_->integrate(params.perturbed(target_, factor, dataset_->multiplier(factor)), y0_, times);
  return finalRatio(treated, control, dataset_->numFactors());
}

ParallelEvaluator::ParallelEvaluator(const InteractionMask& mask, const SequentialEvaluator& prototype, int num_workers) :
  dataset_(prototype.dataset_)
{
  if (num_workers < 1)
    throw std::invalid_argument(fmt::format("ParallelEvaluator needs at least one worker, got {}.", num_workers));

  auto factory = [mask, prototype]() -> WorkerPool::Handler {
    // Each worker gets its own dataset copy.
    std::shared_ptr<SequentialEvaluator> evaluator(new SequentialEvaluator(
        prototype.y0_, PerturbationDataset::ConstPtr(new PerturbationDataset(*prototype.dataset_)),
        prototype.integrator_, PerturbationMode::Independent, prototype.target_));
    return [evaluator, mask](const MessageReader& job) {
      int factor = job.intField("factor");
      ModelParameters params(mask, job.arrayField("parameters").matrix());
      MessageWrapper result;
      result.addField("factor", factor);
      result.addField("response", ArrayXd(evaluator->factorResponse(params, factor)));
      return result;
    };
  };
  pool_.reset(new WorkerPool(std::min(num_workers, dataset_->numFactors()), factory));
}

ParallelEvaluator::~ParallelEvaluator()
{
}

int ParallelEvaluator::numWorkers() const
{
  return pool_->numWorkers();
}

double ParallelEvaluator::cost(const ModelParameters& params) const
{
  return reduceResponses(responses(params), dataset_->magnitudes());
}

Eigen::ArrayXXd ParallelEvaluator::responses(const ModelParameters& params) const
{
  int k = dataset_->numFactors();
  ArrayXd x = params.toVector().array();
  vector<MessageWrapper> jobs(k);
  for (int i = 0; i < k; ++i) {
    jobs[i].addField("factor", i);
    jobs[i].addField("parameters", x);
  }

  vector<MessageReader> results;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    results = pool_->map(jobs);
  }

  ArrayXXd ratios(k, k);
  for (int i = 0; i < k; ++i) {
    if (results[i].intField("factor") != i)
      throw std::runtime_error(fmt::format("Result {} came back for factor {}.", i, results[i].intField("factor")));
    ArrayXd response = results[i].arrayField("response");
    if (response.size() != k)
      throw std::runtime_error(fmt::format("Response of factor {} has {} entries, expected {}.", i, response.size(), k));
    ratios.row(i) = response.transpose();
  }
  return ratios;
}


/************************************************************
 * CoreProblem
 ************************************************************/

CoreProblem::CoreProblem(const ReactionNetwork& network, const Eigen::VectorXd& y0,
                         PerturbationDataset::ConstPtr perturbations, TimeSeriesData::ConstPtr time_series,
                         const EvaluationOptions& options, Integrator::ConstPtr integrator) :
  network_(network),
  y0_(y0),
  options_(options),
  perturbations_(perturbations),
  time_series_(time_series),
  integrator_(integrator)
{
  int n = network_.numNodes();
  configAssert(perturbations_ || time_series_, "Need perturbation data, time-series data, or both.");
  configAssert(y0_.size() == n, fmt::format("Initial state has {} entries, network has {} nodes.", y0_.size(), n));
  configAssert(y0_.allFinite(), "Initial state contains non-finite values.");
  if (perturbations_)
    configAssert(perturbations_->numFactors() <= n,
                 fmt::format("{} perturbed factors but only {} nodes.", perturbations_->numFactors(), n));
  if (time_series_)
    configAssert(time_series_->numNodes() == n,
                 fmt::format("Time series has {} columns, network has {} nodes.", time_series_->numNodes(), n));
  configAssert(!(options_.parallel_ && options_.mode_ == PerturbationMode::Compounding),
               "Parallel evaluation only supports independent perturbations.");

  if (!integrator_)
    integrator_.reset(new RosenbrockIntegrator(options_.abs_tol_, options_.rel_tol_, options_.max_steps_, options_.verbose_));

  if (perturbations_) {
    SequentialEvaluator sequential(y0_, perturbations_, integrator_, options_.mode_, options_.target_);
    if (options_.parallel_)
      evaluator_.reset(new ParallelEvaluator(network_.mask_, sequential, options_.num_workers_));
    else
      evaluator_.reset(new SequentialEvaluator(sequential));
  }

  setDefaultBounds();
}

CoreProblem::Ptr CoreProblem::loadConfig(const std::string& path)
{
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  }
  catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("Could not load {}: {}", path, e.what()));
  }
  return loadConfig(yaml);
}

CoreProblem::Ptr CoreProblem::loadConfig(const YAML::Node& yaml)
{
  try {
    configAssert(bool(yaml["Network"]), "Config has no Network section.");
    bool correction = yaml["Correction"] ? yaml["Correction"].as<bool>() : true;
    ReactionNetwork network(yaml["Network"], correction);
    cout << "Loaded network" << endl;
    cout << network.str("  ") << endl;

    EvaluationOptions options;
    if (yaml["Evaluation"])
      options = EvaluationOptions(yaml["Evaluation"]);

    TimeSeriesData::ConstPtr time_series;
    if (yaml["TimeSeries"]) {
      const YAML::Node& ts = yaml["TimeSeries"];
      VectorXd times = yamlVector(ts["times"], "TimeSeries.times");
      if (ts["replicates"]) {
        vector<ArrayXXd> replicates;
        for (const YAML::Node& rep : ts["replicates"])
          replicates.push_back(yamlMatrix(rep, "TimeSeries.replicates").array());
        time_series.reset(new TimeSeriesData(TimeSeriesData::fromReplicates(times, replicates)));
      }
      else {
        time_series.reset(new TimeSeriesData(times, yamlMatrix(ts["mean"], "TimeSeries.mean").array(),
                                             yamlVector(ts["sigma"], "TimeSeries.sigma").array()));
      }
    }

    PerturbationDataset::ConstPtr perturbations;
    if (yaml["Perturbations"]) {
      const YAML::Node& pert = yaml["Perturbations"];
      perturbations.reset(new PerturbationDataset(yamlMatrix(pert["table"], "Perturbations.table"), network.numNodes()));
      if (pert["factor"])
        options.perturbation_factor_ = pert["factor"].as<double>();
    }

    VectorXd y0;
    if (yaml["InitialState"])
      y0 = yamlVector(yaml["InitialState"], "InitialState");
    else {
      configAssert(bool(time_series), "InitialState is required when there is no TimeSeries section.");
      y0 = time_series->mean_.row(0).transpose().matrix();
    }

    Ptr problem(new CoreProblem(network, y0, perturbations, time_series, options));

    if (yaml["Bounds"]) {
      const YAML::Node& bounds = yaml["Bounds"];
      std::pair<double, double> lambda = yamlRange(bounds, "lambda", 0, 20);
      std::pair<double, double> vmax = yamlRange(bounds, "vmax", 0, 20);
      std::pair<double, double> k = yamlRange(bounds, "k", -20, 20);
      problem->setDefaultBounds(lambda.first, lambda.second, vmax.first, vmax.second, k.first, k.second);
    }
    return problem;
  }
  catch (const YAML::Exception& e) {
    throw ConfigError(fmt::format("Malformed config: {}", e.what()));
  }
}

void CoreProblem::setDefaultBounds(double lambda_lo, double lambda_hi, double vmax_lo, double vmax_hi,
                                   double k_lo, double k_hi)
{
  configAssert(lambda_lo <= lambda_hi && vmax_lo <= vmax_hi && k_lo <= k_hi,
               fmt::format("Bounds are inverted: lambda [{}, {}], vmax [{}, {}], k [{}, {}].",
                           lambda_lo, lambda_hi, vmax_lo, vmax_hi, k_lo, k_hi));
  int n = network_.numNodes();
  int m = network_.numReactions();
  lower_.resize(dimension());
  upper_.resize(dimension());
  lower_.head(n).setConstant(lambda_lo);
  upper_.head(n).setConstant(lambda_hi);
  lower_.segment(n, n).setConstant(vmax_lo);
  upper_.segment(n, n).setConstant(vmax_hi);
  lower_.tail(m).setConstant(k_lo);
  upper_.tail(m).setConstant(k_hi);
}

void CoreProblem::setBounds(const Eigen::VectorXd& lower, const Eigen::VectorXd& upper)
{
  if (lower.size() != dimension() || upper.size() != dimension())
    throw std::invalid_argument(fmt::format("Bounds have {} and {} entries, problem dimension is {}.",
                                            lower.size(), upper.size(), dimension()));
  if (!(lower.array() <= upper.array()).all())
    throw std::invalid_argument("Lower bound exceeds upper bound.");
  lower_ = lower;
  upper_ = upper;
}

bool CoreProblem::feasible(const Eigen::VectorXd& x) const
{
  if (x.size() != dimension())
    return false;
  return (x.array() >= lower_.array()).all() && (x.array() <= upper_.array()).all();
}

ModelParameters CoreProblem::decode(const Eigen::VectorXd& x) const
{
  return ModelParameters(network_.mask_, x);
}

double CoreProblem::perturbationCost(const ModelParameters& params) const
{
  if (!evaluator_)
    return 0;
  return evaluator_->cost(params);
}

double CoreProblem::timeSeriesCost(const ModelParameters& params) const
{
  if (!time_series_)
    return 0;
  ArrayXXd trajectory = integrator_->integrate(params, y0_, time_series_->times_);
  return time_series_->cost(trajectory);
}

double CoreProblem::evaluate(const Eigen::VectorXd& x) const
{
  if (x.size() != dimension())
    throw std::invalid_argument(fmt::format("Decision vector has {} entries, problem dimension is {}.",
                                            x.size(), dimension()));
  if (!x.allFinite())
    throw ConstraintViolation("Decision vector contains non-finite values.");

  VectorXd xb = x;
  if (!feasible(x)) {
    if (options_.bounds_policy_ == BoundsPolicy::Reject)
      throw ConstraintViolation(fmt::format("Decision vector is out of bounds: [{}]", fmt::join(x, ", ")));
    xb = x.cwiseMax(lower_).cwiseMin(upper_);
  }

  ModelParameters params = decode(xb);
  double cost = timeSeriesCost(params);
  if (evaluator_)
    cost += options_.perturbation_factor_ * perturbationCost(params);

  if (!std::isfinite(cost))
    return kPenaltyCost;
  return cost;
}

std::string CoreProblem::formatSolution(const Eigen::VectorXd& x) const
{
  MatrixXd sol = decode(x).solutionMatrix();
  std::ostringstream oss;
  oss << fmt::format("{:>10} {:>10} {:>10}", "", "lambda", "vmax");
  for (const string& name : network_.names_)
    oss << fmt::format(" {:>10}", name);
  oss << endl;
  for (int i = 0; i < sol.rows(); ++i) {
    oss << fmt::format("{:>10}", network_.names_[i]);
    for (int j = 0; j < sol.cols(); ++j)
      oss << fmt::format(" {:10.4g}", sol(i, j));
    oss << endl;
  }
  return oss.str();
}

std::string CoreProblem::_str() const
{
  std::ostringstream oss;
  oss << "CoreProblem, dimension " << dimension() << endl;
  oss << network_.str("  ") << endl;
  oss << "  y0: " << y0_.transpose() << endl;
  oss << "  Options: " << options_.str() << endl;
  if (perturbations_)
    oss << perturbations_->str("  ") << endl;
  if (time_series_)
    oss << time_series_->str("  ") << endl;
  if (evaluator_ && options_.parallel_)
    oss << "  Parallel evaluation with " << std::static_pointer_cast<ParallelEvaluator>(evaluator_)->numWorkers()
        << " workers" << endl;
  return oss.str();
}


/************************************************************
 * Pruning
 ************************************************************/

PrunedModel removeLowestReaction(const ReactionNetwork& network, const Eigen::VectorXd& x)
{
  int n = network.numNodes();
  int m = network.numReactions();
  if (x.size() != 2 * n + m)
    throw std::invalid_argument(fmt::format("Decision vector has {} entries, expected {}.", x.size(), 2 * n + m));
  if (m == 0)
    throw std::logic_error("No reactions left to remove.");

  Eigen::Index idx;
  x.tail(m).cwiseAbs().minCoeff(&idx);
  std::pair<int, int> pos = network.mask_.position(idx);

  int cut = 2 * n + idx;
  VectorXd reduced(x.size() - 1);
  reduced.head(cut) = x.head(cut);
  reduced.tail(m - idx - 1) = x.tail(m - idx - 1);

  return PrunedModel{network.withoutReaction(idx), reduced, pos.first, pos.second};
}
