#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>
#include <grnfit.h>
#include <comms.h>
#include <atomic>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>

using namespace std;
using Eigen::ArrayXd, Eigen::ArrayXXd, Eigen::VectorXd, Eigen::MatrixXd;

void printHeader()
{
  cout << "====================================================================================================" << endl;
  cout << "====================================================================================================" << endl;
  cout << "====================================================================================================" << endl;
}

// IRF4 0, MAF 1, NFATC3 2, STAT3 3.  NFATC3 has no regulators, so correction gives it all four.
ReactionNetwork exampleNetwork()
{
  ReactionNetwork::Edges edges;
  edges["NFATC3"] = {"IRF4", "MAF"};
  edges["STAT3"] = {"MAF"};
  edges["IRF4"] = {"MAF", "STAT3"};
  edges["MAF"] = std::set<std::string>();
  return ReactionNetwork(edges);
}

VectorXd exampleSolution()
{
  VectorXd x(17);
  x << 1.0, 0.8, 1.2, 0.9,
    2.0, 1.5, 1.0, 2.5,
    1.5, -0.5, 2.0, 0.7, -1.0, 0.3, 1.1, -0.8, 0.6;
  return x;
}

PerturbationDataset::ConstPtr exampleDataset(int num_nodes)
{
  MatrixXd table(2, 2 + 4);
  table << 0.5, 0.1, 0, 1, 2, 4,
    -0.2, 0.3, 0, 1, 2, 4;
  return PerturbationDataset::ConstPtr(new PerturbationDataset(table, num_nodes));
}

// Counts integrations so the baseline cache can be checked from outside.
class CountingIntegrator : public Integrator
{
public:
  mutable std::atomic<int> count_;
  RosenbrockIntegrator impl_;

  CountingIntegrator() : count_(0) {}
  Eigen::ArrayXXd integrate(const ModelParameters& params, const Eigen::VectorXd& y0,
                            const Eigen::VectorXd& times) const
  {
    ++count_;
    return impl_.integrate(params, y0, times);
  }
};

TEST_CASE("Interaction mask decode / encode")
{
  printHeader();
  InteractionMask mask(3);
  mask.set(0, 1, true);
  mask.set(1, 0, true);
  mask.set(1, 2, true);
  mask.set(2, 2, true);
  CHECK(mask.numActive() == 4);

  VectorXd strengths(4);
  strengths << 1.5, -2.0, 3.0, 0.25;
  MatrixXd scratch;
  const MatrixXd& K = mask.decode(strengths, &scratch);
  cout << K << endl;
  CHECK(K(0, 1) == 1.5);
  CHECK(K(1, 0) == -2.0);
  CHECK(K(1, 2) == 3.0);
  CHECK(K(2, 2) == 0.25);
  CHECK(K.cwiseAbs().sum() == doctest::Approx(6.75));

  SUBCASE("Round trip")
  {
    VectorXd again = mask.encode(K);
    CHECK((again - strengths).norm() == 0);
  }

  SUBCASE("Reused scratch keeps nothing from the previous call")
  {
    scratch.setConstant(42);
    VectorXd zeros = VectorXd::Zero(4);
    mask.decode(zeros, &scratch);
    CHECK(scratch.norm() == 0);
  }

  SUBCASE("Position of a reaction")
  {
    CHECK(mask.position(0) == std::make_pair(0, 1));
    CHECK(mask.position(2) == std::make_pair(1, 2));
    CHECK_THROWS_AS(mask.position(4), std::out_of_range);
  }

  SUBCASE("Wrong number of strengths")
  {
    CHECK_THROWS_AS(mask.decode(VectorXd::Zero(3), &scratch), std::invalid_argument);
  }
}

TEST_CASE("Reaction network from named edges")
{
  printHeader();
  ReactionNetwork network = exampleNetwork();
  cout << network.str() << endl;

  CHECK(network.numNodes() == 4);
  CHECK(network.nodeIdx("IRF4") == 0);
  CHECK(network.nodeIdx("MAF") == 1);
  CHECK(network.nodeIdx("NFATC3") == 2);
  CHECK(network.nodeIdx("STAT3") == 3);
  CHECK(network.numReactions() == 9);
  CHECK_THROWS_AS(network.nodeIdx("FOXP3"), ConfigError);

  InteractionMask::BoolArray expected(4, 4);
  expected << false, false, true, false,
    true, false, true, true,
    true, true, true, true,
    true, false, false, false;
  CHECK((network.mask_.active_ == expected).all());

  CHECK(network.regulators(1) == vector<int>({0, 2, 3}));
  CHECK(network.regulators(3) == vector<int>({0}));

  SUBCASE("Without correction the unregulated node stays empty")
  {
    ReactionNetwork::Edges edges;
    edges["NFATC3"] = {"IRF4", "MAF"};
    edges["STAT3"] = {"MAF"};
    edges["IRF4"] = {"MAF", "STAT3"};
    ReactionNetwork raw(edges, false);
    CHECK(raw.numReactions() == 5);
    CHECK(raw.regulators(2).empty());
  }

  SUBCASE("Flattened mask is row-major")
  {
    InteractionMask::BoolVector flat = network.mask_.flattened();
    CHECK(flat.size() == 16);
    CHECK(flat(2));
    CHECK(!flat(3));
    CHECK(flat(4));
    InteractionMask again = InteractionMask::fromFlattened(flat, 4);
    CHECK((again.active_ == network.mask_.active_).all());
  }

  SUBCASE("From YAML")
  {
    YAML::Node yaml = YAML::Load(
      "- {name: NFATC3, regulates: [IRF4, MAF]}\n"
      "- {name: STAT3, regulates: [MAF]}\n"
      "- {name: IRF4, regulates: [MAF, STAT3]}\n"
      "- {name: MAF}\n");
    ReactionNetwork from_yaml(yaml);
    CHECK(from_yaml.names_ == network.names_);
    CHECK((from_yaml.mask_.active_ == network.mask_.active_).all());
  }
}

TEST_CASE("Default bounds")
{
  printHeader();
  ReactionNetwork::Edges edges;
  edges["A"] = {"B"};
  edges["B"] = {"A"};
  ReactionNetwork network(edges);
  CHECK(network.numReactions() == 2);

  MatrixXd table(1, 1 + 2);
  table << 0.1, 0, 1;
  CoreProblem problem(network, VectorXd::Ones(2),
                      PerturbationDataset::ConstPtr(new PerturbationDataset(table, 2)), TimeSeriesData::ConstPtr());
  CHECK(problem.dimension() == 6);

  VectorXd lower(6), upper(6);
  lower << 0, 0, 0, 0, -20, -20;
  upper << 20, 20, 20, 20, 20, 20;
  CHECK(problem.lower_ == lower);
  CHECK(problem.upper_ == upper);
}

TEST_CASE("Remove the weakest reaction")
{
  printHeader();
  ReactionNetwork network = exampleNetwork();
  VectorXd x = VectorXd::LinSpaced(17, 0, 10);

  PrunedModel pruned = removeLowestReaction(network, x);
  CHECK(pruned.removed_row_ == 0);
  CHECK(pruned.removed_col_ == 2);
  CHECK(pruned.network_.numReactions() == 8);
  CHECK(!pruned.network_.mask_.active(0, 2));
  CHECK(pruned.x_.size() == 16);
  CHECK(pruned.x_.head(8) == x.head(8));
  CHECK(pruned.x_.tail(8) == x.tail(8));

  SUBCASE("Ties go to the first reaction")
  {
    VectorXd y = VectorXd::Ones(17);
    y(12) = -0.5;
    y(15) = 0.5;
    PrunedModel p = removeLowestReaction(network, y);
    CHECK(network.mask_.position(4) == std::make_pair(p.removed_row_, p.removed_col_));
  }

  SUBCASE("Nothing left to remove")
  {
    ReactionNetwork empty(vector<string>({"A"}), InteractionMask(1));
    CHECK_THROWS_AS(removeLowestReaction(empty, VectorXd::Ones(2)), std::logic_error);
  }
}

TEST_CASE("Regulatory ODE")
{
  printHeader();
  InteractionMask mask(2);
  mask.active_.setConstant(true);
  VectorXd x(8);
  x << 0.5, 1.5, 2.0, 1.0, 0.7, -1.3, 0.4, 2.2;
  ModelParameters params(mask, x);
  RegulatoryOde ode(params);

  SUBCASE("Derivative")
  {
    VectorXd y(2);
    y << 0.3, 0.8;
    VectorXd dy = ode.derivative(y);
    double z0 = 0.7 * 0.3 - 1.3 * 0.8;
    double z1 = 0.4 * 0.3 + 2.2 * 0.8;
    CHECK(dy(0) == doctest::Approx(-0.5 * 0.3 + 2.0 / (1 + exp(-z0))));
    CHECK(dy(1) == doctest::Approx(-1.5 * 0.8 + 1.0 / (1 + exp(-z1))));
  }

  SUBCASE("Jacobian matches finite differences")
  {
    VectorXd y(2);
    y << 0.3, 0.8;
    OdeJacobian jac(2, 2);
    ode.jacobian(y.data(), jac);
    double h = 1e-6;
    for (int j = 0; j < 2; ++j) {
      VectorXd yp = y, ym = y;
      yp(j) += h;
      ym(j) -= h;
      VectorXd fd = (ode.derivative(yp) - ode.derivative(ym)) / (2 * h);
      for (int i = 0; i < 2; ++i)
        CHECK(jac(i, j) == doctest::Approx(fd(i)).epsilon(1e-6));
    }
  }

  SUBCASE("Saturation overflow gives zero production")
  {
    InteractionMask single(1);
    single.set(0, 0, true);
    VectorXd p(3);
    p << 1.0, 1.0, 1000.0;
    ModelParameters huge(single, p);
    RegulatoryOde big(huge);

    VectorXd y = VectorXd::Constant(1, -1.0);
    VectorXd dy = big.derivative(y);
    CHECK(std::isfinite(dy(0)));
    CHECK(dy(0) == 1.0);

    y(0) = 1.0;
    dy = big.derivative(y);
    CHECK(dy(0) == 0.0);
  }

  SUBCASE("Parameters are not touched")
  {
    VectorXd before = params.toVector();
    ode.derivative(VectorXd::Ones(2));
    CHECK(params.toVector() == before);
  }
}

TEST_CASE("Model parameters")
{
  printHeader();
  ReactionNetwork network = exampleNetwork();
  VectorXd x = exampleSolution();
  ModelParameters params(network.mask_, x);
  cout << params.str() << endl;

  CHECK(params.dimension() == 17);
  CHECK(params.toVector() == x);
  CHECK(params.reactions_(0, 2) == 1.5);
  CHECK(params.reactions_(3, 0) == 0.6);
  CHECK_THROWS_AS(ModelParameters(network.mask_, VectorXd::Ones(16)), std::invalid_argument);

  MatrixXd sol = params.solutionMatrix();
  CHECK(sol.rows() == 4);
  CHECK(sol.cols() == 6);
  CHECK(sol(1, 0) == 0.8);
  CHECK(sol(1, 1) == 1.5);
  CHECK(sol.rightCols(4) == params.reactions_);

  SUBCASE("Perturbed copies")
  {
    ModelParameters decay = params.perturbed(PerturbationTarget::Decay, 1, 1.5);
    CHECK(decay.lambda_(1) == doctest::Approx(1.2));
    CHECK(params.lambda_(1) == 0.8);
    ModelParameters vmax = params.perturbed(PerturbationTarget::Vmax, 2, 0.5);
    CHECK(vmax.vmax_(2) == 0.5);
    CHECK(vmax.lambda_(2) == 1.2);
  }
}

TEST_CASE("Rosenbrock integrator")
{
  printHeader();
  InteractionMask mask(1);
  VectorXd x(2);
  x << 1.0, 0.0;  // pure decay
  ModelParameters params(mask, x);
  VectorXd y0 = VectorXd::Constant(1, 2.0);
  VectorXd times(4);
  times << 0, 1, 2, 3;

  RosenbrockIntegrator integrator;
  ArrayXXd trajectory = integrator.integrate(params, y0, times);
  cout << trajectory.transpose() << endl;
  CHECK(trajectory.rows() == 4);
  CHECK(trajectory(0, 0) == 2.0);
  for (int i = 1; i < 4; ++i)
    CHECK(trajectory(i, 0) == doctest::Approx(2.0 * exp(-times(i))).epsilon(1e-4));

  SUBCASE("Identical inputs give identical output")
  {
    ArrayXXd again = integrator.integrate(params, y0, times);
    CHECK((again == trajectory).all());
  }

  SUBCASE("Step ceiling keeps the rows reached so far")
  {
    RosenbrockIntegrator limited(1e-12, 1e-12, 1, true);
    ArrayXXd partial = limited.integrate(params, y0, times);
    CHECK(partial.rows() == 4);
    for (int i = 0; i < 4; ++i)
      CHECK(partial(i, 0) == 2.0);
  }

  SUBCASE("Diverging model returns quickly")
  {
    VectorXd long_times(3);
    long_times << 0, 10, 100;
    VectorXd one = VectorXd::Ones(1);
    for (double lambda : {-5.0, -10.0, -50.0}) {
      VectorXd growth(2);
      growth << lambda, 1.0;
      ModelParameters unstable(mask, growth);
      auto start = std::chrono::steady_clock::now();
      ArrayXXd result = integrator.integrate(unstable, one, long_times);
      double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
      cout << "lambda " << lambda << ": " << result.transpose() << " (" << seconds << " seconds)" << endl;
      CHECK(seconds < 5);
      REQUIRE(result.rows() == 3);
      CHECK(result(0, 0) == 1.0);
      CHECK(result.allFinite());
      CHECK((result.abs() <= RosenbrockIntegrator::kStateLimit).all());
    }
  }
}

TEST_CASE("Baseline cache key")
{
  VectorXd a(3), b(3);
  a << 0.0, 1.0, 2.0;
  b << -0.0, 1.0, 2.0;
  CHECK(BaselineCache::key(a) == BaselineCache::key(b));
  b(2) = std::nextafter(2.0, 3.0);
  CHECK(BaselineCache::key(a) != BaselineCache::key(b));

  BaselineCache cache;
  CHECK(cache.find(a) == nullptr);
  cache.insert(a, ArrayXXd::Ones(3, 2));
  REQUIRE(cache.find(a) != nullptr);
  CHECK(cache.find(a)->rows() == 3);
  CHECK(cache.size() == 1);
}

TEST_CASE("Response clipping and least squares")
{
  printHeader();
  ArrayXXd ratios(2, 2);
  ratios << 5.0, 1.5,
    std::numeric_limits<double>::quiet_NaN(), 0.5;
  VectorXd residuals = PerturbationEvaluator::responseResiduals(ratios);
  CHECK(residuals(0) == 2.0);
  CHECK(residuals(1) == 0.5);
  CHECK(residuals(2) == 2.0);
  CHECK(residuals(3) == -0.5);

  SUBCASE("Exact fit costs nothing")
  {
    MatrixXd magnitudes(2, 2);
    magnitudes << 6.0, 1.5, 6.0, -1.5;
    CHECK(PerturbationEvaluator::reduceResponses(ratios, magnitudes) == doctest::Approx(0).epsilon(1e-12));
  }

  SUBCASE("All-zero residuals leave the full magnitude norm")
  {
    ArrayXXd ones = ArrayXXd::Ones(2, 2);
    MatrixXd magnitudes(2, 2);
    magnitudes << 1, 2, 3, 4;
    CHECK(PerturbationEvaluator::reduceResponses(ones, magnitudes) == doctest::Approx(30));
  }

  SUBCASE("Only NaN and values above the clip are replaced")
  {
    ArrayXXd extreme(2, 2);
    extreme << std::numeric_limits<double>::infinity(), -1e6,
      -std::numeric_limits<double>::infinity(), 3.0;
    VectorXd res = PerturbationEvaluator::responseResiduals(extreme);
    CHECK(res(0) == 2.0);
    CHECK(res(1) == -1e6 - 1.0);
    CHECK(std::isinf(res(2)));
    CHECK(res(2) < 0);
    CHECK(res(3) == 2.0);

    MatrixXd magnitudes = MatrixXd::Ones(2, 2);
    CHECK(!std::isfinite(PerturbationEvaluator::reduceResponses(extreme, magnitudes)));
    extreme(1, 0) = 0.5;
    CHECK(std::isfinite(PerturbationEvaluator::reduceResponses(extreme, magnitudes)));
  }
}

TEST_CASE("Unperturbed two-node model costs nothing")
{
  printHeader();
  ReactionNetwork::Edges edges;
  edges["B"] = {"A"};
  ReactionNetwork network(edges, false);
  REQUIRE(network.numReactions() == 1);
  REQUIRE(network.mask_.active(0, 1));

  MatrixXd table(1, 1 + 3);
  table << 0, 0, 1, 2;
  VectorXd y0(2);
  y0 << 1.0, 0.5;
  CoreProblem problem(network, y0, PerturbationDataset::ConstPtr(new PerturbationDataset(table, 2)),
                      TimeSeriesData::ConstPtr());
  VectorXd x(5);
  x << 1, 1, 1, 1, 0;
  CHECK(problem.evaluate(x) == 0.0);
}

TEST_CASE("Sequential evaluator")
{
  printHeader();
  ReactionNetwork network = exampleNetwork();
  VectorXd y0 = VectorXd::Constant(4, 0.5);
  ModelParameters params(network.mask_, exampleSolution());

  SUBCASE("Shared time sequences integrate the control once")
  {
    std::shared_ptr<CountingIntegrator> counter(new CountingIntegrator);
    SequentialEvaluator evaluator(y0, exampleDataset(4), counter);
    double cost = evaluator.cost(params);
    cout << "cost: " << cost << endl;
    CHECK(std::isfinite(cost));
    CHECK(counter->count_.load() == 3);
  }

  SUBCASE("Different time sequences get their own control")
  {
    MatrixXd table(2, 2 + 4);
    table << 0.5, 0.1, 0, 1, 2, 4,
      -0.2, 0.3, 0, 1, 2, 5;
    std::shared_ptr<CountingIntegrator> counter(new CountingIntegrator);
    SequentialEvaluator evaluator(y0, PerturbationDataset::ConstPtr(new PerturbationDataset(table, 4)), counter);
    evaluator.cost(params);
    CHECK(counter->count_.load() == 4);
  }

  SUBCASE("Deterministic")
  {
    SequentialEvaluator evaluator(y0, exampleDataset(4), Integrator::ConstPtr(new RosenbrockIntegrator));
    double a = evaluator.cost(params);
    double b = evaluator.cost(params);
    CHECK(a == b);
  }

  SUBCASE("Compounding carries earlier perturbations forward")
  {
    Integrator::ConstPtr integrator(new RosenbrockIntegrator);
    SequentialEvaluator independent(y0, exampleDataset(4), integrator, PerturbationMode::Independent);
    SequentialEvaluator compounding(y0, exampleDataset(4), integrator, PerturbationMode::Compounding);
    ArrayXXd ind = independent.responses(params);
    ArrayXXd comp = compounding.responses(params);
    cout << "independent: " << endl << ind << endl;
    cout << "compounding: " << endl << comp << endl;
    CHECK((ind.row(0) == comp.row(0)).all());
    CHECK(std::abs(ind(1, 0) - comp(1, 0)) > 1e-6);

    for (int i = 0; i < 2; ++i)
      CHECK((independent.factorResponse(params, i) == ind.row(i).transpose()).all());
  }
}

TEST_CASE("Parallel evaluator agrees with sequential")
{
  printHeader();
  ReactionNetwork network = exampleNetwork();
  VectorXd y0 = VectorXd::Constant(4, 0.5);
  SequentialEvaluator sequential(y0, exampleDataset(4), Integrator::ConstPtr(new RosenbrockIntegrator));
  ParallelEvaluator parallel(network.mask_, sequential, 8);
  CHECK(parallel.numWorkers() == 2);

  VectorXd x = exampleSolution();
  for (int i = 0; i < 3; ++i) {
    x.tail(9) *= 0.9;
    ModelParameters params(network.mask_, x);
    double seq_cost = sequential.cost(params);
    double par_cost = parallel.cost(params);
    cout << "sequential: " << seq_cost << " parallel: " << par_cost << endl;
    CHECK(par_cost == doctest::Approx(seq_cost));
  }
}

TEST_CASE("Time-series cost")
{
  printHeader();
  ReactionNetwork network = exampleNetwork();
  ModelParameters params(network.mask_, exampleSolution());
  VectorXd y0 = VectorXd::Constant(4, 0.5);
  VectorXd times = VectorXd::LinSpaced(6, 0, 5);
  ArrayXXd trajectory = RosenbrockIntegrator().integrate(params, y0, times);

  Eigen::Array<double, 1, Eigen::Dynamic> colmax = trajectory.colwise().maxCoeff();
  ArrayXXd normalized = trajectory.rowwise() / colmax;
  TimeSeriesData data(times, normalized, ArrayXd::Ones(4));
  CHECK(data.cost(trajectory) == doctest::Approx(0));

  ArrayXXd shifted = normalized;
  shifted(2, 1) += 0.5;
  TimeSeriesData off(times, shifted, ArrayXd::Constant(4, 0.5));
  CHECK(off.cost(trajectory) == doctest::Approx(1.0));

  SUBCASE("From replicates")
  {
    ArrayXXd a(2, 2), b(2, 2);
    a << 1, 2, 3, 4;
    b << 3, 4, 5, 6;
    VectorXd t(2);
    t << 0, 1;
    TimeSeriesData reps = TimeSeriesData::fromReplicates(t, {a, b});
    CHECK(reps.mean_(0, 0) == 2);
    CHECK(reps.mean_(1, 1) == 5);
    CHECK(reps.sigma_(0) == doctest::Approx(sqrt(2.0)));
    CHECK(reps.sigma_(1) == doctest::Approx(sqrt(2.0)));
    CHECK_THROWS_AS(TimeSeriesData::fromReplicates(t, {a}), ConfigError);
  }
}

TEST_CASE("Core problem from YAML")
{
  printHeader();
  CoreProblem::Ptr problem = CoreProblem::loadConfig("config.yaml");
  cout << problem->str() << endl;
  CHECK(problem->dimension() == 17);
  CHECK(problem->time_series_ != nullptr);
  CHECK(problem->perturbations_ != nullptr);

  VectorXd x = exampleSolution();
  double cost = problem->evaluate(x);
  cout << "cost: " << cost << endl;
  CHECK(std::isfinite(cost));
  CHECK(cost >= 0);
  CHECK(problem->evaluate(x) == cost);
  cout << problem->formatSolution(x) << endl;

  SUBCASE("Wrong dimension")
  {
    CHECK_THROWS_AS(problem->evaluate(VectorXd::Ones(16)), std::invalid_argument);
  }

  SUBCASE("Out of bounds is rejected")
  {
    VectorXd bad = x;
    bad(0) = -1;
    CHECK(!problem->feasible(bad));
    CHECK_THROWS_AS(problem->evaluate(bad), ConstraintViolation);
  }

  SUBCASE("Custom bounds")
  {
    VectorXd lower = VectorXd::Constant(17, -1);
    VectorXd upper = VectorXd::Constant(17, 1);
    CHECK_THROWS_AS(problem->setBounds(upper, lower), std::invalid_argument);
    CHECK_THROWS_AS(problem->setBounds(VectorXd::Zero(3), VectorXd::Ones(3)), std::invalid_argument);
    problem->setBounds(lower, upper);
    CHECK(!problem->feasible(x));
    CHECK(problem->feasible(VectorXd::Zero(17)));
  }

  SUBCASE("Out of bounds is clamped")
  {
    problem->options_.bounds_policy_ = BoundsPolicy::Clamp;
    VectorXd bad = x;
    bad(9) = 100;
    VectorXd clamped = x;
    clamped(9) = 20;
    CHECK(problem->evaluate(bad) == problem->evaluate(clamped));
    bad(9) = std::numeric_limits<double>::quiet_NaN();
    CHECK_THROWS_AS(problem->evaluate(bad), ConstraintViolation);
  }
}

TEST_CASE("Parallel core problem agrees with sequential")
{
  printHeader();
  YAML::Node sequential_yaml = YAML::LoadFile("config.yaml");
  YAML::Node parallel_yaml = YAML::LoadFile("config.yaml");
  parallel_yaml["Evaluation"]["parallel"] = true;
  parallel_yaml["Evaluation"]["workers"] = 3;

  CoreProblem::Ptr sequential = CoreProblem::loadConfig(sequential_yaml);
  CoreProblem::Ptr parallel = CoreProblem::loadConfig(parallel_yaml);
  REQUIRE(parallel->options_.parallel_);
  CHECK(!sequential->options_.parallel_);
  cout << parallel->str() << endl;
  CHECK(parallel->str().find("Parallel evaluation with 3 workers") != string::npos);
  CHECK(sequential->str().find("Parallel evaluation") == string::npos);

  VectorXd x = exampleSolution();
  double expected = sequential->evaluate(x);
  CHECK(std::isfinite(expected));
  CHECK(parallel->evaluate(x) == doctest::Approx(expected).epsilon(1e-12));

  VectorXd middle = (sequential->lower_ + sequential->upper_) / 2;
  CHECK(parallel->evaluate(middle) == doctest::Approx(sequential->evaluate(middle)).epsilon(1e-12));
}

TEST_CASE("Configuration errors")
{
  printHeader();
  ReactionNetwork network = exampleNetwork();

  SUBCASE("Table without time columns")
  {
    CHECK_THROWS_AS(PerturbationDataset(MatrixXd::Zero(2, 2), 4), ConfigError);
  }

  SUBCASE("More factors than nodes")
  {
    CHECK_THROWS_AS(PerturbationDataset(MatrixXd::Zero(5, 7), 4), ConfigError);
  }

  SUBCASE("Times going backwards")
  {
    MatrixXd table(1, 4);
    table << 0.1, 0, 2, 1;
    CHECK_THROWS_AS(PerturbationDataset(table, 4), ConfigError);
  }

  SUBCASE("Non-positive sigma")
  {
    CHECK_THROWS_AS(TimeSeriesData(VectorXd::LinSpaced(3, 0, 2), ArrayXXd::Ones(3, 4), ArrayXd::Zero(4)), ConfigError);
  }

  SUBCASE("Wrong initial state")
  {
    CHECK_THROWS_AS(CoreProblem(network, VectorXd::Ones(3), exampleDataset(4), TimeSeriesData::ConstPtr()), ConfigError);
  }

  SUBCASE("No data at all")
  {
    CHECK_THROWS_AS(CoreProblem(network, VectorXd::Ones(4), PerturbationDataset::ConstPtr(), TimeSeriesData::ConstPtr()),
                    ConfigError);
  }

  SUBCASE("Parallel compounding")
  {
    CHECK_THROWS_AS(EvaluationOptions(YAML::Load("{parallel: true, mode: compounding}")), ConfigError);
    CHECK_THROWS_AS(EvaluationOptions(YAML::Load("{mode: sideways}")), ConfigError);
  }

  SUBCASE("Step ceiling out of range")
  {
    CHECK(EvaluationOptions(YAML::Load("{max_steps: 1.0e8}")).max_steps_ == 100000000);
    CHECK(EvaluationOptions(YAML::Load("{max_steps: 2147483647}")).max_steps_ == std::numeric_limits<int>::max());
    CHECK_THROWS_AS(EvaluationOptions(YAML::Load("{max_steps: 1.0e10}")), ConfigError);
    CHECK_THROWS_AS(EvaluationOptions(YAML::Load("{max_steps: 0}")), ConfigError);
    CHECK_THROWS_AS(EvaluationOptions(YAML::Load("{max_steps: .nan}")), ConfigError);
  }

  SUBCASE("Ragged table in YAML")
  {
    YAML::Node yaml = YAML::Load(
      "Network:\n"
      "  - {name: A, regulates: [B]}\n"
      "  - {name: B, regulates: [A]}\n"
      "InitialState: [1, 1]\n"
      "Perturbations:\n"
      "  table: [[0.1, 0, 1], [0.2, 0]]\n");
    CHECK_THROWS_AS(CoreProblem::loadConfig(yaml), ConfigError);
  }

  SUBCASE("Missing initial state")
  {
    YAML::Node yaml = YAML::Load(
      "Network:\n"
      "  - {name: A, regulates: [B]}\n"
      "Perturbations:\n"
      "  table: [[0.1, 0, 1]]\n");
    CHECK_THROWS_AS(CoreProblem::loadConfig(yaml), ConfigError);
  }

  SUBCASE("Missing file")
  {
    CHECK_THROWS_AS(CoreProblem::loadConfig(std::string("no-such-config.yaml")), ConfigError);
  }
}

TEST_CASE("Message round trip")
{
  printHeader();
  ArrayXd arr(3);
  arr << 1.5, -2.0, 1e300;
  ArrayXXd mat(2, 3);
  mat << 1, 2, 3, 4, 5, 6;

  MessageWrapper msg;
  msg.addField("factor", 7);
  msg.addField("name", string("IRF4"));
  msg.addField("parameters", arr);
  msg.addField("matrix", mat);
  msg.addField("names", vector<string>({"IRF4", "MAF"}));

  MessageReader reader(msg.data());
  CHECK(reader.intField("factor") == 7);
  CHECK(reader.stringField("name") == "IRF4");
  CHECK((reader.arrayField("parameters") == arr).all());
  CHECK((reader.matrixField("matrix") == mat).all());
  CHECK(reader.stringsField("names") == vector<string>({"IRF4", "MAF"}));
  CHECK(!reader.hasField("error"));
  CHECK_THROWS_AS(reader.intField("name"), std::runtime_error);
  CHECK_THROWS_AS(reader.intField("nothing"), std::runtime_error);

  SUBCASE("Malformed messages")
  {
    vector<uint8_t> bytes = msg.data();
    bytes[0] = 0;
    CHECK_THROWS_AS(MessageReader(bytes), std::runtime_error);
    bytes = msg.data();
    bytes.resize(bytes.size() - 3);
    CHECK_THROWS_AS(MessageReader(bytes), std::runtime_error);
  }
}

TEST_CASE("Worker pool")
{
  printHeader();
  WorkerPool pool(3, []() -> WorkerPool::Handler {
    return [](const MessageReader& job) {
      int val = job.intField("val");
      if (val < 0)
        throw std::runtime_error("negative");
      MessageWrapper result;
      result.addField("val", 2 * val);
      return result;
    };
  });
  CHECK(pool.numWorkers() == 3);

  vector<MessageWrapper> jobs(10);
  for (int i = 0; i < 10; ++i)
    jobs[i].addField("val", i);
  vector<MessageReader> results = pool.map(jobs);
  REQUIRE(results.size() == 10);
  for (int i = 0; i < 10; ++i)
    CHECK(results[i].intField("val") == 2 * i);

  jobs[4] = MessageWrapper();
  jobs[4].addField("val", -1);
  CHECK_THROWS_AS(pool.map(jobs), std::runtime_error);

  // Still usable afterwards.
  jobs[4] = MessageWrapper();
  jobs[4].addField("val", 4);
  CHECK(pool.map(jobs)[4].intField("val") == 8);

  SUBCASE("A failed map leaves no results behind")
  {
    vector<MessageWrapper> failing(10);
    for (int i = 0; i < 10; ++i)
      failing[i].addField("val", i % 2 ? -1 : 100 + i);
    CHECK_THROWS_AS(pool.map(failing), std::runtime_error);

    vector<MessageWrapper> next(4);
    for (int i = 0; i < 4; ++i)
      next[i].addField("val", 10 * i);
    vector<MessageReader> fresh = pool.map(next);
    REQUIRE(fresh.size() == 4);
    for (int i = 0; i < 4; ++i)
      CHECK(fresh[i].intField("val") == 20 * i);
  }
}
