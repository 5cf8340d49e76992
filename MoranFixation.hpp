//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#ifndef CPP_MORAN_FIXATION_HPP
#define CPP_MORAN_FIXATION_HPP

#include <cmath>
#include <array>
#include <vector>
#include <map>
#include <limits>
#include <string>
#include <optional>
#include <utility>
#include <algorithm>
#include <stdexcept>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include "ConfigResult.hpp"
#include "PayoffToFitness.hpp"


// Birth-death chain of a mutant (A) invading a resident (B) in a population of N.
// State i is the number of mutants. fitness_A[i], fitness_B[i] are the fitness
// of mutants and residents in state i.
class BirthDeathChain {
  public:
  BirthDeathChain() : n(0) {};

  // constant fitness: classical Moran process
  static Result<BirthDeathChain> Moran(size_t N, double f_mutant, double f_resident) {
    if (N < 1) return Result<BirthDeathChain>::Error("population size must be positive");
    if (!(f_mutant > 0.0) || !(f_resident > 0.0)) {
      return Result<BirthDeathChain>::Error("fitness must be positive, got " + std::to_string(f_mutant) + " and " + std::to_string(f_resident));
    }
    return Result<BirthDeathChain>::Ok(BirthDeathChain(N, std::vector<double>(N+1, f_mutant), std::vector<double>(N+1, f_resident)));
  }

  // frequency dependent Moran process of a 2x2 game.
  // payoffs = {A vs A, A vs B, B vs A, B vs B}; each individual plays against the other N-1.
  static Result<BirthDeathChain> PairwiseGame(size_t N, const std::array<double,4>& payoffs, const PayoffToFitness& map) {
    if (N < 2) return Result<BirthDeathChain>::Error("a game needs at least two individuals");
    const double a = payoffs[0], b = payoffs[1], c = payoffs[2], d = payoffs[3];
    const double n1 = static_cast<double>(N - 1);
    std::vector<double> fa(N+1), fb(N+1);
    for (size_t i = 0; i <= N; i++) {
      const double x = static_cast<double>(i), y = static_cast<double>(N - i);
      const double pi_a = (i > 0) ? (a * (x - 1.0) + b * y) / n1 : b;
      const double pi_b = (i < N) ? (c * x + d * (y - 1.0)) / n1 : c;
      fa[i] = map.ToFitness(pi_a);
      fb[i] = map.ToFitness(pi_b);
      if (!(fa[i] > 0.0) || !(fb[i] > 0.0)) {
        return Result<BirthDeathChain>::Error("non-positive fitness with " + std::to_string(i) + " mutants, choose a different fitness map");
      }
    }
    return Result<BirthDeathChain>::Ok(BirthDeathChain(N, fa, fb));
  }

  size_t N() const { return n; }
  double FitnessMutant(size_t i) const { return fitness_A.at(i); }
  double FitnessResident(size_t i) const { return fitness_B.at(i); }

  // probability that the number of mutants increases by one
  double Tplus(size_t i) const {
    const double x = static_cast<double>(i), y = static_cast<double>(n - i);
    const double fa = fitness_A[i], fb = fitness_B[i];
    return y * x * fa / (static_cast<double>(n) * (x * fa + y * fb));
  }
  // T^-(i) / T^+(i)
  double Tratio(size_t i) const {
    return fitness_B[i] / fitness_A[i];
  }
  // the ratio is the same for every state
  bool IsConstant() const {
    return std::all_of(fitness_A.begin(), fitness_A.end(), [this](double f) { return f == fitness_A[0]; })
      && std::all_of(fitness_B.begin(), fitness_B.end(), [this](double f) { return f == fitness_B[0]; });
  }

  bool operator==(const BirthDeathChain& rhs) const {
    return n == rhs.n && fitness_A == rhs.fitness_A && fitness_B == rhs.fitness_B;
  }
  bool operator!=(const BirthDeathChain& rhs) const { return !(*this == rhs); }

  private:
  BirthDeathChain(size_t _n, std::vector<double> fa, std::vector<double> fb) : n(_n), fitness_A(std::move(fa)), fitness_B(std::move(fb)) {};
  size_t n;
  std::vector<double> fitness_A, fitness_B;
};


// Exact fixation probabilities and fixation times of a birth-death chain.
// Quantities are computed lazily and memoized until the chain changes.
class MoranFixation {
  public:
  static constexpr int RESIDENT = 0;
  static constexpr int MUTANT = 1;
  static constexpr int ABSORPTION = 2;  // index of the absorption time in FixationTimes

  class Parameters {
    public:
    Parameters() = default;
    size_t N = 100;
    double fitness_mutant = 1.0;
    double fitness_resident = 1.0;
    double init_mutant_fraction = 0.0;  // initial number of mutants is clamped to [1,N-1]
    size_t max_N_probability = 1000;    // above: approximation for N -> infinity
    size_t max_N_time = 500;            // above: fixation times are not available
    size_t n_species = 1;
    bool moran_update = true;

    bool operator==(const Parameters& rhs) const {
      return N == rhs.N && fitness_mutant == rhs.fitness_mutant && fitness_resident == rhs.fitness_resident
        && init_mutant_fraction == rhs.init_mutant_fraction && max_N_probability == rhs.max_N_probability
        && max_N_time == rhs.max_N_time && n_species == rhs.n_species && moran_update == rhs.moran_update;
    }
    bool operator!=(const Parameters& rhs) const { return !(*this == rhs); }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Parameters, N, fitness_mutant, fitness_resident, init_mutant_fraction, max_N_probability, max_N_time, n_species, moran_update);
  };

  MoranFixation() : MoranFixation(Parameters()) {};
  explicit MoranFixation(const Parameters& _prm) {
    SetParameters(_prm).Warn("fixation: ");
  }

  // Reconfiguration with identical parameters keeps the memoized values.
  ConfigResult SetParameters(const Parameters& _prm) {
    if (_prm.N < 1) {
      return ConfigResult::Error("population size must be positive");
    }
    if (!(_prm.init_mutant_fraction >= 0.0 && _prm.init_mutant_fraction <= 1.0)) {
      return ConfigResult::Error("initial mutant fraction " + std::to_string(_prm.init_mutant_fraction) + " not in [0,1]");
    }
    if (_prm == prm && chain.N() == _prm.N) return ConfigResult::Ok();
    // a game set by SetGame is rebuilt for the new population size
    auto c = game ? BirthDeathChain::PairwiseGame(_prm.N, game_payoffs, game_map)
                  : BirthDeathChain::Moran(_prm.N, _prm.fitness_mutant, _prm.fitness_resident);
    if (!c) return ConfigResult::Error(c.reason);
    prm = _prm;
    if (c.value != chain) SetChain(c.value);
    return ConfigResult::Ok();
  }
  const Parameters& GetParameters() const { return prm; }

  ConfigResult SetPopulationSize(size_t N) {
    Parameters p = prm;
    p.N = N;
    return SetParameters(p);
  }
  ConfigResult SetFitness(double f_mutant, double f_resident) {
    Parameters p = prm;
    p.fitness_mutant = f_mutant;
    p.fitness_resident = f_resident;
    return SetParameters(p);
  }

  // frequency dependent fitness from a 2x2 game. replaces the constant fitness of the parameters.
  ConfigResult SetGame(const std::array<double,4>& payoffs, const PayoffToFitness& map) {
    auto c = BirthDeathChain::PairwiseGame(prm.N, payoffs, map);
    if (!c) return ConfigResult::Error(c.reason);
    game = true;
    game_payoffs = payoffs;
    game_map = map;
    if (c.value != chain) SetChain(c.value);
    return ConfigResult::Ok();
  }
  // back to the constant fitness of the parameters
  ConfigResult ClearGame() {
    if (!game) return ConfigResult::Ok();
    auto c = BirthDeathChain::Moran(prm.N, prm.fitness_mutant, prm.fitness_resident);
    if (!c) return ConfigResult::Error(c.reason);
    game = false;
    if (c.value != chain) SetChain(c.value);
    return ConfigResult::Ok();
  }
  bool IsGame() const { return game; }

  const BirthDeathChain& Chain() const { return chain; }
  size_t N() const { return chain.N(); }

  // drop all memoized values
  void Invalidate() { cache = FixationCache(); }
  // number of times the memo has been rebuilt
  size_t CacheBuilds() const { return cache_builds; }

  // fixation probability of i mutants
  double FixationProbability(size_t i) {
    const size_t n = chain.N();
    if (i > n) throw std::out_of_range("number of mutants " + std::to_string(i) + " exceeds population size");
    if (i == 0) return 0.0;
    if (i == n) return 1.0;
    if (n > prm.max_N_probability && !game) {
      return std::max(0.0, 1.0 - std::pow(chain.Tratio(0), static_cast<double>(i)));
    }
    Prepare();
    return cache.phi[i];
  }

  // expected number of elementary steps until either trait fixates
  std::optional<double> AbsorptionTime(size_t i) {
    const size_t n = chain.N();
    if (i > n) throw std::out_of_range("number of mutants " + std::to_string(i) + " exceeds population size");
    if (n > prm.max_N_time) return std::nullopt;
    if (i == 0 || i == n) return 0.0;
    PrepareTimes();
    auto found = cache.absorption.find(i);
    if (found != cache.absorption.end()) return found->second;

    // t_i = \sum_{l<i} psi_i phi_l w_l + \sum_{l>=i} phi_i psi_l w_l
    LogSum acc;
    for (size_t l = 1; l < n; l++) {
      if (l < i) acc.Add(cache.log_psi[i] + cache.log_phi[l] + cache.log_w[l]);
      else acc.Add(cache.log_phi[i] + cache.log_psi[l] + cache.log_w[l]);
    }
    double t = std::exp(acc.Log());
    cache.absorption[i] = t;
    return t;
  }

  // expected number of elementary steps until fixation of i mutants, conditioned on their fixation
  std::optional<double> ConditionalFixationTime(size_t i) {
    const size_t n = chain.N();
    if (i > n) throw std::out_of_range("number of mutants " + std::to_string(i) + " exceeds population size");
    if (n > prm.max_N_time || i == 0) return std::nullopt;
    if (i == n) return 0.0;
    PrepareTimes();
    auto found = cache.conditional.find(i);
    if (found != cache.conditional.end()) return found->second;

    // t^A_i = \sum_{l<i} psi_i/phi_i phi_l^2 w_l + \sum_{l>=i} phi_l psi_l w_l
    LogSum acc;
    for (size_t l = 1; l < n; l++) {
      if (l < i) acc.Add(cache.log_psi[i] - cache.log_phi[i] + 2.0 * cache.log_phi[l] + cache.log_w[l]);
      else acc.Add(cache.log_phi[l] + cache.log_psi[l] + cache.log_w[l]);
    }
    double t = std::exp(acc.Log());
    cache.conditional[i] = t;
    return t;
  }

  // expected number of elementary steps until the resident recovers from i mutants, conditioned on it
  std::optional<double> ResidentFixationTime(size_t i) {
    const size_t n = chain.N();
    if (i > n) throw std::out_of_range("number of mutants " + std::to_string(i) + " exceeds population size");
    if (n > prm.max_N_time || i == n) return std::nullopt;
    if (i == 0) return 0.0;
    PrepareTimes();
    auto found = cache.resident.find(i);
    if (found != cache.resident.end()) return found->second;

    // t^B_i = \sum_{l<=i} phi_l psi_l w_l + \sum_{l>i} phi_i/psi_i psi_l^2 w_l
    LogSum acc;
    for (size_t l = 1; l < n; l++) {
      if (l <= i) acc.Add(cache.log_phi[l] + cache.log_psi[l] + cache.log_w[l]);
      else acc.Add(cache.log_phi[i] - cache.log_psi[i] + 2.0 * cache.log_psi[l] + cache.log_w[l]);
    }
    double t = std::exp(acc.Log());
    cache.resident[i] = t;
    return t;
  }

  // initial number of mutants
  size_t InitialMutants() const {
    const size_t n = chain.N();
    if (n < 2) return n;
    auto m = static_cast<size_t>(std::floor(prm.init_mutant_fraction * static_cast<double>(n)));
    return std::min(std::max<size_t>(m, 1), n - 1);
  }

  // reference levels for simulations: the fixation probability of `trait`
  // starting from InitialMutants(). empty if the analytical result does not apply.
  std::vector<double> FixationProbabilities(int trait) {
    if (!ReferenceApplies()) return {};
    const double rho = FixationProbability(InitialMutants());
    if (trait == MUTANT) return {rho};
    if (trait == RESIDENT) return {1.0 - rho};
    return {};
  }

  // reference levels in generations (N elementary steps)
  std::vector<double> FixationTimes(int trait) {
    if (!ReferenceApplies() || chain.N() > prm.max_N_time) return {};
    const size_t m = InitialMutants();
    std::optional<double> t;
    if (trait == MUTANT) t = ConditionalFixationTime(m);
    else if (trait == RESIDENT) t = ResidentFixationTime(m);
    else if (trait == ABSORPTION) t = AbsorptionTime(m);
    if (!t) return {};
    return {*t / static_cast<double>(chain.N())};
  }

  // Stationary distribution over traits in the limit of rare mutations.
  // fixation_probs[i][j]: fixation probability of a single j mutant in a population of i.
  static Result<std::vector<double>> LowMutationEquilibrium(const std::vector<std::vector<double>>& fixation_probs) {
    const size_t n = fixation_probs.size();
    if (n == 0) return Result<std::vector<double>>::Error("no traits");
    for (const auto& row: fixation_probs) {
      if (row.size() != n) return Result<std::vector<double>>::Error("fixation probabilities must form a square matrix");
    }
    // A(j,i): transition probability from i to j
    Eigen::MatrixXd A(n, n);
    for (size_t i = 0; i < n; i++) {
      for (size_t j = 0; j < n; j++) {
        A(j, i) = (i == j) ? 0.0 : fixation_probs[i][j] / static_cast<double>(n);
      }
    }
    for (size_t i = 0; i < n; i++) {
      double p_sum = A.col(i).sum();
      if (p_sum > 1.0) {
        return Result<std::vector<double>>::Error("transition probabilities from trait " + std::to_string(i) + " exceed one");
      }
      A(i, i) = 1.0 - p_sum;  // probability that the state doesn't change
    }

    // Ax = x => (A-I)x = 0, last row replaced by the normalization condition
    A -= Eigen::MatrixXd::Identity(n, n);
    A.row(n-1).array() += 1.0;
    Eigen::VectorXd b = Eigen::VectorXd::Zero(n);
    b(n-1) = 1.0;
    Eigen::VectorXd x = A.householderQr().solve(b);

    std::vector<double> ans(n);
    for (size_t i = 0; i < n; i++) {
      ans[i] = x(i);
      if (x(i) < -1.0e-6) throw std::runtime_error("cannot happen: negative stationary probability");
    }
    return Result<std::vector<double>>::Ok(ans);
  }

  private:
  class FixationCache {
    public:
    bool valid = false;
    std::vector<double> log_q;      // log_q[k] = \sum_{j=1}^{k} log Tratio(j), k < N
    std::vector<double> phi;        // fixation probabilities, 0..N
    std::vector<double> log_phi;
    double log_sum_q = 0.0;         // log \sum_{k=0}^{N-1} q_k
    bool times_valid = false;
    std::vector<double> log_psi;    // log (1 - phi_i), 0..N
    std::vector<double> log_w;      // log (\sum_k q_k)/(q_l T^+_l), 0 < l < N
    std::map<size_t,double> absorption;
    std::map<size_t,double> conditional;
    std::map<size_t,double> resident;
  };

  // running log-sum-exp
  class LogSum {
    public:
    void Add(double x) {
      if (x == -std::numeric_limits<double>::infinity()) return;
      if (x > max) { sum = sum * std::exp(max - x) + 1.0; max = x; }
      else { sum += std::exp(x - max); }
    }
    double Log() const { return max + std::log(sum); }
    private:
    double max = -std::numeric_limits<double>::infinity();
    double sum = 0.0;
  };

  Parameters prm;
  BirthDeathChain chain;
  bool game = false;
  std::array<double,4> game_payoffs = {0.0, 0.0, 0.0, 0.0};
  PayoffToFitness game_map;
  FixationCache cache;
  size_t cache_builds = 0;

  void SetChain(const BirthDeathChain& c) {
    chain = c;
    Invalidate();
  }

  bool ReferenceApplies() const {
    return prm.n_species == 1 && prm.moran_update && chain.N() >= 2;
  }

  // fixation probabilities from the cumulative products q_k = \prod_{j=1}^{k} Tratio(j)
  void Prepare() {
    if (cache.valid) return;
    const size_t n = chain.N();
    cache.log_q.assign(n, 0.0);
    for (size_t k = 1; k < n; k++) {
      cache.log_q[k] = cache.log_q[k-1] + std::log(chain.Tratio(k));
    }
    // rescale by the largest product to avoid overflow
    const double log_max = *std::max_element(cache.log_q.begin(), cache.log_q.end());
    std::vector<double> cum(n+1, 0.0);
    std::vector<double> log_cum(n+1, -std::numeric_limits<double>::infinity());
    LogSum acc;
    for (size_t k = 0; k < n; k++) {
      cum[k+1] = cum[k] + std::exp(cache.log_q[k] - log_max);
      acc.Add(cache.log_q[k]);
      log_cum[k+1] = acc.Log();
    }
    cache.phi.assign(n+1, 0.0);
    cache.log_phi.assign(n+1, -std::numeric_limits<double>::infinity());
    for (size_t i = 1; i < n; i++) {
      cache.phi[i] = cum[i] / cum[n];
      cache.log_phi[i] = log_cum[i] - log_cum[n];
    }
    cache.phi[n] = 1.0;
    cache.log_phi[n] = 0.0;
    cache.log_sum_q = log_cum[n];
    cache.valid = true;
    cache_builds++;
  }

  // Green's function of the transient states:
  //   G(i,l) = phi_i psi_l w_l for i <= l,  psi_i phi_l w_l for i > l
  // Every term is positive, so the time sums are free of cancellation.
  void PrepareTimes() {
    Prepare();
    if (cache.times_valid) return;
    const size_t n = chain.N();
    // psi_i from the suffix sums of q_k
    cache.log_psi.assign(n+1, -std::numeric_limits<double>::infinity());
    LogSum acc;
    for (size_t k = n; k-- > 0; ) {
      acc.Add(cache.log_q[k]);
      cache.log_psi[k] = acc.Log() - cache.log_sum_q;
    }
    cache.log_psi[0] = 0.0;
    cache.log_w.assign(n, 0.0);
    for (size_t l = 1; l < n; l++) {
      cache.log_w[l] = cache.log_sum_q - cache.log_q[l] - std::log(chain.Tplus(l));
    }
    cache.times_valid = true;
  }
};

#endif //CPP_MORAN_FIXATION_HPP
