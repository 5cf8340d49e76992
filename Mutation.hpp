//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#ifndef CPP_MUTATION_HPP
#define CPP_MUTATION_HPP

#include <vector>
#include <random>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <Eigen/Dense>
#include <nlohmann/json.hpp>
#include "ConfigResult.hpp"


enum class DiscreteMutationType {
  NONE,   // no mutations
  ALL,    // mutate to any trait
  OTHER,  // mutate to any other trait
  RANGE   // mutate to traits within +/- range
};

NLOHMANN_JSON_SERIALIZE_ENUM(DiscreteMutationType, {
  {DiscreteMutationType::NONE, "none"},
  {DiscreteMutationType::ALL, "all"},
  {DiscreteMutationType::OTHER, "other"},
  {DiscreteMutationType::RANGE, "range"},
})

enum class ContinuousMutationType {
  NONE,      // no mutations
  UNIFORM,   // uniform mutations to any trait value
  GAUSSIAN,  // Gaussian around the parent, sdev `range`
  RANGE      // uniform within +/- range of the parent
};

NLOHMANN_JSON_SERIALIZE_ENUM(ContinuousMutationType, {
  {ContinuousMutationType::NONE, "none"},
  {ContinuousMutationType::UNIFORM, "all"},
  {ContinuousMutationType::GAUSSIAN, "gaussian"},
  {ContinuousMutationType::RANGE, "range"},
})


// Mutations of discrete traits.
//
// With `temperature == true` mutations are tied to reproduction (or imitation)
// events and `DoMutate` decides for each such event. Otherwise mutations arise
// spontaneously ("cosmic rays") and the population decides with
// `IsMutationEvent` whether the next event is a mutation.
class DiscreteMutation {
  public:
  using Type = DiscreteMutationType;

  class Parameters {
    public:
    Parameters() = default;
    Type type = Type::NONE;
    double probability = 0.0;
    size_t range = 0;
    bool temperature = false;

    bool operator==(const Parameters& rhs) const {
      return type == rhs.type && probability == rhs.probability && range == rhs.range && temperature == rhs.temperature;
    }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Parameters, type, probability, range, temperature);
  };

  explicit DiscreteMutation(size_t _n_traits) : n_traits(_n_traits), vacant(-1) {
    SetTraits(_n_traits, std::vector<bool>(_n_traits, true), -1).Warn("mutation: ");
  }

  ConfigResult SetParameters(const Parameters& _prm) {
    if (!(_prm.probability >= 0.0 && _prm.probability <= 1.0)) {
      return ConfigResult::Error("mutation probability " + std::to_string(_prm.probability) + " not in [0,1]");
    }
    if (_prm.type == Type::RANGE && _prm.range < 1) {
      return ConfigResult::Error("mutation range must be at least 1");
    }
    Parameters p = _prm;
    if (p.probability <= 0.0) {
      p.type = Type::NONE;
    }
    else if (p.type == Type::NONE) {
      p.type = Type::OTHER;
    }
    prm = p;
    return ConfigResult::Ok();
  }
  const Parameters& GetParameters() const { return prm; }

  // vacant < 0: no vacant trait
  ConfigResult SetTraits(size_t _n_traits, const std::vector<bool>& _active, int _vacant) {
    if (_active.size() != _n_traits) {
      return ConfigResult::Error("active trait mask has " + std::to_string(_active.size()) + " entries but " + std::to_string(_n_traits) + " traits");
    }
    if (_vacant >= static_cast<int>(_n_traits)) {
      return ConfigResult::Error("vacant trait " + std::to_string(_vacant) + " out of range");
    }
    n_traits = _n_traits;
    vacant = (_vacant < 0) ? -1 : _vacant;
    active = _active;
    active_idx.clear();
    dense_idx.assign(n_traits, -1);
    for (size_t i = 0; i < n_traits; i++) {
      if (!active[i] || static_cast<int>(i) == vacant) continue;
      dense_idx[i] = static_cast<int>(active_idx.size());
      active_idx.push_back(static_cast<int>(i));
    }
    return ConfigResult::Ok();
  }
  size_t NumTraits() const { return n_traits; }
  int VacantIndex() const { return vacant; }
  // number of active traits excluding the vacant one
  size_t NumActive() const { return active_idx.size(); }
  const std::vector<int>& ActiveTraits() const { return active_idx; }

  bool IsUniform() const { return !prm.temperature; }

  bool DoMutate(std::mt19937_64& rnd) const {
    if (prm.type == Type::NONE || !prm.temperature) return false;
    if (prm.probability >= 1.0) return true;
    std::uniform_real_distribution<double> uni;
    return uni(rnd) < prm.probability;
  }

  bool IsMutationEvent(std::mt19937_64& rnd) const {
    if (prm.type == Type::NONE || prm.temperature) return false;
    std::uniform_real_distribution<double> uni;
    return uni(rnd) < prm.probability;
  }

  int Mutate(int trait, std::mt19937_64& rnd) const {
    if (prm.type == Type::NONE) return trait;
    if (trait == vacant) return trait;
    const int n_active = static_cast<int>(active_idx.size());
    if (n_active < 2) return trait;

    switch (prm.type) {
      case Type::ALL: {
        std::uniform_int_distribution<int> pick(0, n_active-1);
        return active_idx[pick(rnd)];
      }
      case Type::OTHER: {
        int pos = (trait >= 0 && trait < static_cast<int>(n_traits)) ? dense_idx[trait] : -1;
        if (pos < 0) {  // current trait inactive: every active trait is 'other'
          std::uniform_int_distribution<int> pick(0, n_active-1);
          return active_idx[pick(rnd)];
        }
        std::uniform_int_distribution<int> pick(0, n_active-2);
        int r = pick(rnd);
        if (r >= pos) r++;
        return active_idx[r];
      }
      case Type::RANGE: {
        size_t n = CountRangeCandidates(trait);
        if (n == 0) return trait;
        std::uniform_int_distribution<size_t> pick(0, n-1);
        return NthRangeCandidate(trait, pick(rnd));
      }
      case Type::NONE:
        return trait;
    }
    throw std::runtime_error("unknown discrete mutation type");
  }

  // Mutational flux for densities of the active traits. `change` holds the
  // rate of change without mutations and is corrected in place. Total mass is
  // preserved whenever the active densities sum to one.
  void MutateDensity(const Eigen::VectorXd& state, Eigen::VectorXd& change) const {
    if (state.size() != static_cast<Eigen::Index>(n_traits) || change.size() != state.size()) {
      throw std::runtime_error("density vectors do not match the number of traits");
    }
    const auto d = static_cast<double>(active_idx.size());
    const double p = prm.probability;
    const double mu1 = 1.0 - p;
    switch (prm.type) {
      case Type::NONE:
        return;
      case Type::ALL: {
        if (active_idx.empty()) return;
        const double muid = p / d;
        for (int i: active_idx) {
          change(i) = change(i) * mu1 + muid * (1.0 - d * state(i));
        }
        return;
      }
      case Type::OTHER: {
        if (active_idx.size() < 2) return;
        const double muid1 = p / (d - 1.0);
        for (int i: active_idx) {
          change(i) = change(i) * mu1 + muid1 * (1.0 - d * state(i));
        }
        return;
      }
      case Type::RANGE: {
        // every individual of trait j mutates uniformly into its window
        Eigen::VectorXd inflow = Eigen::VectorXd::Zero(state.size());
        for (int j: active_idx) {
          size_t n = CountRangeCandidates(j);
          if (n == 0) continue;
          const double share = state(j) / static_cast<double>(n);
          for (size_t k = 0; k < n; k++) {
            inflow(NthRangeCandidate(j, k)) += share;
          }
        }
        for (int i: active_idx) {
          change(i) = change(i) * mu1 + p * (inflow(i) - state(i));
        }
        return;
      }
    }
    throw std::runtime_error("unknown discrete mutation type");
  }

  static std::string Name(Type t) {
    switch (t) {
      case Type::NONE: return "none";
      case Type::ALL: return "all";
      case Type::OTHER: return "other";
      case Type::RANGE: return "range";
    }
    throw std::runtime_error("unknown discrete mutation type");
  }

  private:
  Parameters prm;
  size_t n_traits;
  int vacant;
  std::vector<bool> active;
  std::vector<int> active_idx;  // active, non-vacant traits in ascending order
  std::vector<int> dense_idx;   // trait -> position in active_idx, -1 if excluded

  // offsets -range..+range wrap around the trait indices; a window wider than
  // the number of traits covers every trait exactly once
  size_t WindowWidth() const {
    return std::min<size_t>(2 * prm.range + 1, n_traits);
  }
  int WindowStart(int trait) const {
    const auto n = static_cast<int>(n_traits);
    if (WindowWidth() == n_traits) return 0;
    const int r = static_cast<int>(prm.range) % n;
    return ((trait - r) % n + n) % n;
  }

  size_t CountRangeCandidates(int trait) const {
    const size_t w = WindowWidth();
    const int start = WindowStart(trait);
    size_t count = 0;
    for (size_t k = 0; k < w; k++) {
      int t = static_cast<int>((start + k) % n_traits);
      if (dense_idx[t] >= 0) count++;
    }
    return count;
  }

  int NthRangeCandidate(int trait, size_t nth) const {
    const size_t w = WindowWidth();
    const int start = WindowStart(trait);
    for (size_t k = 0; k < w; k++) {
      int t = static_cast<int>((start + k) % n_traits);
      if (dense_idx[t] < 0) continue;
      if (nth == 0) return t;
      nth--;
    }
    throw std::runtime_error("cannot happen: range candidate out of bounds");
  }
};


// Mutations of continuous traits in [0,1].
class ContinuousMutation {
  public:
  using Type = ContinuousMutationType;

  class Parameters {
    public:
    Parameters() = default;
    Type type = Type::NONE;
    double probability = 0.0;
    double range = 0.0;   // sdev for GAUSSIAN, half-width for RANGE
    bool temperature = false;

    bool operator==(const Parameters& rhs) const {
      return type == rhs.type && probability == rhs.probability && range == rhs.range && temperature == rhs.temperature;
    }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Parameters, type, probability, range, temperature);
  };

  ContinuousMutation() = default;

  ConfigResult SetParameters(const Parameters& _prm) {
    if (!(_prm.probability >= 0.0 && _prm.probability <= 1.0)) {
      return ConfigResult::Error("mutation probability " + std::to_string(_prm.probability) + " not in [0,1]");
    }
    if ((_prm.type == Type::GAUSSIAN || _prm.type == Type::RANGE) && !(_prm.range > 0.0)) {
      return ConfigResult::Error("no valid range for " + Name(_prm.type) + " mutations");
    }
    Parameters p = _prm;
    if (p.probability <= 0.0 || p.type == Type::NONE) {
      p.type = Type::NONE;
      p.probability = 0.0;
    }
    prm = p;
    return ConfigResult::Ok();
  }
  const Parameters& GetParameters() const { return prm; }

  bool IsUniform() const { return !prm.temperature; }

  bool DoMutate(std::mt19937_64& rnd) const {
    if (prm.type == Type::NONE || !prm.temperature) return false;
    if (prm.probability >= 1.0) return true;
    std::uniform_real_distribution<double> uni;
    return uni(rnd) < prm.probability;
  }

  bool IsMutationEvent(std::mt19937_64& rnd) const {
    if (prm.type == Type::NONE || prm.temperature) return false;
    std::uniform_real_distribution<double> uni;
    return uni(rnd) < prm.probability;
  }

  double Mutate(double trait, std::mt19937_64& rnd) const {
    std::uniform_real_distribution<double> uni;
    switch (prm.type) {
      case Type::NONE:
        return trait;
      case Type::UNIFORM:
        return uni(rnd);
      case Type::GAUSSIAN: {
        // rejection sampling avoids piling up mass on the boundaries
        std::normal_distribution<double> gauss(0.0, prm.range);
        double mut;
        do {
          mut = trait + gauss(rnd);
        } while (mut < 0.0 || mut > 1.0);
        return mut;
      }
      case Type::RANGE: {
        double mut = trait + uni(rnd) * prm.range * 2.0 - prm.range;
        return std::max(std::min(mut, 1.0), 0.0);
      }
    }
    throw std::runtime_error("unknown continuous mutation type");
  }

  static std::string Name(Type t) {
    switch (t) {
      case Type::NONE: return "none";
      case Type::UNIFORM: return "all";
      case Type::GAUSSIAN: return "gaussian";
      case Type::RANGE: return "range";
    }
    throw std::runtime_error("unknown continuous mutation type");
  }

  private:
  Parameters prm;
};

#endif //CPP_MUTATION_HPP
