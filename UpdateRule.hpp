//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#ifndef CPP_UPDATE_RULE_HPP
#define CPP_UPDATE_RULE_HPP

#include <cmath>
#include <vector>
#include <random>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "ConfigResult.hpp"


enum class PlayerUpdateType {
  BEST,            // best wins (equal - stay)
  BEST_RANDOM,     // best wins (equal - random)
  BEST_RESPONSE,   // best-response
  IMITATE,         // imitate/replicate (linear)
  IMITATE_BETTER,  // imitate/replicate (better only)
  PROPORTIONAL,    // proportional to payoff
  THERMAL          // Fermi/thermal update
};

NLOHMANN_JSON_SERIALIZE_ENUM(PlayerUpdateType, {
  {PlayerUpdateType::BEST, "best"},
  {PlayerUpdateType::BEST_RANDOM, "best-random"},
  {PlayerUpdateType::BEST_RESPONSE, "best-response"},
  {PlayerUpdateType::IMITATE, "imitate"},
  {PlayerUpdateType::IMITATE_BETTER, "imitate-better"},
  {PlayerUpdateType::PROPORTIONAL, "proportional"},
  {PlayerUpdateType::THERMAL, "thermal"},
})


// Decides whether a focal individual adopts the trait of a model individual.
// The linear imitation rules are normalized by the fitness range of the module,
// [min_fitness, max_fitness], which also serves as the baseline of the
// proportional rule.
class UpdateRule {
  public:
  using Type = PlayerUpdateType;

  class Parameters {
    public:
    Parameters() = default;
    Type type = Type::IMITATE;
    double noise = 1.0;
    double error = 0.0;
    double min_fitness = 0.0;
    double max_fitness = 1.0;

    bool operator==(const Parameters& rhs) const {
      return type == rhs.type && noise == rhs.noise && error == rhs.error
        && min_fitness == rhs.min_fitness && max_fitness == rhs.max_fitness;
    }

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Parameters, type, noise, error, min_fitness, max_fitness);
  };

  UpdateRule() = default;
  explicit UpdateRule(const Parameters& _prm) {
    SetParameters(_prm).Warn("player update: ");
  }

  ConfigResult SetParameters(const Parameters& _prm) {
    if (!(_prm.noise >= 0.0)) {
      return ConfigResult::Error("noise " + std::to_string(_prm.noise) + " must be non-negative");
    }
    if (!(_prm.error >= 0.0 && _prm.error <= 0.5)) {
      return ConfigResult::Error("error " + std::to_string(_prm.error) + " not in [0,0.5]");
    }
    if (!(_prm.max_fitness >= _prm.min_fitness)) {
      return ConfigResult::Error("invalid fitness range [" + std::to_string(_prm.min_fitness) + "," + std::to_string(_prm.max_fitness) + "]");
    }
    prm = _prm;
    return ConfigResult::Ok();
  }
  const Parameters& GetParameters() const { return prm; }

  // returns true if the type changed
  bool SetType(Type t) {
    if (t == prm.type) return false;
    prm.type = t;
    return true;
  }
  Type GetType() const { return prm.type; }

  ConfigResult SetFitnessRange(double min_fitness, double max_fitness) {
    Parameters p = prm;
    p.min_fitness = min_fitness;
    p.max_fitness = max_fitness;
    return SetParameters(p);
  }

  // probability that the focal individual with fitness `my` adopts the trait
  // of a model with fitness `other`
  double AdoptionProb(double my, double other) const {
    return Clamp(RawProb(my, other));
  }

  bool Adopt(double my, double other, std::mt19937_64& rnd) const {
    double p = AdoptionProb(my, other);
    if (p <= 0.0) return false;
    if (p >= 1.0) return true;
    std::uniform_real_distribution<double> uni;
    return uni(rnd) < p;
  }

  // best response: active trait with the highest fitness. ties keep the current trait.
  int ChooseTrait(int my_trait, const std::vector<double>& trait_fitness, const std::vector<bool>& active) const {
    if (trait_fitness.size() != active.size()) {
      throw std::runtime_error("trait fitness and active mask differ in size");
    }
    const auto n = static_cast<int>(trait_fitness.size());
    bool valid = (my_trait >= 0 && my_trait < n && active[my_trait]);
    int idx = valid ? my_trait : -1;
    double max = valid ? trait_fitness[my_trait] : 0.0;
    for (int t = 0; t < n; t++) {
      if (!active[t]) continue;
      if (idx < 0 || trait_fitness[t] > max) {
        max = trait_fitness[t];
        idx = t;
      }
    }
    return (idx < 0) ? my_trait : idx;
  }

  // Competition of the focal individual against a group of models. Returns
  // the index of the adopted model or -1 if the focal individual keeps its trait.
  int SelectModel(double my, const std::vector<double>& others, std::mt19937_64& rnd) const {
    if (others.empty()) return -1;
    std::uniform_real_distribution<double> uni;
    constexpr double tolerance = 1.0e-8;
    switch (prm.type) {
      case Type::BEST: {
        int best = -1;
        double best_score = my;
        for (size_t i = 0; i < others.size(); i++) {
          if (others[i] > best_score + tolerance) {
            best_score = others[i];
            best = static_cast<int>(i);
          }
        }
        return best;
      }
      case Type::BEST_RANDOM: {
        int best = -1;
        double best_score = my;
        for (size_t i = 0; i < others.size(); i++) {
          if (others[i] > best_score + tolerance) {
            best_score = others[i];
            best = static_cast<int>(i);
          }
          else if (std::abs(others[i] - best_score) < tolerance && uni(rnd) < 0.5) {
            best = static_cast<int>(i);
          }
        }
        return best;
      }
      case Type::PROPORTIONAL: {
        // roulette wheel including the focal individual
        const double my_fit = my - prm.min_fitness;
        double total = my_fit;
        for (double o: others) { total += o - prm.min_fitness; }
        if (total <= 0.0) {
          std::uniform_int_distribution<size_t> hit(0, others.size());
          size_t h = hit(rnd);
          return (h == others.size()) ? -1 : static_cast<int>(h);
        }
        double choice = uni(rnd) * total;
        if (choice < my_fit) return -1;
        choice -= my_fit;
        for (size_t i = 0; i < others.size(); i++) {
          double bin = others[i] - prm.min_fitness;
          if (choice < bin) return static_cast<int>(i);
          choice -= bin;
        }
        return static_cast<int>(others.size()) - 1;  // rounding
      }
      case Type::IMITATE:
      case Type::IMITATE_BETTER:
      case Type::THERMAL: {
        // each model is adopted independently with its adoption probability;
        // if several succeed one of them is picked proportional to probability
        std::vector<double> c_probs(others.size());
        double n_prob = 1.0, norm = 0.0;
        for (size_t i = 0; i < others.size(); i++) {
          double a = AdoptionProb(my, others[i]);
          norm += a;
          c_probs[i] = norm;
          n_prob *= 1.0 - a;
        }
        if (norm <= 0.0) return -1;
        double choice = uni(rnd);
        if (choice >= 1.0 - n_prob) return -1;
        if (others.size() == 1) return 0;
        double scale = (1.0 - n_prob) / norm;
        for (size_t i = 0; i < others.size(); i++) {
          if (choice < c_probs[i] * scale) return static_cast<int>(i);
        }
        throw std::runtime_error("cannot happen: no model selected in " + Name(prm.type) + " update");
      }
      case Type::BEST_RESPONSE:
        throw std::runtime_error("best-response update requires ChooseTrait");
    }
    throw std::runtime_error("unknown player update type");
  }

  static std::string Name(Type t) {
    switch (t) {
      case Type::BEST: return "best";
      case Type::BEST_RANDOM: return "best-random";
      case Type::BEST_RESPONSE: return "best-response";
      case Type::IMITATE: return "imitate";
      case Type::IMITATE_BETTER: return "imitate-better";
      case Type::PROPORTIONAL: return "proportional";
      case Type::THERMAL: return "thermal";
    }
    throw std::runtime_error("unknown player update type");
  }

  private:
  Parameters prm;

  double Clamp(double p) const {
    return std::min(1.0 - prm.error, std::max(prm.error, p));
  }

  // zero noise: step function, `tie` for equal fitness
  static double Step(double diff, double tie) {
    if (diff > 0.0) return 1.0;
    return (diff < 0.0) ? 0.0 : tie;
  }

  double RawProb(double my, double other) const {
    const double diff = other - my;
    const double scale = prm.max_fitness - prm.min_fitness;
    switch (prm.type) {
      case Type::BEST:
        return Step(diff, 0.0);
      case Type::BEST_RANDOM:
        return (std::abs(diff) < 1.0e-8) ? 0.5 : Step(diff, 0.5);
      case Type::IMITATE:
        if (prm.noise <= 0.0 || scale <= 0.0) return Step(diff, 0.5);
        return std::min(1.0, std::max(0.0, diff / (2.0 * prm.noise * scale) + 0.5));
      case Type::IMITATE_BETTER:
        if (diff <= 0.0) return 0.0;
        if (prm.noise <= 0.0 || scale <= 0.0) return 1.0;
        return std::min(1.0, diff / (prm.noise * scale));
      case Type::PROPORTIONAL: {
        const double a = my - prm.min_fitness, b = other - prm.min_fitness;
        if (a + b <= 0.0) return 0.5;
        return b / (a + b);
      }
      case Type::THERMAL:
        if (prm.noise <= 0.0) return Step(diff, 0.5);
        // 1/(1+exp(-x)) written with expm1 for symmetric accuracy around x=0
        return 1.0 / (2.0 + std::expm1(-diff / prm.noise));
      case Type::BEST_RESPONSE:
        throw std::runtime_error("best-response update requires ChooseTrait");
    }
    throw std::runtime_error("unknown player update type");
  }
};

#endif //CPP_UPDATE_RULE_HPP
