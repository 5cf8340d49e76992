//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#ifndef CPP_PAYOFF_TO_FITNESS_HPP
#define CPP_PAYOFF_TO_FITNESS_HPP

#include <cmath>
#include <string>
#include <vector>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "ConfigResult.hpp"


enum class FitnessMap {
  NONE,         // fitness = score
  STATIC,       // fitness = b + w score
  CONVEX,       // fitness = b (1 - w) + w score
  EXPONENTIAL   // fitness = b exp(w score)
};

NLOHMANN_JSON_SERIALIZE_ENUM(FitnessMap, {
  {FitnessMap::NONE, "none"},
  {FitnessMap::STATIC, "static"},
  {FitnessMap::CONVEX, "convex"},
  {FitnessMap::EXPONENTIAL, "exponential"},
})


class PayoffToFitness {
  public:
  using Map = FitnessMap;

  class Parameters {
    public:
    Parameters() = default;
    Map map = Map::NONE;
    double baseline = 1.0;
    double selection = 1.0;

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Parameters, map, baseline, selection);
  };

  PayoffToFitness() = default;
  explicit PayoffToFitness(Map _map, double b = 1.0, double w = 1.0) {
    prm.map = _map;
    SetBaseline(b);
    SetSelection(w).Warn("fitness map: ");
  }
  explicit PayoffToFitness(const Parameters& _prm) : PayoffToFitness(_prm.map, _prm.baseline, _prm.selection) {};

  double ToFitness(double score) const {
    const double b = prm.baseline, w = prm.selection;
    switch (prm.map) {
      case Map::NONE:
        return score;
      case Map::STATIC:
        return b + w * score;
      case Map::CONVEX:
        return b + w * (score - b);
      case Map::EXPONENTIAL:
        return b * std::exp(w * score);
    }
    throw std::runtime_error("unknown fitness map");
  }

  double ToScore(double fitness) const {
    const double b = prm.baseline, w = prm.selection;
    switch (prm.map) {
      case Map::NONE:
        return fitness;
      case Map::STATIC:
        return (fitness - b) / w;
      case Map::CONVEX:
        return (fitness - b * (1.0 - w)) / w;
      case Map::EXPONENTIAL:
        return std::log(fitness / b) / w;
    }
    throw std::runtime_error("unknown fitness map");
  }

  std::vector<double> ToFitness(const std::vector<double>& scores) const {
    std::vector<double> ans(scores.size());
    for (size_t i = 0; i < scores.size(); i++) {
      ans[i] = ToFitness(scores[i]);
    }
    return ans;
  }

  void SetMap(Map _map) { prm.map = _map; }
  Map GetMap() const { return prm.map; }
  bool IsMap(Map _map) const { return prm.map == _map; }

  void SetBaseline(double b) { prm.baseline = b; }
  double GetBaseline() const { return prm.baseline; }

  // selection strength must be positive
  ConfigResult SetSelection(double w) {
    if (!(w > 0.0)) {
      return ConfigResult::Error("selection strength " + std::to_string(w) + " not positive - keeping " + std::to_string(prm.selection));
    }
    prm.selection = w;
    return ConfigResult::Ok();
  }
  double GetSelection() const { return prm.selection; }

  ConfigResult SetParameters(const Parameters& _prm) {
    ConfigResult res = SetSelection(_prm.selection);
    if (!res) return res;
    prm.map = _prm.map;
    prm.baseline = _prm.baseline;
    return res;
  }
  const Parameters& GetParameters() const { return prm; }

  std::string Name() const { return Name(prm.map); }
  static std::string Name(Map m) {
    switch (m) {
      case Map::NONE: return "none";
      case Map::STATIC: return "static";
      case Map::CONVEX: return "convex";
      case Map::EXPONENTIAL: return "exponential";
    }
    throw std::runtime_error("unknown fitness map");
  }
  std::string Title() const {
    switch (prm.map) {
      case Map::NONE: return "no mapping";
      case Map::STATIC: return "b+w*score";
      case Map::CONVEX: return "b*(1-w)+w*score";
      case Map::EXPONENTIAL: return "b*exp(w*score)";
    }
    throw std::runtime_error("unknown fitness map");
  }

  private:
  Parameters prm;
};

#endif //CPP_PAYOFF_TO_FITNESS_HPP
