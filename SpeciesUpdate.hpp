//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#ifndef CPP_SPECIES_UPDATE_HPP
#define CPP_SPECIES_UPDATE_HPP

#include <vector>
#include <random>
#include <string>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "ConfigResult.hpp"


enum class SpeciesUpdateType {
  SIZE,     // pick species proportional to rate x population size
  UNIFORM,  // pick species proportional to rate
  FITNESS,  // pick species proportional to rate x total fitness
  TURNS     // species take turns
};

NLOHMANN_JSON_SERIALIZE_ENUM(SpeciesUpdateType, {
  {SpeciesUpdateType::SIZE, "size"},
  {SpeciesUpdateType::UNIFORM, "uniform"},
  {SpeciesUpdateType::FITNESS, "fitness"},
  {SpeciesUpdateType::TURNS, "turns"},
})


class SpeciesStats {
  public:
  SpeciesStats(double _population_size, double _total_fitness) : population_size(_population_size), total_fitness(_total_fitness) {};
  double population_size;
  double total_fitness;
};


// Picks the species whose individual is updated next in multi-species models.
class SpeciesUpdate {
  public:
  using Type = SpeciesUpdateType;

  class Parameters {
    public:
    Parameters() = default;
    Type type = Type::SIZE;
    std::vector<double> rates = {1.0};

    NLOHMANN_DEFINE_TYPE_INTRUSIVE(Parameters, type, rates);
  };

  explicit SpeciesUpdate(size_t _n_species) : n_species(_n_species), rates(_n_species, 1.0), next_idx(-1) {};

  SpeciesUpdate(size_t _n_species, const Parameters& _prm) : SpeciesUpdate(_n_species) {
    SetType(_prm.type);
    SetRates(_prm.rates).Warn("species update: ");
  }

  size_t NumSpecies() const { return n_species; }

  // returns true if the type changed
  bool SetType(Type t) {
    if (t == type) return false;
    type = t;
    next_idx = -1;
    return true;
  }
  Type GetType() const { return type; }

  // rates must be positive. a shorter vector is repeated over the species.
  ConfigResult SetRates(const std::vector<double>& _rates) {
    if (_rates.empty()) {
      return ConfigResult::Error("no update rates given");
    }
    for (double r: _rates) {
      if (!(r > 0.0)) {
        return ConfigResult::Error("update rate " + std::to_string(r) + " not positive - keeping previous rates");
      }
    }
    for (size_t i = 0; i < n_species; i++) {
      rates[i] = _rates[i % _rates.size()];
    }
    return ConfigResult::Ok();
  }
  const std::vector<double>& GetRates() const { return rates; }
  double GetRate(size_t species) const { return rates.at(species); }

  // restart the round robin of TURNS
  void Reset() { next_idx = -1; }

  Result<size_t> NextSpecies(const std::vector<SpeciesStats>& stats, std::mt19937_64& rnd) {
    if (n_species == 0) {
      return Result<size_t>::Error("no species");
    }
    if (type == Type::TURNS) {
      next_idx = (next_idx + 1) % static_cast<int>(n_species);
      return Result<size_t>::Ok(static_cast<size_t>(next_idx));
    }
    if (n_species == 1) return Result<size_t>::Ok(0);
    if (stats.size() != n_species) {
      return Result<size_t>::Error("statistics for " + std::to_string(stats.size()) + " species but " + std::to_string(n_species) + " species present");
    }

    std::vector<double> weights(n_species);
    double total = 0.0;
    for (size_t i = 0; i < n_species; i++) {
      weights[i] = rates[i] * Weight(stats[i]);
      if (weights[i] < 0.0) {
        return Result<size_t>::Error("negative weight " + std::to_string(weights[i]) + " for species " + std::to_string(i));
      }
      total += weights[i];
    }
    if (!(total > 0.0)) {
      return Result<size_t>::Error("all species have zero weight");
    }

    std::uniform_real_distribution<double> uni;
    double r = uni(rnd) * total;
    size_t last = 0;
    for (size_t i = 0; i < n_species; i++) {
      if (weights[i] <= 0.0) continue;
      last = i;
      r -= weights[i];
      if (r < 0.0) return Result<size_t>::Ok(i);
    }
    return Result<size_t>::Ok(last);  // rounding
  }

  static std::string Name(Type t) {
    switch (t) {
      case Type::SIZE: return "size";
      case Type::UNIFORM: return "uniform";
      case Type::FITNESS: return "fitness";
      case Type::TURNS: return "turns";
    }
    throw std::runtime_error("unknown species update type");
  }

  private:
  size_t n_species;
  Type type = Type::SIZE;
  std::vector<double> rates;
  int next_idx;

  double Weight(const SpeciesStats& s) const {
    switch (type) {
      case Type::SIZE: return s.population_size;
      case Type::FITNESS: return s.total_fitness;
      case Type::UNIFORM: return 1.0;
      case Type::TURNS: break;
    }
    throw std::runtime_error("cannot happen: no weight for " + Name(type) + " species update");
  }
};

#endif //CPP_SPECIES_UPDATE_HPP
