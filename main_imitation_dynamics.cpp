//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#include <iostream>
#include <fstream>
#include <vector>
#include <chrono>
#include <random>
#include <algorithm>
#include <stdexcept>
#include <nlohmann/json.hpp>
#include "PayoffToFitness.hpp"
#include "Mutation.hpp"
#include "UpdateRule.hpp"
#include "SpeciesUpdate.hpp"
#include "icecream-cpp/icecream.hpp"


std::string prev_key;
std::chrono::system_clock::time_point start;
void MeasureElapsed(const std::string& key) {
  std::chrono::system_clock::time_point end = std::chrono::system_clock::now();
  if (!prev_key.empty()) {
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end-start).count();
    std::cerr << "T " << prev_key << " finished in " << elapsed << " ms" << std::endl;
  }
  start = end;
  prev_key = key;
}

class Parameters {
  public:
  Parameters() = default;
  size_t T_max = 100000;
  size_t T_print = 1000;
  std::vector<size_t> species_sizes = {100};
  // payoffs[t][u]: payoff of trait t against trait u. species s plays against species (s+1) % n_species.
  std::vector<std::vector<double>> payoffs = {{1.0, 0.0}, {0.0, 1.0}};
  PayoffToFitness::Parameters fitness_map;
  UpdateRule::Parameters update;
  DiscreteMutation::Parameters mutation;
  SpeciesUpdate::Parameters species_update;
  uint64_t _seed = 1234567890ull;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(Parameters, T_max, T_print, species_sizes, payoffs, fitness_map, update, mutation, species_update, _seed);
};

// well-mixed populations of several species with pairwise imitation
class ImitationDynamics {
  public:
  explicit ImitationDynamics(const Parameters& _prm) :
    prm(_prm), n_traits(_prm.payoffs.size()), map(_prm.fitness_map), mutation(_prm.payoffs.size()),
    species_update(_prm.species_sizes.size(), _prm.species_update), rnd(_prm._seed) {
    mutation.SetParameters(prm.mutation).Warn("mutation: ");
    ValidPayoffs();

    // fitness range of the module for the linear imitation rules
    double min_f = map.ToFitness(prm.payoffs[0][0]), max_f = min_f;
    for (const auto& row: prm.payoffs) {
      for (double p: row) {
        min_f = std::min(min_f, map.ToFitness(p));
        max_f = std::max(max_f, map.ToFitness(p));
      }
    }
    UpdateRule::Parameters up = prm.update;
    up.min_fitness = min_f;
    up.max_fitness = max_f;
    rule.SetParameters(up).Warn("player update: ");

    std::uniform_int_distribution<int> pick(0, static_cast<int>(n_traits) - 1);
    for (size_t n: prm.species_sizes) {
      std::vector<int> traits(n);
      std::vector<size_t> counts(n_traits, 0);
      for (size_t i = 0; i < n; i++) {
        traits[i] = pick(rnd);
        counts[traits[i]]++;
      }
      population.push_back(traits);
      trait_counts.push_back(counts);
    }
  }

  size_t NumSpecies() const { return population.size(); }
  const std::vector<size_t>& TraitCounts(size_t s) const { return trait_counts[s]; }

  // fitness of trait t of species s against the trait distribution of its opponent species
  double Fitness(size_t s, int t) const {
    const size_t opp = (s + 1) % NumSpecies();
    const double n = static_cast<double>(population[opp].size());
    double payoff = 0.0;
    for (size_t u = 0; u < n_traits; u++) {
      payoff += prm.payoffs[t][u] * static_cast<double>(trait_counts[opp][u]) / n;
    }
    return map.ToFitness(payoff);
  }

  void Update() {
    std::vector<SpeciesStats> stats;
    for (size_t s = 0; s < NumSpecies(); s++) {
      double total = 0.0;
      for (size_t t = 0; t < n_traits; t++) {
        total += static_cast<double>(trait_counts[s][t]) * Fitness(s, static_cast<int>(t));
      }
      stats.emplace_back(static_cast<double>(population[s].size()), total);
    }
    auto next = species_update.NextSpecies(stats, rnd);
    if (!next) {
      throw std::runtime_error("species selection failed: " + next.reason);
    }
    const size_t s = next.value;
    auto& traits = population[s];
    std::uniform_int_distribution<size_t> pick(0, traits.size() - 1);
    const size_t focal = pick(rnd);
    const int my_trait = traits[focal];

    int new_trait = my_trait;
    if (mutation.IsMutationEvent(rnd)) {
      new_trait = mutation.Mutate(my_trait, rnd);
    }
    else {
      if (rule.GetType() == UpdateRule::Type::BEST_RESPONSE) {
        std::vector<double> fitness(n_traits);
        for (size_t t = 0; t < n_traits; t++) { fitness[t] = Fitness(s, static_cast<int>(t)); }
        new_trait = rule.ChooseTrait(my_trait, fitness, std::vector<bool>(n_traits, true));
      }
      else {
        const int model_trait = traits[pick(rnd)];
        if (rule.Adopt(Fitness(s, my_trait), Fitness(s, model_trait), rnd)) {
          new_trait = model_trait;
        }
      }
      if (mutation.DoMutate(rnd)) {
        new_trait = mutation.Mutate(new_trait, rnd);
      }
    }

    if (new_trait != my_trait) {
      traits[focal] = new_trait;
      trait_counts[s][my_trait]--;
      trait_counts[s][new_trait]++;
    }
  }

  private:
  const Parameters prm;
  const size_t n_traits;
  PayoffToFitness map;
  DiscreteMutation mutation;
  UpdateRule rule;
  SpeciesUpdate species_update;
  std::mt19937_64 rnd;
  std::vector<std::vector<int>> population;
  std::vector<std::vector<size_t>> trait_counts;

  void ValidPayoffs() const {
    if (n_traits < 1) throw std::runtime_error("payoff matrix is empty");
    for (const auto& row: prm.payoffs) {
      if (row.size() != n_traits) throw std::runtime_error("payoff matrix must be square");
    }
    if (prm.species_sizes.empty()) throw std::runtime_error("no species");
    for (size_t n: prm.species_sizes) {
      if (n == 0) throw std::runtime_error("species must not be empty");
    }
  }
};


int main(int argc, char *argv[]) {
  #if defined(NDEBUG)
  icecream::ic.disable();
  #endif

  if( argc != 2 ) {
    std::cerr << "Error : invalid argument" << std::endl;
    std::cerr << "  Usage : " << argv[0] << " <parameter_json_file>" << std::endl;
    return 1;
  }

  Parameters prm;
  {
    std::ifstream fin(argv[1]);
    nlohmann::json input;
    fin >> input;
    prm = input.get<Parameters>();
  }
  if (prm.T_print == 0) {
    std::cerr << "[Error] T_print must be positive" << std::endl;
    return 1;
  }
  IC(static_cast<nlohmann::json>(prm).dump());

  MeasureElapsed("initialize");

  ImitationDynamics eco(prm);

  MeasureElapsed("simulation");

  std::ofstream tout("timeseries.dat");
  for (size_t t = 0; t < prm.T_max; t++) {
    eco.Update();
    if (t % prm.T_print == prm.T_print - 1) {
      tout << t + 1;
      for (size_t s = 0; s < eco.NumSpecies(); s++) {
        const double n_inv = 1.0 / static_cast<double>(prm.species_sizes[s]);
        for (size_t c: eco.TraitCounts(s)) {
          tout << ' ' << static_cast<double>(c) * n_inv;
        }
      }
      tout << std::endl;
    }
  }
  tout.close();

  {
    nlohmann::json output;
    for (size_t s = 0; s < eco.NumSpecies(); s++) {
      output["trait_counts"].push_back(eco.TraitCounts(s));
    }
    std::ofstream fout("_output.json");
    fout << output.dump(2);
    fout.close();
  }

  MeasureElapsed("done");
  return 0;
}
