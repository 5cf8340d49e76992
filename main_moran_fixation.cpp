//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#include <iostream>
#include <fstream>
#include <vector>
#include <array>
#include <chrono>
#include <random>
#include <omp.h>
#include <nlohmann/json.hpp>
#include "MoranFixation.hpp"
#include "PayoffToFitness.hpp"
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
  MoranFixation::Parameters fixation;
  PayoffToFitness::Parameters fitness_map;
  double score_mutant = 1.0;
  double score_resident = 1.0;
  std::vector<double> game;  // optional 2x2 payoffs {A vs A, A vs B, B vs A, B vs B}
  size_t num_samples = 1000;
  uint64_t _seed = 1234567890ull;

  NLOHMANN_DEFINE_TYPE_INTRUSIVE(Parameters, fixation, fitness_map, score_mutant, score_resident, game, num_samples, _seed);
};

// returns the number of elementary steps until absorption. `fixated` is set if the mutant took over.
size_t RunMoran(const BirthDeathChain& chain, size_t m, std::mt19937_64& rnd, bool& fixated) {
  const size_t N = chain.N();
  std::uniform_real_distribution<double> uni;
  size_t i = m, steps = 0;
  while (i > 0 && i < N) {
    const double fa = static_cast<double>(i) * chain.FitnessMutant(i);
    const double fb = static_cast<double>(N - i) * chain.FitnessResident(i);
    bool birth_mutant = uni(rnd) * (fa + fb) < fa;
    bool death_mutant = uni(rnd) * static_cast<double>(N) < static_cast<double>(i);
    if (birth_mutant && !death_mutant) i++;
    else if (!birth_mutant && death_mutant) i--;
    steps++;
  }
  fixated = (i == N);
  return steps;
}


int main(int argc, char *argv[]) {
  #if defined(NDEBUG)
  icecream::ic.disable();
  #else
  icecream::ic.prefix("[", omp_get_thread_num, "/" , omp_get_max_threads, "]: ");
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
  if (prm.num_samples == 0) {
    std::cerr << "[Error] num_samples must be positive" << std::endl;
    return 1;
  }

  MeasureElapsed("initialize");

  PayoffToFitness map(prm.fitness_map);
  prm.fixation.fitness_mutant = map.ToFitness(prm.score_mutant);
  prm.fixation.fitness_resident = map.ToFitness(prm.score_resident);
  MoranFixation mf;
  if (!mf.SetParameters(prm.fixation).Warn("fixation: ")) {
    return 1;
  }
  if (!prm.game.empty()) {
    if (prm.game.size() != 4) {
      std::cerr << "[Error] game must have four payoffs" << std::endl;
      return 1;
    }
    if (!mf.SetGame({prm.game[0], prm.game[1], prm.game[2], prm.game[3]}, map).Warn("game: ")) {
      return 1;
    }
  }
  IC(prm.fixation.fitness_mutant, prm.fixation.fitness_resident, mf.InitialMutants());

  MeasureElapsed("analytics");

  nlohmann::json output;
  output["initial_mutants"] = mf.InitialMutants();
  output["fixation_probability"] = mf.FixationProbabilities(MoranFixation::MUTANT);
  output["fixation_time_mutant"] = mf.FixationTimes(MoranFixation::MUTANT);
  output["fixation_time_resident"] = mf.FixationTimes(MoranFixation::RESIDENT);
  output["absorption_time"] = mf.FixationTimes(MoranFixation::ABSORPTION);

  MeasureElapsed("simulation");

  std::vector<std::mt19937_64> rnds;
  for (uint32_t t = 0; t < static_cast<uint32_t>(omp_get_max_threads()); t++) {
    std::seed_seq s = {static_cast<uint32_t>(prm._seed), t};
    rnds.emplace_back(s);
  }

  const BirthDeathChain& chain = mf.Chain();
  const size_t m = mf.InitialMutants();
  size_t num_fixated = 0;
  double steps_fixated = 0.0, steps_lost = 0.0, steps_total = 0.0;
  #pragma omp parallel for schedule(dynamic, 1)
  for (size_t i = 0; i < prm.num_samples; ++i) {
    const int th = omp_get_thread_num();
    bool fixated = false;
    size_t steps = RunMoran(chain, m, rnds[th], fixated);
    #pragma omp critical
    {
      steps_total += static_cast<double>(steps);
      if (fixated) {
        num_fixated++;
        steps_fixated += static_cast<double>(steps);
      }
      else {
        steps_lost += static_cast<double>(steps);
      }
    }
  }

  const double N = static_cast<double>(chain.N());
  const size_t num_lost = prm.num_samples - num_fixated;
  output["sampled_fixation_probability"] = static_cast<double>(num_fixated) / static_cast<double>(prm.num_samples);
  output["sampled_fixation_time_mutant"] = (num_fixated > 0) ? steps_fixated / num_fixated / N : 0.0;
  output["sampled_fixation_time_resident"] = (num_lost > 0) ? steps_lost / num_lost / N : 0.0;
  output["sampled_absorption_time"] = steps_total / prm.num_samples / N;
  std::cout << output.dump(2) << std::endl;
  {
    std::ofstream fout("_output.json");
    fout << output.dump(2);
    fout.close();
  }

  MeasureElapsed("done");
  return 0;
}
