//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#include <iostream>
#include <cmath>
#include <vector>
#include <random>
#include "UpdateRule.hpp"
#include "icecream-cpp/icecream.hpp"

#define myassert(x) do {                              \
if (!(x)) {                                           \
printf("Assertion failed: %s, file %s, line %d\n"   \
, #x, __FILE__, __LINE__);                   \
exit(1);                                            \
}                                                   \
} while (0)

bool IsClose(double x, double y, double tol = 1.0e-9) {
  return std::abs(x-y) < tol;
}

UpdateRule MakeRule(UpdateRule::Type t, double noise = 1.0, double error = 0.0) {
  UpdateRule::Parameters prm;
  prm.type = t;
  prm.noise = noise;
  prm.error = error;
  prm.min_fitness = 0.0;
  prm.max_fitness = 2.0;
  UpdateRule rule;
  myassert( rule.SetParameters(prm) );
  return rule;
}

void test_Best() {
  std::mt19937_64 rnd(1234567890ull);
  UpdateRule best = MakeRule(UpdateRule::Type::BEST);
  myassert( best.AdoptionProb(1.0, 1.5) == 1.0 );
  myassert( best.AdoptionProb(1.0, 0.5) == 0.0 );
  myassert( best.AdoptionProb(1.0, 1.0) == 0.0 );
  for (int i = 0; i < 100; i++) { myassert( !best.Adopt(1.0, 1.0, rnd) ); }

  UpdateRule best_random = MakeRule(UpdateRule::Type::BEST_RANDOM);
  myassert( best_random.AdoptionProb(1.0, 1.0) == 0.5 );
  int count = 0;
  for (int i = 0; i < 10000; i++) { if (best_random.Adopt(1.0, 1.0, rnd)) count++; }
  myassert( IsClose(count / 10000.0, 0.5, 0.03) );

  // error keeps a residual probability of mistakes
  UpdateRule noisy = MakeRule(UpdateRule::Type::BEST, 1.0, 0.1);
  myassert( IsClose(noisy.AdoptionProb(1.0, 1.5), 0.9) );
  myassert( IsClose(noisy.AdoptionProb(1.0, 0.5), 0.1) );
}

void test_Imitate() {
  UpdateRule rule = MakeRule(UpdateRule::Type::IMITATE, 1.0);
  myassert( IsClose(rule.AdoptionProb(1.0, 1.0), 0.5) );
  // (other - my) / (2 noise scale) + 1/2, scale = 2
  myassert( IsClose(rule.AdoptionProb(0.5, 1.5), 0.75) );
  myassert( IsClose(rule.AdoptionProb(1.5, 0.5), 0.25) );
  myassert( IsClose(rule.AdoptionProb(0.0, 2.0), 1.0) );

  UpdateRule step = MakeRule(UpdateRule::Type::IMITATE, 0.0);
  myassert( step.AdoptionProb(1.0, 1.1) == 1.0 );
  myassert( step.AdoptionProb(1.1, 1.0) == 0.0 );
  myassert( step.AdoptionProb(1.0, 1.0) == 0.5 );

  UpdateRule better = MakeRule(UpdateRule::Type::IMITATE_BETTER, 1.0);
  myassert( better.AdoptionProb(1.0, 0.5) == 0.0 );
  myassert( better.AdoptionProb(1.0, 1.0) == 0.0 );
  myassert( IsClose(better.AdoptionProb(0.5, 1.5), 0.5) );
}

void test_Thermal() {
  UpdateRule rule = MakeRule(UpdateRule::Type::THERMAL, 0.5);
  myassert( IsClose(rule.AdoptionProb(1.0, 1.0), 0.5) );
  myassert( IsClose(rule.AdoptionProb(1.0, 2.0), 1.0 / (1.0 + std::exp(-2.0))) );
  myassert( IsClose(rule.AdoptionProb(2.0, 1.0) + rule.AdoptionProb(1.0, 2.0), 1.0) );

  UpdateRule step = MakeRule(UpdateRule::Type::THERMAL, 0.0);
  myassert( step.AdoptionProb(1.0, 1.0 + 1.0e-12) == 1.0 );
  myassert( step.AdoptionProb(1.0, 1.0) == 0.5 );

  UpdateRule noisy = MakeRule(UpdateRule::Type::THERMAL, 0.0, 0.05);
  myassert( IsClose(noisy.AdoptionProb(0.0, 2.0), 0.95) );
}

void test_Proportional() {
  UpdateRule rule = MakeRule(UpdateRule::Type::PROPORTIONAL);
  myassert( IsClose(rule.AdoptionProb(1.0, 3.0), 0.75) );
  myassert( IsClose(rule.AdoptionProb(0.0, 0.0), 0.5) );
}

void test_BestResponse() {
  UpdateRule rule = MakeRule(UpdateRule::Type::BEST_RESPONSE);
  const std::vector<double> fitness = {1.0, 3.0, 5.0, 3.0};
  myassert( rule.ChooseTrait(0, fitness, {true, true, true, true}) == 2 );
  myassert( rule.ChooseTrait(0, fitness, {true, true, false, true}) == 1 );
  // ties keep the current trait
  myassert( rule.ChooseTrait(3, fitness, {true, true, false, true}) == 3 );
}

void test_Configuration() {
  UpdateRule rule = MakeRule(UpdateRule::Type::IMITATE, 0.5);
  UpdateRule::Parameters prm = rule.GetParameters();
  prm.noise = -1.0;
  myassert( !rule.SetParameters(prm) );
  prm.noise = 1.0;
  prm.error = 0.6;
  myassert( !rule.SetParameters(prm) );
  myassert( rule.GetParameters().noise == 0.5 );
  myassert( !rule.SetFitnessRange(1.0, 0.0) );
  myassert( rule.SetFitnessRange(0.0, 4.0) );
  myassert( !rule.SetType(UpdateRule::Type::IMITATE) );
  myassert( rule.SetType(UpdateRule::Type::THERMAL) );

  nlohmann::json j = {{"type", "best-random"}, {"noise", 0.0}, {"error", 0.01}, {"min_fitness", -1.0}, {"max_fitness", 1.0}};
  auto p2 = j.get<UpdateRule::Parameters>();
  myassert( p2.type == UpdateRule::Type::BEST_RANDOM );
  myassert( rule.SetParameters(p2) );
  myassert( rule.GetParameters() == p2 );
}

void test_SelectModel() {
  std::mt19937_64 rnd(1234567890ull);
  UpdateRule best = MakeRule(UpdateRule::Type::BEST);
  myassert( best.SelectModel(1.0, {0.5, 1.5, 1.2}, rnd) == 1 );
  myassert( best.SelectModel(2.0, {0.5, 1.5, 1.2}, rnd) == -1 );
  myassert( best.SelectModel(1.0, {}, rnd) == -1 );

  // a single model reduces to the pairwise rule
  UpdateRule imitate = MakeRule(UpdateRule::Type::IMITATE);
  int count = 0;
  const int n = 20000;
  for (int i = 0; i < n; i++) { if (imitate.SelectModel(0.5, {1.5}, rnd) == 0) count++; }
  myassert( IsClose(count / static_cast<double>(n), 0.75, 0.02) );

  // models that are never adopted are never picked
  UpdateRule better = MakeRule(UpdateRule::Type::IMITATE_BETTER);
  for (int i = 0; i < 1000; i++) {
    int s = better.SelectModel(1.0, {0.5, 2.0, 1.0}, rnd);
    myassert( s == -1 || s == 1 );
  }

  UpdateRule prop = MakeRule(UpdateRule::Type::PROPORTIONAL);
  std::vector<int> histo(3, 0);
  for (int i = 0; i < n; i++) { histo[prop.SelectModel(1.0, {1.0, 2.0}, rnd) + 1]++; }
  IC(histo);
  myassert( IsClose(histo[0] / static_cast<double>(n), 0.25, 0.02) );
  myassert( IsClose(histo[2] / static_cast<double>(n), 0.5, 0.02) );
}

int main(int argc, char* argv[]) {
  test_Best();
  test_Imitate();
  test_Thermal();
  test_Proportional();
  test_BestResponse();
  test_Configuration();
  test_SelectModel();
  std::cerr << "Testing UpdateRule passed" << std::endl;
  return 0;
}
