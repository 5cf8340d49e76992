//
// Created by sim_evo_fixation contributors on 2026/10/19.
//

#include <iostream>
#include <cmath>
#include <vector>
#include <random>
#include "SpeciesUpdate.hpp"
#include "icecream-cpp/icecream.hpp"

#define myassert(x) do {                              \
if (!(x)) {                                           \
printf("Assertion failed: %s, file %s, line %d\n"   \
, #x, __FILE__, __LINE__);                   \
exit(1);                                            \
}                                                   \
} while (0)

bool IsClose(double x, double y, double tol) {
  return std::abs(x-y) < tol;
}

std::vector<double> Frequencies(SpeciesUpdate& su, const std::vector<SpeciesStats>& stats, std::mt19937_64& rnd, int n) {
  std::vector<double> freq(su.NumSpecies(), 0.0);
  for (int i = 0; i < n; i++) {
    auto res = su.NextSpecies(stats, rnd);
    myassert( res );
    freq[res.value] += 1.0 / n;
  }
  return freq;
}

void test_Size() {
  std::mt19937_64 rnd(1234567890ull);
  SpeciesUpdate su(3);
  myassert( su.GetType() == SpeciesUpdate::Type::SIZE );
  const std::vector<SpeciesStats> stats = {{100.0, 1.0}, {300.0, 1.0}, {0.0, 5.0}};
  auto freq = Frequencies(su, stats, rnd, 20000);
  IC(freq);
  myassert( IsClose(freq[0], 0.25, 0.02) );
  myassert( IsClose(freq[1], 0.75, 0.02) );
  myassert( freq[2] == 0.0 );

  myassert( su.SetRates({3.0, 1.0, 1.0}) );
  freq = Frequencies(su, stats, rnd, 20000);
  myassert( IsClose(freq[0], 0.5, 0.02) );
}

void test_FitnessAndUniform() {
  std::mt19937_64 rnd(1234567890ull);
  SpeciesUpdate su(2);
  su.SetType(SpeciesUpdate::Type::FITNESS);
  const std::vector<SpeciesStats> stats = {{10.0, 1.0}, {10.0, 4.0}};
  auto freq = Frequencies(su, stats, rnd, 20000);
  myassert( IsClose(freq[1], 0.8, 0.02) );

  su.SetType(SpeciesUpdate::Type::UNIFORM);
  myassert( su.SetRates({1.0, 3.0}) );
  freq = Frequencies(su, stats, rnd, 20000);
  myassert( IsClose(freq[1], 0.75, 0.02) );
}

void test_Turns() {
  std::mt19937_64 rnd(1234567890ull);
  SpeciesUpdate su(3);
  su.SetType(SpeciesUpdate::Type::TURNS);
  for (size_t i = 0; i < 9; i++) {
    auto res = su.NextSpecies({}, rnd);
    myassert( res );
    myassert( res.value == i % 3 );
  }
  su.Reset();
  myassert( su.NextSpecies({}, rnd).value == 0 );
}

void test_Errors() {
  std::mt19937_64 rnd(1234567890ull);
  SpeciesUpdate su(3);
  myassert( !su.SetRates({1.0, 0.0, 1.0}) );
  myassert( !su.SetRates({}) );
  myassert( su.GetRates() == std::vector<double>({1.0, 1.0, 1.0}) );
  // shorter rate vectors are repeated
  myassert( su.SetRates({2.0, 0.5}) );
  myassert( su.GetRates() == std::vector<double>({2.0, 0.5, 2.0}) );

  auto res = su.NextSpecies({{1.0, 1.0}}, rnd);
  myassert( !res );
  IC(res.reason);
  res = su.NextSpecies({{0.0, 1.0}, {0.0, 1.0}, {0.0, 1.0}}, rnd);
  myassert( !res );

  nlohmann::json j = {{"type", "fitness"}, {"rates", {1.0, 2.0}}};
  SpeciesUpdate su2(4, j.get<SpeciesUpdate::Parameters>());
  myassert( su2.GetType() == SpeciesUpdate::Type::FITNESS );
  myassert( su2.GetRate(3) == 2.0 );
}

int main(int argc, char* argv[]) {
  test_Size();
  test_FitnessAndUniform();
  test_Turns();
  test_Errors();
  std::cerr << "Testing SpeciesUpdate passed" << std::endl;
  return 0;
}
