#pragma once

#include "Dimensions/PiGroups.hpp"
#include "Dimensions/Registry.hpp"
#include "Math/LinearAlgebra.hpp"
#include "Math/Matrix.hpp"
#include "Math/NullSpace.hpp"
#include "Math/NumericDomain.hpp"
#include "Math/Rational.hpp"
#include <benchmark/benchmark.h>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <gmpxx.h>
#include <llvm/Support/Error.h>
#include <random>

using buckingham::math::DenseMatrix, buckingham::math::Rational,
  buckingham::math::Row, buckingham::math::Col;

// small integer entries keep the fixed width rationals from overflowing
inline auto randomExponents(std::mt19937_64 &rng, size_t m, size_t n)
  -> DenseMatrix<Rational> {
  std::uniform_int_distribution<int64_t> dist(-3, 3);
  DenseMatrix<Rational> A(Row{m}, Col{n});
  for (auto &x : A) x = dist(rng);
  return A;
}

template <class T> static void BM_FactPQ(benchmark::State &state) {
  std::mt19937_64 rng(0);
  size_t m = state.range(0), n = state.range(1);
  DenseMatrix<Rational> R = randomExponents(rng, m, n);
  DenseMatrix<T> A;
  if constexpr (std::same_as<T, mpq_class>) A = R.map(buckingham::math::toMPQ);
  else if constexpr (std::same_as<T, double>)
    A = R.map([](Rational x) { return double(x); });
  else A = R;
  for (auto _ : state) {
    auto F = buckingham::LU::factPQ(A);
    benchmark::DoNotOptimize(F);
  }
}
BENCHMARK_TEMPLATE(BM_FactPQ, Rational)->Args({3, 5})->Args({8, 12});
BENCHMARK_TEMPLATE(BM_FactPQ, mpq_class)->Args({3, 5})->Args({8, 12});
BENCHMARK_TEMPLATE(BM_FactPQ, double)->Args({3, 5})->Args({8, 12});

template <class T> static void BM_NullSpace(benchmark::State &state) {
  std::mt19937_64 rng(1);
  DenseMatrix<Rational> R = randomExponents(rng, 4, 9);
  DenseMatrix<T> A;
  if constexpr (std::same_as<T, mpq_class>) A = R.map(buckingham::math::toMPQ);
  else A = R;
  for (auto _ : state) {
    auto N = buckingham::LU::nullSpace(A);
    benchmark::DoNotOptimize(N);
  }
}
BENCHMARK_TEMPLATE(BM_NullSpace, Rational);
BENCHMARK_TEMPLATE(BM_NullSpace, mpq_class);

static void BM_PendulumGroups(benchmark::State &state) {
  using buckingham::dims::ParameterSpec;
  buckingham::dims::ParameterRegistry reg;
  llvm::cantFail(reg.setParameters(llvm::ArrayRef<ParameterSpec>{
    {"ℓ", "unit:m"},
    {"g", "quantity:9.8 m/s^2"},
    {"m", "unit:g"},
    {"T", "dimension:T"},
    {"θ", "unit:NoDims"}}));
  buckingham::dims::PiOptions opts;
  if (state.range(0)) opts.domain = buckingham::dims::RationalDomain::Arbitrary;
  for (auto _ : state) {
    auto groups = llvm::cantFail(buckingham::dims::piGroups(reg, opts));
    benchmark::DoNotOptimize(groups);
  }
}
BENCHMARK(BM_PendulumGroups)->Arg(0)->Arg(1);
