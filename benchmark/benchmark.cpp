#include "include/factorization_benchmark.hpp"
#include <benchmark/benchmark.h>

BENCHMARK_MAIN();
