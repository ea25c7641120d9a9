#include "Math/LinearAlgebra.hpp"
#include "Math/Matrix.hpp"
#include "Math/NullSpace.hpp"
#include "Math/NumericDomain.hpp"
#include "Math/Rational.hpp"
#include "Utilities/MatrixStringParse.hpp"
#include <cmath>
#include <complex>
#include <cstdint>
#include <gmpxx.h>
#include <gtest/gtest.h>
#include <random>

using namespace buckingham;
using math::DenseMatrix, math::Rational, math::Row, math::Col;

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(NullSpaceTest, BasicAssertions) {
  // rows L, T, M; columns ℓ, g, m, T, θ of a pendulum
  auto A = "[1 1 0 0 0; 0 -2 0 1 0; 0 0 1 0 0]"_rat;
  auto NOpt = LU::nullSpace(A);
  ASSERT_TRUE(NOpt.has_value());
  // NOLINTNEXTLINE(bugprone-unchecked-optional-access)
  auto &N = *NOpt;
  llvm::errs() << "A = \n" << A << "\nnull space = \n" << N.basis << "\n";
  EXPECT_EQ(N.rank, 3);
  EXPECT_EQ(N.q, (llvm::SmallVector<unsigned, 0>{1, 0, 2, 3, 4}));
  EXPECT_EQ(N.basis,
            "[1//2 0; -1//2 0; 0 0; 1 0; 0 1]"_rat);
  DenseMatrix<Rational> V = LU::unpermute(N.basis, N.q);
  EXPECT_EQ(V, "[-1//2 0; 1//2 0; 0 0; 1 0; 0 1]"_rat);
  EXPECT_EQ(A * V, (DenseMatrix<Rational>(Row{3}, Col{2})));
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(NullSpaceShapesTest, BasicAssertions) {
  // full column rank
  auto I = LU::nullSpace(DenseMatrix<Rational>::identity(3));
  ASSERT_TRUE(I.has_value());
  EXPECT_EQ(I->rank, 3);
  EXPECT_EQ(size_t(I->basis.numRow()), 3);
  EXPECT_EQ(size_t(I->basis.numCol()), 0);
  // no columns at all
  auto E = LU::nullSpace(DenseMatrix<Rational>(Row{0}, Col{0}));
  ASSERT_TRUE(E.has_value());
  EXPECT_EQ(size_t(E->basis.numRow()), 0);
  EXPECT_EQ(size_t(E->basis.numCol()), 0);
  // no rows: everything is free
  auto W = LU::nullSpace(DenseMatrix<Rational>(Row{0}, Col{3}));
  ASSERT_TRUE(W.has_value());
  EXPECT_EQ(W->basis, DenseMatrix<Rational>::identity(3));
  // zero matrix
  auto Z = LU::nullSpace("[0 0 0; 0 0 0]"_rat);
  ASSERT_TRUE(Z.has_value());
  EXPECT_EQ(Z->rank, 0);
  EXPECT_EQ(Z->basis, DenseMatrix<Rational>::identity(3));
  // tall and rank deficient
  auto T = "[1 2; 2 4; 3 6; -1 -2]"_rat;
  auto N = LU::nullSpace(T);
  ASSERT_TRUE(N.has_value());
  EXPECT_EQ(N->rank, 1);
  ASSERT_EQ(size_t(N->basis.numCol()), 1);
  EXPECT_EQ(T * LU::unpermute(N->basis, N->q),
            (DenseMatrix<Rational>(Row{4}, Col{1})));
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(NullSpaceRandomTest, BasicAssertions) {
  std::mt19937 gen(9);
  std::uniform_int_distribution<int64_t> dist(-2, 2);
  for (size_t n = 1; n < 5; ++n)
    for (size_t m = 1; m < 7; ++m)
      for (size_t rep = 0; rep < 4; ++rep) {
        DenseMatrix<Rational> A(Row{n}, Col{m});
        for (auto &x : A) x = dist(gen);
        auto NOpt = LU::nullSpace(A);
        ASSERT_TRUE(NOpt.has_value());
        // NOLINTNEXTLINE(bugprone-unchecked-optional-access)
        auto &N = *NOpt;
        EXPECT_EQ(size_t(N.basis.numCol()), m - N.rank);
        EXPECT_EQ(A * LU::unpermute(N.basis, N.q),
                  (DenseMatrix<Rational>(Row{n}, Col{m - N.rank})));
        // the same kernel with arbitrary precision
        auto QOpt = LU::nullSpace(A.map(math::toMPQ));
        ASSERT_TRUE(QOpt.has_value());
        EXPECT_EQ(QOpt->rank, N.rank);
        EXPECT_EQ(QOpt->q, N.q);
        EXPECT_EQ(QOpt->basis, N.basis.map(math::toMPQ));
      }
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(NullSpaceFloatTest, BasicAssertions) {
  auto A = "[1 2 3; 2 4 6]"_mat.map<double>();
  auto NOpt = LU::nullSpace(A);
  ASSERT_TRUE(NOpt.has_value());
  // NOLINTNEXTLINE(bugprone-unchecked-optional-access)
  auto &N = *NOpt;
  llvm::errs() << "null space = \n" << N.basis << "\n";
  EXPECT_EQ(N.rank, 1);
  ASSERT_EQ(size_t(N.basis.numCol()), 2);
  auto R = A * LU::unpermute(N.basis, N.q);
  for (double x : R) EXPECT_NEAR(x, 0.0, 1e-12);
}

// NOLINTNEXTLINE(modernize-use-trailing-return-type)
TEST(NullSpaceComplexTest, BasicAssertions) {
  using C = std::complex<double>;
  // second row is 2i times the first
  DenseMatrix<C> A{{C{1, 0}, C{0, 1}, C{2, 0}},
                   {C{0, 2}, C{-2, 0}, C{0, 4}}};
  auto NOpt = LU::nullSpace(A);
  ASSERT_TRUE(NOpt.has_value());
  // NOLINTNEXTLINE(bugprone-unchecked-optional-access)
  auto &N = *NOpt;
  llvm::errs() << "null space = \n" << N.basis << "\n";
  EXPECT_EQ(N.rank, 1);
  ASSERT_EQ(size_t(N.basis.numCol()), 2);
  auto R = A * LU::unpermute(N.basis, N.q);
  for (const C &x : R) EXPECT_NEAR(std::abs(x), 0.0, 1e-12);
}
