// SPDX-License-Identifier: MIT
#pragma once

/**
 * @file parallel.hpp
 * @brief Parallelization macro for OpenMP or sequential execution
 *
 * The per-row work inside one backward-induction step (lookahead shock
 * generation, covariance assembly, path simulation) is embarrassingly
 * parallel. Loops are annotated with this macro so the library builds
 * with or without OpenMP.
 *
 * Usage:
 *   OSP_PRAGMA_PARALLEL_FOR
 *   for (Eigen::Index i = 0; i < n; ++i) { ... }
 *
 * Every parallel loop writes only to its own row and draws random numbers
 * from a row-owned stream, so results do not depend on the thread count.
 */

#if defined(_OPENMP)
    #define OSP_PRAGMA_PARALLEL_FOR _Pragma("omp parallel for")
#else
    #define OSP_PRAGMA_PARALLEL_FOR
#endif
