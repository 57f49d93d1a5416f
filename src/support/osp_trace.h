// SPDX-License-Identifier: MIT
/**
 * @file osp_trace.h
 * @brief USDT (User Statically-Defined Tracing) probes for the osp library
 *
 * Zero-overhead tracing points that can be enabled at runtime with bpftrace,
 * systemtap or perf. When the library is built without systemtap-sdt the
 * probes compile away entirely.
 *
 * Example usage with bpftrace:
 *   # Per-step induction timings
 *   sudo bpftrace -e 'usdt:./lib*.so:osp:induction_step_complete {
 *       printf("step %d: %d unique, %d sims, %.3fs\n", arg0, arg1, arg2, arg3); }'
 *
 *   # Hyperparameter optimisations that hit the iteration cap
 *   sudo bpftrace -e 'usdt:./lib*.so:osp:convergence_failed { ... }'
 */

#ifndef OSP_TRACE_H
#define OSP_TRACE_H

#include <stddef.h>

#ifdef HAVE_SYSTEMTAP_SDT
#include <sys/sdt.h>
#else
#define DTRACE_PROBE(provider, probe) do {} while(0)
#define DTRACE_PROBE1(provider, probe, arg1) do {} while(0)
#define DTRACE_PROBE2(provider, probe, arg1, arg2) do {} while(0)
#define DTRACE_PROBE3(provider, probe, arg1, arg2, arg3) do {} while(0)
#define DTRACE_PROBE4(provider, probe, arg1, arg2, arg3, arg4) do {} while(0)
#define DTRACE_PROBE5(provider, probe, arg1, arg2, arg3, arg4, arg5) do {} while(0)
#endif

/**
 * Provider name for all osp probes
 */
#define OSP_PROVIDER osp

/**
 * Module identifiers, passed as the first argument of the generic probes
 */
#define OSP_MODULE_INDUCTION        1
#define OSP_MODULE_DESIGN           2
#define OSP_MODULE_GAUSSIAN_PROCESS 3
#define OSP_MODULE_SPLINE           4
#define OSP_MODULE_LINEAR_BASIS     5
#define OSP_MODULE_ALLOCATOR        6
#define OSP_MODULE_EVALUATOR        7
#define OSP_MODULE_NELDER_MEAD      8
#define OSP_MODULE_SIMULATOR        9

/**
 * ============================================================================
 * Algorithm Lifecycle Probes
 * ============================================================================
 */

/**
 * Fired when an algorithm begins execution
 * @param module_id: Module identifier (OSP_MODULE_* constant)
 * @param param1..param3: Module-specific parameters (sizes, steps, budgets)
 */
#define OSP_TRACE_ALGO_START(module_id, param1, param2, param3) \
    DTRACE_PROBE4(OSP_PROVIDER, algo_start, module_id, param1, param2, param3)

/**
 * Fired periodically to report progress
 * @param module_id: Module identifier
 * @param current: Current progress (step, iteration)
 * @param total: Total work
 * @param metric: Progress metric
 */
#define OSP_TRACE_ALGO_PROGRESS(module_id, current, total, metric) \
    DTRACE_PROBE4(OSP_PROVIDER, algo_progress, module_id, current, total, metric)

/**
 * Fired when an algorithm completes successfully
 * @param module_id: Module identifier
 * @param iterations: Iterations or steps completed
 * @param final_metric: Final metric value
 */
#define OSP_TRACE_ALGO_COMPLETE(module_id, iterations, final_metric) \
    DTRACE_PROBE3(OSP_PROVIDER, algo_complete, module_id, iterations, final_metric)

/**
 * ============================================================================
 * Convergence Probes (MLE optimiser, Brent boundary search)
 * ============================================================================
 */

#define OSP_TRACE_CONVERGENCE_ITER(module_id, iter, value, spread) \
    DTRACE_PROBE4(OSP_PROVIDER, convergence_iter, module_id, iter, value, spread)

#define OSP_TRACE_CONVERGENCE_SUCCESS(module_id, final_iter, final_value) \
    DTRACE_PROBE3(OSP_PROVIDER, convergence_success, module_id, final_iter, final_value)

#define OSP_TRACE_CONVERGENCE_FAILED(module_id, max_iter, final_value) \
    DTRACE_PROBE3(OSP_PROVIDER, convergence_failed, module_id, max_iter, final_value)

/**
 * ============================================================================
 * Error Probes
 * ============================================================================
 */

/**
 * Fired when configuration validation fails
 * @param module_id: Module identifier
 * @param error_code: OspErrorCode as int
 * @param param1: Offending value
 * @param param2: Expected value or threshold
 */
#define OSP_TRACE_VALIDATION_ERROR(module_id, error_code, param1, param2) \
    DTRACE_PROBE4(OSP_PROVIDER, validation_error, module_id, error_code, param1, param2)

/**
 * Fired when a runtime failure aborts an operation
 * @param module_id: Module identifier
 * @param error_code: OspErrorCode as int
 * @param context: Context value (usually the time step)
 */
#define OSP_TRACE_RUNTIME_ERROR(module_id, error_code, context) \
    DTRACE_PROBE3(OSP_PROVIDER, runtime_error, module_id, error_code, context)

/**
 * ============================================================================
 * Backward Induction Probes
 * ============================================================================
 */

/**
 * Fired before the design for a step is generated
 * @param step: Time step being fitted
 * @param lookahead: Effective lookahead window
 */
#define OSP_TRACE_INDUCTION_STEP_BEGIN(step, lookahead) \
    DTRACE_PROBE2(OSP_PROVIDER, induction_step_begin, step, lookahead)

/**
 * Fired after the surrogate for a step is stored
 * @param step: Time step
 * @param n_unique: Unique design inputs
 * @param n_sims: Total simulations Σ r(x)
 * @param seconds: Wall-clock time for the step
 */
#define OSP_TRACE_INDUCTION_STEP_COMPLETE(step, n_unique, n_sims, seconds) \
    DTRACE_PROBE4(OSP_PROVIDER, induction_step_complete, step, n_unique, n_sims, seconds)

/**
 * ============================================================================
 * Sequential Design / Allocator Probes
 * ============================================================================
 */

/**
 * Fired when a new input location joins the design
 * @param step: Time step
 * @param n_unique: Design size after the addition
 * @param score: Acquisition value of the chosen candidate
 */
#define OSP_TRACE_DESIGN_POINT_ADDED(step, n_unique, score) \
    DTRACE_PROBE3(OSP_PROVIDER, design_point_added, step, n_unique, score)

/**
 * Fired when replications are added at an existing input
 * @param step: Time step
 * @param index: Input index within the design
 * @param replications: Replication count after the addition
 */
#define OSP_TRACE_DESIGN_REPLICATION_ADDED(step, index, replications) \
    DTRACE_PROBE3(OSP_PROVIDER, design_replication_added, step, index, replications)

/**
 * Fired when the simulation budget stops the allocator early
 * @param step: Time step
 * @param n_unique: Unique inputs reached
 * @param budget: Budget that was exhausted
 */
#define OSP_TRACE_BUDGET_EXHAUSTED(step, n_unique, budget) \
    DTRACE_PROBE3(OSP_PROVIDER, budget_exhausted, step, n_unique, budget)

/**
 * ============================================================================
 * Brent Root-Finding Probes
 * ============================================================================
 */

#define OSP_TRACE_BRENT_START(a, b, tolerance, max_iter) \
    DTRACE_PROBE4(OSP_PROVIDER, brent_start, a, b, tolerance, max_iter)

#define OSP_TRACE_BRENT_ITER(iter, x, fx, interval_width) \
    DTRACE_PROBE4(OSP_PROVIDER, brent_iter, iter, x, fx, interval_width)

#define OSP_TRACE_BRENT_COMPLETE(root, iterations, converged) \
    DTRACE_PROBE3(OSP_PROVIDER, brent_complete, root, iterations, converged)

#endif  // OSP_TRACE_H
