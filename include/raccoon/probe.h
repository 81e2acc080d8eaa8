#ifndef RACCOON_PROBE_H
#define RACCOON_PROBE_H

/**
 * Direct Raccoon oracle probe
 *
 * Detects servers whose behavior reveals whether a DH premaster secret
 * starts with a zero byte. Includes:
 *
 * - Vectors and the shuffled vector set builder
 * - The response collector on top of a ParallelScheduler
 * - The oracle classifier and the per-combination fingerprint state
 * - The scan loop (DirectRaccoonProbe)
 * - ParallelExecutor, the std::async based scheduler
 * - OpenSSL, Botan and seeded random sources
 *
 * Usage:
 *   #include <raccoon/probe.h>
 *
 *   using namespace raccoon;
 *   using namespace raccoon::probe;
 *
 *   auto scheduler = std::make_shared<ParallelExecutor>(engine);
 *   DirectRaccoonProbe probe(scheduler, baseline,
 *                            std::make_shared<StructuralEqualityOracle>());
 *
 *   auto result = probe.run(site_report);
 *   if (result.verdict == TestResult::TRUE) {
 *       // The server leaks the leading zero byte
 *   }
 */

#include <raccoon/types.h>
#include <raccoon/error.h>
#include <raccoon/result.h>
#include <raccoon/cipher_suites.h>
#include <raccoon/site_report.h>
#include <raccoon/error_reporter.h>

#include <raccoon/probe/fingerprint.h>
#include <raccoon/probe/vector.h>
#include <raccoon/probe/execution.h>
#include <raccoon/probe/random_source.h>
#include <raccoon/probe/vector_set_builder.h>
#include <raccoon/probe/response_collector.h>
#include <raccoon/probe/oracle_classifier.h>
#include <raccoon/probe/cipher_suite_fingerprint.h>
#include <raccoon/probe/parallel_executor.h>
#include <raccoon/probe/direct_raccoon_probe.h>

#endif // RACCOON_PROBE_H
