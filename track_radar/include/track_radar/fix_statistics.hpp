#pragma once

#include <track_radar/atomic_cell.hpp>

#include <cstdint>
#include <limits>
#include <string>

namespace track_radar
{

/**
 * @class FixStatistics
 * @brief Session counters plus the guard that keeps fix evaluation single-flight.
 *
 * Readers (info requests, logging) may run on any thread.
 */
class FixStatistics
{
public:
  FixStatistics() = default;

  /// Claims the evaluation slot. False (and counted as skipped) if a fix is still in flight.
  bool tryBeginUpdate();
  /// Publishes the result of the fix that holds the slot and releases it.
  void completeUpdate(double signedDistance, double accuracyM);

  void reset();

  /// Last published signed distance; max double until the first fix completes.
  double signedDistance() const { return signedDistance_.load(); }
  double accuracy() const { return accuracy_.load(); }
  uint64_t updates() const { return updates_.load(); }
  uint64_t skipped() const { return skipped_.load(); }

  std::string toString() const;

private:
  AtomicCell<bool> updating_{false};
  AtomicCell<double> signedDistance_{std::numeric_limits<double>::max()};
  AtomicCell<double> accuracy_{0.0};
  AtomicCell<uint64_t> updates_{0};
  AtomicCell<uint64_t> skipped_{0};
};

}  // namespace track_radar
