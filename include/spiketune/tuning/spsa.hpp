#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <random>
#include <vector>

#include "spiketune/tuning/param_vector.hpp"

namespace spiketune::tuning {

struct SpsaSettings {
  int iterations = 10;
  double a0 = 1.0;
  std::optional<double> bigA;  // stability constant; 10% of iterations when unset
  double alpha = 0.602;
  double c0 = 1.0;
  double gamma = 0.101;
  uint64_t seed = 0;        // 0 => nondeterministic
  bool monitor = false;     // re-evaluate the updated vector each iteration
  bool parallelPair = false;  // evaluate theta+ and theta- concurrently
};

struct SpsaIteration {
  int k = 0;
  double ak = 0.0;
  double ck = 0.0;
  double jPlus = 0.0;
  double jMinus = 0.0;
  std::optional<double> jMonitor;
  ParamVector theta;  // vector after the update
};

// Scalar to minimise. Must be safe to call concurrently when parallelPair is set.
using Objective = std::function<double(const ParamVector&)>;

class SpsaOptimizer {
 public:
  enum class State { Init, Baseline, Perturb, Update, Terminated };

  SpsaOptimizer(ParamVector initial, SpsaSettings settings, Objective objective);

  double gain(int k) const;          // a_k = a0 / (k + A)^alpha
  double perturbation(int k) const;  // c_k = c0 / k^gamma

  // Perturbation magnitude: round(c_k * step), at least one step.
  static int perturb_shift(const Tunable& t, double ck);

  // Evaluates the initial vector once; diagnostic only.
  double baseline();

  // One Perturb -> Update cycle. Returns the iteration record.
  SpsaIteration step();

  // Baseline (if not yet run), then all remaining iterations.
  ParamVector run(const std::function<void(const SpsaIteration&)>& onIteration = {});

  const ParamVector& current() const noexcept { return theta_; }
  int iteration() const noexcept { return k_; }
  State state() const noexcept { return state_; }
  std::optional<double> baseline_value() const noexcept { return baseline_; }

 private:
  ParamVector theta_;
  SpsaSettings settings_;
  Objective objective_;
  std::mt19937_64 rng_;
  int k_ = 0;
  State state_ = State::Init;
  std::optional<double> baseline_;

  std::pair<double, double> evaluate_pair(const ParamVector& plus, const ParamVector& minus);
};

}  // namespace spiketune::tuning
