#include "spiketune/tuning/spsa.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <tuple>
#include <utility>

#include "spiketune/errors.hpp"
#include "spiketune/worker_pool.hpp"

namespace spiketune::tuning {

SpsaOptimizer::SpsaOptimizer(ParamVector initial, SpsaSettings settings, Objective objective)
    : theta_(std::move(initial)),
      settings_(std::move(settings)),
      objective_(std::move(objective)),
      rng_(settings_.seed ? settings_.seed : std::random_device{}()) {
  if (!objective_) throw std::invalid_argument("SPSA objective is empty");
  if (settings_.iterations < 0) throw ConfigError("iterations must be >= 0");
  for (auto& t : theta_) {
    validate(t);
    t.value = clamp_and_snap(t, t.value);
  }
}

double SpsaOptimizer::gain(int k) const {
  const double A = settings_.bigA ? *settings_.bigA : 0.1 * settings_.iterations;
  return settings_.a0 / std::pow(k + A, settings_.alpha);
}

double SpsaOptimizer::perturbation(int k) const { return settings_.c0 / std::pow(k, settings_.gamma); }

int SpsaOptimizer::perturb_shift(const Tunable& t, double ck) {
  // Not a step multiple; clamp_and_snap picks the nearest grid point.
  return static_cast<int>(std::max<long>(t.step, std::lround(ck * t.step)));
}

double SpsaOptimizer::baseline() {
  state_ = State::Baseline;
  baseline_ = objective_(theta_);
  return *baseline_;
}

std::pair<double, double> SpsaOptimizer::evaluate_pair(const ParamVector& plus, const ParamVector& minus) {
  if (!settings_.parallelPair) {
    const double jp = objective_(plus);
    return {jp, objective_(minus)};
  }
  double j[2] = {0.0, 0.0};
  WorkerPool pool(2);
  pool.for_each_index(2, [&](std::size_t i, int) { j[i] = objective_(i == 0 ? plus : minus); });
  return {j[0], j[1]};
}

SpsaIteration SpsaOptimizer::step() {
  if (state_ == State::Terminated) throw std::logic_error("SPSA already terminated");

  SpsaIteration it;
  it.k = ++k_;
  it.ak = gain(it.k);
  it.ck = perturbation(it.k);

  state_ = State::Perturb;
  std::bernoulli_distribution coin(0.5);
  ParamVector plus = theta_;
  ParamVector minus = theta_;
  for (std::size_t i = 0; i < theta_.size(); ++i) {
    const Tunable& t = theta_[i];
    if (t.notUsed) continue;
    const int shift = (coin(rng_) ? 1 : -1) * perturb_shift(t, it.ck);
    plus[i].value = clamp_and_snap(t, double(t.value) + shift);
    minus[i].value = clamp_and_snap(t, double(t.value) - shift);
  }
  std::tie(it.jPlus, it.jMinus) = evaluate_pair(plus, minus);

  state_ = State::Update;
  for (std::size_t i = 0; i < theta_.size(); ++i) {
    Tunable& t = theta_[i];
    if (t.notUsed) continue;
    // Signed distance keeps the descent direction; a pair collapsed by clamping carries none.
    const int d = plus[i].value - minus[i].value;
    if (d == 0) continue;
    const double g = (it.jPlus - it.jMinus) / d;
    t.value = clamp_and_snap(t, t.value - it.ak * g * t.step);
  }

  if (settings_.monitor) it.jMonitor = objective_(theta_);
  it.theta = theta_;

  if (k_ >= settings_.iterations) state_ = State::Terminated;
  return it;
}

ParamVector SpsaOptimizer::run(const std::function<void(const SpsaIteration&)>& onIteration) {
  if (!baseline_) baseline();
  while (k_ < settings_.iterations) {
    const SpsaIteration it = step();
    if (onIteration) onIteration(it);
  }
  state_ = State::Terminated;
  return theta_;
}

}  // namespace spiketune::tuning
