#include "../../include/trial_cache.hpp"
#include <cmath>
#include <stdexcept>

namespace qshift {

long long quantize_key(const double parameter, const double precision) noexcept {
    return std::llround(parameter / precision);
}

double quantize(const double parameter, const double precision) noexcept {
    return static_cast<double>(quantize_key(parameter, precision)) * precision;
}

TrialCache::TrialCache(const double precision) : precision_(precision) {
    if (!(precision_ > 0.0)) {
        throw std::invalid_argument("trial cache precision must be positive");
    }
}

long long TrialCache::key_for(const double parameter) const noexcept {
    return quantize_key(parameter, precision_);
}

const EncodeTrial* TrialCache::find(const double parameter) const {
    const auto it = trials_.find(key_for(parameter));
    return it == trials_.end() ? nullptr : &it->second;
}

const EncodeTrial& TrialCache::record(EncodeTrial trial) {
    trial.key = key_for(trial.parameter);
    const auto [it, inserted] = trials_.emplace(trial.key, trial);
    return it->second;
}

} // namespace qshift
