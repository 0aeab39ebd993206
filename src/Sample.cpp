#include <AbcPop/Sample.h>

#include <stdexcept>

namespace ABCPOP {

Sample::Sample(
    const bool record_rejected, const std::vector<Particle> & accepted, const std::vector<SumStat> & all_sum_stats
) : _record_rejected(record_rejected), _accepted(accepted), _all_sum_stats(all_sum_stats) {
    for (const Particle & p : _accepted) {
        if (not p.accepted) { throw std::invalid_argument("accepted particle list holds a rejected particle"); }
    }
    if (not _record_rejected and not _all_sum_stats.empty()) {
        throw std::invalid_argument("summary statistics recorded on a sample that does not record them");
    }
}

void Sample::append(const FullInfoParticle & particle) {
    if (particle.accepted) { _accepted.push_back(particle.to_particle()); }

    if (_record_rejected) {
        for (const Attempt & att : particle.attempts) { _all_sum_stats.push_back(att.sum_stat); }
    }
}

Sample & Sample::operator+=(const Sample & other) {
    if (other._record_rejected != _record_rejected) {
        throw std::invalid_argument("cannot merge samples recorded under different options");
    }
    _accepted.insert(_accepted.end(), other._accepted.begin(), other._accepted.end());
    _all_sum_stats.insert(_all_sum_stats.end(), other._all_sum_stats.begin(), other._all_sum_stats.end());
    return *this;
}

Sample Sample::operator+(const Sample & other) const {
    Sample merged(*this);
    merged += other;
    return merged;
}

}
