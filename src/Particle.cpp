#include <AbcPop/Particle.h>

#include <stdexcept>
#include <string>

namespace ABCPOP {

Particle FullInfoParticle::to_particle() const {
    if (attempts.empty()) { throw std::logic_error("to_particle() called on a FullInfoParticle with no attempts"); }

    auto chosen = attempts.rbegin();
    for (auto it = attempts.rbegin(); it != attempts.rend(); ++it) {
        if (it->accepted) { chosen = it; break; }
    }

    Particle p;
    p.parameter = parameter;
    p.weight = weight;
    p.distance = chosen->distance;
    p.sum_stat = chosen->sum_stat;
    p.accepted = accepted;
    return p;
}

// all rows must have the same width; ragged input is a caller error
template<typename Extract>
Mat2D as_matrix(const std::vector<Particle> & particles, Extract extract) {
    if (particles.empty()) { return Mat2D(0, 0); }
    const size_t ncol = extract(particles[0]).size();
    Mat2D mat(particles.size(), ncol);
    for (size_t i = 0; i < particles.size(); ++i) {
        const std::vector<float_type> & vals = extract(particles[i]);
        if (vals.size() != ncol) {
            throw std::invalid_argument("ragged population: particle " + std::to_string(i) + " has "
                + std::to_string(vals.size()) + " values, expected " + std::to_string(ncol));
        }
        for (size_t j = 0; j < ncol; ++j) { mat(i, j) = vals[j]; }
    }
    return mat;
}

Mat2D Population::parameters() const {
    return as_matrix(_particles, [](const Particle & p) -> const std::vector<float_type> & { return p.parameter; });
}

Mat2D Population::sum_stats() const {
    return as_matrix(_particles, [](const Particle & p) -> const std::vector<float_type> & { return p.sum_stat; });
}

Col Population::weights() const {
    Col w(_particles.size());
    for (size_t i = 0; i < _particles.size(); ++i) { w[i] = _particles[i].weight; }
    return w;
}

Col Population::distances() const {
    Col d(_particles.size());
    for (size_t i = 0; i < _particles.size(); ++i) { d[i] = _particles[i].distance; }
    return d;
}

}
