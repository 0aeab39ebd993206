#ifndef ABCPOP_PARTICLE_H
#define ABCPOP_PARTICLE_H

#include <vector>
#include <AbcPop/TypeDefs.h>

namespace ABCPOP {

// One internal attempt of an evaluation: the simulated summary statistics,
// their distance to the observation, and whether that attempt passed.
struct Attempt {
    SumStat sum_stat;
    float_type distance;
    bool accepted;
};

// The trimmed form of an evaluated parameter point: what goes into a Population.
struct Particle {
    Theta parameter;
    float_type weight = 1.0;
    float_type distance = 0.0;
    SumStat sum_stat;
    bool accepted = false;
};

// The full record of evaluating one parameter point, i.e. the return value of
// a `simul_eval_one` function. A single evaluation may involve several
// attempts (e.g. repeated simulations); all of them are retained, in order.
struct FullInfoParticle {
    FullInfoParticle() = default;
    FullInfoParticle(const Theta & par, const bool acc, const std::vector<Attempt> & atts, const float_type w = 1.0) :
        parameter(par), weight(w), accepted(acc), attempts(atts) {}

    Theta parameter;
    float_type weight = 1.0;
    bool accepted = false;
    std::vector<Attempt> attempts;

    // project onto the persisted form: the last accepted attempt, or the last
    // attempt when none passed. Throws std::logic_error if there are no attempts.
    Particle to_particle() const;
};

// A read-only generation of accepted particles.
class Population {
    public:
        Population() = default;
        explicit Population(const std::vector<Particle> & particles) : _particles(particles) {}

        size_t size() const { return _particles.size(); }
        bool empty() const { return _particles.empty(); }
        const Particle & operator[](const size_t i) const { return _particles.at(i); }
        const std::vector<Particle> & particles() const { return _particles; }

        // rows = particles, in population order; cols = parameters
        Mat2D parameters() const;
        // rows = particles; cols = summary statistics
        Mat2D sum_stats() const;
        Col weights() const;
        Col distances() const;

    private:
        std::vector<Particle> _particles;
};

}

#endif // ABCPOP_PARTICLE_H
