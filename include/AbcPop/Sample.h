#ifndef ABCPOP_SAMPLE_H
#define ABCPOP_SAMPLE_H

#include <vector>
#include <AbcPop/Particle.h>

namespace ABCPOP {

// A `Sample` is created empty at the start of a sampling round, filled by the
// `Sampler` during that round, and treated as read-only once returned.
//
// Invariants:
//  - accepted_particles().size() == number of appended particles with accepted == true
//  - all_sum_stats() stays empty unless constructed with record_rejected == true,
//    in which case it holds the statistics of every attempt of every appended particle
class Sample {
    public:
        explicit Sample(const bool record_rejected = false) : _record_rejected(record_rejected) {}

        // rebuild a sample from its two lists, e.g. after crossing a process boundary;
        // throws std::invalid_argument if the lists break the invariants below
        Sample(const bool record_rejected, const std::vector<Particle> & accepted, const std::vector<SumStat> & all_sum_stats);

        // call once per produced particle
        void append(const FullInfoParticle & particle);

        size_t n_accepted() const { return _accepted.size(); }
        bool record_rejected() const { return _record_rejected; }

        const std::vector<Particle> & accepted_particles() const { return _accepted; }
        const std::vector<SumStat> & all_sum_stats() const { return _all_sum_stats; }

        // snapshot of the accepted particles
        Population get_accepted_population() const { return Population(_accepted); }

        // concatenates both lists; only defined for samples built under the same
        // options (std::invalid_argument otherwise). Member order follows the operands,
        // so merging shards in a different order yields the same members, differently ordered.
        Sample & operator+=(const Sample & other);
        Sample operator+(const Sample & other) const;

    private:
        bool _record_rejected;
        std::vector<Particle> _accepted;
        std::vector<SumStat> _all_sum_stats;
};

// Creates empty samples for a given recording configuration.
struct SampleFactory {
    explicit SampleFactory(const bool record_rejected = false) : record_rejected(record_rejected) {}
    Sample operator()() const { return Sample(record_rejected); }

    bool record_rejected;
};

}

#endif // ABCPOP_SAMPLE_H
