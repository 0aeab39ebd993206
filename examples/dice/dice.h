#ifndef DICE_H
#define DICE_H

#include <cmath>
#include <stdexcept>
#include <vector>
#include <gsl/gsl_rng.h>
#include <gsl/gsl_statistics_double.h>
#include <json/json.h>

#include <AbcPop/Particle.h>

// Toy model: roll `dice` dice with `sides` sides each; the summary statistics are
// the total and the standard deviation of the faces.
struct DiceModel {
    std::vector<double> observed = { 25.0, 1.5 };   // sum, sd
    double epsilon = 2.0;                           // acceptance threshold on distance
    size_t max_attempts = 1;                        // simulations per parameter point
    double max_dice = 10.0;                         // prior: dice ~ U[1, max_dice + 1)
    double max_sides = 20.0;                        // prior: sides ~ U[1, max_sides + 1)

    // reads the optional "model" block of a configuration file;
    // throws std::invalid_argument on values the model cannot run with
    static DiceModel from_json(const Json::Value & root) {
        DiceModel model;
        const Json::Value & par = root["model"];
        if (par.isNull()) { return model; }
        if (par.isMember("observed")) {
            model.observed.clear();
            for (const Json::Value & jv : par["observed"]) { model.observed.push_back(jv.asDouble()); }
        }
        model.epsilon = par.get("epsilon", model.epsilon).asDouble();
        model.max_attempts = par.get("max_attempts", static_cast<Json::UInt64>(model.max_attempts)).asUInt64();
        model.max_dice = par.get("max_dice", model.max_dice).asDouble();
        model.max_sides = par.get("max_sides", model.max_sides).asDouble();
        if (model.max_attempts == 0) { throw std::invalid_argument("dice model: max_attempts must be positive"); }
        if (model.epsilon < 0) { throw std::invalid_argument("dice model: epsilon must be non-negative"); }
        if (model.max_dice <= 0 or model.max_sides <= 0) { throw std::invalid_argument("dice model: prior bounds must be positive"); }
        return model;
    }

    ABCPOP::Theta sample_prior(const gsl_rng * rng) const {
        return {
            1.0 + gsl_rng_uniform(rng) * max_dice,
            1.0 + gsl_rng_uniform(rng) * max_sides
        };
    }

    ABCPOP::SumStat simulate(const ABCPOP::Theta & args, const gsl_rng * rng) const {
        const size_t par1 = static_cast<size_t>(args[0]); // number of dice
        const size_t par2 = static_cast<size_t>(args[1]); // number of sides on dice

        std::vector<double> results(par1, 0);
        double sum = 0;
        for (size_t i = 0; i < par1; i++) {
            results[i] = gsl_rng_uniform_int(rng, par2) + 1;
            sum += results[i];
        }

        ABCPOP::SumStat metrics(2);
        metrics[0] = sum;
        metrics[1] = par1 == 1 ? 0 : gsl_stats_sd(results.data(), 1, par1);
        return metrics;
    }

    double distance(const ABCPOP::SumStat & sim) const {
        double d = 0;
        for (size_t i = 0; i < observed.size() and i < sim.size(); ++i) { d += std::pow(sim[i] - observed[i], 2); }
        return std::sqrt(d);
    }

    // simulates up to `max_attempts` times, stopping at the first attempt within epsilon
    ABCPOP::FullInfoParticle evaluate(const ABCPOP::Theta & par, const gsl_rng * rng) const {
        std::vector<ABCPOP::Attempt> attempts;
        bool accepted = false;
        for (size_t i = 0; i < max_attempts and not accepted; ++i) {
            const ABCPOP::SumStat ss = simulate(par, rng);
            const double dist = distance(ss);
            accepted = dist <= epsilon;
            attempts.push_back({ ss, dist, accepted });
        }
        return ABCPOP::FullInfoParticle(par, accepted, attempts);
    }
};

#endif // DICE_H
