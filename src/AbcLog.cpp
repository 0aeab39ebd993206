#include <AbcPop/AbcLog.h>

#include <algorithm>
#include <iomanip>
#include <stdexcept>
#include <vector>

using std::setw;
using std::endl;

namespace ABCPOP {

void AbcLog::round_start(
    const std::string & sampler, const size_t n,
    const size_t n_procs, const size_t n_requested,
    std::ostream & os
) {
    os << double_bar << endl;
    os << sampler << ": sampling until " << n << " accepted, using " << n_procs;
    if (n_requested != 0 and n_requested != n_procs) { os << " (of " << n_requested << " requested)"; }
    os << (n_procs == 1 ? " process" : " processes") << endl;
}

void AbcLog::round_end(
    const std::string & sampler,
    const size_t n_accepted, const size_t nr_evaluations,
    std::ostream & os
) {
    const double rate = nr_evaluations > 0 ? static_cast<double>(n_accepted) / nr_evaluations : 0.0;
    os << sampler << ": accepted " << n_accepted << " of " << nr_evaluations
       << " evaluations (acceptance rate " << std::setprecision(4) << rate << ")" << endl;
    os << double_bar << endl;
}

float_type AbcLog::median(const Col & data) {
    if (data.size() == 0) { throw std::invalid_argument("median of an empty column"); }
    std::vector<float_type> vdata(data.data(), data.data() + data.size());
    const size_t n = vdata.size();
    std::sort(vdata.begin(), vdata.end());
    return n % 2 == 0 ? (vdata[n / 2 - 1] + vdata[n / 2]) / 2 : vdata[n / 2];
}

void AbcLog::population_report(
    const Population & pop, const size_t nr_evaluations,
    std::ostream & os
) {
    os << double_bar << endl;
    os << "Population of " << pop.size() << " from " << nr_evaluations << " evaluations";
    if (nr_evaluations > 0) { os << " (acceptance rate " << static_cast<double>(pop.size()) / nr_evaluations << ")"; }
    os << endl;
    if (pop.size() == 0) { os << double_bar << endl; return; }

    const Mat2D pars = pop.parameters();
    const Row means = pars.colwise().mean();
    os << "Parameter means:" << endl;
    for (auto meanpar : means) { os << setw(WIDTH) << meanpar; } os << endl;
    os << "Parameter medians:" << endl;
    for (Eigen::Index i = 0; i < pars.cols(); ++i) { os << setw(WIDTH) << median(pars.col(i)); } os << endl;

    const Col dists = pop.distances();
    os << "Distance mean, median: " << setw(WIDTH) << dists.mean() << ", " << setw(WIDTH) << median(dists) << endl;
    os << double_bar << endl;
}

} // namespace ABCPOP
