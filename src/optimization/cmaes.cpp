// File: optimization/cmaes.cpp

#include "optimization/cmaes.hpp"

// The strategy is header-only; instantiate the supported scalar types once here.
namespace optimization {

    template class CMAES<double>;
    template class CMAES<float>;

    namespace cmaes {
        template class Parameters<double>;
        template class Parameters<float>;

        template State<double> initialize<double>(const Parameters<double> &, const Individual<double> &);
        template State<float> initialize<float>(const Parameters<float> &, const Individual<float> &);

        template StepResult<double> update<double>(const Objective<double> &, const Constraints<double> &,
                                                   State<double> &, std::vector<Individual<double>> &,
                                                   const Parameters<double> &, int, RandomSource<double> &);
        template StepResult<float> update<float>(const Objective<float> &, const Constraints<float> &,
                                                 State<float> &, std::vector<Individual<float>> &,
                                                 const Parameters<float> &, int, RandomSource<float> &);
    } // namespace cmaes

} // namespace optimization
