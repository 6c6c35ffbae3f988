#ifndef UGP_EVALUATION_HPP
#define UGP_EVALUATION_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"
#include "details/accumulator.hpp"
#include "details/report.hpp"

namespace Ugp::Evaluation {
    using Accumulator = Details::Accumulator;
    using Options = Details::Options;
    using Report = Details::Report;

    using Details::Print;
}

#endif //UGP_EVALUATION_HPP
