#ifndef INSIGHT_EVALUATION_HPP
#define INSIGHT_EVALUATION_HPP
// This file is a factory, must exempt it from any logical-code. For functions look into "/details"
#include <vector>

#include "details/decoding.hpp"

namespace Insight::Evaluation {
    using DecodingOptions = Details::Decoding::Options;
    using DecodingReport = Details::Decoding::Report;

    [[nodiscard]] inline std::vector<double> PhysicalScales(const ::Insight::Options& options) {
        return Details::Decoding::physical_scales(options);
    }

    template <class Decoder, class Loader>
    [[nodiscard]] inline auto Evaluate(Decoder& decoder,
                                       Loader& loader,
                                       const std::vector<Loss::Descriptor>& losses,
                                       const DecodingOptions& options = DecodingOptions{}) -> DecodingReport {
        return Details::Decoding::Evaluate(decoder, loader, losses, options);
    }

    inline void Print(const DecodingReport& report, const DecodingOptions& options = DecodingOptions{}) {
        Details::Decoding::Print(report, options);
    }
}

#endif // INSIGHT_EVALUATION_HPP
