#ifndef HYDRA_BLOCK_HPP
#define HYDRA_BLOCK_HPP
// This file is an factory, must exempt it from any logical-code. For functions look into "/details"

#include "details/blocks/nbeats.hpp"
#include "details/transformers/classic.hpp"

namespace Hydra::Block {
    namespace Transformer = Details::Transformer;
    namespace NBeats = Details::NBeats;

    using EncoderOptions = Transformer::Classic::EncoderOptions;
    using TransformerEncoder = Transformer::Classic::TransformerEncoder;

    using NBeatsOptions = NBeats::NetworkOptions;
    using NBeatsNetwork = NBeats::Network;
}

#endif //HYDRA_BLOCK_HPP
