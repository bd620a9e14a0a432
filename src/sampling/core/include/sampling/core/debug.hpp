#pragma once

namespace boothsampler::sampling::core {

//! Verbose diagnostics are enabled by setting BOOTH_SAMPLER_DEBUG=1.
bool debugEnabled();

} // namespace boothsampler::sampling::core
