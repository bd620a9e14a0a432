#include "sampling/core/debug.hpp"

#include <cstdlib>
#include <string_view>

namespace boothsampler::sampling::core {

bool debugEnabled() {
	const char* env = std::getenv("BOOTH_SAMPLER_DEBUG");
	return env != nullptr && std::string_view(env) == "1";
}

} // namespace boothsampler::sampling::core
