// Frame resampling implementation

#include "frame_resampler.h"

#include <algorithm>
#include <sstream>

#include "ozz/base/log.h"

namespace smplx {

bool PlanResampling(int num_samples, int source_rate, int target_rate,
                    ResamplePlan* plan, ConversionError* error) {
    if (source_rate <= 0) {
        std::ostringstream msg;
        msg << "source_rate must be positive, got " << source_rate;
        return Fail(error, ErrorKind::kConfiguration, msg.str());
    }
    if (target_rate <= 0) {
        std::ostringstream msg;
        msg << "target_rate must be positive, got " << target_rate;
        return Fail(error, ErrorKind::kConfiguration, msg.str());
    }
    if (num_samples < 1) {
        return Fail(error, ErrorKind::kShapeMismatch, "pose sequence is empty");
    }

    ResamplePlan result;
    result.source_rate = source_rate;

    // Never upsample
    result.effective_rate = std::min(target_rate, source_rate);
    if (target_rate > source_rate) {
        ozz::log::Log() << "Target rate " << target_rate << " exceeds source rate "
                        << source_rate << ", clamping to " << source_rate << "." << std::endl;
    }

    result.stride = std::max(1, source_rate / result.effective_rate);

    result.source_indices.reserve((num_samples + result.stride - 1) / result.stride);
    for (int index = 0; index < num_samples; index += result.stride) {
        result.source_indices.push_back(index);
    }

    ozz::log::LogV() << "Resampling " << num_samples << " samples @ " << source_rate
                     << " fps to " << result.frame_count() << " frames @ "
                     << result.effective_rate << " fps (stride " << result.stride << ")."
                     << std::endl;

    *plan = result;
    return true;
}

}  // namespace smplx
