// Selection of the source samples that become output keyframes

#ifndef SMPLX_FRAME_RESAMPLER_H_
#define SMPLX_FRAME_RESAMPLER_H_

#include <vector>

#include "conversion_error.h"

namespace smplx {

// Output frame numbers start here, as in the DCC tools the clips end up in.
constexpr int kFirstFrameNumber = 1;

struct ResamplePlan {
    int source_rate = 0;     // Frames per second of the source sequence
    int effective_rate = 0;  // Target rate after clamping to the source rate
    int stride = 1;          // Step between selected source samples

    // Source sample index for each output frame, ascending.
    std::vector<int> source_indices;

    int frame_count() const { return static_cast<int>(source_indices.size()); }

    // Output frame number of the |i|th selected sample.
    int frame_number(int i) const { return kFirstFrameNumber + i; }

    // Keyframe time in seconds of the |i|th selected sample.
    float frame_time(int i) const {
        return static_cast<float>(i) / static_cast<float>(effective_rate);
    }

    // Clip duration. A single frame still lasts one frame period.
    float duration() const {
        const int count = frame_count();
        return static_cast<float>(count > 1 ? count - 1 : 1) /
               static_cast<float>(effective_rate);
    }
};

// effective_rate = min(target_rate, source_rate), stride = source / effective
// (at least 1), indices 0, stride, 2 * stride, ... below |num_samples|.
// Fails with kConfiguration on non-positive rates and kShapeMismatch on an
// empty sequence.
bool PlanResampling(int num_samples, int source_rate, int target_rate,
                    ResamplePlan* plan, ConversionError* error);

}  // namespace smplx

#endif  // SMPLX_FRAME_RESAMPLER_H_
