// Root joint translation per output frame

#ifndef SMPLX_ROOT_MOTION_H_
#define SMPLX_ROOT_MOTION_H_

#include "ozz/base/maths/vec_float.h"

namespace smplx {

// Horizontal offset removed from every frame. With centering enabled it is
// the first selected frame's (x, y, 0); otherwise zero.
ozz::math::Float3 ComputeOriginOffset(const ozz::math::Float3& first_translation,
                                      bool center_on_origin);

// (t.x - offset.x, t.y - offset.y, 0). The third (up) component of the
// source translation is never transmitted.
ozz::math::Float3 CenterTranslation(const ozz::math::Float3& translation,
                                    const ozz::math::Float3& offset);

// Keyframed root offset relative to the bind pose:
// CenterTranslation(t, offset) - bind_root_position
ozz::math::Float3 ResolveRootTranslation(const ozz::math::Float3& translation,
                                         const ozz::math::Float3& offset,
                                         const ozz::math::Float3& bind_root_position);

}  // namespace smplx

#endif  // SMPLX_ROOT_MOTION_H_
