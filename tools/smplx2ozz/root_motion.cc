#include "root_motion.h"

namespace smplx {

ozz::math::Float3 ComputeOriginOffset(const ozz::math::Float3& first_translation,
                                      bool center_on_origin) {
    if (!center_on_origin) {
        return ozz::math::Float3::zero();
    }
    return ozz::math::Float3(first_translation.x, first_translation.y, 0.0f);
}

ozz::math::Float3 CenterTranslation(const ozz::math::Float3& translation,
                                    const ozz::math::Float3& offset) {
    return ozz::math::Float3(translation.x - offset.x, translation.y - offset.y, 0.0f);
}

ozz::math::Float3 ResolveRootTranslation(const ozz::math::Float3& translation,
                                         const ozz::math::Float3& offset,
                                         const ozz::math::Float3& bind_root_position) {
    const ozz::math::Float3 centered = CenterTranslation(translation, offset);
    return ozz::math::Float3(centered.x - bind_root_position.x,
                             centered.y - bind_root_position.y,
                             centered.z - bind_root_position.z);
}

}  // namespace smplx
