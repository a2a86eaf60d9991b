#include <audiopipe/effects/effect_stage.hh>

namespace audiopipe {
    effect_stage::~effect_stage() = default;
}
