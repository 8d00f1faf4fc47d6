#ifndef SKIRMISH_VALIDATION_GATE_H
#define SKIRMISH_VALIDATION_GATE_H

#include "pipeline_interfaces.h"

namespace skirmish {

// Source must be a live named entity: IsAlive, not Stunned, and no
// ActionCooldown left.
class EcsValidationGate final : public ValidationGate {
public:
  bool is_valid(const ActionRequest &request,
                flecs::world &state) const override;
};

} // namespace skirmish

#endif // SKIRMISH_VALIDATION_GATE_H
