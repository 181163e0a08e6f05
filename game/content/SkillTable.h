// Default skill -> characteristic links used when totalling skill values.
#pragma once

#include "../../engine/rules/NpcModel.h"

namespace Forge::Content {

// Unmapped skills link to Weapon Skill.
Rules::SkillLinks defaultSkillLinks();

}  // namespace Forge::Content
