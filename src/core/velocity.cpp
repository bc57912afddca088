/**
 * @file velocity.cpp
 * @brief Implementation of dynamics and expressive shaping.
 */

#include "core/velocity.h"

#include <cmath>

#include "core/score_index.h"

namespace scoreplay {

uint8_t dynamicToVelocity(Dynamic dynamic) {
  switch (dynamic) {
    case Dynamic::PPP: return 20;
    case Dynamic::PP: return 36;
    case Dynamic::P: return 52;
    case Dynamic::MP: return 68;
    case Dynamic::MF: return 84;
    case Dynamic::F: return 100;
    case Dynamic::FF: return 112;
    case Dynamic::FFF: return 120;
  }
  return kNeutralVelocity;
}

uint8_t baseVelocity(const std::optional<Dynamic>& dynamic) {
  return dynamic ? dynamicToVelocity(*dynamic) : kNeutralVelocity;
}

ArticulationShape articulationShape(const VoiceEvent& event) {
  ArticulationShape shape;
  if (event.hasArticulation(Articulation::Staccato)) {
    shape.duration_scale *= kStaccatoDurationScale;
  }
  if (event.hasArticulation(Articulation::Tenuto)) {
    shape.duration_scale *= kTenutoDurationScale;
    shape.timing_offset_ticks += kTenutoOnsetShift;
  }
  if (event.hasArticulation(Articulation::Accent)) {
    shape.velocity_delta += kAccentVelocityBoost;
  }
  return shape;
}

HairpinOffsetMap buildHairpinVelocityOffsets(const Score& score, const ScoreIndex& index) {
  HairpinOffsetMap offsets;
  const auto& order = index.documentOrder();

  for (const auto& hairpin : score.hairpins) {
    const EventLocation* from = index.find(hairpin.from);
    const EventLocation* to = index.find(hairpin.to);
    if (!from || !to || to->document_order <= from->document_order) continue;

    size_t span = to->document_order - from->document_order;
    int sign = hairpin.type == HairpinType::Crescendo ? 1 : -1;
    for (size_t i = from->document_order; i <= to->document_order; ++i) {
      double progress = static_cast<double>(i - from->document_order) / span;
      int amount = static_cast<int>(std::lround(progress * kHairpinMaxOffset));
      offsets[order[i]] = sign * amount;
    }
  }
  return offsets;
}

}  // namespace scoreplay
