/**
 * @file demo_score.h
 * @brief Built-in two-part demo score used by the CLI.
 */

#ifndef SCOREPLAY_CORE_DEMO_SCORE_H
#define SCOREPLAY_CORE_DEMO_SCORE_H

#include "core/score.h"

namespace scoreplay {

/**
 * @brief Create the demo score.
 *
 * A melody part with a repeated phrase and first/second endings, dynamics,
 * a crescendo and a tie, over a bass part with the same repeat structure.
 * @return Score snapshot
 */
Score createDemoScore();

}  // namespace scoreplay

#endif  // SCOREPLAY_CORE_DEMO_SCORE_H
