#pragma once

#include "tmbdd/codegen.hpp"
#include "tmbdd/tm.hpp"

#include <vector>

namespace tmbdd {

// CFG pre-pass over one operation sequence, run before layout.
//  - Goto -> Goto chains are threaded to their final label.
//  - A Goto whose target is the next instruction is dropped, unless it sits
//    in the failure slot right after a decrement.
// Dead code elimination is not attempted.
std::vector<Part> ThreadGotos(const std::vector<Part>& parts);

// States reachable from `entry`, depth first, HALT excluded.
std::vector<StateRef> Reachable(const StateGraph& graph, StateRef entry);

// Merge reachable states with identical (next0, next1, write0, write1,
// move0, move1) until nothing changes. `entry` is rewritten if its state is
// merged away. Returns the number of rounds that rewired something.
int Compress(StateGraph& graph, StateRef& entry);

}  // namespace tmbdd
