/*
 * File:   PhaseMachine.cpp
 *
 * Created on October 19, 2026, 1:50 PM
 *
 * This file is a part of Vigor Battle.
 * Copyright (C) 2026  The Vigor Battle developers
 *
 * This program is free software; you can redistribute it and/or
 * modify it under the terms of the GNU Affero General Public License
 * as published by the Free Software Foundation; either version 3
 * of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License
 * along with this program; if not, visit the Free Software Foundation, Inc.
 * online at http://gnu.org.
 */

#include <string>
#include "PhaseMachine.h"
#include "BattleState.h"

using namespace std;

namespace vigorbattle {

BATTLE_PHASE advancePhase(BattleState &state) {
    const BATTLE_PHASE next = getNextPhase(state.getPhase());
    if (next == BP_SELECT_ACTION) {
        state.nextTurn();
        const Participant::ARRAY &participants = state.getParticipants();
        Participant::ARRAY::const_iterator i = participants.begin();
        for (; i != participants.end(); ++i) {
            (*i)->setActed(false);
        }
    }
    state.setPhase(next);
    state.log("", "Phase Advanced",
            "Battle phase changed to " + getPhaseName(next));
    return next;
}

void finishBattle(BattleState &state, const string &reason) {
    state.setPhase(BP_BATTLE_END);
    state.log("", "Battle Ended", reason);
    state.setActive(false);
}

}
