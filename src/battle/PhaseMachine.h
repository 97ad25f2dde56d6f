/*
 * File:   PhaseMachine.h
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

#ifndef _PHASE_MACHINE_H_
#define _PHASE_MACHINE_H_

#include <string>
#include "phase.h"

namespace vigorbattle {

class BattleState;

/**
 * Move the battle to its next phase and log the transition. Entering
 * BP_SELECT_ACTION starts a new turn: the turn counter goes up by one and
 * every participant may act again. Once in BP_BATTLE_END the battle stays
 * there. Returns the phase entered.
 */
BATTLE_PHASE advancePhase(BattleState &state);

/**
 * End the battle: enter BP_BATTLE_END, log the reason and deactivate.
 */
void finishBattle(BattleState &state, const std::string &reason);

}

#endif
