/*
 * File:   phase.h
 *
 * Created on October 19, 2026, 11:40 AM
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

#ifndef _PHASE_H_
#define _PHASE_H_

#include <string>

namespace vigorbattle {

/**
 * The phases of a battle turn, in cycle order. BP_BATTLE_END is terminal.
 */
enum BATTLE_PHASE {
    BP_INITIALIZE = 0,
    BP_SELECT_ACTION,
    BP_RESOLVE_ACTIONS,
    BP_APPLY_EFFECTS,
    BP_CHECK_VICTORY,
    BP_END_TURN,
    BP_BATTLE_END
};

enum BATTLE_KIND {
    BK_WILD = 0,
    BK_TRAINER,
    BK_GYM,
    BK_ELITE,
    BK_CHAMPION,
    BK_LEGENDARY
};

const int BATTLE_KIND_COUNT = 6;

/**
 * The phase that follows the given one.
 */
BATTLE_PHASE getNextPhase(const BATTLE_PHASE);

std::string getPhaseName(const BATTLE_PHASE);
std::string getBattleKindName(const BATTLE_KIND);

/**
 * Parse a battle kind, ignoring case. Throws ValidationException.
 */
BATTLE_KIND parseBattleKind(const std::string &);

}

#endif
