/*
 * File:   Initiative.h
 *
 * Created on October 19, 2026, 12:45 PM
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

#ifndef _INITIATIVE_H_
#define _INITIATIVE_H_

namespace vigorbattle {

class BattleState;
class BattleMechanics;
class RandomSource;

/**
 * Roll initiative for every participant, in roster order, then rebuild the
 * turn order (highest initiative first, ties kept in roster order) and set
 * the current actor to its head. Must be called after any roster change.
 */
void calculateTurnOrder(BattleState &state, const BattleMechanics &mech,
        RandomSource &rand);

}

#endif
