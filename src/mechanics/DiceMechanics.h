/*
 * File:   DiceMechanics.h
 * Author: Catherine
 *
 * Created on December 28, 2008, 2:30 PM
 *
 * This file is a part of Vigor Battle.
 * Copyright (C) 2009  Catherine Fitzpatrick and Benjamin Gwin
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

#ifndef _DICE_MECHANICS_H_
#define _DICE_MECHANICS_H_

#include "BattleMechanics.h"

namespace vigorbattle {

const int HIT_DIE = 20;
const int DAMAGE_DIE = 6;
const int BASE_DEFENSE = 10;
const int CRITICAL_ROLL = 20;

/**
 * The d20 ruleset.
 *
 *   initiative = Speed * 10 + d20
 *   hit        = d20 + attack >= 10 + defense
 *   damage     = (dice + attack / 2) d6, times 1.5 on a natural 20,
 *                then scaled by type effectiveness
 *
 * attack and defense are Power and Defense for a physical move, Mind and
 * Spirit for a special move. Fractions are rounded down.
 */
class DiceMechanics : public BattleMechanics {
public:
    DiceMechanics() { }
    int calculateInitiative(const Participant &p, RandomSource &rand) const;
    HitRoll attemptHit(const Participant &user, const Participant &target,
            const MoveTemplate &move, RandomSource &rand) const;
    DamageRoll calculateDamage(const Participant &user,
            const Participant &target, const MoveTemplate &move,
            const HitRoll &hit, RandomSource &rand) const;
    double getEffectiveness(const CreatureType &type,
            const Participant &target) const;
};

}

#endif
