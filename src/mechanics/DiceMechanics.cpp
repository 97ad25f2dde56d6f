/*
 * File:   DiceMechanics.cpp
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

#include <algorithm>
#include <cmath>

#include "DiceMechanics.h"
#include "CreatureType.h"
#include "RandomSource.h"
#include "../battle/Participant.h"
#include "../moves/CreatureMove.h"

using namespace std;

namespace vigorbattle {

namespace {

inline STAT getAttackStat(const MoveTemplate &move) {
    return move.isSpecial() ? S_MIND : S_POWER;
}

inline STAT getDefenseStat(const MoveTemplate &move) {
    return move.isSpecial() ? S_SPIRIT : S_DEFENSE;
}

} // anonymous namespace

int DiceMechanics::calculateInitiative(const Participant &p,
        RandomSource &rand) const {
    return p.getStatLevel(S_SPEED) * 10 + rand.getRandomInt(1, HIT_DIE);
}

HitRoll DiceMechanics::attemptHit(const Participant &user,
        const Participant &target, const MoveTemplate &move,
        RandomSource &rand) const {
    HitRoll ret;
    ret.roll = rand.getRandomInt(1, HIT_DIE);
    ret.attackLevel = user.getStatLevel(getAttackStat(move));
    ret.defenseValue = BASE_DEFENSE + target.getStatLevel(getDefenseStat(move));
    ret.hit = (ret.roll + ret.attackLevel >= ret.defenseValue);
    ret.critical = ret.hit && (ret.roll == CRITICAL_ROLL);
    return ret;
}

/**
 * Roll the damage for a hit. Every two attack levels add a die, rounding
 * towards negative infinity, so levels -1 and -2 cost the move one die.
 */
DamageRoll DiceMechanics::calculateDamage(const Participant &,
        const Participant &target, const MoveTemplate &move,
        const HitRoll &hit, RandomSource &rand) const {
    DamageRoll ret;
    const int level = hit.attackLevel;
    ret.bonusDice = (level >= 0) ? (level / 2) : -((1 - level) / 2);
    const int count = std::max(0, move.getDamageDice() + ret.bonusDice);
    for (int i = 0; i < count; ++i) {
        const int die = rand.getRandomInt(1, DAMAGE_DIE);
        ret.dice.push_back(die);
        ret.rolled += die;
    }
    if (hit.critical) {
        ret.rolled = ret.rolled * 3 / 2;
    }
    ret.effectiveness = getEffectiveness(*move.getType(), target);
    ret.damage = static_cast<int>(floor(ret.rolled * ret.effectiveness));
    return ret;
}

double DiceMechanics::getEffectiveness(const CreatureType &type,
        const Participant &target) const {
    const CreatureCombatant *creature = target.getCreature();
    if (!creature) {
        return 1.0;
    }
    return type.getMultiplier(creature->getTypes());
}

}
