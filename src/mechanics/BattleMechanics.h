/*
 * File:   BattleMechanics.h
 * Author: Catherine
 *
 * Created on December 28, 2008, 2:08 PM
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

#ifndef _BATTLE_MECHANICS_H_
#define _BATTLE_MECHANICS_H_

#include "stat.h"
#include <vector>

namespace vigorbattle {

class Participant;
class MoveTemplate;
class CreatureType;
class RandomSource;

struct HitRoll {
    int roll;           // the d20
    int attackLevel;    // added to the roll
    int defenseValue;   // the number to reach
    bool hit;
    bool critical;
    HitRoll(): roll(0), attackLevel(0), defenseValue(0),
            hit(false), critical(false) { }
};

struct DamageRoll {
    std::vector<int> dice;
    int bonusDice;
    int rolled;             // sum of the dice, after any critical
    double effectiveness;
    int damage;             // what the target actually loses
    DamageRoll(): bonusDice(0), rolled(0), effectiveness(1.0), damage(0) { }
};

/**
 * A general notion of battle mechanics, allowing for the calculation of some
 * fundamental quantities. Every roll is drawn from the RandomSource passed
 * in, so an implementation holds no random state of its own.
 */
class BattleMechanics {
public:
    virtual int calculateInitiative(const Participant &p,
            RandomSource &rand) const = 0;
    virtual HitRoll attemptHit(const Participant &user,
            const Participant &target, const MoveTemplate &move,
            RandomSource &rand) const = 0;
    virtual DamageRoll calculateDamage(const Participant &user,
            const Participant &target, const MoveTemplate &move,
            const HitRoll &hit, RandomSource &rand) const = 0;
    virtual double getEffectiveness(const CreatureType &type,
            const Participant &target) const = 0;
    virtual ~BattleMechanics() { }
protected:
    BattleMechanics() { }
private:
    BattleMechanics(const BattleMechanics &);
    BattleMechanics &operator=(const BattleMechanics &);
};

}

#endif
