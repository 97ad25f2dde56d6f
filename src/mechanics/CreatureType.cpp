/*
 * File:   CreatureType.cpp
 * Author: Catherine
 *
 * Created on April 2, 2009, 3:01 PM
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

#include <boost/algorithm/string/predicate.hpp>
#include "CreatureType.h"
#include <string>

using namespace std;

namespace vigorbattle {

/**
 * Creature type constants.
 */
const CreatureType CreatureType::NORMAL(0, "Normal");
const CreatureType CreatureType::FIRE(1, "Fire");
const CreatureType CreatureType::WATER(2, "Water");
const CreatureType CreatureType::ELECTRIC(3, "Electric");
const CreatureType CreatureType::GRASS(4, "Grass");
const CreatureType CreatureType::ICE(5, "Ice");
const CreatureType CreatureType::FIGHTING(6, "Fighting");
const CreatureType CreatureType::POISON(7, "Poison");
const CreatureType CreatureType::GROUND(8, "Ground");
const CreatureType CreatureType::FLYING(9, "Flying");
const CreatureType CreatureType::PSYCHIC(10, "Psychic");
const CreatureType CreatureType::BUG(11, "Bug");
const CreatureType CreatureType::ROCK(12, "Rock");
const CreatureType CreatureType::GHOST(13, "Ghost");
const CreatureType CreatureType::DRAGON(14, "Dragon");
const CreatureType CreatureType::DARK(15, "Dark");
const CreatureType CreatureType::STEEL(16, "Steel");
const CreatureType CreatureType::FAIRY(17, "Fairy");

const CreatureType *CreatureType::m_list[TYPE_COUNT] = {
    &CreatureType::NORMAL,
    &CreatureType::FIRE,
    &CreatureType::WATER,
    &CreatureType::ELECTRIC,
    &CreatureType::GRASS,
    &CreatureType::ICE,
    &CreatureType::FIGHTING,
    &CreatureType::POISON,
    &CreatureType::GROUND,
    &CreatureType::FLYING,
    &CreatureType::PSYCHIC,
    &CreatureType::BUG,
    &CreatureType::ROCK,
    &CreatureType::GHOST,
    &CreatureType::DRAGON,
    &CreatureType::DARK,
    &CreatureType::STEEL,
    &CreatureType::FAIRY
};

/**
 * Type effectiveness chart. Rows are the attacking type, columns the
 * defending type, both in the order of m_list.
 */
const double CreatureType::m_multiplier[TYPE_COUNT][TYPE_COUNT] = {
    { 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 0.5, 0, 1, 1, 0.5, 1 },
    { 1, 0.5, 0.5, 1, 2, 2, 1, 1, 1, 1, 1, 2, 0.5, 1, 0.5, 1, 2, 1 },
    { 1, 2, 0.5, 1, 0.5, 1, 1, 1, 2, 1, 1, 1, 2, 1, 0.5, 1, 1, 1 },
    { 1, 1, 2, 0.5, 0.5, 1, 1, 1, 0, 2, 1, 1, 1, 1, 0.5, 1, 1, 1 },
    { 1, 0.5, 2, 1, 0.5, 1, 1, 0.5, 2, 0.5, 1, 0.5, 2, 1, 0.5, 1, 0.5, 1 },
    { 1, 0.5, 0.5, 1, 2, 0.5, 1, 1, 2, 2, 1, 1, 1, 1, 2, 1, 0.5, 1 },
    { 2, 1, 1, 1, 1, 2, 1, 0.5, 1, 0.5, 0.5, 0.5, 2, 0, 1, 2, 2, 0.5 },
    { 1, 1, 1, 1, 2, 1, 1, 0.5, 0.5, 1, 1, 1, 0.5, 0.5, 1, 1, 0, 2 },
    { 1, 2, 1, 2, 0.5, 1, 1, 2, 1, 0, 1, 0.5, 2, 1, 1, 1, 2, 1 },
    { 1, 1, 1, 0.5, 2, 1, 2, 1, 1, 1, 1, 2, 0.5, 1, 1, 1, 0.5, 1 },
    { 1, 1, 1, 1, 1, 1, 2, 2, 1, 1, 0.5, 1, 1, 1, 1, 0, 0.5, 1 },
    { 1, 0.5, 1, 1, 2, 1, 0.5, 0.5, 1, 0.5, 2, 1, 1, 0.5, 1, 2, 0.5, 0.5 },
    { 1, 2, 1, 1, 1, 2, 0.5, 1, 0.5, 2, 1, 2, 1, 1, 1, 1, 0.5, 1 },
    { 0, 1, 1, 1, 1, 1, 1, 1, 1, 1, 2, 1, 1, 2, 1, 0.5, 1, 1 },
    { 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 1, 2, 1, 0.5, 0 },
    { 1, 1, 1, 1, 1, 1, 0.5, 1, 1, 1, 2, 1, 1, 2, 1, 0.5, 1, 0.5 },
    { 1, 0.5, 0.5, 0.5, 1, 2, 1, 1, 1, 1, 1, 1, 2, 1, 1, 1, 0.5, 2 },
    { 1, 0.5, 1, 1, 1, 1, 2, 0.5, 1, 1, 1, 1, 1, 1, 2, 2, 0.5, 1 }
};

double CreatureType::getMultiplier(const CreatureType &type1,
        const CreatureType *type2) const {
    const double first = getMultiplier(type1);
    const double second = type2 ? getMultiplier(*type2) : 1.0;
    return first * second;
}

double CreatureType::getMultiplier(const TYPE_ARRAY &types) const {
    double multiplier = 1.0;
    TYPE_ARRAY::const_iterator i = types.begin();
    for (; i != types.end(); ++i) {
        multiplier *= getMultiplier(**i);
    }
    return multiplier;
}

void CreatureType::getByMultiplier(const double value,
        TYPE_ARRAY &types) const {
    types.clear();
    for (int i = 0; i < TYPE_COUNT; ++i) {
        if (m_multiplier[m_type][i] == value) {
            types.push_back(m_list[i]);
        }
    }
}

void CreatureType::getSuperEffective(TYPE_ARRAY &types) const {
    getByMultiplier(2.0, types);
}

void CreatureType::getNotVeryEffective(TYPE_ARRAY &types) const {
    getByMultiplier(0.5, types);
}

void CreatureType::getNoEffect(TYPE_ARRAY &types) const {
    getByMultiplier(0.0, types);
}

const CreatureType *CreatureType::getByName(const string &name) {
    for (int i = 0; i < TYPE_COUNT; ++i) {
        const CreatureType *p = m_list[i];
        if (boost::algorithm::iequals(p->m_name, name))
            return p;
    }
    return NULL;
}

string describeEffectiveness(const double multiplier) {
    if (multiplier == 0.0) {
        return "No Effect";
    } else if (multiplier < 1.0) {
        return "Not Very Effective";
    } else if (multiplier > 1.0) {
        return "Super Effective";
    }
    return "Normal Effectiveness";
}

}
