/*
 * File:   CreatureType.h
 * Author: Catherine
 *
 * Created on January 2, 2009, 2:53 PM
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

#ifndef _CREATURE_TYPE_H_
#define _CREATURE_TYPE_H_

#include <string>
#include <vector>

namespace vigorbattle {

const int TYPE_COUNT = 18;

class CreatureType;

typedef std::vector<const CreatureType *> TYPE_ARRAY;

class CreatureType {
public:
    /** Constants for all of the types. */
    static const CreatureType NORMAL;
    static const CreatureType FIRE;
    static const CreatureType WATER;
    static const CreatureType ELECTRIC;
    static const CreatureType GRASS;
    static const CreatureType ICE;
    static const CreatureType FIGHTING;
    static const CreatureType POISON;
    static const CreatureType GROUND;
    static const CreatureType FLYING;
    static const CreatureType PSYCHIC;
    static const CreatureType BUG;
    static const CreatureType ROCK;
    static const CreatureType GHOST;
    static const CreatureType DRAGON;
    static const CreatureType DARK;
    static const CreatureType STEEL;
    static const CreatureType FAIRY;

    /**
     * Multiplier for an attack of this type against a single defending type.
     */
    double getMultiplier(const CreatureType &type) const {
        return m_multiplier[m_type][type.m_type];
    }

    /**
     * Multiplier for an attack of this type against a defender with one or
     * two types. A NULL second type counts as neutral.
     */
    double getMultiplier(const CreatureType &type1,
            const CreatureType *type2) const;

    /**
     * Multiplier against every type in the list (empty list is neutral).
     */
    double getMultiplier(const TYPE_ARRAY &types) const;

    /**
     * Types which take double damage from this attack type.
     */
    void getSuperEffective(TYPE_ARRAY &types) const;
    void getNotVeryEffective(TYPE_ARRAY &types) const;
    void getNoEffect(TYPE_ARRAY &types) const;

    /**
     * Look up a type by name, ignoring case. Returns NULL for an unknown
     * name.
     */
    static const CreatureType *getByName(const std::string &name);

    static const CreatureType *getByValue(const int i) {
        if ((i < 0) || (i >= TYPE_COUNT))
            return NULL;
        return m_list[i];
    }

    std::string getName() const {
        return m_name;
    }

    int getTypeValue() const {
        return m_type;
    }

private:
    unsigned int m_type;
    std::string m_name;
    static const CreatureType *m_list[TYPE_COUNT];
    static const double m_multiplier[TYPE_COUNT][TYPE_COUNT];

    void getByMultiplier(const double, TYPE_ARRAY &) const;

    CreatureType(int type, std::string name): m_type(type), m_name(name) { }
};

/**
 * Describe a combined multiplier: "No Effect", "Not Very Effective",
 * "Normal Effectiveness" or "Super Effective".
 */
std::string describeEffectiveness(const double multiplier);

}

#endif
