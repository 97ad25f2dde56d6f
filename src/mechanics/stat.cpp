/*
 * File:   stat.cpp
 * Author: Catherine
 *
 * Created on April 15, 2009, 9:07 PM
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
#include "stat.h"

using namespace std;

namespace vigorbattle {

namespace {

const char *STAT_NAMES[] = { "Power", "Speed", "Mind", "Charm", "Defense",
        "Spirit" };

} // anonymous namespace

int clampStatLevel(const int level) {
    if (level < MIN_STAT_LEVEL) {
        return MIN_STAT_LEVEL;
    } else if (level > MAX_STAT_LEVEL) {
        return MAX_STAT_LEVEL;
    }
    return level;
}

string getStatName(const STAT i) {
    if ((i < 0) || (i >= STAT_COUNT)) {
        return "None";
    }
    return STAT_NAMES[i];
}

STAT getStatByName(const string &name) {
    for (int i = 0; i < STAT_COUNT; ++i) {
        if (boost::algorithm::iequals(name, STAT_NAMES[i])) {
            return static_cast<STAT>(i);
        }
    }
    // "Agility" is the traditional name of the initiative stat.
    if (boost::algorithm::iequals(name, "Agility")) {
        return S_SPEED;
    }
    return S_NONE;
}

StatBlock::StatBlock(const int power, const int speed, const int mind,
        const int charm, const int defense, const int spirit) {
    m_level[S_POWER] = clampStatLevel(power);
    m_level[S_SPEED] = clampStatLevel(speed);
    m_level[S_MIND] = clampStatLevel(mind);
    m_level[S_CHARM] = clampStatLevel(charm);
    m_level[S_DEFENSE] = clampStatLevel(defense);
    m_level[S_SPIRIT] = clampStatLevel(spirit);
}

}
