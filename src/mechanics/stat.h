/*
 * File:   stat.h
 * Author: Catherine
 *
 * Created on December 28, 2008, 2:12 PM
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

#ifndef _STAT_H_
#define _STAT_H_

#include <string>

namespace vigorbattle {

/**
 * Number of stats carried by every combatant.
 */
const int STAT_COUNT = 6;

/**
 * The different combatant stats. S_SPEED is the stat used for initiative.
 */
enum STAT {
    S_POWER = 0,
    S_SPEED = 1,
    S_MIND = 2,
    S_CHARM = 3,
    S_DEFENSE = 4,
    S_SPIRIT = 5,
    S_NONE = -1
};

/**
 * Named stat levels. A level is also the modifier it contributes to rolls.
 */
enum STAT_LEVEL {
    SL_HOPELESS = -2,
    SL_INCOMPETENT = -1,
    SL_NOVICE = 0,
    SL_TRAINED = 1,
    SL_EXPERT = 3,
    SL_MASTER = 5,
    SL_LEGENDARY = 7
};

const int MIN_STAT_LEVEL = SL_HOPELESS;
const int MAX_STAT_LEVEL = SL_LEGENDARY;

/**
 * Clamp a level into [MIN_STAT_LEVEL, MAX_STAT_LEVEL].
 */
int clampStatLevel(const int level);

/**
 * Get the display name of a stat, e.g. "Power".
 */
std::string getStatName(const STAT i);

/**
 * Look up a stat by name, ignoring case. Returns S_NONE if there is no such
 * stat.
 */
STAT getStatByName(const std::string &name);

/**
 * A full set of stat levels.
 */
class StatBlock {
public:
    StatBlock() {
        for (int i = 0; i < STAT_COUNT; ++i) {
            m_level[i] = SL_NOVICE;
        }
    }
    StatBlock(const int power, const int speed, const int mind,
            const int charm, const int defense, const int spirit);

    int getLevel(const STAT i) const {
        return m_level[i];
    }

    void setLevel(const STAT i, const int level) {
        m_level[i] = clampStatLevel(level);
    }

private:
    int m_level[STAT_COUNT];
};

}

#endif
