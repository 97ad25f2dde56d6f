/*
 * File:   CreatureMove.h
 * Author: Catherine
 *
 * Created on January 3, 2009, 1:09 PM
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

#ifndef _CREATURE_MOVE_H_
#define _CREATURE_MOVE_H_

#include <string>
#include <map>

namespace vigorbattle {

class CreatureType;

enum MOVE_CLASS {
    MC_PHYSICAL = 0,    // Power against Defense
    MC_SPECIAL          // Mind against Spirit
};

/**
 * The metadata needed to resolve an attack: the move's type, how many d6 it
 * rolls for damage and whether it is special.
 */
class MoveTemplate {
public:
    MoveTemplate(const std::string &name, const CreatureType *type,
            const int damageDice, const MOVE_CLASS moveClass);

    /**
     * Parse a move definition of the form "name,type,dice,class" where
     * class is "physical" or "special". Throws ValidationException.
     */
    static MoveTemplate parse(const std::string &definition);

    std::string getName() const {
        return m_name;
    }
    const CreatureType *getType() const {
        return m_type;
    }
    int getDamageDice() const {
        return m_dice;
    }
    MOVE_CLASS getMoveClass() const {
        return m_class;
    }
    bool isSpecial() const {
        return (m_class == MC_SPECIAL);
    }

private:
    std::string m_name;
    const CreatureType *m_type;
    int m_dice;
    MOVE_CLASS m_class;
};

typedef std::map<std::string, MoveTemplate> MOVE_DATABASE;

/**
 * Supplies move metadata by name for attacks that do not carry it.
 * Names are matched without regard to case.
 */
class MoveDatabase {
public:
    MoveDatabase() { }

    /**
     * Add a move, replacing any move with the same name.
     */
    void addMove(const MoveTemplate &move);

    /**
     * Add the stock moves used when no ruleset provides its own.
     */
    void addDefaultMoves();

    /**
     * Get a move by name. Returns NULL if there is no such move.
     */
    const MoveTemplate *getMove(const std::string &name) const;

    int getMoveCount() const {
        return m_data.size();
    }

private:
    MOVE_DATABASE m_data;

    MoveDatabase(const MoveDatabase &);
    MoveDatabase &operator=(const MoveDatabase &);
};

}

#endif
