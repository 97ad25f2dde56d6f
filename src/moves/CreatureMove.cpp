/*
 * File:   CreatureMove.cpp
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

#include <vector>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "CreatureMove.h"
#include "../mechanics/CreatureType.h"
#include "../battle/BattleException.h"

using namespace std;

namespace vigorbattle {

MoveTemplate::MoveTemplate(const string &name, const CreatureType *type,
        const int damageDice, const MOVE_CLASS moveClass):
        m_name(name),
        m_type(type),
        m_dice(damageDice),
        m_class(moveClass) {
    if (name.empty()) {
        throw ValidationException("move name is empty");
    }
    if (!type) {
        throw ValidationException("move " + name + " has no type");
    }
    if (damageDice < 1) {
        throw ValidationException("move " + name
                + " must roll at least one damage die");
    }
}

MoveTemplate MoveTemplate::parse(const string &definition) {
    vector<string> parts;
    boost::algorithm::split(parts, definition,
            boost::algorithm::is_any_of(","));
    if (parts.size() != 4) {
        throw ValidationException("bad move definition: " + definition);
    }
    for (vector<string>::iterator i = parts.begin(); i != parts.end(); ++i) {
        boost::algorithm::trim(*i);
    }
    const CreatureType *type = CreatureType::getByName(parts[1]);
    if (!type) {
        throw ValidationException("unknown type: " + parts[1]);
    }
    int dice;
    try {
        dice = boost::lexical_cast<int>(parts[2]);
    } catch (boost::bad_lexical_cast &) {
        throw ValidationException("bad damage dice: " + parts[2]);
    }
    MOVE_CLASS mc;
    if (boost::algorithm::iequals(parts[3], "physical")) {
        mc = MC_PHYSICAL;
    } else if (boost::algorithm::iequals(parts[3], "special")) {
        mc = MC_SPECIAL;
    } else {
        throw ValidationException("bad move class: " + parts[3]);
    }
    return MoveTemplate(parts[0], type, dice, mc);
}

void MoveDatabase::addMove(const MoveTemplate &move) {
    const string key = boost::algorithm::to_lower_copy(move.getName());
    MOVE_DATABASE::iterator i = m_data.find(key);
    if (i != m_data.end()) {
        m_data.erase(i);
    }
    m_data.insert(MOVE_DATABASE::value_type(key, move));
}

void MoveDatabase::addDefaultMoves() {
    addMove(MoveTemplate("Tackle", &CreatureType::NORMAL, 2, MC_PHYSICAL));
    addMove(MoveTemplate("Ember", &CreatureType::FIRE, 2, MC_SPECIAL));
    addMove(MoveTemplate("Water Gun", &CreatureType::WATER, 2, MC_SPECIAL));
    addMove(MoveTemplate("Thunder Shock", &CreatureType::ELECTRIC, 2,
            MC_SPECIAL));
    addMove(MoveTemplate("Vine Whip", &CreatureType::GRASS, 2, MC_PHYSICAL));
    addMove(MoveTemplate("Rock Throw", &CreatureType::ROCK, 3, MC_PHYSICAL));
    addMove(MoveTemplate("Confusion", &CreatureType::PSYCHIC, 2, MC_SPECIAL));
    addMove(MoveTemplate("Bite", &CreatureType::DARK, 2, MC_PHYSICAL));
}

const MoveTemplate *MoveDatabase::getMove(const string &name) const {
    MOVE_DATABASE::const_iterator i =
            m_data.find(boost::algorithm::to_lower_copy(name));
    if (i == m_data.end()) {
        return NULL;
    }
    return &i->second;
}

}
