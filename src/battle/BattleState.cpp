/*
 * File:   BattleState.cpp
 *
 * Created on October 19, 2026, 12:02 PM
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

#include <boost/algorithm/string/predicate.hpp>
#include "BattleState.h"
#include "BattleException.h"

using namespace std;

namespace vigorbattle {

BattleState::BattleState(const BATTLE_KIND kind, const Battlefield &field,
        const Weather &weather):
        m_active(true),
        m_kind(kind),
        m_turn(1),
        m_phase(BP_INITIALIZE),
        m_field(field),
        m_weather(weather) { }

Participant *BattleState::getParticipant(const string &id) const {
    Participant::ARRAY::const_iterator i = m_participants.begin();
    for (; i != m_participants.end(); ++i) {
        if (boost::algorithm::iequals((*i)->getId(), id))
            return i->get();
    }
    return NULL;
}

void BattleState::addParticipant(Participant::PTR p) {
    if (!p) {
        throw ValidationException("cannot add an empty participant");
    }
    if (getParticipant(p->getId())) {
        throw ValidationException("duplicate participant id: " + p->getId());
    }
    m_participants.push_back(p);
}

bool BattleState::removeParticipant(const string &id) {
    Participant::ARRAY::iterator i = m_participants.begin();
    for (; i != m_participants.end(); ++i) {
        if (boost::algorithm::iequals((*i)->getId(), id))
            break;
    }
    if (i == m_participants.end())
        return false;
    const string removed = (*i)->getId();
    m_participants.erase(i);
    for (i = m_participants.begin(); i != m_participants.end(); ++i) {
        (*i)->clearRelationship(removed);
    }
    return true;
}

void BattleState::log(const string &actor, const string &action,
        const string &result, const vector<string> &targets) {
    BattleLogEntry entry(m_turn, m_phase, actor, action, result);
    entry.targets = targets;
    m_log.append(entry);
}

}
