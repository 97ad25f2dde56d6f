/*
 * File:   Participant.cpp
 *
 * Created on October 19, 2026, 11:05 AM
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

#include <algorithm>
#include <boost/algorithm/string.hpp>
#include "Participant.h"
#include "BattleException.h"

using namespace std;

namespace vigorbattle {

namespace {

const char *KIND_NAMES[] = { "PlayerCreature", "EnemyCreature",
        "PlayerHandler", "EnemyHandler" };

const char *RELATIONSHIP_NAMES[] = { "Hostile", "Allied", "Neutral" };

STATUSES::iterator findStatus(STATUSES &statuses, const string &name) {
    STATUSES::iterator i = statuses.begin();
    for (; i != statuses.end(); ++i) {
        if (boost::algorithm::iequals(i->getName(), name))
            break;
    }
    return i;
}

const StatusEffect *getStatusByName(const STATUSES &statuses,
        const string &name) {
    STATUSES::const_iterator i = statuses.begin();
    for (; i != statuses.end(); ++i) {
        if (boost::algorithm::iequals(i->getName(), name))
            return &*i;
    }
    return NULL;
}

bool replaceStatus(STATUSES &statuses, const StatusEffect &effect) {
    STATUSES::iterator i = findStatus(statuses, effect.getName());
    if (i != statuses.end()) {
        *i = effect;
        return true;
    }
    statuses.push_back(effect);
    return false;
}

bool eraseStatus(STATUSES &statuses, const string &name) {
    STATUSES::iterator i = findStatus(statuses, name);
    if (i == statuses.end())
        return false;
    statuses.erase(i);
    return true;
}

struct StatLevelVisitor : public boost::static_visitor<int> {
    STAT stat;
    StatLevelVisitor(const STAT s): stat(s) { }
    int operator()(const CreatureCombatant &c) const {
        return c.getStatLevel(stat);
    }
    int operator()(const HandlerCombatant &h) const {
        return h.getStatLevel(stat);
    }
};

string relationshipKey(const string &id) {
    return boost::algorithm::to_lower_copy(id);
}

} // anonymous namespace

string getParticipantKindName(const PARTICIPANT_KIND k) {
    return KIND_NAMES[k];
}

string getRelationshipName(const RELATIONSHIP r) {
    return RELATIONSHIP_NAMES[r];
}

PARTICIPANT_KIND parseParticipantKind(const string &text) {
    string key = boost::algorithm::to_lower_copy(text);
    key.erase(remove_if(key.begin(), key.end(),
            boost::algorithm::is_any_of("-_ ")), key.end());
    for (int i = 0; i < 4; ++i) {
        if (key == boost::algorithm::to_lower_copy(string(KIND_NAMES[i])))
            return static_cast<PARTICIPANT_KIND>(i);
    }
    throw ValidationException("unknown participant kind: " + text);
}

StatusEffect::StatusEffect(const string &name,
        const STATUS_CATEGORY category,
        const boost::optional<int> &duration,
        const int severity):
        m_name(name),
        m_category(category),
        m_duration(duration),
        m_severity(severity) {
    if (name.empty()) {
        throw ValidationException("status effect name is empty");
    }
    if (duration && (*duration < 1)) {
        throw ValidationException("status effect " + name
                + " must last at least one turn");
    }
}

CreatureCombatant::CreatureCombatant(const string &species,
        const TYPE_ARRAY &types, const StatBlock &stats, const int maxVigor):
        m_species(species),
        m_types(types),
        m_stats(stats),
        m_vigor(maxVigor),
        m_maxVigor(maxVigor) {
    if (maxVigor <= 0) {
        throw ValidationException("maximum vigor of " + species
                + " must be positive");
    }
    if (types.empty() || (types.size() > 2)) {
        throw ValidationException(species + " must have one or two types");
    }
    for (TYPE_ARRAY::const_iterator i = types.begin(); i != types.end(); ++i) {
        if (!*i) {
            throw ValidationException(species + " has a missing type");
        }
    }
    fill(m_modifier, m_modifier + STAT_COUNT, 0);
}

int CreatureCombatant::setVigor(const int vigor) {
    m_vigor = max(0, min(vigor, m_maxVigor));
    return m_vigor;
}

int CreatureCombatant::getStatLevel(const STAT i) const {
    return clampStatLevel(m_stats.getLevel(i) + m_modifier[i]);
}

int CreatureCombatant::getModifier(const STAT i) const {
    return m_modifier[i];
}

void CreatureCombatant::setModifier(const STAT i, const int delta) {
    m_modifier[i] = delta;
}

void CreatureCombatant::clearModifiers() {
    fill(m_modifier, m_modifier + STAT_COUNT, 0);
}

const StatusEffect *CreatureCombatant::getStatus(const string &name) const {
    return getStatusByName(m_statuses, name);
}

bool CreatureCombatant::applyStatus(const StatusEffect &effect) {
    return replaceStatus(m_statuses, effect);
}

bool CreatureCombatant::removeStatus(const string &name) {
    return eraseStatus(m_statuses, name);
}

void CreatureCombatant::recordMove(const string &name) {
    vector<string>::const_iterator i = m_usedMoves.begin();
    for (; i != m_usedMoves.end(); ++i) {
        if (boost::algorithm::iequals(*i, name))
            return;
    }
    m_usedMoves.push_back(name);
}

HandlerCombatant::HandlerCombatant(const string &name,
        const StatBlock &stats, const bool canEscape):
        m_name(name),
        m_stats(stats),
        m_canEscape(canEscape) { }

const StatusEffect *HandlerCombatant::getCondition(const string &name) const {
    return getStatusByName(m_conditions, name);
}

bool HandlerCombatant::applyCondition(const StatusEffect &condition) {
    return replaceStatus(m_conditions, condition);
}

bool HandlerCombatant::removeCondition(const string &name) {
    return eraseStatus(m_conditions, name);
}

Participant::Participant(const string &id, const string &name,
        const PARTICIPANT_KIND kind, const string &faction,
        const CreatureCombatant &creature, const Position &position):
        m_id(id),
        m_name(name),
        m_kind(kind),
        m_faction(faction),
        m_position(position),
        m_combatant(creature),
        m_initiative(0),
        m_acted(false),
        m_defeated(false) {
    validate();
    if (creature.getVigor() == 0) {
        m_defeated = true;
    }
}

Participant::Participant(const string &id, const string &name,
        const PARTICIPANT_KIND kind, const string &faction,
        const HandlerCombatant &handler, const Position &position):
        m_id(id),
        m_name(name),
        m_kind(kind),
        m_faction(faction),
        m_position(position),
        m_combatant(handler),
        m_initiative(0),
        m_acted(false),
        m_defeated(false) {
    validate();
}

void Participant::validate() const {
    if (m_id.empty()) {
        throw ValidationException("participant id is empty");
    }
    if (m_faction.empty()) {
        throw ValidationException("participant " + m_id + " has no faction");
    }
    if (isCreatureKind(m_kind) != isCreature()) {
        throw ValidationException("participant " + m_id + " of kind "
                + getParticipantKindName(m_kind)
                + " has the wrong combatant payload");
    }
}

bool Participant::isCreature() const {
    return (m_combatant.which() == 0);
}

CreatureCombatant *Participant::getCreature() {
    return boost::get<CreatureCombatant>(&m_combatant);
}

const CreatureCombatant *Participant::getCreature() const {
    return boost::get<CreatureCombatant>(&m_combatant);
}

HandlerCombatant *Participant::getHandler() {
    return boost::get<HandlerCombatant>(&m_combatant);
}

const HandlerCombatant *Participant::getHandler() const {
    return boost::get<HandlerCombatant>(&m_combatant);
}

int Participant::getStatLevel(const STAT i) const {
    return boost::apply_visitor(StatLevelVisitor(i), m_combatant);
}

bool Participant::markDefeated() {
    if (m_defeated)
        return false;
    m_defeated = true;
    return true;
}

bool Participant::setVigor(const int vigor) {
    CreatureCombatant *creature = getCreature();
    if (!creature) {
        throw ValidationException(m_id + " is a handler and has no vigor");
    }
    if (creature->setVigor(vigor) == 0) {
        return markDefeated();
    }
    return false;
}

bool Participant::applyStatus(const StatusEffect &effect) {
    CreatureCombatant *creature = getCreature();
    if (creature) {
        return creature->applyStatus(effect);
    }
    return getHandler()->applyCondition(effect);
}

bool Participant::removeStatus(const string &name) {
    CreatureCombatant *creature = getCreature();
    if (creature) {
        return creature->removeStatus(name);
    }
    return getHandler()->removeCondition(name);
}

RELATIONSHIP Participant::getRelationship(const string &id) const {
    RELATIONSHIP_MAP::const_iterator i =
            m_relationships.find(relationshipKey(id));
    if (i == m_relationships.end())
        return R_NEUTRAL;
    return i->second;
}

bool Participant::hasRelationship(const string &id) const {
    return (m_relationships.count(relationshipKey(id)) != 0);
}

void Participant::setRelationship(const string &id, const RELATIONSHIP r) {
    m_relationships[relationshipKey(id)] = r;
}

void Participant::clearRelationship(const string &id) {
    m_relationships.erase(relationshipKey(id));
}

}
