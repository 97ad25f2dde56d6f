/*
 * File:   Participant.h
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

#ifndef _PARTICIPANT_H_
#define _PARTICIPANT_H_

#include <string>
#include <vector>
#include <map>
#include <boost/shared_ptr.hpp>
#include <boost/optional.hpp>
#include <boost/variant.hpp>
#include "../mechanics/stat.h"
#include "../mechanics/CreatureType.h"

namespace vigorbattle {

enum PARTICIPANT_KIND {
    PK_PLAYER_CREATURE = 0,
    PK_ENEMY_CREATURE,
    PK_PLAYER_HANDLER,
    PK_ENEMY_HANDLER
};

enum RELATIONSHIP {
    R_HOSTILE = 0,
    R_ALLIED,
    R_NEUTRAL
};

enum STATUS_CATEGORY {
    SC_AILMENT = 0,     // burn, poison, sleep...
    SC_VOLATILE,        // wears off when the battle ends
    SC_BENEFICIAL
};

std::string getParticipantKindName(const PARTICIPANT_KIND);
std::string getRelationshipName(const RELATIONSHIP);

/**
 * Parse "PlayerCreature", "enemy-handler" and similar spellings. Throws
 * ValidationException.
 */
PARTICIPANT_KIND parseParticipantKind(const std::string &);

inline bool isCreatureKind(const PARTICIPANT_KIND k) {
    return ((k == PK_PLAYER_CREATURE) || (k == PK_ENEMY_CREATURE));
}

inline bool isEnemyKind(const PARTICIPANT_KIND k) {
    return ((k == PK_ENEMY_CREATURE) || (k == PK_ENEMY_HANDLER));
}

struct Position {
    int x;
    int y;
    Position(const int px = 0, const int py = 0): x(px), y(py) { }
};

class StatusEffect {
public:
    /**
     * A status effect with no duration lasts until it is removed.
     */
    StatusEffect(const std::string &name,
            const STATUS_CATEGORY category = SC_AILMENT,
            const boost::optional<int> &duration = boost::optional<int>(),
            const int severity = 1);

    std::string getName() const {
        return m_name;
    }
    STATUS_CATEGORY getCategory() const {
        return m_category;
    }
    const boost::optional<int> &getDuration() const {
        return m_duration;
    }
    bool isIndefinite() const {
        return !m_duration;
    }
    int getSeverity() const {
        return m_severity;
    }

private:
    std::string m_name;
    STATUS_CATEGORY m_category;
    boost::optional<int> m_duration;
    int m_severity;
};

typedef std::vector<StatusEffect> STATUSES;

class CreatureCombatant {
public:
    CreatureCombatant(const std::string &species, const TYPE_ARRAY &types,
            const StatBlock &stats, const int maxVigor);

    std::string getSpecies() const {
        return m_species;
    }
    const TYPE_ARRAY &getTypes() const {
        return m_types;
    }
    const StatBlock &getStats() const {
        return m_stats;
    }

    int getVigor() const {
        return m_vigor;
    }
    int getMaxVigor() const {
        return m_maxVigor;
    }

    /**
     * Set the current vigor, clamped to [0, max]. Returns the new value.
     */
    int setVigor(const int vigor);

    /**
     * Effective level: base level plus temporary modifier, clamped.
     */
    int getStatLevel(const STAT i) const;
    int getModifier(const STAT i) const;
    void setModifier(const STAT i, const int delta);
    void clearModifiers();

    const STATUSES &getStatuses() const {
        return m_statuses;
    }
    const StatusEffect *getStatus(const std::string &name) const;

    /**
     * Apply an effect, replacing one of the same name. Returns true if an
     * effect was replaced.
     */
    bool applyStatus(const StatusEffect &effect);
    bool removeStatus(const std::string &name);

    const std::vector<std::string> &getUsedMoves() const {
        return m_usedMoves;
    }
    void recordMove(const std::string &name);

private:
    std::string m_species;
    TYPE_ARRAY m_types;
    StatBlock m_stats;
    int m_vigor;
    int m_maxVigor;
    int m_modifier[STAT_COUNT];
    STATUSES m_statuses;
    std::vector<std::string> m_usedMoves;
};

class HandlerCombatant {
public:
    HandlerCombatant(const std::string &name, const StatBlock &stats,
            const bool canEscape = true);

    std::string getName() const {
        return m_name;
    }
    const StatBlock &getStats() const {
        return m_stats;
    }
    int getStatLevel(const STAT i) const {
        return m_stats.getLevel(i);
    }

    const STATUSES &getConditions() const {
        return m_conditions;
    }
    const StatusEffect *getCondition(const std::string &name) const;
    bool applyCondition(const StatusEffect &condition);
    bool removeCondition(const std::string &name);

    bool canEscape() const {
        return m_canEscape;
    }
    void setCanEscape(const bool escape) {
        m_canEscape = escape;
    }

    /**
     * Ids of the participants fighting for this handler.
     */
    const std::vector<std::string> &getRemainingTeam() const {
        return m_team;
    }
    void setRemainingTeam(const std::vector<std::string> &team) {
        m_team = team;
    }

private:
    std::string m_name;
    StatBlock m_stats;
    STATUSES m_conditions;
    bool m_canEscape;
    std::vector<std::string> m_team;
};

typedef boost::variant<CreatureCombatant, HandlerCombatant> COMBATANT;
typedef std::map<std::string, RELATIONSHIP> RELATIONSHIP_MAP;

/**
 * One battler. A participant carries exactly one combatant payload, which
 * must agree with its kind.
 */
class Participant {
public:
    typedef boost::shared_ptr<Participant> PTR;
    typedef std::vector<PTR> ARRAY;

    Participant(const std::string &id, const std::string &name,
            const PARTICIPANT_KIND kind, const std::string &faction,
            const CreatureCombatant &creature,
            const Position &position = Position());
    Participant(const std::string &id, const std::string &name,
            const PARTICIPANT_KIND kind, const std::string &faction,
            const HandlerCombatant &handler,
            const Position &position = Position());

    std::string getId() const {
        return m_id;
    }
    std::string getName() const {
        return m_name;
    }
    PARTICIPANT_KIND getKind() const {
        return m_kind;
    }
    std::string getFaction() const {
        return m_faction;
    }
    const Position &getPosition() const {
        return m_position;
    }
    void setPosition(const Position &position) {
        m_position = position;
    }

    bool isCreature() const;
    CreatureCombatant *getCreature();
    const CreatureCombatant *getCreature() const;
    HandlerCombatant *getHandler();
    const HandlerCombatant *getHandler() const;

    /**
     * Effective level of a stat, whichever payload this participant has.
     */
    int getStatLevel(const STAT i) const;

    int getInitiative() const {
        return m_initiative;
    }
    void setInitiative(const int initiative) {
        m_initiative = initiative;
    }

    bool hasActed() const {
        return m_acted;
    }
    void setActed(const bool acted) {
        m_acted = acted;
    }

    bool isDefeated() const {
        return m_defeated;
    }

    /**
     * Mark this participant as defeated. Defeat is permanent for the rest of
     * the battle. Returns true if the participant was not already defeated.
     */
    bool markDefeated();

    /**
     * Set the vigor of a creature participant, clamped to [0, max]. Reaching
     * zero defeats the participant. Returns true if this call defeated it.
     * Throws ValidationException for a handler.
     */
    bool setVigor(const int vigor);

    /**
     * Apply a status effect to a creature, or a condition to a handler.
     * Returns true if an effect of the same name was replaced.
     */
    bool applyStatus(const StatusEffect &effect);
    bool removeStatus(const std::string &name);

    /**
     * Relationship to another participant. R_NEUTRAL if none was ever set.
     */
    RELATIONSHIP getRelationship(const std::string &id) const;
    bool hasRelationship(const std::string &id) const;
    void setRelationship(const std::string &id, const RELATIONSHIP r);
    void clearRelationship(const std::string &id);
    const RELATIONSHIP_MAP &getRelationships() const {
        return m_relationships;
    }

private:
    std::string m_id;
    std::string m_name;
    PARTICIPANT_KIND m_kind;
    std::string m_faction;
    Position m_position;
    COMBATANT m_combatant;
    int m_initiative;
    bool m_acted;
    bool m_defeated;
    RELATIONSHIP_MAP m_relationships;

    void validate() const;
};

}

#endif
