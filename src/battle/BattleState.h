/*
 * File:   BattleState.h
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

#ifndef _BATTLE_STATE_H_
#define _BATTLE_STATE_H_

#include <string>
#include <vector>
#include <boost/shared_ptr.hpp>
#include <boost/optional.hpp>
#include "Participant.h"
#include "BattleLog.h"
#include "VictoryEvaluator.h"
#include "phase.h"

namespace vigorbattle {

struct Hazard {
    std::string name;
    Position position;
    std::string effect;
    Hazard(const std::string &n, const Position &p, const std::string &e):
            name(n), position(p), effect(e) { }
};

struct Battlefield {
    std::string name;
    std::vector<Hazard> hazards;
    explicit Battlefield(const std::string &n = "Standard Field"): name(n) { }
};

struct Weather {
    std::string name;
    boost::optional<int> duration;     // none lasts all battle
    explicit Weather(const std::string &n = "Clear",
            const boost::optional<int> &d = boost::optional<int>()):
            name(n), duration(d) { }
};

/**
 * Everything known about one battle encounter. Participant ids are matched
 * without regard to case.
 */
class BattleState {
public:
    typedef boost::shared_ptr<BattleState> PTR;

    BattleState(const BATTLE_KIND kind, const Battlefield &field,
            const Weather &weather);

    bool isActive() const {
        return m_active;
    }
    void setActive(const bool active) {
        m_active = active;
    }

    BATTLE_KIND getKind() const {
        return m_kind;
    }

    int getTurn() const {
        return m_turn;
    }
    void nextTurn() {
        ++m_turn;
    }

    BATTLE_PHASE getPhase() const {
        return m_phase;
    }
    void setPhase(const BATTLE_PHASE phase) {
        m_phase = phase;
    }

    const Participant::ARRAY &getParticipants() const {
        return m_participants;
    }

    /**
     * Get a participant by id. Returns NULL if there is no such participant.
     */
    Participant *getParticipant(const std::string &id) const;

    /**
     * Add a participant to the end of the roster. Throws ValidationException
     * if the id is already present. Does not touch the turn order.
     */
    void addParticipant(Participant::PTR p);

    /**
     * Remove a participant and every relationship held towards it. Returns
     * false if there was no such participant. Does not touch the turn order.
     */
    bool removeParticipant(const std::string &id);

    const std::vector<std::string> &getTurnOrder() const {
        return m_turnOrder;
    }
    void setTurnOrder(const std::vector<std::string> &order) {
        m_turnOrder = order;
    }

    /**
     * Id of the participant at the head of the turn order; empty if none.
     */
    std::string getCurrentActor() const {
        return m_currentActor;
    }
    void setCurrentActor(const std::string &id) {
        m_currentActor = id;
    }

    Battlefield &getBattlefield() {
        return m_field;
    }
    const Battlefield &getBattlefield() const {
        return m_field;
    }

    const Weather &getWeather() const {
        return m_weather;
    }
    void setWeather(const Weather &weather) {
        m_weather = weather;
    }

    const VICTORY_CONDITIONS &getVictoryConditions() const {
        return m_conditions;
    }
    void setVictoryConditions(const VICTORY_CONDITIONS &conditions) {
        m_conditions = conditions;
    }

    const BattleLog &getLog() const {
        return m_log;
    }

    /**
     * Append a log entry stamped with the current turn and phase.
     */
    void log(const std::string &actor, const std::string &action,
            const std::string &result,
            const std::vector<std::string> &targets =
                std::vector<std::string>());

private:
    bool m_active;
    BATTLE_KIND m_kind;
    int m_turn;
    BATTLE_PHASE m_phase;
    Participant::ARRAY m_participants;
    std::vector<std::string> m_turnOrder;
    std::string m_currentActor;
    Battlefield m_field;
    Weather m_weather;
    VICTORY_CONDITIONS m_conditions;
    BattleLog m_log;

    BattleState(const BattleState &);
    BattleState &operator=(const BattleState &);
};

}

#endif
