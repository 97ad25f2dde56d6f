/*
 * File:   BattleEngine.h
 *
 * Created on October 19, 2026, 2:20 PM
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

#ifndef _BATTLE_ENGINE_H_
#define _BATTLE_ENGINE_H_

#include <string>
#include <vector>
#include <boost/noncopyable.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include "BattleState.h"
#include "ActionResolver.h"
#include "VictoryEvaluator.h"

namespace vigorbattle {

class StateStore;
class BattleMechanics;
class MoveDatabase;
class RandomSource;

struct VigorChange {
    int oldVigor;
    int newVigor;
    int change;
    bool isDefeated;
};

struct TurnInfo {
    int turn;
    BATTLE_PHASE phase;
};

struct BattleSummary {
    BATTLE_KIND kind;
    int turn;
    BATTLE_PHASE phase;
    std::string currentActor;
    int participants;
    int standing;
    int defeated;
    std::vector<std::string> factions;
    std::string battlefield;
    int hazards;
    std::string weather;
    LOG_ENTRIES recentEvents;   // the last three log entries
};

/**
 * Runs one battle at a time on top of a StateStore. Every operation loads
 * the battle, validates its input, changes the battle and saves it again.
 * An operation that throws a BattleException has changed nothing.
 *
 * The engine is not thread safe. Callers must serialise operations.
 *
 * The inform* functions are called after each operation has been saved.
 * By default they narrate to Log::out(); subclasses can override them to
 * render the battle some other way.
 */
class BattleEngine : boost::noncopyable {
public:
    BattleEngine(StateStore &store, const BattleMechanics &mech,
            const MoveDatabase *moves = NULL);
    virtual ~BattleEngine() { }

    /**
     * Start a battle. Relationships are set up symmetrically (same faction
     * is allied, anything else hostile), default victory conditions for the
     * kind are installed and initiative is rolled for everyone.
     *
     * Throws StateConflictException if a battle is already active, and
     * ValidationException for an empty roster or an invalid kind.
     */
    BattleState::PTR startBattle(const BATTLE_KIND kind,
            const Participant::ARRAY &participants,
            const std::string &battlefield, const Weather &weather,
            RandomSource &rand);
    BattleState::PTR startBattle(const std::string &kind,
            const Participant::ARRAY &participants,
            const std::string &battlefield, const Weather &weather,
            RandomSource &rand);

    /**
     * End the current battle and clear the store.
     */
    void endBattle(const std::string &reason);

    /**
     * Add or remove a participant mid-battle. Either way initiative is
     * rolled again for the whole roster.
     */
    void addParticipant(Participant::PTR p, RandomSource &rand);
    void removeParticipant(const std::string &id, RandomSource &rand);

    /**
     * Set a creature's vigor directly, e.g. for healing or recoil.
     */
    VigorChange updateVigor(const std::string &id, const int vigor,
            const std::string &reason);

    void applyStatusEffect(const std::string &targetId,
            const StatusEffect &effect);
    bool removeStatusEffect(const std::string &targetId,
            const std::string &name);

    void resolveAction(const BattleAction &action, RandomSource &rand,
            ACTION_RESULTS &results);

    TurnInfo advancePhase();

    VictoryOutcome evaluateVictory() const;
    VictoryOutcome evaluateVictory(const boost::posix_time::ptime &now) const;

    /**
     * Get log entries, optionally only the last count and only those by one
     * actor.
     */
    void getLog(LOG_ENTRIES &entries, const int count = 0,
            const std::string &actor = std::string()) const;

    /**
     * Change how one participant regards another. Only that direction is
     * changed.
     */
    void setRelationship(const std::string &from, const std::string &to,
            const RELATIONSHIP r);

    void setVictoryConditions(const VICTORY_CONDITIONS &conditions);

    BattleSummary getSummary() const;

    /**
     * The current battle, for inspection. Null if there is no battle.
     */
    BattleState::PTR getState() const;

    bool hasActiveBattle() const;

    void setNarrationEnabled(const bool narrate) {
        m_narrate = narrate;
    }
    bool isNarrationEnabled() const {
        return m_narrate;
    }

    virtual void informLogEntry(const BattleLogEntry &entry);
    virtual void informActionResult(const Participant &actor,
            const ActionResult &result) { }
    virtual void informDefeated(const Participant &p);
    virtual void informBattleEnd(const std::string &reason);

protected:
    /**
     * Called on entering BP_APPLY_EFFECTS. Status ticks, weather and hazard
     * effects belong to the ruleset, so the engine does nothing here.
     */
    virtual void tickEffects(BattleState &) { }

private:
    StateStore &m_store;
    const BattleMechanics &m_mech;
    const MoveDatabase *m_moves;
    bool m_narrate;

    BattleState::PTR requireBattle() const;
    Participant &requireParticipant(const BattleState &,
            const std::string &) const;
    void defeatHandlers(BattleState &, std::vector<const Participant *> &);
    void commit(BattleState::PTR state, const int mark);
};

}

#endif
