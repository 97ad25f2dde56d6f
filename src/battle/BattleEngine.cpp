/*
 * File:   BattleEngine.cpp
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

#include <set>
#include <sstream>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BattleEngine.h"
#include "BattleException.h"
#include "StateStore.h"
#include "Initiative.h"
#include "PhaseMachine.h"
#include "../mechanics/BattleMechanics.h"
#include "../main/Log.h"

using namespace std;
namespace pt = boost::posix_time;

namespace vigorbattle {

namespace {

const int SUMMARY_EVENTS = 3;

typedef vector<const Participant *> DEFEATED;

} // anonymous namespace

BattleEngine::BattleEngine(StateStore &store, const BattleMechanics &mech,
        const MoveDatabase *moves):
        m_store(store),
        m_mech(mech),
        m_moves(moves),
        m_narrate(true) { }

BattleState::PTR BattleEngine::requireBattle() const {
    BattleState::PTR state = m_store.load();
    if (!state || !state->isActive()) {
        throw StateConflictException("No active battle");
    }
    return state;
}

Participant &BattleEngine::requireParticipant(const BattleState &state,
        const string &id) const {
    Participant *p = state.getParticipant(id);
    if (!p) {
        throw NotFoundException("participant " + id + " not found");
    }
    return *p;
}

/**
 * Defeat any handler whose whole team has been defeated.
 */
void BattleEngine::defeatHandlers(BattleState &state, DEFEATED &defeated) {
    const Participant::ARRAY &participants = state.getParticipants();
    Participant::ARRAY::const_iterator i = participants.begin();
    for (; i != participants.end(); ++i) {
        Participant &p = **i;
        const HandlerCombatant *handler = p.getHandler();
        if (!handler || p.isDefeated() || handler->getRemainingTeam().empty())
            continue;
        // Members who have left the battle are not counted either way.
        int present = 0;
        bool standing = false;
        const vector<string> &team = handler->getRemainingTeam();
        vector<string>::const_iterator j = team.begin();
        for (; j != team.end(); ++j) {
            const Participant *member = state.getParticipant(*j);
            if (!member)
                continue;
            ++present;
            if (!member->isDefeated()) {
                standing = true;
                break;
            }
        }
        if ((present != 0) && !standing && p.markDefeated()) {
            state.log(p.getId(), "Handler Defeated",
                    p.getName() + " has no creatures left to fight");
            defeated.push_back(&p);
        }
    }
}

/**
 * Report the log entries appended since mark, then save.
 */
void BattleEngine::commit(BattleState::PTR state, const int mark) {
    m_store.save(state);
    const LOG_ENTRIES &entries = state->getLog().getEntries();
    for (int i = mark; i < static_cast<int>(entries.size()); ++i) {
        informLogEntry(entries[i]);
    }
}

BattleState::PTR BattleEngine::startBattle(const string &kind,
        const Participant::ARRAY &participants, const string &battlefield,
        const Weather &weather, RandomSource &rand) {
    if (m_store.hasActiveBattle()) {
        throw StateConflictException("A battle is already active");
    }
    if (participants.empty()) {
        throw ValidationException("A battle needs at least one participant");
    }
    return startBattle(parseBattleKind(kind), participants, battlefield,
            weather, rand);
}

BattleState::PTR BattleEngine::startBattle(const BATTLE_KIND kind,
        const Participant::ARRAY &participants, const string &battlefield,
        const Weather &weather, RandomSource &rand) {
    if (m_store.hasActiveBattle()) {
        throw StateConflictException("A battle is already active");
    }
    if (participants.empty()) {
        throw ValidationException("A battle needs at least one participant");
    }
    if ((kind < 0) || (kind >= BATTLE_KIND_COUNT)) {
        throw ValidationException("invalid battle kind");
    }

    BattleState::PTR state(new BattleState(kind, Battlefield(battlefield),
            weather));
    Participant::ARRAY::const_iterator i = participants.begin();
    for (; i != participants.end(); ++i) {
        state->addParticipant(*i);
    }

    for (i = participants.begin(); i != participants.end(); ++i) {
        Participant::ARRAY::const_iterator j = participants.begin();
        for (; j != participants.end(); ++j) {
            if (i == j)
                continue;
            const bool allied = boost::algorithm::iequals(
                    (*i)->getFaction(), (*j)->getFaction());
            (*i)->setRelationship((*j)->getId(), allied ? R_ALLIED : R_HOSTILE);
        }
    }

    VICTORY_CONDITIONS conditions;
    getDefaultVictoryConditions(kind, conditions);
    state->setVictoryConditions(conditions);

    calculateTurnOrder(*state, m_mech, rand);

    stringstream text;
    text << getBattleKindName(kind) << " battle began on "
            << state->getBattlefield().name << " with "
            << participants.size() << " participants";
    state->log("", "Battle Started", text.str());
    commit(state, 0);
    return state;
}

void BattleEngine::endBattle(const string &reason) {
    BattleState::PTR state = requireBattle();
    const int mark = state->getLog().size();
    finishBattle(*state, reason);
    const LOG_ENTRIES &entries = state->getLog().getEntries();
    for (int i = mark; i < static_cast<int>(entries.size()); ++i) {
        informLogEntry(entries[i]);
    }
    m_store.clear();
    informBattleEnd(reason);
}

void BattleEngine::addParticipant(Participant::PTR p, RandomSource &rand) {
    BattleState::PTR state = requireBattle();
    const int mark = state->getLog().size();
    state->addParticipant(p);
    calculateTurnOrder(*state, m_mech, rand);
    state->log(p->getId(), "Participant Added",
            p->getName() + " joined the battle");
    commit(state, mark);
}

void BattleEngine::removeParticipant(const string &id, RandomSource &rand) {
    BattleState::PTR state = requireBattle();
    const Participant &p = requireParticipant(*state, id);
    const string name = p.getName();
    const string pid = p.getId();
    const int mark = state->getLog().size();
    state->removeParticipant(pid);
    calculateTurnOrder(*state, m_mech, rand);
    state->log(pid, "Participant Removed", name + " left the battle");
    commit(state, mark);
}

VigorChange BattleEngine::updateVigor(const string &id, const int vigor,
        const string &reason) {
    BattleState::PTR state = requireBattle();
    Participant &p = requireParticipant(*state, id);
    CreatureCombatant *creature = p.getCreature();
    if (!creature) {
        throw ValidationException(p.getName() + " is a handler and has no "
                "vigor");
    }
    const int mark = state->getLog().size();

    VigorChange change;
    change.oldVigor = creature->getVigor();
    const bool defeatedNow = p.setVigor(vigor);
    change.newVigor = creature->getVigor();
    change.change = change.newVigor - change.oldVigor;
    change.isDefeated = p.isDefeated();

    stringstream text;
    text << p.getName() << " vigor " << change.oldVigor << " -> "
            << change.newVigor;
    if (!reason.empty()) {
        text << " (" << reason << ")";
    }
    state->log(p.getId(), "Vigor Updated", text.str());

    DEFEATED defeated;
    if (defeatedNow) {
        state->log(p.getId(), "Creature Defeated",
                p.getName() + " has been defeated");
        defeated.push_back(&p);
    }
    defeatHandlers(*state, defeated);
    commit(state, mark);
    for (DEFEATED::iterator i = defeated.begin(); i != defeated.end(); ++i) {
        informDefeated(**i);
    }
    return change;
}

void BattleEngine::applyStatusEffect(const string &targetId,
        const StatusEffect &effect) {
    BattleState::PTR state = requireBattle();
    Participant &p = requireParticipant(*state, targetId);
    const int mark = state->getLog().size();
    const bool replaced = p.applyStatus(effect);
    string text = p.getName() + " is now affected by " + effect.getName();
    if (replaced) {
        text += " (replacing the previous " + effect.getName() + ")";
    }
    state->log(p.getId(), "Status Effect Applied", text);
    commit(state, mark);
}

bool BattleEngine::removeStatusEffect(const string &targetId,
        const string &name) {
    BattleState::PTR state = requireBattle();
    Participant &p = requireParticipant(*state, targetId);
    if (!p.removeStatus(name)) {
        return false;
    }
    const int mark = state->getLog().size();
    state->log(p.getId(), "Status Effect Removed",
            p.getName() + " is no longer affected by " + name);
    commit(state, mark);
    return true;
}

void BattleEngine::resolveAction(const BattleAction &action,
        RandomSource &rand, ACTION_RESULTS &results) {
    BattleState::PTR state = requireBattle();
    const int mark = state->getLog().size();
    ActionResolver resolver(m_mech, m_moves);
    resolver.resolve(*state, action, rand, results);

    DEFEATED defeated;
    ACTION_RESULTS::const_iterator i = results.begin();
    for (; i != results.end(); ++i) {
        if (i->defeated) {
            defeated.push_back(state->getParticipant(i->targetId));
        }
    }
    defeatHandlers(*state, defeated);
    commit(state, mark);

    const Participant &actor = *state->getParticipant(action.actorId);
    for (i = results.begin(); i != results.end(); ++i) {
        informActionResult(actor, *i);
    }
    for (DEFEATED::iterator j = defeated.begin(); j != defeated.end(); ++j) {
        informDefeated(**j);
    }
}

TurnInfo BattleEngine::advancePhase() {
    BattleState::PTR state = requireBattle();
    const int mark = state->getLog().size();
    const BATTLE_PHASE phase = vigorbattle::advancePhase(*state);
    if (phase == BP_APPLY_EFFECTS) {
        tickEffects(*state);
    }
    commit(state, mark);
    TurnInfo info;
    info.turn = state->getTurn();
    info.phase = state->getPhase();
    return info;
}

VictoryOutcome BattleEngine::evaluateVictory() const {
    return evaluateVictory(pt::second_clock::universal_time());
}

VictoryOutcome BattleEngine::evaluateVictory(const pt::ptime &now) const {
    BattleState::PTR state = requireBattle();
    return vigorbattle::evaluateVictory(*state, now);
}

void BattleEngine::getLog(LOG_ENTRIES &entries, const int count,
        const string &actor) const {
    if (count < 0) {
        throw ValidationException("log entry count cannot be negative");
    }
    BattleState::PTR state = requireBattle();
    state->getLog().getEntries(entries, count, actor);
}

void BattleEngine::setRelationship(const string &from, const string &to,
        const RELATIONSHIP r) {
    BattleState::PTR state = requireBattle();
    Participant &p = requireParticipant(*state, from);
    const Participant &other = requireParticipant(*state, to);
    const int mark = state->getLog().size();
    p.setRelationship(other.getId(), r);
    state->log(p.getId(), "Relationship Changed", p.getName() + " is now "
            + getRelationshipName(r) + " towards " + other.getName(),
            vector<string>(1, other.getId()));
    commit(state, mark);
}

void BattleEngine::setVictoryConditions(
        const VICTORY_CONDITIONS &conditions) {
    BattleState::PTR state = requireBattle();
    for (VICTORY_CONDITIONS::const_iterator i = conditions.begin();
            i != conditions.end(); ++i) {
        if ((i->type < 0) || (i->type > VT_TIMER)) {
            throw ValidationException("unknown victory condition type");
        }
    }
    const int mark = state->getLog().size();
    state->setVictoryConditions(conditions);
    stringstream text;
    text << conditions.size() << " victory conditions in force";
    state->log("", "Victory Conditions Set", text.str());
    commit(state, mark);
}

BattleSummary BattleEngine::getSummary() const {
    BattleState::PTR state = requireBattle();
    BattleSummary summary;
    summary.kind = state->getKind();
    summary.turn = state->getTurn();
    summary.phase = state->getPhase();
    summary.currentActor = state->getCurrentActor();
    summary.participants = state->getParticipants().size();
    summary.standing = 0;
    summary.defeated = 0;

    set<string> seen;
    const Participant::ARRAY &participants = state->getParticipants();
    Participant::ARRAY::const_iterator i = participants.begin();
    for (; i != participants.end(); ++i) {
        if ((*i)->isDefeated()) {
            ++summary.defeated;
        } else {
            ++summary.standing;
        }
        if (seen.insert((*i)->getFaction()).second) {
            summary.factions.push_back((*i)->getFaction());
        }
    }
    summary.battlefield = state->getBattlefield().name;
    summary.hazards = state->getBattlefield().hazards.size();
    summary.weather = state->getWeather().name;
    state->getLog().getEntries(summary.recentEvents, SUMMARY_EVENTS,
            string());
    return summary;
}

BattleState::PTR BattleEngine::getState() const {
    return m_store.load();
}

bool BattleEngine::hasActiveBattle() const {
    return m_store.hasActiveBattle();
}

void BattleEngine::informLogEntry(const BattleLogEntry &entry) {
    if (!m_narrate)
        return;
    Log::out() << "[turn " << entry.turn << ", " << getPhaseName(entry.phase)
            << "] " << entry.action << ": " << entry.result << endl;
}

void BattleEngine::informDefeated(const Participant &p) {
    if (!m_narrate)
        return;
    Log::out() << p.getName() << " is out of the battle!" << endl;
}

void BattleEngine::informBattleEnd(const string &reason) {
    if (!m_narrate)
        return;
    Log::out() << "The battle is over: " << reason << endl;
}

}
