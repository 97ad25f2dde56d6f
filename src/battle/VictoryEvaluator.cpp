/*
 * File:   VictoryEvaluator.cpp
 *
 * Created on October 19, 2026, 12:20 PM
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
#include <boost/lexical_cast.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "VictoryEvaluator.h"
#include "BattleState.h"

using namespace std;
namespace pt = boost::posix_time;

namespace vigorbattle {

const char *PARAM_TARGET_ID = "targetId";
const char *PARAM_TURNS = "turns";
const char *PARAM_TIME_LIMIT = "timeLimit";

namespace {

const char *VICTORY_NAMES[] = { "DefeatAllEnemies", "DefeatSpecificTarget",
        "Survival", "Escape", "Objective", "Timer" };

/**
 * Get a parameter of the given type, or NULL if it is absent or has some
 * other type.
 */
template <class T>
const T *getParameter(const VictoryCondition &condition, const char *name) {
    PARAMETER_MAP::const_iterator i = condition.parameters.find(name);
    if (i == condition.parameters.end())
        return NULL;
    return boost::get<T>(&i->second);
}

VictoryCheck achieved(const VictoryCondition &condition) {
    return VictoryCheck(true, condition.faction + " has achieved "
            + getVictoryTypeName(condition.type));
}

VictoryCheck checkDefeatAllEnemies(const BattleState &state,
        const VictoryCondition &condition) {
    int standing = 0;
    const Participant::ARRAY &participants = state.getParticipants();
    Participant::ARRAY::const_iterator i = participants.begin();
    for (; i != participants.end(); ++i) {
        const Participant &p = **i;
        if (!isEnemyKind(p.getKind())
                || boost::algorithm::iequals(p.getFaction(), condition.faction))
            continue;
        if (!p.isDefeated()) {
            ++standing;
        }
    }
    if (standing != 0) {
        return VictoryCheck(false, "Condition not met: "
                + boost::lexical_cast<string>(standing)
                + " opposing enemies remain");
    }
    return achieved(condition);
}

VictoryCheck checkDefeatSpecificTarget(const BattleState &state,
        const VictoryCondition &condition) {
    const string *id = getParameter<string>(condition, PARAM_TARGET_ID);
    if (!id) {
        return VictoryCheck(false, "Condition not met: no targetId given");
    }
    const Participant *target = state.getParticipant(*id);
    if (!target) {
        return VictoryCheck(false, "Condition not met: target " + *id
                + " is not in the battle");
    }
    if (!target->isDefeated()) {
        return VictoryCheck(false, "Condition not met: " + target->getName()
                + " is still standing");
    }
    return achieved(condition);
}

VictoryCheck checkSurvival(const BattleState &state,
        const VictoryCondition &condition) {
    const int *turns = getParameter<int>(condition, PARAM_TURNS);
    if (!turns) {
        return VictoryCheck(false, "Condition not met: no turns given");
    }
    if (state.getTurn() < *turns) {
        return VictoryCheck(false, "Condition not met: turn "
                + boost::lexical_cast<string>(state.getTurn()) + " of "
                + boost::lexical_cast<string>(*turns));
    }
    return achieved(condition);
}

VictoryCheck checkTimer(const VictoryCondition &condition,
        const pt::ptime &now) {
    const pt::ptime *limit = getParameter<pt::ptime>(condition,
            PARAM_TIME_LIMIT);
    if (!limit || limit->is_special()) {
        return VictoryCheck(false, "Condition not met: no timeLimit given");
    }
    if (now < *limit) {
        return VictoryCheck(false, "Condition not met: time remains");
    }
    return achieved(condition);
}

} // anonymous namespace

string getVictoryTypeName(const VICTORY_TYPE type) {
    return VICTORY_NAMES[type];
}

void getDefaultVictoryConditions(const BATTLE_KIND kind,
        VICTORY_CONDITIONS &conditions) {
    conditions.clear();
    conditions.push_back(VictoryCondition(VT_DEFEAT_ALL_ENEMIES, "Player",
            "Defeat all opposing creatures"));
    if (kind == BK_WILD) {
        conditions.push_back(VictoryCondition(VT_ESCAPE, "Player",
                "Escape from the wild creature"));
    }
}

VictoryCheck checkVictoryCondition(const BattleState &state,
        const VictoryCondition &condition, const pt::ptime &now) {
    switch (condition.type) {
        case VT_DEFEAT_ALL_ENEMIES:
            return checkDefeatAllEnemies(state, condition);
        case VT_DEFEAT_SPECIFIC_TARGET:
            return checkDefeatSpecificTarget(state, condition);
        case VT_SURVIVAL:
            return checkSurvival(state, condition);
        case VT_TIMER:
            return checkTimer(condition, now);
        case VT_ESCAPE:
        case VT_OBJECTIVE:
            // Needs state that the engine does not track.
            return VictoryCheck(false, getVictoryTypeName(condition.type)
                    + " is not tracked by the engine");
    }
    return VictoryCheck(false, "Unknown victory condition");
}

VictoryOutcome evaluateVictory(const BattleState &state,
        const pt::ptime &now) {
    VictoryOutcome outcome;
    const VICTORY_CONDITIONS &conditions = state.getVictoryConditions();
    VICTORY_CONDITIONS::const_iterator i = conditions.begin();
    for (; i != conditions.end(); ++i) {
        const VictoryCheck check = checkVictoryCondition(state, *i, now);
        if (check.met && !outcome.met) {
            outcome.met = true;
            outcome.reason = check.reason;
        }
        outcome.checks.push_back(check);
    }
    if (!outcome.met) {
        outcome.reason = conditions.empty() ? "No victory conditions"
                : "Condition not met";
    }
    return outcome;
}

}
