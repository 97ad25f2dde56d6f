/*
 * File:   VictoryEvaluator.h
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

#ifndef _VICTORY_EVALUATOR_H_
#define _VICTORY_EVALUATOR_H_

#include <string>
#include <vector>
#include <map>
#include <boost/variant.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include "phase.h"

namespace vigorbattle {

class BattleState;

enum VICTORY_TYPE {
    VT_DEFEAT_ALL_ENEMIES = 0,
    VT_DEFEAT_SPECIFIC_TARGET,
    VT_SURVIVAL,
    VT_ESCAPE,
    VT_OBJECTIVE,
    VT_TIMER
};

std::string getVictoryTypeName(const VICTORY_TYPE);

/**
 * Parameter names understood by the evaluator.
 */
extern const char *PARAM_TARGET_ID;     // string
extern const char *PARAM_TURNS;         // int
extern const char *PARAM_TIME_LIMIT;    // ptime (UTC)

typedef boost::variant<int, std::string, boost::posix_time::ptime>
        VICTORY_PARAMETER;
typedef std::map<std::string, VICTORY_PARAMETER> PARAMETER_MAP;

struct VictoryCondition {
    VICTORY_TYPE type;
    std::string faction;        // the faction this condition is for
    PARAMETER_MAP parameters;
    std::string description;

    VictoryCondition(const VICTORY_TYPE t, const std::string &f,
            const std::string &desc = std::string()):
            type(t),
            faction(f),
            description(desc) { }
};

typedef std::vector<VictoryCondition> VICTORY_CONDITIONS;

struct VictoryCheck {
    bool met;
    std::string reason;
    VictoryCheck(const bool m, const std::string &r): met(m), reason(r) { }
};

/**
 * The outcome of checking every condition of a battle. The battle is won
 * when any single condition is met.
 */
struct VictoryOutcome {
    bool met;
    std::string reason;
    std::vector<VictoryCheck> checks;   // one per condition, in order
    VictoryOutcome(): met(false) { }
};

/**
 * The conditions a new battle of the given kind starts with.
 */
void getDefaultVictoryConditions(const BATTLE_KIND, VICTORY_CONDITIONS &);

/**
 * Check a single condition. Neither function modifies the state. The time
 * is only consulted by VT_TIMER.
 */
VictoryCheck checkVictoryCondition(const BattleState &,
        const VictoryCondition &, const boost::posix_time::ptime &now);

VictoryOutcome evaluateVictory(const BattleState &,
        const boost::posix_time::ptime &now);

}

#endif
