/*
 * File:   phase.cpp
 *
 * Created on October 19, 2026, 11:40 AM
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
#include "phase.h"
#include "BattleException.h"

using namespace std;

namespace vigorbattle {

namespace {

const char *PHASE_NAMES[] = { "Initialize", "SelectAction", "ResolveActions",
        "ApplyEffects", "CheckVictory", "EndTurn", "BattleEnd" };

const char *KIND_NAMES[] = { "Wild", "Trainer", "Gym", "Elite", "Champion",
        "Legendary" };

} // anonymous namespace

BATTLE_PHASE getNextPhase(const BATTLE_PHASE phase) {
    switch (phase) {
        case BP_INITIALIZE:
            return BP_SELECT_ACTION;
        case BP_SELECT_ACTION:
            return BP_RESOLVE_ACTIONS;
        case BP_RESOLVE_ACTIONS:
            return BP_APPLY_EFFECTS;
        case BP_APPLY_EFFECTS:
            return BP_CHECK_VICTORY;
        case BP_CHECK_VICTORY:
            return BP_END_TURN;
        case BP_END_TURN:
            return BP_SELECT_ACTION;
        case BP_BATTLE_END:
            return BP_BATTLE_END;
    }
    return BP_SELECT_ACTION;
}

string getPhaseName(const BATTLE_PHASE phase) {
    return PHASE_NAMES[phase];
}

string getBattleKindName(const BATTLE_KIND kind) {
    return KIND_NAMES[kind];
}

BATTLE_KIND parseBattleKind(const string &text) {
    for (int i = 0; i < BATTLE_KIND_COUNT; ++i) {
        if (boost::algorithm::iequals(text, KIND_NAMES[i]))
            return static_cast<BATTLE_KIND>(i);
    }
    throw ValidationException("invalid battle kind: " + text);
}

}
