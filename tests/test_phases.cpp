/*
 * File:   test_phases.cpp
 *
 * Created on October 19, 2026, 4:40 PM
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

#include <doctest/doctest.h>
#include "test_harness.h"
#include "battle/PhaseMachine.h"

using namespace vigorbattle;
using namespace vigorbattle::test;

TEST_CASE("Phases: successor of every phase") {
    CHECK(getNextPhase(BP_INITIALIZE) == BP_SELECT_ACTION);
    CHECK(getNextPhase(BP_SELECT_ACTION) == BP_RESOLVE_ACTIONS);
    CHECK(getNextPhase(BP_RESOLVE_ACTIONS) == BP_APPLY_EFFECTS);
    CHECK(getNextPhase(BP_APPLY_EFFECTS) == BP_CHECK_VICTORY);
    CHECK(getNextPhase(BP_CHECK_VICTORY) == BP_END_TURN);
    CHECK(getNextPhase(BP_END_TURN) == BP_SELECT_ACTION);
    CHECK(getNextPhase(BP_BATTLE_END) == BP_BATTLE_END);
}

TEST_CASE("Phases: names") {
    CHECK(getPhaseName(BP_SELECT_ACTION) == "SelectAction");
    CHECK(getPhaseName(BP_BATTLE_END) == "BattleEnd");
    CHECK(getBattleKindName(BK_CHAMPION) == "Champion");
    CHECK(parseBattleKind("gym") == BK_GYM);
    CHECK(parseBattleKind("LEGENDARY") == BK_LEGENDARY);
    CHECK_THROWS_AS(parseBattleKind("Tournament"), ValidationException);
}

TEST_CASE_FIXTURE(BattleHarness, "Phases: a full turn cycle") {
    BattleState::PTR state = startDuel();
    CHECK(state->getPhase() == BP_INITIALIZE);
    CHECK(state->getTurn() == 1);

    TurnInfo info = engine.advancePhase();
    CHECK(info.phase == BP_SELECT_ACTION);
    CHECK(info.turn == 2);

    const BATTLE_PHASE cycle[] = { BP_RESOLVE_ACTIONS, BP_APPLY_EFFECTS,
            BP_CHECK_VICTORY, BP_END_TURN };
    for (int i = 0; i < 4; ++i) {
        info = engine.advancePhase();
        CHECK(info.phase == cycle[i]);
        CHECK(info.turn == 2);
    }

    info = engine.advancePhase();
    CHECK(info.phase == BP_SELECT_ACTION);
    CHECK(info.turn == 3);
    CHECK(state->getTurn() == 3);
}

TEST_CASE_FIXTURE(BattleHarness, "Phases: transitions are logged") {
    BattleState::PTR state = startDuel();
    engine.advancePhase();
    engine.advancePhase();

    const BattleLogEntry &entry = state->getLog().getEntries().back();
    CHECK(entry.action == "Phase Advanced");
    CHECK(entry.result == "Battle phase changed to ResolveActions");
    CHECK(entry.phase == BP_RESOLVE_ACTIONS);
    CHECK(entry.turn == 2);
    CHECK(entry.actorId.empty());
    CHECK(engine.entries.back().result == entry.result);
}

TEST_CASE_FIXTURE(BattleHarness, "Phases: acting is reset when a turn starts") {
    BattleState::PTR state = startDuel();
    ACTION_RESULTS results;
    engine.advancePhase();  // SelectAction
    engine.resolveAction(BattleAction("a", AK_SWITCH), rand, results);
    REQUIRE(state->getParticipant("a")->hasActed());

    engine.advancePhase();  // ResolveActions
    engine.advancePhase();  // ApplyEffects
    engine.advancePhase();  // CheckVictory
    engine.advancePhase();  // EndTurn
    CHECK(state->getParticipant("a")->hasActed());

    engine.advancePhase();  // SelectAction
    CHECK_FALSE(state->getParticipant("a")->hasActed());
    CHECK_FALSE(state->getParticipant("b")->hasActed());
}

TEST_CASE_FIXTURE(BattleHarness, "Phases: effects are ticked once per turn") {
    startDuel();
    for (int i = 0; i < 11; ++i) {
        engine.advancePhase();
    }
    // Initialize -> SelectAction, then two full turns and back to SelectAction.
    CHECK(engine.ticks == 2);
}

TEST_CASE("Phases: a finished battle stays finished") {
    BattleState state(BK_WILD, Battlefield(), Weather());
    finishBattle(state, "done");
    CHECK(state.getPhase() == BP_BATTLE_END);
    CHECK_FALSE(state.isActive());
    CHECK(state.getLog().getEntries().back().action == "Battle Ended");
    CHECK(state.getLog().getEntries().back().result == "done");

    const int turn = state.getTurn();
    CHECK(advancePhase(state) == BP_BATTLE_END);
    CHECK(advancePhase(state) == BP_BATTLE_END);
    CHECK(state.getTurn() == turn);
}
