/*
 * File:   test_actions.cpp
 *
 * Created on October 19, 2026, 4:20 PM
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

using namespace vigorbattle;
using namespace vigorbattle::test;

TEST_CASE_FIXTURE(BattleHarness, "Actions: basic physical hit") {
    BattleState::PTR state = startDuel();
    REQUIRE(state->getCurrentActor() == "a");
    const int entries = state->getLog().size();

    const int rolls[] = { 15, 4, 2, 5 };
    rand.push(rolls, 4);
    ACTION_RESULTS results;
    engine.resolveAction(attack("a", "b", strike()), rand, results);

    REQUIRE(results.size() == 1);
    const ActionResult &r = results[0];
    CHECK(r.outcome == AO_HIT);
    CHECK(r.isSuccess());
    CHECK(r.hit.roll == 15);
    CHECK(r.hit.attackLevel == 3);
    CHECK(r.hit.defenseValue == 11);
    CHECK_FALSE(r.hit.critical);
    CHECK(r.damage.bonusDice == 1);
    CHECK(r.damage.dice.size() == 3);
    CHECK(r.damage.rolled == 11);
    CHECK(r.damage.damage == 11);
    CHECK(r.remainingVigor == 39);
    CHECK_FALSE(r.defeated);
    CHECK(getVigor(*state, "b") == 39);
    CHECK(rand.getRemaining() == 0);

    REQUIRE(state->getLog().size() == entries + 1);
    const BattleLogEntry &entry = state->getLog().getEntries().back();
    CHECK(entry.action == "Attack");
    CHECK(entry.actorId == "a");
    CHECK(entry.result == "a used Strike; a hit b for 11 damage");
    REQUIRE(entry.targets.size() == 1);
    CHECK(entry.targets[0] == "b");

    CHECK(state->getParticipant("a")->hasActed());
    CHECK(engine.results.size() == 1);
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: a low roll misses") {
    BattleState::PTR state = startDuel();
    rand.push(5);
    const int draws = rand.getDrawCount();

    ACTION_RESULTS results;
    engine.resolveAction(attack("a", "b", strike()), rand, results);

    REQUIRE(results.size() == 1);
    CHECK(results[0].outcome == AO_MISS);
    CHECK_FALSE(results[0].isSuccess());
    CHECK(results[0].damage.damage == 0);
    CHECK(results[0].remainingVigor == 50);
    CHECK(results[0].message == "a missed b");
    CHECK(getVigor(*state, "b") == 50);
    // No damage dice are rolled for a miss.
    CHECK(rand.getDrawCount() == draws + 1);
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: a natural 20 is a critical hit") {
    BattleState::PTR state = startDuel();
    const int rolls[] = { 20, 6, 6, 6 };
    rand.push(rolls, 4);

    ACTION_RESULTS results;
    engine.resolveAction(attack("a", "b", strike()), rand, results);

    REQUIRE(results.size() == 1);
    CHECK(results[0].hit.critical);
    CHECK(results[0].damage.rolled == 27);
    CHECK(results[0].damage.damage == 27);
    CHECK(getVigor(*state, "b") == 23);
    CHECK(results[0].message == "a hit b for 27 damage (critical hit)");
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: special moves use Mind against Spirit") {
    Participant::ARRAY roster;
    roster.push_back(makeCreature("psy", PK_PLAYER_CREATURE, "Player",
            CreatureType::PSYCHIC, StatBlock(0, 0, 2, 0, 0, 0)));
    roster.push_back(makeCreature("wall", PK_ENEMY_CREATURE, "Wild",
            CreatureType::NORMAL, StatBlock(0, 0, 0, 0, 0, 3)));
    BattleState::PTR state = start(roster);

    const MoveTemplate beam("Beam", &CreatureType::NORMAL, 2, MC_SPECIAL);
    ACTION_RESULTS results;

    SUBCASE("a roll that would hit physically misses") {
        rand.push(10);
        engine.resolveAction(attack("psy", "wall", beam), rand, results);
        REQUIRE(results.size() == 1);
        CHECK(results[0].hit.attackLevel == 2);
        CHECK(results[0].hit.defenseValue == 13);
        CHECK(results[0].outcome == AO_MISS);
    }

    SUBCASE("the physical version of the same move hits") {
        rand.push(10);
        const MoveTemplate punch("Punch", &CreatureType::NORMAL, 2,
                MC_PHYSICAL);
        engine.resolveAction(attack("psy", "wall", punch), rand, results);
        REQUIRE(results.size() == 1);
        CHECK(results[0].hit.attackLevel == 0);
        CHECK(results[0].hit.defenseValue == 10);
        CHECK(results[0].outcome == AO_HIT);
    }
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: type effectiveness scales damage") {
    Participant::ARRAY roster;
    roster.push_back(makeCreature("volt", PK_PLAYER_CREATURE, "Player",
            CreatureType::ELECTRIC, StatBlock(0, 2, 2, 0, 0, 0)));
    roster.push_back(makeCreature("fish", PK_ENEMY_CREATURE, "Wild",
            CreatureType::WATER, StatBlock()));
    roster.push_back(makeCreature("mole", PK_ENEMY_CREATURE, "Wild",
            CreatureType::GROUND, StatBlock()));
    BattleState::PTR state = start(roster);

    const MoveTemplate shock("Shock", &CreatureType::ELECTRIC, 2, MC_SPECIAL);
    ACTION_RESULTS results;

    SUBCASE("super effective doubles") {
        const int rolls[] = { 15, 3, 3, 3 };
        rand.push(rolls, 4);
        engine.resolveAction(attack("volt", "fish", shock), rand, results);
        REQUIRE(results.size() == 1);
        CHECK(results[0].damage.rolled == 9);
        CHECK(results[0].damage.effectiveness == 2.0);
        CHECK(results[0].damage.damage == 18);
        CHECK(getVigor(*state, "fish") == 32);
        CHECK(results[0].message
                == "volt hit fish for 18 damage (Super Effective)");
    }

    SUBCASE("no effect deals nothing") {
        const int rolls[] = { 15, 6, 6, 6 };
        rand.push(rolls, 4);
        engine.resolveAction(attack("volt", "mole", shock), rand, results);
        REQUIRE(results.size() == 1);
        CHECK(results[0].outcome == AO_HIT);
        CHECK(results[0].damage.damage == 0);
        CHECK(getVigor(*state, "mole") == 50);
        CHECK(results[0].message == "volt hit mole for 0 damage (No Effect)");
    }
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: resisted damage is rounded down") {
    BattleState::PTR state = startDuel();
    const MoveTemplate spark("Spark", &CreatureType::FIRE, 1, MC_SPECIAL);
    ACTION_RESULTS results;

    SUBCASE("half of three") {
        const int rolls[] = { 15, 3 };
        rand.push(rolls, 2);
        engine.resolveAction(attack("a", "b", spark), rand, results);
        REQUIRE(results.size() == 1);
        CHECK(results[0].damage.effectiveness == 0.5);
        CHECK(results[0].damage.damage == 1);
        CHECK(getVigor(*state, "b") == 49);
    }

    SUBCASE("half of one is nothing") {
        const int rolls[] = { 15, 1 };
        rand.push(rolls, 2);
        engine.resolveAction(attack("a", "b", spark), rand, results);
        REQUIRE(results.size() == 1);
        CHECK(results[0].outcome == AO_HIT);
        CHECK(results[0].damage.rolled == 1);
        CHECK(results[0].damage.damage == 0);
        CHECK(getVigor(*state, "b") == 50);
        CHECK(results[0].message
                == "a hit b for 0 damage (Not Very Effective)");
    }
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: negative attack levels cost a die") {
    Participant::ARRAY roster;
    roster.push_back(makeCreature("weak", PK_PLAYER_CREATURE, "Player",
            CreatureType::NORMAL, StatBlock(-2, 0, 0, 0, 0, 0)));
    roster.push_back(makeCreature("b", PK_ENEMY_CREATURE, "Wild",
            CreatureType::WATER, StatBlock(0, 1, 0, 0, 1, 0)));
    roster.push_back(makeCreature("c", PK_ENEMY_CREATURE, "Wild",
            CreatureType::WATER, StatBlock(0, 1, 0, 0, -2, 0)));
    BattleState::PTR state = start(roster);
    ACTION_RESULTS results;

    SUBCASE("one die fewer") {
        const int rolls[] = { 15, 2, 3 };
        rand.push(rolls, 3);
        engine.resolveAction(attack("weak", "b", strike()), rand, results);

        REQUIRE(results.size() == 1);
        CHECK(results[0].outcome == AO_HIT);
        CHECK(results[0].damage.bonusDice == -1);
        CHECK(results[0].damage.dice.size() == 1);
        CHECK(results[0].damage.damage == 2);
        CHECK(getVigor(*state, "b") == 48);
        // The unused draw stays queued.
        CHECK(rand.getRemaining() == 1);
    }

    SUBCASE("a one-die move rolls nothing") {
        const MoveTemplate jab("Jab", &CreatureType::NORMAL, 1, MC_PHYSICAL);
        const int rolls[] = { 15 };
        rand.push(rolls, 1);
        engine.resolveAction(attack("weak", "c", jab), rand, results);

        REQUIRE(results.size() == 1);
        CHECK(results[0].outcome == AO_HIT);
        CHECK(results[0].damage.bonusDice == -1);
        CHECK(results[0].damage.dice.empty());
        CHECK(results[0].damage.damage == 0);
        CHECK(getVigor(*state, "c") == 50);
    }

    SUBCASE("level minus one rounds down too") {
        state->getParticipant("weak")->getCreature()->setModifier(S_POWER, 1);
        const int rolls[] = { 15, 4 };
        rand.push(rolls, 2);
        engine.resolveAction(attack("weak", "b", strike()), rand, results);

        REQUIRE(results.size() == 1);
        CHECK(results[0].hit.attackLevel == -1);
        CHECK(results[0].damage.bonusDice == -1);
        CHECK(results[0].damage.damage == 4);
    }
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: defeating a target") {
    BattleState::PTR state = startDuel();
    engine.updateVigor("b", 5, "setup");
    REQUIRE(engine.defeated.empty());

    const int rolls[] = { 15, 4, 2, 5 };
    rand.push(rolls, 4);
    ACTION_RESULTS results;
    engine.resolveAction(attack("a", "b", strike()), rand, results);

    REQUIRE(results.size() == 1);
    CHECK(results[0].defeated);
    CHECK(results[0].remainingVigor == 0);
    CHECK(results[0].message == "a hit b for 11 damage; b was defeated");
    CHECK(state->getParticipant("b")->isDefeated());
    REQUIRE(engine.defeated.size() == 1);
    CHECK(engine.defeated[0] == "b");

    SUBCASE("the defeated creature cannot act") {
        ACTION_RESULTS again;
        CHECK_THROWS_AS(engine.resolveAction(attack("b", "a", strike()), rand,
                again), StateConflictException);
    }

    SUBCASE("hitting it again does not defeat it twice") {
        const int more[] = { 15, 1, 1, 1 };
        rand.push(more, 4);
        ACTION_RESULTS again;
        engine.resolveAction(attack("a", "b", strike()), rand, again);
        REQUIRE(again.size() == 1);
        CHECK(again[0].outcome == AO_HIT);
        CHECK_FALSE(again[0].defeated);
        CHECK(engine.defeated.size() == 1);
    }
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: invalid input changes nothing") {
    BattleState::PTR state = startDuel();
    const int entries = state->getLog().size();
    const int draws = rand.getDrawCount();
    ACTION_RESULTS results;

    SUBCASE("unknown actor") {
        CHECK_THROWS_AS(engine.resolveAction(attack("zed", "b", strike()),
                rand, results), NotFoundException);
    }

    SUBCASE("no targets") {
        BattleAction action("a", AK_ATTACK);
        action.move = strike();
        CHECK_THROWS_AS(engine.resolveAction(action, rand, results),
                ValidationException);
    }

    SUBCASE("no move") {
        BattleAction action("a", AK_ATTACK);
        action.targetIds.push_back("b");
        CHECK_THROWS_AS(engine.resolveAction(action, rand, results),
                ValidationException);
    }

    SUBCASE("unknown move name") {
        BattleAction action("a", AK_ATTACK);
        action.targetIds.push_back("b");
        action.moveName = "Hyper Beam";
        CHECK_THROWS_AS(engine.resolveAction(action, rand, results),
                ValidationException);
    }

    SUBCASE("unknown action kind") {
        BattleAction action("a", static_cast<ACTION_KIND>(9));
        action.targetIds.push_back("b");
        CHECK_THROWS_AS(engine.resolveAction(action, rand, results),
                ValidationException);
    }

    CHECK(state->getLog().size() == entries);
    CHECK(rand.getDrawCount() == draws);
    CHECK_FALSE(state->getParticipant("a")->hasActed());
    CHECK(getVigor(*state, "b") == 50);
    CHECK(results.empty());
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: each target is resolved in order") {
    BattleState::PTR state = startDuel();
    const int entries = state->getLog().size();
    const int rolls[] = { 15, 4, 2, 5 };
    rand.push(rolls, 4);

    BattleAction action = attack("a", "b", strike());
    action.targetIds.push_back("ghost");
    ACTION_RESULTS results;
    engine.resolveAction(action, rand, results);

    REQUIRE(results.size() == 2);
    CHECK(results[0].outcome == AO_HIT);
    CHECK(results[1].outcome == AO_NOT_FOUND);
    CHECK(results[1].targetId == "ghost");
    CHECK(getVigor(*state, "b") == 39);
    REQUIRE(state->getLog().size() == entries + 1);
    CHECK(state->getLog().getEntries().back().result
            == "a used Strike; a hit b for 11 damage; target ghost not found");
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: handlers") {
    Participant::ARRAY roster = duel();
    roster.push_back(makeHandler("ace", PK_ENEMY_HANDLER, "Wild"));
    BattleState::PTR state = start(roster);
    ACTION_RESULTS results;

    SUBCASE("cannot attack") {
        CHECK_THROWS_AS(engine.resolveAction(attack("ace", "a", strike()),
                rand, results), ValidationException);
    }

    SUBCASE("cannot be attacked") {
        const int draws = rand.getDrawCount();
        engine.resolveAction(attack("a", "ace", strike()), rand, results);
        REQUIRE(results.size() == 1);
        CHECK(results[0].outcome == AO_INVALID_TARGET);
        CHECK(results[0].message == "ace cannot be attacked directly");
        CHECK(rand.getDrawCount() == draws);
    }

    SUBCASE("may switch") {
        BattleAction action("ace", AK_SWITCH);
        engine.resolveAction(action, rand, results);
        REQUIRE(results.size() == 1);
        CHECK(results[0].outcome == AO_DEFERRED);
        CHECK(state->getParticipant("ace")->hasActed());
    }
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: other kinds are recorded only") {
    BattleState::PTR state = startDuel();
    const int draws = rand.getDrawCount();

    BattleAction action("a", AK_SWITCH);
    ACTION_RESULTS results;
    engine.resolveAction(action, rand, results);

    REQUIRE(results.size() == 1);
    CHECK(results[0].targetId == "a");
    CHECK(results[0].outcome == AO_DEFERRED);
    CHECK(results[0].isSuccess());
    CHECK(results[0].message == "a is switching out");
    CHECK(state->getParticipant("a")->hasActed());
    CHECK(state->getLog().getEntries().back().action == "Switch");
    CHECK(rand.getDrawCount() == draws);

    SUBCASE("item and escape") {
        engine.resolveAction(BattleAction("b", AK_ITEM), rand, results);
        CHECK(results[0].message == "b used an item");
        CHECK(state->getLog().getEntries().back().action == "Item");
        engine.resolveAction(BattleAction("b", AK_ESCAPE), rand, results);
        CHECK(results[0].message == "b is trying to escape");
        CHECK(state->getLog().getEntries().back().action == "Escape");
    }
}

TEST_CASE_FIXTURE(BattleHarness, "Actions: moves can be named") {
    BattleState::PTR state = startDuel();
    const int rolls[] = { 15, 4, 2, 5 };
    rand.push(rolls, 4);

    BattleAction action("a", AK_ATTACK);
    action.targetIds.push_back("b");
    action.moveName = "tackle";
    ACTION_RESULTS results;
    engine.resolveAction(action, rand, results);

    REQUIRE(results.size() == 1);
    CHECK(results[0].damage.damage == 11);
    const std::vector<std::string> &used =
            state->getParticipant("a")->getCreature()->getUsedMoves();
    REQUIRE(used.size() == 1);
    CHECK(used[0] == "Tackle");
    CHECK(state->getLog().getEntries().back().result
            == "a used Tackle; a hit b for 11 damage");
}

TEST_CASE("Actions: kind names") {
    CHECK(parseActionKind("escape") == AK_ESCAPE);
    CHECK(parseActionKind("ATTACK") == AK_ATTACK);
    CHECK(getActionKindName(AK_ITEM) == "Item");
    CHECK_THROWS_AS(parseActionKind("Dance"), ValidationException);
}
