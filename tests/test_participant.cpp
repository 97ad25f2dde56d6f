/*
 * File:   test_participant.cpp
 *
 * Created on October 19, 2026, 3:55 PM
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

TEST_CASE("Participant: payload must agree with kind") {
    TYPE_ARRAY types(1, &CreatureType::GRASS);
    const CreatureCombatant creature("Oddish", types, StatBlock(), 30);
    const HandlerCombatant handler("Erika", StatBlock());

    CHECK_THROWS_AS(Participant("x", "x", PK_PLAYER_HANDLER, "Player",
            creature), ValidationException);
    CHECK_THROWS_AS(Participant("x", "x", PK_ENEMY_CREATURE, "Gym",
            handler), ValidationException);
    CHECK_THROWS_AS(Participant("", "x", PK_ENEMY_CREATURE, "Gym",
            creature), ValidationException);

    const Participant ok("oddish", "Oddish", PK_ENEMY_CREATURE, "Gym",
            creature);
    CHECK(ok.isCreature());
    CHECK(ok.getCreature());
    CHECK_FALSE(ok.getHandler());
    CHECK_FALSE(ok.isDefeated());
    CHECK_FALSE(ok.hasActed());
}

TEST_CASE("Participant: creature construction is validated") {
    TYPE_ARRAY none;
    TYPE_ARRAY one(1, &CreatureType::FIRE);
    TYPE_ARRAY three(3, &CreatureType::FIRE);

    CHECK_THROWS_AS(CreatureCombatant("A", one, StatBlock(), 0),
            ValidationException);
    CHECK_THROWS_AS(CreatureCombatant("A", none, StatBlock(), 10),
            ValidationException);
    CHECK_THROWS_AS(CreatureCombatant("A", three, StatBlock(), 10),
            ValidationException);

    const CreatureCombatant c("A", one, StatBlock(), 10);
    CHECK(c.getVigor() == 10);
    CHECK(c.getMaxVigor() == 10);
}

TEST_CASE("Participant: vigor is clamped and defeat is permanent") {
    Participant::PTR p = makeCreature("p", PK_PLAYER_CREATURE, "Player",
            CreatureType::NORMAL, StatBlock(), 40);
    const CreatureCombatant &c = *p->getCreature();

    CHECK_FALSE(p->setVigor(100));
    CHECK(c.getVigor() == 40);

    CHECK_FALSE(p->setVigor(12));
    CHECK(c.getVigor() == 12);

    SUBCASE("reaching zero defeats once") {
        CHECK(p->setVigor(-7));
        CHECK(c.getVigor() == 0);
        CHECK(p->isDefeated());
        CHECK_FALSE(p->setVigor(0));

        // Healing does not undo the defeat.
        CHECK_FALSE(p->setVigor(25));
        CHECK(c.getVigor() == 25);
        CHECK(p->isDefeated());
    }

    SUBCASE("handlers have no vigor") {
        Participant::PTR h = makeHandler("h", PK_PLAYER_HANDLER, "Player");
        CHECK_THROWS_AS(h->setVigor(5), ValidationException);
        CHECK_FALSE(h->isDefeated());
    }
}

TEST_CASE("Participant: status effects are unique by name") {
    Participant::PTR p = makeCreature("p", PK_PLAYER_CREATURE, "Player",
            CreatureType::NORMAL, StatBlock());
    const CreatureCombatant &c = *p->getCreature();

    CHECK_FALSE(p->applyStatus(StatusEffect("Burn", SC_AILMENT,
            boost::optional<int>(3), 1)));
    CHECK(p->applyStatus(StatusEffect("burn", SC_AILMENT,
            boost::optional<int>(5), 2)));
    REQUIRE(c.getStatuses().size() == 1);
    CHECK(*c.getStatus("BURN")->getDuration() == 5);
    CHECK(c.getStatus("Burn")->getSeverity() == 2);

    CHECK_FALSE(p->applyStatus(StatusEffect("Focus", SC_BENEFICIAL)));
    CHECK(c.getStatus("Focus")->isIndefinite());
    CHECK(c.getStatuses().size() == 2);

    CHECK(p->removeStatus("BURN"));
    CHECK_FALSE(p->removeStatus("Burn"));
    CHECK_FALSE(c.getStatus("Burn"));
    CHECK(c.getStatuses().size() == 1);
}

TEST_CASE("Participant: status effect construction is validated") {
    CHECK_THROWS_AS(StatusEffect(""), ValidationException);
    CHECK_THROWS_AS(StatusEffect("Sleep", SC_AILMENT,
            boost::optional<int>(0)), ValidationException);
}

TEST_CASE("Participant: handler statuses are its conditions") {
    Participant::PTR h = makeHandler("h", PK_ENEMY_HANDLER, "Rival");
    const HandlerCombatant &handler = *h->getHandler();

    CHECK_FALSE(h->applyStatus(StatusEffect("Inspired", SC_BENEFICIAL)));
    REQUIRE(handler.getConditions().size() == 1);
    CHECK(handler.getCondition("inspired"));
    CHECK(h->removeStatus("Inspired"));
    CHECK(handler.getConditions().empty());
}

TEST_CASE("Participant: effective stat levels") {
    StatBlock stats(6, 1, 0, 0, -2, 0);
    CHECK(stats.getLevel(S_POWER) == 6);

    TYPE_ARRAY types(1, &CreatureType::ROCK);
    CreatureCombatant c("Onix", types, stats, 30);
    c.setModifier(S_POWER, 3);
    c.setModifier(S_DEFENSE, -1);
    c.setModifier(S_SPEED, 2);
    CHECK(c.getStatLevel(S_POWER) == MAX_STAT_LEVEL);
    CHECK(c.getStatLevel(S_DEFENSE) == MIN_STAT_LEVEL);
    CHECK(c.getStatLevel(S_SPEED) == 3);
    c.clearModifiers();
    CHECK(c.getStatLevel(S_SPEED) == 1);

    SUBCASE("stat blocks clamp") {
        StatBlock wild(12, -9, 0, 0, 0, 0);
        CHECK(wild.getLevel(S_POWER) == SL_LEGENDARY);
        CHECK(wild.getLevel(S_SPEED) == SL_HOPELESS);
    }

    SUBCASE("handlers read their own stats") {
        Participant::PTR h = makeHandler("h", PK_PLAYER_HANDLER, "Player",
                StatBlock(0, 4, 0, 2, 0, 0));
        CHECK(h->getStatLevel(S_SPEED) == 4);
        CHECK(h->getStatLevel(S_CHARM) == 2);
    }
}

TEST_CASE("Participant: names of stats and kinds") {
    CHECK(getStatByName("mind") == S_MIND);
    CHECK(getStatByName("Agility") == S_SPEED);
    CHECK(getStatByName("Luck") == S_NONE);
    CHECK(getStatName(S_SPIRIT) == "Spirit");

    CHECK(parseParticipantKind("EnemyHandler") == PK_ENEMY_HANDLER);
    CHECK(parseParticipantKind("player-creature") == PK_PLAYER_CREATURE);
    CHECK(parseParticipantKind("enemy creature") == PK_ENEMY_CREATURE);
    CHECK_THROWS_AS(parseParticipantKind("Boss"), ValidationException);
}

TEST_CASE("Participant: relationships") {
    Participant::PTR p = makeCreature("p", PK_PLAYER_CREATURE, "Player",
            CreatureType::NORMAL, StatBlock());
    CHECK(p->getRelationship("q") == R_NEUTRAL);
    CHECK_FALSE(p->hasRelationship("q"));

    p->setRelationship("Q", R_HOSTILE);
    CHECK(p->hasRelationship("q"));
    CHECK(p->getRelationship("q") == R_HOSTILE);

    p->clearRelationship("q");
    CHECK(p->getRelationships().empty());
}

TEST_CASE("Participant: used moves are remembered once") {
    TYPE_ARRAY types(1, &CreatureType::WATER);
    CreatureCombatant c("Psyduck", types, StatBlock(), 30);
    c.recordMove("Water Gun");
    c.recordMove("Confusion");
    c.recordMove("water gun");
    REQUIRE(c.getUsedMoves().size() == 2);
    CHECK(c.getUsedMoves()[0] == "Water Gun");
}
