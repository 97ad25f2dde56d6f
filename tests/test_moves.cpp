/*
 * File:   test_moves.cpp
 *
 * Created on October 19, 2026, 5:35 PM
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
#include "moves/CreatureMove.h"
#include "mechanics/CreatureType.h"
#include "battle/BattleException.h"

using namespace vigorbattle;

TEST_CASE("Moves: parsing a definition") {
    const MoveTemplate move = MoveTemplate::parse(" Flame Wheel , fire, 3 ,Physical");
    CHECK(move.getName() == "Flame Wheel");
    CHECK(move.getType() == &CreatureType::FIRE);
    CHECK(move.getDamageDice() == 3);
    CHECK(move.getMoveClass() == MC_PHYSICAL);
    CHECK_FALSE(move.isSpecial());

    CHECK(MoveTemplate::parse("Psybeam,Psychic,2,special").isSpecial());
}

TEST_CASE("Moves: bad definitions") {
    CHECK_THROWS_AS(MoveTemplate::parse("Tackle,Normal,2"),
            ValidationException);
    CHECK_THROWS_AS(MoveTemplate::parse("Tackle,Normal,2,physical,extra"),
            ValidationException);
    CHECK_THROWS_AS(MoveTemplate::parse("Tackle,Plastic,2,physical"),
            ValidationException);
    CHECK_THROWS_AS(MoveTemplate::parse("Tackle,Normal,two,physical"),
            ValidationException);
    CHECK_THROWS_AS(MoveTemplate::parse("Tackle,Normal,0,physical"),
            ValidationException);
    CHECK_THROWS_AS(MoveTemplate::parse("Tackle,Normal,2,status"),
            ValidationException);
    CHECK_THROWS_AS(MoveTemplate::parse(",Normal,2,physical"),
            ValidationException);
}

TEST_CASE("Moves: construction is validated") {
    CHECK_THROWS_AS(MoveTemplate("Splash", NULL, 1, MC_PHYSICAL),
            ValidationException);
    CHECK_THROWS_AS(MoveTemplate("Splash", &CreatureType::WATER, 0,
            MC_PHYSICAL), ValidationException);
    CHECK_THROWS_AS(MoveTemplate("", &CreatureType::WATER, 1, MC_PHYSICAL),
            ValidationException);
}

TEST_CASE("Moves: database lookup") {
    MoveDatabase moves;
    CHECK(moves.getMoveCount() == 0);
    CHECK_FALSE(moves.getMove("Tackle"));

    moves.addDefaultMoves();
    CHECK(moves.getMoveCount() == 8);

    const MoveTemplate *shock = moves.getMove("THUNDER shock");
    REQUIRE(shock);
    CHECK(shock->getName() == "Thunder Shock");
    CHECK(shock->getType() == &CreatureType::ELECTRIC);
    CHECK(shock->isSpecial());

    const MoveTemplate *rock = moves.getMove("rock throw");
    REQUIRE(rock);
    CHECK(rock->getDamageDice() == 3);

    SUBCASE("a move of the same name replaces the old one") {
        moves.addMove(MoveTemplate("TACKLE", &CreatureType::FIGHTING, 4,
                MC_PHYSICAL));
        CHECK(moves.getMoveCount() == 8);
        const MoveTemplate *tackle = moves.getMove("tackle");
        REQUIRE(tackle);
        CHECK(tackle->getName() == "TACKLE");
        CHECK(tackle->getDamageDice() == 4);
    }

    SUBCASE("new moves are added") {
        moves.addMove(MoveTemplate::parse("Gust,Flying,2,special"));
        CHECK(moves.getMoveCount() == 9);
        CHECK(moves.getMove("gust"));
    }
}
