/*
 * File:   ActionResolver.h
 *
 * Created on October 19, 2026, 1:10 PM
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

#ifndef _ACTION_RESOLVER_H_
#define _ACTION_RESOLVER_H_

#include <string>
#include <vector>
#include <boost/optional.hpp>
#include "../mechanics/BattleMechanics.h"
#include "../moves/CreatureMove.h"

namespace vigorbattle {

class BattleState;
class Participant;
class RandomSource;

enum ACTION_KIND {
    AK_ATTACK = 0,
    AK_SWITCH,
    AK_ITEM,
    AK_ESCAPE
};

std::string getActionKindName(const ACTION_KIND);

/**
 * Parse an action kind, ignoring case. Throws ValidationException.
 */
ACTION_KIND parseActionKind(const std::string &);

struct BattleAction {
    std::string actorId;
    ACTION_KIND kind;
    std::vector<std::string> targetIds;
    std::string moveName;               // looked up if move is not set
    boost::optional<MoveTemplate> move;

    BattleAction(const std::string &actor, const ACTION_KIND k):
            actorId(actor), kind(k) { }
};

enum ACTION_OUTCOME {
    AO_HIT = 0,
    AO_MISS,
    AO_NOT_FOUND,           // no such target
    AO_INVALID_TARGET,      // the target has no vigor to lose
    AO_DEFERRED             // switch, item and escape
};

/**
 * What happened to one target of an action.
 */
struct ActionResult {
    std::string targetId;
    ACTION_OUTCOME outcome;
    HitRoll hit;
    DamageRoll damage;
    int remainingVigor;
    bool defeated;          // this action defeated the target
    std::string message;

    ActionResult(const std::string &target, const ACTION_OUTCOME o):
            targetId(target), outcome(o), remainingVigor(0), defeated(false) { }

    bool isSuccess() const {
        return ((outcome == AO_HIT) || (outcome == AO_DEFERRED));
    }
};

typedef std::vector<ActionResult> ACTION_RESULTS;

/**
 * Executes one submitted action against a battle. Input is validated before
 * anything changes; once validated, every target is resolved in submission
 * order and exactly one log entry is appended for the whole action.
 */
class ActionResolver {
public:
    /**
     * The move database, if any, supplies moves that an action names but
     * does not carry. It is not owned.
     */
    ActionResolver(const BattleMechanics &mech,
            const MoveDatabase *moves = NULL):
            m_mech(mech), m_moves(moves) { }

    void resolve(BattleState &state, const BattleAction &action,
            RandomSource &rand, ACTION_RESULTS &results) const;

private:
    const BattleMechanics &m_mech;
    const MoveDatabase *m_moves;

    MoveTemplate getMove(const BattleAction &) const;
    ActionResult attack(BattleState &, Participant &, const MoveTemplate &,
            const std::string &, RandomSource &) const;
};

}

#endif
