/*
 * File:   ActionResolver.cpp
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

#include <sstream>
#include <boost/algorithm/string.hpp>
#include "ActionResolver.h"
#include "BattleState.h"
#include "BattleException.h"
#include "../mechanics/CreatureType.h"

using namespace std;

namespace vigorbattle {

namespace {

const char *ACTION_NAMES[] = { "Attack", "Switch", "Item", "Escape" };

const int ACTION_KIND_COUNT = 4;

string deferredMessage(const Participant &actor, const ACTION_KIND kind) {
    const string name = actor.getName();
    switch (kind) {
        case AK_SWITCH:
            return name + " is switching out";
        case AK_ITEM:
            return name + " used an item";
        case AK_ESCAPE:
            return name + " is trying to escape";
        default:
            return name + " acted";
    }
}

} // anonymous namespace

string getActionKindName(const ACTION_KIND kind) {
    return ACTION_NAMES[kind];
}

ACTION_KIND parseActionKind(const string &text) {
    for (int i = 0; i < ACTION_KIND_COUNT; ++i) {
        if (boost::algorithm::iequals(text, ACTION_NAMES[i]))
            return static_cast<ACTION_KIND>(i);
    }
    throw ValidationException("unknown action kind: " + text);
}

MoveTemplate ActionResolver::getMove(const BattleAction &action) const {
    if (action.move) {
        return *action.move;
    }
    if (action.moveName.empty()) {
        throw ValidationException("attack by " + action.actorId
                + " names no move");
    }
    const MoveTemplate *move = m_moves ? m_moves->getMove(action.moveName)
            : NULL;
    if (!move) {
        throw ValidationException("unknown move: " + action.moveName);
    }
    return *move;
}

void ActionResolver::resolve(BattleState &state, const BattleAction &action,
        RandomSource &rand, ACTION_RESULTS &results) const {
    results.clear();

    if ((action.kind < 0) || (action.kind >= ACTION_KIND_COUNT)) {
        throw ValidationException("unknown action kind");
    }
    Participant *actor = state.getParticipant(action.actorId);
    if (!actor) {
        throw NotFoundException("participant " + action.actorId
                + " not found");
    }
    if (actor->isDefeated()) {
        throw StateConflictException(actor->getName()
                + " is defeated and cannot act");
    }

    if (action.kind != AK_ATTACK) {
        actor->setActed(true);
        ActionResult result(actor->getId(), AO_DEFERRED);
        result.message = deferredMessage(*actor, action.kind);
        results.push_back(result);
        state.log(actor->getId(), getActionKindName(action.kind),
                result.message, action.targetIds);
        return;
    }

    CreatureCombatant *creature = actor->getCreature();
    if (!creature) {
        throw ValidationException(actor->getName()
                + " is a handler and cannot attack");
    }
    if (action.targetIds.empty()) {
        throw ValidationException("attack by " + actor->getName()
                + " has no targets");
    }
    const MoveTemplate move = getMove(action);

    actor->setActed(true);
    creature->recordMove(move.getName());

    stringstream text;
    text << actor->getName() << " used " << move.getName();
    vector<string>::const_iterator i = action.targetIds.begin();
    for (; i != action.targetIds.end(); ++i) {
        const ActionResult result = attack(state, *actor, move, *i, rand);
        text << "; " << result.message;
        results.push_back(result);
    }
    state.log(actor->getId(), getActionKindName(AK_ATTACK), text.str(),
            action.targetIds);
}

/**
 * Resolve an attack against a single target.
 */
ActionResult ActionResolver::attack(BattleState &state, Participant &user,
        const MoveTemplate &move, const string &targetId,
        RandomSource &rand) const {
    Participant *target = state.getParticipant(targetId);
    if (!target) {
        ActionResult result(targetId, AO_NOT_FOUND);
        result.message = "target " + targetId + " not found";
        return result;
    }
    const CreatureCombatant *creature = target->getCreature();
    if (!creature) {
        ActionResult result(target->getId(), AO_INVALID_TARGET);
        result.message = target->getName() + " cannot be attacked directly";
        return result;
    }

    const HitRoll hit = m_mech.attemptHit(user, *target, move, rand);
    if (!hit.hit) {
        ActionResult result(target->getId(), AO_MISS);
        result.hit = hit;
        result.remainingVigor = creature->getVigor();
        result.message = user.getName() + " missed " + target->getName();
        return result;
    }

    ActionResult result(target->getId(), AO_HIT);
    result.hit = hit;
    result.damage = m_mech.calculateDamage(user, *target, move, hit, rand);
    result.defeated = target->setVigor(
            creature->getVigor() - result.damage.damage);
    result.remainingVigor = creature->getVigor();

    stringstream text;
    text << user.getName() << " hit " << target->getName() << " for "
            << result.damage.damage << " damage";
    if (hit.critical) {
        text << " (critical hit)";
    }
    const double effectiveness = result.damage.effectiveness;
    if (effectiveness != 1.0) {
        text << " (" << describeEffectiveness(effectiveness) << ")";
    }
    if (result.defeated) {
        text << "; " << target->getName() << " was defeated";
    }
    result.message = text.str();
    return result;
}

}
