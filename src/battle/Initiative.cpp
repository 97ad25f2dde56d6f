/*
 * File:   Initiative.cpp
 *
 * Created on October 19, 2026, 12:45 PM
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

#include <algorithm>
#include <boost/bind.hpp>
#include "Initiative.h"
#include "BattleState.h"
#include "../mechanics/BattleMechanics.h"

using namespace std;

namespace vigorbattle {

namespace {

bool initiativeComparator(const Participant::PTR &p1,
        const Participant::PTR &p2) {
    return (p1->getInitiative() > p2->getInitiative());
}

} // anonymous namespace

void calculateTurnOrder(BattleState &state, const BattleMechanics &mech,
        RandomSource &rand) {
    Participant::ARRAY order = state.getParticipants();
    for (Participant::ARRAY::iterator i = order.begin();
            i != order.end(); ++i) {
        (*i)->setInitiative(mech.calculateInitiative(**i, rand));
    }
    stable_sort(order.begin(), order.end(), initiativeComparator);

    vector<string> ids(order.size());
    transform(order.begin(), order.end(), ids.begin(),
            boost::bind(&Participant::getId, _1));
    state.setTurnOrder(ids);
    state.setCurrentActor(ids.empty() ? string() : ids.front());
}

}
