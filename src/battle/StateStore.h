/*
 * File:   StateStore.h
 *
 * Created on October 19, 2026, 2:15 PM
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

#ifndef _STATE_STORE_H_
#define _STATE_STORE_H_

#include <boost/noncopyable.hpp>
#include "BattleState.h"

namespace vigorbattle {

/**
 * Where the engine keeps the current battle between operations. The engine
 * saves after every operation that changes the battle; a store that cannot
 * save should throw.
 */
class StateStore : boost::noncopyable {
public:
    /**
     * Get the current battle, or a null pointer if there is none.
     */
    virtual BattleState::PTR load() = 0;
    virtual void save(BattleState::PTR state) = 0;
    virtual bool hasActiveBattle() = 0;
    virtual void clear() = 0;
    virtual ~StateStore() { }
};

/**
 * Keeps the battle in memory for the life of the process.
 */
class MemoryStateStore : public StateStore {
public:
    MemoryStateStore(): m_saves(0) { }
    BattleState::PTR load() {
        return m_state;
    }
    void save(BattleState::PTR state) {
        m_state = state;
        ++m_saves;
    }
    bool hasActiveBattle() {
        return (m_state && m_state->isActive());
    }
    void clear() {
        m_state.reset();
    }
    int getSaveCount() const {
        return m_saves;
    }
private:
    BattleState::PTR m_state;
    int m_saves;
};

}

#endif
