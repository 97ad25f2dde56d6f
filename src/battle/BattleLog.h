/*
 * File:   BattleLog.h
 *
 * Created on October 19, 2026, 11:52 AM
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

#ifndef _BATTLE_LOG_H_
#define _BATTLE_LOG_H_

#include <string>
#include <vector>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include "phase.h"

namespace vigorbattle {

struct BattleLogEntry {
    int turn;
    BATTLE_PHASE phase;
    std::string actorId;        // empty for system events
    std::string action;
    std::vector<std::string> targets;
    std::string result;
    boost::posix_time::ptime timestamp;

    BattleLogEntry(): turn(0), phase(BP_INITIALIZE) { }
    BattleLogEntry(const int t, const BATTLE_PHASE p, const std::string &actor,
            const std::string &act, const std::string &res):
            turn(t),
            phase(p),
            actorId(actor),
            action(act),
            result(res) { }
};

typedef std::vector<BattleLogEntry> LOG_ENTRIES;

/**
 * Append-only record of everything that happened in a battle.
 */
class BattleLog {
public:
    /**
     * Append an entry. If the entry has no timestamp, the current UTC time
     * is used.
     */
    void append(const BattleLogEntry &entry);

    const LOG_ENTRIES &getEntries() const {
        return m_entries;
    }

    int size() const {
        return m_entries.size();
    }

    /**
     * Copy entries into out, oldest first. An empty actor matches every
     * entry; otherwise only entries by that actor (ignoring case) are kept.
     * If count is positive only the last count matching entries are kept.
     */
    void getEntries(LOG_ENTRIES &out, const int count,
            const std::string &actor) const;

private:
    LOG_ENTRIES m_entries;
};

}

#endif
