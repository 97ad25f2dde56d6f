/*
 * File:   BattleLog.cpp
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

#include <boost/algorithm/string/predicate.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "BattleLog.h"

using namespace std;
namespace pt = boost::posix_time;

namespace vigorbattle {

void BattleLog::append(const BattleLogEntry &entry) {
    m_entries.push_back(entry);
    if (entry.timestamp.is_not_a_date_time()) {
        m_entries.back().timestamp = pt::microsec_clock::universal_time();
    }
}

void BattleLog::getEntries(LOG_ENTRIES &out, const int count,
        const string &actor) const {
    out.clear();
    LOG_ENTRIES::const_iterator i = m_entries.begin();
    for (; i != m_entries.end(); ++i) {
        if (actor.empty() || boost::algorithm::iequals(i->actorId, actor)) {
            out.push_back(*i);
        }
    }
    if ((count > 0) && (out.size() > static_cast<size_t>(count))) {
        out.erase(out.begin(), out.end() - count);
    }
}

}
