/*
 * File:   BattleException.h
 *
 * Created on October 19, 2026, 10:12 AM
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

#ifndef _BATTLE_EXCEPTION_H_
#define _BATTLE_EXCEPTION_H_

#include <string>

namespace vigorbattle {

/**
 * Base class of every error raised by the engine. An operation that throws
 * one of these has not modified the battle.
 */
class BattleException {
public:
    explicit BattleException(const std::string &message):
            m_message(message) { }
    virtual ~BattleException() { }
    const std::string &getMessage() const {
        return m_message;
    }
private:
    std::string m_message;
};

/**
 * Malformed or missing input.
 */
class ValidationException : public BattleException {
public:
    explicit ValidationException(const std::string &message):
            BattleException(message) { }
};

/**
 * Unknown participant, target or effect.
 */
class NotFoundException : public BattleException {
public:
    explicit NotFoundException(const std::string &message):
            BattleException(message) { }
};

/**
 * The operation is not permitted in the current battle state, e.g. starting
 * a battle while one is active.
 */
class StateConflictException : public BattleException {
public:
    explicit StateConflictException(const std::string &message):
            BattleException(message) { }
};

}

#endif
