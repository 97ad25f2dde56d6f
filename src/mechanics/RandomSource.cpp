/*
 * File:   RandomSource.cpp
 *
 * Created on October 19, 2026, 10:40 AM
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

#include <boost/random.hpp>
#include <boost/lexical_cast.hpp>

#include "RandomSource.h"
#include "../battle/BattleException.h"

using namespace std;
using namespace boost;

namespace vigorbattle {

typedef mt11213b GENERATOR;

struct MersenneSourceImpl {
    GENERATOR rand;
};

MersenneSource::MersenneSource(const unsigned int seed) {
    m_impl = new MersenneSourceImpl();
    m_impl->rand = GENERATOR(seed);
}

MersenneSource::~MersenneSource() {
    delete m_impl;
}

int MersenneSource::getRandomInt(const int lower, const int upper) {
    if (lower > upper) {
        throw ValidationException("empty random range ["
                + lexical_cast<string>(lower) + ", "
                + lexical_cast<string>(upper) + "]");
    }
    uniform_int<> range(lower, upper);
    variate_generator<GENERATOR &, uniform_int<> > r(m_impl->rand, range);
    return r();
}

}
