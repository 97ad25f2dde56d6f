/*
 * File:   RandomSource.h
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

#ifndef _RANDOM_SOURCE_H_
#define _RANDOM_SOURCE_H_

namespace vigorbattle {

/**
 * A source of random integers. Every operation that rolls dice takes one of
 * these as a parameter so that a battle can be replayed from its seed.
 */
class RandomSource {
public:
    /**
     * Get a uniformly distributed integer in [lower, upper].
     */
    virtual int getRandomInt(const int lower, const int upper) = 0;
    virtual ~RandomSource() { }
protected:
    RandomSource() { }
private:
    RandomSource(const RandomSource &);
    RandomSource &operator=(const RandomSource &);
};

class MersenneSourceImpl;

/**
 * RandomSource backed by a seeded Mersenne twister.
 */
class MersenneSource : public RandomSource {
public:
    explicit MersenneSource(const unsigned int seed);
    ~MersenneSource();
    int getRandomInt(const int lower, const int upper);
private:
    MersenneSourceImpl *m_impl;
};

}

#endif
