/*
 * File:   main.cpp
 * Author: Catherine
 *
 * Created on August 28, 2010, 2:48 PM
 *
 * This file is a part of Vigor Battle.
 * Copyright (C) 2009  Catherine Fitzpatrick and Benjamin Gwin
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

#include <cstdlib>
#include <ctime>
#include <fstream>
#include <map>
#include <vector>
#include <boost/program_options.hpp>
#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include "../battle/BattleEngine.h"
#include "../battle/BattleException.h"
#include "../battle/StateStore.h"
#include "../mechanics/DiceMechanics.h"
#include "../mechanics/RandomSource.h"
#include "../moves/CreatureMove.h"
#include "Log.h"

using namespace std;
using namespace vigorbattle;
namespace po = boost::program_options;

namespace {

typedef map<string, string> MOVE_CHOICES;

const char *DEFAULT_ROSTER[] = {
    "sparky,Sparky,PlayerCreature,Player,Electric,40,1/3/2/0/1/1,Thunder Shock",
    "pidgey,Pidgey,EnemyCreature,Wild,Normal/Flying,35,1/2/0/0/1/0,Tackle"
};

template <class T>
T parseNumber(const string &text, const string &what) {
    try {
        return boost::lexical_cast<T>(boost::algorithm::trim_copy(text));
    } catch (boost::bad_lexical_cast &) {
        throw ValidationException("bad " + what + ": " + text);
    }
}

/**
 * Parse "power/speed/mind/charm/defense/spirit".
 */
StatBlock parseStats(const string &text) {
    vector<string> parts;
    boost::algorithm::split(parts, text, boost::algorithm::is_any_of("/"));
    if (parts.size() != STAT_COUNT) {
        throw ValidationException("expected six stat levels: " + text);
    }
    StatBlock stats;
    for (int i = 0; i < STAT_COUNT; ++i) {
        const STAT stat = static_cast<STAT>(i);
        stats.setLevel(stat, parseNumber<int>(parts[i], getStatName(stat)));
    }
    return stats;
}

TYPE_ARRAY parseTypes(const string &text) {
    vector<string> parts;
    boost::algorithm::split(parts, text, boost::algorithm::is_any_of("/"));
    TYPE_ARRAY types;
    for (vector<string>::const_iterator i = parts.begin();
            i != parts.end(); ++i) {
        const CreatureType *type =
                CreatureType::getByName(boost::algorithm::trim_copy(*i));
        if (!type) {
            throw ValidationException("unknown type: " + *i);
        }
        types.push_back(type);
    }
    return types;
}

/**
 * Parse "id,name,kind,faction,types,vigor,levels,move". Handlers leave
 * types, vigor and move empty.
 */
Participant::PTR parseParticipant(const string &definition,
        MOVE_CHOICES &moves) {
    vector<string> parts;
    boost::algorithm::split(parts, definition,
            boost::algorithm::is_any_of(","));
    if (parts.size() != 8) {
        throw ValidationException("bad participant definition: "
                + definition);
    }
    for (vector<string>::iterator i = parts.begin(); i != parts.end(); ++i) {
        boost::algorithm::trim(*i);
    }
    const PARTICIPANT_KIND kind = parseParticipantKind(parts[2]);
    const StatBlock stats = parseStats(parts[6]);
    if (!isCreatureKind(kind)) {
        return Participant::PTR(new Participant(parts[0], parts[1], kind,
                parts[3], HandlerCombatant(parts[1], stats)));
    }
    const CreatureCombatant creature(parts[1], parseTypes(parts[4]), stats,
            parseNumber<int>(parts[5], "vigor"));
    if (!parts[7].empty()) {
        moves[parts[0]] = parts[7];
    }
    return Participant::PTR(new Participant(parts[0], parts[1], kind,
            parts[3], creature));
}

/**
 * Give every handler the creatures of its own faction as its team.
 */
void assignTeams(const Participant::ARRAY &participants) {
    for (Participant::ARRAY::const_iterator i = participants.begin();
            i != participants.end(); ++i) {
        HandlerCombatant *handler = (*i)->getHandler();
        if (!handler)
            continue;
        vector<string> team;
        for (Participant::ARRAY::const_iterator j = participants.begin();
                j != participants.end(); ++j) {
            if ((*j)->isCreature()
                    && ((*j)->getFaction() == (*i)->getFaction())) {
                team.push_back((*j)->getId());
            }
        }
        handler->setRemainingTeam(team);
    }
}

/**
 * The first standing creature that p is hostile towards, in turn order.
 */
string chooseTarget(const BattleState &state, const Participant &p) {
    const vector<string> &order = state.getTurnOrder();
    for (vector<string>::const_iterator i = order.begin();
            i != order.end(); ++i) {
        const Participant *other = state.getParticipant(*i);
        if (other && other->isCreature() && !other->isDefeated()
                && (p.getRelationship(other->getId()) == R_HOSTILE)) {
            return other->getId();
        }
    }
    return string();
}

/**
 * Fight turns until a victory condition is met or the turn limit passes.
 */
void runSkirmish(BattleEngine &engine, const MOVE_CHOICES &moves,
        const int maxTurns, RandomSource &rand) {
    for (int turn = 0; turn < maxTurns; ++turn) {
        engine.advancePhase();      // select actions
        engine.advancePhase();      // resolve actions

        BattleState::PTR state = engine.getState();
        const vector<string> order = state->getTurnOrder();
        for (vector<string>::const_iterator i = order.begin();
                i != order.end(); ++i) {
            const Participant *p = state->getParticipant(*i);
            if (!p || !p->isCreature() || p->isDefeated())
                continue;
            const string target = chooseTarget(*state, *p);
            if (target.empty())
                continue;
            BattleAction action(p->getId(), AK_ATTACK);
            action.targetIds.push_back(target);
            MOVE_CHOICES::const_iterator move = moves.find(p->getId());
            action.moveName = (move != moves.end()) ? move->second : "Tackle";
            ACTION_RESULTS results;
            engine.resolveAction(action, rand, results);
        }

        engine.advancePhase();      // apply effects
        engine.advancePhase();      // check victory
        const VictoryOutcome outcome = engine.evaluateVictory();
        if (outcome.met) {
            engine.endBattle(outcome.reason);
            return;
        }
        engine.advancePhase();      // end turn
    }
    engine.endBattle("Turn limit reached");
}

int initialise(int argc, char **argv) {
    string configFile;
    unsigned int seed;
    int maxTurns, weatherTurns;
    string kind, field, weather, logDirectory;
    vector<string> participantDefinitions, moveDefinitions;

    po::options_description generic("Options");
    generic.add_options()
            ("help", "show this help message")
            ("battle.seed",
                po::value<unsigned int>(&seed),
                "random seed (default: the current time)")
            ("battle.kind",
                po::value<string>(&kind)->default_value("Wild"),
                "Wild, Trainer, Gym, Elite, Champion or Legendary")
            ("battle.field",
                po::value<string>(&field)->default_value("Route 1"),
                "battlefield name")
            ("battle.weather",
                po::value<string>(&weather)->default_value("Clear"),
                "weather name")
            ("battle.weather-turns",
                po::value<int>(&weatherTurns),
                "how long the weather lasts (default: all battle)")
            ("battle.turns",
                po::value<int>(&maxTurns)->default_value(20),
                "give up after this many turns")
            ("battle.log",
                "also write the battle to log files")
            ("battle.log-dir",
                po::value<string>(&logDirectory)->default_value("battle"),
                "directory under logs/ for log files")
            ("battle.quiet",
                "do not narrate the battle")
            ("battle.participant",
                po::value<vector<string> >(
                    &participantDefinitions)->composing(),
                "id,name,kind,faction,types,vigor,levels,move")
            ("battle.move",
                po::value<vector<string> >(&moveDefinitions)->composing(),
                "name,type,dice,physical|special")
    ;

    po::options_description hidden("Hidden options");
    hidden.add_options()
            ("config-file", po::value<string>(&configFile)->default_value(
                    "battle.cfg"))
    ;

    po::options_description desc;
    desc.add(generic).add(hidden);

    po::positional_options_description p;
    p.add("config-file", 1);

    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).
                options(desc).positional(p).run(), vm);
    } catch (po::error &e) {
        Log::out() << "Error reading command line: " << e.what() << endl;
        return EXIT_FAILURE;
    }
    po::notify(vm);

    if (vm.count("help")) {
        Log::out() << "Usage: vigorbattle [options] [config-file = battle.cfg]"
             << endl
             << "   Reads options from the command line first and then from"
                " the config file,\n   which may be omitted if it is the"
                " default." << endl
             << generic << endl;
        return EXIT_SUCCESS;
    }

    ifstream file(configFile.c_str());
    if (file.is_open()) {
        try {
            po::store(po::parse_config_file(file, desc), vm);
        } catch (po::error &e) {
            Log::out() << "Error reading config file: " << e.what() << endl;
            return EXIT_FAILURE;
        }
        po::notify(vm);
    } else if (!vm["config-file"].defaulted()) {
        Log::out() << "Error: Config file " << configFile << " not found."
             << endl;
        return EXIT_FAILURE;
    }

    if (vm.count("battle.log")) {
        Log::out.setDirectory(logDirectory);
        Log::out.setMode(Log::MODE_BOTH);
    }
    if (!vm.count("battle.seed")) {
        seed = static_cast<unsigned int>(time(NULL));
    }
    Log::out() << "Using random seed " << seed << "." << endl;

    MoveDatabase database;
    database.addDefaultMoves();
    for (vector<string>::const_iterator i = moveDefinitions.begin();
            i != moveDefinitions.end(); ++i) {
        database.addMove(MoveTemplate::parse(*i));
    }

    if (participantDefinitions.empty()) {
        participantDefinitions.assign(DEFAULT_ROSTER, DEFAULT_ROSTER
                + sizeof(DEFAULT_ROSTER) / sizeof(DEFAULT_ROSTER[0]));
    }
    MOVE_CHOICES moves;
    Participant::ARRAY participants;
    for (vector<string>::const_iterator i = participantDefinitions.begin();
            i != participantDefinitions.end(); ++i) {
        participants.push_back(parseParticipant(*i, moves));
    }
    assignTeams(participants);

    boost::optional<int> duration;
    if (vm.count("battle.weather-turns")) {
        duration = weatherTurns;
    }

    MemoryStateStore store;
    DiceMechanics mechanics;
    MersenneSource rand(seed);
    BattleEngine engine(store, mechanics, &database);
    engine.setNarrationEnabled(!vm.count("battle.quiet"));

    engine.startBattle(kind, participants, field, Weather(weather, duration),
            rand);
    runSkirmish(engine, moves, maxTurns, rand);
    return EXIT_SUCCESS;
}

}

int main(int argc, char **argv) {
    try {
        return initialise(argc, argv);
    } catch (BattleException &e) {
        Log::out() << "Error: " << e.getMessage() << endl;
        return EXIT_FAILURE;
    }
}
