/*
 * File:   Log.cpp
 * Author: Catherine
 *
 * Created on August 29, 2010, 12:02 PM
 *
 * This file is a part of Vigor Battle.
 * Copyright (C) 2010  Catherine Fitzpatrick and Benjamin Gwin
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

#include <string>
#include <fstream>
#include <iostream>
#include <boost/filesystem.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/mutex.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include "Log.h"

using namespace std;
namespace gc = boost::gregorian; // (gc for gregorian calendar)
namespace pt = boost::posix_time;

namespace vigorbattle {

Log Log::out("battle", MODE_CONSOLE);

struct Log::LogImpl {
    LOG_MODE mode;
    string directory;
    boost::mutex mutex;     // guards the file
    gc::date day;           // day the open file belongs to
    ofstream file;

    string getFileName(const gc::date &d) const {
        return directory + gc::to_iso_extended_string(d);
    }

    void closeFile() {
        boost::lock_guard<boost::mutex> lock(mutex);
        if (file.is_open()) {
            file.close();
        }
    }

    /**
     * Append text to the file for today, starting a new file when the date
     * changes.
     */
    void writeFile(const string &text) {
        boost::lock_guard<boost::mutex> lock(mutex);
        const pt::ptime now = pt::second_clock::local_time();
        if (!file.is_open() || (now.date() != day)) {
            if (file.is_open()) {
                file.close();
            }
            day = now.date();
            const string name = getFileName(day);
            file.clear();
            file.open(name.c_str(), ios_base::app);
            if (!file.is_open()) {
                cerr << "Cannot open log file " << name << endl;
                return;
            }
        }
        file << "(" << pt::to_simple_string(now.time_of_day()) << ") "
                << text << flush;
    }
};

Log::Log(const string &directory, const LOG_MODE mode): m_impl(new LogImpl()) {
    m_impl->mode = MODE_NONE;
    setDirectory(directory);
    setMode(mode);
}

void Log::setMode(const LOG_MODE mode) {
    if (mode & MODE_FILE) {
        boost::filesystem::create_directories(m_impl->directory);
    }
    m_impl->mode = mode;
}

Log::LOG_MODE Log::getMode() const {
    return m_impl->mode;
}

void Log::setDirectory(const string &directory) {
    m_impl->closeFile();
    m_impl->directory = "logs/" + directory + "/";
    if (m_impl->mode & MODE_FILE) {
        boost::filesystem::create_directories(m_impl->directory);
    }
}

string Log::getDirectory() const {
    return m_impl->directory;
}

string Log::getFileName() const {
    return m_impl->getFileName(gc::day_clock::local_day());
}

Log::tempstream Log::operator()() {
    return tempstream(*this);
}

/**
 * Sends each flushed message wherever the mode says.
 */
class Log::logbuf : public stringbuf {
public:
    explicit logbuf(Log &log): m_log(log) { }
protected:
    int sync() {
        const string text = str();
        str(string());
        if (text.empty())
            return 0;
        const LOG_MODE mode = m_log.m_impl->mode;
        if (mode & MODE_CONSOLE) {
            cout << text << flush;
        }
        if (mode & MODE_FILE) {
            m_log.m_impl->writeFile(text);
        }
        return 0;
    }
private:
    Log &m_log;
};

Log::tempstream::tempstream(Log &log):
        m_buf(new logbuf(log)),
        m_stream(new ostream(m_buf.get())) { }

}
