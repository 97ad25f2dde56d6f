/*
 * File:   Log.h
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

#ifndef _MAIN_LOG_H_
#define _MAIN_LOG_H_

#include <string>
#include <sstream>
#include <boost/shared_ptr.hpp>
#include <boost/noncopyable.hpp>

namespace vigorbattle {

/**
 * Log::out() is where the program writes its output instead of cout. A
 * message can go to the console, to the battle log file for the day, to
 * both or nowhere, depending on the mode.
 *
 * Files live in logs/<directory>/ and are named for the date they were
 * written on. Every line written to a file starts with the time of day.
 *
 * Always finish a message with endl:
 *     Log::out() << "Turn " << turn << " begins." << endl;
 */
class Log : boost::noncopyable {
public:
    static Log out;

    enum LOG_MODE {
        MODE_NONE = 0,
        MODE_CONSOLE = 1,
        MODE_FILE = 2,
        MODE_BOTH = MODE_CONSOLE | MODE_FILE
    };

    /**
     * Collects one message and hands it to the log when it is flushed.
     */
    class tempstream {
    public:
        template <class T> tempstream &operator<<(const T &t) {
            *m_stream << t;
            return *this;
        }
        tempstream &operator<<(std::ostream & (*p)(std::ostream &)) {
            *m_stream << p;
            return *this;
        }
    private:
        friend class Log;
        explicit tempstream(Log &);
        boost::shared_ptr<std::streambuf> m_buf;
        boost::shared_ptr<std::ostream> m_stream;
    };

    tempstream operator()();

    /**
     * Enabling MODE_FILE creates the log directory if needed. Do not change
     * the mode while another thread is writing.
     */
    void setMode(const LOG_MODE mode);
    LOG_MODE getMode() const;

    /**
     * Write files to logs/<directory>/ from now on. Closes any open file.
     */
    void setDirectory(const std::string &directory);
    std::string getDirectory() const;

    /**
     * The file that a message written now would go to.
     */
    std::string getFileName() const;

private:
    class logbuf;
    friend class logbuf;
    Log(const std::string &, const LOG_MODE);
    struct LogImpl;
    boost::shared_ptr<LogImpl> m_impl;
};

inline std::ostream &endl(std::ostream &s) {
    return std::endl<char, std::char_traits<char> >(s);
}

}

#endif
