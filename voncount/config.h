#ifndef __VONCOUNT_CONFIG_H__
#define __VONCOUNT_CONFIG_H__
// Copyright (c) 2009 - Mozy, Inc.

#include <stdexcept>
#include <string>

#include <boost/function.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/multi_index_container.hpp>
#include <boost/multi_index/global_fun.hpp>
#include <boost/multi_index/ordered_index.hpp>
#include <boost/noncopyable.hpp>
#include <boost/shared_ptr.hpp>
#include <boost/signals2/signal.hpp>

#include "assert.h"

namespace Voncount {

// ConfigVars are named, typed settings that are declared once (usually as a
// static at namespace scope of the file that uses them) and can then be
// changed at runtime without recompiling:
//
//   static ConfigVar<bool>::ptr g_summary = Config::lookup(
//       "countcat.summary", true, "Print byte counts when done");
//
// Names use only lower case letters and '.'.  A program opts in to
// overriding the defaults by calling Config::loadFromEnvironment() and/or
// Config::loadFromCommandLine(); code that doesn't know a variable's type
// can still reach it through the untyped Config::lookup(name) and
// toString()/fromString().

class ConfigVarBase : public boost::noncopyable
{
public:
    typedef boost::shared_ptr<ConfigVarBase> ptr;

public:
    ConfigVarBase(const std::string &name, const std::string &description)
        : m_name(name),
          m_description(description)
    {}
    virtual ~ConfigVarBase() {}

    const std::string &name() const { return m_name; }
    const std::string &description() const { return m_description; }

    virtual std::string toString() const = 0;
    /// @return false if str doesn't convert or the change was vetoed
    virtual bool fromString(const std::string &str) = 0;

    /// Fired after the value has changed; slots must not throw
    boost::signals2::signal<void ()> onChange;

private:
    std::string m_name, m_description;
};

template <class T>
class ConfigVar : public ConfigVarBase
{
public:
    typedef boost::shared_ptr<ConfigVar> ptr;

    /// Stops at the first slot that returns false; a slot that throws
    /// counts as a veto too
    struct VetoCombiner
    {
        typedef bool result_type;

        template <class InputIterator>
        bool operator()(InputIterator first, InputIterator last) const
        {
            try {
                for (; first != last; ++first) {
                    if (!*first)
                        return false;
                }
            } catch (std::exception &) {
                return false;
            }
            return true;
        }
    };

public:
    ConfigVar(const std::string &name, const T &defaultValue,
        const std::string &description)
        : ConfigVarBase(name, description),
          m_val(defaultValue)
    {}

    T val() const { return m_val; }
    /// @return false if a beforeChange slot rejected value
    bool val(const T &value)
    {
        if (value == m_val)
            return true;
        if (!beforeChange(value))
            return false;
        m_val = value;
        onChange();
        return true;
    }

    std::string toString() const
    { return boost::lexical_cast<std::string>(m_val); }

    bool fromString(const std::string &str)
    {
        T value;
        try {
            value = boost::lexical_cast<T>(str);
        } catch (boost::bad_lexical_cast &) {
            return false;
        }
        return val(value);
    }

    /// Sees the proposed value before it is stored, and may reject it
    boost::signals2::signal<bool (const T &), VetoCombiner> beforeChange;

private:
    T m_val;
};

class Config
{
private:
    static std::string nameOf(const ConfigVarBase::ptr &var)
    { return var->name(); }

    typedef boost::multi_index_container<ConfigVarBase::ptr,
        boost::multi_index::indexed_by<
            boost::multi_index::ordered_unique<
                boost::multi_index::global_fun<const ConfigVarBase::ptr &,
                    std::string, &Config::nameOf> > > > ConfigVarSet;

public:
    /// Declare a new ConfigVar; declaring the same name twice asserts
    /// @throws std::invalid_argument (what() is name) if name has anything
    ///         other than [a-z.]
    template <class T>
    static typename ConfigVar<T>::ptr lookup(const std::string &name,
        const T &defaultValue, const std::string &description = "")
    {
        if (!validName(name))
            VONCOUNT_THROW_EXCEPTION(std::invalid_argument(name));
        VONCOUNT_ASSERT(vars().find(name) == vars().end());
        typename ConfigVar<T>::ptr var(new ConfigVar<T>(name, defaultValue,
            description));
        vars().insert(var);
        return var;
    }

    /// Find an already declared ConfigVar
    /// @return NULL if nothing is declared with that name
    static ConfigVarBase::ptr lookup(const std::string &name);

    /// Call dg for every declared ConfigVar, in name order
    static void visit(boost::function<void (ConfigVarBase::ptr)> dg);

    /// Set ConfigVars from --name=value or --name value arguments
    ///
    /// argv[0] is never looked at.  Arguments that set a ConfigVar are
    /// removed from argv (and argc reduced to match); everything else, and
    /// everything after a bare --, is left in place.
    /// @throws std::invalid_argument (what() is the name) if the value is
    ///         missing or rejected
    static void loadFromCommandLine(int &argc, char *argv[]);

    /// Set ConfigVars from environment variables; NAME_WITH_UNDERSCORES
    /// sets name.with.underscores.  Rejected values are logged and skipped.
    static void loadFromEnvironment();

private:
    static bool validName(const std::string &name)
    {
        return name.find_first_not_of("abcdefghijklmnopqrstuvwxyz.") ==
            std::string::npos;
    }

    static ConfigVarSet &vars()
    {
        static ConfigVarSet s_vars;
        return s_vars;
    }
};

/// Overrides a ConfigVar for as long as it is in scope
class HijackConfigVar : public boost::noncopyable
{
public:
    /// Asserts that name is declared
    HijackConfigVar(const std::string &name, const std::string &value);
    ~HijackConfigVar();

    /// Put the previous value back early
    void reset();

private:
    ConfigVarBase::ptr m_var;
    std::string m_previous;
};

}

#endif
