// Copyright (c) 2009 - Mozy, Inc.

#include "config.h"

#include <ctype.h>
#include <string.h>

#ifdef OSX
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern char **environ;
#endif

namespace Voncount {

static Logger::ptr g_log = Log::lookup("voncount:config");

ConfigVarBase::ptr
Config::lookup(const std::string &name)
{
    ConfigVarSet::const_iterator it = vars().find(name);
    return it == vars().end() ? ConfigVarBase::ptr() : *it;
}

void
Config::visit(boost::function<void (ConfigVarBase::ptr)> dg)
{
    for (ConfigVarSet::const_iterator it = vars().begin();
        it != vars().end();
        ++it)
        dg(*it);
}

void
Config::loadFromCommandLine(int &argc, char *argv[])
{
    if (argc <= 1 || !argv)
        return;
    int out = 1;
    int in = 1;
    while (in < argc) {
        char *arg = argv[in];
        if (strcmp(arg, "--") == 0)
            break;
        ConfigVarBase::ptr var;
        std::string name;
        const char *value = NULL;
        int consumed = 1;
        if (strncmp(arg, "--", 2) == 0) {
            const char *equals = strchr(arg, '=');
            if (equals) {
                name.assign(arg + 2, equals - arg - 2);
                value = equals + 1;
            } else {
                name = arg + 2;
                if (in + 1 < argc) {
                    value = argv[in + 1];
                    consumed = 2;
                }
            }
            var = lookup(name);
        }
        if (!var) {
            argv[out++] = argv[in++];
            continue;
        }
        if (!value || !var->fromString(value))
            VONCOUNT_THROW_EXCEPTION(std::invalid_argument(name));
        VONCOUNT_LOG_VERBOSE(g_log) << "set " << name << " to "
            << var->toString() << " from command line";
        in += consumed;
    }
    // Whatever follows -- is kept as is
    while (in < argc)
        argv[out++] = argv[in++];
    argc = out;
}

void
Config::loadFromEnvironment()
{
    if (!environ)
        return;
    for (char **env = environ; *env; ++env) {
        const char *equals = strchr(*env, '=');
        if (!equals || equals == *env)
            continue;
        std::string name(*env, equals - *env);
        for (std::string::iterator it = name.begin(); it != name.end(); ++it)
            *it = *it == '_' ? '.' : (char)tolower((unsigned char)*it);
        if (!validName(name))
            continue;
        ConfigVarBase::ptr var = lookup(name);
        if (!var)
            continue;
        if (var->fromString(equals + 1))
            VONCOUNT_LOG_VERBOSE(g_log) << "set " << name << " to "
                << var->toString() << " from environment";
        else
            VONCOUNT_LOG_WARNING(g_log) << "ignoring " << name << "="
                << (equals + 1) << " from environment";
    }
}

HijackConfigVar::HijackConfigVar(const std::string &name,
    const std::string &value)
    : m_var(Config::lookup(name))
{
    VONCOUNT_ASSERT(m_var);
    m_previous = m_var->toString();
    if (!m_var->fromString(value))
        m_var.reset();
}

HijackConfigVar::~HijackConfigVar()
{
    reset();
}

void
HijackConfigVar::reset()
{
    if (!m_var)
        return;
    if (!m_var->fromString(m_previous))
        VONCOUNT_LOG_WARNING(g_log) << "couldn't restore " << m_var->name()
            << " to " << m_previous;
    m_var.reset();
}

}
