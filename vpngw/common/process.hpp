//    vpngw -- A VPN gateway that relays OpenVPN peers through an
//             upstream WireGuard tunnel.
//
//    Copyright (C) 2012-2017 OpenVPN Inc.
//
//    This program is free software: you can redistribute it and/or modify
//    it under the terms of the GNU Affero General Public License Version 3
//    as published by the Free Software Foundation.
//
//    This program is distributed in the hope that it will be useful,
//    but WITHOUT ANY WARRANTY; without even the implied warranty of
//    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//    GNU Affero General Public License for more details.
//
//    You should have received a copy of the GNU Affero General Public License
//    along with this program in the COPYING file.
//    If not, see <http://www.gnu.org/licenses/>.

// General-purpose classes for instantiating a posix process with arguments.

#ifndef VPNGW_COMMON_PROCESS_H
#define VPNGW_COMMON_PROCESS_H

#include <cstring>     // memcpy
#include <stdlib.h>    // exit
#include <unistd.h>    // fork, execve
#include <errno.h>
#include <sys/types.h> // waitpid
#include <sys/wait.h>  // waitpid

#include <string>
#include <vector>
#include <memory>

#include <vpngw/common/exception.hpp>
#include <vpngw/common/redir.hpp>

extern char **environ;

namespace vpngw {

  class Argv : public std::vector<std::string>
  {
  public:
    Argv(const size_t capacity=16)
    {
      reserve(capacity);
    }

    Argv(std::initializer_list<std::string> init)
      : std::vector<std::string>(init)
    {
    }

    std::string to_string() const
    {
      std::string ret;
      bool first = true;
      for (const auto &s : *this)
	{
	  if (!first)
	    ret += ' ';
	  ret += s;
	  first = false;
	}
      return ret;
    }
  };

  class Environ : public std::vector<std::string>
  {
  public:
    void load_from_environ()
    {
      reserve(64);
      for (char **e = ::environ; *e != NULL; ++e)
	emplace_back(*e);
    }

    int find_index(const std::string& name) const
    {
      for (size_t i = 0; i < size(); ++i)
	{
	  const std::string& s = (*this)[i];
	  const size_t pos = s.find_first_of('=');
	  if (pos != std::string::npos)
	    {
	      if (name == s.substr(0, pos))
		return int(i);
	    }
	  else
	    {
	      if (name == s)
		return int(i);
	    }
	}
      return -1;
    }

    std::string find(const std::string& name) const
    {
      const int i = find_index(name);
      if (i >= 0)
	return value(i);
      else
	return "";
    }

    std::string value(const size_t idx) const
    {
      const std::string& s = (*this)[idx];
      const size_t pos = s.find_first_of('=');
      if (pos != std::string::npos)
	return s.substr(pos+1);
      else
	return "";
    }

    void assign(const std::string& name, const std::string& value)
    {
      std::string nv = name + '=' + value;
      const int i = find_index(name);
      if (i >= 0)
	(*this)[i] = std::move(nv);
      else
	push_back(std::move(nv));
    }
  };

  class ArgvWrapper
  {
    ArgvWrapper(const ArgvWrapper&) = delete;
    ArgvWrapper& operator=(const ArgvWrapper&) = delete;

  public:
    explicit ArgvWrapper(const std::vector<std::string>& argv)
    {
      size_t i;
      argc = argv.size();
      cargv = new char *[argc+1];
      for (i = 0; i < argc; ++i)
	cargv[i] = string_alloc(argv[i]);
      cargv[i] = nullptr;
    }

    ~ArgvWrapper()
    {
      for (size_t i = 0; i < argc; ++i)
	delete [] cargv[i];
      delete [] cargv;
    }

    char *const *c_argv() const noexcept
    {
      return cargv;
    }

    char **c_argv() noexcept
    {
      return cargv;
    }

  private:
    static char *string_alloc(const std::string& s)
    {
      const char *sdata = s.c_str();
      const size_t slen = s.length();
      char *ret = new char[slen+1];
      std::memcpy(ret, sdata, slen);
      ret[slen] = '\0';
      return ret;
    }

    size_t argc;
    char **cargv;
  };

  // low-level fork/exec (async)
  inline pid_t system_cmd_async(const std::string& cmd,
				const Argv& argv,
				const Environ* env,
				RedirectBase* redir)
  {
    ArgvWrapper argv_wrap(argv);
    std::unique_ptr<ArgvWrapper> env_wrap;
    if (env)
      env_wrap.reset(new ArgvWrapper(*env));
    auto fn = cmd.c_str();
    auto av = argv_wrap.c_argv();
    auto ev = env_wrap ? env_wrap->c_argv() : ::environ;
    const pid_t pid = redir ? ::fork() : ::vfork();
    if (pid == pid_t(0)) /* child side */
      {
	if (redir)
	  redir->redirect();
	::execve(fn, av, ev);
	::_exit(127);
      }
    else if (pid < pid_t(0)) /* fork failed */
      return -1;
    else /* parent side */
      {
	if (redir)
	  redir->close();
	return pid;
      }
  }

  // completion for system_cmd_async()
  inline int system_cmd_post(const pid_t pid)
  {
    int status = -1;
    while (true)
      {
	const pid_t ret = ::waitpid(pid, &status, 0);
	if (ret == pid)
	  break;
	if (ret < 0 && errno == EINTR)
	  continue;
	return -1;
      }
    if (WIFEXITED(status))
      return WEXITSTATUS(status);
    return -1;
  }

  // command execution capturing output and error as
  // std::strings (uses pipes under the hood), stdin
  // is /dev/null
  inline int system_cmd(const std::string& cmd,
			const Argv& argv,
			const Environ* env,
			RedirectPipe::Output& output,
			const bool combine_out_err)
  {
    RedirectPipe remote;
    RedirectPipe local(remote, combine_out_err);
    const pid_t pid = system_cmd_async(cmd, argv, env, &remote);
    if (pid < pid_t(0))
      return -1;
    local.transact(output);
    return system_cmd_post(pid);
  }

  // Replace the current process image.  Only returns by
  // throwing, when execve itself fails.
  VPNGW_EXCEPTION(exec_error);

  inline void exec_replace(const Argv& argv, const Environ* env = nullptr)
  {
    if (argv.empty())
      throw exec_error("empty argv");
    ArgvWrapper argv_wrap(argv);
    std::unique_ptr<ArgvWrapper> env_wrap;
    if (env)
      env_wrap.reset(new ArgvWrapper(*env));
    ::execve(argv[0].c_str(), argv_wrap.c_argv(), env_wrap ? env_wrap->c_argv() : ::environ);
    const int eno = errno;
    VPNGW_THROW(exec_error, argv[0] << " : " << std::strerror(eno));
  }

}

#endif // VPNGW_COMMON_PROCESS_H
