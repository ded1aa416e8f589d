#include "command_runner.h"
#include "format.h"

#include <stdexcept>

#include <cerrno>
#include <cstring>

#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace sdimport {

int process_runner_t::run(const std::vector<std::string>& args)
{
   if(args.empty())
      throw std::invalid_argument("Cannot run an empty command");

   // argument pointers must be prepared before forking
   std::vector<char*> argv;

   for(const std::string& arg : args)
      argv.push_back(const_cast<char*>(arg.c_str()));

   argv.push_back(nullptr);

   pid_t pid = fork();

   if(pid < 0)
      throw std::runtime_error(FMTNS::format("Cannot start {:s} ({:s})", args.front(), std::strerror(errno)));

   if(pid == 0) {
      execvp(argv[0], argv.data());

      // only async-signal-safe calls are allowed in the child
      _exit(EXEC_FAILED_STATUS);
   }

   int status = 0;

   while(waitpid(pid, &status, 0) < 0) {
      if(errno != EINTR)
         throw std::runtime_error(FMTNS::format("Cannot wait for {:s} ({:s})", args.front(), std::strerror(errno)));
   }

   if(WIFEXITED(status))
      return WEXITSTATUS(status);

   if(WIFSIGNALED(status))
      return 128 + WTERMSIG(status);

   return -1;
}

}
