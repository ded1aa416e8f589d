#ifndef SDIMPORT_COMMAND_RUNNER_H
#define SDIMPORT_COMMAND_RUNNER_H

#include <string>
#include <vector>

namespace sdimport {

//
// Runs an external command and returns its exit status. The first
// argument is the program, which is looked up in `PATH`.
//
class command_runner_t {
   public:
      virtual ~command_runner_t(void) = default;

      virtual int run(const std::vector<std::string>& args) = 0;
};

//
// Runs commands in a child process and waits for them to finish.
// A program that cannot be started exits with 127, like it would
// in a shell, and a program killed by a signal yields 128 plus the
// signal number.
//
class process_runner_t : public command_runner_t {
   public:
      static constexpr int EXEC_FAILED_STATUS = 127;

   public:
      int run(const std::vector<std::string>& args) override;
};

}

#endif // SDIMPORT_COMMAND_RUNNER_H
